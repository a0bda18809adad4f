/**
 * @file system_executor_test.cpp
 * @brief Tests the system executor against a fake client
 *
 * Validates the step order (advance, fund, submit, observe), the funding
 * exemptions, the step timeout and the custom entrypoint policy.
 */

#define BOOST_TEST_MODULE system_executor_test
#include <boost/test/unit_test.hpp>

#include "counter_domain.hpp"

#include <lockstep/configuration.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/system_executor.hpp>

#include <folly/init/Init.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace lockstep;
using namespace counter_test;

namespace {
    constexpr std::chrono::milliseconds short_timeout{50};

    using counter_system_executor = system_executor<counter_domain, counter_client, ping_dispatch>;

    auto make_executor(
        const std::shared_ptr<counter_system>& system,
        engine_configuration config = engine_configuration{}
    ) -> counter_system_executor {
        return counter_system_executor(counter_client(system), primary_handle, {tally_handle}, config);
    }
}

// Global fixture to initialize Folly once for all tests
struct FollyInitFixture {
    FollyInitFixture() {
        int argc = 1;
        char* argv_data[] = {const_cast<char*>("system_executor_test"), nullptr};
        char** argv = argv_data;
        _init = std::make_unique<folly::Init>(&argc, &argv);
    }

    ~FollyInitFixture() = default;

    std::unique_ptr<folly::Init> _init;
};

BOOST_GLOBAL_FIXTURE(FollyInitFixture);

BOOST_AUTO_TEST_SUITE(system_executor_tests)

BOOST_AUTO_TEST_CASE(step_runs_in_order, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    auto executor = make_executor(system);

    auto raw = executor.apply(make_add(alice, 3, 2, 5)).get();

    const std::vector<std::string> expected{
        "advance", "fund", "submit", "storage", "balance KT1Counter", "auxiliary KT1Tally", "balance KT1Tally"};
    BOOST_CHECK(system->_calls == expected);
    BOOST_CHECK(!raw.failure().has_value());
    BOOST_CHECK_EQUAL(raw.storage(), 3);
    BOOST_CHECK_EQUAL(raw.balance(), 102u);
    BOOST_REQUIRE_EQUAL(raw.auxiliary().size(), 1u);
    BOOST_CHECK(raw.auxiliary().front().second.storage() == tally{{3}});
    BOOST_REQUIRE_EQUAL(system->_advances.size(), 1u);
    BOOST_CHECK_EQUAL(system->_advances.front(), 5u);
    BOOST_CHECK_EQUAL(executor.applied(), 1u);
}

BOOST_AUTO_TEST_CASE(no_advance_without_directive, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    auto executor = make_executor(system);

    executor.apply(make_add(alice, 1)).get();
    BOOST_CHECK(system->_advances.empty());
    BOOST_CHECK_EQUAL(system->_calls.front(), "fund");
}

BOOST_AUTO_TEST_CASE(sender_is_funded_with_configured_amount, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    engine_configuration config;
    config._funding_amount = 25;
    auto executor = make_executor(system, config);

    executor.apply(make_add(bob, 1)).get();
    BOOST_REQUIRE_EQUAL(system->_funded.size(), 1u);
    BOOST_CHECK_EQUAL(system->_funded.front().first, bob);
    BOOST_CHECK_EQUAL(system->_funded.front().second, 25u);
}

BOOST_AUTO_TEST_CASE(funding_skips_target_and_tracked_entities, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    auto executor = make_executor(system);

    executor.apply(make_add(primary_handle, 1)).get();
    executor.apply(make_add(tally_handle, 1)).get();
    BOOST_CHECK(system->_funded.empty());

    engine_configuration no_funding;
    no_funding._funding_amount = 0;
    auto unfunded = make_executor(system, no_funding);
    unfunded.apply(make_add(alice, 1)).get();
    BOOST_CHECK(system->_funded.empty());
}

BOOST_AUTO_TEST_CASE(failure_is_reported_raw, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    system->_shape = failure_shape::pair;
    auto executor = make_executor(system);

    auto raw = executor.apply(make_add(alice, -1)).get();
    BOOST_REQUIRE(raw.failure().has_value());
    const auto* pair = std::get_if<failed_with_pair>(&*raw.failure());
    BOOST_REQUIRE(pair != nullptr);
    BOOST_CHECK_EQUAL(pair->code(), 1u);
    BOOST_CHECK_EQUAL(raw.storage(), 0);
}

BOOST_AUTO_TEST_CASE(hanging_submission_times_out, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    system->_hang = true;
    engine_configuration config;
    config._step_timeout = short_timeout;
    auto executor = make_executor(system, config);

    auto raw = executor.apply(make_add(alice, 1)).get();
    BOOST_REQUIRE(raw.failure().has_value());
    const auto* transport = std::get_if<transport_failure>(&*raw.failure());
    BOOST_REQUIRE(transport != nullptr);
    BOOST_CHECK_EQUAL(transport->kind(), transport_failure_kind::timeout);
    // Observables are still collected after a timeout
    BOOST_CHECK_EQUAL(system->_calls.back(), "balance KT1Tally");
}

BOOST_AUTO_TEST_CASE(supported_custom_entrypoint_is_dispatched, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    auto executor = make_executor(system);

    auto raw = executor.apply(make_ping(alice, "hello")).get();
    BOOST_CHECK(!raw.failure().has_value());
    BOOST_REQUIRE_EQUAL(system->_pings.size(), 1u);
    BOOST_CHECK_EQUAL(system->_pings.front(), "hello");
}

BOOST_AUTO_TEST_CASE(unsupported_custom_entrypoint_is_ignored_by_default, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    auto executor = make_executor(system);

    auto raw = executor.apply(make_ping(alice, "unsupported")).get();
    BOOST_CHECK(!raw.failure().has_value());
    BOOST_CHECK(system->_pings.empty());
    BOOST_CHECK(std::find(system->_calls.begin(), system->_calls.end(), "submit") == system->_calls.end());
}

BOOST_AUTO_TEST_CASE(unsupported_custom_entrypoint_rejected_on_request, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    engine_configuration config;
    config._custom_policy = custom_entrypoint_policy::reject_unsupported;
    auto executor = make_executor(system, config);

    BOOST_CHECK_THROW(executor.apply(make_ping(alice, "unsupported")).get(), unsupported_operation_exception);
}

BOOST_AUTO_TEST_CASE(lost_entity_fails_the_step, * boost::unit_test::timeout(30)) {
    auto system = std::make_shared<counter_system>();
    system->_tallies.clear();
    auto executor = make_executor(system);

    BOOST_CHECK_THROW(executor.apply(make_add(alice, 1)).get(), missing_entity_exception);
}

BOOST_AUTO_TEST_SUITE_END()
