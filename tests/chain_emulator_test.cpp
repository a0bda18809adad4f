/**
 * @file chain_emulator_test.cpp
 * @brief Tests the emulated chain and its asynchronous client
 *
 * Covers origination rules, tez movement, depth-first execution of internal
 * operations, atomic rollback of failed transfers, the operation limit and
 * future completion on an executor with simulated latency.
 */

#define BOOST_TEST_MODULE chain_emulator_test
#include <boost/test/unit_test.hpp>

#include <chain_emulator/client.hpp>
#include <chain_emulator/contracts.hpp>
#include <chain_emulator/emulator_impl.hpp>
#include <chain_emulator/exceptions.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/init/Init.h>

#include <boost/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace chain_emulator;

namespace {
    constexpr const char* alice = "tz1Alice";
    constexpr const char* bob = "tz1Bob";
    constexpr const char* sink_address = "KT1Sink";
    constexpr std::chrono::milliseconds test_latency{10};

    // Emits a fixed list of calls whenever its default entrypoint runs
    class forwarder_contract : public contract {
    public:
        explicit forwarder_contract(operation_list calls)
            : _calls(std::move(calls)) {}

        auto execute(const call_context&, std::string_view, const boost::json::value&) -> operation_list override {
            return _calls;
        }

        auto storage() const -> boost::json::value override { return unit_value(); }

        auto clone() const -> std::unique_ptr<contract> override {
            return std::make_unique<forwarder_contract>(*this);
        }

    private:
        operation_list _calls;
    };

    // Always fails with a numeric tag
    class failing_contract : public contract {
    public:
        auto execute(const call_context& context, std::string_view, const boost::json::value&)
            -> operation_list override {
            throw failwith_exception(context.self(), int_value(7));
        }

        auto storage() const -> boost::json::value override { return unit_value(); }

        auto clone() const -> std::unique_ptr<contract> override {
            return std::make_unique<failing_contract>(*this);
        }
    };

    auto call(const address& destination, boost::json::value parameter, mutez amount = 0) -> internal_operation {
        internal_operation op;
        op._destination = destination;
        op._parameter = std::move(parameter);
        op._amount = amount;
        return op;
    }
}

// Global fixture to initialize Folly once for all tests
struct FollyInitFixture {
    FollyInitFixture() {
        int argc = 1;
        char* argv_data[] = {const_cast<char*>("chain_emulator_test"), nullptr};
        char** argv = argv_data;
        _init = std::make_unique<folly::Init>(&argc, &argv);
    }

    ~FollyInitFixture() = default;

    std::unique_ptr<folly::Init> _init;
};

BOOST_GLOBAL_FIXTURE(FollyInitFixture);

BOOST_AUTO_TEST_SUITE(emulated_chain_tests)

BOOST_AUTO_TEST_CASE(origination_rules, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.originate(sink_address, std::make_unique<consumer_contract>(), 5);
    BOOST_CHECK(chain.has_contract(sink_address));
    BOOST_CHECK_EQUAL(chain.balance(sink_address), 5u);

    BOOST_CHECK_THROW(chain.originate(sink_address, std::make_unique<unit_contract>()), address_in_use_exception);
    BOOST_CHECK_THROW(chain.originate(alice, std::make_unique<unit_contract>()), chain_exception);
    BOOST_CHECK_THROW(chain.storage("KT1Missing"), unknown_contract_exception);
}

BOOST_AUTO_TEST_CASE(levels_only_move_on_request, * boost::unit_test::timeout(10)) {
    emulated_chain chain(3);
    chain.credit(alice, 10);
    chain.transfer(alice, bob, "default", unit_value(), 1);
    BOOST_CHECK_EQUAL(chain.level(), 3u);
    chain.advance_level(4);
    BOOST_CHECK_EQUAL(chain.level(), 7u);
}

BOOST_AUTO_TEST_CASE(tez_moves_between_accounts, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.credit(alice, 100);
    chain.transfer(alice, bob, "default", unit_value(), 30);
    BOOST_CHECK_EQUAL(chain.balance(alice), 70u);
    BOOST_CHECK_EQUAL(chain.balance(bob), 30u);

    BOOST_CHECK_THROW(chain.transfer(bob, alice, "default", unit_value(), 31), balance_too_low_exception);
    BOOST_CHECK_THROW(chain.transfer(alice, bob, "transfer", unit_value(), 1), unknown_entrypoint_exception);
    BOOST_CHECK_THROW(chain.transfer(alice, "KT1Missing", "default", unit_value(), 1), unknown_contract_exception);
    BOOST_CHECK_EQUAL(chain.balance(alice), 70u);
    BOOST_CHECK_EQUAL(chain.balance(bob), 30u);
}

BOOST_AUTO_TEST_CASE(internal_operations_run_depth_first, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.originate(sink_address, std::make_unique<consumer_contract>());
    chain.originate("KT1Inner", std::make_unique<forwarder_contract>(
        operation_list{call(sink_address, string_value("inner"))}));
    chain.originate("KT1Outer", std::make_unique<forwarder_contract>(
        operation_list{call("KT1Inner", unit_value()), call(sink_address, string_value("outer"))}));

    chain.transfer(alice, "KT1Outer", "default", unit_value(), 0);

    boost::json::array expected{string_value("inner"), string_value("outer")};
    BOOST_CHECK(chain.storage(sink_address) == boost::json::value(expected));
    BOOST_CHECK_EQUAL(chain.operations_run(), 4u);
}

BOOST_AUTO_TEST_CASE(contract_sends_tez_it_holds, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.originate("KT1Payer", std::make_unique<forwarder_contract>(
        operation_list{call(bob, unit_value(), 8)}), 10);
    chain.credit(alice, 1);

    chain.transfer(alice, "KT1Payer", "default", unit_value(), 1);
    BOOST_CHECK_EQUAL(chain.balance("KT1Payer"), 3u);
    BOOST_CHECK_EQUAL(chain.balance(bob), 8u);
}

BOOST_AUTO_TEST_CASE(failed_transfer_rolls_back_everything, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.credit(alice, 50);
    chain.originate(sink_address, std::make_unique<consumer_contract>());
    chain.originate("KT1Failing", std::make_unique<failing_contract>());
    chain.originate("KT1Outer", std::make_unique<forwarder_contract>(
        operation_list{call(sink_address, string_value("kept?")), call("KT1Failing", unit_value())}));

    try {
        chain.transfer(alice, "KT1Outer", "default", unit_value(), 20);
        BOOST_FAIL("expected failwith_exception");
    } catch (const failwith_exception& e) {
        BOOST_CHECK_EQUAL(e.get_contract(), "KT1Failing");
        BOOST_CHECK(e.get_value() == int_value(7));
    }

    BOOST_CHECK(chain.storage(sink_address) == boost::json::value(boost::json::array{}));
    BOOST_CHECK_EQUAL(chain.balance(alice), 50u);
    BOOST_CHECK_EQUAL(chain.balance("KT1Outer"), 0u);
    BOOST_CHECK_EQUAL(chain.operations_run(), 0u);
}

BOOST_AUTO_TEST_CASE(runaway_recursion_hits_the_limit, * boost::unit_test::timeout(30)) {
    emulated_chain chain;
    chain.originate("KT1Loop", std::make_unique<forwarder_contract>(operation_list{call("KT1Loop", unit_value())}));
    BOOST_CHECK_THROW(chain.transfer(alice, "KT1Loop", "default", unit_value(), 0), operation_limit_exception);
}

BOOST_AUTO_TEST_CASE(token_ledger_records_batches, * boost::unit_test::timeout(10)) {
    emulated_chain chain;
    chain.originate("KT1Token", std::make_unique<token_ledger_contract>());

    boost::json::value batch = boost::json::object{
        {"from_", alice},
        {"txs", boost::json::array{boost::json::object{{"to_", bob}, {"token_id", 0}, {"amount", 3}}}}
    };
    chain.transfer(alice, "KT1Token", "transfer", boost::json::array{batch}, 0);
    BOOST_CHECK(chain.storage("KT1Token") == boost::json::value(boost::json::array{batch}));

    BOOST_CHECK_THROW(
        chain.transfer(alice, "KT1Token", "transfer", boost::json::array{boost::json::object{{"to_", bob}}}, 0),
        bad_parameter_exception);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(chain_client_tests)

BOOST_AUTO_TEST_CASE(calls_complete_on_the_executor, * boost::unit_test::timeout(30)) {
    folly::CPUThreadPoolExecutor executor(2);
    auto chain = std::make_shared<emulated_chain>();
    chain_client client(chain, &executor, test_latency);

    client.credit(alice, 40).get();
    client.originate(sink_address, std::make_shared<consumer_contract>()).get();
    client.transfer(alice, sink_address, "default", string_value("hi"), 15).get();
    client.advance_level(2).get();

    BOOST_CHECK_EQUAL(client.balance(alice).get(), 25u);
    BOOST_CHECK_EQUAL(client.balance(sink_address).get(), 15u);
    BOOST_CHECK_EQUAL(client.level().get(), 2u);
    BOOST_CHECK(client.storage(sink_address).get() == boost::json::value(boost::json::array{string_value("hi")}));
}

BOOST_AUTO_TEST_CASE(failures_surface_in_the_future, * boost::unit_test::timeout(30)) {
    auto chain = std::make_shared<emulated_chain>();
    chain_client client(chain);
    client.originate("KT1Failing", std::make_shared<failing_contract>()).get();

    BOOST_CHECK_THROW(client.transfer(alice, "KT1Failing", "default", unit_value(), 0).get(), failwith_exception);
    BOOST_CHECK_THROW(client.storage("KT1Missing").get(), unknown_contract_exception);
}

BOOST_AUTO_TEST_CASE(copies_share_the_chain, * boost::unit_test::timeout(30)) {
    auto chain = std::make_shared<emulated_chain>();
    chain_client first(chain);
    auto second = first;

    first.credit(bob, 9).get();
    BOOST_CHECK_EQUAL(second.balance(bob).get(), 9u);
}

BOOST_AUTO_TEST_SUITE_END()
