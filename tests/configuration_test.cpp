/**
 * @file configuration_test.cpp
 * @brief Tests engine, generator and run configuration defaults, validation and parsing
 */

#define BOOST_TEST_MODULE configuration_test
#include <boost/test/unit_test.hpp>

#include <lockstep/configuration.hpp>
#include <lockstep/exceptions.hpp>

#include <chrono>
#include <sstream>
#include <string>

using namespace lockstep;

BOOST_AUTO_TEST_SUITE(configuration_tests)

BOOST_AUTO_TEST_CASE(defaults_are_valid, * boost::unit_test::timeout(10)) {
    run_configuration config;
    BOOST_CHECK(config.engine().is_valid());
    BOOST_CHECK(config.generator().is_valid());
    BOOST_CHECK_EQUAL(config.engine().funding_amount(), 1u);
    BOOST_CHECK(config.engine().step_timeout() == std::chrono::milliseconds{5000});
    BOOST_CHECK_EQUAL(config.engine().custom_policy(), custom_entrypoint_policy::ignore_unsupported);
    BOOST_CHECK_EQUAL(config.generator().max_sequence_length(), 40u);
    BOOST_REQUIRE_EQUAL(config.seeds().size(), 1u);
}

BOOST_AUTO_TEST_CASE(generator_ranges_are_checked, * boost::unit_test::timeout(10)) {
    generator_configuration config;
    config._proposal_weight = 1.5;
    BOOST_CHECK(!config.is_valid());

    config = generator_configuration{};
    config._sender_count = 0;
    BOOST_CHECK(!config.is_valid());

    config = generator_configuration{};
    config._sender_count = 9;
    BOOST_CHECK(!config.is_valid());

    config = generator_configuration{};
    config._max_sequence_length = 0;
    BOOST_CHECK(!config.is_valid());

    config = generator_configuration{};
    config._max_advance = 0;
    BOOST_CHECK(!config.is_valid());
}

BOOST_AUTO_TEST_CASE(full_document_is_parsed, * boost::unit_test::timeout(10)) {
    auto config = parse_run_configuration(R"({
        "engine": {
            "funding_amount": 3,
            "step_timeout_ms": 250,
            "custom_policy": "reject_unsupported",
            "log_level": "debug"
        },
        "generator": {
            "proposal_weight": 0.5,
            "max_sequence_length": 12,
            "start_level": 20,
            "sender_count": 4,
            "max_advance": 6,
            "initial_balance": 900
        },
        "seeds": [7, 8, 9]
    })");

    BOOST_CHECK_EQUAL(config.engine().funding_amount(), 3u);
    BOOST_CHECK(config.engine().step_timeout() == std::chrono::milliseconds{250});
    BOOST_CHECK_EQUAL(config.engine().custom_policy(), custom_entrypoint_policy::reject_unsupported);
    BOOST_CHECK_EQUAL(config.engine().min_log_level(), log_level::debug);

    BOOST_CHECK_CLOSE(config.generator().proposal_weight(), 0.5, 1e-9);
    BOOST_CHECK_EQUAL(config.generator().max_sequence_length(), 12u);
    BOOST_CHECK_EQUAL(config.generator().start_level(), 20u);
    BOOST_CHECK_EQUAL(config.generator().sender_count(), 4u);
    BOOST_CHECK_EQUAL(config.generator().max_advance(), 6u);
    BOOST_CHECK_EQUAL(config.generator().initial_balance(), 900u);

    BOOST_REQUIRE_EQUAL(config.seeds().size(), 3u);
    BOOST_CHECK_EQUAL(config.seeds()[2], 9u);
}

BOOST_AUTO_TEST_CASE(missing_sections_keep_defaults, * boost::unit_test::timeout(10)) {
    auto config = parse_run_configuration(R"({"seeds": [1]})");
    BOOST_CHECK_EQUAL(config.engine().funding_amount(), 1u);
    BOOST_CHECK_EQUAL(config.generator().sender_count(), 3u);

    auto weight_only = parse_run_configuration(R"({"generator": {"proposal_weight": 1}})");
    BOOST_CHECK_CLOSE(weight_only.generator().proposal_weight(), 1.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(invalid_documents_are_rejected, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_THROW(parse_run_configuration("{not json"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration("[1, 2]"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"verbose": true})"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"engine": {"retries": 2}})"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"engine": {"funding_amount": -1}})"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"engine": {"log_level": "loud"}})"), configuration_exception);
    BOOST_CHECK_THROW(
        parse_run_configuration(R"({"engine": {"custom_policy": "maybe"}})"), configuration_exception);
    BOOST_CHECK_THROW(
        parse_run_configuration(R"({"generator": {"proposal_weight": "high"}})"), configuration_exception);
    BOOST_CHECK_THROW(
        parse_run_configuration(R"({"generator": {"sender_count": 0}})"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"seeds": []})"), configuration_exception);
    BOOST_CHECK_THROW(parse_run_configuration(R"({"seeds": 4})"), configuration_exception);
}

BOOST_AUTO_TEST_CASE(error_message_names_the_problem, * boost::unit_test::timeout(10)) {
    try {
        parse_run_configuration(R"({"generator": {"colour": "red"}})");
        BOOST_FAIL("expected configuration_exception");
    } catch (const configuration_exception& e) {
        std::string message = e.what();
        BOOST_CHECK(message.starts_with("Invalid configuration: "));
        BOOST_CHECK(message.find("colour") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(policy_renders_by_name, * boost::unit_test::timeout(10)) {
    std::ostringstream oss;
    oss << custom_entrypoint_policy::reject_unsupported;
    BOOST_CHECK_EQUAL(oss.str(), "reject_unsupported");
}

BOOST_AUTO_TEST_SUITE_END()
