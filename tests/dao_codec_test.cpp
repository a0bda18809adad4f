/**
 * @file dao_codec_test.cpp
 * @brief Tests the JSON encoding of DAO parameters, storage and auxiliary storages
 */

#define BOOST_TEST_MODULE dao_codec_test
#include <boost/test/unit_test.hpp>

#include <lockstep/dao/codec.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/exceptions.hpp>

#include <boost/json.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace lockstep::dao;
using lockstep::serialization_exception;

namespace {
    auto populated_storage() -> storage {
        storage st;
        st._admin = "tz1Admin";
        st._pending_owner = "tz1Next";
        st._guardian = "KT1Guardian";
        st._governance_token = "KT1Token";
        st._token_id = 2;
        st._start_level = 40;
        st._config._period = 8;
        st._frozen_total_supply = 75;
        st._freeze_history["tz1Admin"] = freeze_record{3, 10, 5, 60};

        proposal p;
        p._proposer = "tz1Admin";
        p._frozen_token = 10;
        p._metadata = registry_update{"colour", std::nullopt};
        p._start_level = 67;
        p._voting_stage = 4;
        p._upvotes = 3;
        p._voter_stakes["tz1Voter"] = 3;
        st._proposals["00000000000000aa"] = p;
        st._ongoing.push_back("00000000000000aa");
        st._registry["shape"] = "round";
        return st;
    }
}

BOOST_AUTO_TEST_SUITE(dao_codec_tests)

BOOST_AUTO_TEST_CASE(builtin_parameters_use_their_entrypoints, * boost::unit_test::timeout(10)) {
    const std::vector<std::pair<parameter, std::string>> cases{
        {propose{10, text_metadata{"hello"}}, "propose"},
        {vote{"abc", false, 4}, "vote"},
        {freeze{3}, "freeze"},
        {unfreeze{2}, "unfreeze"},
        {flush{1}, "flush"},
        {drop_proposal{"abc"}, "drop_proposal"},
        {transfer_ownership{"tz1Next"}, "transfer_ownership"},
        {accept_ownership{}, "accept_ownership"},
        {transfer_contract_tokens{"KT1Token", "tz1Bob", 5}, "transfer_contract_tokens"},
        {receive_xtz{}, "default"}
    };

    for (const auto& [param, entrypoint] : cases) {
        auto call = codec::encode(param);
        BOOST_CHECK_EQUAL(call.entrypoint(), entrypoint);
        BOOST_CHECK(codec::decode_parameter(call.entrypoint(), call.argument()) == param);
    }
}

BOOST_AUTO_TEST_CASE(vote_argument_layout, * boost::unit_test::timeout(10)) {
    auto call = codec::encode(parameter{vote{"k1", true, 7}});
    const auto& obj = call.argument().as_object();
    BOOST_CHECK_EQUAL(obj.at("proposal_key").as_string(), "k1");
    BOOST_CHECK(obj.at("vote_type").as_bool());
    BOOST_CHECK_EQUAL(obj.at("vote_amount").to_number<std::uint64_t>(), 7u);
}

BOOST_AUTO_TEST_CASE(registry_parameters_decode, * boost::unit_test::timeout(10)) {
    registry_parameter lookup = lookup_registry{"shape", "KT1View"};
    auto call = codec::encode(lookup);
    BOOST_CHECK_EQUAL(call.entrypoint(), "lookup_registry");
    BOOST_CHECK(codec::decode_registry_parameter(call.entrypoint(), call.argument()) == lookup);

    registry_parameter update = update_receivers{{"tz1Alice", "tz1Bob"}};
    auto update_call = codec::encode(update);
    BOOST_CHECK_EQUAL(update_call.entrypoint(), "update_receivers");
    BOOST_CHECK(codec::decode_registry_parameter(update_call.entrypoint(), update_call.argument()) == update);
}

BOOST_AUTO_TEST_CASE(removal_metadata_encodes_null_value, * boost::unit_test::timeout(10)) {
    auto encoded = codec::encode(proposal_metadata{registry_update{"colour", std::nullopt}});
    BOOST_CHECK_EQUAL(encoded.as_object().at("kind").as_string(), "registry_update");
    BOOST_CHECK(encoded.as_object().at("value").is_null());
    BOOST_CHECK(codec::decode_metadata(encoded) == proposal_metadata{registry_update{"colour", std::nullopt}});
}

BOOST_AUTO_TEST_CASE(storage_survives_encoding, * boost::unit_test::timeout(10)) {
    auto st = populated_storage();
    auto encoded = codec::encode(st);
    BOOST_CHECK(codec::decode_storage(encoded) == st);

    // Serializing the decoded storage yields the same document
    BOOST_CHECK_EQUAL(
        boost::json::serialize(codec::encode(codec::decode_storage(encoded))),
        boost::json::serialize(encoded));
}

BOOST_AUTO_TEST_CASE(lookup_uses_micheline_option, * boost::unit_test::timeout(10)) {
    auto found = codec::encode_lookup("shape", std::string("round"));
    auto missing = codec::encode_lookup("size", std::nullopt);

    BOOST_CHECK_EQUAL(found.as_object().at("prim").as_string(), "Pair");
    const auto& option = missing.as_object().at("args").as_array()[1].as_object();
    BOOST_CHECK_EQUAL(option.at("prim").as_string(), "None");

    auto log = codec::decode_lookup_log(boost::json::array{found, missing});
    BOOST_REQUIRE_EQUAL(log._entries.size(), 2u);
    BOOST_CHECK_EQUAL(log._entries[0].first, "shape");
    BOOST_CHECK(log._entries[0].second == std::optional<std::string>("round"));
    BOOST_CHECK(!log._entries[1].second.has_value());
}

BOOST_AUTO_TEST_CASE(ledger_decodes_transfer_batches, * boost::unit_test::timeout(10)) {
    transfer_batch batch{"KT1Dao", {transfer_destination{"tz1Bob", 0, 12}}};
    auto argument = codec::transfer_argument(batch);
    BOOST_REQUIRE(argument.is_array());

    auto ledger = codec::decode_token_ledger(argument);
    BOOST_REQUIRE_EQUAL(ledger._transfers.size(), 1u);
    BOOST_CHECK(ledger._transfers.front() == batch);
}

BOOST_AUTO_TEST_CASE(malformed_input_is_rejected, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_THROW(codec::decode_parameter("set_fixed_fee", boost::json::value(1)), serialization_exception);
    BOOST_CHECK_THROW(codec::decode_parameter("freeze", boost::json::value(-4)), serialization_exception);
    BOOST_CHECK_THROW(codec::decode_parameter("freeze", boost::json::value("4")), serialization_exception);
    BOOST_CHECK_THROW(
        codec::decode_parameter("vote", boost::json::parse(R"({"proposal_key":"k","vote_type":1,"vote_amount":1})")),
        serialization_exception);
    BOOST_CHECK_THROW(
        codec::decode_parameter("propose", boost::json::parse(R"({"frozen_token":1})")),
        serialization_exception);
    BOOST_CHECK_THROW(
        codec::decode_metadata(boost::json::parse(R"({"kind":"poll"})")), serialization_exception);
    BOOST_CHECK_THROW(codec::decode_registry_parameter("update_receivers", boost::json::value(3)),
                      serialization_exception);
    BOOST_CHECK_THROW(codec::decode_storage(boost::json::array{}), serialization_exception);
    BOOST_CHECK_THROW(codec::decode_token_ledger(boost::json::object{}), serialization_exception);
    BOOST_CHECK_THROW(
        codec::decode_lookup_log(boost::json::parse(R"([{"prim":"Pair","args":[{"string":"k"},{"prim":"Left"}]}])")),
        serialization_exception);
}

BOOST_AUTO_TEST_CASE(parameters_render_readably, * boost::unit_test::timeout(10)) {
    std::ostringstream oss;
    oss << parameter{propose{10, xtz_transfer{"tz1Bob", 5}}};
    BOOST_CHECK_EQUAL(oss.str(), "propose { frozen_token = 10, metadata = xtz_transfer 5 mutez to tz1Bob }");

    std::ostringstream code;
    code << error_code::not_enough_frozen_tokens;
    BOOST_CHECK_EQUAL(code.str(), "NOT_ENOUGH_FROZEN_TOKENS");
}

BOOST_AUTO_TEST_CASE(optional_registry_values_render_as_options, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_EQUAL(render_option(std::string("round")), "Some \"round\"");
    BOOST_CHECK_EQUAL(render_option(std::nullopt), "None");

    std::ostringstream removal;
    removal << proposal_metadata{registry_update{"colour", std::nullopt}};
    BOOST_CHECK_EQUAL(removal.str(), "registry_update \"colour\" := None");

    std::ostringstream lookups;
    lookups << auxiliary_storage{lookup_log{{{"shape", std::string("round")}, {"size", std::nullopt}}}};
    BOOST_CHECK_EQUAL(lookups.str(), "[(\"shape\", Some \"round\"), (\"size\", None)]");
}

BOOST_AUTO_TEST_SUITE_END()
