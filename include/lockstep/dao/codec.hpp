#pragma once

#include <lockstep/dao/types.hpp>
#include <lockstep/exceptions.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace lockstep::dao {

// Entrypoint name and argument of one call
struct entrypoint_call {
    std::string _entrypoint;
    boost::json::value _argument;

    auto entrypoint() const -> const std::string& { return _entrypoint; }
    auto argument() const -> const boost::json::value& { return _argument; }
};

// JSON wire encoding of DAO parameters, storage and auxiliary storages
class codec {
public:
    // Parameters

    static auto encode(const parameter& param) -> entrypoint_call {
        return std::visit([](const auto& value) -> entrypoint_call {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, propose>) {
                boost::json::object obj;
                obj["frozen_token"] = value._frozen_token;
                obj["metadata"] = encode(value._metadata);
                return {"propose", std::move(obj)};
            } else if constexpr (std::is_same_v<T, vote>) {
                boost::json::object obj;
                obj["proposal_key"] = value._proposal_key;
                obj["vote_type"] = value._upvote;
                obj["vote_amount"] = value._vote_amount;
                return {"vote", std::move(obj)};
            } else if constexpr (std::is_same_v<T, freeze>) {
                return {"freeze", value._amount};
            } else if constexpr (std::is_same_v<T, unfreeze>) {
                return {"unfreeze", value._amount};
            } else if constexpr (std::is_same_v<T, flush>) {
                return {"flush", value._count};
            } else if constexpr (std::is_same_v<T, drop_proposal>) {
                return {"drop_proposal", boost::json::string(value._proposal_key)};
            } else if constexpr (std::is_same_v<T, transfer_ownership>) {
                return {"transfer_ownership", boost::json::string(value._new_owner)};
            } else if constexpr (std::is_same_v<T, accept_ownership>) {
                return {"accept_ownership", unit()};
            } else if constexpr (std::is_same_v<T, transfer_contract_tokens>) {
                boost::json::object obj;
                obj["contract"] = value._contract;
                obj["receiver"] = value._receiver;
                obj["amount"] = value._amount;
                return {"transfer_contract_tokens", std::move(obj)};
            } else {
                return {"default", unit()};
            }
        }, param);
    }

    static auto encode(const registry_parameter& param) -> entrypoint_call {
        if (const auto* lookup = std::get_if<lookup_registry>(&param)) {
            boost::json::object obj;
            obj["key"] = lookup->_key;
            obj["view"] = lookup->_view;
            return {"lookup_registry", std::move(obj)};
        }
        boost::json::array receivers;
        for (const auto& receiver : std::get<update_receivers>(param)._receivers) {
            receivers.emplace_back(receiver);
        }
        return {"update_receivers", std::move(receivers)};
    }

    static auto decode_parameter(std::string_view entrypoint, const boost::json::value& argument) -> parameter {
        if (entrypoint == "propose") {
            const auto& obj = as_object(argument, "propose");
            return propose{get_uint(obj, "frozen_token"), decode_metadata(get(obj, "metadata"))};
        }
        if (entrypoint == "vote") {
            const auto& obj = as_object(argument, "vote");
            const auto& vote_type = get(obj, "vote_type");
            if (!vote_type.is_bool()) {
                throw serialization_exception("vote_type must be a boolean");
            }
            return vote{get_string(obj, "proposal_key"), vote_type.as_bool(), get_uint(obj, "vote_amount")};
        }
        if (entrypoint == "freeze") {
            return freeze{to_uint(argument, "freeze")};
        }
        if (entrypoint == "unfreeze") {
            return unfreeze{to_uint(argument, "unfreeze")};
        }
        if (entrypoint == "flush") {
            return flush{to_uint(argument, "flush")};
        }
        if (entrypoint == "drop_proposal") {
            return drop_proposal{to_string(argument, "drop_proposal")};
        }
        if (entrypoint == "transfer_ownership") {
            return transfer_ownership{to_string(argument, "transfer_ownership")};
        }
        if (entrypoint == "accept_ownership") {
            return accept_ownership{};
        }
        if (entrypoint == "transfer_contract_tokens") {
            const auto& obj = as_object(argument, "transfer_contract_tokens");
            return transfer_contract_tokens{
                get_string(obj, "contract"),
                get_string(obj, "receiver"),
                get_uint(obj, "amount")
            };
        }
        if (entrypoint == "default") {
            return receive_xtz{};
        }
        throw serialization_exception("unknown entrypoint " + std::string(entrypoint));
    }

    static auto decode_registry_parameter(std::string_view entrypoint, const boost::json::value& argument)
        -> registry_parameter {
        if (entrypoint == "lookup_registry") {
            const auto& obj = as_object(argument, "lookup_registry");
            return lookup_registry{get_string(obj, "key"), get_string(obj, "view")};
        }
        if (entrypoint == "update_receivers") {
            if (!argument.is_array()) {
                throw serialization_exception("update_receivers expects a list");
            }
            update_receivers result;
            for (const auto& receiver : argument.as_array()) {
                result._receivers.push_back(to_string(receiver, "receiver"));
            }
            return result;
        }
        throw serialization_exception("unknown entrypoint " + std::string(entrypoint));
    }

    static auto encode(const proposal_metadata& metadata) -> boost::json::value {
        boost::json::object obj;
        std::visit([&obj](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, text_metadata>) {
                obj["kind"] = "text";
                obj["text"] = value._text;
            } else if constexpr (std::is_same_v<T, xtz_transfer>) {
                obj["kind"] = "xtz_transfer";
                obj["receiver"] = value._receiver;
                obj["amount"] = value._amount;
            } else if constexpr (std::is_same_v<T, token_transfer>) {
                obj["kind"] = "token_transfer";
                obj["receiver"] = value._receiver;
                obj["amount"] = value._amount;
            } else {
                obj["kind"] = "registry_update";
                obj["key"] = value._key;
                if (value._value) {
                    obj["value"] = *value._value;
                } else {
                    obj["value"] = nullptr;
                }
            }
        }, metadata);
        return obj;
    }

    static auto decode_metadata(const boost::json::value& value) -> proposal_metadata {
        const auto& obj = as_object(value, "metadata");
        auto kind = get_string(obj, "kind");
        if (kind == "text") {
            return text_metadata{get_string(obj, "text")};
        }
        if (kind == "xtz_transfer") {
            return xtz_transfer{get_string(obj, "receiver"), get_uint(obj, "amount")};
        }
        if (kind == "token_transfer") {
            return token_transfer{get_string(obj, "receiver"), get_uint(obj, "amount")};
        }
        if (kind == "registry_update") {
            return registry_update{get_string(obj, "key"), get_optional_string(obj, "value")};
        }
        throw serialization_exception("unknown metadata kind " + kind);
    }

    // Storage

    static auto encode(const storage& st) -> boost::json::value {
        boost::json::object obj;
        obj["admin"] = st._admin;
        obj["pending_owner"] = st._pending_owner;
        obj["guardian"] = st._guardian;
        obj["governance_token"] = st._governance_token;
        obj["token_id"] = st._token_id;
        obj["start_level"] = st._start_level;

        boost::json::object config;
        config["period"] = st._config._period;
        config["quorum"] = st._config._quorum;
        config["proposal_lock"] = st._config._proposal_lock;
        config["slash_divisor"] = st._config._slash_divisor;
        config["max_proposals"] = st._config._max_proposals;
        config["min_xtz_amount"] = st._config._min_xtz_amount;
        config["max_xtz_amount"] = st._config._max_xtz_amount;
        obj["config"] = std::move(config);

        obj["frozen_total_supply"] = st._frozen_total_supply;

        boost::json::object history;
        for (const auto& [owner, record] : st._freeze_history) {
            boost::json::object entry;
            entry["current_stage"] = record._current_stage;
            entry["staked"] = record._staked;
            entry["current_unstaked"] = record._current_unstaked;
            entry["past_unstaked"] = record._past_unstaked;
            history[owner] = std::move(entry);
        }
        obj["freeze_history"] = std::move(history);

        boost::json::object proposals;
        for (const auto& [key, p] : st._proposals) {
            boost::json::object entry;
            entry["proposer"] = p._proposer;
            entry["frozen_token"] = p._frozen_token;
            entry["metadata"] = encode(p._metadata);
            entry["start_level"] = p._start_level;
            entry["voting_stage"] = p._voting_stage;
            entry["upvotes"] = p._upvotes;
            entry["downvotes"] = p._downvotes;
            boost::json::object voters;
            for (const auto& [voter, stake] : p._voter_stakes) {
                voters[voter] = stake;
            }
            entry["voters"] = std::move(voters);
            proposals[key] = std::move(entry);
        }
        obj["proposals"] = std::move(proposals);

        boost::json::array ongoing;
        for (const auto& key : st._ongoing) {
            ongoing.emplace_back(key);
        }
        obj["ongoing"] = std::move(ongoing);

        boost::json::object registry;
        for (const auto& [key, value] : st._registry) {
            registry[key] = value;
        }
        obj["registry"] = std::move(registry);
        return obj;
    }

    static auto decode_storage(const boost::json::value& value) -> storage {
        const auto& obj = as_object(value, "storage");
        storage st;
        st._admin = get_string(obj, "admin");
        st._pending_owner = get_string(obj, "pending_owner");
        st._guardian = get_string(obj, "guardian");
        st._governance_token = get_string(obj, "governance_token");
        st._token_id = get_uint(obj, "token_id");
        st._start_level = get_uint(obj, "start_level");

        const auto& config = as_object(get(obj, "config"), "config");
        st._config._period = get_uint(config, "period");
        st._config._quorum = get_uint(config, "quorum");
        st._config._proposal_lock = get_uint(config, "proposal_lock");
        st._config._slash_divisor = get_uint(config, "slash_divisor");
        st._config._max_proposals = get_uint(config, "max_proposals");
        st._config._min_xtz_amount = get_uint(config, "min_xtz_amount");
        st._config._max_xtz_amount = get_uint(config, "max_xtz_amount");

        st._frozen_total_supply = get_uint(obj, "frozen_total_supply");

        for (const auto& [owner, entry_value] : as_object(get(obj, "freeze_history"), "freeze_history")) {
            const auto& entry = as_object(entry_value, "freeze record");
            st._freeze_history[std::string(owner)] = freeze_record{
                get_uint(entry, "current_stage"),
                get_uint(entry, "staked"),
                get_uint(entry, "current_unstaked"),
                get_uint(entry, "past_unstaked")
            };
        }

        for (const auto& [key, entry_value] : as_object(get(obj, "proposals"), "proposals")) {
            const auto& entry = as_object(entry_value, "proposal");
            proposal p;
            p._proposer = get_string(entry, "proposer");
            p._frozen_token = get_uint(entry, "frozen_token");
            p._metadata = decode_metadata(get(entry, "metadata"));
            p._start_level = get_uint(entry, "start_level");
            p._voting_stage = get_uint(entry, "voting_stage");
            p._upvotes = get_uint(entry, "upvotes");
            p._downvotes = get_uint(entry, "downvotes");
            for (const auto& [voter, stake] : as_object(get(entry, "voters"), "voters")) {
                p._voter_stakes[std::string(voter)] = to_uint(stake, "voter stake");
            }
            st._proposals[std::string(key)] = std::move(p);
        }

        const auto& ongoing = get(obj, "ongoing");
        if (!ongoing.is_array()) {
            throw serialization_exception("ongoing must be a list");
        }
        for (const auto& key : ongoing.as_array()) {
            st._ongoing.push_back(to_string(key, "ongoing key"));
        }

        for (const auto& [key, entry] : as_object(get(obj, "registry"), "registry")) {
            st._registry[std::string(key)] = to_string(entry, "registry value");
        }
        return st;
    }

    // Governance token ledger

    static auto encode(const transfer_batch& batch) -> boost::json::value {
        boost::json::array txs;
        for (const auto& tx : batch._txs) {
            boost::json::object entry;
            entry["to_"] = tx._to;
            entry["token_id"] = tx._token_id;
            entry["amount"] = tx._amount;
            txs.push_back(std::move(entry));
        }
        boost::json::object obj;
        obj["from_"] = batch._from;
        obj["txs"] = std::move(txs);
        return obj;
    }

    // Argument of an FA2 transfer call carrying one batch
    static auto transfer_argument(const transfer_batch& batch) -> boost::json::value {
        return boost::json::array{encode(batch)};
    }

    static auto decode_token_ledger(const boost::json::value& value) -> token_ledger {
        if (!value.is_array()) {
            throw serialization_exception("token ledger storage must be a list");
        }
        token_ledger ledger;
        for (const auto& batch_value : value.as_array()) {
            const auto& obj = as_object(batch_value, "transfer batch");
            transfer_batch batch;
            batch._from = get_string(obj, "from_");
            const auto& txs = get(obj, "txs");
            if (!txs.is_array()) {
                throw serialization_exception("txs must be a list");
            }
            for (const auto& tx_value : txs.as_array()) {
                const auto& tx = as_object(tx_value, "transfer destination");
                batch._txs.push_back(transfer_destination{
                    get_string(tx, "to_"),
                    get_uint(tx, "token_id"),
                    get_uint(tx, "amount")
                });
            }
            ledger._transfers.push_back(std::move(batch));
        }
        return ledger;
    }

    // View consumer

    // Micheline (Pair "key" (Some "value")) or (Pair "key" None)
    static auto encode_lookup(const std::string& key, const std::optional<std::string>& value) -> boost::json::value {
        boost::json::value option;
        if (value) {
            option = boost::json::object{
                {"prim", "Some"},
                {"args", boost::json::array{boost::json::object{{"string", *value}}}}
            };
        } else {
            option = boost::json::object{{"prim", "None"}};
        }
        return boost::json::object{
            {"prim", "Pair"},
            {"args", boost::json::array{boost::json::object{{"string", key}}, std::move(option)}}
        };
    }

    static auto decode_lookup_log(const boost::json::value& value) -> lookup_log {
        if (!value.is_array()) {
            throw serialization_exception("view storage must be a list");
        }
        lookup_log log;
        for (const auto& entry : value.as_array()) {
            const auto& pair = as_object(entry, "lookup entry");
            const auto& args = get(pair, "args");
            if (get_string(pair, "prim") != "Pair" || !args.is_array() || args.as_array().size() != 2) {
                throw serialization_exception("lookup entry must be a pair");
            }
            auto key = get_string(as_object(args.as_array()[0], "lookup key"), "string");
            const auto& option = as_object(args.as_array()[1], "lookup value");
            auto prim = get_string(option, "prim");
            std::optional<std::string> found;
            if (prim == "Some") {
                const auto& some_args = get(option, "args");
                if (!some_args.is_array() || some_args.as_array().size() != 1) {
                    throw serialization_exception("Some takes one argument");
                }
                found = get_string(as_object(some_args.as_array()[0], "lookup value"), "string");
            } else if (prim != "None") {
                throw serialization_exception("lookup value must be an option");
            }
            log._entries.emplace_back(std::move(key), std::move(found));
        }
        return log;
    }

private:
    static auto unit() -> boost::json::value {
        return boost::json::object{{"prim", "Unit"}};
    }

    static auto as_object(const boost::json::value& value, std::string_view what) -> const boost::json::object& {
        if (!value.is_object()) {
            throw serialization_exception(std::string(what) + " must be an object");
        }
        return value.as_object();
    }

    static auto get(const boost::json::object& obj, std::string_view key) -> const boost::json::value& {
        const auto* value = obj.if_contains(key);
        if (value == nullptr) {
            throw serialization_exception("missing field " + std::string(key));
        }
        return *value;
    }

    static auto to_uint(const boost::json::value& value, std::string_view what) -> std::uint64_t {
        if (value.is_uint64()) {
            return value.as_uint64();
        }
        if (value.is_int64() && value.as_int64() >= 0) {
            return static_cast<std::uint64_t>(value.as_int64());
        }
        throw serialization_exception(std::string(what) + " must be a natural number");
    }

    static auto to_string(const boost::json::value& value, std::string_view what) -> std::string {
        if (!value.is_string()) {
            throw serialization_exception(std::string(what) + " must be a string");
        }
        return std::string(value.as_string());
    }

    static auto get_uint(const boost::json::object& obj, std::string_view key) -> std::uint64_t {
        return to_uint(get(obj, key), key);
    }

    static auto get_string(const boost::json::object& obj, std::string_view key) -> std::string {
        return to_string(get(obj, key), key);
    }

    static auto get_optional_string(const boost::json::object& obj, std::string_view key)
        -> std::optional<std::string> {
        const auto& value = get(obj, key);
        if (value.is_null()) {
            return std::nullopt;
        }
        return to_string(value, key);
    }
};

} // namespace lockstep::dao
