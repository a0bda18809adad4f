#pragma once

#include <chain_emulator/exceptions.hpp>
#include <chain_emulator/types.hpp>

#include <boost/json.hpp>

#include <memory>
#include <string_view>

namespace chain_emulator {

// Code and storage of one originated contract.
// execute() either returns the internal operations to run next or throws; the
// emulator restores the state of every contract touched by a failed transfer
// from the clones it took before running it.
class contract {
public:
    virtual ~contract() = default;

    virtual auto execute(
        const call_context& context,
        std::string_view entrypoint,
        const boost::json::value& parameter
    ) -> operation_list = 0;

    // Storage as Micheline-flavoured JSON
    virtual auto storage() const -> boost::json::value = 0;

    virtual auto clone() const -> std::unique_ptr<contract> = 0;
};

// Accepts anything on default and keeps a unit storage
class unit_contract : public contract {
public:
    auto execute(
        const call_context& context,
        std::string_view entrypoint,
        [[maybe_unused]] const boost::json::value& parameter
    ) -> operation_list override {
        if (entrypoint != "default") {
            throw unknown_entrypoint_exception(context.self(), std::string(entrypoint));
        }
        return {};
    }

    auto storage() const -> boost::json::value override {
        return unit_value();
    }

    auto clone() const -> std::unique_ptr<contract> override {
        return std::make_unique<unit_contract>(*this);
    }
};

// Appends every value received on default to its storage
class consumer_contract : public contract {
public:
    auto execute(
        const call_context& context,
        std::string_view entrypoint,
        const boost::json::value& parameter
    ) -> operation_list override {
        if (entrypoint != "default") {
            throw unknown_entrypoint_exception(context.self(), std::string(entrypoint));
        }
        _received.push_back(parameter);
        return {};
    }

    auto storage() const -> boost::json::value override {
        return _received;
    }

    auto clone() const -> std::unique_ptr<contract> override {
        return std::make_unique<consumer_contract>(*this);
    }

private:
    boost::json::array _received;
};

// FA2-like ledger that records every batch handed to its transfer entrypoint
// instead of keeping balances. Tez sent on default is accepted.
//
// transfer parameter: [{"from_": addr, "txs": [{"to_": addr, "token_id": n, "amount": n}, ...]}, ...]
class token_ledger_contract : public contract {
public:
    auto execute(
        const call_context& context,
        std::string_view entrypoint,
        const boost::json::value& parameter
    ) -> operation_list override {
        if (entrypoint == "default") {
            return {};
        }
        if (entrypoint != "transfer") {
            throw unknown_entrypoint_exception(context.self(), std::string(entrypoint));
        }
        if (!parameter.is_array()) {
            throw bad_parameter_exception(context.self(), "transfer expects a list of batches");
        }
        for (const auto& batch : parameter.as_array()) {
            if (!batch.is_object() || !batch.as_object().contains("from_") || !batch.as_object().contains("txs")) {
                throw bad_parameter_exception(context.self(), "malformed transfer batch");
            }
            _transfers.push_back(batch);
        }
        return {};
    }

    auto storage() const -> boost::json::value override {
        return _transfers;
    }

    auto clone() const -> std::unique_ptr<contract> override {
        return std::make_unique<token_ledger_contract>(*this);
    }

private:
    boost::json::array _transfers;
};

} // namespace chain_emulator
