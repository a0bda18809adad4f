#pragma once

#include <chain_emulator/contracts.hpp>
#include <chain_emulator/exceptions.hpp>
#include <chain_emulator/types.hpp>

#include <boost/json.hpp>

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chain_emulator {

// In-process ledger: a logical level, implicit accounts, originated contracts
// and atomic transfers. Thread-safe; every public call holds the chain lock.
class emulated_chain {
public:
    explicit emulated_chain(level_t level = 0)
        : _level(level) {}

    emulated_chain(const emulated_chain&) = delete;
    auto operator=(const emulated_chain&) -> emulated_chain& = delete;

    // Level control
    auto level() const -> level_t;
    auto advance_level(level_t levels) -> void;

    // Faucet: credit an account out of thin air
    auto credit(const address& account, mutez amount) -> void;

    // Originate code at a fixed address with an initial balance
    auto originate(const address& addr, std::unique_ptr<contract> code, mutez balance = 0) -> void;

    // Run one external transfer signed by source, with every internal
    // operation it emits. All or nothing.
    auto transfer(
        const address& source,
        const address& destination,
        const std::string& entrypoint,
        const boost::json::value& parameter,
        mutez amount
    ) -> void;

    // Queries
    auto balance(const address& account) const -> mutez;
    auto storage(const address& contract_address) const -> boost::json::value;
    auto has_contract(const address& contract_address) const -> bool;
    auto operations_run() const -> std::size_t;

private:
    struct pending_operation {
        address _source;
        address _sender;
        address _destination;
        std::string _entrypoint;
        boost::json::value _parameter;
        mutez _amount{0};
    };

    auto run_one(const pending_operation& op) -> operation_list;
    auto snapshot() const -> std::unordered_map<address, std::unique_ptr<contract>>;

    level_t _level;
    std::unordered_map<address, mutez> _balances;
    std::unordered_map<address, std::unique_ptr<contract>> _contracts;
    std::size_t _operations_run{0};
    mutable std::mutex _mutex;
};

} // namespace chain_emulator
