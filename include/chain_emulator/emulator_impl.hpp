#pragma once

#include <chain_emulator/emulator.hpp>

#include <boost/json.hpp>

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace chain_emulator {

inline auto emulated_chain::level() const -> level_t {
    std::lock_guard lock(_mutex);
    return _level;
}

inline auto emulated_chain::advance_level(level_t levels) -> void {
    std::lock_guard lock(_mutex);
    _level += levels;
}

inline auto emulated_chain::credit(const address& account, mutez amount) -> void {
    std::lock_guard lock(_mutex);
    _balances[account] += amount;
}

inline auto emulated_chain::originate(const address& addr, std::unique_ptr<contract> code, mutez balance) -> void {
    std::lock_guard lock(_mutex);
    if (!is_contract_address(addr)) {
        throw chain_exception("Contract addresses start with KT1: " + addr);
    }
    if (_contracts.contains(addr) || _balances.contains(addr)) {
        throw address_in_use_exception(addr);
    }
    _contracts.emplace(addr, std::move(code));
    _balances[addr] = balance;
}

inline auto emulated_chain::transfer(
    const address& source,
    const address& destination,
    const std::string& entrypoint,
    const boost::json::value& parameter,
    mutez amount
) -> void {
    std::lock_guard lock(_mutex);

    auto saved_balances = _balances;
    auto saved_contracts = snapshot();

    std::deque<pending_operation> pending;
    pending.push_back(pending_operation{source, source, destination, entrypoint, parameter, amount});

    std::size_t count = 0;
    try {
        while (!pending.empty()) {
            auto op = std::move(pending.front());
            pending.pop_front();

            if (++count > max_operations_per_transfer) {
                throw operation_limit_exception(max_operations_per_transfer);
            }

            auto emitted = run_one(op);

            // Depth first: the emitted operations run before the remaining ones
            for (auto it = emitted.rbegin(); it != emitted.rend(); ++it) {
                pending.push_front(pending_operation{
                    op._source,
                    op._destination,
                    it->destination(),
                    it->entrypoint(),
                    it->parameter(),
                    it->amount()
                });
            }
        }
    } catch (...) {
        _balances = std::move(saved_balances);
        _contracts = std::move(saved_contracts);
        throw;
    }

    _operations_run += count;
}

inline auto emulated_chain::run_one(const pending_operation& op) -> operation_list {
    auto& sender_balance = _balances[op._sender];
    if (sender_balance < op._amount) {
        throw balance_too_low_exception(op._sender, sender_balance, op._amount);
    }

    auto target = _contracts.find(op._destination);
    if (target == _contracts.end()) {
        if (is_contract_address(op._destination)) {
            throw unknown_contract_exception(op._destination);
        }
        // Implicit accounts only have the default entrypoint
        if (op._entrypoint != "default") {
            throw unknown_entrypoint_exception(op._destination, op._entrypoint);
        }
        sender_balance -= op._amount;
        _balances[op._destination] += op._amount;
        return {};
    }

    sender_balance -= op._amount;
    auto& destination_balance = _balances[op._destination];
    destination_balance += op._amount;

    call_context context{
        op._sender,
        op._source,
        op._destination,
        op._amount,
        destination_balance,
        _level
    };
    auto emitted = target->second->execute(context, op._entrypoint, op._parameter);

    // Tez leaving with the emitted operations is checked when each one runs
    return emitted;
}

inline auto emulated_chain::snapshot() const -> std::unordered_map<address, std::unique_ptr<contract>> {
    std::unordered_map<address, std::unique_ptr<contract>> copy;
    copy.reserve(_contracts.size());
    for (const auto& [addr, code] : _contracts) {
        copy.emplace(addr, code->clone());
    }
    return copy;
}

inline auto emulated_chain::balance(const address& account) const -> mutez {
    std::lock_guard lock(_mutex);
    auto it = _balances.find(account);
    return it == _balances.end() ? 0 : it->second;
}

inline auto emulated_chain::storage(const address& contract_address) const -> boost::json::value {
    std::lock_guard lock(_mutex);
    auto it = _contracts.find(contract_address);
    if (it == _contracts.end()) {
        throw unknown_contract_exception(contract_address);
    }
    return it->second->storage();
}

inline auto emulated_chain::has_contract(const address& contract_address) const -> bool {
    std::lock_guard lock(_mutex);
    return _contracts.contains(contract_address);
}

inline auto emulated_chain::operations_run() const -> std::size_t {
    std::lock_guard lock(_mutex);
    return _operations_run;
}

} // namespace chain_emulator
