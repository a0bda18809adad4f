#pragma once

#include <chain_emulator/emulator_impl.hpp>
#include <chain_emulator/types.hpp>

#include <folly/Executor.h>
#include <folly/executors/InlineExecutor.h>
#include <folly/futures/Future.h>

#include <boost/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace chain_emulator {

// Asynchronous front of an emulated chain. Every call is scheduled on the
// executor, optionally after a simulated network latency, and completes with
// the chain's result or its exception. Copies share the chain.
class chain_client {
public:
    explicit chain_client(
        std::shared_ptr<emulated_chain> chain,
        folly::Executor* executor = &folly::InlineExecutor::instance(),
        std::chrono::milliseconds latency = std::chrono::milliseconds{0}
    )
        : _chain(std::move(chain))
        , _executor(executor)
        , _latency(latency) {}

    auto advance_level(level_t levels) -> folly::Future<folly::Unit> {
        return schedule([chain = _chain, levels]() { chain->advance_level(levels); });
    }

    auto credit(const address& account, mutez amount) -> folly::Future<folly::Unit> {
        return schedule([chain = _chain, account, amount]() { chain->credit(account, amount); });
    }

    auto originate(const address& addr, std::shared_ptr<contract> code, mutez balance = 0)
        -> folly::Future<folly::Unit> {
        return schedule([chain = _chain, addr, code = std::move(code), balance]() {
            chain->originate(addr, code->clone(), balance);
        });
    }

    auto transfer(
        const address& source,
        const address& destination,
        const std::string& entrypoint,
        boost::json::value parameter,
        mutez amount
    ) -> folly::Future<folly::Unit> {
        return schedule([chain = _chain, source, destination, entrypoint, parameter = std::move(parameter), amount]() {
            chain->transfer(source, destination, entrypoint, parameter, amount);
        });
    }

    auto level() -> folly::Future<level_t> {
        return schedule([chain = _chain]() { return chain->level(); });
    }

    auto balance(const address& account) -> folly::Future<mutez> {
        return schedule([chain = _chain, account]() { return chain->balance(account); });
    }

    auto storage(const address& contract_address) -> folly::Future<boost::json::value> {
        return schedule([chain = _chain, contract_address]() { return chain->storage(contract_address); });
    }

    auto chain() const -> const std::shared_ptr<emulated_chain>& { return _chain; }
    auto executor() const -> folly::Executor* { return _executor; }
    auto latency() const -> std::chrono::milliseconds { return _latency; }

private:
    template<typename F>
    auto schedule(F&& fn) -> folly::Future<folly::lift_unit_t<std::invoke_result_t<F>>> {
        if (_latency.count() == 0) {
            return folly::via(folly::getKeepAliveToken(_executor), std::forward<F>(fn));
        }
        return folly::futures::sleep(_latency)
            .via(folly::getKeepAliveToken(_executor))
            .thenValue([fn = std::forward<F>(fn)](folly::Unit) mutable { return fn(); });
    }

    std::shared_ptr<emulated_chain> _chain;
    folly::Executor* _executor;
    std::chrono::milliseconds _latency;
};

} // namespace chain_emulator
