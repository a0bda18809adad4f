#pragma once

#include <lockstep/call_loop.hpp>
#include <lockstep/configuration.hpp>
#include <lockstep/console_logger.hpp>
#include <lockstep/dao/contract.hpp>
#include <lockstep/dao/model.hpp>
#include <lockstep/dao/system.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/error_normalizer.hpp>
#include <lockstep/logger.hpp>
#include <lockstep/metrics.hpp>
#include <lockstep/model_executor.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/system_executor.hpp>

#include <chain_emulator/client.hpp>
#include <chain_emulator/contracts.hpp>
#include <chain_emulator/emulator_impl.hpp>

#include <folly/CancellationToken.h>
#include <folly/Executor.h>
#include <folly/executors/InlineExecutor.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace lockstep::dao {

// Builds the primary contract from its initial storage; tests substitute
// faulty implementations here
using contract_factory = std::function<std::shared_ptr<chain_emulator::contract>(const storage&, bool)>;

inline auto default_contract_factory() -> contract_factory {
    return [](const storage& initial, bool registry_enabled) -> std::shared_ptr<chain_emulator::contract> {
        return std::make_shared<dao_contract>(initial, registry_enabled);
    };
}

// Tez every sender receives at deployment so calls carrying tez never bounce
constexpr mutez sender_prefund = 1'000'000;

struct fixture_options {
    contract_factory _factory = default_contract_factory();
    failure_encoding _encoding{failure_encoding::typed};
    // Executor the chain client completes its futures on
    folly::Executor* _executor{&folly::InlineExecutor::instance()};
    // Simulated latency of every chain call
    std::chrono::milliseconds _latency{0};
    std::optional<error_code> _timeout_code;
};

// Deploys one sequence's environment on a fresh emulated chain and runs the
// sequence through a call_loop against the reference model.
//
// Deployment: the guardian, governance token and view consumer are
// originated at their handles, the chain is moved to the start level, the
// DAO is originated and funded with the initial balance, and every sender is
// prefunded. The model starts from the same storage, balance and level, with
// empty auxiliary entities.
template<typename Custom, diagnostic_logger Logger = console_logger, metrics Metrics = noop_metrics>
class fixture {
public:
    static constexpr bool registry_enabled = !std::is_same_v<Custom, no_custom_entrypoint>;

    using domain_type = domain<Custom>;
    using model_type = model<Custom>;
    using client_type = system_client<Custom>;
    using dispatch_type = std::conditional_t<registry_enabled, registry_dispatch, no_custom_dispatch>;
    using loop_type = call_loop<domain_type, model_type, client_type, dispatch_type, Logger, Metrics>;
    using result_type = run_result<domain_type>;

    explicit fixture(
        engine_configuration config = engine_configuration{},
        fixture_options options = fixture_options{},
        Logger logger = Logger{},
        Metrics metrics = Metrics{}
    )
        : _config(std::move(config))
        , _options(std::move(options))
        , _logger(std::move(logger))
        , _metrics(std::move(metrics)) {}

    auto run(const sequence<domain_type>& seq, folly::CancellationToken token = {}) -> result_type {
        auto client = deploy(seq);

        const auto& env = seq.env();
        model_executor<domain_type, model_type> model_side(
            model_type{}, initial_state(seq), env.tracked_entities());
        system_executor<domain_type, client_type, dispatch_type> system_side(
            std::move(client), env.primary(), env.tracked_entities(), _config, dispatch_type{});

        auto normalizer = _options._timeout_code
            ? error_normalizer<error_code>(*_options._timeout_code)
            : error_normalizer<error_code>{};

        loop_type loop(std::move(model_side), std::move(system_side), normalizer, _logger, _metrics);
        return loop.run(seq.operations(), std::move(token));
    }

    // Chain of the last deployment
    auto chain() const -> const std::shared_ptr<chain_emulator::emulated_chain>& { return _chain; }
    auto config() const -> const engine_configuration& { return _config; }

private:
    auto deploy(const sequence<domain_type>& seq) -> client_type {
        const auto& env = seq.env();
        _chain = std::make_shared<chain_emulator::emulated_chain>();
        chain_emulator::chain_client chain_client(_chain, _options._executor, _options._latency);

        chain_client.originate(env.guardian().value(), std::make_shared<chain_emulator::unit_contract>()).get();
        chain_client.originate(
            env.governance_token().value(), std::make_shared<chain_emulator::token_ledger_contract>()).get();
        chain_client.originate(
            env.view_consumer().value(), std::make_shared<chain_emulator::consumer_contract>()).get();
        chain_client.advance_level(env.start_level()).get();

        auto code = _options._factory(seq.initial_storage(), registry_enabled);
        chain_client.originate(env.primary().value(), std::move(code)).get();
        chain_client.credit(env.primary().value(), seq.initial_balance()).get();
        for (const auto& sender : seq.senders()) {
            chain_client.credit(sender.value(), sender_prefund).get();
        }

        auto level_text = std::to_string(env.start_level());
        auto balance_text = std::to_string(seq.initial_balance());
        auto senders_text = std::to_string(seq.senders().size());
        _logger.info("Deployed DAO environment", {
            {"primary", env.primary().value()},
            {"start_level", level_text},
            {"initial_balance", balance_text},
            {"senders", senders_text}
        });

        client_type client(std::move(chain_client), _options._encoding);
        client.register_auxiliary(env.governance_token(), auxiliary_kind::token_ledger);
        client.register_auxiliary(env.view_consumer(), auxiliary_kind::lookup_log);
        return client;
    }

    static auto initial_state(const sequence<domain_type>& seq) -> model_state_t<domain_type> {
        model_state_t<domain_type> state;
        state._self = seq.env().primary();
        state._storage = seq.initial_storage();
        state._balance = seq.initial_balance();
        state._level = seq.env().start_level();
        state._entities.emplace(seq.env().governance_token(), entity_state<auxiliary_storage>{token_ledger{}, 0});
        state._entities.emplace(seq.env().view_consumer(), entity_state<auxiliary_storage>{lookup_log{}, 0});
        return state;
    }

    engine_configuration _config;
    fixture_options _options;
    Logger _logger;
    Metrics _metrics;
    std::shared_ptr<chain_emulator::emulated_chain> _chain;
};

} // namespace lockstep::dao
