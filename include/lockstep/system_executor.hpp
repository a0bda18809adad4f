#pragma once

#include <lockstep/configuration.hpp>
#include <lockstep/error_normalizer.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/types.hpp>

#include <folly/futures/Future.h>

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

namespace lockstep {

// Client of the system under test. Every call may suspend; failures of the
// submitted call are reported in the submission_result, transport problems
// and unknown handles as exceptional futures.
template<typename C, typename D>
concept system_client = domain_types<D> && requires(
    C& client,
    level_t levels,
    const entity_handle& handle,
    mutez amount,
    const typename D::builtin_parameter_type& parameter
) {
    // Move the shared logical clock forward
    { client.advance_level(levels) } -> std::same_as<folly::Future<folly::Unit>>;
    // Bookkeeping transfer so the sender can pay for its call
    { client.fund(handle, amount) } -> std::same_as<folly::Future<folly::Unit>>;
    // Submit one call to target from sender, sending amount
    { client.submit(handle, handle, amount, parameter) } -> std::same_as<folly::Future<submission_result>>;
    { client.get_storage(handle) } -> std::same_as<folly::Future<typename D::storage_type>>;
    { client.get_auxiliary_storage(handle) } -> std::same_as<folly::Future<typename D::auxiliary_storage_type>>;
    { client.get_balance(handle) } -> std::same_as<folly::Future<mutez>>;
};

// Capability submitting the domain's custom entrypoint sub-variants.
// Resolved once per run; sub-variants it does not support fall under the
// engine's custom_entrypoint_policy.
template<typename X, typename C, typename D>
concept custom_entrypoint_dispatch = system_client<C, D> && requires(
    const X& dispatch,
    C& client,
    const entity_handle& handle,
    mutez amount,
    const typename D::custom_parameter_type& parameter
) {
    { dispatch.supports(parameter) } -> std::same_as<bool>;
    { dispatch.dispatch(client, handle, handle, amount, parameter) } -> std::same_as<folly::Future<submission_result>>;
};

// Dispatch for implementations without custom entrypoints
struct no_custom_dispatch {
    template<typename Custom>
    auto supports(const Custom&) const -> bool {
        return false;
    }

    template<typename Client, typename Custom>
    auto dispatch(Client&, const entity_handle&, const entity_handle&, mutez, const Custom&) const
        -> folly::Future<submission_result> {
        return folly::makeFuture(submission_result{});
    }
};

// What the system side reports for one step, before normalization
template<domain_types D>
struct raw_observables {
    submission_result _failure;
    typename D::storage_type _storage{};
    mutez _balance{0};
    std::vector<std::pair<entity_handle, entity_state_t<D>>> _auxiliary;

    auto failure() const -> const submission_result& { return _failure; }
    auto storage() const -> const typename D::storage_type& { return _storage; }
    auto balance() const -> mutez { return _balance; }
    auto auxiliary() const -> const std::vector<std::pair<entity_handle, entity_state_t<D>>>& {
        return _auxiliary;
    }
};

// Applies operations to the system under test.
// One step is: advance the clock if asked, fund the sender, submit the call
// (bounded by the step timeout), then fetch the primary storage and balance
// and the storage and balance of every tracked entity. The caller awaits the
// returned future before starting the next step.
template<domain_types D, typename Client, typename Dispatch = no_custom_dispatch>
requires system_client<Client, D> && custom_entrypoint_dispatch<Dispatch, Client, D>
class system_executor {
public:
    using observables_type = raw_observables<D>;

    system_executor(
        Client client,
        entity_handle target,
        std::vector<entity_handle> tracked,
        engine_configuration config = engine_configuration{},
        Dispatch dispatch = Dispatch{}
    )
        : _client(std::move(client))
        , _target(std::move(target))
        , _tracked(std::move(tracked))
        , _config(std::move(config))
        , _dispatch(std::move(dispatch)) {}

    auto apply(const operation_t<D>& op) -> folly::Future<observables_type> {
        ++_applied;

        auto start = op.advance()
            ? _client.advance_level(*op.advance())
            : folly::makeFuture(folly::Unit{});

        return std::move(start)
            .thenValue([this, sender = op.sender()](folly::Unit) {
                return fund(sender);
            })
            .thenValue([this, op](folly::Unit) {
                return submit(op);
            })
            .thenValue([this](submission_result failure) {
                return collect(std::move(failure));
            });
    }

    auto client() -> Client& { return _client; }
    auto target() const -> const entity_handle& { return _target; }
    auto tracked() const -> const std::vector<entity_handle>& { return _tracked; }
    auto applied() const -> std::size_t { return _applied; }

private:
    // Funding is skipped for the target itself and for tracked entities, so
    // the compared balances only move through the calls under test
    auto fund(const entity_handle& sender) -> folly::Future<folly::Unit> {
        if (_config.funding_amount() == 0 || sender == _target ||
            std::find(_tracked.begin(), _tracked.end(), sender) != _tracked.end()) {
            return folly::makeFuture(folly::Unit{});
        }
        return _client.fund(sender, _config.funding_amount());
    }

    auto submit(const operation_t<D>& op) -> folly::Future<submission_result> {
        folly::Future<submission_result> submitted = folly::makeFuture(submission_result{});
        if (op.is_custom()) {
            if (_dispatch.supports(op.custom())) {
                submitted = _dispatch.dispatch(_client, _target, op.sender(), op.amount(), op.custom());
            } else if (_config.custom_policy() == custom_entrypoint_policy::reject_unsupported) {
                throw unsupported_operation_exception(render(op));
            }
        } else {
            submitted = _client.submit(_target, op.sender(), op.amount(), op.builtin());
        }

        if (_config.step_timeout() == std::chrono::milliseconds{0}) {
            return submitted;
        }

        return std::move(submitted)
            .within(_config.step_timeout())
            .thenError(folly::tag_t<folly::FutureTimeout>{}, [](const folly::FutureTimeout& e) {
                return submission_result{raw_failure{transport_failure{transport_failure_kind::timeout, e.what()}}};
            });
    }

    auto collect(submission_result failure) -> folly::Future<observables_type> {
        return _client.get_storage(_target)
            .thenValue([this, failure = std::move(failure)](typename D::storage_type storage) mutable {
                observables_type result;
                result._failure = std::move(failure);
                result._storage = std::move(storage);
                return _client.get_balance(_target)
                    .thenValue([result = std::move(result)](mutez balance) mutable {
                        result._balance = balance;
                        return std::move(result);
                    });
            })
            .thenValue([this](observables_type result) {
                return collect_auxiliary(std::move(result), 0);
            });
    }

    // Tracked entities are fetched one after the other, in tracking order
    auto collect_auxiliary(observables_type result, std::size_t index) -> folly::Future<observables_type> {
        if (index == _tracked.size()) {
            return folly::makeFuture(std::move(result));
        }

        const auto& handle = _tracked[index];
        return _client.get_auxiliary_storage(handle)
            .thenValue([this, handle](typename D::auxiliary_storage_type storage) {
                return _client.get_balance(handle)
                    .thenValue([storage = std::move(storage)](mutez balance) mutable {
                        return entity_state_t<D>{std::move(storage), balance};
                    });
            })
            .thenValue([this, handle, index, result = std::move(result)](entity_state_t<D> state) mutable {
                result._auxiliary.emplace_back(handle, std::move(state));
                return collect_auxiliary(std::move(result), index + 1);
            });
    }

    Client _client;
    entity_handle _target;
    std::vector<entity_handle> _tracked;
    engine_configuration _config;
    Dispatch _dispatch;
    std::size_t _applied{0};
};

} // namespace lockstep
