#pragma once

#include <lockstep/exceptions.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/types.hpp>

#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace lockstep {

// Full mutable state of a reference model
template<typename Storage, typename AuxStorage>
struct model_state {
    // Handle of the primary entity, used when the model moves tez to itself
    entity_handle _self;
    Storage _storage{};
    std::map<entity_handle, entity_state<AuxStorage>> _entities;
    mutez _balance{0};
    level_t _level{0};

    auto self() const -> const entity_handle& { return _self; }
    auto storage() const -> const Storage& { return _storage; }
    auto entities() const -> const std::map<entity_handle, entity_state<AuxStorage>>& { return _entities; }
    auto balance() const -> mutez { return _balance; }
    auto level() const -> level_t { return _level; }

    auto find_entity(const entity_handle& handle) const -> const entity_state<AuxStorage>* {
        auto it = _entities.find(handle);
        return it == _entities.end() ? nullptr : &it->second;
    }

    auto find_entity(const entity_handle& handle) -> entity_state<AuxStorage>* {
        auto it = _entities.find(handle);
        return it == _entities.end() ? nullptr : &it->second;
    }

    auto operator==(const model_state&) const -> bool = default;
};

template<domain_types D>
using model_state_t = model_state<typename D::storage_type, typename D::auxiliary_storage_type>;

// Result of one model step. The state is only meaningful without an error.
template<domain_types D>
struct model_transition {
    model_state_t<D> _state;
    std::optional<typename D::error_code_type> _error;

    static auto ok(model_state_t<D> state) -> model_transition {
        return model_transition{std::move(state), std::nullopt};
    }

    static auto fail(model_state_t<D> state, typename D::error_code_type code) -> model_transition {
        return model_transition{std::move(state), code};
    }
};

// Pure, total semantics of a domain. The clock has already been advanced in
// the state handed over; preconditions violated under the domain's rules are
// reported as an error code, never thrown.
template<typename M, typename D>
concept reference_model = domain_types<D> && requires(
    const M& model,
    const model_state_t<D>& state,
    const operation_t<D>& op
) {
    { model.apply(state, op) } -> std::same_as<model_transition<D>>;
};

// Owns the model state of one run and applies one operation at a time.
// A failing step keeps the pre-operation state with only the clock advance,
// mirroring the revert of a failed transaction.
template<domain_types D, typename Model>
requires reference_model<Model, D>
class model_executor {
public:
    using state_type = model_state_t<D>;
    using observables_type = observable_set_t<D>;

    model_executor(Model model, state_type initial, std::vector<entity_handle> tracked)
        : _model(std::move(model))
        , _state(std::move(initial))
        , _tracked(std::move(tracked)) {}

    auto apply(const operation_t<D>& op) -> observables_type {
        auto advanced = _state;
        if (op.advance()) {
            advanced._level += *op.advance();
        }

        auto transition = _model.apply(advanced, op);
        ++_applied;

        if (transition._error) {
            _state = std::move(advanced);
            return observe(outcome_t<D>::failure(*transition._error));
        }

        _state = std::move(transition._state);
        return observe(outcome_t<D>::success(_state._storage));
    }

    // Snapshot of the compared observables. Every tracked entity must be known
    // to the model.
    auto observe(outcome_t<D> primary) const -> observables_type {
        observables_type result;
        result._primary = std::move(primary);
        result._primary_balance = _state._balance;
        result._auxiliary.reserve(_tracked.size());
        for (const auto& handle : _tracked) {
            const auto* entity = _state.find_entity(handle);
            if (entity == nullptr) {
                throw missing_entity_exception("model", handle.value());
            }
            result._auxiliary.emplace_back(handle, *entity);
        }
        return result;
    }

    auto state() const -> const state_type& { return _state; }
    auto tracked() const -> const std::vector<entity_handle>& { return _tracked; }
    auto applied() const -> std::size_t { return _applied; }

private:
    Model _model;
    state_type _state;
    std::vector<entity_handle> _tracked;
    std::size_t _applied{0};
};

} // namespace lockstep
