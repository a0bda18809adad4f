#pragma once

#include <lockstep/exceptions.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/types.hpp>

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace lockstep {

// Observable that disagreed first
enum class divergence_field : std::uint8_t {
    primary_outcome,
    primary_balance,
    auxiliary_storage,
    auxiliary_balance
};

inline auto operator<<(std::ostream& os, divergence_field field) -> std::ostream& {
    switch (field) {
        case divergence_field::primary_outcome:   return os << "primary outcome";
        case divergence_field::primary_balance:   return os << "primary balance";
        case divergence_field::auxiliary_storage: return os << "auxiliary storage";
        case divergence_field::auxiliary_balance: return os << "auxiliary balance";
    }
    return os << "unknown";
}

// First mismatch between the two sides. Built at failure time only.
struct divergence_report {
    // 1-based index of the operation in the sequence
    std::size_t _step{0};
    std::string _operation;
    divergence_field _field{divergence_field::primary_outcome};
    // Set for the auxiliary checks only
    std::optional<entity_handle> _entity;
    std::string _model_value;
    std::string _system_value;

    auto step() const -> std::size_t { return _step; }
    auto operation() const -> const std::string& { return _operation; }
    auto field() const -> divergence_field { return _field; }
    auto entity() const -> const std::optional<entity_handle>& { return _entity; }
    auto model_value() const -> const std::string& { return _model_value; }
    auto system_value() const -> const std::string& { return _system_value; }

    // Stable text form:
    //
    // ━━ Divergence at step 2: primary outcome differs ━━
    // * Call with:
    // sender: tz1...
    // ...
    // ━━ Model primary outcome ━━
    // <value>
    // ━━ System primary outcome ━━
    // <value>
    auto render() const -> std::string {
        std::ostringstream label;
        label << _field;
        if (_entity) {
            label << " (" << *_entity << ")";
        }

        std::ostringstream oss;
        oss << "━━ Divergence at step " << _step << ": " << label.str() << " differs ━━\n";
        oss << "* Call with:\n" << _operation << "\n";
        oss << "━━ Model " << label.str() << " ━━\n" << _model_value << "\n";
        oss << "━━ System " << label.str() << " ━━\n" << _system_value << "\n";
        return oss.str();
    }

    auto to_json() const -> boost::json::object {
        std::ostringstream field;
        field << _field;

        boost::json::object obj;
        obj["step"] = static_cast<std::uint64_t>(_step);
        obj["field"] = field.str();
        if (_entity) {
            obj["entity"] = _entity->value();
        } else {
            obj["entity"] = nullptr;
        }
        obj["operation"] = _operation;
        obj["model"] = _model_value;
        obj["system"] = _system_value;
        return obj;
    }

    auto operator==(const divergence_report&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const divergence_report& report) -> std::ostream& {
    return os << report.render();
}

namespace detail {

template<renderable T>
auto to_text(const T& value) -> std::string {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace detail

// Structural comparison of the two observable sets of one step.
//
// The checks run in a fixed order: primary outcome, primary balance, the
// storage of each tracked entity, then the balance of each tracked entity.
// The first failing check wins and later ones are not evaluated. Each check
// is exposed on its own so tests can target one failure mode at a time.
template<domain_types D>
class comparator {
public:
    using observables_type = observable_set_t<D>;

    static auto check_primary_outcome(
        const observables_type& model,
        const observables_type& system,
        std::size_t step,
        const operation_t<D>& op
    ) -> std::optional<divergence_report> {
        if (model.primary() == system.primary()) {
            return std::nullopt;
        }
        return make_report(step, op, divergence_field::primary_outcome, std::nullopt,
            detail::to_text(model.primary()), detail::to_text(system.primary()));
    }

    static auto check_primary_balance(
        const observables_type& model,
        const observables_type& system,
        std::size_t step,
        const operation_t<D>& op
    ) -> std::optional<divergence_report> {
        if (model.primary_balance() == system.primary_balance()) {
            return std::nullopt;
        }
        return make_report(step, op, divergence_field::primary_balance, std::nullopt,
            std::to_string(model.primary_balance()), std::to_string(system.primary_balance()));
    }

    static auto check_auxiliary_storage(
        const observables_type& model,
        const observables_type& system,
        std::size_t step,
        const operation_t<D>& op
    ) -> std::optional<divergence_report> {
        for (const auto& [handle, model_state] : model.auxiliary()) {
            const auto& system_state = counterpart(system, handle);
            if (!(model_state.storage() == system_state.storage())) {
                return make_report(step, op, divergence_field::auxiliary_storage, handle,
                    detail::to_text(model_state.storage()), detail::to_text(system_state.storage()));
            }
        }
        return std::nullopt;
    }

    static auto check_auxiliary_balance(
        const observables_type& model,
        const observables_type& system,
        std::size_t step,
        const operation_t<D>& op
    ) -> std::optional<divergence_report> {
        for (const auto& [handle, model_state] : model.auxiliary()) {
            const auto& system_state = counterpart(system, handle);
            if (model_state.balance() != system_state.balance()) {
                return make_report(step, op, divergence_field::auxiliary_balance, handle,
                    std::to_string(model_state.balance()), std::to_string(system_state.balance()));
            }
        }
        return std::nullopt;
    }

    static auto compare(
        const observables_type& model,
        const observables_type& system,
        std::size_t step,
        const operation_t<D>& op
    ) -> std::optional<divergence_report> {
        if (auto report = check_primary_outcome(model, system, step, op)) {
            return report;
        }
        if (auto report = check_primary_balance(model, system, step, op)) {
            return report;
        }
        if (auto report = check_auxiliary_storage(model, system, step, op)) {
            return report;
        }
        return check_auxiliary_balance(model, system, step, op);
    }

private:
    static auto counterpart(const observables_type& system, const entity_handle& handle)
        -> const entity_state_t<D>& {
        const auto* state = system.find_auxiliary(handle);
        if (state == nullptr) {
            throw missing_entity_exception("system", handle.value());
        }
        return *state;
    }

    static auto make_report(
        std::size_t step,
        const operation_t<D>& op,
        divergence_field field,
        std::optional<entity_handle> entity,
        std::string model_value,
        std::string system_value
    ) -> divergence_report {
        return divergence_report{
            step,
            render(op),
            field,
            std::move(entity),
            std::move(model_value),
            std::move(system_value)
        };
    }
};

} // namespace lockstep
