#pragma once

#include <lockstep/types.hpp>

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace lockstep {

// One generated action, applied to both sides in the same step.
// Builtin is the domain's closed variant of entrypoint payloads; Custom is the
// payload of the domain-specific entrypoints dispatched through a capability.
template<typename Builtin, typename Custom>
struct operation {
    entity_handle _sender;
    std::variant<Builtin, Custom> _parameter;
    // Tez sent along with the call
    mutez _amount{0};
    // Move the shared logical clock forward by this many levels before applying
    std::optional<level_t> _advance;

    auto sender() const -> const entity_handle& { return _sender; }
    auto parameter() const -> const std::variant<Builtin, Custom>& { return _parameter; }
    auto amount() const -> mutez { return _amount; }
    auto advance() const -> std::optional<level_t> { return _advance; }

    auto is_custom() const -> bool { return _parameter.index() == 1; }
    auto builtin() const -> const Builtin& { return std::get<0>(_parameter); }
    auto custom() const -> const Custom& { return std::get<1>(_parameter); }

    auto operator==(const operation&) const -> bool = default;
};

template<typename Builtin, typename Custom>
auto operator<<(std::ostream& os, const operation<Builtin, Custom>& op) -> std::ostream& {
    os << "sender: " << op.sender() << "\n";
    os << "parameter: ";
    if (op.is_custom()) {
        os << "custom " << op.custom();
    } else {
        os << op.builtin();
    }
    os << "\n";
    os << "amount: " << op.amount() << "\n";
    os << "advance level: ";
    if (op.advance()) {
        os << *op.advance();
    } else {
        os << "none";
    }
    return os;
}

template<typename Builtin, typename Custom>
auto render(const operation<Builtin, Custom>& op) -> std::string {
    std::ostringstream oss;
    oss << op;
    return oss.str();
}

template<domain_types D>
using operation_t = operation<typename D::builtin_parameter_type, typename D::custom_parameter_type>;

// Handles of the auxiliary entities the generator referenced while building
// payloads, plus the level the run starts at
struct environment {
    level_t _start_level{0};
    entity_handle _primary;
    entity_handle _guardian;
    entity_handle _governance_token;
    entity_handle _view_consumer;

    auto start_level() const -> level_t { return _start_level; }
    auto primary() const -> const entity_handle& { return _primary; }
    auto guardian() const -> const entity_handle& { return _guardian; }
    auto governance_token() const -> const entity_handle& { return _governance_token; }
    auto view_consumer() const -> const entity_handle& { return _view_consumer; }

    // Auxiliary entities whose storage and balance are compared after every step
    auto tracked_entities() const -> std::vector<entity_handle> {
        return {_governance_token, _view_consumer};
    }
};

// Everything one test run needs: the environment, the starting state of the
// primary entity and the ordered operations. Read-only once generated.
template<domain_types D>
struct sequence {
    environment _environment;
    typename D::storage_type _initial_storage{};
    mutez _initial_balance{0};
    std::vector<entity_handle> _senders;
    std::vector<operation_t<D>> _operations;

    auto env() const -> const environment& { return _environment; }
    auto initial_storage() const -> const typename D::storage_type& { return _initial_storage; }
    auto initial_balance() const -> mutez { return _initial_balance; }
    auto senders() const -> const std::vector<entity_handle>& { return _senders; }
    auto operations() const -> const std::vector<operation_t<D>>& { return _operations; }
    auto size() const -> std::size_t { return _operations.size(); }
};

} // namespace lockstep
