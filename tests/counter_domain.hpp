#pragma once

// A minimal domain for exercising the engine without a chain: the primary
// entity holds a counter, and a tally entity records every applied delta.
// The fake system is driven through a shared state whose knobs inject
// faults (drift, forced failures, hangs, lost entities).

#include <lockstep/error_normalizer.hpp>
#include <lockstep/model_executor.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/system_executor.hpp>
#include <lockstep/types.hpp>

#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace counter_test {

enum class counter_error : std::uint64_t {
    underflow = 1,
    too_large = 2,
    timed_out = 9
};

inline constexpr std::array<counter_error, 3> all_counter_errors{
    counter_error::underflow,
    counter_error::too_large,
    counter_error::timed_out
};

inline auto operator<<(std::ostream& os, counter_error code) -> std::ostream& {
    switch (code) {
        case counter_error::underflow: return os << "UNDERFLOW";
        case counter_error::too_large: return os << "TOO_LARGE";
        case counter_error::timed_out: return os << "TIMED_OUT";
    }
    return os << "UNKNOWN";
}

} // namespace counter_test

template<>
struct lockstep::error_code_traits<counter_test::counter_error> {
    static auto from_numeric(std::uint64_t tag) -> std::optional<counter_test::counter_error> {
        for (auto code : counter_test::all_counter_errors) {
            if (static_cast<std::uint64_t>(code) == tag) {
                return code;
            }
        }
        return std::nullopt;
    }

    static auto to_numeric(counter_test::counter_error code) -> std::uint64_t {
        return static_cast<std::uint64_t>(code);
    }

    static auto all() -> std::span<const counter_test::counter_error> {
        return counter_test::all_counter_errors;
    }
};

namespace counter_test {

constexpr std::int64_t counter_limit = 1000;

inline const lockstep::entity_handle primary_handle{"KT1Counter"};
inline const lockstep::entity_handle tally_handle{"KT1Tally"};
inline const lockstep::entity_handle alice{"tz1Alice"};
inline const lockstep::entity_handle bob{"tz1Bob"};

struct add {
    std::int64_t _delta{0};
    auto operator==(const add&) const -> bool = default;
};

// Resets the counter; fails on an empty counter
struct drain {
    auto operator==(const drain&) const -> bool = default;
};

struct counter_parameter {
    std::variant<add, drain> _value;
    auto operator==(const counter_parameter&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const counter_parameter& param) -> std::ostream& {
    if (const auto* a = std::get_if<add>(&param._value)) {
        return os << "Add " << a->_delta;
    }
    return os << "Drain";
}

struct ping {
    std::string _note;
    auto operator==(const ping&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const ping& p) -> std::ostream& {
    return os << "Ping \"" << p._note << "\"";
}

struct tally {
    std::vector<std::int64_t> _values;
    auto operator==(const tally&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const tally& t) -> std::ostream& {
    os << "[";
    for (std::size_t i = 0; i < t._values.size(); ++i) {
        os << (i == 0 ? "" : ", ") << t._values[i];
    }
    return os << "]";
}

struct counter_domain {
    using builtin_parameter_type = counter_parameter;
    using custom_parameter_type = ping;
    using storage_type = std::int64_t;
    using auxiliary_storage_type = tally;
    using error_code_type = counter_error;
};

static_assert(lockstep::domain_types<counter_domain>);

using counter_operation = lockstep::operation_t<counter_domain>;
using counter_state = lockstep::model_state_t<counter_domain>;

inline auto make_add(const lockstep::entity_handle& sender, std::int64_t delta, lockstep::mutez amount = 0,
                     std::optional<lockstep::level_t> advance = std::nullopt) -> counter_operation {
    counter_operation op;
    op._sender = sender;
    op._parameter = counter_parameter{add{delta}};
    op._amount = amount;
    op._advance = advance;
    return op;
}

inline auto make_drain(const lockstep::entity_handle& sender) -> counter_operation {
    counter_operation op;
    op._sender = sender;
    op._parameter = counter_parameter{drain{}};
    return op;
}

inline auto make_ping(const lockstep::entity_handle& sender, std::string note, lockstep::mutez amount = 0)
    -> counter_operation {
    counter_operation op;
    op._sender = sender;
    op._parameter = ping{std::move(note)};
    op._amount = amount;
    return op;
}

inline auto initial_counter_state(std::int64_t counter = 0, lockstep::mutez balance = 100) -> counter_state {
    counter_state state;
    state._self = primary_handle;
    state._storage = counter;
    state._balance = balance;
    state._level = 1;
    state._entities.emplace(tally_handle, lockstep::entity_state<tally>{tally{}, 0});
    return state;
}

// Shared rules of both sides: the new counter, or the error
inline auto counter_step(std::int64_t counter, const counter_parameter& param)
    -> std::variant<counter_error, std::int64_t> {
    if (std::holds_alternative<drain>(param._value)) {
        if (counter == 0) {
            return counter_error::underflow;
        }
        return std::int64_t{0};
    }
    auto next = counter + std::get<add>(param._value)._delta;
    if (next < 0) {
        return counter_error::underflow;
    }
    if (next > counter_limit) {
        return counter_error::too_large;
    }
    return next;
}

class counter_model {
public:
    auto apply(const counter_state& state, const counter_operation& op) const
        -> lockstep::model_transition<counter_domain> {
        auto next = state;
        if (op.is_custom()) {
            return lockstep::model_transition<counter_domain>::ok(std::move(next));
        }
        auto result = counter_step(state._storage, op.builtin());
        if (const auto* error = std::get_if<counter_error>(&result)) {
            return lockstep::model_transition<counter_domain>::fail(std::move(next), *error);
        }
        auto value = std::get<std::int64_t>(result);
        if (const auto* a = std::get_if<add>(&op.builtin()._value)) {
            if (auto* entity = next.find_entity(tally_handle)) {
                entity->_storage._values.push_back(a->_delta);
            }
        }
        next._storage = value;
        next._balance += op.amount();
        return lockstep::model_transition<counter_domain>::ok(std::move(next));
    }
};

static_assert(lockstep::reference_model<counter_model, counter_domain>);

enum class failure_shape {
    code,
    pair,
    expression
};

// State of the fake system plus its fault knobs and a record of what it saw
struct counter_system {
    std::int64_t _counter{0};
    lockstep::mutez _balance{100};
    lockstep::level_t _level{1};
    std::map<lockstep::entity_handle, tally> _tallies{{tally_handle, tally{}}};
    std::map<lockstep::entity_handle, lockstep::mutez> _balances{{tally_handle, 0}};

    failure_shape _shape{failure_shape::code};
    // Added to the counter after every successful add
    std::int64_t _drift{0};
    // Returned for every submission instead of executing it
    std::optional<lockstep::raw_failure> _forced_failure;
    // Submissions never complete
    bool _hang{false};
    // Successful adds are not recorded in the tally
    bool _skip_tally{false};
    // Tez sent along lands on the tally entity instead of the primary
    bool _misroute_tez{false};

    std::vector<std::pair<lockstep::entity_handle, lockstep::mutez>> _funded;
    std::vector<lockstep::level_t> _advances;
    std::vector<std::string> _calls;
    std::vector<std::string> _pings;
    std::vector<std::shared_ptr<folly::Promise<lockstep::submission_result>>> _hanging;
};

class counter_client {
public:
    explicit counter_client(std::shared_ptr<counter_system> system)
        : _system(std::move(system)) {}

    auto advance_level(lockstep::level_t levels) -> folly::Future<folly::Unit> {
        _system->_calls.push_back("advance");
        _system->_advances.push_back(levels);
        _system->_level += levels;
        return folly::makeFuture(folly::Unit{});
    }

    auto fund(const lockstep::entity_handle& account, lockstep::mutez amount) -> folly::Future<folly::Unit> {
        _system->_calls.push_back("fund");
        _system->_funded.emplace_back(account, amount);
        return folly::makeFuture(folly::Unit{});
    }

    auto submit(
        [[maybe_unused]] const lockstep::entity_handle& target,
        [[maybe_unused]] const lockstep::entity_handle& sender,
        lockstep::mutez amount,
        const counter_parameter& param
    ) -> folly::Future<lockstep::submission_result> {
        _system->_calls.push_back("submit");
        if (_system->_hang) {
            auto promise = std::make_shared<folly::Promise<lockstep::submission_result>>();
            _system->_hanging.push_back(promise);
            return promise->getFuture();
        }
        if (_system->_forced_failure) {
            return folly::makeFuture(lockstep::submission_result{*_system->_forced_failure});
        }

        auto result = counter_step(_system->_counter, param);
        if (const auto* error = std::get_if<counter_error>(&result)) {
            return folly::makeFuture(lockstep::submission_result{encode(*error)});
        }
        _system->_counter = std::get<std::int64_t>(result);
        if (const auto* a = std::get_if<add>(&param._value)) {
            _system->_counter += _system->_drift;
            if (!_system->_skip_tally) {
                _system->_tallies[tally_handle]._values.push_back(a->_delta);
            }
        }
        if (_system->_misroute_tez) {
            _system->_balances[tally_handle] += amount;
        } else {
            _system->_balance += amount;
        }
        return folly::makeFuture(lockstep::submission_result{});
    }

    auto get_storage([[maybe_unused]] const lockstep::entity_handle& handle) -> folly::Future<std::int64_t> {
        _system->_calls.push_back("storage");
        return folly::makeFuture(_system->_counter);
    }

    auto get_auxiliary_storage(const lockstep::entity_handle& handle) -> folly::Future<tally> {
        _system->_calls.push_back("auxiliary " + handle.value());
        auto it = _system->_tallies.find(handle);
        if (it == _system->_tallies.end()) {
            return folly::makeFuture<tally>(lockstep::missing_entity_exception("system", handle.value()));
        }
        return folly::makeFuture(it->second);
    }

    auto get_balance(const lockstep::entity_handle& handle) -> folly::Future<lockstep::mutez> {
        _system->_calls.push_back("balance " + handle.value());
        if (handle == primary_handle) {
            return folly::makeFuture(_system->_balance);
        }
        return folly::makeFuture(_system->_balances[handle]);
    }

    auto system() const -> const std::shared_ptr<counter_system>& { return _system; }

private:
    auto encode(counter_error error) const -> lockstep::raw_failure {
        auto tag = static_cast<std::uint64_t>(error);
        switch (_system->_shape) {
            case failure_shape::code:
                return lockstep::failed_with_code{tag};
            case failure_shape::pair:
                return lockstep::failed_with_pair{tag, boost::json::value("detail")};
            case failure_shape::expression:
                return lockstep::failed_with_expression{boost::json::object{{"int", std::to_string(tag)}}};
        }
        return lockstep::failed_with_code{tag};
    }

    std::shared_ptr<counter_system> _system;
};

static_assert(lockstep::system_client<counter_client, counter_domain>);

// Dispatches pings by recording them on the system side
struct ping_dispatch {
    auto supports(const ping& p) const -> bool {
        return p._note != "unsupported";
    }

    auto dispatch(
        counter_client& client,
        [[maybe_unused]] const lockstep::entity_handle& target,
        [[maybe_unused]] const lockstep::entity_handle& sender,
        [[maybe_unused]] lockstep::mutez amount,
        const ping& p
    ) const -> folly::Future<lockstep::submission_result> {
        client.system()->_pings.push_back(p._note);
        return folly::makeFuture(lockstep::submission_result{});
    }
};

static_assert(lockstep::custom_entrypoint_dispatch<ping_dispatch, counter_client, counter_domain>);

} // namespace counter_test
