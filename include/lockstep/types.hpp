#pragma once

#include <concepts>
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lockstep {

// Shared logical clock (block level / height)
using level_t = std::uint64_t;

// Balances and tez amounts, in the smallest unit
using mutez = std::uint64_t;

// Stable handle naming an entity (contract or account address) on both sides
struct entity_handle {
    std::string _value;

    entity_handle() = default;
    explicit entity_handle(std::string value) : _value(std::move(value)) {}

    auto value() const -> const std::string& { return _value; }
    auto empty() const -> bool { return _value.empty(); }

    auto operator<=>(const entity_handle&) const = default;
};

inline auto operator<<(std::ostream& os, const entity_handle& handle) -> std::ostream& {
    return os << handle._value;
}

// Values compared after every step must be comparable and printable
template<typename T>
concept renderable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

template<typename T>
concept observable_value = std::equality_comparable<T> && renderable<T> && std::copy_constructible<T>;

// Numeric tag table of a domain error taxonomy. Domains specialize this for
// their error enum; the tags are what the system under test fails with.
template<typename E>
struct error_code_traits;

template<typename E>
concept error_code = std::is_enum_v<E> && renderable<E> && requires(std::uint64_t tag, E code) {
    { error_code_traits<E>::from_numeric(tag) } -> std::same_as<std::optional<E>>;
    { error_code_traits<E>::to_numeric(code) } -> std::same_as<std::uint64_t>;
    { error_code_traits<E>::all() } -> std::convertible_to<std::span<const E>>;
};

// Domain description consumed by every engine component
template<typename D>
concept domain_types = requires {
    typename D::builtin_parameter_type;
    typename D::custom_parameter_type;
    typename D::storage_type;
    typename D::auxiliary_storage_type;
    typename D::error_code_type;
} &&
    observable_value<typename D::storage_type> &&
    observable_value<typename D::auxiliary_storage_type> &&
    std::default_initializable<typename D::storage_type> &&
    std::default_initializable<typename D::auxiliary_storage_type> &&
    renderable<typename D::builtin_parameter_type> &&
    renderable<typename D::custom_parameter_type> &&
    error_code<typename D::error_code_type>;

// Custom parameter type for domains without custom entrypoints
struct no_custom_entrypoint {
    auto operator==(const no_custom_entrypoint&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const no_custom_entrypoint&) -> std::ostream& {
    return os << "no_custom_entrypoint";
}

// Result of one operation on the primary entity: the failure's error code, or
// the primary storage after a successful application
template<typename Storage, typename ErrorCode>
class outcome {
public:
    outcome() : _value(std::in_place_index<1>) {}

    static auto success(Storage storage) -> outcome {
        return outcome(std::in_place_index<1>, std::move(storage));
    }

    static auto failure(ErrorCode code) -> outcome {
        return outcome(std::in_place_index<0>, code);
    }

    [[nodiscard]] auto is_success() const -> bool { return _value.index() == 1; }
    [[nodiscard]] auto is_failure() const -> bool { return _value.index() == 0; }

    auto storage() const -> const Storage& { return std::get<1>(_value); }
    auto error() const -> ErrorCode { return std::get<0>(_value); }

    auto operator==(const outcome&) const -> bool = default;

private:
    template<std::size_t I, typename T>
    outcome(std::in_place_index_t<I> index, T&& value) : _value(index, std::forward<T>(value)) {}

    std::variant<ErrorCode, Storage> _value;
};

template<typename Storage, typename ErrorCode>
auto operator<<(std::ostream& os, const outcome<Storage, ErrorCode>& result) -> std::ostream& {
    if (result.is_failure()) {
        return os << "failure: " << result.error();
    }
    return os << result.storage();
}

// Storage and balance of one auxiliary entity
template<typename AuxStorage>
struct entity_state {
    AuxStorage _storage{};
    mutez _balance{0};

    auto storage() const -> const AuxStorage& { return _storage; }
    auto balance() const -> mutez { return _balance; }

    auto operator==(const entity_state&) const -> bool = default;
};

// The tuple compared after every step
template<typename Storage, typename AuxStorage, typename ErrorCode>
struct observable_set {
    outcome<Storage, ErrorCode> _primary;
    mutez _primary_balance{0};
    // Tracked auxiliary entities, in tracking order
    std::vector<std::pair<entity_handle, entity_state<AuxStorage>>> _auxiliary;

    auto primary() const -> const outcome<Storage, ErrorCode>& { return _primary; }
    auto primary_balance() const -> mutez { return _primary_balance; }
    auto auxiliary() const -> const std::vector<std::pair<entity_handle, entity_state<AuxStorage>>>& {
        return _auxiliary;
    }

    auto find_auxiliary(const entity_handle& handle) const -> const entity_state<AuxStorage>* {
        for (const auto& [tracked, state] : _auxiliary) {
            if (tracked == handle) {
                return &state;
            }
        }
        return nullptr;
    }
};

template<domain_types D>
using outcome_t = outcome<typename D::storage_type, typename D::error_code_type>;

template<domain_types D>
using entity_state_t = entity_state<typename D::auxiliary_storage_type>;

template<domain_types D>
using observable_set_t = observable_set<
    typename D::storage_type,
    typename D::auxiliary_storage_type,
    typename D::error_code_type>;

} // namespace lockstep
