#pragma once

#include <lockstep/types.hpp>
#include <lockstep/exceptions.hpp>

#include <boost/json.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

namespace lockstep {

// A typed numeric failure value
struct failed_with_code {
    std::uint64_t _code{0};

    auto code() const -> std::uint64_t { return _code; }
    auto operator==(const failed_with_code&) const -> bool = default;
};

// A typed (code, detail) pair; only the code takes part in normalization
struct failed_with_pair {
    std::uint64_t _code{0};
    boost::json::value _detail;

    auto code() const -> std::uint64_t { return _code; }
    auto detail() const -> const boost::json::value& { return _detail; }
    auto operator==(const failed_with_pair&) const -> bool = default;
};

// An untyped failure value in Micheline JSON, as a node reports it
struct failed_with_expression {
    boost::json::value _expression;

    auto expression() const -> const boost::json::value& { return _expression; }
    auto operator==(const failed_with_expression&) const -> bool = default;
};

enum class transport_failure_kind : std::uint8_t {
    timeout,
    rejected,   // refused before execution (e.g. by the mempool or the client)
    unknown
};

inline auto operator<<(std::ostream& os, transport_failure_kind kind) -> std::ostream& {
    switch (kind) {
        case transport_failure_kind::timeout: return os << "timeout";
        case transport_failure_kind::rejected: return os << "rejected";
        case transport_failure_kind::unknown: return os << "unknown";
    }
    return os << "unknown";
}

// The submission never produced a contract-level failure value
struct transport_failure {
    transport_failure_kind _kind{transport_failure_kind::unknown};
    std::string _description;

    auto kind() const -> transport_failure_kind { return _kind; }
    auto description() const -> const std::string& { return _description; }
    auto operator==(const transport_failure&) const -> bool = default;
};

using raw_failure = std::variant<
    failed_with_code,
    failed_with_pair,
    failed_with_expression,
    transport_failure>;

inline auto operator<<(std::ostream& os, const raw_failure& failure) -> std::ostream& {
    std::visit([&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, failed_with_code>) {
            os << "code " << value.code();
        } else if constexpr (std::is_same_v<T, failed_with_pair>) {
            os << "pair (" << value.code() << ", " << boost::json::serialize(value.detail()) << ")";
        } else if constexpr (std::is_same_v<T, failed_with_expression>) {
            os << "expression " << boost::json::serialize(value.expression());
        } else {
            os << "transport " << value.kind();
            if (!value.description().empty()) {
                os << ": " << value.description();
            }
        }
    }, failure);
    return os;
}

inline auto render(const raw_failure& failure) -> std::string {
    std::ostringstream oss;
    oss << failure;
    return oss.str();
}

// Result of submitting one call: nothing on success, the raw failure otherwise
using submission_result = std::optional<raw_failure>;

// Maps raw failures of the system under test onto the domain error taxonomy.
//
// Rules, in priority order:
// 1. a single numeric code maps through error_code_traits<E>::from_numeric;
// 2. a pair maps its first element through rule 1;
// 3. anything else is a normalization fault (normalization_exception).
// Unknown numeric tags are faults as well. A timeout is a fault unless a
// timeout code was configured.
template<error_code E>
class error_normalizer {
public:
    error_normalizer() = default;

    explicit error_normalizer(E timeout_code)
        : _timeout_code(timeout_code) {}

    auto timeout_code() const -> std::optional<E> { return _timeout_code; }

    auto normalize(const raw_failure& failure) const -> E {
        return std::visit([this, &failure](const auto& value) -> E {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, failed_with_code>) {
                return from_numeric(value.code(), failure);
            } else if constexpr (std::is_same_v<T, failed_with_pair>) {
                return from_numeric(value.code(), failure);
            } else if constexpr (std::is_same_v<T, failed_with_expression>) {
                return from_expression(value.expression(), failure);
            } else {
                if (value.kind() == transport_failure_kind::timeout && _timeout_code) {
                    return *_timeout_code;
                }
                throw normalization_exception(render(failure));
            }
        }, failure);
    }

private:
    static auto from_numeric(std::uint64_t tag, const raw_failure& failure) -> E {
        auto code = error_code_traits<E>::from_numeric(tag);
        if (!code) {
            throw normalization_exception("unknown error code " + std::to_string(tag) + " in " + render(failure));
        }
        return *code;
    }

    // Micheline {"int": "<decimal>"}; anything else is not a numeric code
    static auto micheline_int(const boost::json::value& node) -> std::optional<std::uint64_t> {
        if (!node.is_object()) {
            return std::nullopt;
        }
        const auto& obj = node.as_object();
        if (obj.size() != 1) {
            return std::nullopt;
        }
        const auto* digits = obj.if_contains("int");
        if (digits == nullptr || !digits->is_string()) {
            return std::nullopt;
        }
        std::string_view text = digits->as_string();
        if (text.empty()) {
            return std::nullopt;
        }
        std::uint64_t tag = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), tag);
        if (ec != std::errc{} || end != text.data() + text.size()) {
            return std::nullopt;
        }
        return tag;
    }

    static auto from_expression(const boost::json::value& expression, const raw_failure& failure) -> E {
        if (auto tag = micheline_int(expression)) {
            return from_numeric(*tag, failure);
        }
        if (expression.is_object()) {
            const auto& obj = expression.as_object();
            const auto* prim = obj.if_contains("prim");
            const auto* args = obj.if_contains("args");
            if (prim != nullptr && prim->is_string() && prim->as_string() == "Pair" &&
                args != nullptr && args->is_array() && args->as_array().size() >= 2) {
                // Only one level: a nested pair in first position is not a code
                if (auto tag = micheline_int(args->as_array().front())) {
                    return from_numeric(*tag, failure);
                }
            }
        }
        throw normalization_exception(render(failure));
    }

    std::optional<E> _timeout_code;
};

} // namespace lockstep
