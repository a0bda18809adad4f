#pragma once

#include <concepts>
#include <string_view>
#include <vector>
#include <utility>
#include <cstdint>
#include <ostream>

namespace lockstep {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

inline auto operator<<(std::ostream& os, log_level level) -> std::ostream& {
    switch (level) {
        case log_level::trace:    return os << "trace";
        case log_level::debug:    return os << "debug";
        case log_level::info:     return os << "info";
        case log_level::warning:  return os << "warning";
        case log_level::error:    return os << "error";
        case log_level::critical: return os << "critical";
    }
    return os << "unknown";
}

using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept for structured logging of differential runs
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

} // namespace lockstep
