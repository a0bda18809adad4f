#pragma once

#include <lockstep/types.hpp>
#include <lockstep/logger.hpp>
#include <lockstep/exceptions.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lockstep {

// What the system executor does with a custom entrypoint sub-variant the
// configured dispatch does not support
enum class custom_entrypoint_policy : std::uint8_t {
    ignore_unsupported,   // silent no-op on the system side
    reject_unsupported    // unsupported_operation_exception
};

inline auto operator<<(std::ostream& os, custom_entrypoint_policy policy) -> std::ostream& {
    switch (policy) {
        case custom_entrypoint_policy::ignore_unsupported: return os << "ignore_unsupported";
        case custom_entrypoint_policy::reject_unsupported: return os << "reject_unsupported";
    }
    return os << "unknown";
}

// Engine configuration
struct engine_configuration {
    // Nominal transfer to each sender before its call; never part of the compared balances
    mutez _funding_amount{1};
    // Bound on one system submission; zero disables the bound
    std::chrono::milliseconds _step_timeout{5000};
    custom_entrypoint_policy _custom_policy{custom_entrypoint_policy::ignore_unsupported};
    log_level _min_log_level{log_level::info};

    auto funding_amount() const -> mutez { return _funding_amount; }
    auto step_timeout() const -> std::chrono::milliseconds { return _step_timeout; }
    auto custom_policy() const -> custom_entrypoint_policy { return _custom_policy; }
    auto min_log_level() const -> log_level { return _min_log_level; }

    auto is_valid() const -> bool {
        return _step_timeout >= std::chrono::milliseconds{0};
    }
};

// Options understood by sequence generators
struct generator_configuration {
    // Probability that a drawn operation is a proposal
    double _proposal_weight{0.3};
    std::size_t _max_sequence_length{40};
    level_t _start_level{1};
    std::size_t _sender_count{3};
    // Upper bound of one advance directive
    level_t _max_advance{12};
    // Tez held by the primary entity when the run starts
    mutez _initial_balance{500};

    auto proposal_weight() const -> double { return _proposal_weight; }
    auto max_sequence_length() const -> std::size_t { return _max_sequence_length; }
    auto start_level() const -> level_t { return _start_level; }
    auto sender_count() const -> std::size_t { return _sender_count; }
    auto max_advance() const -> level_t { return _max_advance; }
    auto initial_balance() const -> mutez { return _initial_balance; }

    auto is_valid() const -> bool {
        return _proposal_weight >= 0.0 && _proposal_weight <= 1.0 &&
               _max_sequence_length > 0 &&
               _sender_count > 0 && _sender_count <= 8 &&
               _max_advance > 0;
    }
};

// Everything a differential run needs, as loaded from a configuration file
struct run_configuration {
    engine_configuration _engine;
    generator_configuration _generator;
    std::vector<std::uint64_t> _seeds{1};

    auto engine() const -> const engine_configuration& { return _engine; }
    auto generator() const -> const generator_configuration& { return _generator; }
    auto seeds() const -> const std::vector<std::uint64_t>& { return _seeds; }
};

namespace detail {

inline auto to_unsigned(const boost::json::value& value, std::string_view key) -> std::uint64_t {
    if (value.is_uint64()) {
        return value.as_uint64();
    }
    if (value.is_int64() && value.as_int64() >= 0) {
        return static_cast<std::uint64_t>(value.as_int64());
    }
    throw configuration_exception("'" + std::string(key) + "' must be a non-negative integer");
}

inline auto to_double(const boost::json::value& value, std::string_view key) -> double {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    throw configuration_exception("'" + std::string(key) + "' must be a number");
}

inline auto to_string(const boost::json::value& value, std::string_view key) -> std::string {
    if (!value.is_string()) {
        throw configuration_exception("'" + std::string(key) + "' must be a string");
    }
    return std::string(value.as_string());
}

inline auto parse_log_level(const std::string& text) -> log_level {
    if (text == "trace") return log_level::trace;
    if (text == "debug") return log_level::debug;
    if (text == "info") return log_level::info;
    if (text == "warning") return log_level::warning;
    if (text == "error") return log_level::error;
    if (text == "critical") return log_level::critical;
    throw configuration_exception("unknown log level '" + text + "'");
}

inline auto parse_custom_policy(const std::string& text) -> custom_entrypoint_policy {
    if (text == "ignore_unsupported") return custom_entrypoint_policy::ignore_unsupported;
    if (text == "reject_unsupported") return custom_entrypoint_policy::reject_unsupported;
    throw configuration_exception("unknown custom entrypoint policy '" + text + "'");
}

inline auto as_object(const boost::json::value& value, std::string_view key) -> const boost::json::object& {
    if (!value.is_object()) {
        throw configuration_exception("'" + std::string(key) + "' must be an object");
    }
    return value.as_object();
}

inline auto parse_engine(const boost::json::object& obj) -> engine_configuration {
    engine_configuration config;
    for (const auto& [key, value] : obj) {
        if (key == "funding_amount") {
            config._funding_amount = to_unsigned(value, key);
        } else if (key == "step_timeout_ms") {
            config._step_timeout = std::chrono::milliseconds{static_cast<std::int64_t>(to_unsigned(value, key))};
        } else if (key == "custom_policy") {
            config._custom_policy = parse_custom_policy(to_string(value, key));
        } else if (key == "log_level") {
            config._min_log_level = parse_log_level(to_string(value, key));
        } else {
            throw configuration_exception("unknown engine option '" + std::string(key) + "'");
        }
    }
    return config;
}

inline auto parse_generator(const boost::json::object& obj) -> generator_configuration {
    generator_configuration config;
    for (const auto& [key, value] : obj) {
        if (key == "proposal_weight") {
            config._proposal_weight = to_double(value, key);
        } else if (key == "max_sequence_length") {
            config._max_sequence_length = static_cast<std::size_t>(to_unsigned(value, key));
        } else if (key == "start_level") {
            config._start_level = to_unsigned(value, key);
        } else if (key == "sender_count") {
            config._sender_count = static_cast<std::size_t>(to_unsigned(value, key));
        } else if (key == "max_advance") {
            config._max_advance = to_unsigned(value, key);
        } else if (key == "initial_balance") {
            config._initial_balance = to_unsigned(value, key);
        } else {
            throw configuration_exception("unknown generator option '" + std::string(key) + "'");
        }
    }
    return config;
}

} // namespace detail

// Parse a run configuration document:
// {"engine": {...}, "generator": {...}, "seeds": [1, 2, 3]}
// Missing keys keep their defaults; unknown keys are rejected.
inline auto parse_run_configuration(std::string_view text) -> run_configuration {
    boost::json::value document;
    try {
        document = boost::json::parse(text);
    } catch (const boost::system::system_error& e) {
        throw configuration_exception(std::string("malformed JSON: ") + e.what());
    }

    const auto& root = detail::as_object(document, "configuration");
    run_configuration config;

    for (const auto& [key, value] : root) {
        if (key == "engine") {
            config._engine = detail::parse_engine(detail::as_object(value, key));
        } else if (key == "generator") {
            config._generator = detail::parse_generator(detail::as_object(value, key));
        } else if (key == "seeds") {
            if (!value.is_array()) {
                throw configuration_exception("'seeds' must be an array");
            }
            config._seeds.clear();
            for (const auto& seed : value.as_array()) {
                config._seeds.push_back(detail::to_unsigned(seed, "seeds"));
            }
        } else {
            throw configuration_exception("unknown option '" + std::string(key) + "'");
        }
    }

    if (!config._engine.is_valid()) {
        throw configuration_exception("engine options out of range");
    }
    if (!config._generator.is_valid()) {
        throw configuration_exception("generator options out of range");
    }
    if (config._seeds.empty()) {
        throw configuration_exception("at least one seed is required");
    }
    return config;
}

} // namespace lockstep
