#pragma once

#include <lockstep/logger.hpp>
#include <iostream>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace lockstep {

// Console logger used by the call loop, the generator adapter and the fixtures.
// Copies share one mutex so loggers handed to several components of the same
// run do not interleave lines.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info, std::string component = {})
        : _min_level(min_level)
        , _component(std::move(component))
        , _mutex(std::make_shared<std::mutex>()) {}

    // Writes every level to the given stream instead of stdout/stderr
    console_logger(log_level min_level, std::string component, std::ostream& sink)
        : _min_level(min_level)
        , _component(std::move(component))
        , _sink(&sink)
        , _mutex(std::make_shared<std::mutex>()) {}

    // Derived logger for a sub-component sharing the sink and the lock
    [[nodiscard]] auto with_component(std::string component) const -> console_logger {
        console_logger child(*this);
        child._component = _component.empty() ? std::move(component) : _component + "/" + component;
        return child;
    }

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        if (level < _min_level) {
            return;
        }

        std::lock_guard<std::mutex> lock(*_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " " << level_to_string(level);
        if (!_component.empty()) {
            stream << " (" << _component << ")";
        }
        stream << ": " << message;
        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }
        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::trace, message, key_value_pairs);
    }

    auto debug(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::debug, message, key_value_pairs);
    }

    auto info(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::info, message, key_value_pairs);
    }

    auto warning(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::warning, message, key_value_pairs);
    }

    auto error(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::error, message, key_value_pairs);
    }

    auto critical(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::critical, message, key_value_pairs);
    }

    auto set_min_level(log_level level) -> void {
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level;
    }

    [[nodiscard]] auto component() const -> const std::string& {
        return _component;
    }

private:
    log_level _min_level;
    std::string _component;
    std::ostream* _sink = nullptr;
    std::shared_ptr<std::mutex> _mutex;

    [[nodiscard]] static auto level_to_string(log_level level) -> std::string_view {
        switch (level) {
            case log_level::trace:    return "TRACE";
            case log_level::debug:    return "DEBUG";
            case log_level::info:     return "INFO";
            case log_level::warning:  return "WARNING";
            case log_level::error:    return "ERROR";
            case log_level::critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    // Error and critical messages go to stderr unless a sink was given
    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (_sink != nullptr) {
            return *_sink;
        }
        if (level >= log_level::error) {
            return std::cerr;
        }
        return std::cout;
    }

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);

        std::ostringstream oss;
        oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace lockstep
