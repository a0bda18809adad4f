#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <cstdint>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>
#include <utility>
#include <algorithm>

namespace lockstep {

// Metrics concept for reporting run progress and outcomes
template<typename M>
concept metrics = requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value,
    std::int64_t count,
    std::chrono::nanoseconds duration,
    double value
) {
    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;

    { metric.add_one() } -> std::same_as<void>;
    { metric.add_count(count) } -> std::same_as<void>;
    { metric.add_duration(duration) } -> std::same_as<void>;
    { metric.add_value(value) } -> std::same_as<void>;

    { metric.emit() } -> std::same_as<void>;
};

// No-op metrics for runs that do not report anywhere
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}

    auto add_dimension(
        [[maybe_unused]] std::string_view dimension_name,
        [[maybe_unused]] std::string_view dimension_value
    ) -> void {}

    auto add_one() -> void {}

    auto add_count([[maybe_unused]] std::int64_t count) -> void {}

    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}

    auto add_value([[maybe_unused]] double value) -> void {}

    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

// One emitted data point
struct metric_record {
    std::string _name;
    std::vector<std::pair<std::string, std::string>> _dimensions;
    std::int64_t _count{0};
    std::chrono::nanoseconds _duration{0};
    double _value{0.0};
};

// Metrics recorder keeping every emitted point in memory.
// Copies share the record sink; each copy builds its own pending point, which
// matches how components copy their metrics member before recording.
class in_memory_metrics {
public:
    in_memory_metrics()
        : _sink(std::make_shared<sink>()) {}

    auto set_metric_name(std::string_view name) -> void {
        _pending._name = std::string(name);
    }

    auto add_dimension(std::string_view dimension_name, std::string_view dimension_value) -> void {
        _pending._dimensions.emplace_back(std::string(dimension_name), std::string(dimension_value));
    }

    auto add_one() -> void { ++_pending._count; }

    auto add_count(std::int64_t count) -> void { _pending._count += count; }

    auto add_duration(std::chrono::nanoseconds duration) -> void { _pending._duration += duration; }

    auto add_value(double value) -> void { _pending._value += value; }

    auto emit() -> void {
        std::lock_guard<std::mutex> lock(_sink->_mutex);
        _sink->_records.push_back(_pending);
        _pending = metric_record{};
    }

    [[nodiscard]] auto records() const -> std::vector<metric_record> {
        std::lock_guard<std::mutex> lock(_sink->_mutex);
        return _sink->_records;
    }

    // Sum of counts over all emitted points with the given name
    [[nodiscard]] auto total(std::string_view name) const -> std::int64_t {
        std::lock_guard<std::mutex> lock(_sink->_mutex);
        std::int64_t sum = 0;
        for (const auto& record : _sink->_records) {
            if (record._name == name) {
                sum += record._count;
            }
        }
        return sum;
    }

    [[nodiscard]] auto emitted(std::string_view name) const -> bool {
        std::lock_guard<std::mutex> lock(_sink->_mutex);
        return std::any_of(_sink->_records.begin(), _sink->_records.end(),
            [name](const metric_record& record) { return record._name == name; });
    }

private:
    struct sink {
        std::mutex _mutex;
        std::vector<metric_record> _records;
    };

    std::shared_ptr<sink> _sink;
    metric_record _pending;
};

static_assert(metrics<in_memory_metrics>, "in_memory_metrics must satisfy metrics concept");

} // namespace lockstep
