#pragma once

#include <lockstep/comparator.hpp>
#include <lockstep/console_logger.hpp>
#include <lockstep/error_normalizer.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/logger.hpp>
#include <lockstep/metrics.hpp>
#include <lockstep/model_executor.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/system_executor.hpp>
#include <lockstep/types.hpp>

#include <folly/CancellationToken.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace lockstep {

enum class run_status : std::uint8_t {
    completed,
    aborted,
    cancelled
};

inline auto operator<<(std::ostream& os, run_status status) -> std::ostream& {
    switch (status) {
        case run_status::completed: return os << "completed";
        case run_status::aborted:   return os << "aborted";
        case run_status::cancelled: return os << "cancelled";
    }
    return os << "unknown";
}

// Marker of a run aborted by a normalization fault
struct fatal_fault {
    std::size_t _step{0};
    std::string _operation;
    std::string _message;

    auto step() const -> std::size_t { return _step; }
    auto operation() const -> const std::string& { return _operation; }
    auto message() const -> const std::string& { return _message; }
};

// Terminal state of one run
template<domain_types D>
struct run_result {
    run_status _status{run_status::completed};
    std::size_t _model_applied{0};
    std::size_t _system_applied{0};
    std::optional<divergence_report> _divergence;
    std::optional<fatal_fault> _fatal;
    model_state_t<D> _final_state;

    auto status() const -> run_status { return _status; }
    auto model_applied() const -> std::size_t { return _model_applied; }
    auto system_applied() const -> std::size_t { return _system_applied; }
    auto divergence() const -> const std::optional<divergence_report>& { return _divergence; }
    auto fatal() const -> const std::optional<fatal_fault>& { return _fatal; }
    auto final_state() const -> const model_state_t<D>& { return _final_state; }

    auto is_completed() const -> bool { return _status == run_status::completed; }
    auto is_diverged() const -> bool { return _status == run_status::aborted && _divergence.has_value(); }
    auto is_fatal() const -> bool { return _status == run_status::aborted && _fatal.has_value(); }
};

// Drives one sequence through both executors.
//
// Pending -> Stepping -> Pending until the sequence is exhausted (completed),
// a comparison fails or the normalizer faults (aborted), or the token is
// cancelled (cancelled). Nothing is applied to either side after an abort.
// Collaborator exceptions propagate out of run().
template<
    domain_types D,
    typename Model,
    typename Client,
    typename Dispatch = no_custom_dispatch,
    diagnostic_logger Logger = console_logger,
    metrics Metrics = noop_metrics
>
class call_loop {
public:
    using model_executor_type = model_executor<D, Model>;
    using system_executor_type = system_executor<D, Client, Dispatch>;
    using normalizer_type = error_normalizer<typename D::error_code_type>;
    using result_type = run_result<D>;

    call_loop(
        model_executor_type model,
        system_executor_type system,
        normalizer_type normalizer = normalizer_type{},
        Logger logger = Logger{},
        Metrics metrics = Metrics{}
    )
        : _model(std::move(model))
        , _system(std::move(system))
        , _normalizer(std::move(normalizer))
        , _logger(std::move(logger))
        , _metrics(std::move(metrics)) {}

    call_loop(const call_loop&) = delete;
    auto operator=(const call_loop&) -> call_loop& = delete;

    auto run(const std::vector<operation_t<D>>& operations, folly::CancellationToken token = {}) -> result_type {
        auto start_time = std::chrono::steady_clock::now();
        auto count_text = std::to_string(operations.size());
        _logger.info("Starting differential run", {{"operations", count_text}});

        for (std::size_t index = 0; index < operations.size(); ++index) {
            const auto& op = operations[index];
            auto step = index + 1;

            if (token.isCancellationRequested()) {
                return cancelled(step, start_time);
            }

            // Last compared position, restored if this step is cancelled in flight
            std::optional<compared_position> before;
            if (token.canBeCancelled()) {
                before = compared_position{_model.state(), _model.applied(), _system.applied()};
            }

            auto model_observables = _model.apply(op);
            auto raw = _system.apply(op).get();

            if (token.isCancellationRequested()) {
                return cancelled(step, start_time, std::move(before));
            }

            observable_set_t<D> system_observables;
            try {
                system_observables = normalize(std::move(raw));
            } catch (const normalization_exception& e) {
                return fatal(step, op, e, start_time);
            }

            if (auto report = comparator<D>::compare(model_observables, system_observables, step, op)) {
                return diverged(std::move(*report), start_time);
            }

            auto step_text = std::to_string(step);
            _logger.debug("Step matched", {{"step", step_text}});

            auto metric = _metrics;
            metric.set_metric_name("lockstep.step.applied");
            metric.add_one();
            metric.emit();
        }

        _logger.info("Differential run completed", {{"operations", count_text}});
        auto result = make_result(run_status::completed);
        record_run("lockstep.run.completed", "completed", start_time);
        return result;
    }

    auto model() const -> const model_executor_type& { return _model; }
    auto system() -> system_executor_type& { return _system; }
    auto normalizer() const -> const normalizer_type& { return _normalizer; }

private:
    struct compared_position {
        model_state_t<D> _state;
        std::size_t _model_applied{0};
        std::size_t _system_applied{0};
    };

    auto normalize(raw_observables<D> raw) const -> observable_set_t<D> {
        observable_set_t<D> result;
        if (raw._failure) {
            result._primary = outcome_t<D>::failure(_normalizer.normalize(*raw._failure));
        } else {
            result._primary = outcome_t<D>::success(std::move(raw._storage));
        }
        result._primary_balance = raw._balance;
        result._auxiliary = std::move(raw._auxiliary);
        return result;
    }

    auto make_result(run_status status) const -> result_type {
        result_type result;
        result._status = status;
        result._model_applied = _model.applied();
        result._system_applied = _system.applied();
        result._final_state = _model.state();
        return result;
    }

    auto cancelled(
        std::size_t step,
        std::chrono::steady_clock::time_point start_time,
        std::optional<compared_position> before = std::nullopt
    ) -> result_type {
        auto step_text = std::to_string(step);
        _logger.warning("Differential run cancelled", {
            {"step", step_text},
            {"discarded", before ? "true" : "false"}
        });
        auto result = make_result(run_status::cancelled);
        if (before) {
            result._final_state = std::move(before->_state);
            result._model_applied = before->_model_applied;
            result._system_applied = before->_system_applied;
        }
        record_run("lockstep.run.cancelled", "cancelled", start_time);
        return result;
    }

    auto fatal(
        std::size_t step,
        const operation_t<D>& op,
        const normalization_exception& e,
        std::chrono::steady_clock::time_point start_time
    ) -> result_type {
        auto step_text = std::to_string(step);
        _logger.critical("Unmapped system failure, aborting run", {
            {"step", step_text},
            {"error", e.what()}
        });

        auto result = make_result(run_status::aborted);
        result._fatal = fatal_fault{step, render(op), e.what()};
        record_run("lockstep.run.fatal", "fatal", start_time);
        return result;
    }

    auto diverged(divergence_report report, std::chrono::steady_clock::time_point start_time) -> result_type {
        auto step_text = std::to_string(report.step());
        auto field_text = detail::to_text(report.field());
        auto entity_text = report.entity() ? report.entity()->value() : std::string{};
        _logger.error("Divergence between model and system", {
            {"step", step_text},
            {"field", field_text},
            {"entity", entity_text}
        });

        auto result = make_result(run_status::aborted);
        result._divergence = std::move(report);
        record_run("lockstep.run.diverged", "diverged", start_time);
        return result;
    }

    auto record_run(
        std::string_view name,
        std::string_view status,
        std::chrono::steady_clock::time_point start_time
    ) -> void {
        auto metric = _metrics;
        metric.set_metric_name(name);
        metric.add_one();
        metric.emit();

        auto duration = std::chrono::steady_clock::now() - start_time;
        auto timing = _metrics;
        timing.set_metric_name("lockstep.run.duration");
        timing.add_dimension("status", status);
        timing.add_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
        timing.emit();
    }

    model_executor_type _model;
    system_executor_type _system;
    normalizer_type _normalizer;
    Logger _logger;
    Metrics _metrics;
};

} // namespace lockstep
