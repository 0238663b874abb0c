/**
 * @file orchestrator.cpp
 * @brief Implementation of Orchestrator with retry, cancellation and deadlines
 */

#include "orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace retirecalc {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

std::string make_run_id() {
    static std::atomic<uint64_t> counter(0);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    return "run-" + std::to_string(ms) + "-" + std::to_string(++counter);
}

std::string describe_range(const WorkRange& range) {
    return "scenarios [" + std::to_string(range.begin) + ", " + std::to_string(range.end) + ")";
}

} // anonymous namespace

std::string ensemble_status_to_string(EnsembleStatus status) {
    switch (status) {
        case EnsembleStatus::Complete: return "complete";
        case EnsembleStatus::PartialEnsemble: return "partial_ensemble";
        case EnsembleStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

EnsembleRunResult::EnsembleRunResult()
    : status(EnsembleStatus::Complete), completed_scenarios(0), requested_scenarios(0),
      execution_time_ms(0.0) {}

OrchestratorConfig::OrchestratorConfig()
    : worker_type(WorkerType::LOCAL),
      ranges_per_worker(4),
      enable_retry(true),
      max_retry_attempts(1),
      retry_delay_ms(0),
      worker_timeout_ms(0),
      deadline_ms(0),
      poll_interval_ms(5) {}

std::vector<WorkRange> partition_scenarios(uint64_t iterations, size_t pieces) {
    std::vector<WorkRange> ranges;
    if (iterations == 0 || pieces == 0) {
        return ranges;
    }

    uint64_t count = std::min<uint64_t>(iterations, pieces);
    uint64_t base = iterations / count;
    uint64_t extra = iterations % count;
    ranges.reserve(static_cast<size_t>(count));

    uint64_t begin = 0;
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t size = base + (i < extra ? 1 : 0);
        ranges.emplace_back(static_cast<size_t>(i), begin, begin + size);
        begin += size;
    }
    return ranges;
}

// ============================================================================
// Run state: task queue and results channel shared by the pool threads
// ============================================================================

struct Orchestrator::RunState {
    const ScenarioParams& params;
    const EnsembleConfig& config;
    std::string run_id;
    std::chrono::steady_clock::time_point start_time;

    std::vector<WorkRange> ranges;
    std::atomic<size_t> next_range;
    std::atomic<bool> aborted;
    std::atomic<bool> deadline_exceeded;

    std::mutex results_mutex;
    std::vector<ScenarioOutcome> outcomes;
    std::vector<std::string> errors;
    size_t failed_ranges;
    uint64_t failed_scenarios;

    RunState(const ScenarioParams& params_, const EnsembleConfig& config_)
        : params(params_), config(config_), run_id(make_run_id()),
          start_time(std::chrono::steady_clock::now()), next_range(0), aborted(false),
          deadline_exceeded(false), failed_ranges(0), failed_scenarios(0) {}

    void publish(std::vector<ScenarioOutcome> batch) {
        std::lock_guard<std::mutex> lock(results_mutex);
        for (ScenarioOutcome& outcome : batch) {
            outcomes.push_back(std::move(outcome));
        }
    }

    // A failure stops every pool thread before its next scenario
    void record_failure(const std::string& message, uint64_t scenarios) {
        aborted = true;
        std::lock_guard<std::mutex> lock(results_mutex);
        errors.push_back(message);
        ++failed_ranges;
        failed_scenarios += scenarios;
    }
};

// ============================================================================
// Orchestrator
// ============================================================================

Orchestrator::Orchestrator(
    const TaxEngine& tax_engine,
    const OrchestratorConfig& config,
    Logger* logger
)
    : tax_engine_(tax_engine),
      config_(config),
      logger_(logger),
      worker_factory_(tax_engine),
      cancel_requested_(false) {

    // Use the singleton if no logger is provided
    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (config_.ranges_per_worker == 0) {
        throw ConfigurationError("ranges_per_worker must be at least 1");
    }
}

EnsembleRunResult Orchestrator::run(const ScenarioParams& params, const EnsembleConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        logger_->log_validation_error("ensemble_config", e.what());
        throw;
    }
    if (!worker_factory_.is_registered(config_.worker_type)) {
        throw ConfigurationError("Unknown worker type: " + config_.worker_type);
    }

    RunState state(params, config);

    size_t worker_count = static_cast<size_t>(config.worker_count);
    state.ranges = partition_scenarios(config.iterations, worker_count * config_.ranges_per_worker);
    size_t thread_count = std::min(worker_count, state.ranges.size());

    logger_->log_ensemble_start(state.run_id, config.iterations, thread_count, state.ranges.size());

    std::vector<std::thread> pool;
    pool.reserve(thread_count);
    try {
        for (size_t w = 0; w < thread_count; ++w) {
            pool.emplace_back(&Orchestrator::worker_loop, this, w, std::ref(state));
        }
    } catch (const std::system_error&) {
        state.aborted = true;
        for (std::thread& t : pool) {
            t.join();
        }
        cancel_requested_ = false;
        throw;
    }
    for (std::thread& t : pool) {
        t.join();
    }
    // A request is consumed by the run it stopped; later ones apply to the next run
    cancel_requested_ = false;

    EnsembleRunResult run_result;
    run_result.run_id = state.run_id;
    run_result.requested_scenarios = config.iterations;
    run_result.completed_scenarios = state.outcomes.size();
    run_result.errors = state.errors;

    run_result.result = aggregate_outcomes(std::move(state.outcomes), params, tax_engine_, config);
    run_result.result.scenarios_failed = static_cast<int>(state.failed_scenarios);

    if (state.failed_ranges > 0) {
        run_result.status = EnsembleStatus::PartialEnsemble;
    } else if (run_result.completed_scenarios < run_result.requested_scenarios) {
        run_result.status = EnsembleStatus::Cancelled;
        std::string reason = state.deadline_exceeded ? "deadline" : "cancelled";
        run_result.errors.push_back(
            state.deadline_exceeded
                ? "Deadline of " + std::to_string(config_.deadline_ms) + " ms exceeded"
                : std::string("Ensemble cancelled")
        );
        logger_->log_ensemble_cancelled(state.run_id, reason, run_result.completed_scenarios,
                                        run_result.requested_scenarios);
    }

    run_result.execution_time_ms = elapsed_ms(state.start_time);
    run_result.result.execution_time_ms = run_result.execution_time_ms;

    logger_->log_ensemble_complete(
        state.run_id,
        ensemble_status_to_string(run_result.status),
        run_result.completed_scenarios,
        run_result.requested_scenarios,
        run_result.result.success_probability,
        run_result.execution_time_ms
    );

    return run_result;
}

void Orchestrator::cancel() {
    cancel_requested_ = true;
}

EnsembleRunner Orchestrator::runner() {
    return [this](const ScenarioParams& params, const EnsembleConfig& config) {
        EnsembleRunResult ensemble = this->run(params, config);
        if (!ensemble.complete()) {
            throw WorkerFailure("Ensemble " + ensemble.run_id + " ended " +
                                ensemble_status_to_string(ensemble.status) + " with " +
                                std::to_string(ensemble.completed_scenarios) + " of " +
                                std::to_string(ensemble.requested_scenarios) + " scenarios");
        }
        return ensemble.result;
    };
}

// Private helper methods

void Orchestrator::worker_loop(size_t worker_id, RunState& state) {
    ExecutionContext ctx(state.run_id, worker_id);

    try {
        std::unique_ptr<IScenarioWorker> worker = worker_factory_.create_worker(config_.worker_type);

        while (!should_stop(state)) {
            size_t next = state.next_range.fetch_add(1);
            if (next >= state.ranges.size()) {
                break;
            }
            const WorkRange& range = state.ranges[next];
            ctx.range_begin = range.begin;
            ctx.range_end = range.end;
            ctx.attempt = 0;

            run_range_with_retry(worker, range, ctx, state);
        }
    } catch (const std::exception& e) {
        // No usable worker for this pool thread
        logger_->log_error(ctx, e.what());
        state.record_failure(std::string("Worker ") + std::to_string(worker_id) + ": " + e.what(), 0);
    }
}

void Orchestrator::run_range_with_retry(
    std::unique_ptr<IScenarioWorker>& worker,
    const WorkRange& range,
    ExecutionContext& ctx,
    RunState& state
) {
    for (size_t attempt = 0;; ++attempt) {
        ctx.attempt = attempt;
        logger_->log_worker_start(ctx);
        auto attempt_start = std::chrono::steady_clock::now();

        try {
            std::vector<ScenarioOutcome> outcomes = run_attempt(*worker, range, state);
            logger_->log_worker_complete(ctx, outcomes.size(), elapsed_ms(attempt_start));
            state.publish(std::move(outcomes));
            return;
        } catch (const std::exception& e) {
            if (config_.enable_retry && attempt < config_.max_retry_attempts && !should_stop(state)) {
                logger_->log_worker_retry(ctx, e.what());

                // Exponential backoff
                if (config_.retry_delay_ms > 0) {
                    size_t delay_ms = config_.retry_delay_ms * (size_t(1) << attempt);
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                }

                worker = worker_factory_.create_worker(config_.worker_type);
                continue;
            }

            logger_->log_worker_failed(ctx, e.what());
            state.record_failure(describe_range(range) + " failed after " +
                                 std::to_string(attempt + 1) + " attempt(s): " + e.what(),
                                 range.size());
            return;
        }
    }
}

std::vector<ScenarioOutcome> Orchestrator::run_attempt(
    IScenarioWorker& worker,
    const WorkRange& range,
    RunState& state
) {
    std::atomic<bool> stop(false);
    auto attempt_start = std::chrono::steady_clock::now();

    std::future<std::vector<ScenarioOutcome>> future = std::async(std::launch::async, [&]() {
        return worker.run_range(state.params, state.config, range, stop);
    });

    const auto poll = std::chrono::milliseconds(std::max<size_t>(1, config_.poll_interval_ms));
    while (future.wait_for(poll) != std::future_status::ready) {
        if (config_.worker_timeout_ms > 0 &&
            elapsed_ms(attempt_start) >= static_cast<double>(config_.worker_timeout_ms)) {
            stop = true;
            future.wait();
            throw WorkerFailure("Worker timed out after " + std::to_string(config_.worker_timeout_ms) +
                                " ms on " + describe_range(range));
        }
        if (should_stop(state)) {
            // Completed scenarios of the interrupted range are kept
            stop = true;
            break;
        }
    }

    std::vector<ScenarioOutcome> outcomes = future.get();
    if (!stop.load() && outcomes.size() != range.size()) {
        throw WorkerFailure("Worker returned " + std::to_string(outcomes.size()) + " of " +
                            std::to_string(range.size()) + " " + describe_range(range));
    }
    return outcomes;
}

bool Orchestrator::should_stop(RunState& state) const {
    if (cancel_requested_.load() || state.aborted.load()) {
        return true;
    }
    if (config_.deadline_ms > 0 &&
        elapsed_ms(state.start_time) >= static_cast<double>(config_.deadline_ms)) {
        state.deadline_exceeded = true;
    }
    return state.deadline_exceeded.load();
}

} // namespace retirecalc
