/**
 * @file orchestrator.hpp
 * @brief Parallel ensemble execution with retry, cancellation and deadlines
 *
 * The Orchestrator is responsible for:
 * - Partitioning scenario indices into contiguous ranges
 * - Dispatching ranges to a fixed pool of worker threads
 * - Collecting outcomes through a results channel and aggregating them
 * - Retrying a failed range once on a fresh worker
 * - Stopping early on cancel() or the run deadline with the completed scenarios kept
 * - Logging ensemble and worker events
 *
 * Error Handling:
 * - Invalid EnsembleConfig is rejected before any worker starts
 * - A crash or timeout is retried with the same range on a fresh worker
 * - A second failure stops the run and reports a PartialEnsemble with the
 *   completed scenario count, never a silently smaller sample
 */

#ifndef RETIRECALC_ORCHESTRATOR_HPP
#define RETIRECALC_ORCHESTRATOR_HPP

#include "analysis.hpp"
#include "logger.hpp"
#include "worker_factory.hpp"
#include "worker_interface.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace retirecalc {

/**
 * @brief Final state of an ensemble run
 */
enum class EnsembleStatus {
    Complete,          ///< Every requested scenario completed
    PartialEnsemble,   ///< A range failed twice; statistics cover the completed scenarios
    Cancelled          ///< Stopped by cancel() or the run deadline
};

std::string ensemble_status_to_string(EnsembleStatus status);

/**
 * @brief Ensemble result plus execution status
 */
struct EnsembleRunResult {
    std::string run_id;                   ///< Identifier shared by every log event of the run
    EnsembleStatus status;
    EnsembleResult result;                ///< Aggregated over completed scenarios
    uint64_t completed_scenarios;
    uint64_t requested_scenarios;
    std::vector<std::string> errors;      ///< Failures and stop reasons
    double execution_time_ms;

    bool complete() const { return status == EnsembleStatus::Complete; }

    EnsembleRunResult();
};

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    std::string worker_type;              ///< Registered worker type (default: "local")
    size_t ranges_per_worker;             ///< Ranges per pool thread (default: 4)
    bool enable_retry;                    ///< Retry a failed range on a fresh worker
    size_t max_retry_attempts;            ///< Retries per range (default: 1)
    size_t retry_delay_ms;                ///< Backoff before the first retry, doubled after (default: 0)
    size_t worker_timeout_ms;             ///< Time limit per range attempt, 0 = none
    size_t deadline_ms;                   ///< Time limit for the whole run, 0 = none
    size_t poll_interval_ms;              ///< Supervision interval for timeouts and stops (default: 5)

    OrchestratorConfig();
};

/**
 * @brief Partition [0, iterations) into at most `pieces` contiguous ranges
 *
 * Range sizes differ by at most one; no range is empty.
 */
std::vector<WorkRange> partition_scenarios(uint64_t iterations, size_t pieces);

/**
 * @brief Runs ensembles on a pool of scenario workers
 *
 * Usage Example:
 *   @code
 *   TaxEngine tax_engine;
 *   OrchestratorConfig orch_config;
 *   orch_config.worker_timeout_ms = 60000;
 *
 *   Orchestrator orchestrator(tax_engine, orch_config);
 *
 *   EnsembleConfig config;
 *   config.iterations = 10000;
 *   config.worker_count = 8;
 *
 *   EnsembleRunResult run = orchestrator.run(params, config);
 *   if (!run.complete()) {
 *       std::cerr << ensemble_status_to_string(run.status) << ": "
 *                 << run.completed_scenarios << " of " << run.requested_scenarios << std::endl;
 *   }
 *   @endcode
 */
class Orchestrator {
public:
    /**
     * @brief Constructor
     *
     * @param tax_engine Tax tables shared read-only by every worker
     * @param config Orchestrator configuration (optional)
     * @param logger Logger instance (optional, uses the singleton if nullptr)
     */
    explicit Orchestrator(
        const TaxEngine& tax_engine,
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Run an ensemble across config.worker_count pool threads
     *
     * Outcomes are identical to run_ensemble() for the same params and config:
     * scenario seeds depend only on the scenario index.
     *
     * @throws std::invalid_argument If config fails EnsembleConfig::validate()
     * @throws ConfigurationError If the worker type is unknown
     */
    EnsembleRunResult run(const ScenarioParams& params, const EnsembleConfig& config);

    /**
     * @brief Stop the run in progress, or the next run if none is in progress
     *
     * Safe to call from any thread. Scenarios already started finish; no new
     * scenario starts. run() returns a Cancelled result and clears the request
     * once its workers have stopped.
     */
    void cancel();

    bool cancel_requested() const { return cancel_requested_.load(); }

    /**
     * @brief EnsembleRunner running through this orchestrator, for the sub-analyses
     *
     * @throws WorkerFailure from the runner when a run ends incomplete
     */
    EnsembleRunner runner();

    WorkerFactory& worker_factory() { return worker_factory_; }

    const OrchestratorConfig& config() const { return config_; }

private:
    struct RunState;

    const TaxEngine& tax_engine_;
    OrchestratorConfig config_;
    Logger* logger_;
    WorkerFactory worker_factory_;
    std::atomic<bool> cancel_requested_;

    void worker_loop(size_t worker_id, RunState& state);
    void run_range_with_retry(
        std::unique_ptr<IScenarioWorker>& worker,
        const WorkRange& range,
        ExecutionContext& ctx,
        RunState& state
    );
    std::vector<ScenarioOutcome> run_attempt(
        IScenarioWorker& worker,
        const WorkRange& range,
        RunState& state
    );
    bool should_stop(RunState& state) const;
};

} // namespace retirecalc

#endif // RETIRECALC_ORCHESTRATOR_HPP
