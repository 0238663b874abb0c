/**
 * @file worker_interface.hpp
 * @brief Abstract interface for scenario workers
 *
 * A worker runs a contiguous range of scenario indices and returns their
 * outcomes. The orchestrator owns one worker per pool thread and replaces it
 * with a fresh instance after a failure.
 *
 * Design Principles:
 * - Deterministic: a scenario's outcome depends only on (params, config, index)
 * - No shared mutable state: a worker instance is used by one thread at a time
 * - Cooperative stop: workers check the stop flag between scenarios
 */

#ifndef RETIRECALC_WORKER_INTERFACE_HPP
#define RETIRECALC_WORKER_INTERFACE_HPP

#include "ensemble.hpp"
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace retirecalc {

/**
 * @brief Contiguous range of scenario indices [begin, end)
 */
struct WorkRange {
    size_t index;         ///< Position of the range in the partition
    uint64_t begin;       ///< First scenario index
    uint64_t end;         ///< One past the last scenario index

    WorkRange() : index(0), begin(0), end(0) {}
    WorkRange(size_t index_, uint64_t begin_, uint64_t end_)
        : index(index_), begin(begin_), end(end_) {}

    uint64_t size() const { return end > begin ? end - begin : 0; }
};

/**
 * @brief Raised when a worker crashes or exceeds its time limit
 */
class WorkerFailure : public std::runtime_error {
public:
    explicit WorkerFailure(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when the orchestrator is configured with an unusable setting
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Abstract interface for scenario workers
 *
 * Usage Example:
 *   @code
 *   TaxEngine tax_engine;
 *   LocalScenarioWorker worker(tax_engine);
 *   std::atomic<bool> stop(false);
 *
 *   std::vector<ScenarioOutcome> outcomes =
 *       worker.run_range(params, config, WorkRange(0, 0, 250), stop);
 *   @endcode
 */
class IScenarioWorker {
public:
    virtual ~IScenarioWorker() = default;

    /**
     * @brief Worker type name (e.g. "local")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Run the scenarios of a range
     *
     * @param params Validated household scenario (read-only, shared)
     * @param config Ensemble configuration (read-only, shared)
     * @param range Scenario indices to run
     * @param stop Set by the orchestrator to stop before the next scenario
     *
     * @return Outcomes of the scenarios completed, in index order. Fewer than
     *         range.size() only when stop was set.
     *
     * @throws WorkerFailure or any std::exception if the range cannot be run
     */
    virtual std::vector<ScenarioOutcome> run_range(
        const ScenarioParams& params,
        const EnsembleConfig& config,
        const WorkRange& range,
        const std::atomic<bool>& stop
    ) = 0;
};

/**
 * @brief In-process worker running scenarios on the calling thread
 *
 * Shares the read-only tax tables of one TaxEngine with every other worker.
 */
class LocalScenarioWorker : public IScenarioWorker {
public:
    explicit LocalScenarioWorker(const TaxEngine& tax_engine) : tax_engine_(tax_engine) {}

    std::string name() const override { return "local"; }

    std::vector<ScenarioOutcome> run_range(
        const ScenarioParams& params,
        const EnsembleConfig& config,
        const WorkRange& range,
        const std::atomic<bool>& stop
    ) override {
        return run_scenario_range(params, tax_engine_, config, range.begin, range.end, &stop);
    }

private:
    const TaxEngine& tax_engine_;
};

} // namespace retirecalc

#endif // RETIRECALC_WORKER_INTERFACE_HPP
