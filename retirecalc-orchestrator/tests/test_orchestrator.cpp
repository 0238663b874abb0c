/**
 * @file test_orchestrator.cpp
 * @brief Tests for parallel ensemble execution, retry and early termination
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/orchestrator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <thread>

using namespace retirecalc;
using Catch::Matchers::ContainsSubstring;

namespace {

const TaxEngine& engine() {
    static const TaxEngine instance;
    return instance;
}

Logger* quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    return &Logger::get_instance();
}

ScenarioParams short_retirement() {
    PersonParams p;
    p.current_age = 65;
    p.retirement_age = 65;
    p.life_expectancy = 80.0;
    p.social_security_pia = 1800.0;
    p.social_security_claim_age = 67.0;
    return ScenarioParamsBuilder()
        .primary(p)
        .assets(350000.0, 60000.0, 120000.0, 30000.0, 90000.0)
        .expenses(42000.0, 5000.0)
        .build();
}

EnsembleConfig small_config(uint64_t iterations, int workers) {
    EnsembleConfig config;
    config.iterations = iterations;
    config.seed = 2024;
    config.worker_count = workers;
    return config;
}

/**
 * Shared state of every mock worker created by one factory
 */
struct MockControl {
    enum class FailureMode {
        NONE,
        CRASH_ONCE,       ///< First attempt on the target range throws
        CRASH_ALWAYS,     ///< Every attempt on the target range throws
        HANG_ONCE,        ///< First attempt on the target range blocks until stopped
        HANG_ALWAYS,      ///< Every attempt on the target range blocks until stopped
        SLOW              ///< Every scenario takes scenario_delay_ms
    };

    FailureMode failure_mode = FailureMode::NONE;
    uint64_t target_begin = 0;
    int scenario_delay_ms = 0;

    std::atomic<int> workers_created{0};
    std::atomic<int> attempts_on_target{0};
    std::atomic<int> ranges_started{0};
};

/**
 * Mock worker that runs real scenarios and simulates crashes, hangs and slow ranges
 */
class MockScenarioWorker : public IScenarioWorker {
public:
    explicit MockScenarioWorker(MockControl& control) : control_(control) {}

    std::string name() const override { return "mock"; }

    std::vector<ScenarioOutcome> run_range(
        const ScenarioParams& params,
        const EnsembleConfig& config,
        const WorkRange& range,
        const std::atomic<bool>& stop
    ) override {
        control_.ranges_started++;

        if (range.begin == control_.target_begin) {
            int attempt = control_.attempts_on_target++;
            switch (control_.failure_mode) {
                case MockControl::FailureMode::CRASH_ONCE:
                    if (attempt == 0) {
                        throw std::runtime_error("Mock worker crashed");
                    }
                    break;
                case MockControl::FailureMode::CRASH_ALWAYS:
                    throw WorkerFailure("Mock worker crashed");
                case MockControl::FailureMode::HANG_ONCE:
                    if (attempt == 0) {
                        return hang(stop);
                    }
                    break;
                case MockControl::FailureMode::HANG_ALWAYS:
                    return hang(stop);
                default:
                    break;
            }
        }

        std::vector<ScenarioOutcome> outcomes;
        for (uint64_t i = range.begin; i < range.end; ++i) {
            if (stop.load()) {
                break;
            }
            if (control_.failure_mode == MockControl::FailureMode::SLOW) {
                std::this_thread::sleep_for(std::chrono::milliseconds(control_.scenario_delay_ms));
            }
            std::vector<ScenarioOutcome> one = run_scenario_range(params, engine(), config, i, i + 1);
            outcomes.push_back(std::move(one.front()));
        }
        return outcomes;
    }

private:
    MockControl& control_;

    static std::vector<ScenarioOutcome> hang(const std::atomic<bool>& stop) {
        while (!stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return {};
    }
};

/**
 * Orchestrator wired to mock workers
 */
std::unique_ptr<Orchestrator> mock_orchestrator(MockControl& control,
                                                OrchestratorConfig config = OrchestratorConfig()) {
    config.worker_type = "mock";
    auto orchestrator = std::make_unique<Orchestrator>(engine(), config, quiet_logger());
    orchestrator->worker_factory().register_worker("mock", [&control]() {
        control.workers_created++;
        return std::make_unique<MockScenarioWorker>(control);
    });
    return orchestrator;
}

} // anonymous namespace

// ============================================================================
// Partitioning
// ============================================================================

TEST_CASE("Scenarios are partitioned into contiguous ranges", "[orchestrator][partition]") {
    std::vector<WorkRange> ranges = partition_scenarios(10, 3);

    REQUIRE(ranges.size() == 3);
    REQUIRE(ranges[0].begin == 0);
    REQUIRE(ranges[0].size() == 4);
    REQUIRE(ranges[1].size() == 3);
    REQUIRE(ranges[2].end == 10);
    for (size_t i = 1; i < ranges.size(); ++i) {
        REQUIRE(ranges[i].begin == ranges[i - 1].end);
        REQUIRE(ranges[i].index == i);
    }
}

TEST_CASE("Partition edge cases", "[orchestrator][partition][edge-case]") {
    REQUIRE(partition_scenarios(2, 8).size() == 2);
    REQUIRE(partition_scenarios(0, 4).empty());
    REQUIRE(partition_scenarios(5, 0).empty());
    REQUIRE(partition_scenarios(7, 1)[0].size() == 7);
}

// ============================================================================
// Parallel execution
// ============================================================================

TEST_CASE("Parallel run reproduces the sequential ensemble", "[orchestrator][determinism]") {
    ScenarioParams params = short_retirement();
    Orchestrator orchestrator(engine(), OrchestratorConfig(), quiet_logger());

    SECTION("Plain Monte Carlo") {
        EnsembleConfig config = small_config(120, 4);
        EnsembleResult sequential = run_ensemble(params, engine(), config);
        EnsembleRunResult parallel = orchestrator.run(params, config);

        REQUIRE(parallel.status == EnsembleStatus::Complete);
        REQUIRE(parallel.completed_scenarios == 120);
        REQUIRE(parallel.requested_scenarios == 120);
        REQUIRE(parallel.errors.empty());
        REQUIRE(parallel.result.success_probability == sequential.success_probability);
        REQUIRE(parallel.result.ending_balances == sequential.ending_balances);
        REQUIRE(parallel.result.p50() == sequential.p50());
        REQUIRE(parallel.result.risk.cvar_95 == sequential.risk.cvar_95);
        REQUIRE(parallel.result.median_scenario_index == sequential.median_scenario_index);
    }

    SECTION("All variance reduction techniques") {
        EnsembleConfig config = small_config(100, 3);
        config.antithetic = true;
        config.control_variates = true;
        config.stratified = true;
        EnsembleResult sequential = run_ensemble(params, engine(), config);
        EnsembleRunResult parallel = orchestrator.run(params, config);

        REQUIRE(parallel.complete());
        REQUIRE(parallel.result.success_probability == sequential.success_probability);
        REQUIRE(parallel.result.raw_success_probability == sequential.raw_success_probability);
        REQUIRE(parallel.result.ending_balances == sequential.ending_balances);
    }
}

TEST_CASE("Worker count does not change the outcomes", "[orchestrator][determinism]") {
    ScenarioParams params = short_retirement();
    Orchestrator orchestrator(engine(), OrchestratorConfig(), quiet_logger());

    EnsembleRunResult one = orchestrator.run(params, small_config(60, 1));
    EnsembleRunResult six = orchestrator.run(params, small_config(60, 6));

    REQUIRE(one.complete());
    REQUIRE(six.complete());
    REQUIRE(one.run_id != six.run_id);
    REQUIRE(one.result.ending_balances == six.result.ending_balances);
}

TEST_CASE("More workers than scenarios", "[orchestrator][edge-case]") {
    Orchestrator orchestrator(engine(), OrchestratorConfig(), quiet_logger());
    EnsembleRunResult run = orchestrator.run(short_retirement(), small_config(3, 8));

    REQUIRE(run.complete());
    REQUIRE(run.result.completed_scenarios == 3);
}

// ============================================================================
// Worker failures
// ============================================================================

TEST_CASE("A crashed range is retried on a fresh worker", "[orchestrator][retry]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::CRASH_ONCE;
    auto orchestrator = mock_orchestrator(control);

    ScenarioParams params = short_retirement();
    EnsembleConfig config = small_config(40, 2);
    EnsembleRunResult run = orchestrator->run(params, config);

    REQUIRE(run.status == EnsembleStatus::Complete);
    REQUIRE(run.completed_scenarios == 40);
    REQUIRE(control.attempts_on_target == 2);
    // One worker per pool thread plus the replacement
    REQUIRE(control.workers_created == 3);
    REQUIRE(run.result.scenarios_failed == 0);
    REQUIRE(run.result.success_probability == run_ensemble(params, engine(), config).success_probability);
}

TEST_CASE("A second failure yields a partial ensemble", "[orchestrator][retry]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::CRASH_ALWAYS;
    auto orchestrator = mock_orchestrator(control);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(40, 2));

    REQUIRE(run.status == EnsembleStatus::PartialEnsemble);
    REQUIRE_FALSE(run.complete());
    REQUIRE(control.attempts_on_target == 2);
    REQUIRE(run.completed_scenarios < run.requested_scenarios);
    REQUIRE(run.result.completed_scenarios == run.completed_scenarios);
    REQUIRE(run.result.requested_scenarios == 40);
    // 40 scenarios over 8 ranges: the failed range held 5
    REQUIRE(run.result.scenarios_failed == 5);
    REQUIRE(run.errors.size() == 1);
    REQUIRE_THAT(run.errors[0], ContainsSubstring("scenarios [0, 5)"));
    REQUIRE_THAT(run.errors[0], ContainsSubstring("failed after 2 attempt(s)"));
}

TEST_CASE("Without retry the first failure is final", "[orchestrator][retry]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::CRASH_ONCE;
    OrchestratorConfig config;
    config.enable_retry = false;
    auto orchestrator = mock_orchestrator(control, config);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(40, 2));

    REQUIRE(run.status == EnsembleStatus::PartialEnsemble);
    REQUIRE(control.attempts_on_target == 1);
    REQUIRE_THAT(run.errors[0], ContainsSubstring("failed after 1 attempt(s)"));
}

TEST_CASE("A hung range times out and is retried", "[orchestrator][timeout]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::HANG_ONCE;
    control.target_begin = 10;
    OrchestratorConfig config;
    config.worker_timeout_ms = 200;
    auto orchestrator = mock_orchestrator(control, config);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(40, 2));

    REQUIRE(run.status == EnsembleStatus::Complete);
    REQUIRE(run.completed_scenarios == 40);
    REQUIRE(control.attempts_on_target == 2);
}

TEST_CASE("A range that keeps hanging yields a partial ensemble", "[orchestrator][timeout]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::HANG_ALWAYS;
    OrchestratorConfig config;
    config.worker_timeout_ms = 100;
    auto orchestrator = mock_orchestrator(control, config);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(40, 2));

    REQUIRE(run.status == EnsembleStatus::PartialEnsemble);
    REQUIRE(control.attempts_on_target == 2);
    REQUIRE_THAT(run.errors[0], ContainsSubstring("timed out"));
}

TEST_CASE("Worker events are logged", "[orchestrator][logging]") {
    const std::string path = "test_orchestrator_events.log";
    std::filesystem::remove(path);

    MockControl control;
    control.failure_mode = MockControl::FailureMode::CRASH_ONCE;
    auto orchestrator = mock_orchestrator(control);

    LoggerConfig log_config;
    log_config.enable_console = false;
    log_config.enable_file = true;
    log_config.log_file_path = path;
    log_config.min_level = LogLevel::DEBUG;
    Logger::get_instance().configure(log_config);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(20, 2));
    Logger::get_instance().flush();

    std::map<std::string, int> counts;
    bool retry_names_first_attempt = false;
    std::string final_status;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        nlohmann::json record = nlohmann::json::parse(line);
        std::string event = record["event"].get<std::string>();
        counts[event]++;
        REQUIRE(record["run_id"] == run.run_id);
        if (event == "worker_retry") {
            retry_names_first_attempt = record["attempt"] == "0" && record["range_begin"] == "0";
        }
        if (event == "ensemble_complete") {
            final_status = record["status"].get<std::string>();
        }
    }

    REQUIRE(counts["ensemble_start"] == 1);
    REQUIRE(counts["worker_retry"] == 1);
    REQUIRE(counts["worker_failed"] == 0);
    // 8 ranges plus the retried attempt
    REQUIRE(counts["worker_start"] == 9);
    REQUIRE(counts["worker_complete"] == 8);
    REQUIRE(retry_names_first_attempt);
    REQUIRE(final_status == "complete");

    quiet_logger();
    std::filesystem::remove(path);
}

// ============================================================================
// Cancellation and deadlines
// ============================================================================

TEST_CASE("Cancel returns the scenarios completed so far", "[orchestrator][cancel]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::SLOW;
    control.scenario_delay_ms = 5;
    auto orchestrator = mock_orchestrator(control);

    std::thread canceller([&]() {
        while (control.ranges_started.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        orchestrator->cancel();
    });

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(400, 2));
    canceller.join();

    REQUIRE_FALSE(orchestrator->cancel_requested());
    REQUIRE(run.status == EnsembleStatus::Cancelled);
    REQUIRE(run.completed_scenarios < 400);
    REQUIRE(run.result.completed_scenarios == run.completed_scenarios);
    REQUIRE(run.result.scenarios_failed == 0);
    REQUIRE_THAT(run.errors.back(), ContainsSubstring("cancelled"));
}

TEST_CASE("Cancel before run stops that run and only that run", "[orchestrator][cancel]") {
    MockControl control;
    auto orchestrator = mock_orchestrator(control);

    orchestrator->cancel();
    REQUIRE(orchestrator->cancel_requested());

    EnsembleRunResult stopped = orchestrator->run(short_retirement(), small_config(40, 2));
    REQUIRE(stopped.status == EnsembleStatus::Cancelled);
    REQUIRE(stopped.completed_scenarios == 0);
    REQUIRE(control.ranges_started == 0);
    REQUIRE_FALSE(orchestrator->cancel_requested());

    EnsembleRunResult next = orchestrator->run(short_retirement(), small_config(40, 2));
    REQUIRE(next.status == EnsembleStatus::Complete);
    REQUIRE(next.completed_scenarios == 40);
}

TEST_CASE("The run deadline stops the ensemble", "[orchestrator][deadline]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::SLOW;
    control.scenario_delay_ms = 5;
    OrchestratorConfig config;
    config.deadline_ms = 60;
    auto orchestrator = mock_orchestrator(control, config);

    EnsembleRunResult run = orchestrator->run(short_retirement(), small_config(400, 2));

    REQUIRE(run.status == EnsembleStatus::Cancelled);
    REQUIRE(run.completed_scenarios < 400);
    REQUIRE_THAT(run.errors.back(), ContainsSubstring("Deadline of 60 ms exceeded"));
}

// ============================================================================
// Configuration errors
// ============================================================================

TEST_CASE("Invalid ensemble configuration fails before any worker starts", "[orchestrator][edge-case]") {
    MockControl control;
    auto orchestrator = mock_orchestrator(control);

    REQUIRE_THROWS_AS(orchestrator->run(short_retirement(), small_config(0, 2)), std::invalid_argument);
    REQUIRE_THROWS_AS(orchestrator->run(short_retirement(), small_config(10, 0)), std::invalid_argument);
    REQUIRE(control.workers_created == 0);
}

TEST_CASE("Unknown worker type is a configuration error", "[orchestrator][edge-case]") {
    OrchestratorConfig config;
    config.worker_type = "remote";
    Orchestrator orchestrator(engine(), config, quiet_logger());

    REQUIRE_THROWS_AS(orchestrator.run(short_retirement(), small_config(10, 2)), ConfigurationError);
}

TEST_CASE("Zero ranges per worker is rejected", "[orchestrator][edge-case]") {
    OrchestratorConfig config;
    config.ranges_per_worker = 0;
    REQUIRE_THROWS_AS(Orchestrator(engine(), config, quiet_logger()), ConfigurationError);
}

// ============================================================================
// Sub-analyses through the orchestrator
// ============================================================================

TEST_CASE("Orchestrator runner matches the sequential runner", "[orchestrator][analysis]") {
    ScenarioParams params = short_retirement();
    EnsembleConfig config = small_config(40, 3);
    Orchestrator orchestrator(engine(), OrchestratorConfig(), quiet_logger());

    LtcImpactAnalysis parallel = analyze_ltc_impact(params, config, orchestrator.runner());
    LtcImpactAnalysis sequential = analyze_ltc_impact(params, config, sequential_runner(engine()));

    REQUIRE(parallel.computed);
    REQUIRE(parallel.success_with_ltc == sequential.success_with_ltc);
    REQUIRE(parallel.success_without_ltc == sequential.success_without_ltc);
    REQUIRE(parallel.mean_ltc_cost == sequential.mean_ltc_cost);
}

TEST_CASE("Orchestrator runner refuses incomplete ensembles", "[orchestrator][analysis]") {
    MockControl control;
    control.failure_mode = MockControl::FailureMode::CRASH_ALWAYS;
    auto orchestrator = mock_orchestrator(control);
    EnsembleRunner runner = orchestrator->runner();

    REQUIRE_THROWS_AS(runner(short_retirement(), small_config(20, 2)), WorkerFailure);
}
