#ifndef RETIRECALC_ENSEMBLE_HPP
#define RETIRECALC_ENSEMBLE_HPP

#include "scenario_runner.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <vector>

namespace retirecalc {

struct EnsembleConfig {
    static constexpr uint32_t DEFAULT_STRATA = 10;

    uint64_t iterations;
    uint64_t seed;
    bool antithetic;                  // Odd scenarios mirror the preceding even one
    bool control_variates;
    bool stratified;
    uint32_t strata;
    ReturnDistribution distribution;
    double degrees_of_freedom;
    bool regime_switching;
    bool include_ltc;
    bool stochastic_mortality;
    int worker_count;
    bool retain_trajectories;         // Keep every YearState (memory heavy)
    double danger_zone_threshold;

    EnsembleConfig();

    // Throws std::invalid_argument for zero iterations, strata < 2 with
    // stratification on, or degrees of freedom <= 2 with Student-t returns
    void validate() const;
};

// Seed of scenario `index`. Independent of execution order and partitioning;
// an antithetic pair shares one seed.
uint64_t derive_scenario_seed(const EnsembleConfig& config, uint64_t index);

// Sampling options of scenario `index` (mirroring, stratum assignment)
ScenarioOptions scenario_options(const EnsembleConfig& config, uint64_t index);

struct PercentileBand {
    int year_index;
    int age;
    double p10;
    double p25;
    double p50;
    double p75;
    double p90;
};

struct DangerZone {
    int age;
    double depletion_rate;            // Share of scenarios depleted at this age
};

struct RiskMetrics {
    double cvar_95;                   // Mean of the worst 5% of ending balances
    double cvar_99;
    double max_drawdown;              // Averaged across scenarios
    double ulcer_index;
    double drawdown_duration;
    double sequence_risk_score;       // Failures with 2+ early negative years / failures
    double utility_adjusted_success;
    std::vector<DangerZone> danger_zones;

    RiskMetrics();
};

struct LtcImpactAnalysis {
    bool computed;
    double success_with_ltc;
    double success_without_ltc;
    double success_delta;             // Points of success probability lost to LTC
    double mean_ltc_cost;             // Lifetime net LTC cost per scenario
    double ltc_event_probability;

    LtcImpactAnalysis();
};

struct ClaimingAgeResult {
    int claim_age;
    double monthly_benefit;           // Primary, today's dollars
    double npv;
    double success_probability;
};

// EnsembleResult: aggregate over all completed ScenarioOutcomes
struct EnsembleResult {
    uint64_t requested_scenarios;
    uint64_t completed_scenarios;
    int scenarios_failed;

    double success_probability;       // 0-100, control-adjusted when enabled
    double raw_success_probability;   // 0-100, plain fraction of successes
    bool control_variate_applied;
    double control_variate_beta;
    double analytic_success_estimate; // 0-100, lognormal closed form
    double legacy_goal_probability;   // 0-100

    double mean_ending_balance;
    double std_dev_ending_balance;
    std::array<double, 5> ending_percentiles;   // P10, P25, P50, P75, P90

    double mean_ltc_cost;
    double ltc_event_probability;     // 0-1

    RiskMetrics risk;
    std::vector<PercentileBand> bands;
    uint64_t median_scenario_index;
    std::vector<YearState> median_trajectory;

    LtcImpactAnalysis ltc_impact;
    std::vector<ClaimingAgeResult> claiming_sensitivity;

    std::vector<double> ending_balances;        // In scenario order
    std::vector<ScenarioOutcome> outcomes;      // Only with retain_trajectories

    double execution_time_ms;

    double p10() const { return ending_percentiles[0]; }
    double p25() const { return ending_percentiles[1]; }
    double p50() const { return ending_percentiles[2]; }
    double p75() const { return ending_percentiles[3]; }
    double p90() const { return ending_percentiles[4]; }

    EnsembleResult();
};

// Runs scenarios [begin, end). Stops before the next scenario once cancel is set.
// Exceptions from a scenario propagate to the caller.
std::vector<ScenarioOutcome> run_scenario_range(const ScenarioParams& params, const TaxEngine& tax_engine,
                                                const EnsembleConfig& config, uint64_t begin, uint64_t end,
                                                const std::atomic<bool>* cancel = nullptr);

// Statistics over completed outcomes (any order; sorted by scenario index here)
EnsembleResult aggregate_outcomes(std::vector<ScenarioOutcome> outcomes, const ScenarioParams& params,
                                  const TaxEngine& tax_engine, const EnsembleConfig& config);

// Sequential ensemble run. Failed scenarios are reported on stderr and counted.
EnsembleResult run_ensemble(const ScenarioParams& params, const TaxEngine& tax_engine,
                            const EnsembleConfig& config);

// Closed-form success probability (0-1): lognormal portfolio at retirement
// against the portfolio needed for a 4% draw of net expenses
double analytic_success_estimate(const ScenarioParams& params);

} // namespace retirecalc

#endif // RETIRECALC_ENSEMBLE_HPP
