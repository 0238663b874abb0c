#include "ensemble.hpp"
#include "benefits.hpp"
#include "risk_metrics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace retirecalc {

// ============================================================================
// Config / Result
// ============================================================================

EnsembleConfig::EnsembleConfig()
    : iterations(1000), seed(42), antithetic(false), control_variates(false),
      stratified(false), strata(DEFAULT_STRATA),
      distribution(ReturnDistribution::StudentT),
      degrees_of_freedom(ScenarioOptions::DEFAULT_DEGREES_OF_FREEDOM),
      regime_switching(false), include_ltc(true), stochastic_mortality(false),
      worker_count(1),
      retain_trajectories(false), danger_zone_threshold(0.20) {}

void EnsembleConfig::validate() const {
    if (iterations == 0) {
        throw std::invalid_argument("Ensemble needs at least one iteration");
    }
    if (stratified && strata < 2) {
        throw std::invalid_argument("Stratified sampling needs at least 2 strata");
    }
    if (distribution == ReturnDistribution::StudentT && !(degrees_of_freedom > 2.0)) {
        throw std::invalid_argument("Student-t returns need more than 2 degrees of freedom");
    }
    if (worker_count < 1) {
        throw std::invalid_argument("Worker count must be at least 1");
    }
    if (danger_zone_threshold < 0.0 || danger_zone_threshold > 1.0) {
        throw std::invalid_argument("Danger zone threshold must be in [0, 1]");
    }
}

RiskMetrics::RiskMetrics()
    : cvar_95(0.0), cvar_99(0.0), max_drawdown(0.0), ulcer_index(0.0),
      drawdown_duration(0.0), sequence_risk_score(0.0), utility_adjusted_success(0.0) {}

LtcImpactAnalysis::LtcImpactAnalysis()
    : computed(false), success_with_ltc(0.0), success_without_ltc(0.0),
      success_delta(0.0), mean_ltc_cost(0.0), ltc_event_probability(0.0) {}

EnsembleResult::EnsembleResult()
    : requested_scenarios(0), completed_scenarios(0), scenarios_failed(0),
      success_probability(0.0), raw_success_probability(0.0),
      control_variate_applied(false), control_variate_beta(0.0),
      analytic_success_estimate(0.0), legacy_goal_probability(0.0),
      mean_ending_balance(0.0), std_dev_ending_balance(0.0),
      ending_percentiles{0.0, 0.0, 0.0, 0.0, 0.0},
      mean_ltc_cost(0.0), ltc_event_probability(0.0),
      median_scenario_index(0), execution_time_ms(0.0) {}

// ============================================================================
// Seeding and variance reduction
// ============================================================================

namespace {

// Scenarios sharing one underlying draw: pairs under antithetic sampling
uint64_t draw_index(const EnsembleConfig& config, uint64_t index) {
    return config.antithetic ? index / 2 : index;
}

double portfolio_cagr(const ReturnModel& m) {
    return m.stock_allocation * m.stocks.cagr + m.bond_allocation * m.bonds.cagr +
           m.cash_allocation * m.cash.cagr;
}

double portfolio_volatility(const ReturnModel& m) {
    double ws = m.stock_allocation * m.stocks.volatility;
    double wb = m.bond_allocation * m.bonds.volatility;
    double wc = m.cash_allocation * m.cash.volatility;
    double variance = ws * ws + wb * wb + wc * wc +
                      2.0 * (ws * wb * m.corr_stock_bond + ws * wc * m.corr_stock_cash +
                             wb * wc * m.corr_bond_cash);
    return std::sqrt(std::max(0.0, variance));
}

double annual_guaranteed_income(const ScenarioParams& params, const PersonParams& person) {
    double monthly = benefit_at_claim_age(person.social_security_claim_age,
                                          person.full_retirement_age(params.start_year),
                                          person.social_security_pia);
    return monthly * 12.0 + person.pension_annual;
}

} // anonymous namespace

uint64_t derive_scenario_seed(const EnsembleConfig& config, uint64_t index) {
    return mix_seed(config.seed, draw_index(config, index));
}

ScenarioOptions scenario_options(const EnsembleConfig& config, uint64_t index) {
    ScenarioOptions options;
    options.distribution = config.distribution;
    options.degrees_of_freedom = config.degrees_of_freedom;
    options.regime_switching = config.regime_switching;
    options.include_ltc = config.include_ltc;
    options.stochastic_mortality = config.stochastic_mortality;
    options.antithetic = config.antithetic && (index % 2 == 1);

    if (config.stratified && config.strata > 1) {
        uint64_t draw = draw_index(config, index);
        uint64_t block = draw / config.strata;
        options.strata = config.strata;
        options.stratum = static_cast<uint32_t>(draw % config.strata);
        // Each block of `strata` draws gets its own per-year permutation
        options.stratification_seed = mix_seed(config.seed ^ 0x5A5A5A5A5A5A5A5AULL, block);
    }
    return options;
}

double analytic_success_estimate(const ScenarioParams& params) {
    double years = std::max(0, params.primary.retirement_age - params.primary.current_age);
    double r = portfolio_cagr(params.returns);
    double vol = portfolio_volatility(params.returns);

    double growth = std::pow(1.0 + r, years);
    double fv_savings = r == 0.0 ? params.annual_savings * years
                                 : params.annual_savings * (growth - 1.0) / r;
    double at_retirement = params.initial_assets.total() * growth + fv_savings;

    double guaranteed = annual_guaranteed_income(params, params.primary);
    if (params.has_spouse) {
        guaranteed += annual_guaranteed_income(params, params.spouse);
    }
    double net_expenses = std::max(0.0, params.annual_expenses + params.healthcare_expenses - guaranteed);
    if (net_expenses <= 0.0) {
        return 1.0;
    }
    double required = net_expenses / 0.04;
    if (at_retirement <= 0.0) {
        return 0.0;
    }
    if (years <= 0.0 || vol <= 0.0) {
        return at_retirement >= required ? 1.0 : 0.0;
    }

    double log_mean = std::log(at_retirement) - 0.5 * vol * vol * years;
    double log_std = vol * std::sqrt(years);
    return 1.0 - normal_cdf((std::log(required) - log_mean) / log_std);
}

// ============================================================================
// Execution
// ============================================================================

std::vector<ScenarioOutcome> run_scenario_range(const ScenarioParams& params, const TaxEngine& tax_engine,
                                                const EnsembleConfig& config, uint64_t begin, uint64_t end,
                                                const std::atomic<bool>* cancel) {
    std::vector<ScenarioOutcome> outcomes;
    if (end > begin) {
        outcomes.reserve(static_cast<size_t>(end - begin));
    }
    for (uint64_t i = begin; i < end; ++i) {
        if (cancel != nullptr && cancel->load()) {
            break;
        }
        ScenarioOutcome outcome = run_scenario(params, tax_engine, derive_scenario_seed(config, i),
                                               scenario_options(config, i));
        outcome.scenario_index = i;
        if (!config.retain_trajectories) {
            outcome.years.clear();
            outcome.years.shrink_to_fit();
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

EnsembleResult run_ensemble(const ScenarioParams& params, const TaxEngine& tax_engine,
                            const EnsembleConfig& config) {
    config.validate();
    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<ScenarioOutcome> outcomes;
    outcomes.reserve(static_cast<size_t>(config.iterations));
    int failed = 0;

    for (uint64_t i = 0; i < config.iterations; ++i) {
        try {
            std::vector<ScenarioOutcome> one = run_scenario_range(params, tax_engine, config, i, i + 1);
            outcomes.push_back(std::move(one.front()));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Scenario " << i << " failed: " << e.what() << std::endl;
            ++failed;
        }
    }

    EnsembleResult result = aggregate_outcomes(std::move(outcomes), params, tax_engine, config);
    result.scenarios_failed = failed;

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return result;
}

// ============================================================================
// Aggregation
// ============================================================================

EnsembleResult aggregate_outcomes(std::vector<ScenarioOutcome> outcomes, const ScenarioParams& params,
                                  const TaxEngine& tax_engine, const EnsembleConfig& config) {
    EnsembleResult result;
    result.requested_scenarios = config.iterations;
    result.completed_scenarios = outcomes.size();
    result.analytic_success_estimate = 100.0 * analytic_success_estimate(params);
    if (outcomes.empty()) {
        return result;
    }

    std::sort(outcomes.begin(), outcomes.end(),
              [](const ScenarioOutcome& a, const ScenarioOutcome& b) {
                  return a.scenario_index < b.scenario_index;
              });

    const double n = static_cast<double>(outcomes.size());
    std::vector<double> successes;
    std::vector<double> controls;
    std::vector<double> drawdowns;
    std::vector<double> ulcers;
    std::vector<double> durations;
    successes.reserve(outcomes.size());
    controls.reserve(outcomes.size());
    result.ending_balances.reserve(outcomes.size());

    int legacy_met = 0;
    int failures = 0;
    int failures_with_early_losses = 0;
    int ltc_events = 0;
    double ltc_cost = 0.0;

    for (const ScenarioOutcome& o : outcomes) {
        successes.push_back(o.success ? 1.0 : 0.0);
        controls.push_back(o.control_value);
        drawdowns.push_back(o.max_drawdown);
        ulcers.push_back(o.ulcer_index);
        durations.push_back(static_cast<double>(o.drawdown_duration));
        result.ending_balances.push_back(o.ending_balance);
        if (o.legacy_goal_met) {
            ++legacy_met;
        }
        if (!o.success) {
            ++failures;
            if (o.early_negative_returns >= 2) {
                ++failures_with_early_losses;
            }
        }
        if (o.ltc_event) {
            ++ltc_events;
        }
        ltc_cost += o.total_ltc_cost;
    }

    // Success probability, optionally regressed on the zero-mean equity control
    double raw = calculate_mean(successes);
    double estimate = raw;
    if (config.control_variates && outcomes.size() > 1) {
        double c_mean = calculate_mean(controls);
        double covariance = 0.0;
        double variance = 0.0;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            double dc = controls[i] - c_mean;
            covariance += (successes[i] - raw) * dc;
            variance += dc * dc;
        }
        if (variance > 0.0) {
            result.control_variate_beta = covariance / variance;
            estimate = std::min(1.0, std::max(0.0, raw - result.control_variate_beta * c_mean));
            result.control_variate_applied = true;
        }
    }
    result.raw_success_probability = 100.0 * raw;
    result.success_probability = 100.0 * estimate;
    result.legacy_goal_probability = 100.0 * legacy_met / n;
    result.mean_ltc_cost = ltc_cost / n;
    result.ltc_event_probability = ltc_events / n;

    // Ending balance distribution
    std::vector<double> sorted = result.ending_balances;
    std::sort(sorted.begin(), sorted.end());
    result.mean_ending_balance = calculate_mean(sorted);
    result.std_dev_ending_balance = calculate_std_dev(sorted, result.mean_ending_balance);
    const double levels[] = {10.0, 25.0, 50.0, 75.0, 90.0};
    for (size_t i = 0; i < result.ending_percentiles.size(); ++i) {
        result.ending_percentiles[i] = calculate_percentile(sorted, levels[i]);
    }

    // Risk metrics
    result.risk.cvar_95 = calculate_cvar(sorted, 95.0);
    result.risk.cvar_99 = calculate_cvar(sorted, 99.0);
    result.risk.max_drawdown = calculate_mean(drawdowns);
    result.risk.ulcer_index = calculate_mean(ulcers);
    result.risk.drawdown_duration = calculate_mean(durations);
    result.risk.sequence_risk_score = failures > 0
        ? static_cast<double>(failures_with_early_losses) / failures : 0.0;
    result.risk.utility_adjusted_success =
        calculate_utility_adjusted_success(result.ending_balances, params.initial_assets.total());

    // Per-year bands and danger zones
    size_t horizon = 0;
    for (const ScenarioOutcome& o : outcomes) {
        horizon = std::max(horizon, o.balances.size());
    }
    std::vector<double> column;
    column.reserve(outcomes.size());
    for (size_t y = 0; y < horizon; ++y) {
        column.clear();
        int depleted = 0;
        for (const ScenarioOutcome& o : outcomes) {
            if (y < o.balances.size()) {
                column.push_back(o.balances[y]);
                if (o.balances[y] <= 0.01) {
                    ++depleted;
                }
            }
        }
        if (column.empty()) {
            continue;
        }
        std::sort(column.begin(), column.end());

        PercentileBand band;
        band.year_index = static_cast<int>(y);
        band.age = params.primary.current_age + static_cast<int>(y);
        band.p10 = calculate_percentile(column, 10.0);
        band.p25 = calculate_percentile(column, 25.0);
        band.p50 = calculate_percentile(column, 50.0);
        band.p75 = calculate_percentile(column, 75.0);
        band.p90 = calculate_percentile(column, 90.0);
        result.bands.push_back(band);

        double rate = static_cast<double>(depleted) / column.size();
        if (band.age >= params.primary.retirement_age && rate > config.danger_zone_threshold) {
            result.risk.danger_zones.push_back({band.age, rate});
        }
    }

    // Representative path: the scenario ending closest to the median
    const ScenarioOutcome* median = &outcomes.front();
    for (const ScenarioOutcome& o : outcomes) {
        if (std::abs(o.ending_balance - result.p50()) < std::abs(median->ending_balance - result.p50())) {
            median = &o;
        }
    }
    result.median_scenario_index = median->scenario_index;
    if (!median->years.empty()) {
        result.median_trajectory = median->years;
    } else {
        result.median_trajectory = run_scenario(params, tax_engine,
                                                derive_scenario_seed(config, median->scenario_index),
                                                scenario_options(config, median->scenario_index)).years;
    }

    if (config.retain_trajectories) {
        result.outcomes = std::move(outcomes);
    }
    return result;
}

} // namespace retirecalc
