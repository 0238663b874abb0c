#ifndef RETIRECALC_SCENARIO_RUNNER_HPP
#define RETIRECALC_SCENARIO_RUNNER_HPP

#include "guardrail.hpp"
#include "return_generator.hpp"
#include "scenario_params.hpp"
#include "tax_engine.hpp"
#include <cstdint>
#include <vector>

namespace retirecalc {

// One simulated year. Balances are end-of-year, after withdrawals and growth.
struct YearState {
    int year_index;
    int calendar_year;
    int age;
    int spouse_age;                 // -1 without a spouse
    bool retired;

    double tax_deferred;
    double tax_free;
    double capital_gains;
    double cash;
    double total_assets;            // Always the sum of the four buckets

    double portfolio_return;
    double cash_return;
    MarketRegime regime;

    double contributions;
    double social_security;
    double pension;
    double earned_income;
    double guaranteed_income;

    double planned_spending;        // Inflation-adjusted spending before guardrails
    double spending;                // Spending after guardrails
    double healthcare;
    double spending_need;           // spending + healthcare + net LTC + IRMAA

    double gross_withdrawal;
    double net_withdrawal;          // After-tax portfolio draw spent this year
    double rmd;
    double realized_gains;
    double federal_tax;
    double state_tax;
    double irmaa;
    double magi;

    double ltc_gross;
    double ltc_insurance_offset;
    double ltc_premiums;
    double ltc_cost;                // Net LTC cost injected into the need

    GuardrailState guardrail_state;
    double guardrail_adjustment;
    double shortfall;

    YearState();
    double total_taxes() const { return federal_tax + state_tax + irmaa; }
};

// Terminal state of one simulated lifetime
struct ScenarioOutcome {
    uint64_t scenario_index;
    uint64_t seed;
    bool success;                   // No year ran short through the terminal age
    bool legacy_goal_met;
    double ending_balance;
    double total_shortfall;
    int shortfall_years;
    int depletion_age;              // -1 if never depleted in retirement
    double max_drawdown;
    double ulcer_index;
    int drawdown_duration;
    int early_negative_returns;     // Negative years among the first 5 of retirement
    double control_value;           // Mean equity shock over the first 10 retirement years
    double total_ltc_cost;
    bool ltc_event;
    double primary_death_age;       // Drawn or fixed; the simulation ends once all members die
    double spouse_death_age;        // -1 without a spouse
    std::vector<double> balances;   // End-of-year total assets, kept when years are dropped
    std::vector<YearState> years;

    ScenarioOutcome();
};

constexpr int EARLY_RETIREMENT_YEARS = 5;
constexpr int CONTROL_WINDOW_YEARS = 10;

// Stream salts: each concern draws from its own generator
constexpr uint64_t RETURN_STREAM = 1;
constexpr uint64_t LTC_STREAM = 2;
constexpr uint64_t MORTALITY_STREAM = 3;

// Runs one full lifetime (accumulation, retirement, last death).
// Deterministic in (params, seed, options); shortfalls are recorded, never thrown.
ScenarioOutcome run_scenario(const ScenarioParams& params, const TaxEngine& tax_engine,
                             uint64_t seed, const ScenarioOptions& options);

} // namespace retirecalc

#endif // RETIRECALC_SCENARIO_RUNNER_HPP
