#ifndef RETIRECALC_SCENARIO_PARAMS_HPP
#define RETIRECALC_SCENARIO_PARAMS_HPP

#include "asset_buckets.hpp"
#include "guardrail.hpp"
#include "ltc_overlay.hpp"
#include "return_generator.hpp"
#include "tax_tables.hpp"
#include <stdexcept>
#include <string>

namespace retirecalc {

// Rejected input, raised before any simulation starts
class InvalidParameterError : public std::invalid_argument {
public:
    InvalidParameterError(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// One member of the household
struct PersonParams {
    int current_age;
    int retirement_age;
    double life_expectancy;
    int birth_year;                       // 0 when unknown
    Gender gender;
    HealthStatus health;

    double social_security_pia;           // Monthly benefit at FRA, today's dollars
    double social_security_claim_age;
    double pension_annual;                // Today's dollars, starts at retirement
    double pension_survivor_fraction;     // Share paid to the survivor after death
    double employment_income;             // Earned while working past the household retirement
    double part_time_income;              // From retirement until part_time_end_age
    double part_time_end_age;
    LtcInsurance ltc_insurance;

    PersonParams();

    double full_retirement_age(int start_year) const;
};

// ScenarioParams: immutable, validated input to one scenario
struct ScenarioParams {
    static constexpr int DEFAULT_START_YEAR = 2025;
    static constexpr double DEFAULT_PART_TIME_END_AGE = 75.0;

    PersonParams primary;
    bool has_spouse;
    PersonParams spouse;

    AssetBuckets initial_assets;
    double annual_savings;                // Until the household retires
    ContributionSplit contribution_split;

    double annual_expenses;               // Base retirement spending, today's dollars
    double healthcare_expenses;           // Today's dollars
    double general_inflation;
    double healthcare_inflation;
    double social_security_cola;
    double pension_cola;
    double discount_rate;                 // For benefit NPV comparisons

    ReturnModel returns;
    FilingStatus filing_status;
    std::string state;
    LtcConfig ltc;
    GuardrailConfig guardrails;
    double legacy_goal;
    int start_year;

    ScenarioParams();

    // Years simulated with fixed lifespans: until the longer-lived member reaches life expectancy
    int horizon_years() const;
    int rmd_start_age() const;
    int terminal_age() const { return primary.current_age + horizon_years(); }
};

// ScenarioParamsBuilder: the only way to obtain a validated ScenarioParams.
// Unset optional fields keep their defaults; build() checks every invariant.
class ScenarioParamsBuilder {
public:
    ScenarioParamsBuilder();
    explicit ScenarioParamsBuilder(const ScenarioParams& base);

    ScenarioParamsBuilder& primary(const PersonParams& person);
    ScenarioParamsBuilder& spouse(const PersonParams& person);
    ScenarioParamsBuilder& no_spouse();
    // Throws InvalidParameterError for negative balances
    ScenarioParamsBuilder& assets(double tax_deferred, double tax_free, double capital_gains,
                                  double cash, double capital_gains_basis);
    ScenarioParamsBuilder& annual_savings(double amount, const ContributionSplit& split = ContributionSplit());
    ScenarioParamsBuilder& expenses(double annual, double healthcare);
    ScenarioParamsBuilder& inflation(double general, double healthcare);
    ScenarioParamsBuilder& cola(double social_security, double pension);
    ScenarioParamsBuilder& discount_rate(double rate);
    ScenarioParamsBuilder& returns(const ReturnModel& model);
    ScenarioParamsBuilder& filing_status(FilingStatus status);
    ScenarioParamsBuilder& state(const std::string& code);
    ScenarioParamsBuilder& ltc(const LtcConfig& config);
    ScenarioParamsBuilder& guardrails(const GuardrailConfig& config);
    ScenarioParamsBuilder& legacy_goal(double amount);
    ScenarioParamsBuilder& start_year(int year);

    // Throws InvalidParameterError naming the offending field
    ScenarioParams build() const;

private:
    ScenarioParams params_;

    static void validate_person(const PersonParams& person, const std::string& prefix);
};

} // namespace retirecalc

#endif // RETIRECALC_SCENARIO_PARAMS_HPP
