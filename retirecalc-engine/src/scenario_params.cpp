#include "scenario_params.hpp"
#include "benefits.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace retirecalc {

PersonParams::PersonParams()
    : current_age(55), retirement_age(65), life_expectancy(90.0), birth_year(0),
      gender(Gender::Male), health(HealthStatus::Good),
      social_security_pia(0.0), social_security_claim_age(67.0),
      pension_annual(0.0), pension_survivor_fraction(0.0),
      employment_income(0.0), part_time_income(0.0),
      part_time_end_age(ScenarioParams::DEFAULT_PART_TIME_END_AGE) {}

double PersonParams::full_retirement_age(int start_year) const {
    int year = birth_year > 0 ? birth_year : start_year - current_age;
    return retirecalc::full_retirement_age(year);
}

ScenarioParams::ScenarioParams()
    : has_spouse(false), annual_savings(0.0),
      annual_expenses(0.0), healthcare_expenses(0.0),
      general_inflation(0.025), healthcare_inflation(0.05),
      social_security_cola(0.025), pension_cola(0.0), discount_rate(0.03),
      filing_status(FilingStatus::Single), state(""),
      legacy_goal(0.0), start_year(DEFAULT_START_YEAR) {}

int ScenarioParams::horizon_years() const {
    double years = primary.life_expectancy - primary.current_age;
    if (has_spouse) {
        years = std::max(years, spouse.life_expectancy - spouse.current_age);
    }
    return static_cast<int>(std::ceil(years));
}

int ScenarioParams::rmd_start_age() const {
    return primary.birth_year > 0 ? RmdTable::start_age(primary.birth_year) : RmdTable::DEFAULT_START_AGE;
}

// ============================================================================
// ScenarioParamsBuilder Implementation
// ============================================================================

ScenarioParamsBuilder::ScenarioParamsBuilder() {}

ScenarioParamsBuilder::ScenarioParamsBuilder(const ScenarioParams& base)
    : params_(base) {}

ScenarioParamsBuilder& ScenarioParamsBuilder::primary(const PersonParams& person) {
    params_.primary = person;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::spouse(const PersonParams& person) {
    params_.spouse = person;
    params_.has_spouse = true;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::no_spouse() {
    params_.spouse = PersonParams();
    params_.has_spouse = false;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::assets(double tax_deferred, double tax_free,
                                                     double capital_gains, double cash,
                                                     double capital_gains_basis) {
    auto check = [](double value, const char* field) {
        if (value < 0.0 || !std::isfinite(value)) {
            throw InvalidParameterError(field, "must be finite and non-negative");
        }
    };
    check(tax_deferred, "assets.tax_deferred");
    check(tax_free, "assets.tax_free");
    check(capital_gains, "assets.capital_gains");
    check(cash, "assets.cash");
    check(capital_gains_basis, "assets.capital_gains_basis");
    params_.initial_assets = AssetBuckets(tax_deferred, tax_free, capital_gains, cash, capital_gains_basis);
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::annual_savings(double amount, const ContributionSplit& split) {
    params_.annual_savings = amount;
    params_.contribution_split = split;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::expenses(double annual, double healthcare) {
    params_.annual_expenses = annual;
    params_.healthcare_expenses = healthcare;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::inflation(double general, double healthcare) {
    params_.general_inflation = general;
    params_.healthcare_inflation = healthcare;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::cola(double social_security, double pension) {
    params_.social_security_cola = social_security;
    params_.pension_cola = pension;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::discount_rate(double rate) {
    params_.discount_rate = rate;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::returns(const ReturnModel& model) {
    params_.returns = model;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::filing_status(FilingStatus status) {
    params_.filing_status = status;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::state(const std::string& code) {
    std::string upper = code;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    params_.state = upper;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::ltc(const LtcConfig& config) {
    params_.ltc = config;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::guardrails(const GuardrailConfig& config) {
    params_.guardrails = config;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::legacy_goal(double amount) {
    params_.legacy_goal = amount;
    return *this;
}

ScenarioParamsBuilder& ScenarioParamsBuilder::start_year(int year) {
    params_.start_year = year;
    return *this;
}

void ScenarioParamsBuilder::validate_person(const PersonParams& person, const std::string& prefix) {
    if (person.current_age < 0 || person.current_age > 120) {
        throw InvalidParameterError(prefix + ".current_age", "must be in [0, 120]");
    }
    if (person.retirement_age < person.current_age) {
        throw InvalidParameterError(prefix + ".retirement_age", "must be at least current_age");
    }
    if (!(person.life_expectancy > person.retirement_age)) {
        throw InvalidParameterError(prefix + ".life_expectancy", "must exceed retirement_age");
    }
    if (person.life_expectancy > 120.0) {
        throw InvalidParameterError(prefix + ".life_expectancy", "must not exceed 120");
    }
    if (person.social_security_pia < 0.0) {
        throw InvalidParameterError(prefix + ".social_security_pia", "must be non-negative");
    }
    if (person.social_security_claim_age < EARLIEST_CLAIM_AGE ||
        person.social_security_claim_age > LATEST_CLAIM_AGE) {
        throw InvalidParameterError(prefix + ".social_security_claim_age", "must be in [62, 70]");
    }
    if (person.pension_annual < 0.0) {
        throw InvalidParameterError(prefix + ".pension_annual", "must be non-negative");
    }
    if (person.pension_survivor_fraction < 0.0 || person.pension_survivor_fraction > 1.0) {
        throw InvalidParameterError(prefix + ".pension_survivor_fraction", "must be in [0, 1]");
    }
    if (person.employment_income < 0.0) {
        throw InvalidParameterError(prefix + ".employment_income", "must be non-negative");
    }
    if (person.part_time_income < 0.0) {
        throw InvalidParameterError(prefix + ".part_time_income", "must be non-negative");
    }
    const LtcInsurance& policy = person.ltc_insurance;
    if (policy.daily_benefit < 0.0 || policy.annual_premium < 0.0 ||
        policy.benefit_period_years < 0.0 || policy.elimination_days < 0.0) {
        throw InvalidParameterError(prefix + ".ltc_insurance", "amounts must be non-negative");
    }
    if (policy.hybrid_benefit_fraction < 0.0 || policy.hybrid_benefit_fraction > 1.0) {
        throw InvalidParameterError(prefix + ".ltc_insurance.hybrid_benefit_fraction", "must be in [0, 1]");
    }
}

ScenarioParams ScenarioParamsBuilder::build() const {
    const ScenarioParams& p = params_;

    validate_person(p.primary, "primary");
    if (p.has_spouse) {
        validate_person(p.spouse, "spouse");
    } else if (p.filing_status == FilingStatus::MarriedJoint) {
        throw InvalidParameterError("filing_status", "married_joint requires a spouse");
    }

    if (p.annual_savings < 0.0) {
        throw InvalidParameterError("annual_savings", "must be non-negative");
    }
    try {
        p.contribution_split.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidParameterError("contribution_split", e.what());
    }
    if (p.annual_expenses < 0.0) {
        throw InvalidParameterError("annual_expenses", "must be non-negative");
    }
    if (p.healthcare_expenses < 0.0) {
        throw InvalidParameterError("healthcare_expenses", "must be non-negative");
    }
    if (p.general_inflation <= -1.0) {
        throw InvalidParameterError("general_inflation", "must exceed -100%");
    }
    if (p.healthcare_inflation <= -1.0) {
        throw InvalidParameterError("healthcare_inflation", "must exceed -100%");
    }
    if (p.social_security_cola <= -1.0 || p.pension_cola <= -1.0) {
        throw InvalidParameterError("cola", "must exceed -100%");
    }
    if (p.discount_rate <= -1.0) {
        throw InvalidParameterError("discount_rate", "must exceed -100%");
    }
    try {
        p.returns.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidParameterError("returns", e.what());
    }
    try {
        p.guardrails.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidParameterError("guardrails", e.what());
    }
    if (p.ltc.lifetime_probability < 0.0 || p.ltc.lifetime_probability > 1.0) {
        throw InvalidParameterError("ltc.lifetime_probability", "must be in [0, 1]");
    }
    if (p.ltc.onset_max_age < p.ltc.onset_min_age) {
        throw InvalidParameterError("ltc.onset_max_age", "must be at least onset_min_age");
    }
    if (p.ltc.annual_cost < 0.0 || p.ltc.regional_factor < 0.0) {
        throw InvalidParameterError("ltc.annual_cost", "must be non-negative");
    }
    if (p.ltc.inflation <= -1.0) {
        throw InvalidParameterError("ltc.inflation", "must exceed -100%");
    }
    if (p.legacy_goal < 0.0) {
        throw InvalidParameterError("legacy_goal", "must be non-negative");
    }
    if (p.start_year < 2000 || p.start_year > 2080) {
        throw InvalidParameterError("start_year", "must be in [2000, 2080]");
    }
    return p;
}

} // namespace retirecalc
