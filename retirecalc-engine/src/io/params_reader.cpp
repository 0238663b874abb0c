#include "params_reader.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace retirecalc {
namespace io {

namespace {

std::string join(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

const json* child(const json& j, const std::string& key, const std::string& prefix) {
    if (!j.contains(key)) {
        return nullptr;
    }
    const json& value = j[key];
    if (!value.is_object()) {
        throw InvalidParameterError(join(prefix, key), "expected an object");
    }
    return &value;
}

double number(const json& j, const std::string& key, double fallback, const std::string& prefix) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j[key];
    if (!value.is_number()) {
        throw InvalidParameterError(join(prefix, key), "expected a number");
    }
    return value.get<double>();
}

int integer(const json& j, const std::string& key, int fallback, const std::string& prefix) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j[key];
    if (!value.is_number_integer()) {
        throw InvalidParameterError(join(prefix, key), "expected an integer");
    }
    bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw InvalidParameterError(join(prefix, key), "integer out of range");
    }
    return value.get<int>();
}

bool boolean(const json& j, const std::string& key, bool fallback, const std::string& prefix) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j[key];
    if (!value.is_boolean()) {
        throw InvalidParameterError(join(prefix, key), "expected true or false");
    }
    return value.get<bool>();
}

std::string text(const json& j, const std::string& key, const std::string& fallback,
                 const std::string& prefix) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j[key];
    if (!value.is_string()) {
        throw InvalidParameterError(join(prefix, key), "expected a string");
    }
    return value.get<std::string>();
}

// Enum parsers throw std::invalid_argument; report them against the field
template <typename Parse>
auto parse_enum(const std::string& value, const std::string& field, Parse parse) -> decltype(parse(value)) {
    try {
        return parse(value);
    } catch (const std::invalid_argument& e) {
        throw InvalidParameterError(field, e.what());
    }
}

LtcInsurance parse_ltc_insurance(const json& j, const std::string& prefix) {
    LtcInsurance policy;
    if (j.contains("type")) {
        policy.type = parse_enum(text(j, "type", "", prefix), join(prefix, "type"),
                                 ltc_insurance_type_from_string);
    }
    policy.daily_benefit = number(j, "daily_benefit", policy.daily_benefit, prefix);
    policy.benefit_period_years = number(j, "benefit_period_years", policy.benefit_period_years, prefix);
    policy.elimination_days = number(j, "elimination_days", policy.elimination_days, prefix);
    policy.inflation_rider = boolean(j, "inflation_rider", policy.inflation_rider, prefix);
    policy.rider_rate = number(j, "rider_rate", policy.rider_rate, prefix);
    policy.annual_premium = number(j, "annual_premium", policy.annual_premium, prefix);
    policy.hybrid_benefit_fraction = number(j, "hybrid_benefit_fraction", policy.hybrid_benefit_fraction, prefix);
    return policy;
}

PersonParams parse_person(const json& j, const std::string& prefix) {
    PersonParams person;
    person.current_age = integer(j, "current_age", person.current_age, prefix);
    person.retirement_age = integer(j, "retirement_age", person.retirement_age, prefix);
    person.life_expectancy = number(j, "life_expectancy", person.life_expectancy, prefix);
    person.birth_year = integer(j, "birth_year", person.birth_year, prefix);
    if (j.contains("gender")) {
        person.gender = parse_enum(text(j, "gender", "", prefix), join(prefix, "gender"),
                                   gender_from_string);
    }
    if (j.contains("health")) {
        person.health = parse_enum(text(j, "health", "", prefix), join(prefix, "health"),
                                   health_status_from_string);
    }

    if (const json* ss = child(j, "social_security", prefix)) {
        std::string p = join(prefix, "social_security");
        person.social_security_pia = number(*ss, "pia", person.social_security_pia, p);
        person.social_security_claim_age = number(*ss, "claim_age", person.social_security_claim_age, p);
    }
    if (const json* pension = child(j, "pension", prefix)) {
        std::string p = join(prefix, "pension");
        person.pension_annual = number(*pension, "annual", person.pension_annual, p);
        person.pension_survivor_fraction = number(*pension, "survivor_fraction",
                                                  person.pension_survivor_fraction, p);
    }
    person.employment_income = number(j, "employment_income", person.employment_income, prefix);
    if (const json* part_time = child(j, "part_time", prefix)) {
        std::string p = join(prefix, "part_time");
        person.part_time_income = number(*part_time, "income", person.part_time_income, p);
        person.part_time_end_age = number(*part_time, "end_age", person.part_time_end_age, p);
    }
    if (const json* policy = child(j, "ltc_insurance", prefix)) {
        person.ltc_insurance = parse_ltc_insurance(*policy, join(prefix, "ltc_insurance"));
    }
    return person;
}

AssetClassAssumption parse_asset_class(const json& j, const std::string& key,
                                       const AssetClassAssumption& fallback, const std::string& prefix) {
    AssetClassAssumption result = fallback;
    if (const json* a = child(j, key, prefix)) {
        std::string p = join(prefix, key);
        result.cagr = number(*a, "cagr", result.cagr, p);
        result.volatility = number(*a, "volatility", result.volatility, p);
    }
    return result;
}

ReturnModel parse_returns(const json& j) {
    const std::string prefix = "returns";
    ReturnModel model;
    model.stocks = parse_asset_class(j, "stocks", model.stocks, prefix);
    model.bonds = parse_asset_class(j, "bonds", model.bonds, prefix);
    model.cash = parse_asset_class(j, "cash", model.cash, prefix);
    if (const json* alloc = child(j, "allocation", prefix)) {
        std::string p = join(prefix, "allocation");
        model.stock_allocation = number(*alloc, "stocks", model.stock_allocation, p);
        model.bond_allocation = number(*alloc, "bonds", model.bond_allocation, p);
        model.cash_allocation = number(*alloc, "cash", model.cash_allocation, p);
    }
    if (const json* corr = child(j, "correlations", prefix)) {
        std::string p = join(prefix, "correlations");
        model.corr_stock_bond = number(*corr, "stock_bond", model.corr_stock_bond, p);
        model.corr_stock_cash = number(*corr, "stock_cash", model.corr_stock_cash, p);
        model.corr_bond_cash = number(*corr, "bond_cash", model.corr_bond_cash, p);
    }
    model.return_floor = number(j, "return_floor", model.return_floor, prefix);
    return model;
}

LtcConfig parse_ltc(const json* j, const std::string& state) {
    LtcConfig config;
    config.regional_factor = LtcConfig::regional_factor_for(state);
    if (j == nullptr) {
        return config;
    }
    const std::string prefix = "ltc";
    config.enabled = boolean(*j, "enabled", config.enabled, prefix);
    config.lifetime_probability = number(*j, "lifetime_probability", config.lifetime_probability, prefix);
    config.onset_min_age = number(*j, "onset_min_age", config.onset_min_age, prefix);
    config.onset_max_age = number(*j, "onset_max_age", config.onset_max_age, prefix);
    config.female_avg_duration = number(*j, "female_avg_duration", config.female_avg_duration, prefix);
    config.male_avg_duration = number(*j, "male_avg_duration", config.male_avg_duration, prefix);
    config.min_duration = number(*j, "min_duration", config.min_duration, prefix);
    config.annual_cost = number(*j, "annual_cost", config.annual_cost, prefix);
    config.inflation = number(*j, "inflation", config.inflation, prefix);
    config.regional_factor = number(*j, "regional_factor", config.regional_factor, prefix);
    return config;
}

GuardrailConfig parse_guardrails(const json& j) {
    const std::string prefix = "guardrails";
    GuardrailConfig config;
    config.enabled = boolean(j, "enabled", config.enabled, prefix);
    config.lower_guardrail = number(j, "lower_guardrail", config.lower_guardrail, prefix);
    config.upper_guardrail = number(j, "upper_guardrail", config.upper_guardrail, prefix);
    config.spending_cut = number(j, "spending_cut", config.spending_cut, prefix);
    config.spending_raise = number(j, "spending_raise", config.spending_raise, prefix);
    return config;
}

ScenarioParams params_from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidParameterError("params", "expected a JSON object");
    }
    const json* primary = child(j, "primary", "");
    if (primary == nullptr) {
        throw InvalidParameterError("primary", "missing required field");
    }

    ScenarioParams defaults;
    ScenarioParamsBuilder builder;
    builder.primary(parse_person(*primary, "primary"));

    const json* spouse = child(j, "spouse", "");
    if (spouse != nullptr) {
        builder.spouse(parse_person(*spouse, "spouse"));
    }

    if (const json* a = child(j, "assets", "")) {
        double capital_gains = number(*a, "capital_gains", 0.0, "assets");
        builder.assets(number(*a, "tax_deferred", 0.0, "assets"),
                       number(*a, "tax_free", 0.0, "assets"),
                       capital_gains,
                       number(*a, "cash", 0.0, "assets"),
                       number(*a, "capital_gains_basis", capital_gains, "assets"));
    }

    ContributionSplit split;
    if (const json* s = child(j, "contribution_split", "")) {
        split.tax_deferred = number(*s, "tax_deferred", split.tax_deferred, "contribution_split");
        split.tax_free = number(*s, "tax_free", split.tax_free, "contribution_split");
        split.capital_gains = number(*s, "capital_gains", split.capital_gains, "contribution_split");
        split.cash = number(*s, "cash", split.cash, "contribution_split");
    }
    builder.annual_savings(number(j, "annual_savings", defaults.annual_savings, ""), split);

    if (const json* e = child(j, "expenses", "")) {
        builder.expenses(number(*e, "annual", defaults.annual_expenses, "expenses"),
                         number(*e, "healthcare", defaults.healthcare_expenses, "expenses"));
    }
    if (const json* i = child(j, "inflation", "")) {
        builder.inflation(number(*i, "general", defaults.general_inflation, "inflation"),
                          number(*i, "healthcare", defaults.healthcare_inflation, "inflation"));
    }
    if (const json* c = child(j, "cola", "")) {
        builder.cola(number(*c, "social_security", defaults.social_security_cola, "cola"),
                     number(*c, "pension", defaults.pension_cola, "cola"));
    }
    builder.discount_rate(number(j, "discount_rate", defaults.discount_rate, ""));

    if (const json* r = child(j, "returns", "")) {
        builder.returns(parse_returns(*r));
    }

    FilingStatus status = spouse != nullptr ? FilingStatus::MarriedJoint : FilingStatus::Single;
    if (j.contains("filing_status")) {
        status = parse_enum(text(j, "filing_status", "", ""), "filing_status", filing_status_from_string);
    }
    builder.filing_status(status);

    std::string state = text(j, "state", defaults.state, "");
    builder.state(state);
    builder.ltc(parse_ltc(child(j, "ltc", ""), state));

    if (const json* g = child(j, "guardrails", "")) {
        builder.guardrails(parse_guardrails(*g));
    }
    builder.legacy_goal(number(j, "legacy_goal", defaults.legacy_goal, ""));
    builder.start_year(integer(j, "start_year", defaults.start_year, ""));

    return builder.build();
}

} // anonymous namespace

ScenarioParams read_scenario_params_json(std::istream& is) {
    json j;
    try {
        j = json::parse(is);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
    }
    return params_from_json(j);
}

ScenarioParams read_scenario_params_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return read_scenario_params_json(file);
}

} // namespace io
} // namespace retirecalc
