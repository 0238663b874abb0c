#ifndef RETIRECALC_IO_PARAMS_READER_HPP
#define RETIRECALC_IO_PARAMS_READER_HPP

#include "../scenario_params.hpp"
#include <istream>
#include <string>

namespace retirecalc {
namespace io {

/**
 * Read a household scenario from JSON and validate it through ScenarioParamsBuilder.
 *
 * Layout (every field except "primary" is optional and keeps its default):
 *   {
 *     "primary": { "current_age", "retirement_age", "life_expectancy", "birth_year",
 *                  "gender", "health",
 *                  "social_security": { "pia", "claim_age" },
 *                  "pension": { "annual", "survivor_fraction" },
 *                  "employment_income",
 *                  "part_time": { "income", "end_age" },
 *                  "ltc_insurance": { "type", "daily_benefit", "benefit_period_years",
 *                                     "elimination_days", "inflation_rider", "rider_rate",
 *                                     "annual_premium", "hybrid_benefit_fraction" } },
 *     "spouse": { same as primary },
 *     "assets": { "tax_deferred", "tax_free", "capital_gains", "cash", "capital_gains_basis" },
 *     "annual_savings", "contribution_split": { "tax_deferred", "tax_free", "capital_gains", "cash" },
 *     "expenses": { "annual", "healthcare" },
 *     "inflation": { "general", "healthcare" },
 *     "cola": { "social_security", "pension" },
 *     "discount_rate",
 *     "returns": { "stocks": { "cagr", "volatility" }, "bonds": {...}, "cash": {...},
 *                  "allocation": { "stocks", "bonds", "cash" },
 *                  "correlations": { "stock_bond", "stock_cash", "bond_cash" },
 *                  "return_floor" },
 *     "filing_status", "state",
 *     "ltc": { "enabled", "lifetime_probability", "onset_min_age", "onset_max_age",
 *              "female_avg_duration", "male_avg_duration", "min_duration",
 *              "annual_cost", "inflation", "regional_factor" },
 *     "guardrails": { "enabled", "lower_guardrail", "upper_guardrail",
 *                     "spending_cut", "spending_raise" },
 *     "legacy_goal", "start_year"
 *   }
 *
 * Filing status defaults to married_joint with a spouse and single without.
 * The LTC regional factor defaults to the state's factor.
 *
 * @throws InvalidParameterError for a missing, mistyped or out-of-range field
 * @throws std::runtime_error if the file cannot be read or is not valid JSON
 */
ScenarioParams read_scenario_params_json(std::istream& is);
ScenarioParams read_scenario_params_json(const std::string& filepath);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_PARAMS_READER_HPP
