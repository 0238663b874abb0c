#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <sstream>
#include "io/csv_reader.hpp"
#include "io/json_writer.hpp"
#include "io/params_reader.hpp"
#include "io/parquet_writer.hpp"

using namespace retirecalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

ScenarioParams read_params(const std::string& text) {
    std::istringstream is(text);
    return io::read_scenario_params_json(is);
}

// Field named by the reader's error, or "" when the input is accepted
std::string rejected_field(const std::string& text) {
    try {
        read_params(text);
    } catch (const InvalidParameterError& e) {
        return e.field();
    }
    return "";
}

const char* COUPLE_JSON = R"({
    "primary": {
        "current_age": 58, "retirement_age": 63, "life_expectancy": 92,
        "birth_year": 1967, "gender": "female", "health": "excellent",
        "social_security": { "pia": 2600, "claim_age": 68 },
        "pension": { "annual": 12000, "survivor_fraction": 0.5 },
        "part_time": { "income": 20000, "end_age": 70 },
        "ltc_insurance": { "type": "traditional", "daily_benefit": 180, "annual_premium": 2400 }
    },
    "spouse": { "current_age": 60, "retirement_age": 63, "life_expectancy": 88 },
    "assets": { "tax_deferred": 600000, "tax_free": 150000, "capital_gains": 200000, "cash": 40000 },
    "annual_savings": 30000,
    "expenses": { "annual": 90000, "healthcare": 12000 },
    "inflation": { "general": 0.03 },
    "returns": {
        "stocks": { "cagr": 0.09, "volatility": 0.17 },
        "allocation": { "stocks": 0.5, "bonds": 0.45, "cash": 0.05 }
    },
    "state": "ny",
    "guardrails": { "spending_cut": 0.05 },
    "legacy_goal": 250000
})";

EnsembleResult small_result() {
    EnsembleResult result;
    result.requested_scenarios = 3;
    result.completed_scenarios = 3;
    result.success_probability = 66.666667;
    result.raw_success_probability = 66.666667;
    result.ending_percentiles = {0.0, 100.0, 200.0, 300.0, 400.0};
    result.ending_balances = {0.0, 200.0, 400.0};
    result.median_scenario_index = 1;
    result.risk.danger_zones.push_back({85, 0.33});

    PercentileBand band = {0, 65, 10.0, 20.0, 30.0, 40.0, 50.0};
    result.bands.push_back(band);

    YearState year;
    year.age = 65;
    year.total_assets = 1000.0;
    result.median_trajectory.push_back(year);
    result.execution_time_ms = 12.5;
    return result;
}

} // anonymous namespace

// ============================================================================
// Scenario params reader
// ============================================================================

TEST_CASE("Params reader fills a couple's scenario", "[io][params]") {
    ScenarioParams params = read_params(COUPLE_JSON);

    REQUIRE(params.has_spouse);
    REQUIRE(params.filing_status == FilingStatus::MarriedJoint);
    REQUIRE(params.primary.gender == Gender::Female);
    REQUIRE(params.primary.health == HealthStatus::Excellent);
    REQUIRE(params.primary.social_security_claim_age == 68.0);
    REQUIRE(params.primary.pension_survivor_fraction == 0.5);
    REQUIRE(params.primary.part_time_end_age == 70.0);
    REQUIRE(params.primary.ltc_insurance.type == LtcInsuranceType::Traditional);
    REQUIRE(params.primary.ltc_insurance.daily_benefit == 180.0);
    REQUIRE(params.spouse.current_age == 60);

    REQUIRE(params.initial_assets.total() == 990000.0);
    // Basis defaults to the taxable balance
    REQUIRE(params.initial_assets.capital_gains_basis() == 200000.0);
    REQUIRE(params.annual_expenses == 90000.0);
    REQUIRE(params.general_inflation == 0.03);
    REQUIRE(params.healthcare_inflation == ScenarioParams().healthcare_inflation);
    REQUIRE(params.returns.stocks.cagr == 0.09);
    REQUIRE(params.returns.bonds.cagr == ReturnModel().bonds.cagr);
    REQUIRE(params.state == "NY");
    REQUIRE(params.ltc.regional_factor == LtcConfig::regional_factor_for("NY"));
    REQUIRE(params.guardrails.spending_cut == 0.05);
    REQUIRE(params.guardrails.spending_raise == GuardrailConfig().spending_raise);
    REQUIRE(params.legacy_goal == 250000.0);
}

TEST_CASE("Minimal params use defaults", "[io][params]") {
    ScenarioParams params = read_params(R"({"primary": {"current_age": 40, "retirement_age": 60}})");
    REQUIRE_FALSE(params.has_spouse);
    REQUIRE(params.filing_status == FilingStatus::Single);
    REQUIRE(params.initial_assets.total() == 0.0);
    REQUIRE(params.ltc.regional_factor == 1.0);
    REQUIRE(params.start_year == ScenarioParams::DEFAULT_START_YEAR);
}

TEST_CASE("Explicit filing status overrides the default", "[io][params]") {
    ScenarioParams params = read_params(R"({"primary": {}, "filing_status": "head_of_household"})");
    REQUIRE(params.filing_status == FilingStatus::HeadOfHousehold);
}

TEST_CASE("Params reader names the offending field", "[io][params][edge-case]") {
    REQUIRE(rejected_field(R"({})") == "primary");
    REQUIRE(rejected_field(R"({"primary": 5})") == "primary");
    REQUIRE(rejected_field(R"({"primary": {"current_age": "old"}})") == "primary.current_age");
    REQUIRE(rejected_field(R"({"primary": {"current_age": 60.5}})") == "primary.current_age");
    REQUIRE(rejected_field(R"({"primary": {"gender": "other"}})") == "primary.gender");
    REQUIRE(rejected_field(R"({"primary": {"social_security": {"claim_age": 75}}})") ==
            "primary.social_security_claim_age");
    REQUIRE(rejected_field(R"({"primary": {}, "assets": {"cash": -5}})") == "assets.cash");
    REQUIRE(rejected_field(R"({"primary": {}, "returns": {"stocks": {"cagr": "high"}}})") == "returns.stocks.cagr");
    REQUIRE(rejected_field(R"({"primary": {}, "ltc": {"enabled": 1}})") == "ltc.enabled");
    REQUIRE(rejected_field(R"({"primary": {}, "filing_status": "married_joint"})") == "filing_status");
    REQUIRE(rejected_field(R"({"primary": {"retirement_age": 40}})") == "primary.retirement_age");
}

TEST_CASE("Params reader rejects integers that do not fit an int", "[io][params][edge-case]") {
    // 2^32 + 66 would wrap to 66 if narrowed
    REQUIRE(rejected_field(R"({"primary": {"current_age": 4294967362}})") == "primary.current_age");
    REQUIRE(rejected_field(R"({"primary": {"retirement_age": -4294967230}})") == "primary.retirement_age");
    REQUIRE(rejected_field(R"({"primary": {}, "start_year": 18446744073709551615})") == "start_year");
    REQUIRE_THROWS_WITH(read_params(R"({"primary": {"birth_year": 3000000000}})"),
                        Catch::Matchers::ContainsSubstring("primary.birth_year: integer out of range"));
}

TEST_CASE("Params reader reports unreadable input", "[io][params][edge-case]") {
    REQUIRE_THROWS_AS(read_params("{ not json"), std::runtime_error);
    REQUIRE_THROWS_WITH(read_params("{ not json"), Catch::Matchers::ContainsSubstring("JSON parse error"));
    REQUIRE_THROWS_WITH(io::read_scenario_params_json(std::string("/nonexistent/params.json")),
                        Catch::Matchers::ContainsSubstring("Cannot open file"));
}

// ============================================================================
// CSV reader
// ============================================================================

TEST_CASE("CSV reader trims cells and skips comments", "[io][csv]") {
    std::istringstream is("# state rules\nCA, 0.06 ,false\n\n\"Name, with comma\",1\n");
    CsvReader reader(is);

    REQUIRE(reader.has_more());
    std::vector<std::string> first = reader.read_row();
    REQUIRE(first.size() == 3);
    REQUIRE(first[0] == "CA");
    REQUIRE(first[1] == "0.06");

    REQUIRE(reader.has_more());
    std::vector<std::string> second = reader.read_row();
    REQUIRE(second.size() == 2);
    REQUIRE(second[0] == "Name, with comma");
    REQUIRE_FALSE(reader.has_more());
    REQUIRE(reader.read_row().empty());
}

// ============================================================================
// JSON writer
// ============================================================================

TEST_CASE("JSON output parses and carries the statistics", "[io][json]") {
    std::ostringstream os;
    io::write_ensemble_result_json(os, small_result());

    json j = json::parse(os.str());
    REQUIRE_THAT(j["statistics"]["success_probability"].get<double>(), WithinAbs(66.666667, 1e-6));
    REQUIRE(j["statistics"]["percentiles"]["p50"].get<double>() == 200.0);
    REQUIRE(j["risk_metrics"]["danger_zones"].size() == 1);
    REQUIRE(j["risk_metrics"]["danger_zones"][0]["age"].get<int>() == 85);
    REQUIRE(j["percentile_bands"].size() == 1);
    REQUIRE(j["median_scenario_index"].get<int>() == 1);
    REQUIRE(j["median_trajectory"][0]["total_assets"].get<double>() == 1000.0);
    REQUIRE(j["median_trajectory"][0]["guardrail"].get<std::string>() == "normal");
    REQUIRE(j["execution"]["completed_scenarios"].get<int>() == 3);
    REQUIRE_THAT(j["execution"]["execution_time_ms"].get<double>(), WithinAbs(12.5, 1e-9));
    REQUIRE(j["ending_balances"].size() == 3);
    REQUIRE_FALSE(j.contains("ltc_impact"));
    REQUIRE_FALSE(j.contains("claiming_sensitivity"));
}

TEST_CASE("JSON output includes computed sub-analyses", "[io][json]") {
    EnsembleResult result = small_result();
    result.ltc_impact.computed = true;
    result.ltc_impact.success_delta = 4.5;
    result.claiming_sensitivity.push_back({62, 1400.0, 300000.0, 71.0});
    result.claiming_sensitivity.push_back({70, 2480.0, 350000.0, 78.0});

    std::ostringstream compact;
    io::write_ensemble_result_json(compact, result, false);
    REQUIRE(compact.str().find('\n') == std::string::npos);

    json j = json::parse(compact.str());
    REQUIRE(j["ltc_impact"]["success_delta"].get<double>() == 4.5);
    REQUIRE(j["claiming_sensitivity"].size() == 2);
    REQUIRE(j["claiming_sensitivity"][1]["claim_age"].get<int>() == 70);
}

TEST_CASE("JSON writer reports unwritable paths", "[io][json][edge-case]") {
    REQUIRE_THROWS_AS(io::write_ensemble_result_json(std::string("/nonexistent/dir/out.json"), small_result()),
                      std::runtime_error);
}

// ============================================================================
// Parquet writer
// ============================================================================

TEST_CASE("Parquet export requires retained trajectories", "[io][parquet]") {
    REQUIRE_THROWS_AS(io::write_trajectories_parquet(small_result(), "trajectories.parquet"),
                      std::runtime_error);
}

#ifdef HAVE_ARROW

TEST_CASE("Parquet export writes one row per scenario year", "[io][parquet]") {
    EnsembleResult result = small_result();
    ScenarioOutcome outcome;
    outcome.scenario_index = 0;
    outcome.years.resize(3);
    result.outcomes.push_back(outcome);

    std::string path = "test_trajectories.parquet";
    if (std::filesystem::exists(path)) {
        std::filesystem::remove(path);
    }
    REQUIRE_NOTHROW(io::write_trajectories_parquet(result, path));
    REQUIRE(std::filesystem::exists(path));
    std::filesystem::remove(path);
}

#else

TEST_CASE("Parquet export names the missing dependency", "[io][parquet]") {
    EnsembleResult result = small_result();
    result.outcomes.push_back(ScenarioOutcome());
    REQUIRE_THROWS_WITH(io::write_trajectories_parquet(result, "trajectories.parquet"),
                        Catch::Matchers::ContainsSubstring("Apache Arrow not available"));
}

#endif // HAVE_ARROW
