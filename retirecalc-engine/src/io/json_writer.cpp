#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace retirecalc {
namespace io {

namespace {

// Indentation and separators for one nesting level at a time
struct Layout {
    bool pretty;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty_print)
        : pretty(pretty_print), newline(pretty_print ? "\n" : ""), space(pretty_print ? " " : "") {}

    std::string indent(int depth) const {
        return pretty ? std::string(static_cast<size_t>(depth) * 2, ' ') : "";
    }
};

void write_key(std::ostream& os, const Layout& l, int depth, const char* key) {
    os << l.indent(depth) << "\"" << key << "\":" << l.space;
}

void write_year_state(std::ostream& os, const Layout& l, int depth, const YearState& y) {
    const std::string in = l.indent(depth + 1);
    const std::string& nl = l.newline;
    const std::string& sp = l.space;

    os << l.indent(depth) << "{" << nl;
    os << in << "\"year_index\":" << sp << y.year_index << "," << nl;
    os << in << "\"calendar_year\":" << sp << y.calendar_year << "," << nl;
    os << in << "\"age\":" << sp << y.age << "," << nl;
    os << in << "\"spouse_age\":" << sp << y.spouse_age << "," << nl;
    os << in << "\"retired\":" << sp << (y.retired ? "true" : "false") << "," << nl;
    os << in << "\"tax_deferred\":" << sp << y.tax_deferred << "," << nl;
    os << in << "\"tax_free\":" << sp << y.tax_free << "," << nl;
    os << in << "\"capital_gains\":" << sp << y.capital_gains << "," << nl;
    os << in << "\"cash\":" << sp << y.cash << "," << nl;
    os << in << "\"total_assets\":" << sp << y.total_assets << "," << nl;
    os << in << "\"portfolio_return\":" << sp << y.portfolio_return << "," << nl;
    os << in << "\"regime\":" << sp << "\"" << market_regime_to_string(y.regime) << "\"," << nl;
    os << in << "\"contributions\":" << sp << y.contributions << "," << nl;
    os << in << "\"social_security\":" << sp << y.social_security << "," << nl;
    os << in << "\"pension\":" << sp << y.pension << "," << nl;
    os << in << "\"earned_income\":" << sp << y.earned_income << "," << nl;
    os << in << "\"spending\":" << sp << y.spending << "," << nl;
    os << in << "\"healthcare\":" << sp << y.healthcare << "," << nl;
    os << in << "\"spending_need\":" << sp << y.spending_need << "," << nl;
    os << in << "\"gross_withdrawal\":" << sp << y.gross_withdrawal << "," << nl;
    os << in << "\"rmd\":" << sp << y.rmd << "," << nl;
    os << in << "\"federal_tax\":" << sp << y.federal_tax << "," << nl;
    os << in << "\"state_tax\":" << sp << y.state_tax << "," << nl;
    os << in << "\"irmaa\":" << sp << y.irmaa << "," << nl;
    os << in << "\"ltc_cost\":" << sp << y.ltc_cost << "," << nl;
    os << in << "\"guardrail\":" << sp << "\"" << guardrail_state_to_string(y.guardrail_state) << "\"," << nl;
    os << in << "\"shortfall\":" << sp << y.shortfall << nl;
    os << l.indent(depth) << "}";
}

} // anonymous namespace

void write_ensemble_result_json(std::ostream& os, const EnsembleResult& result,
                                bool pretty_print) {
    const Layout l(pretty_print);
    const std::string& nl = l.newline;
    const std::string& sp = l.space;
    const std::string i1 = l.indent(1);
    const std::string i2 = l.indent(2);
    const std::string i3 = l.indent(3);

    os << std::fixed << std::setprecision(6);

    os << "{" << nl;

    // Statistics section
    write_key(os, l, 1, "statistics");
    os << "{" << nl;
    os << i2 << "\"success_probability\":" << sp << result.success_probability << "," << nl;
    os << i2 << "\"raw_success_probability\":" << sp << result.raw_success_probability << "," << nl;
    os << i2 << "\"control_variate_applied\":" << sp
       << (result.control_variate_applied ? "true" : "false") << "," << nl;
    os << i2 << "\"control_variate_beta\":" << sp << result.control_variate_beta << "," << nl;
    os << i2 << "\"analytic_success_estimate\":" << sp << result.analytic_success_estimate << "," << nl;
    os << i2 << "\"legacy_goal_probability\":" << sp << result.legacy_goal_probability << "," << nl;
    os << i2 << "\"mean_ending_balance\":" << sp << result.mean_ending_balance << "," << nl;
    os << i2 << "\"std_dev_ending_balance\":" << sp << result.std_dev_ending_balance << "," << nl;
    os << i2 << "\"percentiles\":" << sp << "{" << nl;
    os << i3 << "\"p10\":" << sp << result.p10() << "," << nl;
    os << i3 << "\"p25\":" << sp << result.p25() << "," << nl;
    os << i3 << "\"p50\":" << sp << result.p50() << "," << nl;
    os << i3 << "\"p75\":" << sp << result.p75() << "," << nl;
    os << i3 << "\"p90\":" << sp << result.p90() << nl;
    os << i2 << "}," << nl;
    os << i2 << "\"mean_ltc_cost\":" << sp << result.mean_ltc_cost << "," << nl;
    os << i2 << "\"ltc_event_probability\":" << sp << result.ltc_event_probability << nl;
    os << i1 << "}," << nl;

    // Risk metrics
    const RiskMetrics& risk = result.risk;
    write_key(os, l, 1, "risk_metrics");
    os << "{" << nl;
    os << i2 << "\"cvar_95\":" << sp << risk.cvar_95 << "," << nl;
    os << i2 << "\"cvar_99\":" << sp << risk.cvar_99 << "," << nl;
    os << i2 << "\"max_drawdown\":" << sp << risk.max_drawdown << "," << nl;
    os << i2 << "\"ulcer_index\":" << sp << risk.ulcer_index << "," << nl;
    os << i2 << "\"drawdown_duration\":" << sp << risk.drawdown_duration << "," << nl;
    os << i2 << "\"sequence_risk_score\":" << sp << risk.sequence_risk_score << "," << nl;
    os << i2 << "\"utility_adjusted_success\":" << sp << risk.utility_adjusted_success << "," << nl;
    os << i2 << "\"danger_zones\":" << sp << "[";
    for (size_t i = 0; i < risk.danger_zones.size(); ++i) {
        os << (i > 0 ? "," : "") << nl << i3 << "{\"age\":" << sp << risk.danger_zones[i].age
           << "," << sp << "\"depletion_rate\":" << sp << risk.danger_zones[i].depletion_rate << "}";
    }
    if (!risk.danger_zones.empty()) {
        os << nl << i2;
    }
    os << "]" << nl;
    os << i1 << "}," << nl;

    // Percentile bands
    write_key(os, l, 1, "percentile_bands");
    os << "[";
    for (size_t i = 0; i < result.bands.size(); ++i) {
        const PercentileBand& b = result.bands[i];
        os << (i > 0 ? "," : "") << nl << i2
           << "{\"year_index\":" << sp << b.year_index << "," << sp
           << "\"age\":" << sp << b.age << "," << sp
           << "\"p10\":" << sp << b.p10 << "," << sp
           << "\"p25\":" << sp << b.p25 << "," << sp
           << "\"p50\":" << sp << b.p50 << "," << sp
           << "\"p75\":" << sp << b.p75 << "," << sp
           << "\"p90\":" << sp << b.p90 << "}";
    }
    if (!result.bands.empty()) {
        os << nl << i1;
    }
    os << "]," << nl;

    // Median trajectory
    write_key(os, l, 1, "median_scenario_index");
    os << result.median_scenario_index << "," << nl;
    write_key(os, l, 1, "median_trajectory");
    os << "[";
    for (size_t i = 0; i < result.median_trajectory.size(); ++i) {
        os << (i > 0 ? "," : "") << nl;
        write_year_state(os, l, 2, result.median_trajectory[i]);
    }
    if (!result.median_trajectory.empty()) {
        os << nl << i1;
    }
    os << "]," << nl;

    // Sub-analyses
    if (result.ltc_impact.computed) {
        const LtcImpactAnalysis& ltc = result.ltc_impact;
        write_key(os, l, 1, "ltc_impact");
        os << "{" << nl;
        os << i2 << "\"success_with_ltc\":" << sp << ltc.success_with_ltc << "," << nl;
        os << i2 << "\"success_without_ltc\":" << sp << ltc.success_without_ltc << "," << nl;
        os << i2 << "\"success_delta\":" << sp << ltc.success_delta << "," << nl;
        os << i2 << "\"mean_ltc_cost\":" << sp << ltc.mean_ltc_cost << "," << nl;
        os << i2 << "\"ltc_event_probability\":" << sp << ltc.ltc_event_probability << nl;
        os << i1 << "}," << nl;
    }
    if (!result.claiming_sensitivity.empty()) {
        write_key(os, l, 1, "claiming_sensitivity");
        os << "[";
        for (size_t i = 0; i < result.claiming_sensitivity.size(); ++i) {
            const ClaimingAgeResult& c = result.claiming_sensitivity[i];
            os << (i > 0 ? "," : "") << nl << i2
               << "{\"claim_age\":" << sp << c.claim_age << "," << sp
               << "\"monthly_benefit\":" << sp << c.monthly_benefit << "," << sp
               << "\"npv\":" << sp << c.npv << "," << sp
               << "\"success_probability\":" << sp << c.success_probability << "}";
        }
        os << nl << i1 << "]," << nl;
    }

    // Execution metadata
    write_key(os, l, 1, "execution");
    os << "{" << nl;
    os << i2 << "\"requested_scenarios\":" << sp << result.requested_scenarios << "," << nl;
    os << i2 << "\"completed_scenarios\":" << sp << result.completed_scenarios << "," << nl;
    os << i2 << "\"scenarios_failed\":" << sp << result.scenarios_failed << "," << nl;
    os << i2 << "\"execution_time_ms\":" << sp << std::setprecision(2)
       << result.execution_time_ms << nl;
    os << i1 << "}," << nl;

    // Distribution (ending balances)
    os << std::setprecision(2);
    write_key(os, l, 1, "ending_balances");
    os << "[";
    if (!result.ending_balances.empty()) {
        if (pretty_print) {
            os << nl << i2;
        }
        for (size_t i = 0; i < result.ending_balances.size(); ++i) {
            if (i > 0) {
                os << ",";
                if (pretty_print && i % 10 == 0) {
                    os << nl << i2;
                } else {
                    os << sp;
                }
            }
            os << result.ending_balances[i];
        }
        if (pretty_print) {
            os << nl << i1;
        }
    }
    os << "]" << nl;

    os << "}" << nl;
}

void write_ensemble_result_json(const std::string& filepath, const EnsembleResult& result,
                                bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_ensemble_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace retirecalc
