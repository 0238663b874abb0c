#ifndef RETIRECALC_RISK_METRICS_HPP
#define RETIRECALC_RISK_METRICS_HPP

#include <vector>

namespace retirecalc {

// ============================================================================
// Distribution statistics
// ============================================================================

double calculate_mean(const std::vector<double>& values);

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean);

// Percentile p (0-100) by linear interpolation; values sorted ascending
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Mean of the lowest ceil(n * (100 - p) / 100) values (at least one); sorted ascending.
// calculate_cvar(v, 95) averages the worst 5%.
double calculate_cvar(const std::vector<double>& sorted_values, double p);

// ============================================================================
// Path risk
// ============================================================================

struct DrawdownMetrics {
    double max_drawdown;     // Largest peak-to-trough decline, 0-1
    double ulcer_index;      // Root mean square drawdown, 0-1
    int duration;            // Longest run of years below a prior peak

    DrawdownMetrics();
};

// Drawdowns of a balance trajectory. Years before the first positive peak
// count as no drawdown.
DrawdownMetrics calculate_drawdown_metrics(const std::vector<double>& balances);

// Log utility of ending wealth above a subsistence level, normalized to 0-1
double calculate_utility_adjusted_success(const std::vector<double>& ending_balances,
                                          double initial_wealth,
                                          double subsistence_level = 20000.0);

} // namespace retirecalc

#endif // RETIRECALC_RISK_METRICS_HPP
