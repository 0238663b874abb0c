#include "risk_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace retirecalc {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);
    size_t lower = static_cast<size_t>(std::floor(pos));
    size_t upper = static_cast<size_t>(std::ceil(pos));
    if (lower == upper || upper >= sorted_values.size()) {
        return sorted_values[std::min(lower, sorted_values.size() - 1)];
    }

    double frac = pos - static_cast<double>(lower);
    return sorted_values[lower] * (1.0 - frac) + sorted_values[upper] * frac;
}

double calculate_cvar(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    double tail = (100.0 - p) / 100.0;
    size_t count = static_cast<size_t>(std::ceil(sorted_values.size() * tail));
    count = std::min(std::max<size_t>(count, 1), sorted_values.size());

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += sorted_values[i];
    }
    return sum / static_cast<double>(count);
}

DrawdownMetrics::DrawdownMetrics()
    : max_drawdown(0.0), ulcer_index(0.0), duration(0) {}

DrawdownMetrics calculate_drawdown_metrics(const std::vector<double>& balances) {
    DrawdownMetrics metrics;
    if (balances.empty()) {
        return metrics;
    }

    double peak = 0.0;
    double sum_sq = 0.0;
    int run = 0;
    for (double balance : balances) {
        if (balance >= peak) {
            peak = balance;
            run = 0;
            continue;
        }
        // balance < peak implies peak > 0
        double drawdown = std::min(1.0, (peak - balance) / peak);
        metrics.max_drawdown = std::max(metrics.max_drawdown, drawdown);
        sum_sq += drawdown * drawdown;
        ++run;
        metrics.duration = std::max(metrics.duration, run);
    }
    metrics.ulcer_index = std::sqrt(sum_sq / static_cast<double>(balances.size()));
    return metrics;
}

double calculate_utility_adjusted_success(const std::vector<double>& ending_balances,
                                          double initial_wealth,
                                          double subsistence_level) {
    if (ending_balances.empty() || initial_wealth <= 0.0) {
        return 0.0;
    }

    const double min_utility = -10.0;
    double total = 0.0;
    for (double balance : ending_balances) {
        if (balance <= subsistence_level) {
            total += min_utility;
        } else {
            total += std::log(1.0 + (balance - subsistence_level) / initial_wealth);
        }
    }
    double avg = total / static_cast<double>(ending_balances.size());
    double max_utility = std::log(1.0 + 10000000.0 / initial_wealth);
    return std::min(1.0, std::max(0.0, (avg - min_utility) / (max_utility - min_utility)));
}

} // namespace retirecalc
