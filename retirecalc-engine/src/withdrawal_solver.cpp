#include "withdrawal_solver.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace retirecalc {

GuaranteedIncome::GuaranteedIncome()
    : social_security(0.0), pension(0.0), earned(0.0) {}

WithdrawalRequest::WithdrawalRequest()
    : net_need(0.0), age(65), seniors(0), filing_status(FilingStatus::Single),
      state(""), year(2025), rmd_start_age(RmdTable::DEFAULT_START_AGE) {}

WithdrawalResult::WithdrawalResult()
    : gross_withdrawal(0.0), rmd_required(0.0), rmd_withdrawn(0.0),
      net_available(0.0), surplus_reinvested(0.0), shortfall(0.0) {}

namespace {

// Quantities that are linear in the draw between Social Security tier edges
struct TaxDrivers {
    double ordinary_gross;    // Ordinary income plus taxable Social Security
    double total_gross;       // Ordinary gross plus gains (= AGI)
    double retirement;        // Pension plus distributions (state exemption)
};

// x at which a linear quantity running from q_lo (at x_lo) to q_hi (at x_hi) crosses k
void add_crossing(std::vector<double>& points, double x_lo, double x_hi,
                  double q_lo, double q_hi, double k) {
    if (q_hi == q_lo) {
        return;
    }
    if ((k - q_lo) * (k - q_hi) >= 0.0) {
        return;
    }
    points.push_back(x_lo + (k - q_lo) * (x_hi - x_lo) / (q_hi - q_lo));
}

} // anonymous namespace

// ============================================================================
// WithdrawalSolver Implementation
// ============================================================================

WithdrawalSolver::WithdrawalSolver(const TaxEngine& tax_engine)
    : tax_engine_(tax_engine) {}

double WithdrawalSolver::tax_on(const HouseholdIncome& income, const WithdrawalRequest& request) const {
    return tax_engine_.household_tax(income, request.filing_status, request.year,
                                     request.seniors, request.state).total();
}

HouseholdIncome WithdrawalSolver::with_draw(const HouseholdIncome& base, bool ordinary,
                                            double gain_share, double x) const {
    HouseholdIncome income = base;
    if (ordinary) {
        income.distributions += gain_share * x;
    } else {
        income.capital_gains += gain_share * x;
    }
    return income;
}

std::vector<double> WithdrawalSolver::breakpoints(const HouseholdIncome& base,
                                                  const WithdrawalRequest& request,
                                                  bool ordinary, double gain_share,
                                                  double max_draw) const {
    const FilingTables& tables = tax_engine_.year_config(request.year).for_status(request.filing_status);
    const StateTaxRule& state_rule = tax_engine_.state_table().rule(request.state);
    double deduction = tax_engine_.standard_deduction(request.filing_status, request.year, request.seniors);

    // Social Security tier edges, in provisional income
    std::vector<double> partitions{0.0, max_draw};
    double ss = base.social_security;
    if (ss > 0.0) {
        SocialSecurityThresholds th = TaxEngine::social_security_thresholds(request.filing_status);
        double middle_tier = std::min(0.5 * ss, 0.5 * (th.adjusted - th.base));
        double provisional0 = base.ordinary() + std::max(0.0, base.capital_gains) + 0.5 * ss;
        for (double k : {th.base, th.adjusted, th.base + ss,
                         th.adjusted + (0.85 * ss - middle_tier) / 0.85}) {
            double x = (k - provisional0) / gain_share;
            if (x > 0.0 && x < max_draw) {
                partitions.push_back(x);
            }
        }
    }
    std::sort(partitions.begin(), partitions.end());

    auto drivers_at = [&](double x) {
        HouseholdIncome income = with_draw(base, ordinary, gain_share, x);
        double gains = std::max(0.0, income.capital_gains);
        double tss = tax_engine_.taxable_social_security(income.social_security,
                                                         income.ordinary() + gains,
                                                         request.filing_status);
        TaxDrivers d;
        d.ordinary_gross = income.ordinary() + tss;
        d.total_gross = d.ordinary_gross + gains;
        d.retirement = income.retirement();
        return d;
    };

    std::vector<double> points = partitions;
    for (size_t i = 1; i < partitions.size(); ++i) {
        double lo = partitions[i - 1];
        double hi = partitions[i];
        if (hi <= lo) {
            continue;
        }
        TaxDrivers a = drivers_at(lo);
        TaxDrivers b = drivers_at(hi);

        for (const Bracket& bracket : tables.ordinary) {
            add_crossing(points, lo, hi, a.ordinary_gross, b.ordinary_gross, deduction + bracket.lower);
        }
        for (const Bracket& bracket : tables.capital_gains) {
            // Gains band edges are crossed both by the ordinary floor and by the top of the stack
            add_crossing(points, lo, hi, a.ordinary_gross, b.ordinary_gross, deduction + bracket.lower);
            add_crossing(points, lo, hi, a.total_gross, b.total_gross, deduction + bracket.lower);
        }
        add_crossing(points, lo, hi, a.ordinary_gross, b.ordinary_gross, tables.niit_threshold);
        add_crossing(points, lo, hi, a.total_gross, b.total_gross, tables.niit_threshold);
        if (std::isfinite(state_rule.retirement_exemption)) {
            add_crossing(points, lo, hi, a.retirement, b.retirement, state_rule.retirement_exemption);
        }
    }

    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end(),
                             [](double x, double y) { return std::abs(x - y) < TOLERANCE; }),
                 points.end());
    return points;
}

double WithdrawalSolver::gross_up(const HouseholdIncome& base, const WithdrawalRequest& request,
                                  bool ordinary, double gain_share, double max_draw,
                                  double target_net) const {
    if (target_net <= 0.0 || max_draw <= 0.0) {
        return 0.0;
    }
    if (gain_share <= 0.0) {
        return std::min(target_net, max_draw);
    }

    double base_tax = tax_on(base, request);
    auto net_at = [&](double x) {
        return x - (tax_on(with_draw(base, ordinary, gain_share, x), request) - base_tax);
    };

    // Net proceeds are linear between consecutive breakpoints
    std::vector<double> points = breakpoints(base, request, ordinary, gain_share, max_draw);
    double prev_x = points.front();
    double prev_net = net_at(prev_x);
    for (size_t i = 1; i < points.size(); ++i) {
        double x = points[i];
        double net = net_at(x);
        if (net >= target_net) {
            if (net <= prev_net) {
                return x;
            }
            return prev_x + (target_net - prev_net) * (x - prev_x) / (net - prev_net);
        }
        prev_x = x;
        prev_net = net;
    }
    return max_draw;
}

WithdrawalResult WithdrawalSolver::solve(const WithdrawalRequest& request) const {
    if (request.net_need < 0.0 || !std::isfinite(request.net_need)) {
        throw std::invalid_argument("Net spending need must be finite and non-negative");
    }

    WithdrawalResult result;
    AssetBuckets buckets = request.buckets;

    HouseholdIncome income;
    income.earned = request.income.earned;
    income.pension = request.income.pension;
    income.social_security = request.income.social_security;

    // RMD comes out first regardless of need
    result.rmd_required = RmdTable::required_distribution(buckets.tax_deferred(), request.age,
                                                          request.rmd_start_age);
    result.rmd_withdrawn = buckets.withdraw(BucketType::TaxDeferred, result.rmd_required);
    result.draws.tax_deferred = result.rmd_withdrawn;
    income.distributions = result.rmd_withdrawn;

    double net = request.income.total() + result.rmd_withdrawn - tax_on(income, request);

    if (net >= request.net_need) {
        result.surplus_reinvested = net - request.net_need;
        buckets.deposit(BucketType::Cash, result.surplus_reinvested);
    } else {
        double gap = request.net_need - net;

        double drawn = buckets.withdraw(BucketType::Cash, gap);
        result.draws.cash = drawn;
        gap -= drawn;

        if (gap > TOLERANCE && buckets.capital_gains() > 0.0) {
            double before = tax_on(income, request);
            double share = buckets.gain_ratio();
            double x = gross_up(income, request, false, share, buckets.capital_gains(), gap);
            drawn = buckets.withdraw(BucketType::CapitalGains, x);
            income.capital_gains += share * drawn;
            result.draws.capital_gains = drawn;
            result.draws.realized_gains = share * drawn;
            gap -= drawn - (tax_on(income, request) - before);
        }

        if (gap > TOLERANCE && buckets.tax_deferred() > 0.0) {
            double before = tax_on(income, request);
            double x = gross_up(income, request, true, 1.0, buckets.tax_deferred(), gap);
            drawn = buckets.withdraw(BucketType::TaxDeferred, x);
            income.distributions += drawn;
            result.draws.tax_deferred += drawn;
            gap -= drawn - (tax_on(income, request) - before);
        }

        if (gap > TOLERANCE) {
            drawn = buckets.withdraw(BucketType::TaxFree, gap);
            result.draws.tax_free = drawn;
        }
    }

    result.taxable_income = income;
    result.taxes = tax_engine_.household_tax(income, request.filing_status, request.year,
                                             request.seniors, request.state);
    result.gross_withdrawal = result.draws.total();
    result.net_available = request.income.total() + result.gross_withdrawal -
                           result.taxes.total() - result.surplus_reinvested;

    double unmet = request.net_need - result.net_available;
    result.shortfall = unmet > SHORTFALL_TOLERANCE ? unmet : 0.0;
    result.buckets_after = buckets;
    return result;
}

} // namespace retirecalc
