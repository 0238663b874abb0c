#ifndef RETIRECALC_WITHDRAWAL_SOLVER_HPP
#define RETIRECALC_WITHDRAWAL_SOLVER_HPP

#include "asset_buckets.hpp"
#include "benefits.hpp"
#include "tax_engine.hpp"
#include <string>
#include <vector>

namespace retirecalc {

// Income received outside the portfolio in one year
struct GuaranteedIncome {
    double social_security;
    double pension;
    double earned;    // Salary or part-time earnings

    GuaranteedIncome();
    double total() const { return social_security + pension + earned; }
};

struct WithdrawalRequest {
    double net_need;                // After-tax spending to cover this year
    AssetBuckets buckets;           // Balances at the time of the draw
    GuaranteedIncome income;
    int age;                        // Owner age, drives the RMD
    int seniors;                    // Household members aged 65+ (senior deduction)
    FilingStatus filing_status;
    std::string state;
    int year;
    int rmd_start_age;

    WithdrawalRequest();
};

struct WithdrawalResult {
    double gross_withdrawal;        // Total drawn from buckets, RMD included
    BucketDraws draws;
    double rmd_required;
    double rmd_withdrawn;
    TaxBreakdown taxes;
    double net_available;           // Income plus draws minus tax and reinvested surplus
    double surplus_reinvested;      // Excess RMD proceeds moved to cash
    double shortfall;               // Unmet need (0 when fully funded)
    HouseholdIncome taxable_income; // Income the taxes were computed on
    AssetBuckets buckets_after;

    WithdrawalResult();
};

// WithdrawalSolver: grosses a net spending need up for tax and draws it from
// the buckets in tax-efficiency order (cash, capital gains, tax-deferred, tax-free).
//
// Tax as a function of a bucket draw is piecewise linear. The solver walks
// the draw's breakpoints (bracket edges, deduction, Social Security tiers,
// NIIT threshold, state exemption) and interpolates inside the segment that
// contains the need, so bracket boundaries are hit exactly.
class WithdrawalSolver {
public:
    static constexpr double TOLERANCE = 1e-6;
    static constexpr double SHORTFALL_TOLERANCE = 0.01;

    explicit WithdrawalSolver(const TaxEngine& tax_engine);

    // Never throws for insufficient assets: unmet need is reported as shortfall.
    // Throws std::invalid_argument for a negative need.
    WithdrawalResult solve(const WithdrawalRequest& request) const;

    // Minimal draw x in [0, max_draw] adding target_net after tax on top of base.
    // gain_share is the taxable share of each drawn dollar; ordinary selects
    // whether that share is ordinary income or capital gains.
    double gross_up(const HouseholdIncome& base, const WithdrawalRequest& request,
                    bool ordinary, double gain_share, double max_draw,
                    double target_net) const;

private:
    const TaxEngine& tax_engine_;

    double tax_on(const HouseholdIncome& income, const WithdrawalRequest& request) const;
    HouseholdIncome with_draw(const HouseholdIncome& base, bool ordinary,
                              double gain_share, double x) const;
    std::vector<double> breakpoints(const HouseholdIncome& base, const WithdrawalRequest& request,
                                    bool ordinary, double gain_share, double max_draw) const;
};

} // namespace retirecalc

#endif // RETIRECALC_WITHDRAWAL_SOLVER_HPP
