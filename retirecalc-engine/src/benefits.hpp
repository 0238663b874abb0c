#ifndef RETIRECALC_BENEFITS_HPP
#define RETIRECALC_BENEFITS_HPP

#include <array>
#include <optional>
#include <vector>

namespace retirecalc {

// ============================================================================
// Social Security claiming
// ============================================================================

constexpr double EARLIEST_CLAIM_AGE = 62.0;
constexpr double LATEST_CLAIM_AGE = 70.0;
constexpr double MAX_MONTHLY_BENEFIT_2024 = 4873.0;

// Full retirement age by birth year (SSA schedule, 67 for 1960 and later)
double full_retirement_age(int birth_year);

// Monthly benefit when claiming at claim_age (clamped to [62, 70]):
// 5/9% per month reduction for the first 36 months early, 5/12% per month
// beyond that, 2/3% per month credit after FRA. Capped at max_monthly_benefit.
double benefit_at_claim_age(double claim_age, double full_retirement_age, double pia,
                            double max_monthly_benefit = MAX_MONTHLY_BENEFIT_2024);

// Present value at current_age of monthly benefits from claim_age through
// life_expectancy. Benefits are in today's dollars: COLA compounds once per
// year from current_age, discounting is applied per month.
double lifetime_npv(double claim_age, double life_expectancy, double monthly_benefit,
                    double discount_rate, double cola_rate, double current_age);

// Age at which cumulative (undiscounted, COLA-adjusted) benefits from the later
// claim first reach those of the earlier claim. Empty if never reached by max_age.
std::optional<double> break_even_age(double early_claim_age, double late_claim_age,
                                     double full_retirement_age, double pia,
                                     double cola_rate, double max_age = 110.0);

struct ClaimingOption {
    int claim_age;
    double monthly_benefit;
    double npv;
};

// NPV of each whole claiming age 62..70, in claim-age order
std::vector<ClaimingOption> rank_claiming_ages(double pia, double full_retirement_age,
                                               double life_expectancy, double discount_rate,
                                               double cola_rate, double current_age);

// Claim age with the highest NPV
ClaimingOption best_claiming_age(const std::vector<ClaimingOption>& options);

// ============================================================================
// Required minimum distributions
// ============================================================================

// IRS Uniform Lifetime Table divisors, ages 72-120
class RmdTable {
public:
    static constexpr int MIN_AGE = 72;
    static constexpr int MAX_AGE = 120;
    static constexpr int DEFAULT_START_AGE = 73;

    // Divisor for an age, linearly interpolated between whole ages.
    // 0 below 72, the age-120 divisor above 120.
    static double factor(double age);

    // SECURE 2.0: 72 if born before 1951, 73 for 1951-1959, 75 from 1960
    static int start_age(int birth_year);

    // Required withdrawal for the year; 0 before start_age
    static double required_distribution(double prior_year_balance, double age,
                                        int start_age = DEFAULT_START_AGE);

private:
    static const std::array<double, MAX_AGE - MIN_AGE + 1> DIVISORS;
};

} // namespace retirecalc

#endif // RETIRECALC_BENEFITS_HPP
