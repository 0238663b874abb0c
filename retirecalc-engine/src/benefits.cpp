#include "benefits.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retirecalc {

// ============================================================================
// Social Security
// ============================================================================

double full_retirement_age(int birth_year) {
    if (birth_year <= 1937) {
        return 65.0;
    }
    if (birth_year <= 1942) {
        return 65.0 + 2.0 * (birth_year - 1937) / 12.0;
    }
    if (birth_year <= 1954) {
        return 66.0;
    }
    if (birth_year <= 1959) {
        return 66.0 + 2.0 * (birth_year - 1954) / 12.0;
    }
    return 67.0;
}

double benefit_at_claim_age(double claim_age, double full_retirement_age, double pia,
                            double max_monthly_benefit) {
    if (pia <= 0.0) {
        return 0.0;
    }

    double age = std::min(std::max(claim_age, EARLIEST_CLAIM_AGE), LATEST_CLAIM_AGE);
    long months = std::lround((age - full_retirement_age) * 12.0);

    double factor = 1.0;
    if (months < 0) {
        long early = -months;
        long first_tier = std::min(early, 36L);
        long second_tier = std::max(early - 36L, 0L);
        factor -= first_tier * (5.0 / 900.0) + second_tier * (5.0 / 1200.0);
    } else if (months > 0) {
        factor += months * (2.0 / 300.0);
    }

    double benefit = pia * factor;
    if (max_monthly_benefit > 0.0) {
        benefit = std::min(benefit, max_monthly_benefit);
    }
    return benefit;
}

double lifetime_npv(double claim_age, double life_expectancy, double monthly_benefit,
                    double discount_rate, double cola_rate, double current_age) {
    if (discount_rate <= -1.0 || cola_rate <= -1.0) {
        throw std::invalid_argument("Discount and COLA rates must exceed -100%");
    }
    if (monthly_benefit <= 0.0) {
        return 0.0;
    }

    double start = std::max(claim_age, current_age);
    long months = std::lround((life_expectancy - start) * 12.0);
    if (months <= 0) {
        return 0.0;
    }

    // Benefits are quoted in today's dollars; COLA indexes from current_age
    double npv = 0.0;
    for (long m = 0; m < months; ++m) {
        double age = start + m / 12.0;
        double cola = std::pow(1.0 + cola_rate, std::floor(age - current_age));
        double discount = std::pow(1.0 + discount_rate, -(age - current_age));
        npv += monthly_benefit * cola * discount;
    }
    return npv;
}

std::optional<double> break_even_age(double early_claim_age, double late_claim_age,
                                     double full_retirement_age, double pia,
                                     double cola_rate, double max_age) {
    if (late_claim_age <= early_claim_age) {
        throw std::invalid_argument("Later claim age must exceed the earlier claim age");
    }

    double early_benefit = benefit_at_claim_age(early_claim_age, full_retirement_age, pia);
    double late_benefit = benefit_at_claim_age(late_claim_age, full_retirement_age, pia);
    if (late_benefit <= early_benefit) {
        return std::nullopt;
    }

    double cum_early = 0.0;
    double cum_late = 0.0;
    long months = std::lround((max_age - early_claim_age) * 12.0);
    for (long m = 0; m < months; ++m) {
        double age = early_claim_age + m / 12.0;
        double cola = std::pow(1.0 + cola_rate, std::floor(age - early_claim_age));
        cum_early += early_benefit * cola;
        if (age + 1e-9 >= late_claim_age) {
            cum_late += late_benefit * cola;
            if (cum_late >= cum_early) {
                return age + 1.0 / 12.0;
            }
        }
    }
    return std::nullopt;
}

std::vector<ClaimingOption> rank_claiming_ages(double pia, double full_retirement_age,
                                               double life_expectancy, double discount_rate,
                                               double cola_rate, double current_age) {
    std::vector<ClaimingOption> options;
    for (int age = static_cast<int>(EARLIEST_CLAIM_AGE); age <= static_cast<int>(LATEST_CLAIM_AGE); ++age) {
        ClaimingOption option;
        option.claim_age = age;
        option.monthly_benefit = benefit_at_claim_age(age, full_retirement_age, pia);
        option.npv = lifetime_npv(age, life_expectancy, option.monthly_benefit,
                                  discount_rate, cola_rate, current_age);
        options.push_back(option);
    }
    return options;
}

ClaimingOption best_claiming_age(const std::vector<ClaimingOption>& options) {
    if (options.empty()) {
        throw std::invalid_argument("No claiming options to rank");
    }
    return *std::max_element(options.begin(), options.end(),
        [](const ClaimingOption& a, const ClaimingOption& b) { return a.npv < b.npv; });
}

// ============================================================================
// RmdTable
// ============================================================================

const std::array<double, RmdTable::MAX_AGE - RmdTable::MIN_AGE + 1> RmdTable::DIVISORS = {
    27.4, 26.5, 25.5, 24.6, 23.7, 22.9, 22.0, 21.1, 20.2, 19.4,   // 72-81
    18.5, 17.7, 16.8, 16.0, 15.2, 14.4, 13.7, 12.9, 12.2, 11.5,   // 82-91
    10.8, 10.1,  9.5,  8.9,  8.4,  7.8,  7.3,  6.8,  6.4,  6.0,   // 92-101
     5.6,  5.2,  4.9,  4.6,  4.3,  4.1,  3.9,  3.7,  3.5,  3.4,   // 102-111
     3.3,  3.1,  3.0,  2.9,  2.8,  2.7,  2.5,  2.3,  2.0          // 112-120
};

double RmdTable::factor(double age) {
    if (age < MIN_AGE) {
        return 0.0;
    }
    if (age >= MAX_AGE) {
        return DIVISORS.back();
    }
    double offset = age - MIN_AGE;
    size_t lower = static_cast<size_t>(std::floor(offset));
    double frac = offset - static_cast<double>(lower);
    if (frac == 0.0) {
        return DIVISORS[lower];
    }
    return DIVISORS[lower] * (1.0 - frac) + DIVISORS[lower + 1] * frac;
}

int RmdTable::start_age(int birth_year) {
    if (birth_year < 1951) {
        return 72;
    }
    if (birth_year < 1960) {
        return 73;
    }
    return 75;
}

double RmdTable::required_distribution(double prior_year_balance, double age, int start_age) {
    if (prior_year_balance <= 0.0 || age < start_age) {
        return 0.0;
    }
    double divisor = factor(age);
    if (divisor <= 0.0) {
        return 0.0;
    }
    return prior_year_balance / divisor;
}

} // namespace retirecalc
