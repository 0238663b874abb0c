#ifndef RETIRECALC_MORTALITY_HPP
#define RETIRECALC_MORTALITY_HPP

#include "ltc_overlay.hpp"
#include <array>
#include <cstddef>
#include <random>

namespace retirecalc {

// MortalityTable: annual probability of death (qx) by age and gender
class MortalityTable {
public:
    static constexpr int MAX_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_AGE + 1;  // 0 to 120 inclusive
    static constexpr size_t NUM_GENDERS = 2;

    MortalityTable();

    void set_qx(int age, Gender gender, double qx);
    double get_qx(int age, Gender gender) const;

    // Adjusted qx, capped at 1.0
    double get_qx(int age, Gender gender, double multiplier) const;

    // SSA 2021 period life table. Ages below 50 carry the age-50 rate.
    static const MortalityTable& ssa_period();

    // Mortality scaling for self-reported health
    static double health_multiplier(HealthStatus health);

private:
    // rates_[gender][age] = qx
    std::array<std::array<double, NUM_AGES>, NUM_GENDERS> rates_;
};

// Draws a lifespan by simulating one survival trial per year of age.
// Death falls mid-year, so the returned age is always n + 0.5 for some
// whole age n in [current_age, MAX_AGE].
double draw_death_age(const MortalityTable& table, int current_age, Gender gender,
                      HealthStatus health, std::mt19937_64& rng);

} // namespace retirecalc

#endif // RETIRECALC_MORTALITY_HPP
