#ifndef RETIRECALC_LTC_OVERLAY_HPP
#define RETIRECALC_LTC_OVERLAY_HPP

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace retirecalc {

enum class Gender : uint8_t {
    Male = 0,
    Female = 1
};

enum class HealthStatus : uint8_t {
    Excellent = 0,
    Good = 1,
    Fair = 2,
    Poor = 3
};

enum class LtcInsuranceType : uint8_t {
    None = 0,
    Traditional = 1,    // Pays daily benefit after the elimination period
    Hybrid = 2          // Life/LTC hybrid: partial daily benefit
};

enum class CareSetting : uint8_t {
    HomeCare = 0,
    AssistedLiving = 1,
    NursingHome = 2,
    MemoryCare = 3
};

Gender gender_from_string(const std::string& value);
HealthStatus health_status_from_string(const std::string& value);
LtcInsuranceType ltc_insurance_type_from_string(const std::string& value);
std::string care_setting_to_string(CareSetting setting);

struct LtcInsurance {
    LtcInsuranceType type;
    double daily_benefit;
    double benefit_period_years;
    double elimination_days;
    bool inflation_rider;          // Compound benefit growth at rider_rate
    double rider_rate;
    double annual_premium;         // Paid until a claim starts or age 85
    double hybrid_benefit_fraction;

    LtcInsurance();
};

// One person exposed to LTC risk
struct LtcPerson {
    int current_age;
    double life_expectancy;
    Gender gender;
    HealthStatus health;
    LtcInsurance insurance;

    LtcPerson();
};

struct LtcConfig {
    static constexpr double BASE_ANNUAL_COST = 75504.0;
    static constexpr double PREMIUM_END_AGE = 85.0;
    static constexpr double MAX_PROBABILITY = 0.95;

    bool enabled;
    double lifetime_probability;   // Before the health multiplier
    double onset_min_age;
    double onset_max_age;
    double female_avg_duration;
    double male_avg_duration;
    double min_duration;
    double annual_cost;            // National cost in today's dollars
    double inflation;              // LTC cost inflation
    double regional_factor;

    LtcConfig();

    // Cost factor relative to the national average; 1.0 for unknown states
    static double regional_factor_for(const std::string& state);
    static double health_multiplier(HealthStatus health);
    static double care_cost_multiplier(CareSetting setting);
};

// One person's care event, drawn once per scenario
struct LtcEvent {
    bool occurs;
    double onset_age;
    double duration_years;
    CareSetting setting;
    double annual_cost;            // Today's dollars, regional and setting adjusted

    LtcEvent();
    double end_age() const { return onset_age + duration_years; }
};

struct LtcYearCost {
    double gross;
    double insurance_offset;
    double premiums;

    LtcYearCost();
    double net() const { return gross - insurance_offset + premiums; }
};

// LtcPlan: the drawn events for a household, queried year by year
class LtcPlan {
public:
    LtcPlan();
    LtcPlan(LtcConfig config, std::vector<LtcPerson> persons, std::vector<LtcEvent> events);

    // Household cost for the simulated year starting years_from_start after the scenario start
    LtcYearCost cost_at(int years_from_start) const;

    const std::vector<LtcEvent>& events() const { return events_; }
    bool any_event() const;

private:
    LtcConfig config_;
    std::vector<LtcPerson> persons_;
    std::vector<LtcEvent> events_;
};

// LtcOverlay: draws each person's care event at scenario start
class LtcOverlay {
public:
    LtcOverlay(const LtcConfig& config, std::vector<LtcPerson> persons);

    LtcPlan draw(std::mt19937_64& rng) const;

    const LtcConfig& config() const { return config_; }
    const std::vector<LtcPerson>& persons() const { return persons_; }

private:
    LtcConfig config_;
    std::vector<LtcPerson> persons_;
};

} // namespace retirecalc

#endif // RETIRECALC_LTC_OVERLAY_HPP
