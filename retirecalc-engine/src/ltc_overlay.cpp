#include "ltc_overlay.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace retirecalc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Length of the overlap of [a0, a1) and [b0, b1)
double overlap(double a0, double a1, double b0, double b1) {
    return std::max(0.0, std::min(a1, b1) - std::max(a0, b0));
}

// Share of LTC events by care setting
constexpr double CARE_MIX[] = {0.40, 0.35, 0.20, 0.05};

} // anonymous namespace

Gender gender_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "male" || v == "m") return Gender::Male;
    if (v == "female" || v == "f") return Gender::Female;
    throw std::invalid_argument("Unknown gender: " + value);
}

HealthStatus health_status_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "excellent") return HealthStatus::Excellent;
    if (v == "good") return HealthStatus::Good;
    if (v == "fair") return HealthStatus::Fair;
    if (v == "poor") return HealthStatus::Poor;
    throw std::invalid_argument("Unknown health status: " + value);
}

LtcInsuranceType ltc_insurance_type_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "none") return LtcInsuranceType::None;
    if (v == "traditional") return LtcInsuranceType::Traditional;
    if (v == "hybrid") return LtcInsuranceType::Hybrid;
    throw std::invalid_argument("Unknown LTC insurance type: " + value);
}

std::string care_setting_to_string(CareSetting setting) {
    switch (setting) {
        case CareSetting::HomeCare: return "home_care";
        case CareSetting::AssistedLiving: return "assisted_living";
        case CareSetting::NursingHome: return "nursing_home";
        case CareSetting::MemoryCare: return "memory_care";
        default: return "unknown";
    }
}

LtcInsurance::LtcInsurance()
    : type(LtcInsuranceType::None), daily_benefit(0.0), benefit_period_years(3.0),
      elimination_days(90.0), inflation_rider(false), rider_rate(0.03),
      annual_premium(0.0), hybrid_benefit_fraction(0.5) {}

LtcPerson::LtcPerson()
    : current_age(65), life_expectancy(90.0), gender(Gender::Male), health(HealthStatus::Good) {}

LtcConfig::LtcConfig()
    : enabled(true), lifetime_probability(0.48), onset_min_age(75.0), onset_max_age(85.0),
      female_avg_duration(3.7), male_avg_duration(2.2), min_duration(0.25),
      annual_cost(BASE_ANNUAL_COST), inflation(0.035), regional_factor(1.0) {}

double LtcConfig::regional_factor_for(const std::string& state) {
    static const std::map<std::string, double> factors = {
        {"AL", 0.85}, {"AK", 1.45}, {"AZ", 0.95}, {"AR", 0.80}, {"CA", 1.35},
        {"CO", 1.10}, {"CT", 1.30}, {"DE", 1.15}, {"FL", 0.90}, {"GA", 0.85},
        {"HI", 1.40}, {"ID", 0.95}, {"IL", 1.05}, {"IN", 0.90}, {"IA", 0.85},
        {"KS", 0.85}, {"KY", 0.85}, {"LA", 0.80}, {"ME", 1.10}, {"MD", 1.20},
        {"MA", 1.35}, {"MI", 0.95}, {"MN", 1.15}, {"MS", 0.75}, {"MO", 0.85},
        {"MT", 0.95}, {"NE", 0.90}, {"NV", 1.05}, {"NH", 1.20}, {"NJ", 1.25},
        {"NM", 0.90}, {"NY", 1.40}, {"NC", 0.85}, {"ND", 1.00}, {"OH", 0.90},
        {"OK", 0.80}, {"OR", 1.10}, {"PA", 1.00}, {"RI", 1.20}, {"SC", 0.85},
        {"SD", 0.90}, {"TN", 0.85}, {"TX", 0.90}, {"UT", 0.95}, {"VT", 1.15},
        {"VA", 0.95}, {"WA", 1.20}, {"WV", 0.85}, {"WI", 0.95}, {"WY", 1.00}
    };
    std::string code = state;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto it = factors.find(code);
    return it != factors.end() ? it->second : 1.0;
}

double LtcConfig::health_multiplier(HealthStatus health) {
    switch (health) {
        case HealthStatus::Excellent: return 0.5;
        case HealthStatus::Good: return 0.85;
        case HealthStatus::Fair: return 1.3;
        case HealthStatus::Poor: return 2.0;
        default: return 1.0;
    }
}

double LtcConfig::care_cost_multiplier(CareSetting setting) {
    switch (setting) {
        case CareSetting::HomeCare: return 0.6;
        case CareSetting::AssistedLiving: return 0.8;
        case CareSetting::NursingHome: return 1.2;
        case CareSetting::MemoryCare: return 1.4;
        default: return 1.0;
    }
}

LtcEvent::LtcEvent()
    : occurs(false), onset_age(0.0), duration_years(0.0),
      setting(CareSetting::AssistedLiving), annual_cost(0.0) {}

LtcYearCost::LtcYearCost()
    : gross(0.0), insurance_offset(0.0), premiums(0.0) {}

// ============================================================================
// LtcPlan Implementation
// ============================================================================

LtcPlan::LtcPlan() {}

LtcPlan::LtcPlan(LtcConfig config, std::vector<LtcPerson> persons, std::vector<LtcEvent> events)
    : config_(config), persons_(std::move(persons)), events_(std::move(events)) {
    if (persons_.size() != events_.size()) {
        throw std::invalid_argument("LTC plan needs one event per person");
    }
}

bool LtcPlan::any_event() const {
    return std::any_of(events_.begin(), events_.end(),
                       [](const LtcEvent& e) { return e.occurs; });
}

LtcYearCost LtcPlan::cost_at(int years_from_start) const {
    LtcYearCost total;
    if (!config_.enabled || years_from_start < 0) {
        return total;
    }

    double cost_index = std::pow(1.0 + config_.inflation, years_from_start);

    for (size_t i = 0; i < persons_.size(); ++i) {
        const LtcPerson& person = persons_[i];
        const LtcEvent& event = events_[i];
        const LtcInsurance& policy = person.insurance;

        double age = person.current_age + years_from_start;
        if (age >= person.life_expectancy) {
            continue;
        }
        double year_end = std::min(age + 1.0, person.life_expectancy);

        // Premiums until a claim starts or the premium end age
        if (policy.type != LtcInsuranceType::None && age < LtcConfig::PREMIUM_END_AGE &&
            (!event.occurs || age < event.onset_age)) {
            total.premiums += policy.annual_premium;
        }

        if (!event.occurs) {
            continue;
        }
        double care_end = std::min(event.end_age(), person.life_expectancy);
        double in_care = overlap(age, year_end, event.onset_age, care_end);
        if (in_care <= 0.0) {
            continue;
        }

        double gross = event.annual_cost * cost_index * in_care;
        total.gross += gross;

        if (policy.type == LtcInsuranceType::None || policy.daily_benefit <= 0.0) {
            continue;
        }
        double benefit_start = event.onset_age + policy.elimination_days / 365.0;
        double benefit_end = std::min(care_end, benefit_start + policy.benefit_period_years);
        double covered = overlap(age, year_end, benefit_start, benefit_end);
        if (covered <= 0.0) {
            continue;
        }

        double daily = policy.daily_benefit;
        if (policy.type == LtcInsuranceType::Hybrid) {
            daily *= policy.hybrid_benefit_fraction;
        }
        if (policy.inflation_rider) {
            daily *= std::pow(1.0 + policy.rider_rate, years_from_start);
        }
        total.insurance_offset += std::min(gross, daily * 365.0 * covered);
    }
    return total;
}

// ============================================================================
// LtcOverlay Implementation
// ============================================================================

LtcOverlay::LtcOverlay(const LtcConfig& config, std::vector<LtcPerson> persons)
    : config_(config), persons_(std::move(persons)) {
    if (config_.lifetime_probability < 0.0 || config_.lifetime_probability > 1.0) {
        throw std::invalid_argument("LTC lifetime probability must be in [0, 1]");
    }
    if (config_.onset_max_age < config_.onset_min_age) {
        throw std::invalid_argument("LTC onset age range is empty");
    }
    if (config_.annual_cost < 0.0) {
        throw std::invalid_argument("LTC annual cost must be non-negative");
    }
}

LtcPlan LtcOverlay::draw(std::mt19937_64& rng) const {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<LtcEvent> events;
    events.reserve(persons_.size());

    for (const LtcPerson& person : persons_) {
        // Fixed draw count per person keeps the stream aligned across settings
        double u_occurs = uniform(rng);
        double u_onset = uniform(rng);
        double u_duration = uniform(rng);
        double u_setting = uniform(rng);

        LtcEvent event;
        double probability = std::min(config_.lifetime_probability * LtcConfig::health_multiplier(person.health),
                                      LtcConfig::MAX_PROBABILITY);
        double onset_lo = std::max(config_.onset_min_age, static_cast<double>(person.current_age));
        double onset_hi = std::max(config_.onset_max_age, onset_lo);
        event.onset_age = onset_lo + u_onset * (onset_hi - onset_lo);

        double avg = person.gender == Gender::Female ? config_.female_avg_duration : config_.male_avg_duration;
        event.duration_years = std::max(config_.min_duration, avg * (0.5 + u_duration));

        double cumulative = 0.0;
        event.setting = CareSetting::MemoryCare;
        for (size_t s = 0; s < 4; ++s) {
            cumulative += CARE_MIX[s];
            if (u_setting < cumulative) {
                event.setting = static_cast<CareSetting>(s);
                break;
            }
        }
        event.annual_cost = config_.annual_cost * config_.regional_factor *
                            LtcConfig::care_cost_multiplier(event.setting);

        event.occurs = config_.enabled && u_occurs < probability &&
                       event.onset_age < person.life_expectancy;
        events.push_back(event);
    }
    return LtcPlan(config_, persons_, std::move(events));
}

} // namespace retirecalc
