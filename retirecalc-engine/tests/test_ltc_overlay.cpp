#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "ltc_overlay.hpp"

using namespace retirecalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

LtcConfig flat_config() {
    LtcConfig config;
    config.inflation = 0.0;
    return config;
}

LtcPerson make_person(int age, double life_expectancy) {
    LtcPerson person;
    person.current_age = age;
    person.life_expectancy = life_expectancy;
    return person;
}

LtcEvent make_event(double onset, double duration, double annual_cost) {
    LtcEvent event;
    event.occurs = true;
    event.onset_age = onset;
    event.duration_years = duration;
    event.annual_cost = annual_cost;
    return event;
}

LtcInsurance traditional_policy(double daily, double elimination_days) {
    LtcInsurance policy;
    policy.type = LtcInsuranceType::Traditional;
    policy.daily_benefit = daily;
    policy.elimination_days = elimination_days;
    policy.benefit_period_years = 3.0;
    return policy;
}

LtcPlan single_plan(const LtcConfig& config, const LtcPerson& person, const LtcEvent& event) {
    return LtcPlan(config, {person}, {event});
}

} // anonymous namespace

// ============================================================================
// Configuration tables
// ============================================================================

TEST_CASE("Regional factors by state", "[ltc]") {
    REQUIRE(LtcConfig::regional_factor_for("CA") == 1.35);
    REQUIRE(LtcConfig::regional_factor_for("ms") == 0.75);
    REQUIRE(LtcConfig::regional_factor_for("ZZ") == 1.0);
    REQUIRE(LtcConfig::regional_factor_for("") == 1.0);
}

TEST_CASE("Health and care setting multipliers", "[ltc]") {
    REQUIRE(LtcConfig::health_multiplier(HealthStatus::Excellent) == 0.5);
    REQUIRE(LtcConfig::health_multiplier(HealthStatus::Poor) == 2.0);
    REQUIRE(LtcConfig::care_cost_multiplier(CareSetting::HomeCare) == 0.6);
    REQUIRE(LtcConfig::care_cost_multiplier(CareSetting::MemoryCare) == 1.4);
}

TEST_CASE("LTC enum parsing", "[ltc]") {
    REQUIRE(gender_from_string("F") == Gender::Female);
    REQUIRE(health_status_from_string("Fair") == HealthStatus::Fair);
    REQUIRE(ltc_insurance_type_from_string("HYBRID") == LtcInsuranceType::Hybrid);
    REQUIRE(care_setting_to_string(CareSetting::NursingHome) == "nursing_home");
    REQUIRE_THROWS_AS(gender_from_string("x"), std::invalid_argument);
    REQUIRE_THROWS_AS(health_status_from_string("great"), std::invalid_argument);
    REQUIRE_THROWS_AS(ltc_insurance_type_from_string("term"), std::invalid_argument);
}

// ============================================================================
// LtcPlan costs
// ============================================================================

TEST_CASE("Care costs accrue only during the care window", "[ltc][plan]") {
    LtcPlan plan = single_plan(flat_config(), make_person(70, 95.0), make_event(80.0, 2.0, 100000.0));

    REQUIRE(plan.cost_at(9).gross == 0.0);
    REQUIRE_THAT(plan.cost_at(10).gross, WithinAbs(100000.0, 1e-6));
    REQUIRE_THAT(plan.cost_at(11).gross, WithinAbs(100000.0, 1e-6));
    REQUIRE(plan.cost_at(12).gross == 0.0);
    REQUIRE(plan.any_event());
}

TEST_CASE("Partial care years are prorated", "[ltc][plan]") {
    LtcPlan plan = single_plan(flat_config(), make_person(70, 95.0), make_event(80.5, 1.0, 100000.0));

    REQUIRE_THAT(plan.cost_at(10).gross, WithinAbs(50000.0, 1e-6));
    REQUIRE_THAT(plan.cost_at(11).gross, WithinAbs(50000.0, 1e-6));
}

TEST_CASE("Care costs inflate at the LTC rate", "[ltc][plan]") {
    LtcConfig config;
    config.inflation = 0.035;
    LtcPlan plan = single_plan(config, make_person(70, 95.0), make_event(80.0, 2.0, 100000.0));

    REQUIRE_THAT(plan.cost_at(10).gross, WithinRel(100000.0 * std::pow(1.035, 10), 1e-12));
}

TEST_CASE("Care stops at death", "[ltc][plan][edge-case]") {
    LtcPlan plan = single_plan(flat_config(), make_person(70, 81.0), make_event(80.0, 3.0, 100000.0));

    REQUIRE_THAT(plan.cost_at(10).gross, WithinAbs(100000.0, 1e-6));
    REQUIRE(plan.cost_at(11).gross == 0.0);
}

TEST_CASE("Insurance pays after the elimination period", "[ltc][plan][insurance]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(200.0, 0.0);
    LtcPlan immediate = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));
    REQUIRE_THAT(immediate.cost_at(10).insurance_offset, WithinAbs(73000.0, 1e-6));
    REQUIRE_THAT(immediate.cost_at(10).net(), WithinAbs(27000.0, 1e-6));

    person.insurance = traditional_policy(200.0, 73.0);
    LtcPlan delayed = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));
    // 73 days is a fifth of the year
    REQUIRE_THAT(delayed.cost_at(10).insurance_offset, WithinAbs(73000.0 * 0.8, 1e-6));
}

TEST_CASE("Insurance stops after the benefit period", "[ltc][plan][insurance]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(200.0, 0.0);
    person.insurance.benefit_period_years = 1.0;
    LtcPlan plan = single_plan(flat_config(), person, make_event(80.0, 3.0, 100000.0));

    REQUIRE(plan.cost_at(10).insurance_offset > 0.0);
    REQUIRE(plan.cost_at(11).insurance_offset == 0.0);
    REQUIRE_THAT(plan.cost_at(11).gross, WithinAbs(100000.0, 1e-6));
}

TEST_CASE("Insurance offset never exceeds the gross cost", "[ltc][plan][insurance][edge-case]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(1000.0, 0.0);
    LtcPlan plan = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));

    LtcYearCost cost = plan.cost_at(10);
    REQUIRE_THAT(cost.insurance_offset, WithinAbs(cost.gross, 1e-9));
    REQUIRE_THAT(cost.net(), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Hybrid policies pay a fraction of the daily benefit", "[ltc][plan][insurance]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(200.0, 0.0);
    person.insurance.type = LtcInsuranceType::Hybrid;
    LtcPlan plan = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));

    REQUIRE_THAT(plan.cost_at(10).insurance_offset, WithinAbs(36500.0, 1e-6));
}

TEST_CASE("Inflation rider compounds the daily benefit", "[ltc][plan][insurance]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(100.0, 0.0);
    person.insurance.inflation_rider = true;
    person.insurance.rider_rate = 0.05;
    LtcPlan plan = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));

    REQUIRE_THAT(plan.cost_at(10).insurance_offset, WithinRel(36500.0 * std::pow(1.05, 10), 1e-12));
}

TEST_CASE("Premiums are paid until a claim or age 85", "[ltc][plan][insurance]") {
    LtcPerson person = make_person(70, 95.0);
    person.insurance = traditional_policy(200.0, 90.0);
    person.insurance.annual_premium = 3000.0;

    LtcPlan claim = single_plan(flat_config(), person, make_event(80.0, 2.0, 100000.0));
    REQUIRE(claim.cost_at(0).premiums == 3000.0);
    REQUIRE(claim.cost_at(9).premiums == 3000.0);
    REQUIRE(claim.cost_at(10).premiums == 0.0);

    LtcPlan healthy = single_plan(flat_config(), person, LtcEvent());
    REQUIRE(healthy.cost_at(14).premiums == 3000.0);
    REQUIRE(healthy.cost_at(15).premiums == 0.0);
    REQUIRE_FALSE(healthy.any_event());
}

TEST_CASE("Plan edge cases", "[ltc][plan][edge-case]") {
    LtcConfig disabled = flat_config();
    disabled.enabled = false;
    LtcPlan off = single_plan(disabled, make_person(70, 95.0), make_event(70.0, 5.0, 100000.0));
    REQUIRE(off.cost_at(1).net() == 0.0);

    LtcPlan plan = single_plan(flat_config(), make_person(70, 95.0), make_event(70.0, 5.0, 100000.0));
    REQUIRE(plan.cost_at(-1).net() == 0.0);

    REQUIRE(LtcPlan().cost_at(3).net() == 0.0);
    REQUIRE_THROWS_AS(LtcPlan(flat_config(), {make_person(70, 95.0)}, {}), std::invalid_argument);
}

TEST_CASE("Couple costs add up", "[ltc][plan]") {
    LtcPlan plan(flat_config(), {make_person(70, 95.0), make_person(68, 95.0)},
                 {make_event(80.0, 2.0, 100000.0), make_event(78.0, 2.0, 50000.0)});
    REQUIRE_THAT(plan.cost_at(10).gross, WithinAbs(150000.0, 1e-6));
}

// ============================================================================
// LtcOverlay draws
// ============================================================================

TEST_CASE("Overlay rejects invalid configuration", "[ltc][overlay][edge-case]") {
    LtcConfig config;
    config.lifetime_probability = 1.5;
    REQUIRE_THROWS_AS(LtcOverlay(config, {make_person(65, 90.0)}), std::invalid_argument);

    config = LtcConfig();
    config.onset_min_age = 90.0;
    REQUIRE_THROWS_AS(LtcOverlay(config, {make_person(65, 90.0)}), std::invalid_argument);

    config = LtcConfig();
    config.annual_cost = -1.0;
    REQUIRE_THROWS_AS(LtcOverlay(config, {make_person(65, 90.0)}), std::invalid_argument);
}

TEST_CASE("Draws are reproducible from the seed", "[ltc][overlay]") {
    LtcOverlay overlay(LtcConfig(), {make_person(65, 92.0), make_person(63, 94.0)});
    std::mt19937_64 a(123);
    std::mt19937_64 b(123);

    for (int i = 0; i < 50; ++i) {
        LtcPlan pa = overlay.draw(a);
        LtcPlan pb = overlay.draw(b);
        for (size_t p = 0; p < 2; ++p) {
            REQUIRE(pa.events()[p].occurs == pb.events()[p].occurs);
            REQUIRE(pa.events()[p].onset_age == pb.events()[p].onset_age);
            REQUIRE(pa.events()[p].duration_years == pb.events()[p].duration_years);
        }
    }
}

TEST_CASE("Drawn events respect the onset range and minimum duration", "[ltc][overlay]") {
    LtcPerson person = make_person(65, 100.0);
    person.gender = Gender::Female;
    LtcOverlay overlay(LtcConfig(), {person});
    std::mt19937_64 rng(7);

    for (int i = 0; i < 500; ++i) {
        const LtcEvent& event = overlay.draw(rng).events()[0];
        REQUIRE(event.onset_age >= 75.0);
        REQUIRE(event.onset_age <= 85.0);
        REQUIRE(event.duration_years >= 0.5 * 3.7);
        REQUIRE(event.duration_years < 1.5 * 3.7);
        REQUIRE(event.annual_cost > 0.0);
    }
}

TEST_CASE("Event frequency follows probability and health", "[ltc][overlay]") {
    const int draws = 4000;
    auto frequency = [draws](HealthStatus health) {
        LtcPerson person = make_person(65, 100.0);
        person.health = health;
        LtcOverlay overlay(LtcConfig(), {person});
        std::mt19937_64 rng(2024);
        int hits = 0;
        for (int i = 0; i < draws; ++i) {
            if (overlay.draw(rng).any_event()) {
                ++hits;
            }
        }
        return static_cast<double>(hits) / draws;
    };

    REQUIRE_THAT(frequency(HealthStatus::Good), WithinAbs(0.48 * 0.85, 0.04));
    REQUIRE_THAT(frequency(HealthStatus::Excellent), WithinAbs(0.24, 0.04));
    // 0.48 * 2.0 is capped at 0.95
    REQUIRE_THAT(frequency(HealthStatus::Poor), WithinAbs(0.95, 0.02));
}

TEST_CASE("No events when disabled or impossible", "[ltc][overlay][edge-case]") {
    LtcConfig disabled;
    disabled.enabled = false;
    LtcOverlay off(disabled, {make_person(65, 100.0)});

    LtcConfig never;
    never.lifetime_probability = 0.0;
    LtcOverlay zero(never, {make_person(65, 100.0)});

    // Death before the earliest onset
    LtcOverlay early_death(LtcConfig(), {make_person(65, 74.0)});

    std::mt19937_64 rng(99);
    for (int i = 0; i < 200; ++i) {
        REQUIRE_FALSE(off.draw(rng).any_event());
        REQUIRE_FALSE(zero.draw(rng).any_event());
        REQUIRE_FALSE(early_death.draw(rng).any_event());
    }
}
