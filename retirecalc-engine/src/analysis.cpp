#include "analysis.hpp"
#include "benefits.hpp"

namespace retirecalc {

EnsembleRunner sequential_runner(const TaxEngine& tax_engine) {
    return [&tax_engine](const ScenarioParams& params, const EnsembleConfig& config) {
        return run_ensemble(params, tax_engine, config);
    };
}

LtcImpactAnalysis analyze_ltc_impact(const ScenarioParams& params, const EnsembleConfig& config,
                                     const EnsembleRunner& runner) {
    EnsembleConfig with_ltc = config;
    with_ltc.include_ltc = true;
    with_ltc.retain_trajectories = false;
    EnsembleConfig without_ltc = with_ltc;
    without_ltc.include_ltc = false;

    EnsembleResult a = runner(params, with_ltc);
    EnsembleResult b = runner(params, without_ltc);

    LtcImpactAnalysis analysis;
    analysis.computed = true;
    analysis.success_with_ltc = a.success_probability;
    analysis.success_without_ltc = b.success_probability;
    analysis.success_delta = b.success_probability - a.success_probability;
    analysis.mean_ltc_cost = a.mean_ltc_cost;
    analysis.ltc_event_probability = a.ltc_event_probability;
    return analysis;
}

std::vector<ClaimingAgeResult> analyze_claiming_sensitivity(const ScenarioParams& params,
                                                            const EnsembleConfig& config,
                                                            const EnsembleRunner& runner) {
    EnsembleConfig run_config = config;
    run_config.retain_trajectories = false;

    std::vector<ClaimingAgeResult> results;
    for (int age = static_cast<int>(EARLIEST_CLAIM_AGE); age <= static_cast<int>(LATEST_CLAIM_AGE); ++age) {
        ScenarioParamsBuilder builder(params);
        PersonParams primary = params.primary;
        primary.social_security_claim_age = age;
        builder.primary(primary);
        if (params.has_spouse) {
            PersonParams spouse = params.spouse;
            spouse.social_security_claim_age = age;
            builder.spouse(spouse);
        }
        ScenarioParams variant = builder.build();

        ClaimingAgeResult entry;
        entry.claim_age = age;
        entry.monthly_benefit = benefit_at_claim_age(age, primary.full_retirement_age(params.start_year),
                                                     primary.social_security_pia);
        entry.npv = lifetime_npv(age, primary.life_expectancy, entry.monthly_benefit,
                                 params.discount_rate, params.social_security_cola, primary.current_age);
        entry.success_probability = runner(variant, run_config).success_probability;
        results.push_back(entry);
    }
    return results;
}

} // namespace retirecalc
