#ifndef RETIRECALC_ANALYSIS_HPP
#define RETIRECALC_ANALYSIS_HPP

#include "ensemble.hpp"
#include <functional>
#include <vector>

namespace retirecalc {

// Any way of running an ensemble: sequential here, the thread pool in the orchestrator
using EnsembleRunner = std::function<EnsembleResult(const ScenarioParams&, const EnsembleConfig&)>;

EnsembleRunner sequential_runner(const TaxEngine& tax_engine);

// Same seeds with the LTC overlay on and off
LtcImpactAnalysis analyze_ltc_impact(const ScenarioParams& params, const EnsembleConfig& config,
                                     const EnsembleRunner& runner);

// Success probability and benefit NPV for each whole claiming age 62-70.
// Both spouses claim at the tested age.
std::vector<ClaimingAgeResult> analyze_claiming_sensitivity(const ScenarioParams& params,
                                                            const EnsembleConfig& config,
                                                            const EnsembleRunner& runner);

} // namespace retirecalc

#endif // RETIRECALC_ANALYSIS_HPP
