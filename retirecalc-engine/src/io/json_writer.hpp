#ifndef RETIRECALC_IO_JSON_WRITER_HPP
#define RETIRECALC_IO_JSON_WRITER_HPP

#include "../ensemble.hpp"
#include <ostream>
#include <string>

namespace retirecalc {
namespace io {

/**
 * Write an ensemble result as JSON.
 *
 * Sections: "statistics" (success probabilities, ending-balance moments and
 * percentiles, LTC cost), "risk_metrics", "percentile_bands", "median_trajectory",
 * "ltc_impact" and "claiming_sensitivity" (when computed), "execution" (scenario
 * counts, timing) and "ending_balances" in scenario order.
 *
 * @param os Output stream
 * @param result Aggregated ensemble result
 * @param pretty_print If true, indent and break lines
 */
void write_ensemble_result_json(std::ostream& os, const EnsembleResult& result,
                                bool pretty_print = true);

/**
 * Write an ensemble result as JSON to a file.
 *
 * @throws std::runtime_error if the file cannot be opened
 */
void write_ensemble_result_json(const std::string& filepath, const EnsembleResult& result,
                                bool pretty_print = true);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_JSON_WRITER_HPP
