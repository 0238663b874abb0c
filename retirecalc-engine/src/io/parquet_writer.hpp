#ifndef RETIRECALC_IO_PARQUET_WRITER_HPP
#define RETIRECALC_IO_PARQUET_WRITER_HPP

#include "../ensemble.hpp"
#include <string>

namespace retirecalc {
namespace io {

/**
 * Write every retained scenario trajectory to a Parquet file, one row per
 * scenario year.
 *
 * Output schema:
 *   - scenario_id: uint64
 *   - year: int32 (calendar year)
 *   - age: int32 (primary's age)
 *   - tax_deferred, tax_free, capital_gains, cash, total_assets: float64
 *   - gross_withdrawal, rmd: float64
 *   - federal_tax, state_tax, irmaa: float64
 *   - ltc_cost: float64
 *   - guardrail: utf8 (normal, upper_guardrail, lower_guardrail)
 *   - shortfall: float64
 *
 * @param result EnsembleResult run with retain_trajectories
 * @param filepath Path to output Parquet file
 * @throws std::runtime_error if no trajectories were retained, the file cannot
 *         be written, or the build has no Apache Arrow support
 */
void write_trajectories_parquet(const EnsembleResult& result, const std::string& filepath);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_PARQUET_WRITER_HPP
