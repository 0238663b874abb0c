#include "parquet_writer.hpp"
#include <stdexcept>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace retirecalc {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void write_trajectories_parquet(const EnsembleResult& result, const std::string& filepath) {
    size_t rows = 0;
    for (const ScenarioOutcome& outcome : result.outcomes) {
        rows += outcome.years.size();
    }
    if (rows == 0) {
        throw std::runtime_error("EnsembleResult has no trajectories to write. Ensure EnsembleConfig.retain_trajectories is true.");
    }

    auto schema = arrow::schema({
        arrow::field("scenario_id", arrow::uint64()),
        arrow::field("year", arrow::int32()),
        arrow::field("age", arrow::int32()),
        arrow::field("tax_deferred", arrow::float64()),
        arrow::field("tax_free", arrow::float64()),
        arrow::field("capital_gains", arrow::float64()),
        arrow::field("cash", arrow::float64()),
        arrow::field("total_assets", arrow::float64()),
        arrow::field("gross_withdrawal", arrow::float64()),
        arrow::field("rmd", arrow::float64()),
        arrow::field("federal_tax", arrow::float64()),
        arrow::field("state_tax", arrow::float64()),
        arrow::field("irmaa", arrow::float64()),
        arrow::field("ltc_cost", arrow::float64()),
        arrow::field("guardrail", arrow::utf8()),
        arrow::field("shortfall", arrow::float64())
    });

    arrow::UInt64Builder scenario_id_builder;
    arrow::Int32Builder year_builder;
    arrow::Int32Builder age_builder;
    arrow::StringBuilder guardrail_builder;

    // Double columns in schema order, after age and before guardrail
    constexpr size_t NUM_AMOUNTS = 11;
    std::vector<arrow::DoubleBuilder> amounts(NUM_AMOUNTS);

    check(scenario_id_builder.Reserve(rows), "reserve scenario_id column");
    check(year_builder.Reserve(rows), "reserve year column");
    check(age_builder.Reserve(rows), "reserve age column");
    check(guardrail_builder.Reserve(rows), "reserve guardrail column");
    for (auto& builder : amounts) {
        check(builder.Reserve(rows), "reserve amount column");
    }

    for (const ScenarioOutcome& outcome : result.outcomes) {
        for (const YearState& y : outcome.years) {
            check(scenario_id_builder.Append(outcome.scenario_index), "append scenario_id");
            check(year_builder.Append(y.calendar_year), "append year");
            check(age_builder.Append(y.age), "append age");

            const double values[NUM_AMOUNTS] = {
                y.tax_deferred, y.tax_free, y.capital_gains, y.cash, y.total_assets,
                y.gross_withdrawal, y.rmd, y.federal_tax, y.state_tax, y.irmaa, y.ltc_cost
            };
            for (size_t c = 0; c < NUM_AMOUNTS; ++c) {
                check(amounts[c].Append(values[c]), "append amount");
            }
            check(guardrail_builder.Append(guardrail_state_to_string(y.guardrail_state)), "append guardrail");
        }
    }

    arrow::DoubleBuilder shortfall_builder;
    check(shortfall_builder.Reserve(rows), "reserve shortfall column");
    for (const ScenarioOutcome& outcome : result.outcomes) {
        for (const YearState& y : outcome.years) {
            check(shortfall_builder.Append(y.shortfall), "append shortfall");
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.push_back(finish(scenario_id_builder, "scenario_id"));
    columns.push_back(finish(year_builder, "year"));
    columns.push_back(finish(age_builder, "age"));
    for (auto& builder : amounts) {
        columns.push_back(finish(builder, "amount"));
    }
    columns.push_back(finish(guardrail_builder, "guardrail"));
    columns.push_back(finish(shortfall_builder, "shortfall"));

    auto table = arrow::Table::Make(schema, columns);

    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void write_trajectories_parquet(const EnsembleResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace retirecalc
