#ifndef RETIRECALC_CONFIG_PARSER_HPP
#define RETIRECALC_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "orchestrator.hpp"
#include <stdexcept>
#include <string>

namespace retirecalc {

/**
 * @brief Exception thrown when run configuration parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything a CLI run needs besides the household scenario
 */
struct RunConfig {
    std::string params_path;              ///< Household scenario JSON
    EnsembleConfig ensemble;
    OrchestratorConfig orchestrator;
    bool ltc_impact;                      ///< Run the LTC on/off comparison
    bool claiming_sensitivity;            ///< Run the claiming-age sweep
    std::string output_path;              ///< JSON result file, empty = stdout
    std::string trajectories_path;        ///< Parquet trajectory file, empty = none
    bool pretty_print;
    LoggerConfig logging;

    RunConfig();
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Layout (every section and field is optional):
 *   {
 *     "params": "household.json",
 *     "simulation": { "iterations", "seed", "distribution", "degrees_of_freedom",
 *                     "regime_switching", "include_ltc", "stochastic_mortality",
 *                     "danger_zone_threshold" },
 *     "variance_reduction": { "antithetic", "control_variates", "stratified", "strata" },
 *     "execution": { "workers", "worker_type", "ranges_per_worker", "worker_timeout_ms",
 *                    "retry", "max_retries", "retry_delay_ms", "deadline_ms" },
 *     "analyses": { "ltc_impact", "claiming_sensitivity" },
 *     "output": { "path", "trajectories", "pretty" },
 *     "logging": { "level", "console", "file", "json" }
 *   }
 *
 * Relative paths are resolved against the directory of the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed run configuration
 * @throws ConfigParseError if file cannot be read, JSON is invalid or a value is out of range
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Checks a run configuration
 *
 * @throws ConfigParseError naming the first invalid setting
 */
void validate_run_config(const RunConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace retirecalc

#endif // RETIRECALC_CONFIG_PARSER_HPP
