#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace retirecalc {

namespace {

// Optional object member; null when absent
const json& section(const json& j, const char* key) {
    static const json empty = nullptr;
    if (!j.contains(key)) {
        return empty;
    }
    if (!j[key].is_object()) {
        throw ConfigParseError(std::string("Section '") + key + "' must be an object");
    }
    return j[key];
}

template <typename T>
void read_value(const json& s, const char* key, T& target) {
    if (!s.is_null() && s.contains(key)) {
        target = s[key].get<T>();
    }
}

template <typename T>
void read_count(const json& s, const char* name, const char* key, T& target) {
    if (s.is_null() || !s.contains(key)) {
        return;
    }
    if (!s[key].is_number_unsigned()) {
        throw ConfigParseError(std::string(name) + "." + key + " must be a non-negative integer");
    }
    target = s[key].get<T>();
}

void read_string(const json& s, const char* key, std::string& target) {
    if (!s.is_null() && s.contains(key)) {
        target = expand_environment_variables(s[key].get<std::string>());
    }
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // anonymous namespace

RunConfig::RunConfig()
    : ltc_impact(false), claiming_sensitivity(false), pretty_print(true) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // A lone '$' is kept
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

void validate_run_config(const RunConfig& config) {
    try {
        config.ensemble.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid simulation settings: ") + e.what());
    }

    if (config.orchestrator.worker_type.empty()) {
        throw ConfigParseError("execution.worker_type must not be empty");
    }
    if (config.orchestrator.ranges_per_worker == 0) {
        throw ConfigParseError("execution.ranges_per_worker must be at least 1");
    }
    if (config.logging.enable_file && config.logging.log_file_path.empty()) {
        throw ConfigParseError("logging.file must not be empty");
    }
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        read_string(j, "params", config.params_path);

        // Simulation
        const json& sim = section(j, "simulation");
        read_count(sim, "simulation", "iterations", config.ensemble.iterations);
        read_count(sim, "simulation", "seed", config.ensemble.seed);
        if (!sim.is_null() && sim.contains("distribution")) {
            std::string name = sim["distribution"].get<std::string>();
            try {
                config.ensemble.distribution = return_distribution_from_string(name);
            } catch (const std::invalid_argument& e) {
                throw ConfigParseError(std::string("simulation.distribution: ") + e.what());
            }
        }
        read_value(sim, "degrees_of_freedom", config.ensemble.degrees_of_freedom);
        read_value(sim, "regime_switching", config.ensemble.regime_switching);
        read_value(sim, "include_ltc", config.ensemble.include_ltc);
        read_value(sim, "stochastic_mortality", config.ensemble.stochastic_mortality);
        read_value(sim, "danger_zone_threshold", config.ensemble.danger_zone_threshold);

        // Variance reduction
        const json& vr = section(j, "variance_reduction");
        read_value(vr, "antithetic", config.ensemble.antithetic);
        read_value(vr, "control_variates", config.ensemble.control_variates);
        read_value(vr, "stratified", config.ensemble.stratified);
        read_count(vr, "variance_reduction", "strata", config.ensemble.strata);

        // Execution
        const json& exec = section(j, "execution");
        unsigned int workers = static_cast<unsigned int>(config.ensemble.worker_count);
        read_count(exec, "execution", "workers", workers);
        config.ensemble.worker_count = static_cast<int>(workers);
        read_string(exec, "worker_type", config.orchestrator.worker_type);
        read_count(exec, "execution", "ranges_per_worker", config.orchestrator.ranges_per_worker);
        read_count(exec, "execution", "worker_timeout_ms", config.orchestrator.worker_timeout_ms);
        read_value(exec, "retry", config.orchestrator.enable_retry);
        read_count(exec, "execution", "max_retries", config.orchestrator.max_retry_attempts);
        read_count(exec, "execution", "retry_delay_ms", config.orchestrator.retry_delay_ms);
        read_count(exec, "execution", "deadline_ms", config.orchestrator.deadline_ms);

        // Analyses
        const json& analyses = section(j, "analyses");
        read_value(analyses, "ltc_impact", config.ltc_impact);
        read_value(analyses, "claiming_sensitivity", config.claiming_sensitivity);

        // Output
        const json& output = section(j, "output");
        read_string(output, "path", config.output_path);
        read_string(output, "trajectories", config.trajectories_path);
        read_value(output, "pretty", config.pretty_print);
        if (!config.trajectories_path.empty()) {
            config.ensemble.retain_trajectories = true;
        }

        // Logging
        const json& logging = section(j, "logging");
        if (!logging.is_null() && logging.contains("level")) {
            std::string level = to_upper(logging["level"].get<std::string>());
            if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
                throw ConfigParseError("logging.level must be one of DEBUG, INFO, WARN, ERROR");
            }
            config.logging.min_level = string_to_level(level);
        }
        read_value(logging, "console", config.logging.enable_console);
        read_value(logging, "json", config.logging.enable_json);
        if (!logging.is_null() && logging.contains("file")) {
            read_string(logging, "file", config.logging.log_file_path);
            config.logging.enable_file = true;
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_run_config(config);

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    // Resolve relative paths
    config.params_path = resolve_relative_path(config.params_path, file_path);
    config.output_path = resolve_relative_path(config.output_path, file_path);
    config.trajectories_path = resolve_relative_path(config.trajectories_path, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace retirecalc
