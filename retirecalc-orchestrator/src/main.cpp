#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "analysis.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "io/json_writer.hpp"
#include "io/params_reader.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    retirecalc::RunConfig run;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RetireCalc v1.0.0 - retirement Monte Carlo engine\n\n";
    std::cerr << "Usage: " << program_name << " --params <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --params <path>             JSON file describing the household scenario\n";
    std::cerr << "  --config <path>             JSON run configuration (flags below override it)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --iterations <count>        Number of scenarios (default: 1000)\n";
    std::cerr << "  --seed <value>              Base seed for reproducibility (default: 42)\n";
    std::cerr << "  --distribution <name>       Return shocks: normal or student-t (default: student-t)\n";
    std::cerr << "  --df <value>                Student-t degrees of freedom (default: 5)\n";
    std::cerr << "  --regimes                   Markov regime-switching returns\n";
    std::cerr << "  --no-ltc                    Disable the long-term care overlay\n";
    std::cerr << "  --stochastic-mortality      Draw each lifespan from the SSA period table\n\n";
    std::cerr << "Variance reduction:\n";
    std::cerr << "  --antithetic                Antithetic variates\n";
    std::cerr << "  --control-variates          Equity-shock control variate\n";
    std::cerr << "  --stratified                Stratified sampling of first-year shocks\n";
    std::cerr << "  --strata <count>            Number of strata (default: 10)\n\n";
    std::cerr << "Execution options:\n";
    std::cerr << "  --workers <count>           Parallel workers (default: 1)\n";
    std::cerr << "  --timeout-ms <ms>           Time limit per scenario range (default: none)\n";
    std::cerr << "  --deadline-ms <ms>          Time limit for the whole run (default: none)\n\n";
    std::cerr << "Analyses:\n";
    std::cerr << "  --ltc-impact                Compare success with and without LTC costs\n";
    std::cerr << "  --claiming-sensitivity      Sweep Social Security claiming ages 62-70\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --trajectories <path>       Parquet file with every scenario year\n";
    std::cerr << "  --compact                   Single-line JSON\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log records to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --params household.json --iterations 10000 \\\n";
    std::cerr << "      --workers 8 --antithetic --control-variates --output result.json\n\n";
    std::cerr << "  " << program_name << " --config run.json --ltc-impact --claiming-sensitivity\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Config file first, so that flags parsed afterwards override it
std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return "";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    retirecalc::RunConfig& run = args.run;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--params" && i + 1 < argc) {
            run.params_path = argv[++i];
        } else if (arg == "--iterations" && i + 1 < argc) {
            run.ensemble.iterations = std::stoull(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            run.ensemble.seed = std::stoull(argv[++i]);
        } else if (arg == "--distribution" && i + 1 < argc) {
            run.ensemble.distribution = retirecalc::return_distribution_from_string(argv[++i]);
        } else if (arg == "--df" && i + 1 < argc) {
            run.ensemble.degrees_of_freedom = std::stod(argv[++i]);
        } else if (arg == "--regimes") {
            run.ensemble.regime_switching = true;
        } else if (arg == "--no-ltc") {
            run.ensemble.include_ltc = false;
        } else if (arg == "--stochastic-mortality") {
            run.ensemble.stochastic_mortality = true;
        } else if (arg == "--antithetic") {
            run.ensemble.antithetic = true;
        } else if (arg == "--control-variates") {
            run.ensemble.control_variates = true;
        } else if (arg == "--stratified") {
            run.ensemble.stratified = true;
        } else if (arg == "--strata" && i + 1 < argc) {
            run.ensemble.strata = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--workers" && i + 1 < argc) {
            run.ensemble.worker_count = std::stoi(argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            run.orchestrator.worker_timeout_ms = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--deadline-ms" && i + 1 < argc) {
            run.orchestrator.deadline_ms = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--ltc-impact") {
            run.ltc_impact = true;
        } else if (arg == "--claiming-sensitivity") {
            run.claiming_sensitivity = true;
        } else if (arg == "--output" && i + 1 < argc) {
            run.output_path = argv[++i];
        } else if (arg == "--trajectories" && i + 1 < argc) {
            run.trajectories_path = argv[++i];
            run.ensemble.retain_trajectories = true;
        } else if (arg == "--compact") {
            run.pretty_print = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level = argv[++i];
            std::transform(level.begin(), level.end(), level.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            run.logging.min_level = retirecalc::string_to_level(level);
        } else if (arg == "--log-file" && i + 1 < argc) {
            run.logging.log_file_path = argv[++i];
            run.logging.enable_file = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.run.params_path.empty()) {
        std::cerr << "Error: --params is required\n";
        valid = false;
    } else if (!file_exists(args.run.params_path)) {
        std::cerr << "Error: Params file not found: " << args.run.params_path << "\n";
        valid = false;
    }

    try {
        retirecalc::validate_run_config(args.run);
    } catch (const retirecalc::ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        valid = false;
    }

    return valid;
}

void print_summary(const retirecalc::EnsembleRunResult& run) {
    const retirecalc::EnsembleResult& result = run.result;
    std::cerr << "\nResults (" << retirecalc::ensemble_status_to_string(run.status) << ", "
              << run.completed_scenarios << " of " << run.requested_scenarios << " scenarios):\n";
    std::cerr << "  Success:        " << result.success_probability << "%\n";
    if (result.control_variate_applied) {
        std::cerr << "  Raw success:    " << result.raw_success_probability << "%\n";
    }
    std::cerr << "  Analytic:       " << result.analytic_success_estimate << "%\n";
    std::cerr << "  Legacy goal:    " << result.legacy_goal_probability << "%\n";
    std::cerr << "  P10 ending:     " << result.p10() << "\n";
    std::cerr << "  P50 ending:     " << result.p50() << "\n";
    std::cerr << "  P90 ending:     " << result.p90() << "\n";
    std::cerr << "  CVaR 95:        " << result.risk.cvar_95 << "\n";
    std::cerr << "  Max drawdown:   " << result.risk.max_drawdown << "\n";
    std::cerr << "  Ulcer index:    " << result.risk.ulcer_index << "\n";
    std::cerr << "  Execution:      " << run.execution_time_ms << " ms\n";
    for (const std::string& error : run.errors) {
        std::cerr << "  Warning: " << error << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    CLIArgs args;
    try {
        std::string config_path = find_config_path(argc, argv);
        if (!config_path.empty()) {
            args.run = retirecalc::parse_run_config_from_file(config_path);
        }
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    retirecalc::Logger& logger = retirecalc::Logger::get_instance();
    logger.configure(args.run.logging);

    try {
        retirecalc::ScenarioParams params;
        try {
            params = retirecalc::io::read_scenario_params_json(args.run.params_path);
        } catch (const retirecalc::InvalidParameterError& e) {
            logger.log_validation_error(e.field(), e.what());
            std::cerr << "Error: Invalid scenario parameter " << e.what() << "\n";
            return 1;
        }

        retirecalc::TaxEngine tax_engine;
        retirecalc::Orchestrator orchestrator(tax_engine, args.run.orchestrator);

        retirecalc::EnsembleRunResult run = orchestrator.run(params, args.run.ensemble);

        if (run.complete()) {
            if (args.run.ltc_impact) {
                std::cerr << "Running LTC impact analysis...\n";
                run.result.ltc_impact =
                    retirecalc::analyze_ltc_impact(params, args.run.ensemble, orchestrator.runner());
            }
            if (args.run.claiming_sensitivity) {
                std::cerr << "Running claiming-age sensitivity...\n";
                run.result.claiming_sensitivity =
                    retirecalc::analyze_claiming_sensitivity(params, args.run.ensemble, orchestrator.runner());
            }
        } else if (args.run.ltc_impact || args.run.claiming_sensitivity) {
            std::cerr << "Warning: Skipping analyses after an incomplete ensemble\n";
        }

        print_summary(run);

        if (args.run.output_path.empty()) {
            retirecalc::io::write_ensemble_result_json(std::cout, run.result, args.run.pretty_print);
        } else {
            retirecalc::io::write_ensemble_result_json(args.run.output_path, run.result, args.run.pretty_print);
            std::cerr << "\nOutput written to: " << args.run.output_path << "\n";
        }

        if (!args.run.trajectories_path.empty()) {
            retirecalc::io::write_trajectories_parquet(run.result, args.run.trajectories_path);
            std::cerr << "Trajectories written to: " << args.run.trajectories_path << "\n";
        }

        logger.flush();
        return run.complete() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
