#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef RETIRECALC_CLI_PATH
#define RETIRECALC_CLI_PATH "./retirecalc"
#endif

namespace {

namespace fs = std::filesystem;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/retirecalc_test_stdout.txt";
    std::string stderr_file = "/tmp/retirecalc_test_stderr.txt";

    std::string full_cmd = std::string("\"") + RETIRECALC_CLI_PATH + "\" " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns the raw wait status)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

std::string write_temp(const std::string& name, const std::string& content) {
    fs::path dir = fs::temp_directory_path() / "retirecalc_cli_test";
    fs::create_directories(dir);
    fs::path path = dir / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

const char* HOUSEHOLD = R"({
    "primary": {
        "current_age": 66, "retirement_age": 66, "life_expectancy": 82,
        "gender": "female",
        "social_security": { "pia": 2100, "claim_age": 67 }
    },
    "assets": { "tax_deferred": 400000, "tax_free": 80000, "capital_gains": 150000,
                "cash": 40000, "capital_gains_basis": 100000 },
    "expenses": { "annual": 45000, "healthcare": 6000 },
    "state": "TX"
})";

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--params") != std::string::npos);
    REQUIRE(result.stderr_output.find("--iterations") != std::string::npos);
    REQUIRE(result.stderr_output.find("--workers") != std::string::npos);
    REQUIRE(result.stderr_output.find("--antithetic") != std::string::npos);
    REQUIRE(result.stderr_output.find("--stochastic-mortality") != std::string::npos);
    REQUIRE(result.stderr_output.find("--deadline-ms") != std::string::npos);
    REQUIRE(result.stderr_output.find("--output") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI missing params fails", "[cli]") {
    auto result = run_command("--iterations 100");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("--params is required") != std::string::npos);
}

TEST_CASE("CLI invalid file path fails", "[cli]") {
    auto result = run_command("--params /nonexistent/household.json");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("not found") != std::string::npos);
}

TEST_CASE("CLI unknown option fails", "[cli]") {
    auto result = run_command("--unknown-option");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
}

TEST_CASE("CLI rejects invalid settings", "[cli]") {
    std::string params = write_temp("household.json", HOUSEHOLD);

    SECTION("Unknown distribution") {
        auto result = run_command("--params " + params + " --distribution cauchy");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
    }

    SECTION("Zero iterations") {
        auto result = run_command("--params " + params + " --iterations 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid simulation settings") != std::string::npos);
    }
}

TEST_CASE("CLI reports the invalid scenario field", "[cli]") {
    std::string params = write_temp("bad_household.json", R"({
        "primary": { "current_age": 70, "retirement_age": 65, "life_expectancy": 90 }
    })");

    auto result = run_command("--params " + params + " --iterations 10");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("primary.retirement_age") != std::string::npos);
}

TEST_CASE("CLI full run writes JSON output", "[cli][integration]") {
    std::string params = write_temp("household.json", HOUSEHOLD);
    std::string output = (fs::temp_directory_path() / "retirecalc_cli_test" / "result.json").string();
    fs::remove(output);

    auto result = run_command("--params " + params + " --iterations 200 --seed 7 --workers 2 "
                              "--antithetic --log-level error --output " + output);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Success:") != std::string::npos);
    REQUIRE(result.stderr_output.find("Output written to:") != std::string::npos);

    nlohmann::json json = nlohmann::json::parse(read_file(output));
    double success = json["statistics"]["success_probability"].get<double>();
    REQUIRE(success >= 0.0);
    REQUIRE(success <= 100.0);
    REQUIRE(json["execution"]["requested_scenarios"] == 200);
    REQUIRE(json["execution"]["completed_scenarios"] == 200);
    REQUIRE(json["ending_balances"].size() == 200);
}

TEST_CASE("CLI runs with drawn lifespans", "[cli][integration]") {
    std::string params = write_temp("household.json", HOUSEHOLD);

    auto result = run_command("--params " + params + " --iterations 60 --seed 11 "
                              "--stochastic-mortality --compact --log-level error");

    REQUIRE(result.exit_code == 0);
    nlohmann::json json = nlohmann::json::parse(result.stdout_output);
    REQUIRE(json["execution"]["completed_scenarios"] == 60);
    REQUIRE(json["ending_balances"].size() == 60);
}

TEST_CASE("CLI writes JSON to stdout without --output", "[cli][integration]") {
    std::string params = write_temp("household.json", HOUSEHOLD);

    auto result = run_command("--params " + params + " --iterations 50 --compact --log-level error");

    REQUIRE(result.exit_code == 0);
    nlohmann::json json = nlohmann::json::parse(result.stdout_output);
    REQUIRE(json["execution"]["completed_scenarios"] == 50);
}

TEST_CASE("CLI flags override the run configuration", "[cli][integration]") {
    std::string params = write_temp("household.json", HOUSEHOLD);
    std::string config = write_temp("run.json", R"({
        "params": "household.json",
        "simulation": { "iterations": 5000, "seed": 3 },
        "execution": { "workers": 2 },
        "logging": { "level": "error" }
    })");

    auto result = run_command("--config " + config + " --iterations 40 --compact");

    REQUIRE(result.exit_code == 0);
    nlohmann::json json = nlohmann::json::parse(result.stdout_output);
    REQUIRE(json["execution"]["requested_scenarios"] == 40);
    REQUIRE(json["execution"]["completed_scenarios"] == 40);
}

TEST_CASE("CLI malformed run configuration fails", "[cli]") {
    std::string config = write_temp("broken.json", "{ \"simulation\": ");

    auto result = run_command("--config " + config);
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("JSON parse error") != std::string::npos);
}
