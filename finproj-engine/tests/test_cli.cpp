#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace {

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

CommandResult run_engine(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/finproj_test_stdout.txt";
    std::string stderr_file = "/tmp/finproj_test_stderr.txt";

    std::string full_cmd = std::string("\"") + FINPROJ_ENGINE_BINARY + "\" " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    result.exit_code = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns the raw wait status)
    result.exit_code = WEXITSTATUS(result.exit_code);

    return result;
}

const std::string SAMPLE_CONFIG = std::string("\"") + FINPROJ_SAMPLE_DATA_DIR + "/sample_co.json\"";

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_engine("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--config") != std::string::npos);
    REQUIRE(result.stderr_output.find("--base-year") != std::string::npos);
    REQUIRE(result.stderr_output.find("--years") != std::string::npos);
    REQUIRE(result.stderr_output.find("--output") != std::string::npos);
    REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_engine("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI argument errors", "[cli]") {
    SECTION("Missing config") {
        auto result = run_engine("--years 2");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--config is required") != std::string::npos);
    }

    SECTION("Config file not found") {
        auto result = run_engine("--config /nonexistent/company.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Config file not found") != std::string::npos);
    }

    SECTION("Invalid number") {
        auto result = run_engine("--config " + SAMPLE_CONFIG + " --years two");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid number") != std::string::npos);
    }

    SECTION("Negative forecast years") {
        auto result = run_engine("--config " + SAMPLE_CONFIG + " --years -1");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--years must be greater than 0") != std::string::npos);
    }

    SECTION("Unknown option") {
        auto result = run_engine("--config " + SAMPLE_CONFIG + " --plug cash");
        REQUIRE(result.exit_code == 1);
    }
}

TEST_CASE("CLI forecast writes JSON to stdout", "[cli]") {
    auto result = run_engine("--config " + SAMPLE_CONFIG);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.find("\"company\": \"Sample Co\"") != std::string::npos);
    REQUIRE(result.stdout_output.find("\"periods\"") != std::string::npos);
    REQUIRE(result.stdout_output.find("\"balanced\": true") != std::string::npos);
    REQUIRE(result.stdout_output.find("\"backtest\": null") != std::string::npos);
    REQUIRE(result.stderr_output.find("Balanced:  yes") != std::string::npos);
}

TEST_CASE("CLI historical base year runs a backtest", "[cli]") {
    auto result = run_engine("--config " + SAMPLE_CONFIG + " --base-year 2021 --years 2");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.find("\"base_year\": 2021") != std::string::npos);
    REQUIRE(result.stdout_output.find("\"results\"") != std::string::npos);
    REQUIRE(result.stderr_output.find("Backtest") != std::string::npos);
}

TEST_CASE("CLI base year outside the data fails", "[cli]") {
    auto result = run_engine("--config " + SAMPLE_CONFIG + " --base-year 2030");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
}

TEST_CASE("CLI output file", "[cli]") {
    std::string output = "/tmp/finproj_test_forecast.json";
    std::remove(output.c_str());

    auto result = run_engine("--config " + SAMPLE_CONFIG + " --output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());

    std::string json = read_file(output);
    REQUIRE(json.find("\"periods\"") != std::string::npos);
    std::remove(output.c_str());
}
