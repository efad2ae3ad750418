/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include "forecaster.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace finproj;

namespace {

// Flat JSON object of string values, as the logger writes them
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        while (val_end != std::string::npos && line[val_end - 1] == '\\') {
            val_end = line.find('"', val_end + 1);
        }
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG, bool json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void finish(const std::string& path) {
    finproj::testing::quiet_logger();
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Custom configuration") {
        log_to_file("test_log.log");
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);

        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);

        finish("test_log.log");
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("debug") == LogLevel::DEBUG);
        REQUIRE(string_to_level("Warning") == LogLevel::WARN);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }
}

TEST_CASE("Logger Run Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    RunContext ctx("Sample Co", 2023);

    SECTION("Run start") {
        log_to_file("test_run_start.log");
        logger.log_run_start(ctx, 3, 4);

        auto lines = read_lines("test_run_start.log");
        REQUIRE(lines.size() == 1);
        auto fields = parse_json_log(lines[0]);

        REQUIRE(fields["event"] == "run_start");
        REQUIRE(fields["level"] == "INFO");
        REQUIRE(fields["company"] == "Sample Co");
        REQUIRE(fields["base_year"] == "2023");
        REQUIRE(fields["n_forecast_years"] == "3");
        REQUIRE(fields["n_input_years"] == "4");
        REQUIRE(fields.count("year") == 0);
        REQUIRE_FALSE(fields["timestamp"].empty());

        finish("test_run_start.log");
    }

    SECTION("Assumption resolved") {
        log_to_file("test_assumption.log");
        ctx.phase = "resolve";
        logger.log_assumption_resolved(ctx, "tax_rate", 0.21, "derived");

        auto fields = parse_json_log(read_lines("test_assumption.log").at(0));
        REQUIRE(fields["event"] == "assumption_resolved");
        REQUIRE(fields["assumption"] == "tax_rate");
        REQUIRE(std::stod(fields["value"]) == 0.21);
        REQUIRE(fields["provenance"] == "derived");
        REQUIRE(fields["phase"] == "resolve");

        finish("test_assumption.log");
    }

    SECTION("Period complete is debug only") {
        log_to_file("test_period.log", LogLevel::INFO);
        ctx.year = 2024;
        logger.log_period_complete(ctx, 150.0, 0.0, 180.0, 0.0);
        REQUIRE(read_lines("test_period.log").empty());

        logger.set_min_level(LogLevel::DEBUG);
        logger.log_period_complete(ctx, 150.0, 0.0, 180.0, 0.0);
        auto fields = parse_json_log(read_lines("test_period.log").at(0));
        REQUIRE(fields["event"] == "period_complete");
        REQUIRE(fields["year"] == "2024");
        REQUIRE(std::stod(fields["long_term_debt"]) == 180.0);

        finish("test_period.log");
    }

    SECTION("Warnings and errors") {
        log_to_file("test_warn_error.log", LogLevel::WARN);
        logger.log_run_complete(ctx, 3, 0, 1.5);
        logger.log_warning(ctx, "Balance check failed: \"residual\" 10");
        logger.log_error(ctx, "Missing required fields");

        auto lines = read_lines("test_warn_error.log");
        REQUIRE(lines.size() == 2);

        auto warning = parse_json_log(lines[0]);
        REQUIRE(warning["level"] == "WARN");
        REQUIRE(warning["event"] == "warning");
        REQUIRE(warning["warning"] == "Balance check failed: \\\"residual\\\" 10");

        auto error = parse_json_log(lines[1]);
        REQUIRE(error["level"] == "ERROR");
        REQUIRE(error["event"] == "error");
        REQUIRE(error["error_message"] == "Missing required fields");

        finish("test_warn_error.log");
    }
}

TEST_CASE("Logger Plain Text Output", "[logger]") {
    log_to_file("test_text.log", LogLevel::DEBUG, false);
    Logger::get_instance().log_debug(RunContext("Sample Co", 2023), "Backtest complete",
                                     {{"comparisons", "16"}});

    auto lines = read_lines("test_text.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[DEBUG] Backtest complete") != std::string::npos);
    REQUIRE(lines[0].find("comparisons=16") != std::string::npos);
    REQUIRE(lines[0].find("company=Sample Co") != std::string::npos);

    finish("test_text.log");
}

TEST_CASE("Logger Forecast Run Trace", "[logger]") {
    log_to_file("test_forecast_trace.log", LogLevel::INFO);

    auto result = run_forecast(ForecastContext(finproj::testing::make_sample_config(),
                                               finproj::testing::make_sample_history()));

    auto lines = read_lines("test_forecast_trace.log");
    REQUIRE(lines.size() == 2 + result.assumptions.entries().size());
    REQUIRE(parse_json_log(lines.front())["event"] == "run_start");

    auto last = parse_json_log(lines.back());
    REQUIRE(last["event"] == "run_complete");
    REQUIRE(last["periods"] == "3");
    REQUIRE(last["warning_count"] == "0");

    finish("test_forecast_trace.log");
}
