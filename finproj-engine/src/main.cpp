#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include "company_config.hpp"
#include "forecaster.hpp"
#include "historical.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string data_path;          // Overrides data_path from the config file
    int base_year = 0;              // 0 = from config, else latest reported year
    int forecast_years = 0;         // 0 = from config
    std::string output_path;
    std::string log_level = "WARN";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "FinProj Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON company configuration (required)\n";
    std::cerr << "  --data <dir>                Directory with income statement.csv, balance sheet.csv\n";
    std::cerr << "                              and cash flow.csv (default: data_path from config)\n\n";
    std::cerr << "Forecast options:\n";
    std::cerr << "  --base-year <year>          Last actual year; earlier than the latest reported\n";
    std::cerr << "                              year runs a backtest against the later actuals\n";
    std::cerr << "  --years <n>                 Number of forecast years\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: WARN)\n";
    std::cerr << "  --log-file <path>           Append log events to a file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config data/sample_co.json --base-year 2022 \\\n";
    std::cerr << "      --years 2 --output forecast.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--data" && i + 1 < argc) {
                args.data_path = argv[++i];
            } else if (arg == "--base-year" && i + 1 < argc) {
                args.base_year = std::stoi(argv[++i]);
            } else if (arg == "--years" && i + 1 < argc) {
                args.forecast_years = std::stoi(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid number for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.base_year < 0) {
        std::cerr << "Error: --base-year must be a positive year\n";
        valid = false;
    }

    if (args.forecast_years < 0) {
        std::cerr << "Error: --years must be greater than 0\n";
        valid = false;
    }

    return valid;
}

void print_summary(const finproj::ForecastResult& result) {
    std::cerr << "\nForecast for " << result.company << " from base year " << result.base_year << ":\n";
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "  " << std::setw(6) << "Year"
              << std::setw(16) << "Revenue"
              << std::setw(16) << "Net income"
              << std::setw(16) << "Ending cash"
              << std::setw(14) << "ST debt"
              << std::setw(14) << "LT debt"
              << std::setw(12) << "Residual" << "\n";
    for (const auto& p : result.periods) {
        std::cerr << "  " << std::setw(6) << p.year()
                  << std::setw(16) << p.income_statement.revenue
                  << std::setw(16) << p.income_statement.net_income
                  << std::setw(16) << p.cash_budget.ending_cash
                  << std::setw(14) << p.debt.st_ending
                  << std::setw(14) << p.debt.lt_ending
                  << std::setw(12) << p.balance_check.residual << "\n";
    }

    std::cerr << "  Balanced:  " << (result.balanced() ? "yes" : "NO") << "\n";
    if (!result.warnings.empty()) {
        std::cerr << "  Warnings:  " << result.warnings.size() << "\n";
        for (const auto& w : result.warnings) {
            std::cerr << "    [" << w.year << "] " << finproj::warning_kind_to_string(w.kind)
                      << ": " << w.message << "\n";
        }
    }

    if (result.backtest) {
        finproj::BacktestSummary summary = finproj::summarize_backtest(*result.backtest);
        std::cerr << "\nBacktest (" << summary.periods << " periods, " << summary.comparisons
                  << " comparisons, MAPE " << summary.mean_absolute_percent_error << "%):\n";
        for (const auto& r : *result.backtest) {
            std::cerr << "  " << r.year << "  " << std::left << std::setw(42) << r.line_item << std::right
                      << std::setw(16) << r.forecast << std::setw(16) << r.actual;
            if (r.percent_variance) {
                std::cerr << std::setw(10) << *r.percent_variance << "%";
            }
            std::cerr << "\n";
        }
    }
    std::cerr << "  Execution: " << result.execution_time_ms << " ms\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    finproj::LoggerConfig log_config;
    log_config.min_level = finproj::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    finproj::Logger::get_instance().configure(log_config);

    try {
        std::cerr << "Loading config from " << args.config_path << "..." << std::flush;
        finproj::CompanyConfig config = finproj::parse_company_config_from_file(args.config_path);
        std::cerr << " done\n";

        if (!args.data_path.empty()) config.data_path = args.data_path;
        if (args.base_year > 0) config.base_year = args.base_year;
        if (args.forecast_years > 0) config.n_forecast_years = args.forecast_years;

        if (config.data_path.empty()) {
            throw finproj::ConfigError("No historical data directory: set data_path in the config or pass --data");
        }

        std::cerr << "Loading historical statements from " << config.data_path << "..." << std::flush;
        finproj::HistoricalFinancials history =
            finproj::HistoricalFinancials::load_from_directory(config.data_path);
        auto years = history.years();
        std::cerr << " loaded " << years.size() << " years (" << years.front() << "-" << years.back() << ")\n";

        finproj::ForecastContext context(config, history);
        finproj::ForecastResult result = finproj::run_forecast(context);

        print_summary(result);

        if (args.output_path.empty()) {
            finproj::io::write_forecast_result_json(std::cout, result);
        } else {
            finproj::io::write_forecast_result_json(args.output_path, result);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        finproj::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        finproj::Logger::get_instance().flush();
        return 1;
    }
}
