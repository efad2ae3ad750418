/**
 * @file logger.hpp
 * @brief Structured logging for forecast runs with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-line or plain-text output to stderr and/or a file
 * - Run context (company, base year, period, phase) on every event
 *
 * Design Pattern: Singleton logger with structured event emission. Writes
 * are serialized so batch runs on several threads can share it.
 */

#ifndef FINPROJ_LOGGER_HPP
#define FINPROJ_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace finproj {

/// Event fields, written in key order
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-period intermediate values
    INFO,    ///< Run start/end, resolved assumptions
    WARN,    ///< Recovered anomalies (clamped debt, balance residuals)
    ERROR    ///< Failed runs
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive); unknown names map to INFO
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every event of a forecast run
 */
struct RunContext {
    std::string company;
    int base_year;
    int year;                   ///< Period being computed, 0 outside the period loop
    std::string phase;          ///< resolve, project, backtest

    RunContext();
    RunContext(const std::string& company_name, int base);
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to stderr
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig();
};

/**
 * @brief Structured logger for the forecasting engine
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   RunContext ctx("Sample Co", 2023);
 *   Logger::get_instance().log_run_start(ctx, 2, 3);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration; reopens the log file if enabled
     */
    void configure(const LoggerConfig& config);

    void log_run_start(const RunContext& ctx, int n_forecast_years, int n_input_years);

    void log_assumption_resolved(
        const RunContext& ctx,
        const std::string& name,
        double value,
        const std::string& provenance
    );

    /**
     * @brief Log a completed period with its headline balances
     */
    void log_period_complete(
        const RunContext& ctx,
        double ending_cash,
        double short_term_debt,
        double long_term_debt,
        double balance_residual
    );

    void log_run_complete(
        const RunContext& ctx,
        size_t periods,
        size_t warnings,
        double execution_time_ms
    );

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_debug(const RunContext& ctx, const std::string& message,
                   const LogFields& fields);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, LogFields fields,
             const RunContext& ctx);
    // Render one event as it will be written. Caller holds mutex_.
    std::string format_event(LogLevel level, const std::string& message,
                             const LogFields& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const LogFields& fields) const;
    static void append_escaped(std::string& out, const std::string& str);
    void write_output(const std::string& output);
};

} // namespace finproj

#endif // FINPROJ_LOGGER_HPP
