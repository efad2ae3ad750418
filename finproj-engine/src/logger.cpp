/**
 * @file logger.cpp
 * @brief Structured logger for forecast runs
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace finproj {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

RunContext::RunContext() : base_year(0), year(0) {}

RunContext::RunContext(const std::string& company_name, int base)
    : company(company_name), base_year(base), year(0) {}

LoggerConfig::LoggerConfig()
    : min_level(LogLevel::INFO),
      enable_console(true),
      enable_file(false),
      log_file_path("finproj.log"),
      enable_json(true) {}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: cannot open log file " << config_.log_file_path
                  << "; file logging disabled" << std::endl;
        file_stream_.reset();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_run_start(const RunContext& ctx, int n_forecast_years, int n_input_years) {
    log(LogLevel::INFO, "Starting forecast", {
        {"event", "run_start"},
        {"n_forecast_years", std::to_string(n_forecast_years)},
        {"n_input_years", std::to_string(n_input_years)}
    }, ctx);
}

void Logger::log_assumption_resolved(
    const RunContext& ctx,
    const std::string& name,
    double value,
    const std::string& provenance
) {
    log(LogLevel::INFO, "Resolved assumption", {
        {"event", "assumption_resolved"},
        {"assumption", name},
        {"value", std::to_string(value)},
        {"provenance", provenance}
    }, ctx);
}

void Logger::log_period_complete(
    const RunContext& ctx,
    double ending_cash,
    double short_term_debt,
    double long_term_debt,
    double balance_residual
) {
    log(LogLevel::DEBUG, "Period complete", {
        {"event", "period_complete"},
        {"ending_cash", std::to_string(ending_cash)},
        {"short_term_debt", std::to_string(short_term_debt)},
        {"long_term_debt", std::to_string(long_term_debt)},
        {"balance_residual", std::to_string(balance_residual)}
    }, ctx);
}

void Logger::log_run_complete(
    const RunContext& ctx,
    size_t periods,
    size_t warnings,
    double execution_time_ms
) {
    log(LogLevel::INFO, "Forecast completed", {
        {"event", "run_complete"},
        {"periods", std::to_string(periods)},
        {"warning_count", std::to_string(warnings)},
        {"execution_time_ms", std::to_string(execution_time_ms)}
    }, ctx);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    log(LogLevel::WARN, warning_message, {{"event", "warning"}, {"warning", warning_message}}, ctx);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    log(LogLevel::ERROR, "Forecast failed", {{"event", "error"}, {"error_message", error_message}}, ctx);
}

void Logger::log_debug(const RunContext& ctx, const std::string& message, const LogFields& fields) {
    log(LogLevel::DEBUG, message, fields, ctx);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

// ============================================================================
// Formatting
// ============================================================================

void Logger::log(LogLevel level, const std::string& message, LogFields fields,
                 const RunContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    if (!ctx.company.empty()) fields["company"] = ctx.company;
    if (ctx.base_year != 0) fields["base_year"] = std::to_string(ctx.base_year);
    if (ctx.year != 0) fields["year"] = std::to_string(ctx.year);
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;

    write_output(format_event(level, message, fields));
}

std::string Logger::format_event(LogLevel level, const std::string& message,
                                 const LogFields& fields) const {
    if (config_.enable_json) {
        LogFields event = fields;
        event["timestamp"] = get_timestamp();
        event["level"] = level_to_string(level);
        event["message"] = message;
        return format_json(event);
    }

    std::string line = get_timestamp() + " [" + level_to_string(level) + "] " + message;
    for (const auto& [key, value] : fields) {
        line += " " + key + "=" + value;
    }
    return line;
}

// UTC, ISO-8601 with milliseconds
std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buffer + n, sizeof(buffer) - n, ".%03lldZ", millis);
    return buffer;
}

std::string Logger::format_json(const LogFields& fields) const {
    std::string out = "{";
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it != fields.begin()) out += ',';
        out += '"';
        append_escaped(out, it->first);
        out += "\":\"";
        append_escaped(out, it->second);
        out += '"';
    }
    out += '}';
    return out;
}

void Logger::append_escaped(std::string& out, const std::string& str) {
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
}

// Caller holds mutex_
void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << '\n';
    }
    if (config_.enable_file && file_stream_) {
        *file_stream_ << output << '\n';
    }
}

} // namespace finproj
