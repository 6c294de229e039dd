/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace proforma {

namespace {

std::string format_rate(double rate) {
    if (std::isnan(rate)) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << rate;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(const RunContext& ctx) const {
    std::map<std::string, std::string> fields;
    fields["scenario_id"] = ctx.scenario_id;
    return fields;
}

void Logger::log_run_start(const RunContext& ctx) {
    auto fields = context_fields(ctx);
    fields["event"] = "run_start";
    fields["hold_months"] = std::to_string(ctx.hold_months);
    fields["tenants"] = std::to_string(ctx.tenant_count);
    fields["loans"] = std::to_string(ctx.loan_count);

    log(LogLevel::INFO, "Starting calculation run", fields);
}

void Logger::log_run_complete(
    const RunContext& ctx,
    double unlevered_irr,
    double levered_irr,
    double exit_value,
    double elapsed_ms
) {
    auto fields = context_fields(ctx);
    fields["event"] = "run_complete";
    fields["unlevered_irr"] = format_rate(unlevered_irr);
    fields["levered_irr"] = format_rate(levered_irr);
    fields["exit_value"] = std::to_string(exit_value);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Calculation run completed", fields);
}

void Logger::log_validation_failed(const RunContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx);
    fields["event"] = "validation_failed";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Scenario failed validation", fields);
}

void Logger::log_numeric_failure(
    const RunContext& ctx,
    const std::string& error_kind,
    const std::string& error_message
) {
    auto fields = context_fields(ctx);
    fields["event"] = "numeric_failure";
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Numeric failure", fields);
}

void Logger::log_invariant_violation(const RunContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx);
    fields["event"] = "invariant_violation";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Invariant violation", fields);
}

void Logger::log_solver_fallback(const std::string& solver, int iterations, const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "solver_fallback";
    fields["solver"] = solver;
    fields["newton_iterations"] = std::to_string(iterations);
    fields["reason"] = reason;

    log(LogLevel::WARN, "Newton iteration failed, using bisection", fields);
}

void Logger::log_batch_complete(size_t runs, size_t failures, double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_complete";
    fields["runs"] = std::to_string(runs);
    fields["failures"] = std::to_string(failures);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Batch completed", fields);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::warn(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, fields);
}

void Logger::error(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace proforma
