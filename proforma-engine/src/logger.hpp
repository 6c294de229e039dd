/**
 * @file logger.hpp
 * @brief Structured run logging for the pro-forma engine
 *
 * The Logger emits one event per line, either as a flat JSON object or as
 * plain text, to stderr and/or a log file:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - Run context (scenario id, hold, tenant and loan counts)
 * - Solver and failure events from the calculation boundary
 *
 * Logging never feeds back into numeric results.
 */

#ifndef PROFORMA_LOGGER_HPP
#define PROFORMA_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace proforma {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (per-phase timings)
    INFO,    ///< Run start/end, batch summaries
    WARN,    ///< Recoverable conditions (solver fallback)
    ERROR    ///< Failed runs and invariant violations
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string; unknown names fall back to INFO
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("proforma.log"),
          enable_json(true) {}
};

/**
 * @brief Identifies the run an event belongs to
 */
struct RunContext {
    std::string scenario_id;
    int hold_months;
    size_t tenant_count;
    size_t loan_count;

    RunContext() : scenario_id(""), hold_months(0), tenant_count(0), loan_count(0) {}
    explicit RunContext(const std::string& id)
        : scenario_id(id), hold_months(0), tenant_count(0), loan_count(0) {}
};

/**
 * @brief Structured logger (singleton)
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "proforma.log";
 *   Logger::get_instance().configure(config);
 *
 *   RunContext ctx("base-case");
 *   Logger::get_instance().log_run_start(ctx);
 *   @endcode
 *
 * Safe to call from concurrent batch runs; each line is written whole.
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    void log_run_start(const RunContext& ctx);

    /**
     * @brief Log a successful run
     *
     * @param unlevered_irr Annualised unlevered XIRR
     * @param levered_irr Annualised levered XIRR (NaN when unlevered only)
     * @param exit_value Net exit proceeds
     * @param elapsed_ms Wall time of the run
     */
    void log_run_complete(
        const RunContext& ctx,
        double unlevered_irr,
        double levered_irr,
        double exit_value,
        double elapsed_ms
    );

    void log_validation_failed(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Log a typed numeric failure
     *
     * @param error_kind ConvergenceError, DivideByZeroError, ...
     */
    void log_numeric_failure(
        const RunContext& ctx,
        const std::string& error_kind,
        const std::string& error_message
    );

    void log_invariant_violation(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Newton iteration failed and the bracketed search was used
     *
     * @param solver "xirr" or "irr"
     * @param iterations Newton iterations spent before falling back
     */
    void log_solver_fallback(const std::string& solver, int iterations, const std::string& reason);

    void log_batch_complete(size_t runs, size_t failures, double elapsed_ms);

    // Free-form events
    void info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void debug(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void warn(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void error(const std::string& message, const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const RunContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace proforma

#endif // PROFORMA_LOGGER_HPP
