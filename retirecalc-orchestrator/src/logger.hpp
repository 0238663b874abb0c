/**
 * @file logger.hpp
 * @brief Structured logging for ensemble runs with JSON output
 *
 * The Logger provides structured logging for the orchestrator:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output, one object per line
 * - Context tracking (run ID, worker ID, scenario range, attempt)
 * - Typed events for the ensemble and worker lifecycle
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef RETIRECALC_LOGGER_HPP
#define RETIRECALC_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace retirecalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (range scheduling, per-attempt timing)
    INFO,    ///< Informational messages (ensemble start/end, worker completion)
    WARN,    ///< Warning messages (retries, cancellation)
    ERROR    ///< Error messages (worker failures, invalid input)
};

/**
 * @brief Convert log level to string
 */
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
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Execution context attached to worker events
 */
struct ExecutionContext {
    std::string run_id;              ///< Ensemble run identifier
    size_t worker_id;                ///< Pool thread index
    uint64_t range_begin;            ///< First scenario index of the range
    uint64_t range_end;              ///< One past the last scenario index
    size_t attempt;                  ///< 0 for the first attempt, 1 for the retry

    ExecutionContext()
        : run_id(""), worker_id(0), range_begin(0), range_end(0), attempt(0) {}

    ExecutionContext(const std::string& id, size_t worker)
        : run_id(id), worker_id(worker), range_begin(0), range_end(0), attempt(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (opened in append mode)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("retirecalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "run.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   ExecutionContext ctx("run-1", 0);
 *   ctx.range_begin = 0;
 *   ctx.range_end = 250;
 *   logger.log_worker_start(ctx);
 *   logger.log_worker_complete(ctx, 250, 84.2);
 *   @endcode
 *
 * All methods are safe to call from multiple pool threads.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled, closes it otherwise.
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of an ensemble run
     *
     * @param run_id Ensemble run identifier
     * @param iterations Requested scenario count
     * @param worker_count Number of pool threads
     * @param range_count Number of scenario ranges dispatched
     */
    void log_ensemble_start(
        const std::string& run_id,
        uint64_t iterations,
        size_t worker_count,
        size_t range_count
    );

    /**
     * @brief Log a worker picking up a scenario range
     */
    void log_worker_start(const ExecutionContext& ctx);

    /**
     * @brief Log a worker finishing a scenario range
     *
     * @param ctx Execution context
     * @param scenarios_completed Scenarios returned by the worker
     * @param execution_time_ms Wall time of the attempt
     */
    void log_worker_complete(
        const ExecutionContext& ctx,
        size_t scenarios_completed,
        double execution_time_ms
    );

    /**
     * @brief Log a failed attempt that will be retried on a fresh worker
     */
    void log_worker_retry(const ExecutionContext& ctx, const std::string& error_message);

    /**
     * @brief Log a scenario range that failed its last attempt
     */
    void log_worker_failed(const ExecutionContext& ctx, const std::string& error_message);

    /**
     * @brief Log an ensemble stopped early by cancel() or the run deadline
     *
     * @param run_id Ensemble run identifier
     * @param reason "cancelled" or "deadline"
     * @param completed Scenarios completed before the stop
     * @param requested Scenarios requested
     */
    void log_ensemble_cancelled(
        const std::string& run_id,
        const std::string& reason,
        uint64_t completed,
        uint64_t requested
    );

    /**
     * @brief Log the end of an ensemble run
     *
     * @param run_id Ensemble run identifier
     * @param status Final status (complete, partial_ensemble, cancelled)
     * @param completed Scenarios completed
     * @param requested Scenarios requested
     * @param success_probability Success probability over completed scenarios (0-100)
     * @param execution_time_ms Total run time
     */
    void log_ensemble_complete(
        const std::string& run_id,
        const std::string& status,
        uint64_t completed,
        uint64_t requested,
        double success_probability,
        double execution_time_ms
    );

    /**
     * @brief Log rejected input
     *
     * @param field Offending field (e.g. "primary.retirement_age")
     * @param message Diagnostic
     */
    void log_validation_error(const std::string& field, const std::string& message);

    /**
     * @brief Log error with context
     */
    void log_error(const ExecutionContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const ExecutionContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Get current log level
     */
    LogLevel get_min_level() const;

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
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const ExecutionContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace retirecalc

#endif // RETIRECALC_LOGGER_HPP
