/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace retirecalc {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
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

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_ensemble_start(
    const std::string& run_id,
    uint64_t iterations,
    size_t worker_count,
    size_t range_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ensemble_start";
    fields["run_id"] = run_id;
    fields["iterations"] = std::to_string(iterations);
    fields["worker_count"] = std::to_string(worker_count);
    fields["range_count"] = std::to_string(range_count);

    log(LogLevel::INFO, "Starting ensemble", fields);
}

void Logger::log_worker_start(const ExecutionContext& ctx) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_start";
    add_context(fields, ctx);

    log(LogLevel::DEBUG, "Worker started scenario range", fields);
}

void Logger::log_worker_complete(
    const ExecutionContext& ctx,
    size_t scenarios_completed,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_complete";
    add_context(fields, ctx);
    fields["scenarios_completed"] = std::to_string(scenarios_completed);
    fields["execution_time_ms"] = format_number(execution_time_ms);
    fields["throughput_scenarios_per_sec"] = format_number(
        execution_time_ms > 0 ? (scenarios_completed * 1000.0 / execution_time_ms) : 0.0
    );

    log(LogLevel::INFO, "Worker completed scenario range", fields);
}

void Logger::log_worker_retry(const ExecutionContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_retry";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Retrying scenario range on a fresh worker", fields);
}

void Logger::log_worker_failed(const ExecutionContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_failed";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Scenario range failed", fields);
}

void Logger::log_ensemble_cancelled(
    const std::string& run_id,
    const std::string& reason,
    uint64_t completed,
    uint64_t requested
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ensemble_cancelled";
    fields["run_id"] = run_id;
    fields["reason"] = reason;
    fields["completed_scenarios"] = std::to_string(completed);
    fields["requested_scenarios"] = std::to_string(requested);

    log(LogLevel::WARN, "Ensemble stopped early", fields);
}

void Logger::log_ensemble_complete(
    const std::string& run_id,
    const std::string& status,
    uint64_t completed,
    uint64_t requested,
    double success_probability,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "ensemble_complete";
    fields["run_id"] = run_id;
    fields["status"] = status;
    fields["completed_scenarios"] = std::to_string(completed);
    fields["requested_scenarios"] = std::to_string(requested);
    fields["success_probability"] = format_number(success_probability);
    fields["execution_time_ms"] = format_number(execution_time_ms);

    log(completed == requested ? LogLevel::INFO : LogLevel::WARN, "Ensemble finished", fields);
}

void Logger::log_validation_error(const std::string& field, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "validation_error";
    fields["field"] = field;
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Invalid input", fields);
}

void Logger::log_error(const ExecutionContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Orchestrator error", fields);
}

void Logger::log_warning(const ExecutionContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
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

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
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
        // Plain text format
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

void Logger::add_context(std::map<std::string, std::string>& fields, const ExecutionContext& ctx) const {
    fields["run_id"] = ctx.run_id;
    fields["worker_id"] = std::to_string(ctx.worker_id);
    fields["range_begin"] = std::to_string(ctx.range_begin);
    fields["range_end"] = std::to_string(ctx.range_end);
    fields["attempt"] = std::to_string(ctx.attempt);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

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
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace retirecalc
