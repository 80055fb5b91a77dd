/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "sync_engine.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace artcache {

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

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(
    const CacheLogContext& ctx,
    const std::string& event
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["cache_name"] = ctx.cache_name;
    if (!ctx.operation.empty()) {
        fields["operation"] = ctx.operation;
    }
    return fields;
}

void Logger::log_cache_initialized(
    const CacheLogContext& ctx,
    size_t entries_loaded,
    size_t stale_references,
    size_t untracked_files
) {
    auto fields = context_fields(ctx, "cache_initialized");
    fields["entries_loaded"] = std::to_string(entries_loaded);
    fields["stale_references"] = std::to_string(stale_references);
    fields["untracked_files"] = std::to_string(untracked_files);

    log(LogLevel::INFO, "Cache initialized", std::move(fields));
}

void Logger::log_sync_complete(
    const CacheLogContext& ctx,
    const SyncResult& result,
    double duration_ms
) {
    auto fields = context_fields(ctx, "sync_complete");
    fields["artifacts_supplied"] = std::to_string(result.artifacts_supplied);
    fields["artifacts_unresolved"] = std::to_string(result.artifacts_unresolved);
    fields["updated"] = std::to_string(result.updated_count);
    fields["copied"] = std::to_string(result.copied_keys.size());
    fields["removed"] = std::to_string(result.removed_keys.size());
    fields["copy_failures"] = std::to_string(result.failed_copies.size());
    fields["delete_failures"] = std::to_string(result.failed_deletes.size());
    fields["download_failed"] = result.download_failed ? "true" : "false";
    fields["cancelled"] = result.cancelled ? "true" : "false";
    fields["duration_ms"] = std::to_string(duration_ms);

    // First few failures only
    for (size_t i = 0; i < std::min(result.failed_copies.size(), size_t(5)); ++i) {
        fields["copy_failure_" + std::to_string(i)] =
            result.failed_copies[i].cache_key + ": " + result.failed_copies[i].error;
    }

    if (result.download_failed) {
        fields["download_error"] = result.download_error;
    }

    log(result.complete() ? LogLevel::INFO : LogLevel::WARN, "Synchronization completed", std::move(fields));
}

void Logger::log_cache_cleared(const CacheLogContext& ctx, size_t entries_dropped) {
    auto fields = context_fields(ctx, "cache_cleared");
    fields["entries_dropped"] = std::to_string(entries_dropped);

    log(LogLevel::INFO, "Cache cleared", std::move(fields));
}

void Logger::log_warning(const CacheLogContext& ctx, const std::string& warning_message) {
    auto fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const CacheLogContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Cache error", std::move(fields));
}

void Logger::log_info(const CacheLogContext& ctx, const std::string& message) {
    log(LogLevel::INFO, message, context_fields(ctx, "progress"));
}

void Logger::log_debug(const CacheLogContext& ctx, const std::string& message) {
    log(LogLevel::DEBUG, message, context_fields(ctx, "debug"));
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
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
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
                    // Escape control characters
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

} // namespace artcache
