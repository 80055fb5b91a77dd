/**
 * @file logger.hpp
 * @brief Structured logging for the artifact cache with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (cache name, operation)
 * - Sync metrics (files copied / removed, failures, duration)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef ARTCACHE_LOGGER_HPP
#define ARTCACHE_LOGGER_HPP

#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace artcache {

struct SyncResult;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-file operations)
    INFO,    ///< Informational messages (initialization, sync summaries)
    WARN,    ///< Warning messages (partial failures, inconsistent state)
    ERROR    ///< Error messages (failures, exceptions)
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
 * @brief Context attached to every cache log event
 */
struct CacheLogContext {
    std::string cache_name;          ///< Cache instance name
    std::string operation;           ///< initialize, put_all, clear_cache, ...

    CacheLogContext() = default;
    CacheLogContext(const std::string& name, const std::string& op)
        : cache_name(name), operation(op) {}
};

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
          log_file_path("artcache.log"),
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
 *   config.log_file_path = "artcache.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   CacheLogContext ctx("aars", "put_all");
 *   logger.log_sync_complete(ctx, result, duration_ms);
 *   @endcode
 *
 * All methods may be called from worker threads.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log completion of cache initialization
     *
     * @param ctx Log context
     * @param entries_loaded Entries in the index after reconciliation
     * @param stale_references Index entries dropped because their file was missing
     * @param untracked_files Files removed because no entry referenced them
     */
    void log_cache_initialized(
        const CacheLogContext& ctx,
        size_t entries_loaded,
        size_t stale_references,
        size_t untracked_files
    );

    /**
     * @brief Log the outcome of one put_all call
     */
    void log_sync_complete(
        const CacheLogContext& ctx,
        const SyncResult& result,
        double duration_ms
    );

    /**
     * @brief Log a cache clear
     */
    void log_cache_cleared(const CacheLogContext& ctx, size_t entries_dropped);

    void log_warning(const CacheLogContext& ctx, const std::string& warning_message);

    void log_error(const CacheLogContext& ctx, const std::string& error_message);

    void log_info(const CacheLogContext& ctx, const std::string& message);

    void log_debug(const CacheLogContext& ctx, const std::string& message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
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
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    std::map<std::string, std::string> context_fields(const CacheLogContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace artcache

#endif // ARTCACHE_LOGGER_HPP
