/**
 * @file config.hpp
 * @brief Cache configuration and its JSON parser
 */

#ifndef ARTCACHE_CONFIG_HPP
#define ARTCACHE_CONFIG_HPP

#include "artifact.hpp"
#include "logger.hpp"
#include <string>

namespace artcache {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public CacheError {
public:
    explicit ConfigParseError(const std::string& message)
        : CacheError(message) {}
};

/**
 * @brief Settings of one LocalArtifactCache
 */
struct CacheConfig {
    std::string cache_name;
    std::string cache_dir;                    ///< Empty: get_default_cache_dir(cache_name)
    size_t worker_threads = 0;                ///< 0 = hardware concurrency
    bool remove_missing_artifacts = false;    ///< Default for put_all callers
    int download_timeout_ms = 30000;
    std::string staging_dir;                  ///< Empty: sibling of cache_dir
    LoggerConfig logging;
};

/**
 * @brief Parses a cache configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration with defaults filled in
 * @throws ConfigParseError if JSON is invalid or a field has the wrong type
 */
CacheConfig parse_cache_config_from_string(const std::string& json_string);

/**
 * @brief Parses a cache configuration from a JSON file
 *
 * Relative cache_dir, staging_dir and log file paths are resolved against the
 * directory containing the file.
 *
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 */
CacheConfig parse_cache_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

/**
 * @brief Per-user cache location: $XDG_CACHE_HOME or $HOME/.cache, then artcache/<name>
 */
std::string get_default_cache_dir(const std::string& cache_name);

/**
 * @brief Staging directory for downloads, outside the cache directory
 */
std::string get_staging_dir(const CacheConfig& config);

} // namespace artcache

#endif // ARTCACHE_CONFIG_HPP
