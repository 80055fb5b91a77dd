#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace artcache {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        if (pos < result.size() && std::isdigit(static_cast<unsigned char>(result[pos]))) {
            // "$5" is not a variable reference
            pos = start + 1;
            continue;
        }
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated "${": keep literally
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (name_end == name_start) {
            // Lone '$'
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).lexically_normal().string();
}

std::string get_default_cache_dir(const std::string& cache_name) {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".cache";
    } else {
        base = fs::temp_directory_path();
    }
    return (base / "artcache" / cache_name).string();
}

std::string get_staging_dir(const CacheConfig& config) {
    if (!config.staging_dir.empty()) {
        return config.staging_dir;
    }
    fs::path dir = fs::path(config.cache_dir).lexically_normal();
    if (!dir.has_filename()) {
        dir = dir.parent_path();
    }
    return dir.string() + ".staging";
}

CacheConfig parse_cache_config_from_string(const std::string& json_string) {
    CacheConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        // Parse cache_name (required)
        if (!j.contains("cache_name")) {
            throw ConfigParseError("Missing required field: cache_name");
        }
        config.cache_name = expand_environment_variables(j["cache_name"].get<std::string>());
        if (config.cache_name.empty()) {
            throw ConfigParseError("cache_name cannot be empty");
        }

        if (j.contains("cache_dir")) {
            config.cache_dir = expand_environment_variables(j["cache_dir"].get<std::string>());
        }

        if (j.contains("worker_threads")) {
            int threads = j["worker_threads"].get<int>();
            if (threads < 0) {
                throw ConfigParseError("worker_threads cannot be negative");
            }
            config.worker_threads = static_cast<size_t>(threads);
        }

        if (j.contains("remove_missing_artifacts")) {
            config.remove_missing_artifacts = j["remove_missing_artifacts"].get<bool>();
        }

        // Parse download (optional)
        if (j.contains("download")) {
            const auto& download = j["download"];
            if (download.contains("timeout_ms")) {
                config.download_timeout_ms = download["timeout_ms"].get<int>();
                if (config.download_timeout_ms <= 0) {
                    throw ConfigParseError("download.timeout_ms must be positive");
                }
            }
            if (download.contains("staging_dir")) {
                config.staging_dir = expand_environment_variables(
                    download["staging_dir"].get<std::string>()
                );
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                std::string level = logging["level"].get<std::string>();
                if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
                    throw ConfigParseError("Unknown log level: " + level);
                }
                config.logging.min_level = string_to_level(level);
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = expand_environment_variables(
                    logging["file"].get<std::string>()
                );
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    if (config.cache_dir.empty()) {
        config.cache_dir = get_default_cache_dir(config.cache_name);
    }

    return config;
}

CacheConfig parse_cache_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CacheConfig config = parse_cache_config_from_string(buffer.str());

    // Resolve relative paths
    config.cache_dir = resolve_relative_path(config.cache_dir, file_path);
    if (!config.staging_dir.empty()) {
        config.staging_dir = resolve_relative_path(config.staging_dir, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace artcache
