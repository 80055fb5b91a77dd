/**
 * @file cache_entry.cpp
 * @brief Implementation of CacheEntry
 */

#include "cache_entry.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace artcache {

// FNV-1a, 64 bit. Stable across runs and platforms, unlike std::hash.
static std::uint64_t fnv1a_64(const std::string& data) {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

CacheEntry::CacheEntry(std::string cache_key, Fingerprint fingerprint, std::string file_name)
    : cache_key_(std::move(cache_key)),
      fingerprint_(std::move(fingerprint)),
      file_name_(std::move(file_name)) {}

CacheEntry CacheEntry::for_artifact(const OutputArtifact& artifact) {
    std::string key = cache_key_for(artifact.relative_path());
    // fingerprint() throws ArtifactNotFoundError when the artifact vanished
    Fingerprint fingerprint = artifact.fingerprint();
    return CacheEntry(key, std::move(fingerprint), file_name_for(key));
}

std::string CacheEntry::cache_key_for(const std::string& relative_path) {
    std::string basename = relative_path;
    size_t slash = basename.find_last_of("/\\");
    if (slash != std::string::npos) {
        basename = basename.substr(slash + 1);
    }

    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << fnv1a_64(relative_path);
    oss << "_" << basename;
    return oss.str();
}

std::string CacheEntry::file_name_for(const std::string& cache_key) {
    std::string file_name = cache_key;
    for (char& c : file_name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!safe) {
            c = '_';
        }
    }
    return file_name;
}

void to_json(json& j, const CacheEntry& entry) {
    json fingerprint;
    if (std::holds_alternative<std::int64_t>(entry.fingerprint())) {
        fingerprint["timestamp"] = std::get<std::int64_t>(entry.fingerprint());
    } else {
        fingerprint["digest"] = std::get<std::string>(entry.fingerprint());
    }

    j = json{
        {"cache_key", entry.cache_key()},
        {"file_name", entry.file_name()},
        {"fingerprint", fingerprint}
    };
}

CacheEntry cache_entry_from_json(const json& j) {
    const json& fp = j.at("fingerprint");
    Fingerprint fingerprint;
    if (fp.contains("timestamp")) {
        fingerprint = fp.at("timestamp").get<std::int64_t>();
    } else {
        fingerprint = fp.at("digest").get<std::string>();
    }

    return CacheEntry(
        j.at("cache_key").get<std::string>(),
        std::move(fingerprint),
        j.at("file_name").get<std::string>()
    );
}

} // namespace artcache
