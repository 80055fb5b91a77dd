/**
 * @file cache_entry.hpp
 * @brief Metadata describing one cached artifact
 *
 * Every artifact handed to the cache is mapped to a CacheEntry. The entry
 * captures what is needed to tell whether the artifact changed since it was
 * copied (its fingerprint) and where the local copy lives (its file name).
 */

#ifndef ARTCACHE_CACHE_ENTRY_HPP
#define ARTCACHE_CACHE_ENTRY_HPP

#include "artifact.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace artcache {

/**
 * @brief Immutable description of a cached artifact
 *
 * Two entries are equal iff their cache key and fingerprint match; equality
 * is the only signal used to decide that an artifact changed.
 */
class CacheEntry {
public:
    CacheEntry(std::string cache_key, Fingerprint fingerprint, std::string file_name);

    /**
     * @brief Build the entry describing the current state of an artifact
     *
     * @throws ArtifactNotFoundError if the artifact's fingerprint cannot be resolved
     */
    static CacheEntry for_artifact(const OutputArtifact& artifact);

    /**
     * @brief Derive the cache key for an artifact's relative path
     *
     * Format: 16 hex digits of FNV-1a-64 over the path, '_', path basename.
     */
    static std::string cache_key_for(const std::string& relative_path);

    /**
     * @brief Derive the on-disk file name for a cache key
     *
     * Characters outside [A-Za-z0-9._-] are replaced with '_'.
     */
    static std::string file_name_for(const std::string& cache_key);

    const std::string& cache_key() const { return cache_key_; }
    const Fingerprint& fingerprint() const { return fingerprint_; }
    const std::string& file_name() const { return file_name_; }

    bool operator==(const CacheEntry& other) const {
        return cache_key_ == other.cache_key_ && fingerprint_ == other.fingerprint_;
    }
    bool operator!=(const CacheEntry& other) const { return !(*this == other); }

private:
    std::string cache_key_;
    Fingerprint fingerprint_;
    std::string file_name_;
};

/**
 * @brief In-memory index: cache key -> entry
 */
using CacheState = std::unordered_map<std::string, CacheEntry>;

void to_json(nlohmann::json& j, const CacheEntry& entry);
CacheEntry cache_entry_from_json(const nlohmann::json& j);

} // namespace artcache

#endif // ARTCACHE_CACHE_ENTRY_HPP
