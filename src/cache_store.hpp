/**
 * @file cache_store.hpp
 * @brief Persistence of the cache index and reconciliation with the file tree
 *
 * The cache directory holds the cached artifact files plus one descriptor
 * file (cache_data.json) recording which files the cache legitimately owns:
 *
 *   <cache_dir>/
 *     cache_data.json          serialized CacheState
 *     0123456789abcdef_a.aar   cached artifact
 *     ...
 *
 * The descriptor is the only durable record of the index. It is rewritten
 * atomically (temp file + rename) after every mutation, and re-validated
 * against the real directory contents at startup because the process may
 * have died between a file operation and the descriptor update.
 */

#ifndef ARTCACHE_CACHE_STORE_HPP
#define ARTCACHE_CACHE_STORE_HPP

#include "cache_entry.hpp"
#include "worker_pool.hpp"
#include <filesystem>
#include <future>
#include <set>
#include <string>
#include <vector>

namespace artcache {

/// Name of the descriptor file inside the cache directory
inline const std::string CACHE_DATA_FILE_NAME = "cache_data.json";

/// Current descriptor format version
constexpr int CACHE_DATA_FORMAT_VERSION = 1;

/**
 * @brief Raised when the descriptor cannot be read, parsed or written
 */
class CacheDataError : public CacheError {
public:
    explicit CacheDataError(const std::string& message)
        : CacheError("Cache data error: " + message) {}
};

/**
 * @brief Raised when the cache directory itself cannot be operated on
 */
class CacheOperationError : public CacheError {
public:
    explicit CacheOperationError(const std::string& message)
        : CacheError("Cache operation failed: " + message) {}
};

/**
 * @brief Outcome of one file operation (copy or delete) for one key
 */
struct ItemResult {
    std::string cache_key;           ///< Key (or file name for untracked files)
    bool success;                    ///< True if the operation completed
    std::string error;               ///< Cause of failure if success == false

    static ItemResult ok(const std::string& key) {
        return ItemResult{key, true, ""};
    }

    static ItemResult failure(const std::string& key, const std::string& error) {
        return ItemResult{key, false, error};
    }
};

/**
 * @brief Path of the descriptor file for a cache directory
 */
std::filesystem::path get_cache_data_file(const std::filesystem::path& cache_dir);

/**
 * @brief Path of a cached artifact file
 */
std::filesystem::path get_path_to_cached_file(
    const std::filesystem::path& cache_dir,
    const std::string& file_name
);

/**
 * @brief Names of all entries in the cache directory except the descriptor
 *
 * A missing directory yields an empty set.
 *
 * @throws CacheOperationError if the directory cannot be listed
 */
std::set<std::string> get_cache_files(const std::filesystem::path& cache_dir);

/**
 * @brief Serialize an index to descriptor JSON text
 */
std::string serialize_cache_data(const CacheState& state);

/**
 * @brief Parse descriptor JSON text into an index
 *
 * @throws CacheDataError on malformed JSON, unknown format version,
 *         or entries whose file name is not a plain file name
 */
CacheState parse_cache_data(const std::string& text);

/**
 * @brief Read and parse a descriptor file
 *
 * @throws CacheDataError if the file cannot be read or parsed
 */
CacheState load_cache_data(const std::filesystem::path& cache_data_file);

/**
 * @brief Atomically write the descriptor for an index
 *
 * Writes <descriptor>.tmp, then renames it over the descriptor, so a reader
 * never sees a partially written file. Creates cache_dir if needed.
 *
 * @throws CacheDataError if the descriptor cannot be written
 */
void write_cache_data(const std::filesystem::path& cache_dir, const CacheState& state);

/**
 * @brief Drop index entries whose backing file is not on disk
 *
 * @param cached_files Result of get_cache_files()
 * @param state Index to prune in place
 * @return Keys of the removed entries
 */
std::vector<std::string> remove_stale_references(
    const std::set<std::string>& cached_files,
    CacheState& state
);

/**
 * @brief Delete, concurrently, every file not referenced by the index
 *
 * @return One future per deleted file; each yields the file name and outcome
 */
std::vector<std::future<ItemResult>> remove_untracked_files(
    const std::filesystem::path& cache_dir,
    const std::set<std::string>& cached_files,
    const CacheState& state,
    WorkerPool& pool
);

/**
 * @brief Delete, concurrently, everything in the cache directory
 *
 * Includes the descriptor. Best effort: individual failures are reported
 * through the returned futures.
 *
 * @throws CacheOperationError if the directory cannot be listed
 */
std::vector<std::future<ItemResult>> clear_cache_dir(
    const std::filesystem::path& cache_dir,
    WorkerPool& pool
);

} // namespace artcache

#endif // ARTCACHE_CACHE_STORE_HPP
