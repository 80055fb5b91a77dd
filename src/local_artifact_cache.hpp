/**
 * @file local_artifact_cache.hpp
 * @brief Disk-backed ArtifactCache
 *
 * Owns one cache directory and its index. The directory holds one file per
 * entry plus the cache_data.json descriptor. Every mutating operation ends by
 * writing the descriptor, and initialize() reconciles the descriptor with the
 * directory contents, so a crash between a file operation and the next write
 * is repaired at the next start.
 *
 * Thread safety: all public operations serialize on one instance-wide mutex.
 * Two instances must not share a directory.
 */

#ifndef ARTCACHE_LOCAL_ARTIFACT_CACHE_HPP
#define ARTCACHE_LOCAL_ARTIFACT_CACHE_HPP

#include "artifact_cache.hpp"
#include "cache_entry.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "prefetcher.hpp"
#include "sync_engine.hpp"
#include "worker_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace artcache {

/**
 * @brief Counters accumulated over the lifetime of a cache instance
 */
struct CacheStats {
    size_t entries_count = 0;     ///< Current index size
    size_t files_copied = 0;
    size_t files_removed = 0;
    size_t copy_failures = 0;
    size_t delete_failures = 0;
    size_t sync_count = 0;        ///< put_all calls
};

class LocalArtifactCache : public ArtifactCache {
public:
    /**
     * @param cache_name Name used in progress and log output
     * @param cache_dir Directory owned by this cache (created by initialize)
     * @param pool Executor for file operations
     * @param prefetcher Batch downloader for remote artifacts
     * @throws std::invalid_argument if pool or prefetcher is null
     */
    LocalArtifactCache(
        std::string cache_name,
        std::filesystem::path cache_dir,
        std::shared_ptr<WorkerPool> pool,
        std::shared_ptr<ArtifactPrefetcher> prefetcher
    );

    /**
     * @brief Build a cache with its own worker pool and an HttpPrefetcher
     */
    explicit LocalArtifactCache(const CacheConfig& config);

    ~LocalArtifactCache() override = default;

    LocalArtifactCache(const LocalArtifactCache&) = delete;
    LocalArtifactCache& operator=(const LocalArtifactCache&) = delete;

    /**
     * @brief Load the descriptor and reconcile it with the directory
     *
     * - Descriptor missing while files exist: the directory is cleared.
     * - Descriptor unreadable: a warning is logged and the index starts empty,
     *   so every file is swept.
     * - Entries whose file is missing are dropped.
     * - Files no entry references are deleted.
     *
     * The reconciled index is always written back.
     */
    void initialize() override;

    /**
     * @brief Delete every file in the directory and persist an empty index
     *
     * The index ends empty even when some deletions fail.
     */
    void clear_cache() override;

    /**
     * @throws UnsupportedOperationError always
     */
    void refresh() override;

    SyncResult put_all(
        const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
        SyncContext& context,
        bool remove_missing_artifacts
    ) override;

    /**
     * @brief Path for a key; no filesystem check is made
     */
    std::optional<std::filesystem::path> get(const std::string& cache_key) override;

    /**
     * @brief Path for an artifact's key; empty if it cannot be resolved
     */
    std::optional<std::filesystem::path> get(const OutputArtifact& artifact) override;

    CacheStats get_stats() const;

    const std::string& cache_name() const { return cache_name_; }
    const std::filesystem::path& cache_dir() const { return cache_dir_; }

    /**
     * @brief Snapshot of the index
     */
    CacheState entries() const;

    /**
     * @brief Forwarded to the sync engine; used to make cancellation prompt in tests
     */
    void set_poll_interval(std::chrono::milliseconds interval);

private:
    std::string cache_name_;
    std::filesystem::path cache_dir_;
    std::shared_ptr<WorkerPool> pool_;
    SyncEngine engine_;

    mutable std::mutex mutex_;
    CacheState state_;
    CacheStats stats_;

    void clear_cache_locked();

    /**
     * @brief Persist the index; failures become warnings
     */
    void write_locked(const CacheLogContext& ctx);

    /**
     * @brief Wait for file deletions and log the failures
     * @return Number of successful deletions
     */
    size_t wait_for_deletions(
        std::vector<std::future<ItemResult>>& futures,
        const CacheLogContext& ctx
    );
};

} // namespace artcache

#endif // ARTCACHE_LOCAL_ARTIFACT_CACHE_HPP
