/**
 * @file sync_engine.hpp
 * @brief Batch reconciliation of a cache index against a set of artifacts
 *
 * One sync runs in phases separated by join-all barriers:
 *
 *   plan      classify artifacts into updated / removed against the index
 *   download  one batch request for the updated remote artifacts
 *   copy      one pool task per updated artifact
 *   delete    one pool task per removed key
 *   merge     apply only the operations that succeeded
 *
 * A failed copy leaves the previous entry for its key untouched, and a failed
 * delete leaves the stale entry in place, so the next sync retries it. The
 * engine never persists the index; the owning cache does that afterwards.
 */

#ifndef ARTCACHE_SYNC_ENGINE_HPP
#define ARTCACHE_SYNC_ENGINE_HPP

#include "cache_entry.hpp"
#include "cache_store.hpp"
#include "prefetcher.hpp"
#include "sync_context.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace artcache {

/**
 * @brief An artifact that must be (re)copied, with the entry it will get
 */
struct PlannedCopy {
    std::string cache_key;
    std::shared_ptr<OutputArtifact> artifact;
    CacheEntry entry;
};

/**
 * @brief Work decided by the classification step
 */
struct SyncPlan {
    std::vector<PlannedCopy> updated;        ///< New or changed artifacts
    std::vector<std::string> removed_keys;   ///< Indexed keys absent from the input
    size_t artifacts_supplied = 0;
    size_t artifacts_unresolved = 0;         ///< Skipped: identity or fingerprint unavailable
};

/**
 * @brief Outcome of one sync
 */
struct SyncResult {
    size_t artifacts_supplied = 0;
    size_t artifacts_unresolved = 0;
    size_t updated_count = 0;                ///< Copies attempted
    size_t removal_count = 0;                ///< Deletes attempted
    std::vector<std::string> copied_keys;    ///< Merged into the index
    std::vector<std::string> removed_keys;   ///< Dropped from the index
    std::vector<ItemResult> failed_copies;
    std::vector<ItemResult> failed_deletes;
    bool download_failed = false;
    std::string download_error;
    bool cancelled = false;

    /**
     * @brief True if every planned operation succeeded
     */
    bool complete() const {
        return !download_failed && !cancelled &&
               failed_copies.empty() && failed_deletes.empty() &&
               copied_keys.size() == updated_count &&
               removed_keys.size() == removal_count;
    }
};

/**
 * @brief Classify artifacts against the current index
 *
 * Artifacts whose identity or fingerprint cannot be resolved are skipped.
 * When a key occurs more than once, the last resolved artifact for it wins.
 * An artifact is updated when no entry exists for its key or the existing
 * entry differs. With remove_missing, every indexed key not among the
 * resolved artifacts' keys is scheduled for removal; otherwise nothing is.
 */
SyncPlan plan_sync(
    const CacheState& state,
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
    bool remove_missing
);

class SyncEngine {
public:
    /**
     * @param cache_name Name used in progress output
     * @param cache_dir Directory holding the cached files
     * @param pool Executor for copy and delete tasks
     * @param prefetcher Batch downloader for remote artifacts
     */
    SyncEngine(
        std::string cache_name,
        std::filesystem::path cache_dir,
        std::shared_ptr<WorkerPool> pool,
        std::shared_ptr<ArtifactPrefetcher> prefetcher
    );

    /**
     * @brief Bring the cache directory and index in line with the artifacts
     *
     * Mutates state only for operations that succeeded. Never throws for I/O
     * failures: they are reported in the result and through the context. If
     * the context requests cancellation, the engine stops waiting, merges
     * what already finished, and marks the context cancelled.
     */
    SyncResult sync(
        CacheState& state,
        const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
        bool remove_missing,
        SyncContext& context
    );

    /**
     * @brief How often waits check for a cancellation request
     */
    void set_poll_interval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

    /**
     * @brief Copy an artifact's bytes to dest via a temporary sibling file
     *
     * The destination is replaced only once the full content was written.
     *
     * @throws ArtifactIOError if the stream cannot be read or the file written
     */
    static void copy_to(const OutputArtifact& artifact, const std::filesystem::path& dest);

private:
    std::string cache_name_;
    std::filesystem::path cache_dir_;
    std::shared_ptr<WorkerPool> pool_;
    std::shared_ptr<ArtifactPrefetcher> prefetcher_;
    std::chrono::milliseconds poll_interval_;

    struct PendingOperation {
        std::string cache_key;
        std::future<ItemResult> future;
    };

    std::vector<PendingOperation> copy_locally(const std::vector<PlannedCopy>& updated);
    std::vector<PendingOperation> delete_cached_files(
        const CacheState& state,
        const std::vector<std::string>& removed_keys
    );

    static std::vector<ItemResult> collect_finished(std::vector<PendingOperation>& operations);

    bool wait_for(const std::future<void>& future, SyncContext& context) const;
    bool wait_for_all(const std::vector<PendingOperation>& operations, SyncContext& context) const;
};

} // namespace artcache

#endif // ARTCACHE_SYNC_ENGINE_HPP
