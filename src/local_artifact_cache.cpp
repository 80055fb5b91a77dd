/**
 * @file local_artifact_cache.cpp
 * @brief Implementation of LocalArtifactCache
 */

#include "local_artifact_cache.hpp"
#include "cache_store.hpp"
#include "http_prefetcher.hpp"
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace artcache {

LocalArtifactCache::LocalArtifactCache(
    std::string cache_name,
    fs::path cache_dir,
    std::shared_ptr<WorkerPool> pool,
    std::shared_ptr<ArtifactPrefetcher> prefetcher
)
    : cache_name_(std::move(cache_name)),
      cache_dir_(std::move(cache_dir)),
      pool_(pool),
      engine_(cache_name_, cache_dir_, std::move(pool), std::move(prefetcher)) {}

LocalArtifactCache::LocalArtifactCache(const CacheConfig& config)
    : LocalArtifactCache(
          config.cache_name,
          config.cache_dir,
          std::make_shared<WorkerPool>(config.worker_threads),
          std::make_shared<HttpPrefetcher>(get_staging_dir(config), config.download_timeout_ms)) {}

void LocalArtifactCache::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheLogContext ctx(cache_name_, "initialize");
    Logger& logger = Logger::get_instance();

    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        logger.log_error(ctx, "Cannot create " + cache_dir_.string() + ": " + ec.message());
    }

    state_.clear();
    size_t stale = 0;
    size_t untracked = 0;

    try {
        std::set<std::string> cached_files = get_cache_files(cache_dir_);
        fs::path cache_data_file = get_cache_data_file(cache_dir_);

        if (!fs::exists(cache_data_file, ec) && !cached_files.empty()) {
            logger.log_warning(ctx, cache_data_file.string() + " does not exist, but " +
                               cache_dir_.string() +
                               " contains cached files. Clearing directory for a clean start.");
            clear_cache_locked();
            logger.log_cache_initialized(ctx, 0, 0, cached_files.size());
            return;
        }

        if (fs::exists(cache_data_file, ec)) {
            try {
                state_ = load_cache_data(cache_data_file);
            } catch (const CacheDataError& e) {
                logger.log_warning(ctx, std::string(e.what()) + ". Starting with an empty index.");
                state_.clear();
            }
        }

        std::vector<std::string> removed = remove_stale_references(cached_files, state_);
        stale = removed.size();
        if (stale > 0) {
            logger.log_warning(ctx, std::to_string(stale) + " invalid references in " +
                               cache_name_ + ". Removed invalid references.");
        }

        auto deletions = remove_untracked_files(cache_dir_, cached_files, state_, *pool_);
        untracked = wait_for_deletions(deletions, ctx);

    } catch (const CacheOperationError& e) {
        logger.log_warning(ctx, e.what());
    }

    write_locked(ctx);
    logger.log_cache_initialized(ctx, state_.size(), stale, untracked);
}

void LocalArtifactCache::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_cache_locked();
}

void LocalArtifactCache::clear_cache_locked() {
    CacheLogContext ctx(cache_name_, "clear_cache");
    size_t dropped = state_.size();

    try {
        auto deletions = clear_cache_dir(cache_dir_, *pool_);
        wait_for_deletions(deletions, ctx);
    } catch (const CacheOperationError& e) {
        Logger::get_instance().log_warning(
            ctx, "Could not delete contents of " + cache_dir_.string() + ": " + e.what());
    }

    // The index ends empty whatever the deletions did
    state_.clear();
    write_locked(ctx);
    Logger::get_instance().log_cache_cleared(ctx, dropped);
}

void LocalArtifactCache::refresh() {
    throw UnsupportedOperationError("Operation is not supported.");
}

SyncResult LocalArtifactCache::put_all(
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
    SyncContext& context,
    bool remove_missing_artifacts
) {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheLogContext ctx(cache_name_, "put_all");
    auto start = std::chrono::steady_clock::now();

    SyncResult result = engine_.sync(state_, artifacts, remove_missing_artifacts, context);

    // Persist whatever succeeded, including after a cancellation
    write_locked(ctx);

    stats_.sync_count++;
    stats_.files_copied += result.copied_keys.size();
    stats_.files_removed += result.removed_keys.size();
    stats_.copy_failures += result.failed_copies.size();
    stats_.delete_failures += result.failed_deletes.size();

    auto end = std::chrono::steady_clock::now();
    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    Logger::get_instance().log_sync_complete(ctx, result, duration_ms);

    return result;
}

std::optional<fs::path> LocalArtifactCache::get(const std::string& cache_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(cache_key);
    if (it == state_.end()) {
        return std::nullopt;
    }
    return get_path_to_cached_file(cache_dir_, it->second.file_name());
}

std::optional<fs::path> LocalArtifactCache::get(const OutputArtifact& artifact) {
    std::string cache_key;
    try {
        cache_key = CacheEntry::for_artifact(artifact).cache_key();
    } catch (const ArtifactNotFoundError&) {
        return std::nullopt;
    }
    return get(cache_key);
}

CacheStats LocalArtifactCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats = stats_;
    stats.entries_count = state_.size();
    return stats;
}

CacheState LocalArtifactCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void LocalArtifactCache::set_poll_interval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_.set_poll_interval(interval);
}

void LocalArtifactCache::write_locked(const CacheLogContext& ctx) {
    try {
        write_cache_data(cache_dir_, state_);
    } catch (const CacheDataError& e) {
        // The in-memory index stays authoritative for this process
        Logger::get_instance().log_warning(ctx, std::string("Failed to write cache data: ") + e.what());
    }
}

size_t LocalArtifactCache::wait_for_deletions(
    std::vector<std::future<ItemResult>>& futures,
    const CacheLogContext& ctx
) {
    size_t deleted = 0;
    for (auto& future : futures) {
        try {
            ItemResult item = future.get();
            if (item.success) {
                deleted++;
            } else {
                Logger::get_instance().log_warning(ctx, item.error);
            }
        } catch (const std::exception& e) {
            Logger::get_instance().log_warning(ctx, std::string("Deletion failed: ") + e.what());
        }
    }
    return deleted;
}

} // namespace artcache
