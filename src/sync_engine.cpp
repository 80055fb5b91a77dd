/**
 * @file sync_engine.cpp
 * @brief Implementation of the concurrent sync engine
 */

#include "sync_engine.hpp"
#include "logger.hpp"
#include <atomic>
#include <fstream>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace artcache {

SyncPlan plan_sync(
    const CacheState& state,
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
    bool remove_missing
) {
    SyncPlan plan;
    plan.artifacts_supplied = artifacts.size();

    // Collapse to the last resolved artifact per key, keeping first-seen order
    std::vector<std::string> order;
    std::unordered_map<std::string, PlannedCopy> resolved;

    for (const auto& artifact : artifacts) {
        if (!artifact) {
            plan.artifacts_unresolved++;
            continue;
        }

        try {
            CacheEntry entry = CacheEntry::for_artifact(*artifact);
            std::string key = entry.cache_key();

            auto it = resolved.find(key);
            if (it == resolved.end()) {
                order.push_back(key);
                resolved.emplace(key, PlannedCopy{key, artifact, std::move(entry)});
            } else {
                it->second.artifact = artifact;
                it->second.entry = std::move(entry);
            }
        } catch (const ArtifactNotFoundError&) {
            // Cannot be cached; the caller may hold a stale reference
            plan.artifacts_unresolved++;
        }
    }

    for (const auto& key : order) {
        const PlannedCopy& copy = resolved.at(key);
        auto existing = state.find(key);
        if (existing == state.end() || existing->second != copy.entry) {
            plan.updated.push_back(copy);
        }
    }

    // Unresolved artifacts do not protect their entries
    if (remove_missing) {
        for (const auto& pair : state) {
            if (resolved.count(pair.first) == 0) {
                plan.removed_keys.push_back(pair.first);
            }
        }
    }

    return plan;
}

SyncEngine::SyncEngine(
    std::string cache_name,
    fs::path cache_dir,
    std::shared_ptr<WorkerPool> pool,
    std::shared_ptr<ArtifactPrefetcher> prefetcher
)
    : cache_name_(std::move(cache_name)),
      cache_dir_(std::move(cache_dir)),
      pool_(std::move(pool)),
      prefetcher_(std::move(prefetcher)),
      poll_interval_(std::chrono::milliseconds(50)) {

    if (!pool_) {
        throw std::invalid_argument("SyncEngine: worker pool cannot be null");
    }
    if (!prefetcher_) {
        throw std::invalid_argument("SyncEngine: prefetcher cannot be null");
    }
}

void SyncEngine::copy_to(const OutputArtifact& artifact, const fs::path& dest) {
    static std::atomic<unsigned long> temp_counter{0};

    fs::path temp = dest;
    temp += ".tmp-" + std::to_string(temp_counter++);

    std::unique_ptr<std::istream> in = artifact.open_stream();

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw ArtifactIOError("Failed to open " + temp.string() + " for writing");
        }

        char buffer[64 * 1024];
        while (*in) {
            in->read(buffer, sizeof(buffer));
            std::streamsize n = in->gcount();
            if (n > 0) {
                out.write(buffer, n);
            }
            if (!out) break;
        }

        bool failed = in->bad() || !out;
        out.close();
        if (failed || !out) {
            std::error_code ec;
            fs::remove(temp, ec);
            throw ArtifactIOError("Failed to copy " + artifact.to_string() + " to " + dest.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw ArtifactIOError("Failed to move copy into place at " + dest.string() +
                              ": " + ec.message());
    }
}

std::vector<SyncEngine::PendingOperation> SyncEngine::copy_locally(
    const std::vector<PlannedCopy>& updated
) {
    std::vector<PendingOperation> operations;
    operations.reserve(updated.size());

    for (const auto& copy : updated) {
        // Tasks hold their own copies: they may outlive a cancelled sync
        std::shared_ptr<OutputArtifact> artifact = copy.artifact;
        fs::path dest = get_path_to_cached_file(cache_dir_, copy.entry.file_name());
        std::string key = copy.cache_key;
        std::string cache_name = cache_name_;

        auto future = pool_->submit([artifact, dest, key, cache_name]() {
            try {
                copy_to(*artifact, dest);
                return ItemResult::ok(key);
            } catch (const std::exception& e) {
                Logger::get_instance().log_warning(
                    CacheLogContext(cache_name, "copy"),
                    "Failed to copy artifact " + artifact->to_string() + " to " +
                        dest.parent_path().string() + ": " + e.what());
                return ItemResult::failure(key, e.what());
            }
        });

        operations.push_back(PendingOperation{key, std::move(future)});
    }

    return operations;
}

std::vector<SyncEngine::PendingOperation> SyncEngine::delete_cached_files(
    const CacheState& state,
    const std::vector<std::string>& removed_keys
) {
    std::vector<PendingOperation> operations;
    operations.reserve(removed_keys.size());

    for (const auto& key : removed_keys) {
        fs::path path = get_path_to_cached_file(cache_dir_, state.at(key).file_name());
        std::string cache_name = cache_name_;

        auto future = pool_->submit([path, key, cache_name]() {
            std::error_code ec;
            fs::remove(path, ec);  // a missing file counts as deleted
            if (ec) {
                Logger::get_instance().log_warning(
                    CacheLogContext(cache_name, "delete"),
                    "Failed to delete " + path.string() + ": " + ec.message());
                return ItemResult::failure(key, ec.message());
            }
            return ItemResult::ok(key);
        });

        operations.push_back(PendingOperation{key, std::move(future)});
    }

    return operations;
}

bool SyncEngine::wait_for(const std::future<void>& future, SyncContext& context) const {
    while (future.wait_for(poll_interval_) != std::future_status::ready) {
        if (context.is_cancel_requested()) {
            return false;
        }
    }
    return true;
}

bool SyncEngine::wait_for_all(
    const std::vector<PendingOperation>& operations,
    SyncContext& context
) const {
    for (const auto& op : operations) {
        while (op.future.wait_for(poll_interval_) != std::future_status::ready) {
            if (context.is_cancel_requested()) {
                return false;
            }
        }
    }
    return true;
}

// Unfinished operations (after a cancellation) are skipped
std::vector<ItemResult> SyncEngine::collect_finished(std::vector<PendingOperation>& operations) {
    std::vector<ItemResult> results;
    for (auto& op : operations) {
        if (!op.future.valid() ||
            op.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            continue;
        }
        try {
            results.push_back(op.future.get());
        } catch (const std::exception& e) {
            results.push_back(ItemResult::failure(op.cache_key, e.what()));
        }
    }
    return results;
}

SyncResult SyncEngine::sync(
    CacheState& state,
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
    bool remove_missing,
    SyncContext& context
) {
    CacheLogContext log_ctx(cache_name_, "put_all");
    SyncResult result;

    SyncPlan plan = plan_sync(state, artifacts, remove_missing);
    result.artifacts_supplied = plan.artifacts_supplied;
    result.artifacts_unresolved = plan.artifacts_unresolved;

    std::unordered_map<std::string, CacheEntry> updated_entries;
    std::vector<std::shared_ptr<OutputArtifact>> updated_artifacts;
    for (const auto& copy : plan.updated) {
        updated_entries.insert_or_assign(copy.cache_key, copy.entry);
        updated_artifacts.push_back(copy.artifact);
        Logger::get_instance().log_debug(
            log_ctx, "Updating " + copy.cache_key + " (" +
                     fingerprint_to_string(copy.entry.fingerprint()) + ")");
    }

    // Prefetch remote artifacts (if required)
    try {
        auto remote = get_remote_artifacts(updated_artifacts);
        if (!remote.empty()) {
            context.output(log_ctx, "Fetching Artifacts for " + cache_name_ + "...");
        }

        std::future<void> download = prefetcher_->download_artifacts(cache_name_, remote);
        if (!wait_for(download, context)) {
            result.cancelled = true;
            context.set_cancelled();
            return result;
        }
        download.get();

    } catch (const std::exception& e) {
        result.download_failed = true;
        result.download_error = e.what();
        Logger::get_instance().log_warning(
            log_ctx, cache_name_ + " synchronization didn't complete: " + e.what());
        context.warn(log_ctx, cache_name_ +
                     " synchronization didn't complete. Resyncing might fix the issue");
        return result;
    }

    // Copy and delete touch disjoint keys, so both batches run together
    result.updated_count = plan.updated.size();
    result.removal_count = plan.removed_keys.size();
    std::vector<PendingOperation> copies = copy_locally(plan.updated);
    std::vector<PendingOperation> deletes = delete_cached_files(state, plan.removed_keys);
    Logger::get_instance().log_debug(
        log_ctx, "Scheduled " + std::to_string(copies.size()) + " copies and " +
                 std::to_string(deletes.size()) + " deletions on " +
                 std::to_string(pool_->thread_count()) + " workers");

    bool finished = wait_for_all(copies, context) && wait_for_all(deletes, context);

    for (const auto& item : collect_finished(copies)) {
        if (item.success) {
            state.insert_or_assign(item.cache_key, updated_entries.at(item.cache_key));
            result.copied_keys.push_back(item.cache_key);
        } else {
            result.failed_copies.push_back(item);
        }
    }

    for (const auto& item : collect_finished(deletes)) {
        if (item.success) {
            state.erase(item.cache_key);
            result.removed_keys.push_back(item.cache_key);
        } else {
            result.failed_deletes.push_back(item);
        }
    }

    if (!result.copied_keys.empty()) {
        context.output(log_ctx, "Copied " + std::to_string(result.copied_keys.size()) +
                                " files to " + cache_name_);
    }
    if (!result.removed_keys.empty()) {
        context.output(log_ctx, "Removed " + std::to_string(result.removed_keys.size()) +
                                " files from " + cache_name_);
    }
    if (!result.failed_copies.empty() || !result.failed_deletes.empty()) {
        context.warn(log_ctx, cache_name_ + ": " +
                     std::to_string(result.failed_copies.size()) + " copies and " +
                     std::to_string(result.failed_deletes.size()) +
                     " deletions failed. Resyncing might fix the issue");
    }

    if (!finished) {
        result.cancelled = true;
        context.set_cancelled();
    }

    return result;
}

} // namespace artcache
