/**
 * @file artifact_cache.hpp
 * @brief Abstract interface of a local cache of build artifacts
 */

#ifndef ARTCACHE_ARTIFACT_CACHE_HPP
#define ARTCACHE_ARTIFACT_CACHE_HPP

#include "artifact.hpp"
#include "sync_context.hpp"
#include "sync_engine.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace artcache {

/**
 * @brief Raised by operations a cache implementation does not provide
 */
class UnsupportedOperationError : public CacheError {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : CacheError(message) {}
};

class ArtifactCache {
public:
    virtual ~ArtifactCache() = default;

    /**
     * @brief Load and reconcile the persisted state. Blocks on disk I/O.
     */
    virtual void initialize() = 0;

    /**
     * @brief Remove every cached file and reset the index
     */
    virtual void clear_cache() = 0;

    /**
     * @brief Revalidate cached entries against their sources
     */
    virtual void refresh() = 0;

    /**
     * @brief Add or update the given artifacts
     *
     * @param artifacts Artifacts to cache
     * @param context Progress sink and cancellation signal
     * @param remove_missing_artifacts Also evict entries not among the artifacts
     */
    virtual SyncResult put_all(
        const std::vector<std::shared_ptr<OutputArtifact>>& artifacts,
        SyncContext& context,
        bool remove_missing_artifacts
    ) = 0;

    /**
     * @brief Local path of a cached entry, if the key is known
     */
    virtual std::optional<std::filesystem::path> get(const std::string& cache_key) = 0;

    /**
     * @brief Local path for an artifact, if it resolves and is cached
     */
    virtual std::optional<std::filesystem::path> get(const OutputArtifact& artifact) = 0;
};

} // namespace artcache

#endif // ARTCACHE_ARTIFACT_CACHE_HPP
