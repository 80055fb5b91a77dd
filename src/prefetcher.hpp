/**
 * @file prefetcher.hpp
 * @brief Batch download of remote artifacts before they are copied into a cache
 *
 * The cache asks the prefetcher once per put_all call for the whole set of
 * changed remote artifacts. Batching lets implementations reuse connections
 * and amortize round trips. A failed future means the whole batch failed;
 * callers do not try to find out which artifact was at fault.
 */

#ifndef ARTCACHE_PREFETCHER_HPP
#define ARTCACHE_PREFETCHER_HPP

#include "artifact.hpp"
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace artcache {

class ArtifactPrefetcher {
public:
    virtual ~ArtifactPrefetcher() = default;

    /**
     * @brief Fetch the bytes of every given artifact
     *
     * @param cache_name Name of the requesting cache (for logging)
     * @param artifacts Remote artifacts to fetch; may be empty
     * @return Future that becomes ready when all downloads finished, or holds
     *         the first error encountered
     */
    virtual std::future<void> download_artifacts(
        const std::string& cache_name,
        const std::vector<std::shared_ptr<RemoteOutputArtifact>>& artifacts
    ) = 0;
};

/**
 * @brief Prefetcher for setups where every artifact is already local
 */
class NoopPrefetcher : public ArtifactPrefetcher {
public:
    std::future<void> download_artifacts(
        const std::string& cache_name,
        const std::vector<std::shared_ptr<RemoteOutputArtifact>>& artifacts
    ) override;
};

/**
 * @brief Select the artifacts that need a download step
 */
std::vector<std::shared_ptr<RemoteOutputArtifact>> get_remote_artifacts(
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts
);

/**
 * @brief A future that is already satisfied
 */
std::future<void> make_ready_future();

} // namespace artcache

#endif // ARTCACHE_PREFETCHER_HPP
