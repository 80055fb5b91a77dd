/**
 * @file prefetcher.cpp
 * @brief Prefetcher helpers
 */

#include "prefetcher.hpp"

namespace artcache {

std::future<void> make_ready_future() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

std::future<void> NoopPrefetcher::download_artifacts(
    const std::string& /* cache_name */,
    const std::vector<std::shared_ptr<RemoteOutputArtifact>>& /* artifacts */
) {
    return make_ready_future();
}

std::vector<std::shared_ptr<RemoteOutputArtifact>> get_remote_artifacts(
    const std::vector<std::shared_ptr<OutputArtifact>>& artifacts
) {
    std::vector<std::shared_ptr<RemoteOutputArtifact>> remote;
    for (const auto& artifact : artifacts) {
        auto r = std::dynamic_pointer_cast<RemoteOutputArtifact>(artifact);
        if (r) {
            remote.push_back(std::move(r));
        }
    }
    return remote;
}

} // namespace artcache
