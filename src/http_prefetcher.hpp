/**
 * @file http_prefetcher.hpp
 * @brief Remote artifacts served over HTTP(S) and their batch downloader
 */

#ifndef ARTCACHE_HTTP_PREFETCHER_HPP
#define ARTCACHE_HTTP_PREFETCHER_HPP

#include "prefetcher.hpp"
#include "worker_pool.hpp"
#include <filesystem>
#include <mutex>
#include <string>

namespace artcache {

/**
 * @brief Artifact stored at a URL, identified by the digest the build reported
 *
 * The digest is the fingerprint: a new build output gets a new digest. The
 * stream is the local copy staged by HttpPrefetcher.
 */
class HttpArtifact : public RemoteOutputArtifact {
public:
    HttpArtifact(std::string relative_path, std::string url, std::string digest);

    std::string relative_path() const override { return relative_path_; }

    /**
     * @throws ArtifactNotFoundError if no digest is known
     */
    Fingerprint fingerprint() const override;

    /**
     * @throws ArtifactIOError if the artifact has not been fetched
     */
    std::unique_ptr<std::istream> open_stream() const override;

    std::string to_string() const override;
    std::string remote_ref() const override { return url_; }
    bool is_fetched() const override;

    const std::string& digest() const { return digest_; }

    /**
     * @brief Record where the downloaded bytes live
     */
    void set_local_copy(const std::filesystem::path& path);

    std::filesystem::path local_copy() const;

private:
    std::string relative_path_;
    std::string url_;
    std::string digest_;

    mutable std::mutex mutex_;
    std::filesystem::path local_copy_;
};

/**
 * @brief Downloads HttpArtifacts into a staging directory
 *
 * Staged files are named <digest>-<basename> so an artifact whose digest did
 * not change is never downloaded twice.
 */
class HttpPrefetcher : public ArtifactPrefetcher {
public:
    /**
     * @param staging_dir Directory for downloaded files (created on demand)
     * @param timeout_ms Timeout per download
     */
    explicit HttpPrefetcher(std::filesystem::path staging_dir, int timeout_ms = 30000);

    /**
     * @brief Download every artifact on the prefetcher's background thread
     *
     * Batches run one after another. Dropping the returned future does not
     * wait for the batch.
     *
     * The returned future holds HttpClientError (or CacheError for artifacts
     * that are not HttpArtifacts) if any download fails.
     */
    std::future<void> download_artifacts(
        const std::string& cache_name,
        const std::vector<std::shared_ptr<RemoteOutputArtifact>>& artifacts
    ) override;

    const std::filesystem::path& staging_dir() const { return staging_dir_; }

    /**
     * @brief Staging file name for an artifact
     */
    static std::string staged_file_name(const HttpArtifact& artifact);

private:
    std::filesystem::path staging_dir_;
    int timeout_ms_;
    WorkerPool download_pool_{1};
};

} // namespace artcache

#endif // ARTCACHE_HTTP_PREFETCHER_HPP
