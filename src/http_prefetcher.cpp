/**
 * @file http_prefetcher.cpp
 * @brief Implementation of HttpArtifact and HttpPrefetcher
 */

#include "http_prefetcher.hpp"
#include "cache_entry.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace artcache {

HttpArtifact::HttpArtifact(std::string relative_path, std::string url, std::string digest)
    : relative_path_(std::move(relative_path)),
      url_(std::move(url)),
      digest_(std::move(digest)) {}

Fingerprint HttpArtifact::fingerprint() const {
    if (digest_.empty()) {
        throw ArtifactNotFoundError(relative_path_ + " has no digest");
    }
    return digest_;
}

std::unique_ptr<std::istream> HttpArtifact::open_stream() const {
    fs::path path = local_copy();
    if (path.empty()) {
        throw ArtifactIOError(url_ + " has not been fetched");
    }

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        throw ArtifactIOError("Failed to open staged copy " + path.string());
    }
    return stream;
}

std::string HttpArtifact::to_string() const {
    return relative_path_ + " (" + url_ + ")";
}

bool HttpArtifact::is_fetched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !local_copy_.empty();
}

void HttpArtifact::set_local_copy(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_copy_ = path;
}

fs::path HttpArtifact::local_copy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_copy_;
}

HttpPrefetcher::HttpPrefetcher(fs::path staging_dir, int timeout_ms)
    : staging_dir_(std::move(staging_dir)), timeout_ms_(timeout_ms) {}

std::string HttpPrefetcher::staged_file_name(const HttpArtifact& artifact) {
    // Reuse the cache's file name sanitizing
    return CacheEntry::file_name_for(artifact.digest() + "-" +
                                     fs::path(artifact.relative_path()).filename().string());
}

std::future<void> HttpPrefetcher::download_artifacts(
    const std::string& cache_name,
    const std::vector<std::shared_ptr<RemoteOutputArtifact>>& artifacts
) {
    if (artifacts.empty()) {
        return make_ready_future();
    }

    fs::path staging_dir = staging_dir_;
    int timeout_ms = timeout_ms_;

    return download_pool_.submit([cache_name, artifacts, staging_dir, timeout_ms]() {
        CacheLogContext ctx(cache_name, "prefetch");

        std::error_code ec;
        fs::create_directories(staging_dir, ec);
        if (ec) {
            throw CacheError("Cannot create staging directory " + staging_dir.string() +
                             ": " + ec.message());
        }

        HttpClient client(timeout_ms);
        client.set_debug(Logger::get_instance().get_min_level() == LogLevel::DEBUG);
        size_t downloaded = 0;

        for (const auto& remote : artifacts) {
            auto artifact = std::dynamic_pointer_cast<HttpArtifact>(remote);
            if (!artifact) {
                throw CacheError("Cannot fetch " + remote->to_string() +
                                 ": not an HTTP artifact");
            }

            fs::path staged = staging_dir / staged_file_name(*artifact);
            if (fs::exists(staged, ec)) {
                artifact->set_local_copy(staged);
                continue;
            }

            fs::path partial = staged;
            partial += ".part";
            client.download(artifact->remote_ref(), partial);

            fs::rename(partial, staged, ec);
            if (ec) {
                throw CacheError("Failed to stage " + staged.string() + ": " + ec.message());
            }

            artifact->set_local_copy(staged);
            downloaded++;
        }

        Logger::get_instance().log_debug(
            ctx, "Downloaded " + std::to_string(downloaded) + " of " +
                 std::to_string(artifacts.size()) + " artifacts");
    });
}

} // namespace artcache
