/**
 * @file artifact.hpp
 * @brief Abstract interface for build artifacts that can be mirrored into a cache
 *
 * An artifact is an opaque handle to a file produced by a build. The cache never
 * looks at artifact content directly; it asks the artifact for:
 * - A logical identity (its path relative to the build output root)
 * - A fingerprint that changes whenever the content changes
 * - A byte stream to copy into the cache directory
 *
 * Remote artifacts additionally need to be fetched before their stream can be
 * opened; see prefetcher.hpp.
 */

#ifndef ARTCACHE_ARTIFACT_HPP
#define ARTCACHE_ARTIFACT_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

namespace artcache {

/**
 * @brief Value used to detect that an artifact changed
 *
 * Either a modification timestamp (milliseconds since epoch) or an opaque
 * digest / version id reported by the remote store.
 */
using Fingerprint = std::variant<std::int64_t, std::string>;

/**
 * @brief Base exception for cache errors
 */
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when an artifact's identity or fingerprint cannot be resolved
 */
class ArtifactNotFoundError : public CacheError {
public:
    explicit ArtifactNotFoundError(const std::string& message)
        : CacheError("Artifact not found: " + message) {}
};

/**
 * @brief Raised when an artifact's bytes cannot be read
 */
class ArtifactIOError : public CacheError {
public:
    explicit ArtifactIOError(const std::string& message)
        : CacheError("Artifact I/O error: " + message) {}
};

/**
 * @brief A build output that can be copied into the cache
 *
 * Implementations must be safe to use from worker threads: the cache opens
 * streams for several artifacts concurrently.
 */
class OutputArtifact {
public:
    virtual ~OutputArtifact() = default;

    /**
     * @brief Path of the artifact relative to the build output root
     *
     * This is the logical identity the cache key is derived from.
     *
     * @throws ArtifactNotFoundError if the identity cannot be resolved
     */
    virtual std::string relative_path() const = 0;

    /**
     * @brief Current fingerprint of the artifact
     *
     * @throws ArtifactNotFoundError if the artifact no longer exists
     */
    virtual Fingerprint fingerprint() const = 0;

    /**
     * @brief Open the artifact content for reading
     *
     * @throws ArtifactIOError if the content cannot be opened
     */
    virtual std::unique_ptr<std::istream> open_stream() const = 0;

    /**
     * @brief Human-readable description for log messages
     */
    virtual std::string to_string() const { return relative_path(); }
};

/**
 * @brief An artifact whose bytes live in a remote store
 *
 * The stream of a remote artifact is only available after a prefetcher has
 * downloaded it (see ArtifactPrefetcher).
 */
class RemoteOutputArtifact : public OutputArtifact {
public:
    /**
     * @brief Location of the artifact in the remote store (URL, blob id, ...)
     */
    virtual std::string remote_ref() const = 0;

    /**
     * @brief True once the bytes have been fetched and the stream can be opened
     */
    virtual bool is_fetched() const = 0;
};

/**
 * @brief Artifact backed by a file on the local file system
 *
 * The fingerprint is the file's last-write time.
 */
class LocalFileArtifact : public OutputArtifact {
public:
    /**
     * @param path Absolute (or working-directory relative) path of the file
     * @param relative_path Logical path of the artifact in the build output
     */
    LocalFileArtifact(std::filesystem::path path, std::string relative_path);

    std::string relative_path() const override { return relative_path_; }
    Fingerprint fingerprint() const override;
    std::unique_ptr<std::istream> open_stream() const override;
    std::string to_string() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string relative_path_;
};

/**
 * @brief Render a fingerprint for log output
 */
std::string fingerprint_to_string(const Fingerprint& fingerprint);

} // namespace artcache

#endif // ARTCACHE_ARTIFACT_HPP
