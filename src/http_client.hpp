/**
 * @file http_client.hpp
 * @brief libcurl-based downloader for remote artifacts
 */

#ifndef ARTCACHE_HTTP_CLIENT_HPP
#define ARTCACHE_HTTP_CLIENT_HPP

#include "artifact.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace artcache {

/**
 * @brief Download outcome
 */
struct HttpResponse {
    int status_code;                 ///< HTTP status (0 for file:// transfers)
    size_t bytes_received;
    std::chrono::milliseconds duration;
};

/**
 * @brief HTTP client error
 */
class HttpClientError : public CacheError {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : CacheError(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * @brief HTTP client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s max 3 retries)
 * - Configurable timeout (default 30s)
 * - Connection reuse across downloads via one curl handle
 * - Any URL scheme libcurl supports, including file://
 *
 * One instance must not be used from several threads at once.
 */
class HttpClient {
public:
    /**
     * @param timeout_ms Timeout per transfer in milliseconds (default: 30000)
     */
    explicit HttpClient(int timeout_ms = 30000);

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Download a URL into a file, with automatic retry
     *
     * The body is written to dest_path; on failure the partial file is removed.
     *
     * @param url Absolute URL
     * @param dest_path Destination file (overwritten)
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse download(const std::string& url, const std::filesystem::path& dest_path);

    /**
     * @brief Set debug mode (logs requests at DEBUG level)
     */
    void set_debug(bool debug) { debug_ = debug; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    int timeout_ms_;
    bool debug_;

    // Retry logic
    static constexpr int MAX_RETRIES = 3;
    static constexpr int RETRY_DELAYS_MS[MAX_RETRIES] = {1000, 2000, 4000};

    bool should_retry(int status_code) const;
    HttpResponse perform_download(const std::string& url, const std::filesystem::path& dest_path);
};

} // namespace artcache

#endif // ARTCACHE_HTTP_CLIENT_HPP
