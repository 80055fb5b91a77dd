/**
 * @file http_client.cpp
 * @brief Implementation of HttpClient
 */

#include "http_client.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace artcache {

// Static initialization
constexpr int HttpClient::RETRY_DELAYS_MS[];

// CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* out = static_cast<std::ofstream*>(userp);
    out->write(static_cast<const char*>(contents), static_cast<std::streamsize>(total_size));
    if (!*out) {
        return 0;  // makes curl abort with CURLE_WRITE_ERROR
    }
    return total_size;
}

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        static std::once_flag global_init;
        std::call_once(global_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

HttpClient::HttpClient(int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , timeout_ms_(timeout_ms)
    , debug_(false)
{
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) const {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    // Don't retry on: auth (401), forbidden (403), not found (404)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    if (status_code >= 500 && status_code < 600) {
        return true;
    }
    return false;
}

HttpResponse HttpClient::perform_download(const std::string& url, const fs::path& dest_path)
{
    auto start = std::chrono::steady_clock::now();

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw HttpClientError("Failed to open " + dest_path.string() + " for writing");
    }

    // Reset CURL handle
    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(impl_->curl, CURLOPT_FOLLOWLOCATION, 1L);

    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &out);

    if (debug_) {
        Logger::get_instance().log_debug(CacheLogContext("http", "download"), "GET " + url);
    }

    // Execute request
    CURLcode res = curl_easy_perform(impl_->curl);

    out.close();

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    // Check for CURL errors
    if (res != CURLE_OK) {
        std::string error_msg = "CURL error for " + url + ": ";
        error_msg += curl_easy_strerror(res);
        throw HttpClientError(error_msg);
    }

    // Get status code (stays 0 for file:// transfers)
    long status_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

    curl_off_t bytes = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_SIZE_DOWNLOAD_T, &bytes);

    if (debug_) {
        std::ostringstream oss;
        oss << "Status: " << status_code << " (" << duration.count() << "ms)";
        Logger::get_instance().log_debug(CacheLogContext("http", "download"), oss.str());
    }

    if (status_code >= 400) {
        std::ostringstream oss;
        if (status_code == 401) {
            oss << "Authentication failed for " << url;
        } else if (status_code == 403) {
            oss << "Access denied for " << url;
        } else if (status_code == 404) {
            oss << "Artifact not found at " << url;
        } else {
            oss << "HTTP " << status_code << " for " << url;
        }
        throw HttpClientError(oss.str(), static_cast<int>(status_code));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.bytes_received = static_cast<size_t>(bytes);
    response.duration = duration;
    return response;
}

HttpResponse HttpClient::download(const std::string& url, const fs::path& dest_path)
{
    int attempt = 0;

    while (true) {
        try {
            return perform_download(url, dest_path);

        } catch (const HttpClientError& e) {
            std::error_code ec;
            fs::remove(dest_path, ec);

            // If not retryable, or retries exhausted, give up
            if (!should_retry(e.status_code()) || attempt >= MAX_RETRIES - 1) {
                throw;
            }

            if (debug_) {
                Logger::get_instance().log_debug(
                    CacheLogContext("http", "download"),
                    std::string("Error: ") + e.what() + " - retrying in " +
                        std::to_string(RETRY_DELAYS_MS[attempt]) + "ms...");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(RETRY_DELAYS_MS[attempt]));
            attempt++;
        }
    }
}

} // namespace artcache
