/**
 * @file sync_context.hpp
 * @brief Progress reporting and cooperative cancellation for cache operations
 *
 * A SyncContext is handed to put_all by the caller. It receives the
 * human-readable progress lines ("Copied N files to ...") and warnings of
 * the operation, and carries the cancellation signal in both directions:
 * - The caller (or any other thread) requests cancellation
 * - The cache marks the context cancelled once it has stopped
 *
 * Output is purely observational and never affects control flow.
 */

#ifndef ARTCACHE_SYNC_CONTEXT_HPP
#define ARTCACHE_SYNC_CONTEXT_HPP

#include "logger.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace artcache {

class SyncContext {
public:
    SyncContext() = default;

    /**
     * @param forward_to_logger Also emit progress and warnings through Logger
     */
    explicit SyncContext(bool forward_to_logger)
        : forward_to_logger_(forward_to_logger) {}

    SyncContext(const SyncContext&) = delete;
    SyncContext& operator=(const SyncContext&) = delete;

    /**
     * @brief Report a progress line
     */
    void output(const CacheLogContext& ctx, const std::string& message);

    /**
     * @brief Report a non-fatal problem
     */
    void warn(const CacheLogContext& ctx, const std::string& message);

    /**
     * @brief Ask the running operation to stop at its next wait point
     *
     * Thread-safe; may be called from any thread.
     */
    void request_cancel() { cancel_requested_ = true; }

    bool is_cancel_requested() const { return cancel_requested_; }

    /**
     * @brief Mark the operation as cancelled (called by the cache)
     */
    void set_cancelled() { cancelled_ = true; }

    bool is_cancelled() const { return cancelled_; }

    std::vector<std::string> messages() const;
    std::vector<std::string> warnings() const;

private:
    bool forward_to_logger_ = true;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::vector<std::string> warnings_;
};

} // namespace artcache

#endif // ARTCACHE_SYNC_CONTEXT_HPP
