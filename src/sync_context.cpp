/**
 * @file sync_context.cpp
 * @brief Implementation of SyncContext
 */

#include "sync_context.hpp"

namespace artcache {

void SyncContext::output(const CacheLogContext& ctx, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
    }
    if (forward_to_logger_) {
        Logger::get_instance().log_info(ctx, message);
    }
}

void SyncContext::warn(const CacheLogContext& ctx, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(message);
    }
    if (forward_to_logger_) {
        Logger::get_instance().log_warning(ctx, message);
    }
}

std::vector<std::string> SyncContext::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<std::string> SyncContext::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

} // namespace artcache
