/**
 * @file artifact.cpp
 * @brief Implementation of local file artifacts
 */

#include "artifact.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace artcache {

LocalFileArtifact::LocalFileArtifact(fs::path path, std::string relative_path)
    : path_(std::move(path)), relative_path_(std::move(relative_path)) {
    if (relative_path_.empty()) {
        relative_path_ = path_.filename().string();
    }
}

Fingerprint LocalFileArtifact::fingerprint() const {
    std::error_code ec;
    auto mtime = fs::last_write_time(path_, ec);
    if (ec) {
        throw ArtifactNotFoundError(path_.string() + " (" + ec.message() + ")");
    }

    // Ticks of the file clock; only compared against values from the same clock
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(mtime.time_since_epoch());
    return static_cast<std::int64_t>(ms.count());
}

std::unique_ptr<std::istream> LocalFileArtifact::open_stream() const {
    auto stream = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!stream->is_open()) {
        throw ArtifactIOError("Failed to open " + path_.string());
    }
    return stream;
}

std::string LocalFileArtifact::to_string() const {
    return relative_path_ + " (" + path_.string() + ")";
}

std::string fingerprint_to_string(const Fingerprint& fingerprint) {
    if (std::holds_alternative<std::int64_t>(fingerprint)) {
        return "timestamp:" + std::to_string(std::get<std::int64_t>(fingerprint));
    }
    return "digest:" + std::get<std::string>(fingerprint);
}

} // namespace artcache
