/**
 * @file cache_store.cpp
 * @brief Implementation of descriptor persistence and reconciliation
 */

#include "cache_store.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace artcache {

// Deletes one path; never throws so it can run as a pool task
static ItemResult delete_path(const fs::path& path, const std::string& key) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return ItemResult::failure(key, "Failed to delete " + path.string() + ": " + ec.message());
    }
    return ItemResult::ok(key);
}

static bool is_plain_file_name(const std::string& name) {
    return !name.empty() &&
           name != "." && name != ".." &&
           name != CACHE_DATA_FILE_NAME &&
           name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos;
}

fs::path get_cache_data_file(const fs::path& cache_dir) {
    return cache_dir / CACHE_DATA_FILE_NAME;
}

fs::path get_path_to_cached_file(const fs::path& cache_dir, const std::string& file_name) {
    return cache_dir / file_name;
}

std::set<std::string> get_cache_files(const fs::path& cache_dir) {
    std::set<std::string> files;

    std::error_code ec;
    if (!fs::exists(cache_dir, ec)) {
        return files;
    }

    fs::directory_iterator it(cache_dir, ec);
    if (ec) {
        throw CacheOperationError("Cannot list " + cache_dir.string() + ": " + ec.message());
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name != CACHE_DATA_FILE_NAME) {
            files.insert(name);
        }
    }
    if (ec) {
        throw CacheOperationError("Cannot list " + cache_dir.string() + ": " + ec.message());
    }

    return files;
}

std::string serialize_cache_data(const CacheState& state) {
    // Sorted by key so identical indexes produce identical descriptors
    std::vector<const CacheEntry*> entries;
    entries.reserve(state.size());
    for (const auto& pair : state) {
        entries.push_back(&pair.second);
    }
    std::sort(entries.begin(), entries.end(), [](const CacheEntry* a, const CacheEntry* b) {
        return a->cache_key() < b->cache_key();
    });

    json cache_entries = json::array();
    for (const CacheEntry* entry : entries) {
        cache_entries.push_back(*entry);
    }

    json j;
    j["format_version"] = CACHE_DATA_FORMAT_VERSION;
    j["cache_entries"] = cache_entries;
    return j.dump(2);
}

CacheState parse_cache_data(const std::string& text) {
    CacheState state;

    try {
        json j = json::parse(text);

        int version = j.at("format_version").get<int>();
        if (version != CACHE_DATA_FORMAT_VERSION) {
            throw CacheDataError("Unsupported format version " + std::to_string(version));
        }

        std::unordered_set<std::string> file_names;
        for (const auto& entry_json : j.at("cache_entries")) {
            CacheEntry entry = cache_entry_from_json(entry_json);

            if (!is_plain_file_name(entry.file_name())) {
                throw CacheDataError("Invalid file name '" + entry.file_name() +
                                     "' for key " + entry.cache_key());
            }
            if (!file_names.insert(entry.file_name()).second) {
                throw CacheDataError("File name '" + entry.file_name() + "' referenced twice");
            }

            state.insert_or_assign(entry.cache_key(), entry);
        }

    } catch (const json::exception& e) {
        throw CacheDataError(std::string("Malformed cache data: ") + e.what());
    }

    return state;
}

CacheState load_cache_data(const fs::path& cache_data_file) {
    std::ifstream file(cache_data_file);
    if (!file.is_open()) {
        throw CacheDataError("Failed to open " + cache_data_file.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw CacheDataError("Failed to read " + cache_data_file.string());
    }

    return parse_cache_data(buffer.str());
}

void write_cache_data(const fs::path& cache_dir, const CacheState& state) {
    std::error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        throw CacheDataError("Cannot create " + cache_dir.string() + ": " + ec.message());
    }

    fs::path cache_data_file = get_cache_data_file(cache_dir);
    fs::path temp_file = cache_data_file;
    temp_file += ".tmp";

    {
        std::ofstream out(temp_file, std::ios::trunc);
        if (!out.is_open()) {
            throw CacheDataError("Failed to open " + temp_file.string() + " for writing");
        }
        out << serialize_cache_data(state);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_file, ec);
            throw CacheDataError("Failed to write " + temp_file.string());
        }
    }

    fs::rename(temp_file, cache_data_file, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_file, ignored);
        throw CacheDataError("Failed to replace " + cache_data_file.string() + ": " + ec.message());
    }
}

std::vector<std::string> remove_stale_references(
    const std::set<std::string>& cached_files,
    CacheState& state
) {
    std::vector<std::string> removed;

    for (auto it = state.begin(); it != state.end();) {
        if (cached_files.count(it->second.file_name()) == 0) {
            removed.push_back(it->first);
            it = state.erase(it);
        } else {
            ++it;
        }
    }

    return removed;
}

std::vector<std::future<ItemResult>> remove_untracked_files(
    const fs::path& cache_dir,
    const std::set<std::string>& cached_files,
    const CacheState& state,
    WorkerPool& pool
) {
    std::unordered_set<std::string> tracked;
    for (const auto& pair : state) {
        tracked.insert(pair.second.file_name());
    }

    std::vector<std::future<ItemResult>> futures;
    for (const auto& name : cached_files) {
        if (tracked.count(name) > 0) {
            continue;
        }
        fs::path path = get_path_to_cached_file(cache_dir, name);
        futures.push_back(pool.submit([path, name]() { return delete_path(path, name); }));
    }

    return futures;
}

std::vector<std::future<ItemResult>> clear_cache_dir(const fs::path& cache_dir, WorkerPool& pool) {
    std::vector<std::future<ItemResult>> futures;

    std::set<std::string> names = get_cache_files(cache_dir);
    std::error_code ec;
    if (fs::exists(get_cache_data_file(cache_dir), ec)) {
        names.insert(CACHE_DATA_FILE_NAME);
    }

    for (const auto& name : names) {
        fs::path path = cache_dir / name;
        futures.push_back(pool.submit([path, name]() { return delete_path(path, name); }));
    }

    return futures;
}

} // namespace artcache
