/**
 * @file mirror_directory.cpp
 * @brief Example mirroring a local directory into an artifact cache
 *
 * Usage: mirror_directory <config.json> <source_dir> [--prune]
 *
 * Every regular file under source_dir becomes an artifact keyed by its path
 * relative to source_dir. Running the program twice copies only the files
 * whose modification time changed. With --prune, cached files that no longer
 * exist in source_dir are evicted.
 */

#include "../src/config.hpp"
#include "../src/local_artifact_cache.hpp"
#include "../src/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace artcache;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <source_dir> [--prune]\n";
        return 2;
    }

    CacheConfig config;
    try {
        config = parse_cache_config_from_file(argv[1]);
    } catch (const ConfigParseError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    Logger::get_instance().configure(config.logging);

    fs::path source_dir(argv[2]);
    bool prune = config.remove_missing_artifacts ||
                 (argc > 3 && std::string(argv[3]) == "--prune");

    std::vector<std::shared_ptr<OutputArtifact>> artifacts;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            std::string relative = fs::relative(it->path(), source_dir).generic_string();
            artifacts.push_back(std::make_shared<LocalFileArtifact>(it->path(), relative));
        }
    }
    if (ec) {
        std::cerr << "Cannot scan " << source_dir << ": " << ec.message() << "\n";
        return 1;
    }

    LocalArtifactCache cache(config);
    cache.initialize();

    SyncContext context;
    SyncResult result = cache.put_all(artifacts, context, prune);

    for (const auto& line : context.messages()) {
        std::cout << line << "\n";
    }
    for (const auto& line : context.warnings()) {
        std::cout << "WARNING: " << line << "\n";
    }

    for (const auto& artifact : artifacts) {
        if (auto path = cache.get(*artifact)) {
            std::cout << artifact->relative_path() << " -> " << path->string() << "\n";
        }
    }

    CacheStats stats = cache.get_stats();
    std::cout << stats.entries_count << " entries in " << cache.cache_dir() << "\n";

    Logger::get_instance().flush();
    return result.complete() ? 0 : 1;
}
