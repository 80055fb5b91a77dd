/**
 * @file test_cache_store.cpp
 * @brief Unit tests for descriptor persistence and reconciliation
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/cache_store.hpp"
#include "test_helpers.hpp"

using namespace artcache;
using namespace artcache::test;
using json = nlohmann::json;

namespace {

CacheEntry make_entry(const std::string& relative_path, std::int64_t timestamp) {
    std::string key = CacheEntry::cache_key_for(relative_path);
    return CacheEntry(key, Fingerprint(timestamp), CacheEntry::file_name_for(key));
}

CacheState make_state(const std::vector<CacheEntry>& entries) {
    CacheState state;
    for (const auto& entry : entries) {
        state.insert_or_assign(entry.cache_key(), entry);
    }
    return state;
}

} // namespace

TEST_CASE("get_cache_files", "[cache_store]") {
    TempDir dir;

    SECTION("Missing directory has no files") {
        REQUIRE(get_cache_files(dir / "absent").empty());
    }

    SECTION("Descriptor is not reported") {
        write_file(dir / "a.jar", "a");
        write_file(dir / "b.jar", "b");
        write_file(get_cache_data_file(dir.path()), "{}");

        std::set<std::string> files = get_cache_files(dir.path());
        REQUIRE(files == std::set<std::string>{"a.jar", "b.jar"});
    }

    SECTION("A path that cannot be listed is an operation error") {
        write_file(dir / "plain.txt", "not a directory");
        REQUIRE_THROWS_AS(get_cache_files(dir / "plain.txt"), CacheOperationError);
    }
}

TEST_CASE("Descriptor write and load", "[cache_store]") {
    TempDir dir;
    CacheState state = make_state({make_entry("a/x.jar", 1), make_entry("b/y.jar", 2)});
    CacheEntry remote("k_z.aar", Fingerprint(std::string("digest-1")), "k_z.aar");
    state.insert_or_assign(remote.cache_key(), remote);

    SECTION("Every field survives a write") {
        write_cache_data(dir.path(), state);
        CacheState loaded = load_cache_data(get_cache_data_file(dir.path()));

        REQUIRE(loaded.size() == 3);
        for (const auto& pair : state) {
            REQUIRE(loaded.count(pair.first) == 1);
            REQUIRE(loaded.at(pair.first) == pair.second);
            REQUIRE(loaded.at(pair.first).file_name() == pair.second.file_name());
        }
    }

    SECTION("No temporary file is left behind") {
        write_cache_data(dir.path(), state);
        REQUIRE_FALSE(fs::exists(dir / (CACHE_DATA_FILE_NAME + ".tmp")));
        REQUIRE(get_cache_files(dir.path()).empty());
    }

    SECTION("A write replaces the previous descriptor") {
        write_cache_data(dir.path(), state);
        write_cache_data(dir.path(), CacheState());
        REQUIRE(load_cache_data(get_cache_data_file(dir.path())).empty());
    }

    SECTION("Cache directory is created on demand") {
        fs::path nested = dir / "nested/cache";
        write_cache_data(nested, state);
        REQUIRE(fs::exists(get_cache_data_file(nested)));
    }

    SECTION("Output is sorted and stable") {
        REQUIRE(serialize_cache_data(state) == serialize_cache_data(CacheState(state)));
        json j = json::parse(serialize_cache_data(state));
        REQUIRE(j["format_version"] == CACHE_DATA_FORMAT_VERSION);
        const auto& entries = j["cache_entries"];
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0]["cache_key"].get<std::string>() < entries[1]["cache_key"].get<std::string>());
        REQUIRE(entries[1]["cache_key"].get<std::string>() < entries[2]["cache_key"].get<std::string>());
    }
}

TEST_CASE("Malformed descriptors", "[cache_store]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_cache_data("{not json"), CacheDataError);
    }

    SECTION("Unknown format version") {
        REQUIRE_THROWS_AS(parse_cache_data(R"({"format_version": 99, "cache_entries": []})"),
                          CacheDataError);
    }

    SECTION("Missing entries array") {
        REQUIRE_THROWS_AS(parse_cache_data(R"({"format_version": 1})"), CacheDataError);
    }

    SECTION("File name escaping the cache directory") {
        std::string text = R"({"format_version": 1, "cache_entries": [
            {"cache_key": "k", "file_name": "../k", "fingerprint": {"timestamp": 1}}]})";
        REQUIRE_THROWS_AS(parse_cache_data(text), CacheDataError);
    }

    SECTION("File name used by two entries") {
        std::string text = R"({"format_version": 1, "cache_entries": [
            {"cache_key": "k1", "file_name": "same", "fingerprint": {"timestamp": 1}},
            {"cache_key": "k2", "file_name": "same", "fingerprint": {"timestamp": 2}}]})";
        REQUIRE_THROWS_AS(parse_cache_data(text), CacheDataError);
    }

    SECTION("Unreadable file") {
        TempDir dir;
        REQUIRE_THROWS_AS(load_cache_data(dir / "absent.json"), CacheDataError);
    }
}

TEST_CASE("remove_stale_references", "[cache_store]") {
    CacheEntry a = make_entry("a.jar", 1);
    CacheEntry b = make_entry("b.jar", 1);
    CacheState state = make_state({a, b});

    std::vector<std::string> removed = remove_stale_references({a.file_name()}, state);

    REQUIRE(removed == std::vector<std::string>{b.cache_key()});
    REQUIRE(state.size() == 1);
    REQUIRE(state.count(a.cache_key()) == 1);
}

TEST_CASE("remove_untracked_files", "[cache_store]") {
    TempDir dir;
    WorkerPool pool(2);

    CacheEntry tracked = make_entry("tracked.jar", 1);
    CacheState state = make_state({tracked});
    write_file(dir / tracked.file_name(), "keep");
    write_file(dir / "stray.jar", "drop");
    write_file(dir / "stray.jar.tmp-3", "drop");
    fs::create_directories(dir / "stray_dir/sub");
    write_cache_data(dir.path(), state);

    auto futures = remove_untracked_files(dir.path(), get_cache_files(dir.path()), state, pool);
    REQUIRE(futures.size() == 3);
    for (auto& future : futures) {
        REQUIRE(future.get().success);
    }

    REQUIRE(fs::exists(dir / tracked.file_name()));
    REQUIRE(fs::exists(get_cache_data_file(dir.path())));
    REQUIRE_FALSE(fs::exists(dir / "stray.jar"));
    REQUIRE_FALSE(fs::exists(dir / "stray.jar.tmp-3"));
    REQUIRE_FALSE(fs::exists(dir / "stray_dir"));
}

TEST_CASE("clear_cache_dir", "[cache_store]") {
    TempDir dir;
    WorkerPool pool(2);

    write_file(dir / "a.jar", "a");
    write_file(dir / "b.jar", "b");
    write_cache_data(dir.path(), CacheState());

    auto futures = clear_cache_dir(dir.path(), pool);
    REQUIRE(futures.size() == 3);
    wait_all(futures);

    REQUIRE(fs::is_empty(dir.path()));
}
