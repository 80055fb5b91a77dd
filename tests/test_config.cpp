#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "test_helpers.hpp"
#include <cstdlib>

using namespace artcache;
using namespace artcache::test;

TEST_CASE("Cache config parsing", "[config]") {
    SECTION("Minimal configuration gets defaults") {
        CacheConfig config = parse_cache_config_from_string(R"({"cache_name": "aars"})");

        REQUIRE(config.cache_name == "aars");
        REQUIRE(config.cache_dir == get_default_cache_dir("aars"));
        REQUIRE(config.worker_threads == 0);
        REQUIRE_FALSE(config.remove_missing_artifacts);
        REQUIRE(config.download_timeout_ms == 30000);
        REQUIRE(config.logging.min_level == LogLevel::INFO);
    }

    SECTION("Full configuration") {
        CacheConfig config = parse_cache_config_from_string(R"({
            "cache_name": "jars",
            "cache_dir": "/var/cache/jars",
            "worker_threads": 8,
            "remove_missing_artifacts": true,
            "download": {"timeout_ms": 1000, "staging_dir": "/var/cache/jars.dl"},
            "logging": {"level": "DEBUG", "console": false, "file": "cache.log", "json": false}
        })");

        REQUIRE(config.cache_dir == "/var/cache/jars");
        REQUIRE(config.worker_threads == 8);
        REQUIRE(config.remove_missing_artifacts);
        REQUIRE(config.download_timeout_ms == 1000);
        REQUIRE(config.staging_dir == "/var/cache/jars.dl");
        REQUIRE(config.logging.min_level == LogLevel::DEBUG);
        REQUIRE_FALSE(config.logging.enable_console);
        REQUIRE(config.logging.enable_file);
        REQUIRE(config.logging.log_file_path == "cache.log");
        REQUIRE_FALSE(config.logging.enable_json);
    }

    SECTION("Invalid configurations are rejected") {
        REQUIRE_THROWS_AS(parse_cache_config_from_string("{"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string("[]"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string("{}"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string(R"({"cache_name": ""})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string(R"({"cache_name": 3})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string(R"({"cache_name": "x", "worker_threads": -1})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string(R"({"cache_name": "x", "download": {"timeout_ms": 0}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_cache_config_from_string(R"({"cache_name": "x", "logging": {"level": "LOUD"}})"),
                          ConfigParseError);
    }
}

TEST_CASE("Environment variable expansion", "[config]") {
    setenv("ARTCACHE_TEST_ROOT", "/data/build", 1);
    unsetenv("ARTCACHE_TEST_UNSET");

    REQUIRE(expand_environment_variables("${ARTCACHE_TEST_ROOT}/cache") == "/data/build/cache");
    REQUIRE(expand_environment_variables("$ARTCACHE_TEST_ROOT/cache") == "/data/build/cache");
    REQUIRE(expand_environment_variables("a${ARTCACHE_TEST_UNSET}b") == "ab");
    REQUIRE(expand_environment_variables("no variables") == "no variables");
    REQUIRE(expand_environment_variables("cost $5") == "cost $5");
    REQUIRE(expand_environment_variables("price $") == "price $");
    REQUIRE(expand_environment_variables("${unterminated") == "${unterminated");

    SECTION("Expansion applies to config values") {
        CacheConfig config = parse_cache_config_from_string(
            R"({"cache_name": "x", "cache_dir": "${ARTCACHE_TEST_ROOT}/x"})");
        REQUIRE(config.cache_dir == "/data/build/x");
    }
}

TEST_CASE("Config file loading", "[config]") {
    TempDir dir;

    SECTION("Relative paths resolve against the config directory") {
        write_file(dir / "conf/cache.json", R"({
            "cache_name": "rel",
            "cache_dir": "caches/rel",
            "download": {"staging_dir": "staging"},
            "logging": {"file": "logs/cache.log"}
        })");

        CacheConfig config = parse_cache_config_from_file((dir / "conf/cache.json").string());

        REQUIRE(config.cache_dir == (dir / "conf/caches/rel").lexically_normal().string());
        REQUIRE(config.staging_dir == (dir / "conf/staging").lexically_normal().string());
        REQUIRE(config.logging.log_file_path == (dir / "conf/logs/cache.log").lexically_normal().string());
    }

    SECTION("Absolute paths are kept") {
        write_file(dir / "cache.json", R"({"cache_name": "abs", "cache_dir": "/srv/abs"})");
        CacheConfig config = parse_cache_config_from_file((dir / "cache.json").string());
        REQUIRE(config.cache_dir == "/srv/abs");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_cache_config_from_file((dir / "absent.json").string()), ConfigParseError);
    }
}

TEST_CASE("Default locations", "[config]") {
    SECTION("XDG cache home wins over HOME") {
        const char* saved_xdg = std::getenv("XDG_CACHE_HOME");
        std::string xdg_value = saved_xdg ? saved_xdg : "";
        setenv("XDG_CACHE_HOME", "/xdg", 1);

        std::string dir = get_default_cache_dir("c");

        if (saved_xdg) {
            setenv("XDG_CACHE_HOME", xdg_value.c_str(), 1);
        } else {
            unsetenv("XDG_CACHE_HOME");
        }

        REQUIRE(dir == "/xdg/artcache/c");
    }

    SECTION("HOME fallback") {
        const char* saved_xdg = std::getenv("XDG_CACHE_HOME");
        const char* saved_home = std::getenv("HOME");
        std::string xdg_value = saved_xdg ? saved_xdg : "";
        std::string home_value = saved_home ? saved_home : "";
        unsetenv("XDG_CACHE_HOME");
        setenv("HOME", "/home/tester", 1);

        std::string dir = get_default_cache_dir("c");

        if (saved_xdg) setenv("XDG_CACHE_HOME", xdg_value.c_str(), 1);
        if (saved_home) setenv("HOME", home_value.c_str(), 1);

        REQUIRE(dir == "/home/tester/.cache/artcache/c");
    }

    SECTION("Staging directory sits beside the cache directory") {
        CacheConfig config;
        config.cache_dir = "/var/cache/jars/";
        REQUIRE(get_staging_dir(config) == "/var/cache/jars.staging");

        config.staging_dir = "/elsewhere";
        REQUIRE(get_staging_dir(config) == "/elsewhere");
    }
}
