/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include "../src/sync_context.hpp"
#include "../src/sync_engine.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

using namespace artcache;
using namespace artcache::test;
using json = nlohmann::json;

namespace {

// Route the logger to a file, run the action, return the parsed lines
template<typename F>
std::vector<json> capture_json_log(const TempDir& dir, LogLevel min_level, F&& action) {
    Logger& logger = Logger::get_instance();

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = (dir / "test.log").string();
    logger.configure(config);

    action(logger);
    logger.flush();

    std::vector<json> lines;
    std::ifstream file(config.log_file_path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(json::parse(line));
    }

    silence_logger();
    return lines;
}

} // namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Custom level is applied") {
        LoggerConfig config;
        config.min_level = LogLevel::DEBUG;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);

        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
        silence_logger();
    }

    SECTION("Level names round-trip") {
        for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
            REQUIRE(string_to_level(level_to_string(level)) == level);
        }
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }
}

TEST_CASE("Logger Level Filtering", "[logger]") {
    TempDir dir;
    CacheLogContext ctx("filter-cache", "put_all");

    auto lines = capture_json_log(dir, LogLevel::WARN, [&](Logger& logger) {
        logger.log_debug(ctx, "debug line");
        logger.log_info(ctx, "info line");
        logger.log_warning(ctx, "warn line");
        logger.log_error(ctx, "error line");
    });

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["level"] == "WARN");
    REQUIRE(lines[1]["level"] == "ERROR");
}

TEST_CASE("Logger Cache Events", "[logger]") {
    TempDir dir;
    CacheLogContext ctx("event-cache", "initialize");

    SECTION("Cache initialized") {
        auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger& logger) {
            logger.log_cache_initialized(ctx, 12, 2, 3);
        });

        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0]["event"] == "cache_initialized");
        REQUIRE(lines[0]["cache_name"] == "event-cache");
        REQUIRE(lines[0]["operation"] == "initialize");
        REQUIRE(lines[0]["entries_loaded"] == "12");
        REQUIRE(lines[0]["stale_references"] == "2");
        REQUIRE(lines[0]["untracked_files"] == "3");
        REQUIRE(lines[0].contains("timestamp"));
    }

    SECTION("Complete sync logs at INFO") {
        SyncResult result;
        result.artifacts_supplied = 2;
        result.updated_count = 2;
        result.copied_keys = {"k1", "k2"};

        auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger& logger) {
            logger.log_sync_complete(CacheLogContext("event-cache", "put_all"), result, 12.5);
        });

        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0]["event"] == "sync_complete");
        REQUIRE(lines[0]["level"] == "INFO");
        REQUIRE(lines[0]["copied"] == "2");
        REQUIRE(lines[0]["cancelled"] == "false");
    }

    SECTION("Partial sync logs at WARN with failure details") {
        SyncResult result;
        result.updated_count = 2;
        result.copied_keys = {"k1"};
        result.failed_copies = {ItemResult::failure("k2", "disk full")};

        auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger& logger) {
            logger.log_sync_complete(CacheLogContext("event-cache", "put_all"), result, 3.0);
        });

        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0]["level"] == "WARN");
        REQUIRE(lines[0]["copy_failures"] == "1");
        REQUIRE(lines[0]["copy_failure_0"] == "k2: disk full");
    }

    SECTION("Cache cleared") {
        auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger& logger) {
            logger.log_cache_cleared(CacheLogContext("event-cache", "clear_cache"), 7);
        });

        REQUIRE(lines[0]["event"] == "cache_cleared");
        REQUIRE(lines[0]["entries_dropped"] == "7");
    }
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    TempDir dir;
    CacheLogContext ctx("escape \"cache\"", "put_all");

    auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger& logger) {
        logger.log_warning(ctx, "path C:\\out\\a.jar\nsecond line\tend");
    });

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["warning"] == "path C:\\out\\a.jar\nsecond line\tend");
    REQUIRE(lines[0]["cache_name"] == "escape \"cache\"");
}

TEST_CASE("SyncContext forwards to the logger", "[logger]") {
    TempDir dir;
    CacheLogContext ctx("ctx-cache", "put_all");
    SyncContext context;

    auto lines = capture_json_log(dir, LogLevel::INFO, [&](Logger&) {
        context.output(ctx, "Copied 3 files to ctx-cache");
        context.warn(ctx, "ctx-cache synchronization didn't complete. Resyncing might fix the issue");
    });

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["event"] == "progress");
    REQUIRE(lines[0]["message"] == "Copied 3 files to ctx-cache");
    REQUIRE(lines[1]["event"] == "warning");

    REQUIRE(context.messages() == std::vector<std::string>{"Copied 3 files to ctx-cache"});
    REQUIRE(context.warnings().size() == 1);
}
