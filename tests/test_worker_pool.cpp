/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/worker_pool.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <set>

using namespace artcache;
using namespace artcache::test;

TEST_CASE("WorkerPool runs submitted tasks", "[worker_pool]") {
    WorkerPool pool(4);

    SECTION("Futures deliver results") {
        std::vector<std::future<int>> futures;
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([i]() { return i * i; }));
        }
        int sum = 0;
        for (auto& future : futures) {
            sum += future.get();
        }
        REQUIRE(sum == 2470);
    }

    SECTION("Exceptions are delivered through the future") {
        auto future = pool.submit([]() -> int { throw CacheError("boom"); });
        REQUIRE_THROWS_AS(future.get(), CacheError);
    }

    SECTION("Void tasks") {
        std::atomic<int> counter{0};
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 10; ++i) {
            futures.push_back(pool.submit([&counter]() { counter++; }));
        }
        wait_all(futures);
        REQUIRE(counter == 10);
    }
}

TEST_CASE("WorkerPool thread bound", "[worker_pool]") {
    SECTION("Never starts more threads than allowed") {
        WorkerPool pool(2);
        auto gate = std::make_shared<Gate>();
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 8; ++i) {
            futures.push_back(pool.submit([gate]() { gate->wait(); }));
        }
        REQUIRE(pool.thread_count() <= 2);
        gate->release();
        wait_all(futures);
        REQUIRE(pool.thread_count() <= 2);
    }

    SECTION("Tasks run in parallel up to the bound") {
        WorkerPool pool(3);
        std::mutex mutex;
        std::set<std::thread::id> ids;
        auto gate = std::make_shared<Gate>();
        std::atomic<int> arrived{0};

        std::vector<std::future<void>> futures;
        for (int i = 0; i < 3; ++i) {
            futures.push_back(pool.submit([&, gate]() {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    ids.insert(std::this_thread::get_id());
                }
                arrived++;
                gate->wait();
            }));
        }

        // All three must be running at once for this to finish
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (arrived < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        gate->release();
        wait_all(futures);

        REQUIRE(arrived == 3);
        REQUIRE(ids.size() == 3);
    }

    SECTION("Zero means hardware concurrency") {
        WorkerPool pool(0);
        REQUIRE(pool.max_threads() >= 1);
        REQUIRE(pool.thread_count() == 0);
    }
}

TEST_CASE("WorkerPool drains queued work on destruction", "[worker_pool]") {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 50; ++i) {
            pool.submit([&counter]() { counter++; });
        }
    }
    REQUIRE(counter == 50);
}
