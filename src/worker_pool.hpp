/**
 * @file worker_pool.hpp
 * @brief Bounded pool of worker threads for cache file operations
 *
 * Copy and delete operations are submitted as independent tasks. Each
 * submission returns a std::future the caller can wait on, which gives the
 * sync engine its join-all barriers.
 *
 * Threads are started lazily, up to max_threads, when work is queued faster
 * than the running workers drain it.
 */

#ifndef ARTCACHE_WORKER_POOL_HPP
#define ARTCACHE_WORKER_POOL_HPP

#include "artifact.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace artcache {

/**
 * @brief Raised when work is submitted to a pool that is shutting down
 */
class PoolShutDownError : public CacheError {
public:
    explicit PoolShutDownError(const std::string& message)
        : CacheError(message) {}
};

class WorkerPool {
public:
    /**
     * @param max_threads Upper bound on worker threads (0 = hardware concurrency)
     */
    explicit WorkerPool(size_t max_threads = 0);

    /**
     * @brief Finishes queued work, then joins all workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task and return a future for its result
     *
     * Exceptions thrown by the task are delivered through the future.
     *
     * @throws PoolShutDownError if the pool is being destroyed
     */
    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        std::future<R> future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    size_t max_threads() const { return max_threads_; }

    /**
     * @brief Number of worker threads started so far
     */
    size_t thread_count() const;

private:
    using work_t = std::function<void()>;

    size_t max_threads_;
    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::queue<work_t> pending_;
    std::vector<std::thread> workers_;
    size_t idle_ = 0;
    bool quit_ = false;

    void enqueue(work_t work);
    void do_work();
};

/**
 * @brief Block until every future is ready (join-all barrier)
 */
template<typename T>
void wait_all(const std::vector<std::future<T>>& futures) {
    for (const auto& future : futures) {
        future.wait();
    }
}

} // namespace artcache

#endif // ARTCACHE_WORKER_POOL_HPP
