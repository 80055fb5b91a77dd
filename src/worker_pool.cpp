/**
 * @file worker_pool.cpp
 * @brief Implementation of WorkerPool
 */

#include "worker_pool.hpp"

namespace artcache {

WorkerPool::WorkerPool(size_t max_threads)
    : max_threads_(max_threads) {
    if (max_threads_ == 0) {
        max_threads_ = std::thread::hardware_concurrency();
        if (max_threads_ == 0) max_threads_ = 1;
    }
}

WorkerPool::~WorkerPool() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
        std::swap(workers, workers_);
    }

    work_available_.notify_all();

    for (auto& worker : workers) {
        worker.join();
    }
}

size_t WorkerPool::thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void WorkerPool::enqueue(work_t work) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (quit_) {
        throw PoolShutDownError("Cannot submit work while the worker pool is shutting down");
    }

    pending_.push(std::move(work));

    if (pending_.size() > idle_ && workers_.size() < max_threads_) {
        workers_.emplace_back(&WorkerPool::do_work, this);
    }
    work_available_.notify_one();
}

void WorkerPool::do_work() {
    while (true) {
        work_t work;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            idle_++;
            work_available_.wait(lock, [this]() { return quit_ || !pending_.empty(); });
            idle_--;

            // Queued work still runs after quit is set
            if (pending_.empty()) {
                return;
            }

            work = std::move(pending_.front());
            pending_.pop();
        }

        // Packaged tasks capture their own exceptions
        work();
    }
}

} // namespace artcache
