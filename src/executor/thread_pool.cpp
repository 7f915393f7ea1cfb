/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace fleet_orchestrator {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    ensure_threads(num_threads);
}

ThreadPool::~ThreadPool() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers.clear();  // joins

    // Drop whatever never ran; destroying the packaged_tasks breaks their promises.
    std::lock_guard lock(queue_mutex_);
    std::queue<std::function<void()>>{}.swap(task_queue_);
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested()) return;
            if (task_queue_.empty()) continue;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

void ThreadPool::ensure_threads(size_t num_threads) {
    std::lock_guard lock(workers_mutex_);
    workers_.reserve(num_threads);
    while (workers_.size() < num_threads) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    std::lock_guard lock(workers_mutex_);
    return workers_.size();
}

}  // namespace fleet_orchestrator
