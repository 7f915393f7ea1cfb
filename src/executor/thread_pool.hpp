/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool used to fan out node probes.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleet_orchestrator {

/**
 * @brief Fixed-size pool; every submitted callable yields a future.
 *
 * Exceptions thrown by a task are captured in its future, never lost in a
 * worker thread. Tasks still queued at destruction are dropped and their
 * futures report broken_promise.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Submit fn(item) for every item; futures come back in input order.
     *
     * Items are copied into their tasks, so the input may go away before the
     * futures resolve.
     */
    template <typename T, std::invocable<const T&> F>
    std::vector<std::future<std::invoke_result_t<F, const T&>>> submit_each(const std::vector<T>& items,
                                                                             F func);

    /// Spawn workers until at least num_threads exist. Never shrinks.
    void ensure_threads(size_t num_threads);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    mutable std::mutex workers_mutex_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([task = std::move(task)]() { (*task)(); });
    }
    queue_cv_.notify_one();
    return future;
}

template <typename T, std::invocable<const T&> F>
std::vector<std::future<std::invoke_result_t<F, const T&>>> ThreadPool::submit_each(
    const std::vector<T>& items, F func) {
    std::vector<std::future<std::invoke_result_t<F, const T&>>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(submit([func, item] { return func(item); }));
    }
    return futures;
}

}  // namespace fleet_orchestrator
