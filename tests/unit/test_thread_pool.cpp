/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace fleet_orchestrator;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, SubmitEachPreservesInputOrder) {
    ThreadPool pool(4);
    std::vector<std::string> addresses;
    for (int i = 0; i < 50; ++i) {
        addresses.push_back("10.0.0." + std::to_string(i));
    }

    // Early items sleep longest, so completion order is roughly reversed.
    auto futures = pool.submit_each(addresses, [](const std::string& address) {
        auto last_octet = std::stoi(address.substr(address.rfind('.') + 1));
        std::this_thread::sleep_for(std::chrono::milliseconds(50 - last_octet));
        return address + ":22";
    });

    ASSERT_EQ(futures.size(), addresses.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        EXPECT_EQ(futures[i].get(), addresses[i] + ":22");
    }
}

TEST(ThreadPoolTest, SubmitEachOutlivesInput) {
    ThreadPool pool(2);
    std::vector<std::future<size_t>> futures;
    {
        std::vector<std::string> names{"master-01", "worker-01", "storage-01"};
        futures = pool.submit_each(names, [](const std::string& name) { return name.size(); });
    }
    EXPECT_EQ(futures[0].get(), 9u);
    EXPECT_EQ(futures[2].get(), 10u);
}

TEST(ThreadPoolTest, SubmitEachEmpty) {
    ThreadPool pool(1);
    auto futures = pool.submit_each(std::vector<int>{}, [](int v) { return v; });
    EXPECT_TRUE(futures.empty());
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto healthy = pool.submit([] { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(healthy.get(), 7);
}

TEST(ThreadPoolTest, TasksRunInParallel) {
    ThreadPool pool(4);
    auto start = std::chrono::steady_clock::now();

    auto futures = pool.submit_each(std::vector<int>{1, 2, 3, 4}, [](int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return 0;
    });
    for (auto& f : futures) f.get();

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST(ThreadPoolTest, QueuedTasksBreakOnDestruction) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::future<int> queued;

    std::jthread opener([&gate] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        gate.set_value();
    });
    {
        ThreadPool pool(1);
        auto blocking = pool.submit([opened] { opened.wait(); });
        queued = pool.submit([] { return 1; });
    }  // the single worker is still blocked when shutdown begins

    try {
        (void)queued.get();
        FAIL() << "queued task should not have run";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::future_errc::broken_promise);
    }
}

TEST(ThreadPoolTest, EnsureThreadsOnlyGrows) {
    ThreadPool pool(2);
    pool.ensure_threads(6);
    EXPECT_EQ(pool.thread_count(), 6u);
    pool.ensure_threads(3);
    EXPECT_EQ(pool.thread_count(), 6u);

    // Six sleepers on six workers finish together.
    auto start = std::chrono::steady_clock::now();
    auto futures = pool.submit_each(std::vector<int>{1, 2, 3, 4, 5, 6}, [](int v) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return v;
    });
    for (auto& f : futures) f.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(380));
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    ThreadPool sized_by_hardware;
    EXPECT_GE(sized_by_hardware.thread_count(), 1u);
}
