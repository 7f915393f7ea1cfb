/**
 * @file test_port_ledger.cpp
 * @brief Unit tests for PortLedger.
 */

#include "ledger/port_ledger.hpp"

#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

using namespace fleet_orchestrator;

TEST(PortLedgerTest, AllocatesFromRangeStart) {
    PortLedger ledger;
    EXPECT_EQ(*ledger.allocate("w1", "i-1"), 8000);
    EXPECT_EQ(*ledger.allocate("w1", "i-2"), 8001);
    EXPECT_EQ(*ledger.allocate("w1", "i-3"), 8002);
}

TEST(PortLedgerTest, ReleasedPortIsReused) {
    PortLedger ledger;
    ASSERT_TRUE(ledger.allocate("w1", "i-1").has_value());
    ASSERT_TRUE(ledger.allocate("w1", "i-2").has_value());
    ASSERT_TRUE(ledger.allocate("w1", "i-3").has_value());

    EXPECT_EQ(ledger.release("w1", "i-2"), 8001);
    EXPECT_EQ(*ledger.allocate("w1", "i-4"), 8001);
    EXPECT_EQ(*ledger.allocate("w1", "i-5"), 8003);
}

TEST(PortLedgerTest, NodesAreIndependent) {
    PortLedger ledger;
    EXPECT_EQ(*ledger.allocate("w1", "i-1"), 8000);
    EXPECT_EQ(*ledger.allocate("w2", "i-2"), 8000);
}

TEST(PortLedgerTest, SameInstanceGetsSamePort) {
    PortLedger ledger;
    auto first = ledger.allocate("w1", "i-1");
    auto again = ledger.allocate("w1", "i-1");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*first, *again);
    EXPECT_EQ(ledger.usage("w1").allocated_count, 1u);
}

TEST(PortLedgerTest, ExhaustedRange) {
    PortLedger ledger(8000, 8002);
    ASSERT_TRUE(ledger.allocate("w1", "a").has_value());
    ASSERT_TRUE(ledger.allocate("w1", "b").has_value());
    ASSERT_TRUE(ledger.allocate("w1", "c").has_value());

    auto full = ledger.allocate("w1", "d");
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().code, ErrorCode::ResourceExhausted);
    EXPECT_TRUE(full.error().retryable());

    ledger.release("w1", "b");
    EXPECT_EQ(*ledger.allocate("w1", "d"), 8001);
}

TEST(PortLedgerTest, RangeEndingAtPortMax) {
    PortLedger ledger(65534, 65535);
    EXPECT_EQ(*ledger.allocate("w1", "a"), 65534);
    EXPECT_EQ(*ledger.allocate("w1", "b"), 65535);
    EXPECT_FALSE(ledger.allocate("w1", "c").has_value());
}

TEST(PortLedgerTest, ReleaseIsIdempotent) {
    PortLedger ledger;
    ASSERT_TRUE(ledger.allocate("w1", "i-1").has_value());
    EXPECT_EQ(ledger.release("w1", "i-1"), 8000);
    EXPECT_FALSE(ledger.release("w1", "i-1").has_value());
    EXPECT_FALSE(ledger.release("w9", "i-1").has_value());
    EXPECT_FALSE(ledger.port_of("w1", "i-1").has_value());
}

TEST(PortLedgerTest, ReserveRecordsKnownAssignment) {
    PortLedger ledger;
    ASSERT_TRUE(ledger.reserve("w1", "old", 8000).has_value());
    ASSERT_TRUE(ledger.reserve("w1", "old", 8000).has_value());
    EXPECT_EQ(ledger.port_of("w1", "old"), 8000);
    EXPECT_EQ(*ledger.allocate("w1", "new"), 8001);

    auto taken = ledger.reserve("w1", "other", 8000);
    ASSERT_FALSE(taken.has_value());
    EXPECT_EQ(taken.error().code, ErrorCode::InvalidState);

    EXPECT_FALSE(ledger.reserve("w1", "old", 8005).has_value());
    EXPECT_FALSE(ledger.reserve("w1", "far", 7000).has_value());
}

TEST(PortLedgerTest, Usage) {
    PortLedger ledger(8000, 8009);
    ASSERT_TRUE(ledger.allocate("w1", "i-1").has_value());
    ASSERT_TRUE(ledger.allocate("w1", "i-2").has_value());

    auto usage = ledger.usage("w1");
    EXPECT_EQ(usage.node_id, "w1");
    EXPECT_EQ(usage.allocated_count, 2u);
    EXPECT_EQ(usage.available_count, 8u);
    EXPECT_EQ(usage.allocations.at("i-2"), 8001);

    auto empty = ledger.usage("w2");
    EXPECT_EQ(empty.allocated_count, 0u);
    EXPECT_EQ(empty.available_count, 10u);
}

TEST(PortLedgerTest, ConcurrentAllocationsAreDistinct) {
    PortLedger ledger;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::vector<uint16_t>> assigned(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&ledger, &assigned, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto port = ledger.allocate("w1", "i-" + std::to_string(t) + "-" + std::to_string(i));
                if (port) assigned[t].push_back(*port);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    std::set<uint16_t> unique;
    for (const auto& ports : assigned) unique.insert(ports.begin(), ports.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.begin(), 8000);
    EXPECT_EQ(*unique.rbegin(), 8000 + kThreads * kPerThread - 1);
}
