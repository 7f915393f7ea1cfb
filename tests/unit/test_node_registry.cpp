/**
 * @file test_node_registry.cpp
 * @brief Unit tests for InMemoryNodeRegistry.
 */

#include "registry/node_registry.hpp"

#include <gtest/gtest.h>

using namespace fleet_orchestrator;

namespace {

Node make_node(const std::string& id, NodeRole role, const std::string& address) {
    Node node;
    node.id = id;
    node.hostname = id;
    node.address = address;
    node.role = role;
    return node;
}

}  // namespace

TEST(NodeRegistryTest, SeedPreservesOrder) {
    InMemoryNodeRegistry registry({
        make_node("m1", NodeRole::Master, "10.0.0.1"),
        make_node("w1", NodeRole::Worker, "10.0.0.11"),
        make_node("s1", NodeRole::Storage, "10.0.0.21"),
    });

    auto nodes = registry.list();
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0].id, "m1");
    EXPECT_EQ(nodes[1].id, "w1");
    EXPECT_EQ(nodes[2].id, "s1");
}

TEST(NodeRegistryTest, SeedSkipsDuplicateIds) {
    InMemoryNodeRegistry registry({
        make_node("w1", NodeRole::Worker, "10.0.0.11"),
        make_node("w1", NodeRole::Worker, "10.0.0.99"),
    });
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("w1")->address, "10.0.0.11");
}

TEST(NodeRegistryTest, FilterByRole) {
    InMemoryNodeRegistry registry({
        make_node("m1", NodeRole::Master, "10.0.0.1"),
        make_node("w1", NodeRole::Worker, "10.0.0.11"),
        make_node("w2", NodeRole::Worker, "10.0.0.12"),
    });

    auto workers = registry.list(NodeRole::Worker);
    ASSERT_EQ(workers.size(), 2u);
    EXPECT_EQ(workers[0].id, "w1");
    EXPECT_EQ(workers[1].id, "w2");
    EXPECT_TRUE(registry.list(NodeRole::Storage).empty());
}

TEST(NodeRegistryTest, GetUnknownIsNotFound) {
    InMemoryNodeRegistry registry;
    auto result = registry.get("ghost");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(NodeRegistryTest, AddRejectsDuplicatesAndMissingFields) {
    InMemoryNodeRegistry registry;
    ASSERT_TRUE(registry.add(make_node("w1", NodeRole::Worker, "10.0.0.11")).has_value());

    auto dup = registry.add(make_node("w1", NodeRole::Worker, "10.0.0.12"));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::InvalidArgument);

    auto no_address = registry.add(make_node("w2", NodeRole::Worker, ""));
    EXPECT_FALSE(no_address.has_value());
    EXPECT_EQ(registry.size(), 1u);
}

TEST(NodeRegistryTest, UpdateReplacesInPlace) {
    InMemoryNodeRegistry registry({
        make_node("w1", NodeRole::Worker, "10.0.0.11"),
        make_node("w2", NodeRole::Worker, "10.0.0.12"),
    });

    auto changed = make_node("w1", NodeRole::Worker, "10.0.0.111");
    changed.cpu_cores = 32;
    ASSERT_TRUE(registry.update(changed).has_value());

    auto nodes = registry.list();
    EXPECT_EQ(nodes[0].address, "10.0.0.111");
    EXPECT_EQ(nodes[0].cpu_cores, 32u);

    EXPECT_FALSE(registry.update(make_node("w9", NodeRole::Worker, "x")).has_value());
}

TEST(NodeRegistryTest, RemoveReindexes) {
    InMemoryNodeRegistry registry({
        make_node("a", NodeRole::Worker, "10.0.0.1"),
        make_node("b", NodeRole::Worker, "10.0.0.2"),
        make_node("c", NodeRole::Worker, "10.0.0.3"),
    });

    ASSERT_TRUE(registry.remove("a").has_value());
    EXPECT_EQ(registry.size(), 2u);
    ASSERT_TRUE(registry.get("c").has_value());
    EXPECT_EQ(registry.get("c")->address, "10.0.0.3");
    EXPECT_EQ(registry.remove("a").error().code, ErrorCode::NotFound);
}
