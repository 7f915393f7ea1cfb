/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/logger.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace fleet_orchestrator;

TEST(ClusterSummaryTest, AvailabilityRoundedToTwoDecimals) {
    ClusterSummary summary{.total_nodes = 17, .online_nodes = 14};
    EXPECT_DOUBLE_EQ(summary.availability_percent(), 82.35);
}

TEST(ClusterSummaryTest, EmptyClusterHasZeroAvailability) {
    ClusterSummary summary;
    EXPECT_DOUBLE_EQ(summary.availability_percent(), 0.0);
}

TEST(ClusterSummaryTest, FullAvailability) {
    ClusterSummary summary{.total_nodes = 3, .online_nodes = 3};
    EXPECT_DOUBLE_EQ(summary.availability_percent(), 100.0);
}

TEST(NodeRoleTest, ParseAndPrint) {
    EXPECT_EQ(parse_node_role("master"), NodeRole::Master);
    EXPECT_EQ(parse_node_role("worker"), NodeRole::Worker);
    EXPECT_EQ(parse_node_role("storage"), NodeRole::Storage);
    EXPECT_FALSE(parse_node_role("gateway").has_value());
    EXPECT_EQ(to_string(NodeRole::Storage), "storage");
}

TEST(InstanceStatusTest, ParseAndPrint) {
    for (auto status : {InstanceStatus::Pending, InstanceStatus::Running,
                        InstanceStatus::Stopped, InstanceStatus::Terminated,
                        InstanceStatus::Error}) {
        EXPECT_EQ(parse_instance_status(to_string(status)), status);
    }
    EXPECT_FALSE(parse_instance_status("paused").has_value());
}

TEST(InstanceTest, LiveStatuses) {
    Instance instance;
    instance.status = InstanceStatus::Running;
    EXPECT_TRUE(instance.is_live());
    instance.status = InstanceStatus::Stopped;
    EXPECT_TRUE(instance.is_live());
    instance.status = InstanceStatus::Terminated;
    EXPECT_FALSE(instance.is_live());
    instance.status = InstanceStatus::Error;
    EXPECT_FALSE(instance.is_live());
}

TEST(InstanceTest, AccessUrl) {
    Instance instance;
    EXPECT_TRUE(instance.access_url().empty());
    instance.node_address = "100.64.0.11";
    instance.port = 8001;
    EXPECT_EQ(instance.access_url(), "100.64.0.11:8001");
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(JsonEscapeTest, EscapesQuotesAndControls) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("line\nbreak"), "line\\nbreak");
}
