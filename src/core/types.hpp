/**
 * @file types.hpp
 * @brief Fundamental types used throughout FleetOrchestrator.
 *
 * Defines the fleet vocabulary: nodes and their probe status, cluster
 * snapshots, workload instances, quota counters and capacity-feed entries.
 * All types are plain values; ownership lives in the services that hold them.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using UserId = std::string;
using InstanceId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Request limits
// ─────────────────────────────────────────────

inline constexpr uint32_t kMinInstanceCpu = 1;
inline constexpr uint32_t kMaxInstanceCpu = 8;
inline constexpr uint32_t kMinInstanceMemoryGb = 1;
inline constexpr uint32_t kMaxInstanceMemoryGb = 32;
inline constexpr size_t kMaxInstanceNameLength = 64;

// ─────────────────────────────────────────────
// Nodes
// ─────────────────────────────────────────────

enum class NodeRole : uint8_t {
    Master,
    Worker,
    Storage
};

[[nodiscard]] constexpr std::string_view to_string(NodeRole role) noexcept {
    switch (role) {
        case NodeRole::Master:  return "master";
        case NodeRole::Worker:  return "worker";
        case NodeRole::Storage: return "storage";
    }
    return "unknown";
}

[[nodiscard]] std::optional<NodeRole> parse_node_role(std::string_view text) noexcept;

/**
 * @brief A registered fleet machine.
 *
 * Owned by the node registry; immutable here except through explicit update.
 */
struct Node {
    NodeId id;
    std::string hostname;
    std::string address;                      ///< Overlay-network IPv4 address
    NodeRole role{NodeRole::Worker};
    std::optional<uint32_t> cpu_cores;        ///< Declared capacity, if known
    std::optional<double> memory_gb;
    std::string description;
    std::vector<std::string> tags;
};

enum class NodeHealth : uint8_t {
    Healthy,
    Unhealthy,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(NodeHealth health) noexcept {
    switch (health) {
        case NodeHealth::Healthy:   return "healthy";
        case NodeHealth::Unhealthy: return "unhealthy";
        case NodeHealth::Unknown:   return "unknown";
    }
    return "unknown";
}

/**
 * @brief Result of a single reachability probe. Recomputed on every probe.
 */
struct NodeStatus {
    NodeId node_id;
    NodeHealth health{NodeHealth::Unknown};
    bool online{false};
    double response_time_ms{0.0};
    Timestamp last_check_at;
    std::optional<std::string> error_message;
};

struct NodeWithStatus {
    Node info;
    NodeStatus status;
};

/**
 * @brief Raw outcome of a TCP handshake attempt, before health policy.
 */
struct ProbeOutcome {
    enum class Kind : uint8_t {
        Connected,
        Refused,
        TimedOut,
        TransportError
    } kind{Kind::TransportError};

    double latency_ms{0.0};
    std::string detail;
};

// ─────────────────────────────────────────────
// Cluster snapshot
// ─────────────────────────────────────────────

enum class ClusterGrade : uint8_t {
    Healthy,
    Degraded,
    Critical,
    Offline
};

[[nodiscard]] constexpr std::string_view to_string(ClusterGrade grade) noexcept {
    switch (grade) {
        case ClusterGrade::Healthy:  return "healthy";
        case ClusterGrade::Degraded: return "degraded";
        case ClusterGrade::Critical: return "critical";
        case ClusterGrade::Offline:  return "offline";
    }
    return "unknown";
}

struct ClusterSummary {
    size_t total_nodes{0};
    size_t online_nodes{0};
    size_t offline_nodes{0};
    size_t healthy_nodes{0};
    size_t unhealthy_nodes{0};

    /// online/total*100 rounded to two decimals; 0 for an empty cluster.
    [[nodiscard]] double availability_percent() const noexcept;
};

struct ClusterSnapshot {
    std::string cluster_name;
    ClusterGrade grade{ClusterGrade::Offline};
    ClusterSummary summary;
    double availability_percent{0.0};
    Timestamp checked_at;
    std::string message;
    std::optional<std::vector<NodeWithStatus>> nodes;
};

// ─────────────────────────────────────────────
// Instances
// ─────────────────────────────────────────────

enum class InstanceStatus : uint8_t {
    Pending,
    Running,
    Stopped,
    Terminated,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(InstanceStatus status) noexcept {
    switch (status) {
        case InstanceStatus::Pending:    return "pending";
        case InstanceStatus::Running:    return "running";
        case InstanceStatus::Stopped:    return "stopped";
        case InstanceStatus::Terminated: return "terminated";
        case InstanceStatus::Error:      return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<InstanceStatus> parse_instance_status(std::string_view text) noexcept;

/**
 * @brief Parameters of a create-instance request.
 */
struct InstanceRequest {
    std::string name;
    std::string image = "ubuntu:22.04";
    uint32_t cpu = 1;
    uint32_t memory_gb = 2;
    std::map<std::string, std::string> env;
};

/**
 * @brief A workload placed on a worker node.
 *
 * Never deleted: termination is a status transition. The *_held flags record
 * whether this instance still owns its port and quota units in the ledger.
 */
struct Instance {
    InstanceId id;
    UserId owner_id;
    std::string name;
    std::string image;
    NodeId node_id;
    std::string node_address;
    uint32_t cpu{1};
    uint32_t memory_gb{1};
    uint16_t port{0};
    InstanceStatus status{InstanceStatus::Pending};
    std::string deployment_handle;

    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> stopped_at;

    bool port_held{false};
    bool quota_held{false};

    [[nodiscard]] bool is_live() const noexcept {
        return status != InstanceStatus::Terminated && status != InstanceStatus::Error;
    }

    /// "address:port" once a port has been assigned, empty otherwise.
    [[nodiscard]] std::string access_url() const;
};

struct InstanceSummary {
    size_t total{0};
    size_t running{0};
    size_t stopped{0};
    size_t pending{0};
};

// ─────────────────────────────────────────────
// Quota
// ─────────────────────────────────────────────

/**
 * @brief Declared per-user limits. Reported, not enforced by the
 *        usage-based policy.
 */
struct QuotaLimits {
    uint32_t max_instances{5};
    uint32_t max_cpu{16};
    uint32_t max_memory_gb{64};
};

/**
 * @brief Per-user usage counters. Never negative.
 */
struct QuotaCounters {
    uint32_t used_instances{0};
    uint32_t used_cpu{0};
    uint32_t used_memory_gb{0};

    bool operator==(const QuotaCounters&) const = default;
};

struct QuotaDimension {
    uint32_t used{0};
    uint32_t max{0};
    uint32_t available{0};
    double usage_percent{0.0};
};

struct QuotaSummary {
    UserId user_id;
    QuotaDimension instances;
    QuotaDimension cpu;
    QuotaDimension memory_gb;
};

// ─────────────────────────────────────────────
// Capacity feed
// ─────────────────────────────────────────────

/**
 * @brief Live headroom of one node as reported by the capacity feed.
 */
struct CapacityEntry {
    std::string address;
    double available_cpu{0.0};
    double available_memory_gb{0.0};
};

struct CapacityLimits {
    uint32_t max_cpu{0};
    uint32_t max_memory_gb{0};
};

// ─────────────────────────────────────────────
// Ports
// ─────────────────────────────────────────────

struct PortUsage {
    NodeId node_id;
    size_t allocated_count{0};
    size_t available_count{0};
    std::map<InstanceId, uint16_t> allocations;
};

}  // namespace fleet_orchestrator
