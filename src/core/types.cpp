/**
 * @file types.cpp
 * @brief Parsing and derived-value helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <cmath>

namespace fleet_orchestrator {

std::optional<NodeRole> parse_node_role(std::string_view text) noexcept {
    if (text == "master")  return NodeRole::Master;
    if (text == "worker")  return NodeRole::Worker;
    if (text == "storage") return NodeRole::Storage;
    return std::nullopt;
}

std::optional<InstanceStatus> parse_instance_status(std::string_view text) noexcept {
    if (text == "pending")    return InstanceStatus::Pending;
    if (text == "running")    return InstanceStatus::Running;
    if (text == "stopped")    return InstanceStatus::Stopped;
    if (text == "terminated") return InstanceStatus::Terminated;
    if (text == "error")      return InstanceStatus::Error;
    return std::nullopt;
}

double ClusterSummary::availability_percent() const noexcept {
    if (total_nodes == 0) return 0.0;
    double pct = 100.0 * static_cast<double>(online_nodes)
                 / static_cast<double>(total_nodes);
    return std::round(pct * 100.0) / 100.0;
}

std::string Instance::access_url() const {
    if (node_address.empty() || port == 0) return {};
    return node_address + ":" + std::to_string(port);
}

}  // namespace fleet_orchestrator
