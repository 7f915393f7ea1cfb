/**
 * @file cluster_aggregator.cpp
 * @brief Cluster grade computation.
 */

#include "health/cluster_aggregator.hpp"

namespace fleet_orchestrator {

ClusterSummary summarize(const std::vector<NodeStatus>& statuses) {
    ClusterSummary summary;
    summary.total_nodes = statuses.size();
    for (const auto& status : statuses) {
        if (status.online) {
            ++summary.online_nodes;
        }
        if (status.health == NodeHealth::Healthy) {
            ++summary.healthy_nodes;
        }
    }
    summary.offline_nodes = summary.total_nodes - summary.online_nodes;
    summary.unhealthy_nodes = summary.total_nodes - summary.healthy_nodes;
    return summary;
}

ClusterGrade grade_for(const ClusterSummary& summary) noexcept {
    if (summary.total_nodes == 0 || summary.online_nodes == 0) {
        return ClusterGrade::Offline;
    }
    if (summary.online_nodes == summary.total_nodes) {
        return ClusterGrade::Healthy;
    }
    // Exact ratio; the reported percentage is rounded separately.
    double ratio = static_cast<double>(summary.online_nodes)
                 / static_cast<double>(summary.total_nodes) * 100.0;
    if (ratio >= 80.0) {
        return ClusterGrade::Degraded;
    }
    return ClusterGrade::Critical;
}

std::string summary_message(ClusterGrade grade, const ClusterSummary& summary) {
    switch (grade) {
        case ClusterGrade::Healthy:
            return "All nodes are operating normally.";
        case ClusterGrade::Degraded:
            return "Some nodes have problems. (" + std::to_string(summary.unhealthy_nodes)
                 + " unhealthy)";
        case ClusterGrade::Critical:
            return "Many nodes are offline. (" + std::to_string(summary.offline_nodes)
                 + " offline)";
        case ClusterGrade::Offline:
            return "No nodes are connected to the cluster.";
    }
    return {};
}

ClusterSnapshot aggregate(const std::vector<NodeStatus>& statuses, std::string cluster_name) {
    ClusterSnapshot snapshot;
    snapshot.cluster_name = std::move(cluster_name);
    snapshot.summary = summarize(statuses);
    snapshot.grade = grade_for(snapshot.summary);
    snapshot.availability_percent = snapshot.summary.availability_percent();
    snapshot.message = summary_message(snapshot.grade, snapshot.summary);
    snapshot.checked_at = std::chrono::system_clock::now();
    return snapshot;
}

ClusterSnapshot aggregate(const std::vector<NodeWithStatus>& nodes,
                          bool include_nodes,
                          std::string cluster_name) {
    std::vector<NodeStatus> statuses;
    statuses.reserve(nodes.size());
    for (const auto& entry : nodes) {
        statuses.push_back(entry.status);
    }

    auto snapshot = aggregate(statuses, std::move(cluster_name));
    if (include_nodes) {
        snapshot.nodes = nodes;
    }
    return snapshot;
}

}  // namespace fleet_orchestrator
