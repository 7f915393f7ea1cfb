/**
 * @file cluster_aggregator.hpp
 * @brief Reduce per-node probe results into one cluster-wide grade.
 *
 * Grade rule, evaluated in order:
 *   total == 0          → offline
 *   availability == 100 → healthy
 *   availability >= 80  → degraded
 *   availability >  0   → critical
 *   otherwise           → offline
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace fleet_orchestrator {

[[nodiscard]] ClusterSummary summarize(const std::vector<NodeStatus>& statuses);

[[nodiscard]] ClusterGrade grade_for(const ClusterSummary& summary) noexcept;

[[nodiscard]] std::string summary_message(ClusterGrade grade, const ClusterSummary& summary);

/// Pure function of the status counts.
[[nodiscard]] ClusterSnapshot aggregate(const std::vector<NodeStatus>& statuses,
                                        std::string cluster_name = "fleet-cluster");

/// Same, optionally embedding the per-node detail in input order.
[[nodiscard]] ClusterSnapshot aggregate(const std::vector<NodeWithStatus>& nodes,
                                        bool include_nodes,
                                        std::string cluster_name = "fleet-cluster");

}  // namespace fleet_orchestrator
