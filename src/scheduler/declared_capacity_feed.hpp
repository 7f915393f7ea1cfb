/**
 * @file declared_capacity_feed.hpp
 * @brief Capacity feed derived from registry-declared node capacity minus
 *        the resources held by live instances on each node.
 *
 * Used when no external resource manager is available. Nodes without a
 * declared cpu_cores/memory_gb pair are omitted from the feed.
 */

#pragma once

#include "lifecycle/instance_store.hpp"
#include "registry/node_registry.hpp"
#include "scheduler/capacity_feed.hpp"

namespace fleet_orchestrator {

class DeclaredCapacityFeed : public ICapacityFeed {
public:
    DeclaredCapacityFeed(const INodeRegistry& registry, const IInstanceStore& store);

    [[nodiscard]] Result<std::vector<CapacityEntry>> list_available() const override;

private:
    const INodeRegistry& registry_;
    const IInstanceStore& store_;
};

}  // namespace fleet_orchestrator
