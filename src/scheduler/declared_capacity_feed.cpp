/**
 * @file declared_capacity_feed.cpp
 * @brief DeclaredCapacityFeed implementation.
 */

#include "scheduler/declared_capacity_feed.hpp"

#include <algorithm>
#include <unordered_map>

namespace fleet_orchestrator {

DeclaredCapacityFeed::DeclaredCapacityFeed(const INodeRegistry& registry,
                                           const IInstanceStore& store)
    : registry_(registry)
    , store_(store) {
}

Result<std::vector<CapacityEntry>> DeclaredCapacityFeed::list_available() const {
    auto instances = store_.list_all();
    if (!instances) return instances.error();

    struct Held {
        double cpu{0.0};
        double memory_gb{0.0};
    };
    std::unordered_map<NodeId, Held> held;
    for (const auto& instance : *instances) {
        if (!instance.is_live()) continue;
        auto& h = held[instance.node_id];
        h.cpu += instance.cpu;
        h.memory_gb += instance.memory_gb;
    }

    std::vector<CapacityEntry> entries;
    for (const auto& node : registry_.list()) {
        if (!node.cpu_cores || !node.memory_gb) continue;

        CapacityEntry entry;
        entry.address = node.address;
        entry.available_cpu = static_cast<double>(*node.cpu_cores);
        entry.available_memory_gb = *node.memory_gb;
        if (auto it = held.find(node.id); it != held.end()) {
            entry.available_cpu = std::max(0.0, entry.available_cpu - it->second.cpu);
            entry.available_memory_gb = std::max(0.0, entry.available_memory_gb - it->second.memory_gb);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace fleet_orchestrator
