/**
 * @file capacity_scheduler.cpp
 * @brief Capacity-validated node selection with observable random fallback.
 */

#include "scheduler/capacity_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace fleet_orchestrator {

namespace {

/// Index feed entries by address; the first entry for an address wins.
std::unordered_map<std::string, const CapacityEntry*>
index_by_address(const std::vector<CapacityEntry>& entries) {
    std::unordered_map<std::string, const CapacityEntry*> index;
    for (const auto& entry : entries) {
        index.emplace(entry.address, &entry);
    }
    return index;
}

uint32_t whole_units(double value) noexcept {
    return value <= 0.0 ? 0 : static_cast<uint32_t>(value);
}

}  // anonymous namespace

CapacityScheduler::CapacityScheduler(const INodeRegistry& registry,
                                     const ICapacityFeed& feed,
                                     Logger& logger,
                                     uint64_t seed)
    : registry_(registry)
    , feed_(feed)
    , logger_(logger)
    , rng_(seed) {
}

Result<std::vector<CapacityEntry>> CapacityScheduler::query_feed() const {
    try {
        return feed_.list_available();
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"Capacity feed threw: "} + e.what()};
    }
}

Result<Placement> CapacityScheduler::select_node(uint32_t cpu, uint32_t memory_gb) {
    auto workers = registry_.list(NodeRole::Worker);
    if (workers.empty()) {
        return Error{ErrorCode::NotFound, "No worker nodes registered"};
    }

    auto feed = query_feed();
    if (!feed) {
        return random_worker(workers, feed.error().message);
    }

    auto by_address = index_by_address(*feed);

    const Node* best = nullptr;
    const CapacityEntry* best_entry = nullptr;
    double max_cpu = 0.0;
    double max_memory = 0.0;

    for (const auto& worker : workers) {
        auto it = by_address.find(worker.address);
        if (it == by_address.end()) continue;
        const auto* entry = it->second;

        max_cpu = std::max(max_cpu, entry->available_cpu);
        max_memory = std::max(max_memory, entry->available_memory_gb);

        if (entry->available_cpu < cpu || entry->available_memory_gb < memory_gb) continue;

        if (best == nullptr
            || entry->available_cpu > best_entry->available_cpu
            || (entry->available_cpu == best_entry->available_cpu && worker.id < best->id)) {
            best = &worker;
            best_entry = entry;
        }
    }

    if (best == nullptr) {
        CapacityShortfall shortfall{
            .requested_cpu = cpu,
            .requested_memory_gb = memory_gb,
            .max_cpu_available = whole_units(max_cpu),
            .max_memory_available_gb = whole_units(max_memory),
        };
        logger_.info("No worker fits " + std::to_string(cpu) + " vCPU / "
                     + std::to_string(memory_gb) + " GB request");
        return insufficient_capacity(shortfall);
    }

    Placement placement;
    placement.node_id = best->id;
    placement.address = best->address;
    placement.reason = Placement::Reason::CapacityValidated;
    placement.capacity = *best_entry;

    logger_.debug("Placed " + std::to_string(cpu) + " vCPU / " + std::to_string(memory_gb)
                  + " GB on " + best->id + " (available cpu "
                  + std::to_string(best_entry->available_cpu) + ")");
    return placement;
}

Result<Placement> CapacityScheduler::random_worker(const std::vector<Node>& workers,
                                                   const std::string& reason) {
    size_t index = 0;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_int_distribution<size_t> dist(0, workers.size() - 1);
        index = dist(rng_);
    }
    fallback_count_.fetch_add(1, std::memory_order_relaxed);

    const auto& chosen = workers[index];
    logger_.warn("Capacity feed unavailable (" + reason + "); placing on random worker "
                 "without capacity validation",
                 {{"node", chosen.id}});

    Placement placement;
    placement.node_id = chosen.id;
    placement.address = chosen.address;
    placement.reason = Placement::Reason::RandomFallback;
    return placement;
}

CapacityLimits CapacityScheduler::max_available_capacity() const {
    CapacityLimits limits;
    auto feed = query_feed();
    if (!feed) return limits;

    auto by_address = index_by_address(*feed);
    double max_cpu = 0.0;
    double max_memory = 0.0;
    for (const auto& worker : registry_.list(NodeRole::Worker)) {
        auto it = by_address.find(worker.address);
        if (it == by_address.end()) continue;
        max_cpu = std::max(max_cpu, it->second->available_cpu);
        max_memory = std::max(max_memory, it->second->available_memory_gb);
    }
    limits.max_cpu = whole_units(max_cpu);
    limits.max_memory_gb = whole_units(max_memory);
    return limits;
}

}  // namespace fleet_orchestrator
