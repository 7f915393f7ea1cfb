/**
 * @file capacity_scheduler.hpp
 * @brief Picks the worker node that will host a new instance.
 *
 * Candidates are registry workers joined with capacity-feed entries by
 * address. Survivors of the (cpu, memory) filter are ranked by available
 * cpu, ties broken by lowest node id. When the feed is unavailable the
 * scheduler degrades to a uniform random worker and says so in the
 * returned Placement.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/node_registry.hpp"
#include "scheduler/capacity_feed.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

namespace fleet_orchestrator {

/**
 * @brief Scheduling decision.
 */
struct Placement {
    enum class Reason : uint8_t {
        CapacityValidated,   ///< Chosen from live feed data
        RandomFallback       ///< Feed unavailable; capacity not checked
    };

    NodeId node_id;
    std::string address;
    Reason reason{Reason::CapacityValidated};
    std::optional<CapacityEntry> capacity;   ///< Feed entry behind a validated choice

    [[nodiscard]] bool validated() const noexcept { return reason == Reason::CapacityValidated; }
};

[[nodiscard]] constexpr std::string_view to_string(Placement::Reason reason) noexcept {
    switch (reason) {
        case Placement::Reason::CapacityValidated: return "capacity_validated";
        case Placement::Reason::RandomFallback:    return "random_fallback";
    }
    return "unknown";
}

class CapacityScheduler {
public:
    CapacityScheduler(const INodeRegistry& registry,
                      const ICapacityFeed& feed,
                      Logger& logger,
                      uint64_t seed = std::random_device{}());

    /**
     * @brief Select a worker for a (cpu, memory_gb) request.
     *
     * @return Placement, or
     *         NotFound when no worker is registered,
     *         InsufficientCapacity (with shortfall) when none fits.
     */
    [[nodiscard]] Result<Placement> select_node(uint32_t cpu, uint32_t memory_gb);

    /// Largest single-worker headroom; 0/0 if the feed is empty or unavailable.
    [[nodiscard]] CapacityLimits max_available_capacity() const;

    [[nodiscard]] uint64_t fallback_count() const noexcept {
        return fallback_count_.load(std::memory_order_relaxed);
    }

private:
    Result<std::vector<CapacityEntry>> query_feed() const;
    Result<Placement> random_worker(const std::vector<Node>& workers, const std::string& reason);

    const INodeRegistry& registry_;
    const ICapacityFeed& feed_;
    Logger& logger_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::atomic<uint64_t> fallback_count_{0};
};

}  // namespace fleet_orchestrator
