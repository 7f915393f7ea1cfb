/**
 * @file port_ledger.hpp
 * @brief Per-node host port assignment for instances.
 *
 * Ports come from a fixed range (default [8000, 9999]). Allocation returns
 * the lowest port not live on that node, so a released port is reused before
 * the allocation frontier moves up. Mutations on one node are serialized;
 * different nodes proceed in parallel.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace fleet_orchestrator {

class PortLedger {
public:
    PortLedger(uint16_t range_start = 8000, uint16_t range_end = 9999);

    PortLedger(const PortLedger&) = delete;
    PortLedger& operator=(const PortLedger&) = delete;

    /**
     * @brief Assign a port on node to instance.
     *
     * An instance that already holds a port on the node gets the same port
     * back. ResourceExhausted when every port in range is live.
     */
    Result<uint16_t> allocate(const NodeId& node, const InstanceId& instance);

    /**
     * @brief Record a known assignment, e.g. when rebuilding from persisted
     *        instances. InvalidState if the port is out of range or held by
     *        another instance.
     */
    Result<void> reserve(const NodeId& node, const InstanceId& instance, uint16_t port);

    /// Drop the mapping; the freed port, or nullopt if there was none.
    std::optional<uint16_t> release(const NodeId& node, const InstanceId& instance);

    [[nodiscard]] std::optional<uint16_t> port_of(const NodeId& node,
                                                  const InstanceId& instance) const;

    [[nodiscard]] PortUsage usage(const NodeId& node) const;

    [[nodiscard]] uint16_t range_start() const noexcept { return range_start_; }
    [[nodiscard]] uint16_t range_end() const noexcept { return range_end_; }
    [[nodiscard]] size_t range_size() const noexcept {
        return static_cast<size_t>(range_end_) - range_start_ + 1;
    }

private:
    struct NodePorts {
        mutable std::mutex mutex;
        std::map<InstanceId, uint16_t> by_instance;
        std::set<uint16_t> live;
    };

    NodePorts* find(const NodeId& node) const;
    NodePorts& find_or_create(const NodeId& node);

    uint16_t range_start_;
    uint16_t range_end_;
    mutable std::shared_mutex nodes_mutex_;
    std::unordered_map<NodeId, std::unique_ptr<NodePorts>> nodes_;
};

}  // namespace fleet_orchestrator
