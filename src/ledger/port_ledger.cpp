/**
 * @file port_ledger.cpp
 * @brief PortLedger implementation.
 */

#include "ledger/port_ledger.hpp"

#include <utility>

namespace fleet_orchestrator {

PortLedger::PortLedger(uint16_t range_start, uint16_t range_end)
    : range_start_(range_start)
    , range_end_(range_end < range_start ? range_start : range_end) {
}

PortLedger::NodePorts* PortLedger::find(const NodeId& node) const {
    std::shared_lock lock(nodes_mutex_);
    auto it = nodes_.find(node);
    return it == nodes_.end() ? nullptr : it->second.get();
}

PortLedger::NodePorts& PortLedger::find_or_create(const NodeId& node) {
    if (auto* existing = find(node)) return *existing;

    std::unique_lock lock(nodes_mutex_);
    auto& slot = nodes_[node];
    if (!slot) slot = std::make_unique<NodePorts>();
    return *slot;
}

Result<uint16_t> PortLedger::allocate(const NodeId& node, const InstanceId& instance) {
    auto& ports = find_or_create(node);
    std::lock_guard lock(ports.mutex);

    if (auto it = ports.by_instance.find(instance); it != ports.by_instance.end()) {
        return it->second;
    }

    // `live` is ordered: walk it alongside the range until the first gap.
    uint32_t candidate = range_start_;
    for (uint16_t used : ports.live) {
        if (used < candidate) continue;
        if (used > candidate) break;
        ++candidate;
    }
    if (candidate > range_end_) {
        return Error{ErrorCode::ResourceExhausted,
                     "No free port on node " + node + " in ["
                     + std::to_string(range_start_) + ", " + std::to_string(range_end_) + "]"};
    }

    auto port = static_cast<uint16_t>(candidate);
    ports.live.insert(port);
    ports.by_instance.emplace(instance, port);
    return port;
}

Result<void> PortLedger::reserve(const NodeId& node, const InstanceId& instance, uint16_t port) {
    if (port < range_start_ || port > range_end_) {
        return Error{ErrorCode::InvalidState,
                     "Port " + std::to_string(port) + " outside ledger range"};
    }

    auto& ports = find_or_create(node);
    std::lock_guard lock(ports.mutex);

    if (auto it = ports.by_instance.find(instance); it != ports.by_instance.end()) {
        if (it->second == port) return Result<void>{};
        return Error{ErrorCode::InvalidState,
                     "Instance " + instance + " already holds port "
                     + std::to_string(it->second) + " on " + node};
    }
    if (ports.live.count(port) > 0) {
        return Error{ErrorCode::InvalidState,
                     "Port " + std::to_string(port) + " on " + node + " is already assigned"};
    }
    ports.live.insert(port);
    ports.by_instance.emplace(instance, port);
    return Result<void>{};
}

std::optional<uint16_t> PortLedger::release(const NodeId& node, const InstanceId& instance) {
    auto* ports = find(node);
    if (ports == nullptr) return std::nullopt;

    std::lock_guard lock(ports->mutex);
    auto it = ports->by_instance.find(instance);
    if (it == ports->by_instance.end()) return std::nullopt;

    uint16_t port = it->second;
    ports->by_instance.erase(it);
    ports->live.erase(port);
    return port;
}

std::optional<uint16_t> PortLedger::port_of(const NodeId& node, const InstanceId& instance) const {
    auto* ports = find(node);
    if (ports == nullptr) return std::nullopt;

    std::lock_guard lock(ports->mutex);
    auto it = ports->by_instance.find(instance);
    if (it == ports->by_instance.end()) return std::nullopt;
    return it->second;
}

PortUsage PortLedger::usage(const NodeId& node) const {
    PortUsage result;
    result.node_id = node;
    result.available_count = range_size();

    auto* ports = find(node);
    if (ports == nullptr) return result;

    std::lock_guard lock(ports->mutex);
    result.allocated_count = ports->by_instance.size();
    result.available_count = range_size() - result.allocated_count;
    result.allocations = ports->by_instance;
    return result;
}

}  // namespace fleet_orchestrator
