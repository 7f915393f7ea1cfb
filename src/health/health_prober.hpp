/**
 * @file health_prober.hpp
 * @brief Concurrent reachability probing of every registered node.
 *
 * Each node gets one bounded TCP handshake on the prober's worker pool; the
 * batch waits for all of them, so a round costs roughly one timeout rather
 * than one timeout per node. The pool grows until every outstanding probe,
 * across overlapping rounds, has a worker of its own; pool_size only sets
 * how many workers exist up front. Probe faults never escape: they become
 * NodeStatus records with health "unknown".
 *
 * Template-parameterized on the probe transport for testability
 * (TcpProbe in production, scripted fakes in tests).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "network/tcp_probe.hpp"
#include "registry/node_registry.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <vector>

namespace fleet_orchestrator {

struct ProberOptions {
    uint16_t port = 22;
    uint32_t timeout_ms = 5000;
    size_t pool_size = 32;  ///< Workers spawned up front
};

/**
 * @brief Map a raw handshake outcome onto the node health policy.
 *
 *   Connected       → healthy,   online
 *   Refused         → healthy,   online  (host alive, port closed)
 *   TimedOut        → unhealthy, offline
 *   TransportError  → unhealthy, offline, error captured
 */
[[nodiscard]] NodeStatus classify_probe(const NodeId& node_id, const ProbeOutcome& outcome);

/// Status recorded when the probe itself faulted.
[[nodiscard]] NodeStatus unknown_status(const NodeId& node_id, std::string error, double latency_ms = 0.0);

template <ProbeTransportLike ProbeT = TcpProbe>
class HealthProber {
public:
    HealthProber(const INodeRegistry& registry,
                 ProberOptions options,
                 Logger& logger,
                 ProbeT transport = ProbeT{});

    HealthProber(const HealthProber&) = delete;
    HealthProber& operator=(const HealthProber&) = delete;

    /// Probe a single node. Never throws for std::exception faults.
    [[nodiscard]] NodeStatus probe(const Node& node) const;

    /// Probe every registered node concurrently; output follows registry order.
    [[nodiscard]] std::vector<NodeWithStatus> probe_all();

    /// Look up a node in the registry and probe it.
    [[nodiscard]] Result<NodeWithStatus> probe_node(const NodeId& id) const;

    [[nodiscard]] const ProberOptions& options() const noexcept { return options_; }
    [[nodiscard]] const ProbeT& transport() const noexcept { return transport_; }

private:
    const INodeRegistry& registry_;
    ProberOptions options_;
    Logger& logger_;
    ProbeT transport_;
    ThreadPool pool_;
    std::atomic<size_t> in_flight_{0};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ProbeTransportLike ProbeT>
HealthProber<ProbeT>::HealthProber(const INodeRegistry& registry,
                                   ProberOptions options,
                                   Logger& logger,
                                   ProbeT transport)
    : registry_(registry)
    , options_(options)
    , logger_(logger)
    , transport_(std::move(transport))
    , pool_(options.pool_size == 0 ? 1 : options.pool_size) {
}

template <ProbeTransportLike ProbeT>
NodeStatus HealthProber<ProbeT>::probe(const Node& node) const {
    auto start = std::chrono::steady_clock::now();
    try {
        auto outcome = transport_.connect_probe(node.address, options_.port, options_.timeout_ms);
        return classify_probe(node.id, outcome);
    } catch (const std::exception& e) {
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        logger_.warn("Probe of " + node.id + " faulted: " + e.what());
        return unknown_status(node.id, std::string{"Unexpected probe fault: "} + e.what(), elapsed);
    }
}

template <ProbeTransportLike ProbeT>
std::vector<NodeWithStatus> HealthProber<ProbeT>::probe_all() {
    auto nodes = registry_.list();
    if (nodes.empty()) return {};

    auto start = std::chrono::steady_clock::now();

    // No node may queue behind another node's timeout.
    pool_.ensure_threads(in_flight_.fetch_add(nodes.size()) + nodes.size());
    auto pending = pool_.submit_each(nodes, [this](const Node& node) { return probe(node); });

    std::vector<NodeWithStatus> results;
    results.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        NodeStatus status;
        try {
            status = pending[i].get();
        } catch (const std::exception& e) {
            status = unknown_status(nodes[i].id, std::string{"Health check failed: "} + e.what());
        }
        in_flight_.fetch_sub(1);
        results.push_back(NodeWithStatus{std::move(nodes[i]), std::move(status)});
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger_.debug("Probed " + std::to_string(results.size()) + " nodes in "
                  + std::to_string(elapsed.count()) + "ms");
    return results;
}

template <ProbeTransportLike ProbeT>
Result<NodeWithStatus> HealthProber<ProbeT>::probe_node(const NodeId& id) const {
    auto node = registry_.get(id);
    if (!node) return node.error();
    auto status = probe(*node);
    return NodeWithStatus{std::move(*node), std::move(status)};
}

}  // namespace fleet_orchestrator
