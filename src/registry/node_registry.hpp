/**
 * @file node_registry.hpp
 * @brief Node registry interface and the in-memory registry the daemon seeds
 *        from configuration.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace fleet_orchestrator {

/**
 * @brief Read-mostly source of registered fleet nodes.
 *
 * list() returns nodes in registration order; the prober and aggregator
 * preserve that order in their output.
 */
class INodeRegistry {
public:
    virtual ~INodeRegistry() = default;

    [[nodiscard]] virtual std::vector<Node> list(std::optional<NodeRole> role = std::nullopt) const = 0;
    [[nodiscard]] virtual Result<Node> get(const NodeId& id) const = 0;

    virtual Result<void> add(Node node) = 0;
    virtual Result<void> update(Node node) = 0;
    virtual Result<void> remove(const NodeId& id) = 0;
};

/**
 * @brief Thread-safe in-memory registry. Reads share the lock; writes are
 *        exclusive.
 */
class InMemoryNodeRegistry : public INodeRegistry {
public:
    InMemoryNodeRegistry() = default;
    explicit InMemoryNodeRegistry(std::vector<Node> seed);

    [[nodiscard]] std::vector<Node> list(std::optional<NodeRole> role = std::nullopt) const override;
    [[nodiscard]] Result<Node> get(const NodeId& id) const override;

    Result<void> add(Node node) override;
    Result<void> update(Node node) override;
    Result<void> remove(const NodeId& id) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, size_t> index_;
};

}  // namespace fleet_orchestrator
