/**
 * @file node_registry.cpp
 * @brief InMemoryNodeRegistry implementation.
 */

#include "registry/node_registry.hpp"

#include <mutex>

namespace fleet_orchestrator {

InMemoryNodeRegistry::InMemoryNodeRegistry(std::vector<Node> seed) {
    for (auto& node : seed) {
        if (index_.count(node.id) > 0) continue;
        index_.emplace(node.id, nodes_.size());
        nodes_.push_back(std::move(node));
    }
}

std::vector<Node> InMemoryNodeRegistry::list(std::optional<NodeRole> role) const {
    std::shared_lock lock(mutex_);
    if (!role) return nodes_;

    std::vector<Node> result;
    for (const auto& node : nodes_) {
        if (node.role == *role) result.push_back(node);
    }
    return result;
}

Result<Node> InMemoryNodeRegistry::get(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    return nodes_[it->second];
}

Result<void> InMemoryNodeRegistry::add(Node node) {
    if (node.id.empty() || node.address.empty()) {
        return Error{ErrorCode::InvalidArgument, "Node id and address are required"};
    }
    std::unique_lock lock(mutex_);
    if (index_.count(node.id) > 0) {
        return Error{ErrorCode::InvalidArgument, "Node already registered: " + node.id};
    }
    index_.emplace(node.id, nodes_.size());
    nodes_.push_back(std::move(node));
    return Result<void>{};
}

Result<void> InMemoryNodeRegistry::update(Node node) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(node.id);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + node.id};
    }
    nodes_[it->second] = std::move(node);
    return Result<void>{};
}

Result<void> InMemoryNodeRegistry::remove(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(it->second));
    index_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_.emplace(nodes_[i].id, i);
    }
    return Result<void>{};
}

size_t InMemoryNodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

}  // namespace fleet_orchestrator
