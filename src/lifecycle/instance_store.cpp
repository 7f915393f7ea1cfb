/**
 * @file instance_store.cpp
 * @brief MemoryInstanceStore implementation.
 */

#include "lifecycle/instance_store.hpp"

namespace fleet_orchestrator {

Result<void> MemoryInstanceStore::save(const Instance& instance) {
    if (instance.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Instance id is required"};
    }
    std::lock_guard lock(mutex_);
    records_.insert_or_assign(instance.id, instance);
    return Result<void>{};
}

Result<Instance> MemoryInstanceStore::load(const InstanceId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Instance not found: " + id};
    }
    return it->second;
}

Result<std::vector<Instance>> MemoryInstanceStore::list_all() const {
    std::lock_guard lock(mutex_);
    std::vector<Instance> all;
    all.reserve(records_.size());
    for (const auto& [id, instance] : records_) {
        all.push_back(instance);
    }
    return all;
}

size_t MemoryInstanceStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace fleet_orchestrator
