/**
 * @file instance_store.hpp
 * @brief Persistence boundary for instance records.
 *
 * Records are upserted by id and never deleted: termination is a status
 * change. Backends map their I/O failures to PersistenceFailure.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// IInstanceStore (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

class IInstanceStore {
public:
    virtual ~IInstanceStore() = default;

    /// Insert or replace the record with instance.id.
    virtual Result<void> save(const Instance& instance) = 0;

    /// NotFound if no record has this id.
    [[nodiscard]] virtual Result<Instance> load(const InstanceId& id) const = 0;

    /// Every record, in any state.
    [[nodiscard]] virtual Result<std::vector<Instance>> list_all() const = 0;
};

/**
 * @brief Process-local store. Records are lost at exit.
 */
class MemoryInstanceStore : public IInstanceStore {
public:
    Result<void> save(const Instance& instance) override;
    [[nodiscard]] Result<Instance> load(const InstanceId& id) const override;
    [[nodiscard]] Result<std::vector<Instance>> list_all() const override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<InstanceId, Instance> records_;
};

}  // namespace fleet_orchestrator
