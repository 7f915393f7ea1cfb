/**
 * @file instance_controller.cpp
 * @brief InstanceController implementation.
 */

#include "lifecycle/instance_controller.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace fleet_orchestrator {

namespace {

Timestamp now() {
    return std::chrono::system_clock::now();
}

void sort_newest_first(std::vector<Instance>& instances) {
    std::sort(instances.begin(), instances.end(), [](const Instance& a, const Instance& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
}

}  // anonymous namespace

InstanceController::InstanceController(ControllerCollaborators collaborators,
                                       Logger& logger,
                                       MetricsCollector* metrics,
                                       uint64_t id_seed)
    : scheduler_(collaborators.scheduler)
    , quotas_(collaborators.quotas)
    , ports_(collaborators.ports)
    , driver_(collaborators.driver)
    , store_(collaborators.store)
    , logger_(logger)
    , metrics_(metrics)
    , id_rng_(id_seed) {
}

// ─────────────────────────────────────────────
// Validation & helpers
// ─────────────────────────────────────────────

Result<void> InstanceController::validate(const InstanceRequest& request) {
    if (request.name.empty() || request.name.size() > kMaxInstanceNameLength) {
        return Error{ErrorCode::InvalidArgument,
                     "Instance name must be 1-" + std::to_string(kMaxInstanceNameLength)
                     + " characters"};
    }
    if (request.image.empty()) {
        return Error{ErrorCode::InvalidArgument, "Image is required"};
    }
    if (request.cpu < kMinInstanceCpu || request.cpu > kMaxInstanceCpu) {
        return Error{ErrorCode::InvalidArgument,
                     "cpu must be between " + std::to_string(kMinInstanceCpu) + " and "
                     + std::to_string(kMaxInstanceCpu)};
    }
    if (request.memory_gb < kMinInstanceMemoryGb || request.memory_gb > kMaxInstanceMemoryGb) {
        return Error{ErrorCode::InvalidArgument,
                     "memory_gb must be between " + std::to_string(kMinInstanceMemoryGb) + " and "
                     + std::to_string(kMaxInstanceMemoryGb)};
    }
    return Result<void>{};
}

Result<InstanceId> InstanceController::next_id() {
    std::lock_guard lock(id_mutex_);
    char buf[16];
    for (;;) {
        auto value = static_cast<uint32_t>(id_rng_());
        std::snprintf(buf, sizeof(buf), "i-%08x", value);
        InstanceId id{buf};
        auto existing = store_.load(id);
        if (existing) continue;
        if (existing.error().is(ErrorCode::NotFound)) return id;
        return Error{ErrorCode::PersistenceFailure,
                     "Cannot allocate instance id: " + existing.error().message};
    }
}

Result<Instance> InstanceController::load_owned(const InstanceId& id, const UserId& owner) const {
    auto loaded = store_.load(id);
    if (!loaded) {
        if (loaded.error().is(ErrorCode::NotFound)) {
            return Error{ErrorCode::NotFound, "Instance not found: " + id};
        }
        return loaded.error();
    }
    // Someone else's instance is indistinguishable from a missing one.
    if (loaded->owner_id != owner) {
        return Error{ErrorCode::NotFound, "Instance not found: " + id};
    }
    return loaded;
}

Result<std::string> InstanceController::deploy_guarded(const DeployRequest& request) {
    try {
        auto handle = driver_.deploy(request);
        if (!handle) {
            return Error{ErrorCode::DeploymentFailure, handle.error().message};
        }
        return handle;
    } catch (const std::exception& e) {
        return Error{ErrorCode::DeploymentFailure,
                     std::string{"Deployment driver threw: "} + e.what()};
    }
}

Result<void> InstanceController::driver_call(DriverAction action, const Instance& instance) {
    if (instance.deployment_handle.empty()) return Result<void>{};

    const auto& address = instance.node_address;
    const auto& handle = instance.deployment_handle;
    try {
        Result<void> outcome;
        switch (action) {
            case DriverAction::Stop:   outcome = driver_.stop(address, handle); break;
            case DriverAction::Start:  outcome = driver_.start(address, handle); break;
            case DriverAction::Remove: outcome = driver_.remove(address, handle); break;
        }
        if (!outcome) {
            return Error{ErrorCode::DeploymentFailure, outcome.error().message};
        }
        return Result<void>{};
    } catch (const std::exception& e) {
        return Error{ErrorCode::DeploymentFailure,
                     std::string{"Deployment driver threw: "} + e.what()};
    }
}

void InstanceController::release_resources(const Instance& instance) {
    if (instance.port_held) {
        ports_.release(instance.node_id, instance.id);
    }
    if (instance.quota_held) {
        quotas_.release(instance.owner_id, instance.cpu, instance.memory_gb);
    }
}

void InstanceController::record(const Instance& instance, std::string_view action) {
    if (metrics_ != nullptr) {
        metrics_->record_instance_event(instance, action);
    }
}

// ─────────────────────────────────────────────
// Create
// ─────────────────────────────────────────────

Result<Instance> InstanceController::create(const UserId& owner, const InstanceRequest& request) {
    if (auto valid = validate(request); !valid) {
        return valid.error();
    }

    // 1. Admission
    if (auto admitted = quotas_.check(owner, request.cpu, request.memory_gb); !admitted) {
        logger_.info("Quota rejected request from " + owner + ": " + admitted.error().message);
        return admitted.error();
    }

    // 2. Placement (nothing committed yet)
    auto placement = scheduler_.select_node(request.cpu, request.memory_gb);
    if (!placement) {
        return placement.error();
    }

    auto id = next_id();
    if (!id) {
        logger_.error(id.error().message);
        return id.error();
    }

    Instance instance;
    instance.id = std::move(*id);
    instance.owner_id = owner;
    instance.name = request.name;
    instance.image = request.image;
    instance.node_id = placement->node_id;
    instance.node_address = placement->address;
    instance.cpu = request.cpu;
    instance.memory_gb = request.memory_gb;
    instance.status = InstanceStatus::Pending;
    instance.created_at = now();

    if (metrics_ != nullptr) {
        metrics_->record_placement(instance.id, *placement, request.cpu, request.memory_gb);
    }

    // 3. Port
    auto port = ports_.allocate(instance.node_id, instance.id);
    if (!port) {
        logger_.warn("Port allocation failed on " + instance.node_id + ": " + port.error().message);
        return port.error();
    }
    instance.port = *port;
    instance.port_held = true;

    // 4. Quota commit
    if (auto committed = quotas_.allocate(owner, request.cpu, request.memory_gb); !committed) {
        if (committed.error().is(ErrorCode::NotFound)) {
            logger_.warn("No quota account for " + owner + "; usage not recorded for "
                         + instance.id);
        } else {
            release_resources(instance);
            return committed.error();
        }
    } else {
        instance.quota_held = true;
    }

    // 5. Deploy
    DeployRequest deploy{
        .instance_id = instance.id,
        .owner_id = owner,
        .address = instance.node_address,
        .image = instance.image,
        .cpu = instance.cpu,
        .memory_gb = instance.memory_gb,
        .port = instance.port,
        .env = request.env,
    };
    auto handle = deploy_guarded(deploy);

    if (!handle) {
        // 7. Roll back everything committed in steps 3-4.
        release_resources(instance);
        instance.port_held = false;
        instance.quota_held = false;
        instance.status = InstanceStatus::Error;

        if (auto saved = store_.save(instance); !saved) {
            logger_.error("Failed to record errored instance " + instance.id + ": "
                          + saved.error().message);
        }
        record(instance, "failed");
        logger_.error("Deployment failed: " + handle.error().message,
                      {{"instance", instance.id}, {"owner", owner}, {"node", instance.node_id}});
        return Error{ErrorCode::DeploymentFailure,
                     "Deployment of " + instance.id + " failed: " + handle.error().message};
    }

    // 6. Running
    instance.deployment_handle = *handle;
    instance.status = InstanceStatus::Running;
    instance.started_at = now();

    if (auto saved = store_.save(instance); !saved) {
        if (auto removed = driver_call(DriverAction::Remove, instance); !removed) {
            logger_.error("Cleanup of unpersisted " + instance.id + " failed: "
                          + removed.error().message);
        }
        release_resources(instance);
        logger_.error("Failed to persist " + instance.id + ": " + saved.error().message);
        return Error{ErrorCode::PersistenceFailure,
                     "Failed to persist instance " + instance.id + ": " + saved.error().message};
    }

    record(instance, "created");
    auto port_text = std::to_string(instance.port);
    logger_.info("Instance " + instance.name + " running"
                     + (placement->validated() ? "" : " [unvalidated placement]"),
                 {{"instance", instance.id}, {"owner", owner}, {"node", instance.node_id},
                  {"port", port_text}});
    return instance;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<std::vector<Instance>> InstanceController::collect(const std::optional<UserId>& owner) const {
    auto all = store_.list_all();
    if (!all) return all.error();

    std::vector<Instance> result;
    for (auto& instance : *all) {
        if (instance.status == InstanceStatus::Terminated) continue;
        if (owner && instance.owner_id != *owner) continue;
        result.push_back(std::move(instance));
    }
    sort_newest_first(result);
    return result;
}

Result<std::vector<Instance>> InstanceController::list(const UserId& owner) const {
    return collect(owner);
}

Result<std::vector<Instance>> InstanceController::list_all() const {
    return collect(std::nullopt);
}

Result<Instance> InstanceController::get(const InstanceId& id, const UserId& owner) const {
    return load_owned(id, owner);
}

Result<InstanceSummary> InstanceController::summary(const std::optional<UserId>& owner) const {
    auto instances = collect(owner);
    if (!instances) return instances.error();

    InstanceSummary result;
    result.total = instances->size();
    for (const auto& instance : *instances) {
        switch (instance.status) {
            case InstanceStatus::Running: ++result.running; break;
            case InstanceStatus::Stopped: ++result.stopped; break;
            case InstanceStatus::Pending: ++result.pending; break;
            default: break;
        }
    }
    return result;
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

Result<Instance> InstanceController::stop(const InstanceId& id, const UserId& owner) {
    auto guard = instance_locks_.lock(id);

    auto instance = load_owned(id, owner);
    if (!instance) return instance.error();

    if (instance->status != InstanceStatus::Running && instance->status != InstanceStatus::Pending) {
        return Error{ErrorCode::InvalidState,
                     "Cannot stop instance in '" + std::string{to_string(instance->status)}
                     + "' state"};
    }
    if (auto stopped = driver_call(DriverAction::Stop, *instance); !stopped) {
        logger_.warn("Stop of " + id + " failed: " + stopped.error().message);
        return stopped.error();
    }

    Instance updated = *instance;
    updated.status = InstanceStatus::Stopped;
    updated.stopped_at = now();
    if (auto saved = store_.save(updated); !saved) {
        return saved.error();
    }
    record(updated, "stopped");
    logger_.info("Instance stopped", {{"instance", id}, {"owner", owner}});
    return updated;
}

Result<Instance> InstanceController::start(const InstanceId& id, const UserId& owner) {
    auto guard = instance_locks_.lock(id);

    auto instance = load_owned(id, owner);
    if (!instance) return instance.error();

    if (instance->status != InstanceStatus::Stopped) {
        return Error{ErrorCode::InvalidState,
                     "Cannot start instance in '" + std::string{to_string(instance->status)}
                     + "' state"};
    }
    if (auto started = driver_call(DriverAction::Start, *instance); !started) {
        logger_.warn("Start of " + id + " failed: " + started.error().message);
        return started.error();
    }

    Instance updated = *instance;
    updated.status = InstanceStatus::Running;
    updated.started_at = now();
    updated.stopped_at.reset();
    if (auto saved = store_.save(updated); !saved) {
        return saved.error();
    }
    record(updated, "started");
    logger_.info("Instance started", {{"instance", id}, {"owner", owner}});
    return updated;
}

Result<Instance> InstanceController::terminate(const InstanceId& id, const UserId& owner) {
    auto guard = instance_locks_.lock(id);

    auto instance = load_owned(id, owner);
    if (!instance) return instance.error();

    if (instance->status == InstanceStatus::Terminated) {
        return instance;
    }

    if (auto removed = driver_call(DriverAction::Remove, *instance); !removed) {
        logger_.warn("Container removal for " + id + " failed: " + removed.error().message);
    }

    // Persist first: once the record says terminated with nothing held, a
    // second terminate cannot release the same units again.
    Instance updated = *instance;
    updated.status = InstanceStatus::Terminated;
    if (!updated.stopped_at) updated.stopped_at = now();
    updated.port_held = false;
    updated.quota_held = false;
    if (auto saved = store_.save(updated); !saved) {
        return saved.error();
    }

    release_resources(*instance);
    record(updated, "terminated");
    logger_.info("Instance terminated", {{"instance", id}, {"owner", owner}});
    return updated;
}

// ─────────────────────────────────────────────
// Recovery
// ─────────────────────────────────────────────

Result<size_t> InstanceController::restore_ledger() {
    auto all = store_.list_all();
    if (!all) return all.error();

    size_t restored = 0;
    for (auto& instance : *all) {
        if (!instance.port_held && !instance.quota_held) continue;

        bool changed = false;
        if (instance.port_held) {
            if (auto reserved = ports_.reserve(instance.node_id, instance.id, instance.port);
                !reserved) {
                logger_.warn("Cannot restore port for " + instance.id + ": "
                             + reserved.error().message);
                instance.port_held = false;
                changed = true;
            }
        }
        if (instance.quota_held) {
            if (auto allocated = quotas_.allocate(instance.owner_id, instance.cpu,
                                                  instance.memory_gb);
                !allocated) {
                logger_.warn("Cannot restore quota for " + instance.id + ": "
                             + allocated.error().message);
                instance.quota_held = false;
                changed = true;
            }
        }
        if (changed) {
            if (auto saved = store_.save(instance); !saved) {
                return saved.error();
            }
        }
        ++restored;
    }

    logger_.info("Restored ledger state for " + std::to_string(restored) + " instances");
    return restored;
}

}  // namespace fleet_orchestrator
