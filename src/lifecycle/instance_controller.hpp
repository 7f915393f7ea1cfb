/**
 * @file instance_controller.hpp
 * @brief Instance lifecycle: provisioning, stop/start, termination.
 *
 * State machine:
 *
 *   pending ──deploy ok──▶ running ◀──start── stopped
 *      │                      │                  ▲
 *      │ deploy failed        └──────stop────────┘
 *      ▼
 *    error        any non-terminated ──terminate──▶ terminated
 *
 * Create commits resources in a fixed order (quota check, node selection,
 * port, quota) and unwinds all of them if deployment or persistence fails,
 * so a failed create leaves the ledger exactly as it found it.
 */

#pragma once

#include "core/keyed_mutex.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "deployment/deployment_driver.hpp"
#include "ledger/port_ledger.hpp"
#include "ledger/quota_ledger.hpp"
#include "lifecycle/instance_store.hpp"
#include "scheduler/capacity_scheduler.hpp"
#include "telemetry/metrics_collector.hpp"

#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace fleet_orchestrator {

struct ControllerCollaborators {
    CapacityScheduler& scheduler;
    QuotaLedger& quotas;
    PortLedger& ports;
    IDeploymentDriver& driver;
    IInstanceStore& store;
};

class InstanceController {
public:
    InstanceController(ControllerCollaborators collaborators,
                       Logger& logger,
                       MetricsCollector* metrics = nullptr,
                       uint64_t id_seed = std::random_device{}());

    InstanceController(const InstanceController&) = delete;
    InstanceController& operator=(const InstanceController&) = delete;

    /// Name length, cpu and memory bounds. InvalidArgument on violation.
    [[nodiscard]] static Result<void> validate(const InstanceRequest& request);

    /**
     * @brief Provision a new instance for owner.
     *
     * @return The running instance, or QuotaExceeded, InsufficientCapacity,
     *         NotFound (no workers), ResourceExhausted (ports),
     *         DeploymentFailure or PersistenceFailure. Every failure after
     *         the port step is rolled back before returning.
     */
    [[nodiscard]] Result<Instance> create(const UserId& owner, const InstanceRequest& request);

    /// Owner's non-terminated instances, newest first.
    [[nodiscard]] Result<std::vector<Instance>> list(const UserId& owner) const;

    /// Every non-terminated instance, newest first.
    [[nodiscard]] Result<std::vector<Instance>> list_all() const;

    /// Any state. NotFound when absent or owned by someone else.
    [[nodiscard]] Result<Instance> get(const InstanceId& id, const UserId& owner) const;

    Result<Instance> stop(const InstanceId& id, const UserId& owner);
    Result<Instance> start(const InstanceId& id, const UserId& owner);

    /// Idempotent: terminating a terminated instance returns it unchanged.
    Result<Instance> terminate(const InstanceId& id, const UserId& owner);

    /// Counts over non-terminated instances, for one owner or everyone.
    [[nodiscard]] Result<InstanceSummary> summary(const std::optional<UserId>& owner = std::nullopt) const;

    /**
     * @brief Re-enter ports and quota held by persisted live instances into
     *        the ledgers. Call once at startup, before serving requests.
     *
     * @return Number of instances whose resources were restored.
     */
    Result<size_t> restore_ledger();

private:
    enum class DriverAction : uint8_t { Stop, Start, Remove };

    Result<Instance> load_owned(const InstanceId& id, const UserId& owner) const;
    Result<std::vector<Instance>> collect(const std::optional<UserId>& owner) const;
    Result<InstanceId> next_id();

    Result<std::string> deploy_guarded(const DeployRequest& request);
    Result<void> driver_call(DriverAction action, const Instance& instance);
    void release_resources(const Instance& instance);
    void record(const Instance& instance, std::string_view action);

    CapacityScheduler& scheduler_;
    QuotaLedger& quotas_;
    PortLedger& ports_;
    IDeploymentDriver& driver_;
    IInstanceStore& store_;
    Logger& logger_;
    MetricsCollector* metrics_;

    KeyedMutex<InstanceId> instance_locks_;
    std::mutex id_mutex_;
    std::mt19937_64 id_rng_;
};

}  // namespace fleet_orchestrator
