/**
 * @file placement_service.hpp
 * @brief Top-level PlacementService facade. Ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Provisioning and managing instances on worker nodes
 *   2. Probing fleet health and grading the cluster
 *   3. Reporting quota, port and capacity usage
 *
 * External collaborators (node registry, capacity feed, deployment driver,
 * instance store) are injected by reference and must outlive the service.
 * Template-parameterized on ProbeT for testability (TcpProbe or a fake).
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "deployment/deployment_driver.hpp"
#include "health/cluster_aggregator.hpp"
#include "health/health_prober.hpp"
#include "ledger/port_ledger.hpp"
#include "ledger/quota_ledger.hpp"
#include "lifecycle/instance_controller.hpp"
#include "lifecycle/instance_store.hpp"
#include "network/tcp_probe.hpp"
#include "registry/node_registry.hpp"
#include "scheduler/capacity_feed.hpp"
#include "scheduler/capacity_scheduler.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace fleet_orchestrator {

/**
 * @brief External services the placement core consumes.
 */
struct ServiceCollaborators {
    INodeRegistry& registry;
    ICapacityFeed& capacity;
    IDeploymentDriver& driver;
    IInstanceStore& store;
};

template <ProbeTransportLike ProbeT = TcpProbe>
class PlacementService {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;
        std::unique_ptr<IQuotaPolicy> quota_policy;   ///< Null = usage-based
        std::optional<uint64_t> seed;          ///< Fixes scheduler fallback and instance ids
    };

    PlacementService(Options opts, ServiceCollaborators collaborators, ProbeT transport = ProbeT{});
    ~PlacementService();

    // Non-copyable, non-movable
    PlacementService(const PlacementService&) = delete;
    PlacementService& operator=(const PlacementService&) = delete;

    // ── Background monitoring ────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Rebuild ledger state from the instance store. Call before serving.
    Result<size_t> restore();

    // ── Instances ────────────────────────────
    Result<Instance> create_instance(const UserId& owner, const InstanceRequest& request);
    Result<std::vector<Instance>> list_instances(const UserId& owner) const;
    Result<Instance> get_instance(const InstanceId& id, const UserId& owner) const;
    Result<Instance> stop_instance(const InstanceId& id, const UserId& owner);
    Result<Instance> start_instance(const InstanceId& id, const UserId& owner);
    Result<Instance> terminate_instance(const InstanceId& id, const UserId& owner);
    Result<InstanceSummary> instance_summary(const std::optional<UserId>& owner = std::nullopt) const;

    // ── Cluster health ───────────────────────
    ClusterSnapshot cluster_status(bool include_nodes = false);
    Result<NodeWithStatus> node_health(const NodeId& id) const;
    [[nodiscard]] std::optional<ClusterSnapshot> last_snapshot() const;

    // ── Reporting ────────────────────────────
    [[nodiscard]] CapacityLimits max_available_capacity() const { return scheduler_.max_available_capacity(); }
    [[nodiscard]] Result<QuotaSummary> quota_summary(const UserId& user) const { return quotas_.summary(user); }
    [[nodiscard]] PortUsage port_usage(const NodeId& node) const { return ports_.usage(node); }

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    QuotaLedger& quotas() { return quotas_; }
    PortLedger& ports() { return ports_; }
    CapacityScheduler& scheduler() { return scheduler_; }
    HealthProber<ProbeT>& prober() { return prober_; }
    InstanceController& controller() { return controller_; }
    const Config& config() const { return config_; }

private:
    void monitor_loop(std::stop_token stop);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    // Ledger
    QuotaLedger quotas_;
    PortLedger ports_;

    // Placement & health
    CapacityScheduler scheduler_;
    HealthProber<ProbeT> prober_;
    InstanceController controller_;

    // Monitoring
    std::jthread monitor_thread_;
    std::mutex monitor_mutex_;
    std::condition_variable_any monitor_cv_;
    mutable std::mutex snapshot_mutex_;
    std::optional<ClusterSnapshot> last_snapshot_;
    std::atomic<bool> running_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

namespace detail {

inline std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

inline ProberOptions prober_options(const ProberConfig& config) {
    return ProberOptions{
        .port = config.port,
        .timeout_ms = config.timeout_ms,
        .pool_size = config.pool_size,
    };
}

}  // namespace detail

template <ProbeTransportLike ProbeT>
PlacementService<ProbeT>::PlacementService(Options opts,
                                           ServiceCollaborators collaborators,
                                           ProbeT transport)
    : config_(std::move(opts.config))
    , logger_(detail::or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , metrics_(detail::or_null_sink(std::move(opts.metrics_sink)))
    , quotas_(std::move(opts.quota_policy))
    , ports_(config_.ledger.port_range_start, config_.ledger.port_range_end)
    , scheduler_(collaborators.registry, collaborators.capacity, logger_,
                 opts.seed.value_or(std::random_device{}()))
    , prober_(collaborators.registry, detail::prober_options(config_.prober), logger_,
              std::move(transport))
    , controller_(ControllerCollaborators{
                      .scheduler = scheduler_,
                      .quotas = quotas_,
                      .ports = ports_,
                      .driver = collaborators.driver,
                      .store = collaborators.store,
                  },
                  logger_, &metrics_,
                  opts.seed ? *opts.seed + 1 : std::random_device{}()) {
    for (const auto& user : config_.users) {
        quotas_.register_user(user.id, user.limits);
    }
}

template <ProbeTransportLike ProbeT>
PlacementService<ProbeT>::~PlacementService() {
    stop();
}

template <ProbeTransportLike ProbeT>
Result<void> PlacementService<ProbeT>::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Already running"};
    }
    logger_.info("Placement service starting: cluster=" + config_.service.cluster_name
                 + " probe_port=" + std::to_string(config_.prober.port)
                 + " interval_ms=" + std::to_string(config_.prober.interval_ms));
    monitor_thread_ = std::jthread([this](std::stop_token stop) { monitor_loop(stop); });
    return Result<void>{};
}

template <ProbeTransportLike ProbeT>
void PlacementService<ProbeT>::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Placement service shutting down...");
    monitor_thread_.request_stop();
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    metrics_.flush();
    logger_.info("Placement service stopped");
    logger_.flush();
}

template <ProbeTransportLike ProbeT>
void PlacementService<ProbeT>::monitor_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(config_.prober.interval_ms);
    while (!stop.stop_requested()) {
        auto snapshot = cluster_status(false);
        auto level = snapshot.grade == ClusterGrade::Healthy ? LogLevel::Info : LogLevel::Warn;
        logger_.log(level, "Cluster " + snapshot.cluster_name + " "
                           + std::string{to_string(snapshot.grade)} + ": "
                           + std::to_string(snapshot.summary.online_nodes) + "/"
                           + std::to_string(snapshot.summary.total_nodes) + " online. "
                           + snapshot.message);

        std::unique_lock lock(monitor_mutex_);
        monitor_cv_.wait_for(lock, stop, interval, [] { return false; });
    }
}

template <ProbeTransportLike ProbeT>
Result<size_t> PlacementService<ProbeT>::restore() {
    return controller_.restore_ledger();
}

// ── Instances ───────────────────────────────

template <ProbeTransportLike ProbeT>
Result<Instance> PlacementService<ProbeT>::create_instance(const UserId& owner,
                                                           const InstanceRequest& request) {
    return controller_.create(owner, request);
}

template <ProbeTransportLike ProbeT>
Result<std::vector<Instance>> PlacementService<ProbeT>::list_instances(const UserId& owner) const {
    return controller_.list(owner);
}

template <ProbeTransportLike ProbeT>
Result<Instance> PlacementService<ProbeT>::get_instance(const InstanceId& id,
                                                        const UserId& owner) const {
    return controller_.get(id, owner);
}

template <ProbeTransportLike ProbeT>
Result<Instance> PlacementService<ProbeT>::stop_instance(const InstanceId& id, const UserId& owner) {
    return controller_.stop(id, owner);
}

template <ProbeTransportLike ProbeT>
Result<Instance> PlacementService<ProbeT>::start_instance(const InstanceId& id, const UserId& owner) {
    return controller_.start(id, owner);
}

template <ProbeTransportLike ProbeT>
Result<Instance> PlacementService<ProbeT>::terminate_instance(const InstanceId& id,
                                                              const UserId& owner) {
    return controller_.terminate(id, owner);
}

template <ProbeTransportLike ProbeT>
Result<InstanceSummary> PlacementService<ProbeT>::instance_summary(
    const std::optional<UserId>& owner) const {
    return controller_.summary(owner);
}

// ── Cluster health ──────────────────────────

template <ProbeTransportLike ProbeT>
ClusterSnapshot PlacementService<ProbeT>::cluster_status(bool include_nodes) {
    auto start_time = std::chrono::steady_clock::now();
    auto nodes = prober_.probe_all();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    auto snapshot = aggregate(nodes, include_nodes, config_.service.cluster_name);
    metrics_.record_probe_batch(nodes.size(), snapshot.summary.online_nodes, elapsed);
    metrics_.record_cluster_snapshot(snapshot);

    {
        std::lock_guard lock(snapshot_mutex_);
        last_snapshot_ = snapshot;
        last_snapshot_->nodes.reset();
    }
    return snapshot;
}

template <ProbeTransportLike ProbeT>
Result<NodeWithStatus> PlacementService<ProbeT>::node_health(const NodeId& id) const {
    return prober_.probe_node(id);
}

template <ProbeTransportLike ProbeT>
std::optional<ClusterSnapshot> PlacementService<ProbeT>::last_snapshot() const {
    std::lock_guard lock(snapshot_mutex_);
    return last_snapshot_;
}

}  // namespace fleet_orchestrator
