/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/capacity_scheduler.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace fleet_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_placement(const InstanceId& instance, const Placement& placement,
                          uint32_t cpu, uint32_t memory_gb);
    void record_instance_event(const Instance& instance, std::string_view action);
    void record_probe_batch(size_t probed, size_t online, std::chrono::milliseconds elapsed);
    void record_cluster_snapshot(const ClusterSnapshot& snapshot);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace fleet_orchestrator
