/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace fleet_orchestrator {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_placement(const InstanceId& instance, const Placement& placement,
                                        uint32_t cpu, uint32_t memory_gb) {
    std::ostringstream oss;
    oss << R"({"event":"placement")"
        << R"(,"instance":")" << json_escape(instance) << "\""
        << R"(,"node":")" << json_escape(placement.node_id) << "\""
        << R"(,"cpu":)" << cpu
        << R"(,"memory_gb":)" << memory_gb
        << R"(,"reason":")" << to_string(placement.reason) << "\""
        << R"(,"validated":)" << (placement.validated() ? "true" : "false");
    if (placement.capacity) {
        oss << R"(,"node_cpu_available":)" << placement.capacity->available_cpu
            << R"(,"node_mem_available_gb":)" << placement.capacity->available_memory_gb;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_instance_event(const Instance& instance, std::string_view action) {
    std::ostringstream oss;
    oss << R"({"event":"instance_)" << action << "\""
        << R"(,"instance":")" << json_escape(instance.id) << "\""
        << R"(,"owner":")" << json_escape(instance.owner_id) << "\""
        << R"(,"node":")" << json_escape(instance.node_id) << "\""
        << R"(,"port":)" << instance.port
        << R"(,"status":")" << to_string(instance.status) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_probe_batch(size_t probed, size_t online,
                                          std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"probe_batch")"
        << R"(,"probed":)" << probed
        << R"(,"online":)" << online
        << R"(,"elapsed_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cluster_snapshot(const ClusterSnapshot& snapshot) {
    const auto& s = snapshot.summary;
    std::ostringstream oss;
    oss << R"({"event":"cluster_snapshot")"
        << R"(,"cluster":")" << json_escape(snapshot.cluster_name) << "\""
        << R"(,"grade":")" << to_string(snapshot.grade) << "\""
        << R"(,"total":)" << s.total_nodes
        << R"(,"online":)" << s.online_nodes
        << R"(,"healthy":)" << s.healthy_nodes
        << R"(,"availability_pct":)" << snapshot.availability_percent
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace fleet_orchestrator
