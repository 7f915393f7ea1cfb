/**
 * @file health_prober.cpp
 * @brief Probe outcome → node health policy.
 */

#include "health/health_prober.hpp"

namespace fleet_orchestrator {

NodeStatus classify_probe(const NodeId& node_id, const ProbeOutcome& outcome) {
    NodeStatus status;
    status.node_id = node_id;
    status.response_time_ms = outcome.latency_ms;
    status.last_check_at = std::chrono::system_clock::now();

    switch (outcome.kind) {
        case ProbeOutcome::Kind::Connected:
            status.health = NodeHealth::Healthy;
            status.online = true;
            break;
        case ProbeOutcome::Kind::Refused:
            // The host answered with a reset: it is up, only this port is closed.
            status.health = NodeHealth::Healthy;
            status.online = true;
            status.error_message = "Probe port refused (node online)";
            break;
        case ProbeOutcome::Kind::TimedOut:
            status.health = NodeHealth::Unhealthy;
            status.online = false;
            status.error_message = "Connection timed out";
            break;
        case ProbeOutcome::Kind::TransportError:
            status.health = NodeHealth::Unhealthy;
            status.online = false;
            status.error_message = "Network error: " + outcome.detail;
            break;
    }
    return status;
}

NodeStatus unknown_status(const NodeId& node_id, std::string error, double latency_ms) {
    NodeStatus status;
    status.node_id = node_id;
    status.health = NodeHealth::Unknown;
    status.online = false;
    status.response_time_ms = latency_ms;
    status.last_check_at = std::chrono::system_clock::now();
    status.error_message = std::move(error);
    return status;
}

}  // namespace fleet_orchestrator
