/**
 * @file deployment_driver.hpp
 * @brief Interface to whatever actually starts workloads on a node.
 *
 * The driver is treated as slow and fallible. Failures come back as
 * DeploymentFailure errors; a driver that throws is caught by the lifecycle
 * controller and handled the same way.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <string>

namespace fleet_orchestrator {

/**
 * @brief Everything needed to start one instance on its node.
 */
struct DeployRequest {
    InstanceId instance_id;
    UserId owner_id;                         ///< Used for the workspace volume path
    std::string address;                     ///< Target node address
    std::string image;
    uint32_t cpu{1};
    uint32_t memory_gb{1};
    uint16_t port{0};
    std::map<std::string, std::string> env;
};

// ─────────────────────────────────────────────
// IDeploymentDriver (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

class IDeploymentDriver {
public:
    virtual ~IDeploymentDriver() = default;

    /// Start the workload; returns the deployment handle.
    [[nodiscard]] virtual Result<std::string> deploy(const DeployRequest& request) = 0;

    virtual Result<void> stop(const std::string& address, const std::string& handle) = 0;
    virtual Result<void> start(const std::string& address, const std::string& handle) = 0;
    virtual Result<void> remove(const std::string& address, const std::string& handle) = 0;
};

}  // namespace fleet_orchestrator
