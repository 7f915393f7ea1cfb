/**
 * @file docker_command_driver.hpp
 * @brief Deployment driver that drives the docker CLI on fleet nodes.
 *
 * The driver only builds argument vectors; an ICommandRunner executes them
 * against a node (over SSH, locally, or not at all for dry runs).
 */

#pragma once

#include "core/logger.hpp"
#include "deployment/deployment_driver.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace fleet_orchestrator {

using CommandLine = std::vector<std::string>;

/// Join argv for logging; arguments containing whitespace are single-quoted.
[[nodiscard]] std::string format_command_line(const CommandLine& argv);

// ─────────────────────────────────────────────
// ICommandRunner (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Execute argv on the node at `address`; returns trimmed stdout.
    [[nodiscard]] virtual Result<std::string> run(const std::string& address,
                                                  const CommandLine& argv) = 0;
};

/**
 * @brief Logs each command instead of executing it.
 *
 * `docker run` yields a synthetic 64-hex-digit container id so the rest of
 * the provisioning path behaves as with a real daemon.
 */
class DryRunCommandRunner : public ICommandRunner {
public:
    explicit DryRunCommandRunner(Logger& logger);

    [[nodiscard]] Result<std::string> run(const std::string& address,
                                          const CommandLine& argv) override;

    [[nodiscard]] std::vector<std::string> history() const;

private:
    Logger& logger_;
    std::atomic<uint64_t> sequence_{0};
    mutable std::mutex history_mutex_;
    std::vector<std::string> history_;
};

struct DockerDriverOptions {
    std::string container_prefix = "fleet";
    std::string workspace_root = "/home/mroot/user_data";
};

class DockerCommandDriver : public IDeploymentDriver {
public:
    DockerCommandDriver(ICommandRunner& runner, DockerDriverOptions options, Logger& logger);

    [[nodiscard]] Result<std::string> deploy(const DeployRequest& request) override;

    Result<void> stop(const std::string& address, const std::string& handle) override;
    Result<void> start(const std::string& address, const std::string& handle) override;
    Result<void> remove(const std::string& address, const std::string& handle) override;

    // ── Command construction (exposed for inspection) ──

    [[nodiscard]] std::string container_name(const InstanceId& instance) const;
    [[nodiscard]] std::string workspace_path(const UserId& owner, const InstanceId& instance) const;
    [[nodiscard]] CommandLine run_command(const DeployRequest& request) const;

private:
    Result<void> simple(const std::string& verb, const std::string& address,
                        const std::string& handle, CommandLine argv);

    ICommandRunner& runner_;
    DockerDriverOptions options_;
    Logger& logger_;
};

}  // namespace fleet_orchestrator
