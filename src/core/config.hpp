/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace fleet_orchestrator {

struct ServiceConfig {
    std::string cluster_name = "fleet-cluster";
};

struct ProberConfig {
    uint16_t port = 22;                   ///< Handshake target on every node
    uint32_t timeout_ms = 5000;           ///< Per-probe hard timeout
    uint32_t pool_size = 32;              ///< Probe workers kept warm; grows with the fleet
    uint32_t interval_ms = 30000;         ///< Daemon re-probe period
};

struct LedgerConfig {
    uint16_t port_range_start = 8000;
    uint16_t port_range_end = 9999;
};

struct DeploymentConfig {
    std::string container_prefix = "fleet";
    std::string workspace_root = "/home/mroot/user_data";
};

struct StoreConfig {
    std::filesystem::path path;           ///< Empty = in-memory store
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

struct UserConfig {
    UserId id;
    QuotaLimits limits;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    ServiceConfig service;
    ProberConfig prober;
    LedgerConfig ledger;
    DeploymentConfig deployment;
    StoreConfig store;
    TelemetryConfig telemetry;
    std::vector<Node> nodes;              ///< Seed for the node registry
    std::vector<UserConfig> users;        ///< Quota accounts
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace fleet_orchestrator
