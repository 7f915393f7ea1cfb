/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <arpa/inet.h>

#include <unordered_set>

namespace fleet_orchestrator {

namespace {

Result<Node> parse_node(const toml::table& tbl, size_t index) {
    Node node;
    node.id = tbl["id"].value_or(std::string{});
    node.address = tbl["address"].value_or(std::string{});
    if (node.id.empty() || node.address.empty()) {
        return Error{ErrorCode::ConfigError,
                     "nodes[" + std::to_string(index) + "]: id and address are required"};
    }
    in_addr parsed{};
    if (::inet_pton(AF_INET, node.address.c_str(), &parsed) != 1) {
        return Error{ErrorCode::ConfigError,
                     "node " + node.id + ": address '" + node.address
                     + "' must be an IPv4 literal"};
    }
    node.hostname = tbl["hostname"].value_or(node.id);
    node.description = tbl["description"].value_or(std::string{});

    auto role_text = tbl["role"].value_or(std::string{"worker"});
    auto role = parse_node_role(role_text);
    if (!role) {
        return Error{ErrorCode::ConfigError,
                     "node " + node.id + ": unknown role '" + role_text + "'"};
    }
    node.role = *role;

    if (auto cpu = tbl["cpu_cores"].value<int64_t>()) {
        node.cpu_cores = static_cast<uint32_t>(*cpu);
    }
    if (auto mem = tbl["memory_gb"].value<double>()) {
        node.memory_gb = *mem;
    }
    if (auto tags = tbl["tags"].as_array()) {
        for (const auto& tag : *tags) {
            if (auto text = tag.value<std::string>()) node.tags.push_back(*text);
        }
    }
    return node;
}

Result<UserConfig> parse_user(const toml::table& tbl, size_t index) {
    UserConfig user;
    user.id = tbl["id"].value_or(std::string{});
    if (user.id.empty()) {
        return Error{ErrorCode::ConfigError,
                     "users[" + std::to_string(index) + "]: id is required"};
    }
    QuotaLimits defaults;
    user.limits.max_instances = static_cast<uint32_t>(
        tbl["max_instances"].value_or(int64_t{defaults.max_instances}));
    user.limits.max_cpu = static_cast<uint32_t>(
        tbl["max_cpu"].value_or(int64_t{defaults.max_cpu}));
    user.limits.max_memory_gb = static_cast<uint32_t>(
        tbl["max_memory"].value_or(int64_t{defaults.max_memory_gb}));
    return user;
}

Result<void> validate(const Config& config) {
    if (config.ledger.port_range_start == 0
        || config.ledger.port_range_start > config.ledger.port_range_end) {
        return Error{ErrorCode::ConfigError, "ledger port range is empty"};
    }
    if (config.prober.timeout_ms == 0) {
        return Error{ErrorCode::ConfigError, "prober.timeout_ms must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::ConfigError,
                     "unknown log level '" + config.telemetry.log_level + "'"};
    }

    std::unordered_set<NodeId> node_ids;
    for (const auto& node : config.nodes) {
        if (!node_ids.insert(node.id).second) {
            return Error{ErrorCode::ConfigError, "duplicate node id: " + node.id};
        }
    }
    std::unordered_set<UserId> user_ids;
    for (const auto& user : config.users) {
        if (!user_ids.insert(user.id).second) {
            return Error{ErrorCode::ConfigError, "duplicate user id: " + user.id};
        }
    }
    return Result<void>{};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.cluster_name =
                service["cluster_name"].value_or(std::string{"fleet-cluster"});
        }

        // [prober]
        if (auto prober = tbl["prober"]; prober.is_table()) {
            config.prober.port = static_cast<uint16_t>(
                prober["port"].value_or(int64_t{22}));
            config.prober.timeout_ms = static_cast<uint32_t>(
                prober["timeout_ms"].value_or(int64_t{5000}));
            config.prober.pool_size = static_cast<uint32_t>(
                prober["pool_size"].value_or(int64_t{32}));
            config.prober.interval_ms = static_cast<uint32_t>(
                prober["interval_ms"].value_or(int64_t{30000}));
        }

        // [ledger]
        if (auto ledger = tbl["ledger"]; ledger.is_table()) {
            config.ledger.port_range_start = static_cast<uint16_t>(
                ledger["port_range_start"].value_or(int64_t{8000}));
            config.ledger.port_range_end = static_cast<uint16_t>(
                ledger["port_range_end"].value_or(int64_t{9999}));
        }

        // [deployment]
        if (auto deployment = tbl["deployment"]; deployment.is_table()) {
            config.deployment.container_prefix =
                deployment["container_prefix"].value_or(std::string{"fleet"});
            config.deployment.workspace_root =
                deployment["workspace_root"].value_or(std::string{"/home/mroot/user_data"});
        }

        // [store]
        if (auto store = tbl["store"]; store.is_table()) {
            config.store.path = store["path"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[nodes]]
        if (auto nodes = tbl["nodes"].as_array()) {
            size_t index = 0;
            for (const auto& element : *nodes) {
                const auto* node_tbl = element.as_table();
                if (node_tbl == nullptr) {
                    return Error{ErrorCode::ConfigError, "nodes must be an array of tables"};
                }
                auto node = parse_node(*node_tbl, index++);
                if (!node) return node.error();
                config.nodes.push_back(std::move(*node));
            }
        }

        // [[users]]
        if (auto users = tbl["users"].as_array()) {
            size_t index = 0;
            for (const auto& element : *users) {
                const auto* user_tbl = element.as_table();
                if (user_tbl == nullptr) {
                    return Error{ErrorCode::ConfigError, "users must be an array of tables"};
                }
                auto user = parse_user(*user_tbl, index++);
                if (!user) return user.error();
                config.users.push_back(std::move(*user));
            }
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace fleet_orchestrator
