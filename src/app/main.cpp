/**
 * @file main.cpp
 * @brief FleetOrchestrator daemon entry point.
 *
 * Wires all modules into the placement core:
 *   Config → Logger → Registry → Store → CapacityFeed → Driver → PlacementService
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "deployment/docker_command_driver.hpp"
#include "lifecycle/instance_store.hpp"
#include "lifecycle/toml_instance_store.hpp"
#include "orchestrator/placement_service.hpp"
#include "registry/node_registry.hpp"
#include "scheduler/declared_capacity_feed.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fleet_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         FleetOrchestrator v1.0.0          ║
  ║   Health-aware Placement & Resource       ║
  ║   Ledger for Container Fleets             ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool once = false;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fleet_orchestrator [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory (empty: stdout)\n"
                      << "  --once             Probe the fleet once, print status, exit\n"
                      << "  --demo             Provision and tear down one instance, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

/// Local single-worker fleet used by --demo when the config declares no nodes.
std::vector<Node> demo_nodes() {
    Node master;
    master.id = "master-01";
    master.hostname = "master-01";
    master.address = "127.0.0.1";
    master.role = NodeRole::Master;

    Node worker;
    worker.id = "worker-01";
    worker.hostname = "worker-01";
    worker.address = "127.0.0.1";
    worker.role = NodeRole::Worker;
    worker.cpu_cores = 8;
    worker.memory_gb = 32.0;
    return {master, worker};
}

void print_snapshot(const ClusterSnapshot& snapshot) {
    const auto& s = snapshot.summary;
    std::cout << "Cluster " << snapshot.cluster_name << ": " << to_string(snapshot.grade)
              << " (" << s.online_nodes << "/" << s.total_nodes << " online, "
              << std::fixed << std::setprecision(2) << snapshot.availability_percent << "%)\n"
              << "  " << snapshot.message << "\n";
    if (!snapshot.nodes) return;
    for (const auto& [info, status] : *snapshot.nodes) {
        std::cout << "  " << std::left << std::setw(16) << info.id
                  << std::setw(16) << info.address
                  << std::setw(10) << to_string(info.role)
                  << std::setw(10) << to_string(status.health)
                  << std::right << std::setw(9) << std::setprecision(2)
                  << status.response_time_ms << " ms";
        if (status.error_message) std::cout << "  " << *status.error_message;
        std::cout << "\n";
    }
}

/**
 * @brief Provision one instance for a demo user, walk it through
 *        stop/start/terminate, and report ledger state along the way.
 */
int run_demo(PlacementService<>& service, Logger& logger) {
    logger.info("=== Demo Mode ===");
    const UserId user = "demo";
    if (!service.quotas().has_user(user)) {
        service.quotas().register_user(user);
    }

    auto capacity = service.max_available_capacity();
    logger.info("Largest worker headroom: " + std::to_string(capacity.max_cpu) + " vCPU, "
                + std::to_string(capacity.max_memory_gb) + " GB");

    InstanceRequest request;
    request.name = "demo-workspace";
    request.cpu = 2;
    request.memory_gb = 4;
    request.env = {{"FLEET_DEMO", "1"}};

    auto created = service.create_instance(user, request);
    if (!created) {
        logger.error("Demo create failed [" + std::string{to_string(created.error().code)}
                     + "]: " + created.error().message);
        return 1;
    }
    std::cout << "Created " << created->id << " on " << created->node_id
              << " at " << created->access_url() << "\n";

    if (auto quota = service.quota_summary(user)) {
        std::cout << "Quota: " << quota->instances.used << " instances, "
                  << quota->cpu.used << "/" << quota->cpu.max << " vCPU, "
                  << quota->memory_gb.used << "/" << quota->memory_gb.max << " GB\n";
    }
    auto ports = service.port_usage(created->node_id);
    std::cout << "Ports on " << created->node_id << ": " << ports.allocated_count
              << " allocated, " << ports.available_count << " available\n";

    auto stopped = service.stop_instance(created->id, user);
    if (!stopped) {
        logger.error("Demo stop failed: " + stopped.error().message);
        return 1;
    }
    std::cout << "Instance " << created->id << " is " << to_string(stopped->status) << "\n";

    auto restarted = service.start_instance(created->id, user);
    if (!restarted) {
        logger.error("Demo start failed: " + restarted.error().message);
        return 1;
    }
    std::cout << "Instance " << created->id << " is " << to_string(restarted->status) << "\n";

    auto terminated = service.terminate_instance(created->id, user);
    if (!terminated) {
        logger.error("Demo terminate failed: " + terminated.error().message);
        return 1;
    }
    std::cout << "Instance " << created->id << " is " << to_string(terminated->status) << "\n";

    print_snapshot(service.cluster_status(true));
    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.demo_mode && config.nodes.empty()) config.nodes = demo_nodes();

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize Logger ────────────────────
    Logger logger(make_sink(config.telemetry, "fleet_orchestrator"), level);
    logger.info("FleetOrchestrator starting...");
    logger.info("Cluster: " + config.service.cluster_name + ", "
                + std::to_string(config.nodes.size()) + " registered nodes, "
                + std::to_string(config.users.size()) + " quota accounts");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Collaborators ────────────────────────
    InMemoryNodeRegistry registry(config.nodes);

    std::unique_ptr<IInstanceStore> store;
    if (config.store.path.empty()) {
        store = std::make_unique<MemoryInstanceStore>();
        logger.info("Instance store: in-memory");
    } else {
        auto opened = TomlInstanceStore::open(config.store.path);
        if (!opened) {
            logger.error("Cannot open instance store: " + opened.error().message);
            std::cerr << "Cannot open instance store: " << opened.error().message << std::endl;
            return 1;
        }
        store = std::move(*opened);
        logger.info("Instance store: " + config.store.path.string());
    }

    DeclaredCapacityFeed capacity(registry, *store);
    DryRunCommandRunner runner(logger);
    DockerCommandDriver driver(runner,
                               DockerDriverOptions{
                                   .container_prefix = config.deployment.container_prefix,
                                   .workspace_root = config.deployment.workspace_root,
                               },
                               logger);

    // ── Placement Service ────────────────────
    PlacementService<>::Options options;
    options.config = config;
    options.log_sink = make_sink(config.telemetry, "placement");
    options.log_level = level;
    options.metrics_sink = config.telemetry.log_dir.empty()
        ? std::unique_ptr<ILogSink>(std::make_unique<NullSink>())
        : make_sink(config.telemetry, "metrics");

    PlacementService<> service(std::move(options),
                               ServiceCollaborators{
                                   .registry = registry,
                                   .capacity = capacity,
                                   .driver = driver,
                                   .store = *store,
                               });

    if (auto restored = service.restore(); !restored) {
        logger.error("Ledger restore failed: " + restored.error().message);
        return 1;
    }

    // ── One-shot modes ───────────────────────
    if (args.demo_mode) {
        return run_demo(service, logger);
    }
    if (args.once) {
        print_snapshot(service.cluster_status(true));
        return 0;
    }

    // ── Main Loop ────────────────────────────
    if (auto started = service.start(); !started) {
        logger.error("Failed to start: " + started.error().message);
        return 1;
    }
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    service.stop();
    logger.info("FleetOrchestrator stopped.");
    return 0;
}
