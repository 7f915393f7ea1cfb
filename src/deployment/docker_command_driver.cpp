/**
 * @file docker_command_driver.cpp
 * @brief docker CLI command construction and the dry-run runner.
 */

#include "deployment/docker_command_driver.hpp"

#include <cstdio>
#include <functional>

namespace fleet_orchestrator {

namespace {

constexpr size_t kHandleLength = 12;

bool needs_quoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\'' || c == '"') return true;
    }
    return false;
}

std::string synthetic_container_id(const std::string& seed, uint64_t sequence) {
    std::string id;
    id.reserve(64);
    uint64_t state = std::hash<std::string>{}(seed) ^ (sequence * 0x9E3779B97F4A7C15ULL);
    char buf[17];
    for (int block = 0; block < 4; ++block) {
        // splitmix64 step
        state += 0x9E3779B97F4A7C15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        z ^= z >> 31;
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(z));
        id += buf;
    }
    return id;
}

}  // anonymous namespace

std::string format_command_line(const CommandLine& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        if (needs_quoting(arg)) {
            line += '\'';
            for (char c : arg) {
                if (c == '\'') line += "'\\''";
                else line += c;
            }
            line += '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

// ─────────────────────────────────────────────
// DryRunCommandRunner
// ─────────────────────────────────────────────

DryRunCommandRunner::DryRunCommandRunner(Logger& logger)
    : logger_(logger) {
}

Result<std::string> DryRunCommandRunner::run(const std::string& address,
                                             const CommandLine& argv) {
    auto line = format_command_line(argv);
    logger_.info("[dry-run] " + address + ": " + line);
    {
        std::lock_guard lock(history_mutex_);
        history_.push_back(address + ": " + line);
    }

    if (argv.size() >= 2 && argv[0] == "docker" && argv[1] == "run") {
        return synthetic_container_id(address + line, sequence_.fetch_add(1));
    }
    return std::string{};
}

std::vector<std::string> DryRunCommandRunner::history() const {
    std::lock_guard lock(history_mutex_);
    return history_;
}

// ─────────────────────────────────────────────
// DockerCommandDriver
// ─────────────────────────────────────────────

DockerCommandDriver::DockerCommandDriver(ICommandRunner& runner,
                                         DockerDriverOptions options,
                                         Logger& logger)
    : runner_(runner)
    , options_(std::move(options))
    , logger_(logger) {
}

std::string DockerCommandDriver::container_name(const InstanceId& instance) const {
    return options_.container_prefix + "-" + instance;
}

std::string DockerCommandDriver::workspace_path(const UserId& owner,
                                                const InstanceId& instance) const {
    return options_.workspace_root + "/" + owner + "/" + instance;
}

CommandLine DockerCommandDriver::run_command(const DeployRequest& request) const {
    CommandLine argv{
        "docker", "run", "-d",
        "--name", container_name(request.instance_id),
        "--network", "host",
        "--cpus=" + std::to_string(request.cpu),
        "--memory=" + std::to_string(request.memory_gb) + "g",
    };
    if (!request.owner_id.empty()) {
        argv.push_back("-v");
        argv.push_back(workspace_path(request.owner_id, request.instance_id) + ":/workspace");
    }
    for (const auto& [key, value] : request.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    argv.insert(argv.end(), {"--init", "-t", request.image, "sleep", "infinity"});
    return argv;
}

Result<std::string> DockerCommandDriver::deploy(const DeployRequest& request) {
    if (!request.owner_id.empty()) {
        auto workspace = workspace_path(request.owner_id, request.instance_id);
        auto created = runner_.run(request.address, {"mkdir", "-p", workspace});
        if (!created) {
            logger_.warn("Failed to create workspace " + workspace + " on "
                         + request.address + ": " + created.error().message);
        }
    }

    auto output = runner_.run(request.address, run_command(request));
    if (!output) {
        return Error{ErrorCode::DeploymentFailure,
                     "docker run failed on " + request.address + ": " + output.error().message};
    }

    std::string handle = output->empty() ? std::string{"unknown"}
                                         : output->substr(0, kHandleLength);
    logger_.info("Deployed " + container_name(request.instance_id) + " on "
                 + request.address + " (container " + handle + ")");
    return handle;
}

Result<void> DockerCommandDriver::simple(const std::string& verb,
                                         const std::string& address,
                                         const std::string& handle,
                                         CommandLine argv) {
    auto output = runner_.run(address, argv);
    if (!output) {
        return Error{ErrorCode::DeploymentFailure,
                     "docker " + verb + " " + handle + " failed on " + address + ": "
                     + output.error().message};
    }
    return Result<void>{};
}

Result<void> DockerCommandDriver::stop(const std::string& address, const std::string& handle) {
    return simple("stop", address, handle, {"docker", "stop", handle});
}

Result<void> DockerCommandDriver::start(const std::string& address, const std::string& handle) {
    return simple("start", address, handle, {"docker", "start", handle});
}

Result<void> DockerCommandDriver::remove(const std::string& address, const std::string& handle) {
    return simple("rm", address, handle, {"docker", "rm", "-f", handle});
}

}  // namespace fleet_orchestrator
