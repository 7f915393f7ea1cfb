/**
 * @file test_deployment.cpp
 * @brief Unit tests for DockerCommandDriver and the command runners.
 */

#include "deployment/docker_command_driver.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace fleet_orchestrator;

namespace {

/**
 * @brief Records every call; fails commands whose first argument after
 *        the program name is in `failing`.
 */
class RecordingRunner : public ICommandRunner {
public:
    struct Call {
        std::string address;
        CommandLine argv;
    };

    Result<std::string> run(const std::string& address, const CommandLine& argv) override {
        calls.push_back({address, argv});
        std::string verb = argv.size() > 1 ? argv[1] : std::string{};
        if (argv[0] == "mkdir") verb = "mkdir";
        if (failing.count(verb) > 0) {
            return Error{ErrorCode::Internal, "exit status 125"};
        }
        if (verb == "run") return run_output;
        return std::string{};
    }

    std::vector<Call> calls;
    std::set<std::string> failing;
    std::string run_output = "3f4e5d6c7b8a9f0e1d2c3b4a5f6e7d8c9b0a1f2e3d4c5b6a7f8e9d0c1b2a3f4e";
};

DeployRequest sample_request() {
    DeployRequest request;
    request.instance_id = "i-0000abcd";
    request.owner_id = "alice";
    request.address = "10.0.0.11";
    request.image = "ubuntu:22.04";
    request.cpu = 2;
    request.memory_gb = 4;
    request.port = 8001;
    request.env = {{"A", "1"}, {"B", "two words"}};
    return request;
}

bool contains(const CommandLine& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

}  // namespace

class DockerDriverTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    RecordingRunner runner_;
};

TEST_F(DockerDriverTest, RunCommandShape) {
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    auto argv = driver.run_command(sample_request());

    ASSERT_GE(argv.size(), 5u);
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");
    EXPECT_EQ(argv[2], "-d");
    EXPECT_TRUE(contains(argv, "fleet-i-0000abcd"));
    EXPECT_TRUE(contains(argv, "host"));
    EXPECT_TRUE(contains(argv, "--cpus=2"));
    EXPECT_TRUE(contains(argv, "--memory=4g"));
    EXPECT_TRUE(contains(argv, "/home/mroot/user_data/alice/i-0000abcd:/workspace"));
    EXPECT_TRUE(contains(argv, "A=1"));
    EXPECT_TRUE(contains(argv, "B=two words"));
    EXPECT_EQ(argv[argv.size() - 3], "ubuntu:22.04");
    EXPECT_EQ(argv[argv.size() - 2], "sleep");
    EXPECT_EQ(argv.back(), "infinity");
}

TEST_F(DockerDriverTest, CustomPrefixAndRoot) {
    DockerCommandDriver driver(runner_,
                               DockerDriverOptions{.container_prefix = "lab",
                                                   .workspace_root = "/srv/ws"},
                               logger_);
    EXPECT_EQ(driver.container_name("i-1"), "lab-i-1");
    EXPECT_EQ(driver.workspace_path("bob", "i-1"), "/srv/ws/bob/i-1");
}

TEST_F(DockerDriverTest, NoOwnerMeansNoVolume) {
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    auto request = sample_request();
    request.owner_id.clear();
    EXPECT_FALSE(contains(driver.run_command(request), "-v"));

    ASSERT_TRUE(driver.deploy(request).has_value());
    ASSERT_EQ(runner_.calls.size(), 1u);  // no mkdir
}

TEST_F(DockerDriverTest, DeployReturnsShortHandle) {
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    auto handle = driver.deploy(sample_request());

    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_EQ(*handle, "3f4e5d6c7b8a");
    ASSERT_EQ(runner_.calls.size(), 2u);
    EXPECT_EQ(runner_.calls[0].argv[0], "mkdir");
    EXPECT_EQ(runner_.calls[1].address, "10.0.0.11");
}

TEST_F(DockerDriverTest, EmptyOutputYieldsUnknownHandle) {
    runner_.run_output.clear();
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    auto handle = driver.deploy(sample_request());
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(*handle, "unknown");
}

TEST_F(DockerDriverTest, WorkspaceFailureIsNotFatal) {
    runner_.failing.insert("mkdir");
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    EXPECT_TRUE(driver.deploy(sample_request()).has_value());
}

TEST_F(DockerDriverTest, RunFailureIsDeploymentFailure) {
    runner_.failing.insert("run");
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    auto handle = driver.deploy(sample_request());
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::DeploymentFailure);
    EXPECT_NE(handle.error().message.find("exit status 125"), std::string::npos);
}

TEST_F(DockerDriverTest, LifecycleVerbs) {
    DockerCommandDriver driver(runner_, DockerDriverOptions{}, logger_);
    ASSERT_TRUE(driver.stop("10.0.0.11", "abc123").has_value());
    ASSERT_TRUE(driver.start("10.0.0.11", "abc123").has_value());
    ASSERT_TRUE(driver.remove("10.0.0.11", "abc123").has_value());

    ASSERT_EQ(runner_.calls.size(), 3u);
    EXPECT_EQ(runner_.calls[0].argv, (CommandLine{"docker", "stop", "abc123"}));
    EXPECT_EQ(runner_.calls[1].argv, (CommandLine{"docker", "start", "abc123"}));
    EXPECT_EQ(runner_.calls[2].argv, (CommandLine{"docker", "rm", "-f", "abc123"}));

    runner_.failing.insert("stop");
    auto failed = driver.stop("10.0.0.11", "abc123");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::DeploymentFailure);
}

// ═══════════════════════════════════════════════
// Command formatting and dry run
// ═══════════════════════════════════════════════

TEST(CommandLineTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(format_command_line({"docker", "stop", "abc"}), "docker stop abc");
    EXPECT_EQ(format_command_line({"echo", "two words"}), "echo 'two words'");
    EXPECT_EQ(format_command_line({"echo", "it's"}), "echo 'it'\\''s'");
    EXPECT_EQ(format_command_line({"echo", ""}), "echo ''");
}

TEST(DryRunRunnerTest, SyntheticContainerIds) {
    Logger logger(std::make_unique<NullSink>());
    DryRunCommandRunner runner(logger);

    auto first = runner.run("10.0.0.11", {"docker", "run", "-d", "img"});
    auto second = runner.run("10.0.0.11", {"docker", "run", "-d", "img"});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->size(), 64u);
    EXPECT_EQ(first->find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(*first, *second);

    auto other = runner.run("10.0.0.11", {"docker", "stop", "abc"});
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->empty());

    auto history = runner.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[2], "10.0.0.11: docker stop abc");
}

TEST(DryRunRunnerTest, DriverEndToEnd) {
    Logger logger(std::make_unique<NullSink>());
    DryRunCommandRunner runner(logger);
    DockerCommandDriver driver(runner, DockerDriverOptions{}, logger);

    auto handle = driver.deploy(sample_request());
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->size(), 12u);
    EXPECT_EQ(runner.history().size(), 2u);
}
