#include "sandpool/backend/docker_backend.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/executor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

using namespace sandpool::backend;
using sandpool::core::ErrorKind;
using sandpool::core::SandpoolError;
using sandpool::utils::CancellationToken;

namespace {

const std::string kAppStderr = "Error response from daemon: my app says hello";

/**
 * Stand-in docker CLI: `exec` prints kAppStderr and exits 1, `inspect`
 * answers with `inspect_script`.
 */
class StubDocker {
public:
    explicit StubDocker(const std::string& inspect_script) {
        path_ = std::filesystem::temp_directory_path() /
                ("sandpool_docker_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter_++));
        {
            std::ofstream script(path_);
            script << "#!/bin/sh\n"
                   << "case \"$1\" in\n"
                   << "  exec) echo '" << kAppStderr << "' >&2; exit 1 ;;\n"
                   << "  inspect) " << inspect_script << " ;;\n"
                   << "  *) exit 0 ;;\n"
                   << "esac\n";
        }
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
    }

    ~StubDocker() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    DockerOptions Options() const {
        DockerOptions options;
        options.docker_binary = path_.string();
        options.command_timeout = std::chrono::seconds(5);
        return options;
    }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

EnvironmentSpec MakeSpec() {
    EnvironmentSpec spec;
    spec.image = "python:3.12-slim";
    spec.workspace_root = "/workspace";
    spec.label = "sandpool=sandbox";
    spec.limits.memory_limit_mb = 512;
    spec.limits.cpu_limit = 0.5;
    spec.limits.pids_limit = 64;
    return spec;
}

bool HasPair(const std::vector<std::string>& args, const std::string& flag,
             const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

TEST(DockerBackendTest, RunArgsApplyIsolation) {
    DockerBackend backend;
    auto args = backend.BuildRunArgs(MakeSpec(), "sandpool_test");

    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_TRUE(HasPair(args, "--name", "sandpool_test"));
    EXPECT_TRUE(HasPair(args, "--network", "none"));
    EXPECT_TRUE(HasPair(args, "--memory", "512m"));
    EXPECT_TRUE(HasPair(args, "--cpus", "0.50"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "64"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(HasPair(args, "--label", "sandpool=sandbox"));
    EXPECT_TRUE(HasPair(args, "-w", "/workspace"));

    // Image followed by the keep-alive command
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "python:3.12-slim");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args[args.size() - 1], "infinity");
}

TEST(DockerBackendTest, OptionalFlagsFollowOptions) {
    DockerOptions options;
    options.hostname.clear();
    options.no_new_privileges = false;
    options.capabilities_drop = {"NET_RAW", "SYS_ADMIN"};
    DockerBackend backend(options);

    EnvironmentSpec spec = MakeSpec();
    spec.limits.pids_limit = 0;
    auto args = backend.BuildRunArgs(spec, "n");

    EXPECT_EQ(std::find(args.begin(), args.end(), "--hostname"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--security-opt"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--pids-limit"), args.end());
    EXPECT_TRUE(HasPair(args, "--cap-drop", "NET_RAW"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "SYS_ADMIN"));
}

// Payload stderr that looks like a daemon message is still payload output
TEST(DockerBackendTest, PayloadStderrDoesNotFailRunningContainer) {
    StubDocker docker("echo true");
    DockerBackend backend(docker.Options());

    auto result = backend.Exec("abc", {"python", "-c", "raise SystemExit(1)"}, "/workspace",
                               CancellationToken(), 0);

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.cancelled);
    EXPECT_NE(result.stderr_output.find(kAppStderr), std::string::npos);
}

TEST(DockerBackendTest, NonZeroExitKeepsHandleReusable) {
    StubDocker docker("echo true");
    auto backend = std::make_shared<DockerBackend>(docker.Options());
    sandpool::core::Executor executor(backend, 1000, "\n... [output truncated]");

    sandpool::core::EnvironmentHandle handle;
    handle.id = "abc";
    handle.workspace_root = "/workspace";
    sandpool::core::ExecutionRequest request;
    request.payload = "import sys; sys.stderr.write('Error response from daemon'); sys.exit(1)";

    auto result = executor.Run(handle, request, std::chrono::seconds(5), CancellationToken());

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_FALSE(result.error_kind.has_value());
    EXPECT_EQ(sandpool::core::OutcomeFor(result), sandpool::core::ReleaseOutcome::REUSABLE);
}

TEST(DockerBackendTest, StoppedContainerIsEnvironmentFailure) {
    StubDocker docker("echo false");
    DockerBackend backend(docker.Options());

    try {
        backend.Exec("abc", {"sh", "-c", "exit 1"}, "/workspace", CancellationToken(), 0);
        FAIL() << "exec in a stopped container reported as payload exit";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ENVIRONMENT_FAILURE);
    }
}

TEST(DockerBackendTest, MissingContainerIsEnvironmentFailure) {
    StubDocker docker("echo 'Error: No such object: abc' >&2; exit 1");
    DockerBackend backend(docker.Options());

    EXPECT_FALSE(backend.IsRunning("abc"));
    try {
        backend.Exec("abc", {"sh", "-c", "exit 1"}, "/workspace", CancellationToken(), 0);
        FAIL() << "exec in a missing container reported as payload exit";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ENVIRONMENT_FAILURE);
    }
}

TEST(DockerBackendTest, ProbeFailsWithoutDockerCli) {
    DockerOptions options;
    options.docker_binary = "/nonexistent/docker";
    options.command_timeout = std::chrono::seconds(5);
    DockerBackend backend(options);

    try {
        backend.Probe();
        FAIL() << "probe succeeded without a docker binary";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ENVIRONMENT_FAILURE);
    }
}

TEST(DockerBackendTest, CreateFailureIsEnvironmentFailure) {
    DockerOptions options;
    options.docker_binary = "false";
    DockerBackend backend(options);

    try {
        backend.Create(MakeSpec());
        FAIL() << "create succeeded with a failing docker binary";
    }
    catch (const SandpoolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ENVIRONMENT_FAILURE);
    }
}

} // namespace
