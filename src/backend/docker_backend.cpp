/**
 * @file docker_backend.cpp
 * @brief Docker CLI environment backend
 *
 * **Command Mapping**:
 * - Probe:        docker version --format {{.Server.Version}}
 * - Create:       docker run -d ... sleep infinity, then mkdir -p <root>
 * - Exec:         docker exec -w <workdir> <id> <argv...>
 * - IsRunning:    docker inspect --format {{.State.Running}} <id>
 * - ListLive:     docker ps --no-trunc --filter label=<label> --format {{.ID}}
 * - Destroy:      docker rm -f <id>
 * - ReadFile:     docker exec <id> cat -- <path>
 * - WriteFile:    docker exec -i <id> sh -c 'mkdir -p ... && cat > "$1"'
 * - ListDir:      docker exec <id> ls -1A -- <path>
 * - Stat:         docker exec <id> sh -c 'test -d / test -e'
 * - Canonicalize: docker exec <id> readlink -m -- <path>
 *
 * Caller-supplied paths are passed as positional parameters ("$1") to the
 * in-container shell, never spliced into the script text.
 *
 * **Cancellation**: killing the local docker CLI does not stop the process
 * inside the container, so a cancelled Exec additionally runs
 * `kill -9 -1` in the container, which terminates every process except
 * the container's init (`sleep infinity`).
 *
 * @date 2025
 */

#include "sandpool/backend/docker_backend.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace sandpool {
namespace backend {

using core::ErrorKind;
using core::SandpoolError;
using utils::StringUtils;

namespace {

// In-container helper scripts; the path always arrives as "$1"
constexpr const char* kWriteScript = "mkdir -p \"$(dirname \"$1\")\" && cat > \"$1\"";
constexpr const char* kStatScript =
    "if [ -d \"$1\" ]; then echo directory; elif [ -e \"$1\" ]; then echo file; else echo missing; fi";

std::string FirstLine(const std::string& text) {
    std::string trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

[[noreturn]] void ThrowFailure(const std::string& what, const utils::ProcessResult& result) {
    std::string detail = FirstLine(result.stderr_output);
    if (detail.empty()) {
        detail = result.timed_out ? "docker command timed out"
                                  : "exit code " + std::to_string(result.exit_code);
    }
    throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE, what + ": " + detail);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerBackend::DockerBackend(const DockerOptions& options)
    : options_(options) {
    spdlog::debug("Docker backend using binary: {}", options_.docker_binary);
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

void DockerBackend::Probe() {
    auto result = RunDocker({"version", "--format", "{{.Server.Version}}"});
    if (!result.success()) {
        ThrowFailure("Docker daemon not reachable", result);
    }
    spdlog::info("Docker server version: {}", FirstLine(result.stdout_output));
}

// ============================================================================
// ENVIRONMENT LIFECYCLE
// ============================================================================

std::string DockerBackend::Create(const EnvironmentSpec& spec) {
    std::string name = GenerateContainerName();
    spdlog::debug("Creating container: {}", name);

    auto result = RunDocker(BuildRunArgs(spec, name));
    if (!result.success()) {
        ThrowFailure("Failed to create container " + name, result);
    }

    std::string id = StringUtils::Trim(result.stdout_output);
    if (id.empty()) {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            "docker run returned no container id for " + name);
    }

    // Ensure the workspace exists before the environment is handed out
    auto mkdir = RunInContainer(id, {"mkdir", "-p", spec.workspace_root});
    if (!mkdir.success()) {
        spdlog::error("Failed to prepare workspace in {}: {}", ShortId(id),
                      FirstLine(mkdir.stderr_output));
        try {
            Destroy(id);
        }
        catch (const SandpoolError& e) {
            spdlog::warn("Cleanup of half-created container failed: {}", e.what());
        }
        ThrowFailure("Failed to prepare workspace " + spec.workspace_root, mkdir);
    }

    spdlog::info("Container created: {} ({})", ShortId(id), name);
    return id;
}

void DockerBackend::Destroy(const std::string& id) {
    spdlog::debug("Removing container: {}", ShortId(id));

    auto result = RunDocker({"rm", "-f", id});
    if (result.success() || StringUtils::Contains(result.stderr_output, "No such container")) {
        return;
    }
    ThrowFailure("Failed to remove container " + ShortId(id), result);
}

std::set<std::string> DockerBackend::ListLive(const std::string& label) {
    auto result = RunDocker({
        "ps",
        "--no-trunc",
        "--filter", "label=" + label,
        "--filter", "status=running",
        "--format", "{{.ID}}"
    });
    if (!result.success()) {
        ThrowFailure("Failed to list containers", result);
    }

    std::set<std::string> live;
    for (const auto& line : StringUtils::Split(result.stdout_output, '\n')) {
        std::string id = StringUtils::Trim(line);
        if (!id.empty()) {
            live.insert(id);
        }
    }
    return live;
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

BackendExecResult DockerBackend::Exec(const std::string& id,
                                      const std::vector<std::string>& argv,
                                      const std::string& workdir,
                                      const utils::CancellationToken& cancel,
                                      std::size_t max_capture_bytes) {
    std::vector<std::string> args = {options_.docker_binary, "exec", "-w", workdir, id};
    args.insert(args.end(), argv.begin(), argv.end());

    utils::ProcessOptions process_options;
    process_options.cancel = &cancel;
    process_options.max_capture_bytes = max_capture_bytes;

    utils::ProcessResult result;
    try {
        result = utils::ProcessRunner::Run(args, process_options);
    }
    catch (const std::runtime_error& e) {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            std::string("Failed to spawn docker exec: ") + e.what());
    }

    BackendExecResult exec_result;
    exec_result.stdout_output = std::move(result.stdout_output);
    exec_result.stderr_output = std::move(result.stderr_output);
    exec_result.stdout_overflow = result.stdout_overflow;
    exec_result.stderr_overflow = result.stderr_overflow;
    exec_result.exit_code = result.exit_code;
    exec_result.cancelled = result.cancelled;

    if (result.cancelled) {
        KillPayload(id);
        return exec_result;
    }

    // stderr belongs to the payload here; only the daemon can say the
    // container itself is gone
    if (result.exit_code != 0 && !IsRunning(id)) {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            "Container " + ShortId(id) + " stopped during exec (exit " +
                            std::to_string(result.exit_code) + ")");
    }

    return exec_result;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::string DockerBackend::ReadFile(const std::string& id, const std::string& path) {
    auto result = RunInContainer(id, {"cat", "--", path});
    if (result.success()) {
        return result.stdout_output;
    }
    if (StringUtils::Contains(result.stderr_output, "No such file")) {
        throw SandpoolError(ErrorKind::FILE_NOT_FOUND, "File not found in sandbox: " + path);
    }
    ThrowFailure("Failed to read " + path, result);
}

void DockerBackend::WriteFile(const std::string& id, const std::string& path,
                              const std::string& content) {
    auto result = RunInContainer(id, {"sh", "-c", kWriteScript, "sh", path}, content);
    if (!result.success()) {
        ThrowFailure("Failed to write " + path, result);
    }
}

std::vector<std::string> DockerBackend::ListDir(const std::string& id, const std::string& path) {
    auto result = RunInContainer(id, {"ls", "-1A", "--", path});
    if (!result.success()) {
        if (StringUtils::Contains(result.stderr_output, "No such file")) {
            throw SandpoolError(ErrorKind::FILE_NOT_FOUND, "Cannot list path: " + path);
        }
        ThrowFailure("Failed to list " + path, result);
    }
    return StringUtils::Split(result.stdout_output, '\n');
}

PathKind DockerBackend::Stat(const std::string& id, const std::string& path) {
    auto result = RunInContainer(id, {"sh", "-c", kStatScript, "sh", path});
    if (!result.success()) {
        ThrowFailure("Failed to stat " + path, result);
    }

    std::string kind = StringUtils::Trim(result.stdout_output);
    if (kind == "directory") return PathKind::DIRECTORY;
    if (kind == "file") return PathKind::FILE;
    return PathKind::MISSING;
}

std::string DockerBackend::Canonicalize(const std::string& id, const std::string& path) {
    auto result = RunInContainer(id, {"readlink", "-m", "--", path});
    if (!result.success()) {
        ThrowFailure("Failed to canonicalize " + path, result);
    }
    return StringUtils::Trim(result.stdout_output);
}

// ============================================================================
// RUN COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerBackend::BuildRunArgs(const EnvironmentSpec& spec,
                                                     const std::string& name) const {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    args.push_back("--name");
    args.push_back(name);

    if (!options_.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(options_.hostname);
    }

    // Network isolation
    if (spec.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }

    // Resource limits
    args.push_back("--memory");
    args.push_back(std::to_string(spec.limits.memory_limit_mb) + "m");

    std::ostringstream cpus;
    cpus << std::fixed << std::setprecision(2) << spec.limits.cpu_limit;
    args.push_back("--cpus");
    args.push_back(cpus.str());

    if (spec.limits.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.limits.pids_limit));
    }

    // Security: drop capabilities
    for (const auto& cap : options_.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (options_.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (!spec.label.empty()) {
        args.push_back("--label");
        args.push_back(spec.label);
    }

    // Working directory
    args.push_back("-w");
    args.push_back(spec.workspace_root);

    // Image, then the keep-alive command
    args.push_back(spec.image);
    args.push_back("sleep");
    args.push_back("infinity");

    return args;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::ProcessResult DockerBackend::RunDocker(const std::vector<std::string>& args,
                                              const std::string& stdin_data) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.docker_binary);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));

    utils::ProcessOptions process_options;
    process_options.stdin_data = stdin_data;
    process_options.deadline = std::chrono::steady_clock::now() + options_.command_timeout;

    try {
        return utils::ProcessRunner::Run(argv, process_options);
    }
    catch (const std::runtime_error& e) {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            std::string("Failed to spawn docker: ") + e.what());
    }
}

utils::ProcessResult DockerBackend::RunInContainer(const std::string& id,
                                                   const std::vector<std::string>& argv,
                                                   const std::string& stdin_data) const {
    std::vector<std::string> args = {"exec"};
    if (!stdin_data.empty()) {
        args.push_back("-i");  // Keep stdin attached
    }
    args.push_back(id);
    args.insert(args.end(), argv.begin(), argv.end());

    auto result = RunDocker(args, stdin_data);
    if (result.exit_code != 0 && !IsRunning(id)) {
        ThrowFailure("Container " + ShortId(id) + " unavailable", result);
    }
    return result;
}

bool DockerBackend::IsRunning(const std::string& id) const {
    utils::ProcessResult result;
    try {
        result = RunDocker({"inspect", "--format", "{{.State.Running}}", id});
    }
    catch (const SandpoolError& e) {
        spdlog::warn("Failed to inspect {}: {}", ShortId(id), e.what());
        return false;
    }

    if (!result.success()) {
        spdlog::debug("Inspect of {} failed: {}", ShortId(id), FirstLine(result.stderr_output));
        return false;
    }
    return StringUtils::Trim(result.stdout_output) == "true";
}

void DockerBackend::KillPayload(const std::string& id) const {
    try {
        auto result = RunDocker({"exec", id, "sh", "-c", "kill -9 -1"});
        if (!result.success()) {
            spdlog::debug("Payload kill in {} exited {}", ShortId(id), result.exit_code);
        }
    }
    catch (const SandpoolError& e) {
        spdlog::warn("Failed to kill payload in {}: {}", ShortId(id), e.what());
    }
}

std::string DockerBackend::GenerateContainerName() const {
    auto timestamp = std::time(nullptr);

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(100000, 999999);

    std::tm local_time{};
    localtime_r(&timestamp, &local_time);

    std::ostringstream oss;
    oss << options_.name_prefix << "_"
        << std::put_time(&local_time, "%Y%m%d_%H%M%S")
        << "_" << dis(gen);

    return oss.str();
}

} // namespace backend
} // namespace sandpool
