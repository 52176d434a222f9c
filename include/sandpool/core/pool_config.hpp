/**
 * @file pool_config.hpp
 * @brief Pool and remote-dispatch configuration
 *
 * Configuration is layered: built-in defaults, then an optional JSON file,
 * then environment variables, then command-line flags. The pool copies its
 * PoolConfig at construction and never observes later changes.
 *
 * **JSON file layout**:
 * ```json
 * {
 *   "pool": {
 *     "image": "python:3.12-slim",
 *     "pool_size": 2,
 *     "exec_timeout_seconds": 30,
 *     "max_output_chars": 50000,
 *     "memory_limit": "256m",
 *     "cpu_limit": 1.0,
 *     "sandbox_root": "/workspace",
 *     "health_check_interval_seconds": 10
 *   },
 *   "remote": {
 *     "hosts": ["10.0.0.5", "10.0.0.6"],
 *     "app_user": "runner"
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @struct ResourceLimits
 * @brief Per-environment resource ceilings
 */
struct ResourceLimits {
    std::size_t memory_limit_mb{256};  ///< Memory ceiling (MB)
    double cpu_limit{1.0};             ///< CPU share (fraction of one core)
    int pids_limit{128};               ///< Process count ceiling
};

/**
 * @struct PoolConfig
 * @brief Sandbox pool settings, immutable for the pool's lifetime
 */
struct PoolConfig {
    // Environment template
    std::string image{"python:3.12-slim"};           ///< Backend image/template identifier
    std::string container_label{"sandpool=sandbox"}; ///< Label marking pool-owned environments
    ResourceLimits resource_limits;                  ///< Per-environment ceilings
    std::string sandbox_root{"/workspace"};          ///< Confinement root for file operations

    // Capacity
    std::size_t pool_size{2};                        ///< Target number of environments

    // Execution
    std::chrono::seconds exec_timeout{30};           ///< Hard wall-clock bound per execution
    std::size_t max_output_chars{50000};             ///< Per-stream truncation limit (characters)
    std::string truncation_marker{"\n... [output truncated]"};  ///< Appended to truncated streams

    // Lifecycle
    std::chrono::seconds health_check_interval{10};  ///< Reconciliation period
    std::chrono::seconds acquire_timeout{30};        ///< Default wait for an idle handle
    std::chrono::seconds shutdown_grace{10};         ///< Wait for in-flight work before cancelling

    // Transport endpoint (consumed by the external front end)
    std::string bind_host{"0.0.0.0"};
    int bind_port{8000};
};

/**
 * @struct RemoteConfig
 * @brief Remote-shell dispatch settings
 */
struct RemoteConfig {
    std::vector<std::string> hosts;                  ///< Candidate remote hosts
    std::string app_user;                            ///< Remote login identity
    std::string ssh_binary{"ssh"};                   ///< Transport executable
    std::chrono::seconds connect_timeout{10};        ///< ssh ConnectTimeout
    std::chrono::seconds command_timeout{60};        ///< Bound on one remote command
    std::size_t max_output_bytes{1 << 20};           ///< Capture cap for combined output
};

/**
 * @struct AppConfig
 * @brief Everything the executable configures
 */
struct AppConfig {
    PoolConfig pool;
    RemoteConfig remote;
};

/// Environment variable lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by std::getenv
EnvLookup ProcessEnvironment();

/**
 * @brief Parse a docker-style memory size ("512", "256m", "1g", "2048k")
 *
 * A bare number is bytes. The result is rounded up to whole megabytes.
 *
 * @throws SandpoolError(INVALID_REQUEST) on malformed input
 */
std::size_t ParseMemoryLimitMb(const std::string& text);

/**
 * @brief Overlay a JSON configuration file onto `config`
 *
 * Unknown keys are ignored; absent keys keep their current value.
 *
 * @throws SandpoolError(INVALID_REQUEST) if the file cannot be read or parsed
 */
void ApplyConfigFile(AppConfig& config, const std::filesystem::path& path);

/**
 * @brief Overlay environment variables onto `config`
 *
 * Recognised: SANDBOX_IMAGE, POOL_SIZE, EXEC_TIMEOUT, MAX_OUTPUT_SIZE,
 * MCP_HOST, MCP_PORT, CONTAINER_MEMORY_LIMIT, CONTAINER_CPU_LIMIT,
 * SANDBOX_ROOT, HEALTH_CHECK_INTERVAL, ACQUIRE_TIMEOUT, REMOTE_HOSTS
 * (';'-separated) and APP_USER_NAME.
 *
 * @throws SandpoolError(INVALID_REQUEST) on unparsable numeric values
 */
void ApplyEnvironment(AppConfig& config, const EnvLookup& lookup = ProcessEnvironment());

/**
 * @brief Reject configurations the pool cannot serve
 * @throws SandpoolError(INVALID_REQUEST) describing the first problem found
 */
void ValidatePoolConfig(const PoolConfig& config);

/**
 * @brief Reject remote settings that cannot dispatch
 * @throws SandpoolError(INVALID_REQUEST) when no host or no user is configured
 */
void ValidateRemoteConfig(const RemoteConfig& config);

/**
 * @class PoolConfigBuilder
 * @brief Fluent API for constructing pool configurations
 *
 * **Usage Example**:
 * @code
 * auto config = PoolConfigBuilder()
 *     .WithImage("python:3.12-slim")
 *     .WithPoolSize(4)
 *     .WithExecTimeout(std::chrono::seconds(10))
 *     .WithMaxOutputChars(4096)
 *     .Build();
 * @endcode
 */
class PoolConfigBuilder {
public:
    PoolConfigBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    PoolConfigBuilder& WithPoolSize(std::size_t size) {
        config_.pool_size = size;
        return *this;
    }

    PoolConfigBuilder& WithExecTimeout(std::chrono::seconds timeout) {
        config_.exec_timeout = timeout;
        return *this;
    }

    PoolConfigBuilder& WithMaxOutputChars(std::size_t chars) {
        config_.max_output_chars = chars;
        return *this;
    }

    PoolConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.resource_limits.memory_limit_mb = mb;
        return *this;
    }

    PoolConfigBuilder& WithCpuLimit(double cpus) {
        config_.resource_limits.cpu_limit = cpus;
        return *this;
    }

    PoolConfigBuilder& WithSandboxRoot(const std::string& root) {
        config_.sandbox_root = root;
        return *this;
    }

    PoolConfigBuilder& WithHealthCheckInterval(std::chrono::seconds interval) {
        config_.health_check_interval = interval;
        return *this;
    }

    PoolConfigBuilder& WithAcquireTimeout(std::chrono::seconds timeout) {
        config_.acquire_timeout = timeout;
        return *this;
    }

    PoolConfigBuilder& WithShutdownGrace(std::chrono::seconds grace) {
        config_.shutdown_grace = grace;
        return *this;
    }

    PoolConfig Build() const {
        return config_;
    }

private:
    PoolConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace sandpool
