/**
 * @file environment_backend.hpp
 * @brief Interface to the runtime that creates and runs isolated environments
 *
 * The pool never talks to a container or VM runtime directly. Everything it
 * needs (create, exec with cancellation, list live, destroy, and scoped
 * file primitives) goes through this interface. DockerBackend is the
 * production implementation; tests inject an in-memory fake.
 *
 * Failures of the runtime itself (unreachable daemon, crashed environment,
 * I/O error) are reported by throwing SandpoolError(ENVIRONMENT_FAILURE).
 * File primitives additionally throw FILE_NOT_FOUND for missing targets.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/pool_config.hpp"
#include "sandpool/utils/cancellation.hpp"

#include <set>
#include <string>
#include <vector>

namespace sandpool {
namespace backend {

/**
 * @struct EnvironmentSpec
 * @brief Template for a new environment
 */
struct EnvironmentSpec {
    std::string image;                 ///< Image/template identifier
    core::ResourceLimits limits;       ///< Memory/CPU/process ceilings
    std::string workspace_root;        ///< Created inside the environment, used as working dir
    std::string label;                 ///< Ownership label ("key=value")
    bool network_disabled{true};       ///< Always true for pool environments
};

/**
 * @struct BackendExecResult
 * @brief Raw outcome of a command inside an environment
 */
struct BackendExecResult {
    std::string stdout_output;    ///< Captured stdout
    std::string stderr_output;    ///< Captured stderr
    bool stdout_overflow{false};  ///< stdout exceeded the capture cap
    bool stderr_overflow{false};  ///< stderr exceeded the capture cap
    int exit_code{0};             ///< Exit status of the in-environment process
    bool cancelled{false};        ///< Terminated because the token was cancelled
};

/**
 * @enum PathKind
 * @brief What a path refers to inside an environment
 */
enum class PathKind {
    MISSING,
    FILE,
    DIRECTORY
};

/**
 * @class EnvironmentBackend
 * @brief Abstract environment runtime
 *
 * **Thread Safety**: implementations must accept concurrent calls for
 * different environment ids.
 */
class EnvironmentBackend {
public:
    virtual ~EnvironmentBackend() = default;

    /**
     * @brief Check the runtime is reachable
     * @throws core::SandpoolError(ENVIRONMENT_FAILURE) if it is not
     */
    virtual void Probe() = 0;

    /**
     * @brief Create and start one environment
     * @return Environment id
     */
    virtual std::string Create(const EnvironmentSpec& spec) = 0;

    /**
     * @brief Run `argv` inside the environment
     *
     * Returns promptly after `cancel` is cancelled, with `cancelled` set and
     * whatever output was captured so far. `max_capture_bytes` bounds each
     * stream's memory (0 = unlimited); excess output is drained and dropped.
     */
    virtual BackendExecResult Exec(const std::string& id,
                                   const std::vector<std::string>& argv,
                                   const std::string& workdir,
                                   const utils::CancellationToken& cancel,
                                   std::size_t max_capture_bytes) = 0;

    /// Authoritative set of live environments carrying `label`
    virtual std::set<std::string> ListLive(const std::string& label) = 0;

    /// Remove the environment; destroying an already-gone id is not an error
    virtual void Destroy(const std::string& id) = 0;

    virtual std::string ReadFile(const std::string& id, const std::string& path) = 0;

    /// Write `content`, creating parent directories
    virtual void WriteFile(const std::string& id, const std::string& path,
                           const std::string& content) = 0;

    /// Entry names in a directory, without "." and ".."
    virtual std::vector<std::string> ListDir(const std::string& id, const std::string& path) = 0;

    virtual PathKind Stat(const std::string& id, const std::string& path) = 0;

    /**
     * @brief Resolve symbolic links of `path` inside the environment
     *
     * Missing trailing components are allowed (as `readlink -m`), so paths
     * about to be written can be canonicalized too.
     */
    virtual std::string Canonicalize(const std::string& id, const std::string& path) = 0;
};

} // namespace backend
} // namespace sandpool
