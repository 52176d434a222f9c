/**
 * @file docker_backend.hpp
 * @brief Docker CLI implementation of the environment backend
 *
 * Each environment is a long-lived container started with `sleep infinity`,
 * network disabled, capabilities dropped and resource limits applied.
 * Payloads and file primitives run through `docker exec`, always as argv
 * vectors so no caller-supplied text is ever interpreted by a host shell.
 *
 * **Container Layout**:
 * ```
 * docker run -d --network none --memory 256m --cpus 1.0 --pids-limit 128
 *            --cap-drop ALL --security-opt no-new-privileges
 *            --label sandpool=sandbox -w /workspace <image> sleep infinity
 *     └─ /workspace   (file-operation confinement root)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backend/environment_backend.hpp"
#include "sandpool/utils/process_runner.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sandpool {
namespace backend {

/**
 * @struct DockerOptions
 * @brief Docker CLI invocation settings
 */
struct DockerOptions {
    std::string docker_binary{"docker"};                 ///< CLI executable (PATH lookup)
    std::string name_prefix{"sandpool"};                 ///< Container name prefix
    std::string hostname{"sandbox"};                     ///< Container hostname
    std::chrono::seconds command_timeout{60};            ///< Bound on management commands
    std::vector<std::string> capabilities_drop{"ALL"};   ///< Dropped Linux capabilities
    bool no_new_privileges{true};                        ///< --security-opt no-new-privileges
};

/**
 * @class DockerBackend
 * @brief EnvironmentBackend over the docker CLI
 *
 * **Usage Example**:
 * @code
 * auto backend = std::make_shared<DockerBackend>();
 * backend->Probe();
 * std::string id = backend->Create(spec);
 * auto out = backend->Exec(id, {"python", "-c", "print(1)"}, "/workspace", token, 0);
 * backend->Destroy(id);
 * @endcode
 */
class DockerBackend : public EnvironmentBackend {
public:
    explicit DockerBackend(const DockerOptions& options = DockerOptions{});
    ~DockerBackend() override = default;

    void Probe() override;
    std::string Create(const EnvironmentSpec& spec) override;
    BackendExecResult Exec(const std::string& id,
                           const std::vector<std::string>& argv,
                           const std::string& workdir,
                           const utils::CancellationToken& cancel,
                           std::size_t max_capture_bytes) override;
    std::set<std::string> ListLive(const std::string& label) override;
    void Destroy(const std::string& id) override;
    std::string ReadFile(const std::string& id, const std::string& path) override;
    void WriteFile(const std::string& id, const std::string& path,
                   const std::string& content) override;
    std::vector<std::string> ListDir(const std::string& id, const std::string& path) override;
    PathKind Stat(const std::string& id, const std::string& path) override;
    std::string Canonicalize(const std::string& id, const std::string& path) override;

    /**
     * @brief docker run arguments for a pool environment (without the binary)
     *
     * Exposed so the hardening flags can be inspected without a daemon.
     */
    std::vector<std::string> BuildRunArgs(const EnvironmentSpec& spec,
                                          const std::string& name) const;

    /**
     * @brief Whether the container is still running
     *
     * Asks the daemon (`docker inspect`), never the payload's output. A
     * failed or unreachable query counts as not running.
     */
    bool IsRunning(const std::string& id) const;

    const DockerOptions& GetOptions() const { return options_; }

private:
    DockerOptions options_;  ///< CLI settings

    utils::ProcessResult RunDocker(const std::vector<std::string>& args,
                                   const std::string& stdin_data = "") const;
    utils::ProcessResult RunInContainer(const std::string& id,
                                        const std::vector<std::string>& argv,
                                        const std::string& stdin_data = "") const;
    void KillPayload(const std::string& id) const;
    std::string GenerateContainerName() const;
};

} // namespace backend
} // namespace sandpool
