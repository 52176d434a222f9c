/**
 * @file sandbox_service.hpp
 * @brief Request-level operations over the sandbox pool
 *
 * Composes the pool, the executor and the file gateway into the caller
 * contract: run code, read/write/list files, reset a workspace, report
 * pool state. Each operation validates its input before acquiring a
 * handle, holds the handle for exactly one operation, and returns it with
 * the outcome the operation implies.
 *
 * **Release Policy**:
 * ```
 * execution OK / non-zero exit / contract error  → REUSABLE
 * TIMEOUT / ENVIRONMENT_FAILURE                  → COMPROMISED
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backend/environment_backend.hpp"
#include "sandpool/core/environment.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/executor.hpp"
#include "sandpool/core/file_gateway.hpp"
#include "sandpool/core/sandbox_pool.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandpool {
namespace service {

/**
 * @struct WriteOutcome
 * @brief Result of a file write
 */
struct WriteOutcome {
    std::size_t bytes_written{0};  ///< Bytes of content written
    std::string path;              ///< Resolved path inside the environment
};

/**
 * @class SandboxService
 * @brief Caller-facing operations
 *
 * **Usage Example**:
 * @code
 * SandboxService service(pool, backend);
 * auto result = service.ExecuteCode("print('hi')", "python");
 * service.WriteFile("notes.txt", "hello");
 * auto entries = service.ListFiles();
 * @endcode
 *
 * **Thread Safety**: thread-safe; concurrency is bounded by the pool size.
 */
class SandboxService {
public:
    SandboxService(core::SandboxPool& pool, std::shared_ptr<backend::EnvironmentBackend> backend);

    /**
     * @brief Run `code` with the named language
     *
     * @throws SandpoolError(INVALID_REQUEST) for blank code or unknown language
     * @throws SandpoolError(POOL_EXHAUSTED / POOL_CLOSED) from acquisition
     */
    core::ExecutionResult ExecuteCode(const std::string& code,
                                      const std::string& language = "python");

    /// @throws SandpoolError(FILE_NOT_FOUND, PATH_ESCAPE, ...)
    std::string ReadFile(const std::string& path);

    WriteOutcome WriteFile(const std::string& path, const std::string& content);

    /// Entries of `path`; empty means the sandbox root
    std::vector<std::string> ListFiles(const std::string& path = "");

    /**
     * @brief Remove everything under the sandbox root of one environment
     * @return Number of top-level entries removed
     */
    std::size_t ResetWorkspace();

    core::PoolStats Stats() const;

    const std::string& GetSandboxRoot() const { return sandbox_root_; }

private:
    core::SandboxPool& pool_;
    core::Executor executor_;
    core::FileAccessGateway gateway_;
    std::string sandbox_root_;
    std::chrono::milliseconds exec_timeout_;

    /// Run `operation` on a leased handle, releasing with the implied outcome
    template <typename Operation>
    auto WithHandle(Operation&& operation)
        -> decltype(operation(std::declval<const core::EnvironmentHandle&>())) {
        auto lease = pool_.Acquire();
        try {
            auto value = operation(lease.handle());
            lease.Release(core::ReleaseOutcome::REUSABLE);
            return value;
        }
        catch (const core::SandpoolError& e) {
            lease.Release(e.kind() == core::ErrorKind::ENVIRONMENT_FAILURE
                              ? core::ReleaseOutcome::COMPROMISED
                              : core::ReleaseOutcome::REUSABLE);
            throw;
        }
    }
};

} // namespace service
} // namespace sandpool
