/**
 * @file executor.hpp
 * @brief Runs one payload inside one acquired environment
 *
 * The executor turns an ExecutionRequest into an interpreter invocation,
 * runs it through the backend under a hard wall-clock bound, and shapes
 * the captured streams into an ExecutionResult.
 *
 * **Invocation Strategies**:
 * ```
 * python → python -c <payload>
 * bash   → bash -c <payload>
 * sh     → sh -c <payload>
 * node   → node -e <payload>
 * ```
 *
 * **Timeout**: when the bound elapses the execution's cancellation token
 * is cancelled, which makes the backend kill the in-environment process.
 * Output captured up to that point is kept; the result carries
 * `error_kind = TIMEOUT` and no exit code.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backend/environment_backend.hpp"
#include "sandpool/core/environment.hpp"
#include "sandpool/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @class Executor
 * @brief Timeout-bounded payload execution with output truncation
 *
 * **Thread Safety**: Run() may be called concurrently for different handles.
 */
class Executor {
public:
    /**
     * @param backend Environment runtime
     * @param max_output_chars Per-stream character limit (0 = unlimited)
     * @param truncation_marker Appended to a truncated stream
     */
    Executor(std::shared_ptr<backend::EnvironmentBackend> backend,
             std::size_t max_output_chars,
             std::string truncation_marker);

    /**
     * @brief Execute `request` inside `handle`'s environment
     *
     * Never throws for execution outcomes: timeouts and backend faults are
     * reported through ExecutionResult::error_kind.
     *
     * @param handle Environment owned by the caller
     * @param request Payload and language
     * @param timeout Hard bound on the whole invocation
     * @param token Cancelled by the executor on timeout, or by the pool on shutdown
     *
     * @throws SandpoolError(INVALID_REQUEST) if the payload is blank
     */
    ExecutionResult Run(const EnvironmentHandle& handle,
                        const ExecutionRequest& request,
                        std::chrono::milliseconds timeout,
                        utils::CancellationToken token) const;

    /// Interpreter argv for `language`
    static std::vector<std::string> BuildInvocation(Language language, const std::string& payload);

    /**
     * @brief Apply the per-stream limit to a captured stream
     *
     * @param overflowed The backend dropped bytes past its capture cap;
     *        the marker is appended even if the kept prefix fits the limit
     */
    std::string Truncate(const std::string& output, bool overflowed, bool* truncated) const;

private:
    std::shared_ptr<backend::EnvironmentBackend> backend_;
    std::size_t max_output_chars_;
    std::string truncation_marker_;

    std::size_t CaptureLimitBytes() const;
};

} // namespace core
} // namespace sandpool
