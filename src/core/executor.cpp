/**
 * @file executor.cpp
 * @brief Payload execution, timeout enforcement and output shaping
 *
 * **Execution Workflow**:
 * 1. Build the interpreter argv for the request's language
 * 2. Start backend Exec on a worker (std::async)
 * 3. Wait until the deadline
 * 4. On timeout: cancel the token, collect partial output
 * 5. Truncate each stream independently
 *
 * @date 2025
 */

#include "sandpool/core/executor.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace sandpool {
namespace core {

Executor::Executor(std::shared_ptr<backend::EnvironmentBackend> backend,
                   std::size_t max_output_chars,
                   std::string truncation_marker)
    : backend_(std::move(backend))
    , max_output_chars_(max_output_chars)
    , truncation_marker_(std::move(truncation_marker)) {}

std::vector<std::string> Executor::BuildInvocation(Language language, const std::string& payload) {
    switch (language) {
        case Language::PYTHON: return {"python", "-c", payload};
        case Language::BASH:   return {"bash", "-c", payload};
        case Language::SH:     return {"sh", "-c", payload};
        case Language::NODE:   return {"node", "-e", payload};
    }
    throw SandpoolError(ErrorKind::INVALID_REQUEST, "Unsupported language");
}

std::string Executor::Truncate(const std::string& output, bool overflowed,
                               bool* truncated) const {
    if (max_output_chars_ == 0) {
        if (truncated) {
            *truncated = false;
        }
        return output;
    }

    bool cut = false;
    std::string shaped = utils::StringUtils::TruncateChars(output, max_output_chars_,
                                                           truncation_marker_, &cut);
    // Bytes were dropped at capture even though the kept prefix fits
    if (!cut && overflowed) {
        shaped += truncation_marker_;
        cut = true;
    }
    if (truncated) {
        *truncated = cut;
    }
    return shaped;
}

// A UTF-8 character is at most 4 bytes, so capturing 4 * limit + 4 bytes
// always retains the limit plus at least one character past it.
std::size_t Executor::CaptureLimitBytes() const {
    if (max_output_chars_ == 0) {
        return 0;
    }
    return max_output_chars_ * 4 + 4;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult Executor::Run(const EnvironmentHandle& handle,
                              const ExecutionRequest& request,
                              std::chrono::milliseconds timeout,
                              utils::CancellationToken token) const {
    if (utils::StringUtils::Trim(request.payload).empty()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST, "No code provided");
    }

    spdlog::info("Executing {} payload ({} bytes) in {}",
                 LanguageName(request.language), request.payload.size(), handle.id);

    ExecutionResult result;
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;

    auto backend = backend_;
    auto argv = BuildInvocation(request.language, request.payload);
    std::string id = handle.id;
    std::string workdir = handle.workspace_root;
    std::size_t capture_limit = CaptureLimitBytes();

    auto pending = std::async(std::launch::async,
        [backend, id, argv, workdir, token, capture_limit]() {
            return backend->Exec(id, argv, workdir, token, capture_limit);
        });

    bool timed_out = pending.wait_until(deadline) == std::future_status::timeout;
    if (timed_out) {
        spdlog::warn("Execution in {} exceeded {} ms, terminating", handle.id, timeout.count());
        token.Cancel();
    }

    backend::BackendExecResult raw;
    try {
        raw = pending.get();
    }
    catch (const std::exception& e) {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        result.error_kind = timed_out ? ErrorKind::TIMEOUT : ErrorKind::ENVIRONMENT_FAILURE;
        result.error_message = timed_out
            ? "Execution timed out after " + std::to_string(timeout.count()) + " ms"
            : std::string("Sandbox failure: ") + e.what();
        spdlog::error("Execution in {} failed: {}", handle.id, e.what());
        return result;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    bool stdout_truncated = false;
    bool stderr_truncated = false;
    result.stdout_output = Truncate(raw.stdout_output, raw.stdout_overflow, &stdout_truncated);
    result.stderr_output = Truncate(raw.stderr_output, raw.stderr_overflow, &stderr_truncated);
    result.truncated = stdout_truncated || stderr_truncated;

    if (timed_out) {
        result.error_kind = ErrorKind::TIMEOUT;
        result.error_message = "Execution timed out after " + std::to_string(timeout.count()) + " ms";
    }
    else if (raw.cancelled) {
        result.error_kind = ErrorKind::ENVIRONMENT_FAILURE;
        result.error_message = "Execution cancelled";
    }
    else {
        result.exit_code = raw.exit_code;
    }

    spdlog::info("Execution in {} finished in {} ms ({})", handle.id, result.duration.count(),
                 result.exit_code ? "exit " + std::to_string(*result.exit_code)
                                  : std::string(ErrorKindName(*result.error_kind)));
    return result;
}

} // namespace core
} // namespace sandpool
