/**
 * @file sandbox_service.cpp
 * @brief Caller-facing operations over the pool
 *
 * @date 2025
 */

#include "sandpool/service/sandbox_service.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace service {

using core::ErrorKind;
using core::SandpoolError;

SandboxService::SandboxService(core::SandboxPool& pool,
                               std::shared_ptr<backend::EnvironmentBackend> backend)
    : pool_(pool)
    , executor_(backend, pool.GetConfig().max_output_chars, pool.GetConfig().truncation_marker)
    , gateway_(backend)
    , sandbox_root_(pool.GetConfig().sandbox_root)
    , exec_timeout_(std::chrono::duration_cast<std::chrono::milliseconds>(
          pool.GetConfig().exec_timeout)) {}

// ============================================================================
// CODE EXECUTION
// ============================================================================

core::ExecutionResult SandboxService::ExecuteCode(const std::string& code,
                                                  const std::string& language) {
    if (utils::StringUtils::Trim(code).empty()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST, "No code provided");
    }

    auto parsed = core::ParseLanguage(language.empty() ? "python" : language);
    if (!parsed) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST,
                            "Unsupported language '" + language + "'. Supported: " +
                            core::SupportedLanguages());
    }

    core::ExecutionRequest request;
    request.payload = code;
    request.language = *parsed;

    auto lease = pool_.Acquire();
    auto result = executor_.Run(lease.handle(), request, exec_timeout_, lease.token());
    lease.Release(core::OutcomeFor(result));
    return result;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::string SandboxService::ReadFile(const std::string& path) {
    core::FileAccessGateway::Resolve(path, sandbox_root_);

    return WithHandle([&](const core::EnvironmentHandle& handle) {
        return gateway_.Read(handle, path);
    });
}

WriteOutcome SandboxService::WriteFile(const std::string& path, const std::string& content) {
    std::string resolved = core::FileAccessGateway::Resolve(path, sandbox_root_);

    return WithHandle([&](const core::EnvironmentHandle& handle) {
        WriteOutcome outcome;
        outcome.bytes_written = gateway_.Write(handle, path, content);
        outcome.path = resolved;
        return outcome;
    });
}

std::vector<std::string> SandboxService::ListFiles(const std::string& path) {
    const std::string& target = path.empty() ? sandbox_root_ : path;
    core::FileAccessGateway::Resolve(target, sandbox_root_);

    return WithHandle([&](const core::EnvironmentHandle& handle) {
        return gateway_.List(handle, target);
    });
}

std::size_t SandboxService::ResetWorkspace() {
    return WithHandle([&](const core::EnvironmentHandle& handle) {
        std::size_t removed = gateway_.ClearWorkspace(handle);
        spdlog::info("Workspace of {} reset", handle.id);
        return removed;
    });
}

core::PoolStats SandboxService::Stats() const {
    return pool_.Stats();
}

} // namespace service
} // namespace sandpool
