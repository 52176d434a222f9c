/**
 * @file json_codec.hpp
 * @brief JSON shapes of service responses
 *
 * **Response Shapes**:
 * ```
 * execute  {"stdout", "stderr", "exitCode": int|null, "error": str|null,
 *           "errorKind": str|null, "truncated": bool, "durationMs": int}
 * read     {"content"}
 * write    {"ok": true, "bytesWritten", "path"}
 * list     {"entries": [name, ...]}
 * reset    {"ok": true, "removed"}
 * stats    {"target", "idle", "inUse", "unhealthy", "created", "destroyed"}
 * remote   {"output", "error": str|null}
 * failure  {"error", "errorKind", "retryable"}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/environment.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/remote/remote_dispatcher.hpp"
#include "sandpool/service/sandbox_service.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sandpool {
namespace service {

nlohmann::json ExecutionToJson(const core::ExecutionResult& result);
nlohmann::json ContentToJson(const std::string& content);
nlohmann::json WriteToJson(const WriteOutcome& outcome);
nlohmann::json EntriesToJson(const std::vector<std::string>& entries);
nlohmann::json ResetToJson(std::size_t removed);
nlohmann::json StatsToJson(const core::PoolStats& stats);
nlohmann::json DispatchToJson(const remote::DispatchResult& result);

/// Failure response for a contract error
nlohmann::json ErrorToJson(const core::SandpoolError& error);

/// Failure response for a request the codec itself rejected
nlohmann::json ErrorToJson(core::ErrorKind kind, const std::string& message);

/**
 * @brief Serialize one response line
 *
 * Invalid UTF-8 in captured output is replaced with U+FFFD instead of
 * failing the response.
 */
std::string DumpLine(const nlohmann::json& response);

} // namespace service
} // namespace sandpool
