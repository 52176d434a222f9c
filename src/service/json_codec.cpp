/**
 * @file json_codec.cpp
 * @brief Response serialization with nlohmann::json
 *
 * @date 2025
 */

#include "sandpool/service/json_codec.hpp"

using json = nlohmann::json;

namespace sandpool {
namespace service {

json ExecutionToJson(const core::ExecutionResult& result) {
    json j;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["exitCode"] = result.exit_code ? json(*result.exit_code) : json(nullptr);

    if (result.error_kind) {
        j["error"] = result.error_message;
        j["errorKind"] = core::ErrorKindName(*result.error_kind);
    }
    else {
        j["error"] = nullptr;
        j["errorKind"] = nullptr;
    }

    j["truncated"] = result.truncated;
    j["durationMs"] = result.duration.count();
    return j;
}

json ContentToJson(const std::string& content) {
    return json{{"content", content}};
}

json WriteToJson(const WriteOutcome& outcome) {
    return json{
        {"ok", true},
        {"bytesWritten", outcome.bytes_written},
        {"path", outcome.path}
    };
}

json EntriesToJson(const std::vector<std::string>& entries) {
    return json{{"entries", entries}};
}

json ResetToJson(std::size_t removed) {
    return json{{"ok", true}, {"removed", removed}};
}

json StatsToJson(const core::PoolStats& stats) {
    return json{
        {"target", stats.target},
        {"idle", stats.idle},
        {"inUse", stats.in_use},
        {"unhealthy", stats.unhealthy},
        {"created", stats.created_total},
        {"destroyed", stats.destroyed_total}
    };
}

json DispatchToJson(const remote::DispatchResult& result) {
    json j;
    j["output"] = result.output;
    j["error"] = result.error ? json(*result.error) : json(nullptr);
    return j;
}

json ErrorToJson(const core::SandpoolError& error) {
    return ErrorToJson(error.kind(), error.what());
}

json ErrorToJson(core::ErrorKind kind, const std::string& message) {
    return json{
        {"error", message},
        {"errorKind", core::ErrorKindName(kind)},
        {"retryable", core::IsRetryable(kind)}
    };
}

std::string DumpLine(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace service
} // namespace sandpool
