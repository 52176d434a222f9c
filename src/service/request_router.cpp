/**
 * @file request_router.cpp
 * @brief JSON-lines request dispatch
 *
 * @date 2025
 */

#include "sandpool/service/request_router.hpp"
#include "sandpool/service/json_codec.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sandpool {
namespace service {

using core::ErrorKind;
using core::SandpoolError;

namespace {

std::string RequireString(const json& request, const char* key) {
    if (!request.contains(key) || !request[key].is_string()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST,
                            std::string("Missing string field '") + key + "'");
    }
    return request[key].get<std::string>();
}

std::string OptionalString(const json& request, const char* key, const std::string& fallback) {
    if (!request.contains(key) || request[key].is_null()) {
        return fallback;
    }
    if (!request[key].is_string()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST,
                            std::string("Field '") + key + "' must be a string");
    }
    return request[key].get<std::string>();
}

} // anonymous namespace

RequestRouter::RequestRouter(SandboxService* service, remote::RemoteDispatcher* remote)
    : service_(service)
    , remote_(remote) {}

SandboxService& RequestRouter::RequireService(const std::string& op) {
    if (service_ == nullptr) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST,
                            "Operation '" + op + "' is not available in remote mode");
    }
    return *service_;
}

json RequestRouter::Route(const std::string& op, const json& request) {
    if (op == "execute") {
        std::string code = RequireString(request, "code");
        if (remote_ != nullptr) {
            return DispatchToJson(remote_->Execute(code));
        }
        std::string language = OptionalString(request, "language", "python");
        return ExecutionToJson(RequireService(op).ExecuteCode(code, language));
    }
    if (op == "read") {
        return ContentToJson(RequireService(op).ReadFile(RequireString(request, "path")));
    }
    if (op == "write") {
        std::string path = RequireString(request, "path");
        std::string content = RequireString(request, "content");
        return WriteToJson(RequireService(op).WriteFile(path, content));
    }
    if (op == "list") {
        return EntriesToJson(RequireService(op).ListFiles(OptionalString(request, "path", "")));
    }
    if (op == "reset") {
        return ResetToJson(RequireService(op).ResetWorkspace());
    }
    if (op == "stats") {
        return StatsToJson(RequireService(op).Stats());
    }

    throw SandpoolError(ErrorKind::INVALID_REQUEST, "Unknown operation '" + op + "'");
}

json RequestRouter::Handle(const json& request) {
    json response;
    try {
        if (!request.is_object()) {
            throw SandpoolError(ErrorKind::INVALID_REQUEST, "Request must be a JSON object");
        }
        response = Route(RequireString(request, "op"), request);
    }
    catch (const SandpoolError& e) {
        spdlog::debug("Request failed ({}): {}", core::ErrorKindName(e.kind()), e.what());
        response = ErrorToJson(e);
    }
    catch (const json::exception& e) {
        response = ErrorToJson(ErrorKind::INVALID_REQUEST, e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("Unexpected failure handling request: {}", e.what());
        response = ErrorToJson(ErrorKind::ENVIRONMENT_FAILURE, e.what());
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

std::string RequestRouter::HandleLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    }
    catch (const json::parse_error& e) {
        return DumpLine(ErrorToJson(ErrorKind::INVALID_REQUEST,
                                    std::string("Invalid JSON: ") + e.what()));
    }
    return DumpLine(Handle(request));
}

} // namespace service
} // namespace sandpool
