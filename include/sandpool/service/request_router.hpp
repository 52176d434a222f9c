/**
 * @file request_router.hpp
 * @brief JSON-lines request dispatch for the sandpool executable
 *
 * **Request Shapes** (one JSON object per line):
 * ```
 * {"op": "execute", "code": "...", "language": "python"}
 * {"op": "read",    "path": "notes.txt"}
 * {"op": "write",   "path": "notes.txt", "content": "..."}
 * {"op": "list",    "path": "sub"}           (path optional)
 * {"op": "reset"}
 * {"op": "stats"}
 * ```
 * An optional "id" member is echoed back in the response.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/remote/remote_dispatcher.hpp"
#include "sandpool/service/sandbox_service.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sandpool {
namespace service {

/**
 * @class RequestRouter
 * @brief Maps request objects to service or remote-dispatch calls
 *
 * With a remote dispatcher, "execute" is forwarded to a remote host and
 * the pool-backed operations are only available when a service is set.
 * Never throws: every failure becomes an error response.
 */
class RequestRouter {
public:
    /**
     * @param service Local pool operations, may be nullptr in remote mode
     * @param remote Remote dispatcher, nullptr for local execution
     */
    RequestRouter(SandboxService* service, remote::RemoteDispatcher* remote);

    nlohmann::json Handle(const nlohmann::json& request);

    /// Parse `line`, handle it, and serialize the response
    std::string HandleLine(const std::string& line);

private:
    SandboxService* service_;
    remote::RemoteDispatcher* remote_;

    nlohmann::json Route(const std::string& op, const nlohmann::json& request);
    SandboxService& RequireService(const std::string& op);
};

} // namespace service
} // namespace sandpool
