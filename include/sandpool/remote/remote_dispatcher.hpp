/**
 * @file remote_dispatcher.hpp
 * @brief Forwards commands to one of several remote hosts over ssh
 *
 * Alternative to the local pool: a command is run on a randomly selected
 * remote host under the configured application identity. Host names and
 * addresses are redacted from everything returned to the caller.
 *
 * **Transport Command**:
 * ```
 * ssh -o BatchMode=yes -o ConnectTimeout=<n> <user>@<host> <command>
 * ```
 * The command is a single argv element; it is interpreted by the remote
 * login shell, never by a local one.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/selection_strategy.hpp"
#include "sandpool/remote/sanitizer.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace remote {

/**
 * @struct DispatchResult
 * @brief Combined output of one remote command
 */
struct DispatchResult {
    std::string output;                 ///< stdout and stderr, combined
    std::optional<std::string> error;   ///< Transport or exit-status error, if any
};

/**
 * @class RemoteDispatcher
 * @brief Host selection, ssh dispatch and output sanitization
 *
 * **Thread Safety**: all methods are thread-safe; Reload() swaps the
 * configuration atomically with respect to in-progress Execute() calls.
 */
class RemoteDispatcher {
public:
    /**
     * @throws SandpoolError(INVALID_REQUEST) if the config cannot dispatch
     */
    explicit RemoteDispatcher(core::RemoteConfig config,
                              std::unique_ptr<core::SelectionStrategy> strategy = nullptr);

    /**
     * @brief Pick a configured host
     * @throws SandpoolError(INVALID_REQUEST) if no host is configured
     */
    std::string SelectHost();

    /**
     * @brief Run `command` on `host`, output not sanitized
     */
    DispatchResult Dispatch(const std::string& command, const std::string& host) const;

    /**
     * @brief Trim, select a host, dispatch and sanitize
     *
     * A blank command yields the error "No command provided" without
     * contacting any host.
     */
    DispatchResult Execute(const std::string& command);

    /// Replace configured host identifiers with the placeholder
    std::string Sanitize(const std::string& message) const;

    /**
     * @brief Replace hosts, identity and timeouts
     * @throws SandpoolError(INVALID_REQUEST) if the new config cannot dispatch
     */
    void Reload(core::RemoteConfig config);

    /// Full transport argv for `command` on `host`
    std::vector<std::string> BuildCommand(const std::string& command,
                                          const std::string& host) const;

    core::RemoteConfig GetConfig() const;

private:
    mutable std::mutex mutex_;
    core::RemoteConfig config_;
    Sanitizer sanitizer_;
    std::unique_ptr<core::SelectionStrategy> strategy_;
};

} // namespace remote
} // namespace sandpool
