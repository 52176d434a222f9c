/**
 * @file remote_dispatcher.cpp
 * @brief ssh transport and host selection
 *
 * @date 2025
 */

#include "sandpool/remote/remote_dispatcher.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/process_runner.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace remote {

using core::ErrorKind;
using core::SandpoolError;

RemoteDispatcher::RemoteDispatcher(core::RemoteConfig config,
                                   std::unique_ptr<core::SelectionStrategy> strategy)
    : config_(std::move(config))
    , sanitizer_(config_.hosts)
    , strategy_(std::move(strategy)) {
    core::ValidateRemoteConfig(config_);
    if (!strategy_) {
        strategy_ = std::make_unique<core::UniformRandomSelection>();
    }
    spdlog::info("Remote dispatch configured with {} hosts", config_.hosts.size());
}

std::string RemoteDispatcher::SelectHost() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.hosts.empty()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST, "No remote hosts configured");
    }
    return config_.hosts[strategy_->Select(config_.hosts.size())];
}

std::vector<std::string> RemoteDispatcher::BuildCommand(const std::string& command,
                                                        const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        config_.ssh_binary,
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(config_.connect_timeout.count()),
        config_.app_user + "@" + host,
        command
    };
}

DispatchResult RemoteDispatcher::Dispatch(const std::string& command,
                                          const std::string& host) const {
    auto argv = BuildCommand(command, host);

    utils::ProcessOptions options;
    options.merge_stderr = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options.deadline = std::chrono::steady_clock::now() + config_.command_timeout;
        options.max_capture_bytes = config_.max_output_bytes;
    }

    DispatchResult result;
    utils::ProcessResult process;
    try {
        process = utils::ProcessRunner::Run(argv, options);
    }
    catch (const std::runtime_error& e) {
        result.error = std::string("failed to start transport: ") + e.what();
        return result;
    }

    result.output = std::move(process.stdout_output);
    if (process.timed_out) {
        result.error = "command timed out after " +
                       std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                           process.duration).count()) + " s";
    }
    else if (process.exit_code != 0) {
        result.error = "exit status " + std::to_string(process.exit_code);
    }

    spdlog::debug("Remote command on {} finished: {}", host, result.error.value_or("ok"));
    return result;
}

DispatchResult RemoteDispatcher::Execute(const std::string& command) {
    std::string trimmed = utils::StringUtils::Trim(command);
    if (trimmed.empty()) {
        DispatchResult result;
        result.error = "No command provided";
        return result;
    }

    std::string host = SelectHost();
    spdlog::info("Dispatching remote command ({} bytes)", trimmed.size());

    DispatchResult result = Dispatch(trimmed, host);
    result.output = Sanitize(result.output);
    if (result.error) {
        result.error = Sanitize(*result.error);
    }
    return result;
}

std::string RemoteDispatcher::Sanitize(const std::string& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sanitizer_.Sanitize(message);
}

void RemoteDispatcher::Reload(core::RemoteConfig config) {
    core::ValidateRemoteConfig(config);

    std::lock_guard<std::mutex> lock(mutex_);
    sanitizer_ = Sanitizer(config.hosts);
    config_ = std::move(config);
    spdlog::info("Remote dispatch reloaded with {} hosts", config_.hosts.size());
}

core::RemoteConfig RemoteDispatcher::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

} // namespace remote
} // namespace sandpool
