/**
 * @file file_gateway.cpp
 * @brief Path confinement and confined file operations
 *
 * @date 2025
 */

#include "sandpool/core/file_gateway.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace sandpool {
namespace core {

namespace {

std::string Normalize(const fs::path& path) {
    std::string normal = path.lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

bool IsWithin(const std::string& path, const std::string& root) {
    if (path == root) {
        return true;
    }
    if (root == "/") {
        return utils::StringUtils::StartsWith(path, "/");
    }
    return utils::StringUtils::StartsWith(path, root + "/");
}

} // anonymous namespace

FileAccessGateway::FileAccessGateway(std::shared_ptr<backend::EnvironmentBackend> backend)
    : backend_(std::move(backend)) {}

// ============================================================================
// PATH RESOLUTION
// ============================================================================

std::string FileAccessGateway::Resolve(const std::string& raw_path,
                                       const std::string& workspace_root) {
    if (utils::StringUtils::Trim(raw_path).empty()) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST, "Path must not be empty");
    }
    if (raw_path.find('\0') != std::string::npos) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST, "Path contains a NUL byte");
    }

    std::string root = Normalize(workspace_root);
    fs::path candidate(raw_path);
    if (candidate.is_relative()) {
        candidate = fs::path(root) / candidate;
    }

    std::string resolved = Normalize(candidate);
    if (!IsWithin(resolved, root)) {
        throw SandpoolError(ErrorKind::PATH_ESCAPE,
                            "Path escapes sandbox root " + root + ": " + raw_path);
    }
    return resolved;
}

std::string FileAccessGateway::ResolveIn(const EnvironmentHandle& handle,
                                         const std::string& raw_path) {
    std::string lexical = Resolve(raw_path, handle.workspace_root);
    std::string canonical = backend_->Canonicalize(handle.id, lexical);

    if (canonical != lexical) {
        spdlog::debug("Path {} canonicalized to {}", lexical, canonical);
        if (canonical.empty() || !IsWithin(canonical, Normalize(handle.workspace_root))) {
            throw SandpoolError(ErrorKind::PATH_ESCAPE,
                                "Path resolves outside sandbox root: " + raw_path);
        }
    }
    return canonical;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::string FileAccessGateway::Read(const EnvironmentHandle& handle, const std::string& raw_path) {
    std::string path = ResolveIn(handle, raw_path);

    switch (backend_->Stat(handle.id, path)) {
        case backend::PathKind::MISSING:
            throw SandpoolError(ErrorKind::FILE_NOT_FOUND, "File not found: " + raw_path);
        case backend::PathKind::DIRECTORY:
            throw SandpoolError(ErrorKind::INVALID_REQUEST, "Path is a directory: " + raw_path);
        case backend::PathKind::FILE:
            break;
    }

    std::string content = backend_->ReadFile(handle.id, path);
    spdlog::debug("Read {} bytes from {} in {}", content.size(), path, handle.id);
    return content;
}

std::size_t FileAccessGateway::Write(const EnvironmentHandle& handle, const std::string& raw_path,
                                     const std::string& content) {
    std::string path = ResolveIn(handle, raw_path);

    if (backend_->Stat(handle.id, path) == backend::PathKind::DIRECTORY) {
        throw SandpoolError(ErrorKind::INVALID_REQUEST,
                            "Cannot write to a directory: " + raw_path);
    }

    backend_->WriteFile(handle.id, path, content);
    spdlog::debug("Wrote {} bytes to {} in {}", content.size(), path, handle.id);
    return content.size();
}

std::vector<std::string> FileAccessGateway::List(const EnvironmentHandle& handle,
                                                 const std::string& raw_path) {
    std::string path = ResolveIn(handle, raw_path);

    if (backend_->Stat(handle.id, path) != backend::PathKind::DIRECTORY) {
        throw SandpoolError(ErrorKind::NOT_A_DIRECTORY, "Not a directory: " + raw_path);
    }

    auto entries = backend_->ListDir(handle.id, path);
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const std::string& name) {
                                     return name.empty() || name == "." || name == "..";
                                 }),
                  entries.end());
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::size_t FileAccessGateway::ClearWorkspace(const EnvironmentHandle& handle) {
    std::string root = Normalize(handle.workspace_root);
    auto entries = List(handle, root);
    if (entries.empty()) {
        return 0;
    }

    std::vector<std::string> argv = {"rm", "-rf", "--"};
    for (const auto& name : entries) {
        argv.push_back(root + "/" + name);
    }

    utils::CancellationToken token;
    auto result = backend_->Exec(handle.id, argv, root, token, 64 * 1024);
    if (result.exit_code != 0) {
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            "Failed to clear workspace: " +
                            utils::StringUtils::Trim(result.stderr_output));
    }

    spdlog::info("Cleared {} entries from {} in {}", entries.size(), root, handle.id);
    return entries.size();
}

} // namespace core
} // namespace sandpool
