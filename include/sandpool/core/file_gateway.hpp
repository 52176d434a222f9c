/**
 * @file file_gateway.hpp
 * @brief Path confinement and file operations inside an environment
 *
 * Every caller-supplied path is resolved against the handle's workspace
 * root before any backend call is made. Resolution happens twice: first
 * lexically (`.`/`..` folding, no environment access), then against the
 * environment's real filesystem so symbolic links cannot point the
 * operation outside the root.
 *
 * **Resolution Examples** (root `/workspace`):
 * ```
 * notes.txt                    → /workspace/notes.txt
 * /workspace/sub/../notes.txt  → /workspace/notes.txt
 * ../../etc/passwd             → PATH_ESCAPE
 * /etc/passwd                  → PATH_ESCAPE
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backend/environment_backend.hpp"
#include "sandpool/core/environment.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @class FileAccessGateway
 * @brief Confined read/write/list against one environment at a time
 *
 * The gateway holds no handle state; the caller must own the handle
 * (acquired from the pool) for the duration of each call.
 */
class FileAccessGateway {
public:
    explicit FileAccessGateway(std::shared_ptr<backend::EnvironmentBackend> backend);

    /**
     * @brief Lexically resolve `raw_path` against `workspace_root`
     *
     * Relative paths are joined to the root, absolute paths are taken as-is.
     * The result is normalized and must equal the root or lie beneath it.
     *
     * @return Absolute normalized path without a trailing slash
     * @throws SandpoolError(INVALID_REQUEST) for empty paths or embedded NUL
     * @throws SandpoolError(PATH_ESCAPE) if the result leaves the root
     */
    static std::string Resolve(const std::string& raw_path, const std::string& workspace_root);

    /**
     * @brief Resolve, then canonicalize inside the environment and recheck
     * @throws SandpoolError(PATH_ESCAPE) if a symbolic link leads outside the root
     */
    std::string ResolveIn(const EnvironmentHandle& handle, const std::string& raw_path);

    /**
     * @brief Read a file's content
     * @throws SandpoolError(FILE_NOT_FOUND) if it does not exist
     * @throws SandpoolError(INVALID_REQUEST) if it is a directory
     */
    std::string Read(const EnvironmentHandle& handle, const std::string& raw_path);

    /**
     * @brief Write `content`, creating parent directories
     * @return Number of bytes written
     * @throws SandpoolError(INVALID_REQUEST) if the target is a directory
     */
    std::size_t Write(const EnvironmentHandle& handle, const std::string& raw_path,
                      const std::string& content);

    /**
     * @brief Entry names of a directory, sorted
     * @throws SandpoolError(NOT_A_DIRECTORY) if the target is missing or not a directory
     */
    std::vector<std::string> List(const EnvironmentHandle& handle, const std::string& raw_path);

    /**
     * @brief Remove every entry beneath the workspace root, keeping the root
     * @return Number of top-level entries removed
     */
    std::size_t ClearWorkspace(const EnvironmentHandle& handle);

private:
    std::shared_ptr<backend::EnvironmentBackend> backend_;
};

} // namespace core
} // namespace sandpool
