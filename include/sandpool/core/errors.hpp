/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the pool, executor and file gateway
 *
 * Every failure that is part of the caller's contract is classified by an
 * ErrorKind. Operations that cannot produce a result throw SandpoolError;
 * execution outcomes carry the kind inside ExecutionResult instead.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandpool {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of request and infrastructure failures
 */
enum class ErrorKind {
    INVALID_REQUEST,      ///< Empty/malformed payload or path, never reaches an environment
    POOL_EXHAUSTED,       ///< No handle became idle before the deadline (retryable)
    POOL_CLOSED,          ///< Pool is shutting down or was never started
    TIMEOUT,              ///< Execution exceeded its wall-clock bound
    PATH_ESCAPE,          ///< Resolved path lies outside the sandbox root
    NOT_A_DIRECTORY,      ///< List target is not a directory
    FILE_NOT_FOUND,       ///< Read target does not exist
    ENVIRONMENT_FAILURE   ///< Backend-level fault (crash, unreachable, I/O error)
};

/**
 * @brief Stable lowercase identifier for an error kind ("timeout", "path_escape", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @brief Whether a caller may retry the same request unchanged
 *
 * True for POOL_EXHAUSTED and ENVIRONMENT_FAILURE: both are resolved by
 * waiting for capacity or for a replacement environment.
 */
bool IsRetryable(ErrorKind kind);

/**
 * @class SandpoolError
 * @brief Exception carrying an ErrorKind
 */
class SandpoolError : public std::runtime_error {
public:
    SandpoolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace core
} // namespace sandpool
