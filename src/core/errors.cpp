/**
 * @file errors.cpp
 * @brief ErrorKind naming and retry classification
 *
 * @date 2025
 */

#include "sandpool/core/errors.hpp"

namespace sandpool {
namespace core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_REQUEST:     return "invalid_request";
        case ErrorKind::POOL_EXHAUSTED:      return "pool_exhausted";
        case ErrorKind::POOL_CLOSED:         return "pool_closed";
        case ErrorKind::TIMEOUT:             return "timeout";
        case ErrorKind::PATH_ESCAPE:         return "path_escape";
        case ErrorKind::NOT_A_DIRECTORY:     return "not_a_directory";
        case ErrorKind::FILE_NOT_FOUND:      return "file_not_found";
        case ErrorKind::ENVIRONMENT_FAILURE: return "environment_failure";
    }
    return "unknown";
}

bool IsRetryable(ErrorKind kind) {
    return kind == ErrorKind::POOL_EXHAUSTED ||
           kind == ErrorKind::ENVIRONMENT_FAILURE;
}

} // namespace core
} // namespace sandpool
