/**
 * @file logging.hpp
 * @brief spdlog setup for the sandpool executable
 *
 * @date 2025
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace sandpool {
namespace utils {

/// Default console pattern: time, colored level, message
inline constexpr const char* kDefaultLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Install a colored stderr logger named "sandpool" as the default logger
 *
 * Logs go to stderr because stdout carries the JSON-lines responses.
 */
void InitLogging(spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& pattern = kDefaultLogPattern);

void SetLogLevel(spdlog::level::level_enum level);

} // namespace utils
} // namespace sandpool
