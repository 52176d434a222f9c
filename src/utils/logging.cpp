/**
 * @file logging.cpp
 * @brief spdlog default logger installation
 *
 * @date 2025
 */

#include "sandpool/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sandpool {
namespace utils {

void InitLogging(spdlog::level::level_enum level, const std::string& pattern) {
    auto console = spdlog::get("sandpool");
    if (!console) {
        console = spdlog::stderr_color_mt("sandpool");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern(pattern);
}

void SetLogLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace utils
} // namespace sandpool
