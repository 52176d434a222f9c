/**
 * @file sanitizer.cpp
 * @brief Host identifier redaction
 *
 * @date 2025
 */

#include "sandpool/remote/sanitizer.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <algorithm>

namespace sandpool {
namespace remote {

Sanitizer::Sanitizer(std::vector<std::string> sensitive, std::string placeholder)
    : placeholder_(std::move(placeholder)) {
    for (auto& item : sensitive) {
        if (!item.empty()) {
            sensitive_.push_back(std::move(item));
        }
    }

    std::sort(sensitive_.begin(), sensitive_.end(),
              [](const std::string& a, const std::string& b) {
                  return a.size() != b.size() ? a.size() > b.size() : a < b;
              });
    sensitive_.erase(std::unique(sensitive_.begin(), sensitive_.end()), sensitive_.end());
}

std::string Sanitizer::Sanitize(const std::string& message) const {
    std::string result = message;
    for (const auto& item : sensitive_) {
        result = utils::StringUtils::ReplaceAll(result, item, placeholder_);
    }
    return result;
}

} // namespace remote
} // namespace sandpool
