/**
 * @file sanitizer.hpp
 * @brief Redacts internal host identifiers from caller-visible text
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandpool {
namespace remote {

/// Placeholder substituted for every sensitive identifier
inline constexpr const char* kHostPlaceholder = "remote_host";

/**
 * @class Sanitizer
 * @brief Replaces configured sensitive substrings with a placeholder
 *
 * Longer identifiers are replaced first so that a host which is a prefix
 * of another ("10.0.0.1" and "10.0.0.12") cannot leave a partial suffix
 * behind. Empty identifiers are ignored.
 *
 * **Usage Example**:
 * @code
 * Sanitizer sanitizer({"10.0.0.5", "build-7.internal"});
 * sanitizer.Sanitize("ssh: connect to host 10.0.0.5 port 22: refused");
 * // "ssh: connect to host remote_host port 22: refused"
 * @endcode
 */
class Sanitizer {
public:
    explicit Sanitizer(std::vector<std::string> sensitive,
                       std::string placeholder = kHostPlaceholder);

    std::string Sanitize(const std::string& message) const;

    const std::vector<std::string>& GetSensitive() const { return sensitive_; }

private:
    std::vector<std::string> sensitive_;  ///< Sorted longest first, no empties
    std::string placeholder_;
};

} // namespace remote
} // namespace sandpool
