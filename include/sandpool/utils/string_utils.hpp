/**
 * @file string_utils.hpp
 * @brief String helpers for request validation, output capture and redaction
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * Provides static methods for:
 * - Trimming, casing, splitting and joining
 * - Substring replacement (used by host redaction)
 * - UTF-8 aware character counting and output truncation
 *
 * **Usage Example**:
 * @code
 * auto hosts = StringUtils::Split("10.0.0.1;10.0.0.2", ';');
 * auto out = StringUtils::TruncateChars(captured, 50000, "\n... [output truncated]");
 * @endcode
 */
class StringUtils {
public:
    /// Remove leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Replace every occurrence of `from` with `to`
     *
     * Replacement text is never rescanned, so `to` may contain `from`.
     * An empty `from` returns the input unchanged.
     */
    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Number of UTF-8 code points in `str`
     *
     * Well-formed sequences count once. Every byte of an invalid or
     * truncated sequence, stray continuation bytes included, counts as
     * one character.
     */
    static std::size_t CountChars(const std::string& str);

    /**
     * @brief Keep the first `max_chars` characters and append `marker`
     *
     * Strings of at most `max_chars` characters are returned unchanged.
     * Characters are UTF-8 code points, so a multi-byte sequence is never
     * split.
     *
     * @param str Captured text
     * @param max_chars Character limit
     * @param marker Appended only when truncation happened
     * @param truncated Set to true when truncation happened (optional)
     */
    static std::string TruncateChars(const std::string& str,
                                     std::size_t max_chars,
                                     const std::string& marker,
                                     bool* truncated = nullptr);
};

} // namespace utils
} // namespace sandpool
