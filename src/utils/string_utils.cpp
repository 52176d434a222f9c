/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandpool/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sandpool {
namespace utils {

namespace {

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of the character starting at `pos`. A malformed or
// truncated sequence, or a stray continuation byte, is one character of
// one byte.
std::size_t CharLength(const std::string& str, std::size_t pos) {
    auto lead = static_cast<unsigned char>(str[pos]);
    std::size_t expected = 1;
    if ((lead & 0xE0) == 0xC0) {
        expected = 2;
    }
    else if ((lead & 0xF0) == 0xE0) {
        expected = 3;
    }
    else if ((lead & 0xF8) == 0xF0) {
        expected = 4;
    }

    if (pos + expected > str.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < expected; ++i) {
        if (!IsContinuationByte(static_cast<unsigned char>(str[pos + i]))) {
            return 1;
        }
    }
    return expected;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// OUTPUT TRUNCATION
// ============================================================================
// Limits are expressed in characters; captured output is raw UTF-8 bytes

std::size_t StringUtils::CountChars(const std::string& str) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < str.size(); i += CharLength(str, i)) {
        ++count;
    }
    return count;
}

std::string StringUtils::TruncateChars(const std::string& str,
                                       std::size_t max_chars,
                                       const std::string& marker,
                                       bool* truncated) {
    if (truncated) {
        *truncated = false;
    }

    // Byte length bounds character count
    if (str.size() <= max_chars || CountChars(str) <= max_chars) {
        return str;
    }

    // Find the byte offset where character number max_chars starts
    std::size_t chars = 0;
    std::size_t cut = str.size();
    for (std::size_t i = 0; i < str.size(); i += CharLength(str, i)) {
        if (chars == max_chars) {
            cut = i;
            break;
        }
        ++chars;
    }

    if (cut == str.size()) {
        return str;
    }

    if (truncated) {
        *truncated = true;
    }
    return str.substr(0, cut) + marker;
}

} // namespace utils
} // namespace sandpool
