/**
 * @file environment.cpp
 * @brief Naming and classification helpers for the environment data model
 *
 * @date 2025
 */

#include "sandpool/core/environment.hpp"
#include "sandpool/utils/string_utils.hpp"

namespace sandpool {
namespace core {

const char* HandleStateName(HandleState state) {
    switch (state) {
        case HandleState::IDLE:      return "idle";
        case HandleState::IN_USE:    return "in_use";
        case HandleState::UNHEALTHY: return "unhealthy";
        case HandleState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lowered == "python") return Language::PYTHON;
    if (lowered == "bash") return Language::BASH;
    if (lowered == "sh") return Language::SH;
    if (lowered == "node" || lowered == "javascript") return Language::NODE;

    return std::nullopt;
}

const char* LanguageName(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::BASH:   return "bash";
        case Language::SH:     return "sh";
        case Language::NODE:   return "node";
    }
    return "unknown";
}

std::string SupportedLanguages() {
    return "python, bash, sh, node, javascript";
}

ReleaseOutcome OutcomeFor(const ExecutionResult& result) {
    if (!result.error_kind) {
        return ReleaseOutcome::REUSABLE;
    }

    switch (*result.error_kind) {
        case ErrorKind::TIMEOUT:
        case ErrorKind::ENVIRONMENT_FAILURE:
            return ReleaseOutcome::COMPROMISED;
        default:
            return ReleaseOutcome::REUSABLE;
    }
}

} // namespace core
} // namespace sandpool
