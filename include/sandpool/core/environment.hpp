/**
 * @file environment.hpp
 * @brief Data model for pooled execution environments
 *
 * Defines the pool's bookkeeping record for one isolated environment, the
 * execution request/result pair exchanged with the executor, and the
 * release outcome that decides whether an environment is reused.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/errors.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @enum HandleState
 * @brief Lifecycle of an environment handle
 *
 * ```
 * IDLE ──acquire──▶ IN_USE ──clean release──▶ IDLE
 *                     │
 *                     └─timeout/crash──▶ UNHEALTHY ──reclaim──▶ DESTROYED
 * ```
 */
enum class HandleState {
    IDLE,        ///< Available for acquisition
    IN_USE,      ///< Owned by exactly one in-flight execution
    UNHEALTHY,   ///< Compromised, waiting for reclamation
    DESTROYED    ///< Environment removed from the backend
};

const char* HandleStateName(HandleState state);

/**
 * @struct EnvironmentHandle
 * @brief Pool record referencing one environment
 */
struct EnvironmentHandle {
    std::string id;                               ///< Backend identifier, unique among live environments
    HandleState state{HandleState::IDLE};         ///< Current lifecycle state
    std::string workspace_root{"/workspace"};     ///< Only readable/writable surface inside the environment
    std::chrono::system_clock::time_point created_at;  ///< Creation time
    std::size_t executions{0};                    ///< Completed acquisitions served
};

/**
 * @enum Language
 * @brief Invocation strategy inside the environment
 */
enum class Language {
    PYTHON,      ///< python -c
    BASH,        ///< bash -c
    SH,          ///< sh -c
    NODE         ///< node -e ("javascript" is an alias)
};

/**
 * @brief Parse a language name (case-insensitive)
 * @return Language, or std::nullopt for unsupported names
 */
std::optional<Language> ParseLanguage(const std::string& name);

const char* LanguageName(Language language);

/// Comma-separated list of accepted language names, for error messages
std::string SupportedLanguages();

/**
 * @struct ExecutionRequest
 * @brief One payload to run
 */
struct ExecutionRequest {
    std::string payload;                  ///< Source text, non-empty after trimming
    Language language{Language::PYTHON};  ///< Invocation strategy
};

/**
 * @struct ExecutionResult
 * @brief Captured outcome of one execution attempt
 *
 * Exactly one of `exit_code` or `error_kind == TIMEOUT` holds for a
 * completed attempt. ENVIRONMENT_FAILURE carries neither exit code nor
 * timeout; INVALID_REQUEST never reaches an environment.
 */
struct ExecutionResult {
    std::string stdout_output;              ///< Captured stdout, truncated to the limit
    std::string stderr_output;              ///< Captured stderr, truncated to the limit
    std::optional<int> exit_code;           ///< Process exit code, absent on timeout/failure
    std::optional<ErrorKind> error_kind;    ///< Infrastructure fault, if any
    std::string error_message;              ///< Infrastructure fault description
    bool truncated{false};                  ///< Either stream was truncated
    std::chrono::milliseconds duration{0};  ///< Wall-clock time of the attempt

    bool has_error() const { return error_kind.has_value(); }
};

/**
 * @enum ReleaseOutcome
 * @brief How an environment came back to the pool
 */
enum class ReleaseOutcome {
    REUSABLE,     ///< Execution succeeded or failed only at the application level
    COMPROMISED   ///< Timeout, crash or backend I/O error: replace the environment
};

/**
 * @brief Map an execution result to its release outcome
 *
 * A non-zero exit code alone is REUSABLE; TIMEOUT and ENVIRONMENT_FAILURE
 * are COMPROMISED.
 */
ReleaseOutcome OutcomeFor(const ExecutionResult& result);

/**
 * @struct PoolStats
 * @brief Handle counts per state
 */
struct PoolStats {
    std::size_t target{0};           ///< Configured pool size
    std::size_t idle{0};             ///< Handles ready for acquisition
    std::size_t in_use{0};           ///< Handles owned by executions
    std::size_t unhealthy{0};        ///< Handles waiting for reclamation
    std::size_t destroyed_total{0};  ///< Environments reclaimed since start
    std::size_t created_total{0};    ///< Environments created since start

    std::size_t total() const { return idle + in_use + unhealthy; }
};

} // namespace core
} // namespace sandpool
