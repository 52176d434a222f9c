/**
 * @file process_runner.hpp
 * @brief Child process execution with concurrent stream capture
 *
 * Runs an argv vector (no shell), optionally feeds stdin, and drains
 * stdout and stderr concurrently through poll(2) so neither stream can
 * block the other on a full pipe buffer. A deadline or a cancellation
 * token kills the whole process group; both pipes are still drained to
 * EOF and the child is always reaped.
 *
 * **Usage Example**:
 * @code
 * ProcessOptions options;
 * options.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
 * auto result = ProcessRunner::Run({"docker", "ps", "-q"}, options);
 * if (result.exit_code == 0) { ... }
 * @endcode
 *
 * @note The first call sets SIGPIPE to SIG_IGN for the process so a child
 *       that exits before consuming stdin cannot kill the caller.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/utils/cancellation.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Per-invocation knobs
 */
struct ProcessOptions {
    std::string stdin_data;                                          ///< Written to the child's stdin, then closed
    std::optional<std::chrono::steady_clock::time_point> deadline;   ///< Kill the child at this instant
    const CancellationToken* cancel{nullptr};                        ///< Kill the child when cancelled
    std::size_t max_capture_bytes{0};                                ///< Per-stream capture cap (0 = unlimited)
    bool merge_stderr{false};                                        ///< Send stderr into the stdout capture
    std::chrono::milliseconds poll_interval{50};                     ///< Cancellation check granularity
    std::chrono::milliseconds kill_drain_grace{5000};                ///< Bound on draining after a kill
};

/**
 * @struct ProcessResult
 * @brief Outcome of one child process
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, or 128+signal when killed by a signal
    std::string stdout_output;              ///< Captured stdout (capped)
    std::string stderr_output;              ///< Captured stderr (capped)
    bool stdout_overflow{false};            ///< Bytes past the cap were discarded
    bool stderr_overflow{false};
    bool timed_out{false};                  ///< Killed because the deadline passed
    bool cancelled{false};                  ///< Killed because the token was cancelled
    std::chrono::milliseconds duration{0};  ///< Spawn to reap

    bool killed() const { return timed_out || cancelled; }
    bool success() const { return !killed() && exit_code == 0; }
};

/**
 * @class ProcessRunner
 * @brief Spawns and supervises child processes
 */
class ProcessRunner {
public:
    /**
     * @brief Run `argv` to completion
     *
     * @param argv Program and arguments; argv[0] is looked up in PATH
     * @param options Stdin, deadline, cancellation and capture settings
     * @return ProcessResult; an exec failure yields exit code 127
     *
     * @throws std::invalid_argument if argv is empty
     * @throws std::runtime_error if pipes cannot be created or fork fails
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions{});
};

} // namespace utils
} // namespace sandpool
