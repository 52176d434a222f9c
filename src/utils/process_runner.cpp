/**
 * @file process_runner.cpp
 * @brief fork/exec child supervision with poll(2)-based stream draining
 *
 * **Pipe Layout**:
 * ```
 * parent                     child (own process group)
 *   stdin_pipe.write  ──▶  fd 0
 *   stdout_pipe.read  ◀──  fd 1
 *   stderr_pipe.read  ◀──  fd 2   (or fd 1 when merged)
 * ```
 *
 * All parent ends are non-blocking. One poll loop services the three
 * descriptors so a chatty stderr can never stall on a full pipe while the
 * parent blocks on stdout. Kills target the whole process group so
 * grandchildren that inherited the pipes release them as well.
 *
 * @date 2025
 */

#include "sandpool/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandpool {
namespace utils {

namespace {

// ============================================================================
// FILE DESCRIPTOR OWNERSHIP
// ============================================================================

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void SetNonBlocking(const UniqueFd& fd) {
    if (!fd.valid()) {
        return;
    }
    int flags = ::fcntl(fd.get(), F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK);
    }
}

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void AppendCapped(std::string& dst, const char* data, std::size_t n,
                  std::size_t cap, bool& overflow) {
    if (cap == 0) {
        dst.append(data, n);
        return;
    }
    std::size_t room = cap > dst.size() ? cap - dst.size() : 0;
    if (n > room) {
        overflow = true;
        n = room;
    }
    dst.append(data, n);
}

// Read until EAGAIN; closes the descriptor on EOF or error
void DrainReadable(UniqueFd& fd, std::string& dst, std::size_t cap, bool& overflow) {
    std::array<char, 4096> buffer;
    while (fd.valid()) {
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            AppendCapped(dst, buffer.data(), static_cast<std::size_t>(n), cap, overflow);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.Reset();
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("ProcessRunner::Run: empty argv");
    }

    IgnoreSigpipeOnce();

    Pipe stdin_pipe = MakePipe();
    Pipe stdout_pipe = MakePipe();
    Pipe stderr_pipe = MakePipe();

    // Everything the child touches is prepared before fork
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    const int child_stderr = options.merge_stderr ? stdout_pipe.write_end.get()
                                                  : stderr_pipe.write_end.get();

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(stdin_pipe.read_end.get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(child_stderr, STDERR_FILENO);

        ::execvp(c_argv[0], c_argv.data());

        static const char kExecFailed[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Close the race with the child's own setpgid
    ::setpgid(pid, pid);

    stdin_pipe.read_end.Reset();
    stdout_pipe.write_end.Reset();
    stderr_pipe.write_end.Reset();

    UniqueFd& in = stdin_pipe.write_end;
    UniqueFd& out = stdout_pipe.read_end;
    UniqueFd& err = stderr_pipe.read_end;

    if (options.merge_stderr) {
        err.Reset();
    }
    if (options.stdin_data.empty()) {
        in.Reset();
    }

    SetNonBlocking(in);
    SetNonBlocking(out);
    SetNonBlocking(err);

    ProcessResult result;
    std::size_t stdin_offset = 0;
    bool killed = false;
    std::chrono::steady_clock::time_point kill_time;

    auto kill_child = [&]() {
        if (killed) {
            return;
        }
        killed = true;
        kill_time = std::chrono::steady_clock::now();
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        in.Reset();
        spdlog::debug("Killed process group {} ({})", pid,
                      result.timed_out ? "deadline" : "cancelled");
    };

    auto check_termination = [&]() {
        if (killed) {
            return;
        }
        if (options.cancel && options.cancel->IsCancelled()) {
            result.cancelled = true;
            kill_child();
        } else if (options.deadline && std::chrono::steady_clock::now() >= *options.deadline) {
            result.timed_out = true;
            kill_child();
        }
    };

    // Drain both streams to EOF
    while (out.valid() || err.valid()) {
        check_termination();

        auto now = std::chrono::steady_clock::now();
        if (killed && now - kill_time >= options.kill_drain_grace) {
            spdlog::warn("Process {} still holds its pipes {} ms after kill, abandoning capture",
                         pid, options.kill_drain_grace.count());
            break;
        }

        std::array<pollfd, 3> fds{};
        std::array<UniqueFd*, 3> owners{};
        nfds_t nfds = 0;

        if (out.valid()) {
            fds[nfds] = pollfd{out.get(), POLLIN, 0};
            owners[nfds++] = &out;
        }
        if (err.valid()) {
            fds[nfds] = pollfd{err.get(), POLLIN, 0};
            owners[nfds++] = &err;
        }
        if (in.valid()) {
            fds[nfds] = pollfd{in.get(), POLLOUT, 0};
            owners[nfds++] = &in;
        }

        auto wait = options.poll_interval;
        if (options.deadline && !killed) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *options.deadline - now);
            if (remaining < wait) {
                wait = remaining < std::chrono::milliseconds(0) ? std::chrono::milliseconds(0)
                                                                : remaining;
            }
        }

        int ready = ::poll(fds.data(), nfds, static_cast<int>(wait.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed for process {}: {}", pid, std::strerror(errno));
            result.cancelled = true;
            kill_child();
            break;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            UniqueFd* owner = owners[i];

            if (owner == &out) {
                DrainReadable(out, result.stdout_output, options.max_capture_bytes,
                              result.stdout_overflow);
            } else if (owner == &err) {
                DrainReadable(err, result.stderr_output, options.max_capture_bytes,
                              result.stderr_overflow);
            } else if (owner == &in) {
                if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                    in.Reset();
                    continue;
                }
                const std::string& data = options.stdin_data;
                ssize_t n = ::write(in.get(), data.data() + stdin_offset,
                                    data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                    if (stdin_offset >= data.size()) {
                        in.Reset();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    in.Reset();
                }
            }
        }
    }

    in.Reset();
    out.Reset();
    err.Reset();

    // Reap, still honouring deadline and cancellation for children that
    // closed their output early
    int status = 0;
    while (true) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            result.exit_code = DecodeStatus(status);
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            spdlog::error("waitpid failed for process {}: {}", pid, std::strerror(errno));
            break;
        }
        check_termination();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    return result;
}

} // namespace utils
} // namespace sandpool
