/**
 * @file main.cpp
 * @brief sandpool - pooled sandbox execution service
 *
 * Loads configuration, pre-warms the sandbox pool and serves JSON-lines
 * requests from stdin, writing one JSON response per line to stdout.
 * Requests are handled concurrently, so several executions may run at
 * once up to the pool size. SIGINT, SIGTERM or end of input shut the
 * pool down with the configured grace period.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "sandpool/backend/docker_backend.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/remote/remote_dispatcher.hpp"
#include "sandpool/service/request_router.hpp"
#include "sandpool/service/sandbox_service.hpp"
#include "sandpool/utils/logging.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <future>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace {

// Set from the signal handler, read by the serve loop and the stopper thread
std::atomic<bool> g_stop_requested{false};
static_assert(std::atomic<bool>::is_always_lock_free,
              "stop flag must be lock-free to be set from a signal handler");

void HandleSignal(int) {
    g_stop_requested.store(true);
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: interrupt poll/read
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/*******************************************************************************
 * Request Loop
 ******************************************************************************/

/**
 * @brief Read stdin line by line until EOF or a stop signal
 *
 * Each line is handled on its own task; responses are written whole,
 * one per line, under a mutex.
 */
void ServeRequests(sandpool::service::RequestRouter& router) {
    std::mutex output_mutex;
    std::list<std::future<void>> in_flight;
    std::string buffer;
    char chunk[4096];

    auto dispatch = [&](std::string line) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            return;
        }
        in_flight.push_back(std::async(std::launch::async, [&router, &output_mutex, line]() {
            std::string response = router.HandleLine(line);
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << response << '\n' << std::flush;
        }));
    };

    while (!g_stop_requested) {
        in_flight.remove_if([](const std::future<void>& task) {
            return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });

        pollfd stdin_fd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&stdin_fd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[ERROR] poll on stdin failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("[ERROR] read on stdin failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            spdlog::info("[STOP] End of input");
            break;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            dispatch(buffer.substr(0, newline));
            buffer.erase(0, newline + 1);
        }
    }

    if (g_stop_requested) {
        spdlog::info("[STOP] Signal received");
    }
    else if (!buffer.empty()) {
        dispatch(buffer);
    }

    // Drain: every task finishes (or is cancelled by pool shutdown) before return
    for (auto& task : in_flight) {
        task.wait();
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandpool - pooled sandbox code execution"};

    std::string config_path;
    std::string image;
    std::size_t pool_size = 0;
    int timeout_seconds = 0;
    std::size_t max_output = 0;
    int health_interval = 0;
    bool remote_mode = false;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    auto* image_opt = app.add_option("--image", image, "Sandbox image");
    auto* size_opt = app.add_option("--pool-size", pool_size, "Number of pre-warmed environments")
        ->check(CLI::PositiveNumber);
    auto* timeout_opt = app.add_option("--timeout", timeout_seconds,
                                       "Execution timeout in seconds")
        ->check(CLI::PositiveNumber);
    auto* output_opt = app.add_option("--max-output", max_output,
                                      "Per-stream output limit in characters");
    auto* health_opt = app.add_option("--health-interval", health_interval,
                                      "Reconciliation interval in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("--remote", remote_mode, "Forward executions to remote hosts over ssh");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    sandpool::utils::InitLogging(verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        // Configuration layers: defaults, file, environment, flags
        sandpool::core::AppConfig config;
        if (!config_path.empty()) {
            sandpool::core::ApplyConfigFile(config, config_path);
        }
        sandpool::core::ApplyEnvironment(config);

        if (image_opt->count() > 0) config.pool.image = image;
        if (size_opt->count() > 0) config.pool.pool_size = pool_size;
        if (timeout_opt->count() > 0) config.pool.exec_timeout = std::chrono::seconds(timeout_seconds);
        if (output_opt->count() > 0) config.pool.max_output_chars = max_output;
        if (health_opt->count() > 0) {
            config.pool.health_check_interval = std::chrono::seconds(health_interval);
        }

        InstallSignalHandlers();

        if (remote_mode) {
            spdlog::info("[INIT] Remote dispatch mode");
            sandpool::remote::RemoteDispatcher dispatcher(config.remote);
            sandpool::service::RequestRouter router(nullptr, &dispatcher);
            ServeRequests(router);
            return 0;
        }

        spdlog::info("[INIT] Initializing sandbox pool...");
        auto backend = std::make_shared<sandpool::backend::DockerBackend>();
        sandpool::core::SandboxPool pool(config.pool, backend);
        pool.Start();

        spdlog::info("[READY] Serving requests on stdin (transport endpoint {}:{})",
                     config.pool.bind_host, config.pool.bind_port);

        sandpool::service::SandboxService service(pool, backend);
        sandpool::service::RequestRouter router(&service, nullptr);

        // Shutdown runs on its own task so in-flight requests see cancellation
        // while ServeRequests waits for them.
        auto stopper = std::async(std::launch::async, [&pool]() {
            while (!g_stop_requested && pool.IsRunning()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            pool.Shutdown();
        });

        ServeRequests(router);

        g_stop_requested.store(true);
        stopper.wait();

        spdlog::info("[DONE] sandpool stopped");
        return 0;

    } catch (const sandpool::core::SandpoolError& e) {
        spdlog::error("[ERROR] {} ({})", e.what(), sandpool::core::ErrorKindName(e.kind()));
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
