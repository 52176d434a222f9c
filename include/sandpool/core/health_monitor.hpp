/**
 * @file health_monitor.hpp
 * @brief Background reconciliation of pool membership
 *
 * Each cycle asks the backend for the authoritative set of live
 * environments, removes tracked handles that are gone or unhealthy,
 * destroys them, and creates replacements up to the target size. Handles
 * that are IN_USE are never touched; a missing one is marked stale and
 * reclaimed when it is released.
 *
 * The monitor is owned by SandboxPool: started by Start(), stopped by
 * Shutdown(). A compromised release wakes it early.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace sandpool {
namespace core {

class SandboxPool;

/**
 * @struct ReconcileReport
 * @brief What one reconciliation cycle did
 */
struct ReconcileReport {
    bool query_failed{false};   ///< Backend live-set query failed, nothing changed
    std::size_t removed{0};     ///< Handles dropped from the pool
    std::size_t deferred{0};    ///< Missing handles left alone because they are in use
    std::size_t created{0};     ///< Replacement environments added
    std::size_t failed{0};      ///< Destroy or create calls that failed
};

/**
 * @class HealthMonitor
 * @brief Periodic reconciliation task
 *
 * **Thread Safety**: RunCycle() is serialized internally and may be called
 * from any thread, including while the background loop runs.
 */
class HealthMonitor {
public:
    HealthMonitor(SandboxPool& pool, std::chrono::milliseconds interval);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Start the background loop; no-op if already running
    void Start();

    /// Stop and join the background loop; no-op if not running
    void Stop();

    /// Run the next cycle now instead of at the next interval
    void Wake();

    /**
     * @brief Execute one reconciliation cycle synchronously
     *
     * Never throws: backend failures are logged and counted.
     */
    ReconcileReport RunCycle();

    bool IsRunning() const { return running_; }

    /// Cycles completed since construction
    std::size_t CycleCount() const { return cycles_; }

private:
    SandboxPool& pool_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> cycles_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    bool wake_requested_{false};

    std::mutex cycle_mutex_;  ///< Serializes RunCycle

    void Loop();
};

} // namespace core
} // namespace sandpool
