/**
 * @file health_monitor.cpp
 * @brief Reconciliation loop implementation
 *
 * **Cycle**:
 * 1. ListLive(label) on the backend (failure: log, retry next cycle)
 * 2. Under the pool lock: drop unhealthy and vanished idle handles,
 *    mark vanished in-use handles stale, compute the deficit
 * 3. Outside the lock: destroy dropped environments, create replacements
 *
 * @date 2025
 */

#include "sandpool/core/health_monitor.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/sandbox_pool.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace core {

HealthMonitor::HealthMonitor(SandboxPool& pool, std::chrono::milliseconds interval)
    : pool_(pool)
    , interval_(interval) {}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::Start() {
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        wake_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&HealthMonitor::Loop, this);

    spdlog::debug("Health monitor started (interval {} ms)", interval_.count());
}

void HealthMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Health monitor stopped");
    }
    running_ = false;
}

void HealthMonitor::Wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();
}

void HealthMonitor::Loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return stop_requested_ || wake_requested_; });
            if (stop_requested_) {
                return;
            }
            wake_requested_ = false;
        }

        RunCycle();
    }
}

ReconcileReport HealthMonitor::RunCycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    ReconcileReport report;

    std::set<std::string> live;
    try {
        live = pool_.backend_->ListLive(pool_.config_.container_label);
    }
    catch (const std::exception& e) {
        spdlog::warn("Health check query failed, retrying next cycle: {}", e.what());
        report.query_failed = true;
        cycles_++;
        return report;
    }

    auto plan = pool_.PlanReconcile(live);
    report.removed = plan.to_destroy.size();
    report.deferred = plan.deferred;

    for (const auto& id : plan.to_destroy) {
        pool_.DestroyEnvironment(id);
    }

    for (std::size_t i = 0; i < plan.deficit; ++i) {
        std::string id;
        try {
            id = pool_.CreateEnvironment();
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to create replacement environment: {}", e.what());
            report.failed++;
            break;
        }

        if (!pool_.AddHandle(id)) {
            // Pool started closing while the environment was being created
            pool_.DestroyEnvironment(id);
            break;
        }
        report.created++;
    }

    if (report.removed > 0 || report.created > 0 || report.failed > 0) {
        spdlog::info("Reconciliation: removed {}, created {}, deferred {}, failed {}",
                     report.removed, report.created, report.deferred, report.failed);
    }

    cycles_++;
    return report;
}

} // namespace core
} // namespace sandpool
