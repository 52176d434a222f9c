/**
 * @file sandbox_pool.cpp
 * @brief Handle ownership, acquisition, release and shutdown
 *
 * **Locking Rules**:
 * - `mutex_` guards handles_, tokens_, stale_ and the lifecycle flags
 * - Backend calls are made without holding `mutex_`
 * - `cv_` is notified whenever a handle turns idle, a handle leaves
 *   IN_USE, or the pool starts closing
 *
 * @date 2025
 */

#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/health_monitor.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace core {

namespace {

// Wait for cancelled executions to hand their handles back, after the grace
constexpr std::chrono::milliseconds kCancelDrainBound{500};

} // anonymous namespace

// ============================================================================
// HANDLE LEASE
// ============================================================================

HandleLease::HandleLease(SandboxPool* pool, EnvironmentHandle handle,
                         utils::CancellationToken token)
    : pool_(pool)
    , handle_(std::move(handle))
    , token_(std::move(token)) {}

HandleLease::~HandleLease() {
    if (pool_ != nullptr) {
        spdlog::warn("Lease on {} dropped without release, discarding environment", handle_.id);
        Release(ReleaseOutcome::COMPROMISED);
    }
}

HandleLease::HandleLease(HandleLease&& other) noexcept
    : pool_(other.pool_)
    , handle_(std::move(other.handle_))
    , token_(other.token_) {
    other.pool_ = nullptr;
}

HandleLease& HandleLease::operator=(HandleLease&& other) noexcept {
    if (this != &other) {
        if (pool_ != nullptr) {
            pool_->Release(handle_.id, ReleaseOutcome::COMPROMISED);
        }
        pool_ = other.pool_;
        handle_ = std::move(other.handle_);
        token_ = other.token_;
        other.pool_ = nullptr;
    }
    return *this;
}

void HandleLease::Release(ReleaseOutcome outcome) {
    if (pool_ == nullptr) {
        return;
    }
    SandboxPool* pool = pool_;
    pool_ = nullptr;
    pool->Release(handle_.id, outcome);
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxPool::SandboxPool(PoolConfig config,
                         std::shared_ptr<backend::EnvironmentBackend> backend,
                         std::unique_ptr<SelectionStrategy> strategy)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , strategy_(std::move(strategy)) {
    if (!backend_) {
        throw std::invalid_argument("SandboxPool requires an environment backend");
    }
    if (!strategy_) {
        strategy_ = std::make_unique<UniformRandomSelection>();
    }
}

SandboxPool::~SandboxPool() {
    if (IsRunning()) {
        Shutdown();
    }
}

// ============================================================================
// STARTUP
// ============================================================================

void SandboxPool::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || closing_) {
            throw SandpoolError(ErrorKind::POOL_CLOSED, "Pool was already started");
        }
    }

    ValidatePoolConfig(config_);

    spdlog::info("Starting sandbox pool: {} x {} (memory {} MB, cpus {})",
                 config_.pool_size, config_.image,
                 config_.resource_limits.memory_limit_mb, config_.resource_limits.cpu_limit);

    backend_->Probe();

    std::vector<std::string> created;
    created.reserve(config_.pool_size);

    try {
        for (std::size_t i = 0; i < config_.pool_size; ++i) {
            created.push_back(CreateEnvironment());
        }
    }
    catch (const SandpoolError& e) {
        spdlog::error("Pre-warm failed after {} of {} environments: {}",
                      created.size(), config_.pool_size, e.what());
        for (const auto& id : created) {
            DestroyEnvironment(id);
        }
        throw SandpoolError(ErrorKind::ENVIRONMENT_FAILURE,
                            std::string("Failed to pre-warm pool: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        for (const auto& id : created) {
            EnvironmentHandle handle;
            handle.id = id;
            handle.state = HandleState::IDLE;
            handle.workspace_root = config_.sandbox_root;
            handle.created_at = now;
            handles_.emplace(id, handle);
        }
        created_total_ += created.size();
        started_ = true;
    }

    monitor_ = std::make_unique<HealthMonitor>(
        *this, std::chrono::duration_cast<std::chrono::milliseconds>(config_.health_check_interval));
    monitor_->Start();

    spdlog::info("Sandbox pool ready with {} environments", created.size());
}

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

HandleLease SandboxPool::Acquire(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (!started_ || closing_) {
            throw SandpoolError(ErrorKind::POOL_CLOSED, "Sandbox pool is not running");
        }

        std::vector<EnvironmentHandle*> idle;
        for (auto& entry : handles_) {
            if (entry.second.state == HandleState::IDLE) {
                idle.push_back(&entry.second);
            }
        }

        if (!idle.empty()) {
            EnvironmentHandle* chosen = idle[strategy_->Select(idle.size())];
            chosen->state = HandleState::IN_USE;

            utils::CancellationToken token;
            tokens_[chosen->id] = token;

            spdlog::debug("Acquired {}", chosen->id);
            return HandleLease(this, *chosen, token);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            throw SandpoolError(ErrorKind::POOL_EXHAUSTED,
                                "No sandbox available, all " + std::to_string(config_.pool_size) +
                                " environments are busy");
        }

        cv_.wait_until(lock, deadline);
    }
}

HandleLease SandboxPool::Acquire() {
    return Acquire(std::chrono::steady_clock::now() + config_.acquire_timeout);
}

void SandboxPool::Release(const std::string& id, ReleaseOutcome outcome) {
    bool wake_monitor = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = handles_.find(id);
        if (it == handles_.end()) {
            spdlog::warn("Release of untracked environment {} ignored", id);
            return;
        }

        EnvironmentHandle& handle = it->second;
        if (handle.state != HandleState::IN_USE) {
            spdlog::warn("Release of {} in state {} ignored", id, HandleStateName(handle.state));
            return;
        }

        tokens_.erase(id);
        handle.executions++;

        bool stale = stale_.erase(id) > 0;
        if (outcome == ReleaseOutcome::COMPROMISED || stale) {
            handle.state = HandleState::UNHEALTHY;
            wake_monitor = true;
            spdlog::info("Environment {} marked unhealthy{}", id, stale ? " (no longer live)" : "");
        }
        else {
            handle.state = HandleState::IDLE;
            spdlog::debug("Released {}", id);
        }
    }
    cv_.notify_all();

    if (wake_monitor && monitor_) {
        monitor_->Wake();
    }
}

// ============================================================================
// OBSERVABILITY
// ============================================================================

std::size_t SandboxPool::CountInState(HandleState state) const {
    std::size_t count = 0;
    for (const auto& entry : handles_) {
        if (entry.second.state == state) {
            ++count;
        }
    }
    return count;
}

PoolStats SandboxPool::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.target = config_.pool_size;
    stats.idle = CountInState(HandleState::IDLE);
    stats.in_use = CountInState(HandleState::IN_USE);
    stats.unhealthy = CountInState(HandleState::UNHEALTHY);
    stats.created_total = created_total_;
    stats.destroyed_total = destroyed_total_;
    return stats;
}

std::vector<EnvironmentHandle> SandboxPool::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<EnvironmentHandle> handles;
    handles.reserve(handles_.size());
    for (const auto& entry : handles_) {
        handles.push_back(entry.second);
    }
    return handles;
}

bool SandboxPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !closing_;
}

// ============================================================================
// SHUTDOWN
// ============================================================================

void SandboxPool::Shutdown(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || closing_) {
            return;
        }
        closing_ = true;
    }
    cv_.notify_all();

    spdlog::info("Shutting down sandbox pool (grace {} ms)", grace.count());

    if (monitor_) {
        monitor_->Stop();
    }

    std::vector<std::string> ids;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto drained = [this] { return CountInState(HandleState::IN_USE) == 0; };

        if (!cv_.wait_for(lock, grace, drained)) {
            spdlog::warn("Cancelling {} in-flight executions", tokens_.size());
            for (auto& entry : tokens_) {
                entry.second.Cancel();
            }
            if (!cv_.wait_for(lock, kCancelDrainBound, drained)) {
                spdlog::warn("{} executions still running, destroying their environments",
                             CountInState(HandleState::IN_USE));
            }
        }

        for (const auto& entry : handles_) {
            ids.push_back(entry.first);
        }
        handles_.clear();
        tokens_.clear();
        stale_.clear();
    }

    for (const auto& id : ids) {
        DestroyEnvironment(id);
    }

    spdlog::info("Sandbox pool stopped, {} environments destroyed", ids.size());
}

void SandboxPool::Shutdown() {
    Shutdown(std::chrono::duration_cast<std::chrono::milliseconds>(config_.shutdown_grace));
}

// ============================================================================
// RECONCILIATION SUPPORT
// ============================================================================

SandboxPool::ReconcilePlan SandboxPool::PlanReconcile(const std::set<std::string>& live) {
    std::lock_guard<std::mutex> lock(mutex_);

    ReconcilePlan plan;
    if (closing_) {
        return plan;
    }

    for (auto it = handles_.begin(); it != handles_.end();) {
        EnvironmentHandle& handle = it->second;
        bool is_live = live.count(handle.id) > 0;

        if (handle.state == HandleState::IN_USE) {
            if (!is_live && stale_.insert(handle.id).second) {
                plan.deferred++;
                spdlog::warn("Environment {} vanished while in use, reclaiming on release",
                             handle.id);
            }
            ++it;
            continue;
        }

        if (handle.state == HandleState::UNHEALTHY || !is_live) {
            if (!is_live) {
                spdlog::warn("Environment {} is no longer live, removing from pool", handle.id);
            }
            handle.state = HandleState::DESTROYED;
            plan.to_destroy.push_back(handle.id);
            it = handles_.erase(it);
            continue;
        }
        ++it;
    }

    if (handles_.size() < config_.pool_size) {
        plan.deficit = config_.pool_size - handles_.size();
    }
    return plan;
}

std::string SandboxPool::CreateEnvironment() {
    backend::EnvironmentSpec spec;
    spec.image = config_.image;
    spec.limits = config_.resource_limits;
    spec.workspace_root = config_.sandbox_root;
    spec.label = config_.container_label;
    spec.network_disabled = true;

    return backend_->Create(spec);
}

void SandboxPool::DestroyEnvironment(const std::string& id) {
    try {
        backend_->Destroy(id);
    }
    catch (const SandpoolError& e) {
        spdlog::error("Failed to destroy environment {}: {}", id, e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    destroyed_total_++;
}

bool SandboxPool::AddHandle(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return false;
        }

        EnvironmentHandle handle;
        handle.id = id;
        handle.state = HandleState::IDLE;
        handle.workspace_root = config_.sandbox_root;
        handle.created_at = std::chrono::system_clock::now();
        handles_.emplace(id, handle);
        created_total_++;
    }
    cv_.notify_all();
    return true;
}

} // namespace core
} // namespace sandpool
