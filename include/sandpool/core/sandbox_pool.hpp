/**
 * @file sandbox_pool.hpp
 * @brief Fixed-size pool of isolated execution environments
 *
 * The pool exclusively owns the set of environment handles and every
 * state transition on them. Callers borrow a handle through a HandleLease
 * and give it back with a ReleaseOutcome; a background HealthMonitor,
 * owned by the pool, reclaims compromised or vanished environments and
 * restores the target size.
 *
 * **Handle Flow**:
 * ```
 *            Start() pre-warms pool_size environments
 *                          │
 *                          ▼
 *   Acquire() ───▶ [IDLE] ───▶ [IN_USE] ───REUSABLE────▶ [IDLE]
 *                                 │
 *                                 └──COMPROMISED──▶ [UNHEALTHY]
 *                                                       │
 *              HealthMonitor: destroy + create ◀────────┘
 * ```
 *
 * **Concurrency**: one mutex guards the handle map; Acquire blocks on a
 * condition variable until a handle turns idle or the deadline passes.
 * Backend calls (create, destroy, list) never run under the lock.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backend/environment_backend.hpp"
#include "sandpool/core/environment.hpp"
#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/selection_strategy.hpp"
#include "sandpool/utils/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

class SandboxPool;
class HealthMonitor;

/**
 * @class HandleLease
 * @brief Exclusive, move-only ownership of one IN_USE handle
 *
 * A lease that is destroyed without an explicit Release() returns its
 * handle as COMPROMISED, since the environment's state is unknown.
 * A lease must not outlive the pool that issued it.
 */
class HandleLease {
public:
    HandleLease() = default;
    ~HandleLease();

    HandleLease(HandleLease&& other) noexcept;
    HandleLease& operator=(HandleLease&& other) noexcept;

    HandleLease(const HandleLease&) = delete;
    HandleLease& operator=(const HandleLease&) = delete;

    /// Snapshot of the handle taken at acquisition
    const EnvironmentHandle& handle() const { return handle_; }

    /// Cancellation token for the execution running on this handle
    const utils::CancellationToken& token() const { return token_; }

    bool active() const { return pool_ != nullptr; }

    /// Give the handle back; further calls are no-ops
    void Release(ReleaseOutcome outcome);

private:
    friend class SandboxPool;

    HandleLease(SandboxPool* pool, EnvironmentHandle handle, utils::CancellationToken token);

    SandboxPool* pool_{nullptr};
    EnvironmentHandle handle_;
    utils::CancellationToken token_;
};

/**
 * @class SandboxPool
 * @brief Concurrency-safe owner of the environment handles
 *
 * **Usage Example**:
 * @code
 * auto backend = std::make_shared<backend::DockerBackend>();
 * SandboxPool pool(config, backend);
 * pool.Start();
 *
 * auto lease = pool.Acquire(std::chrono::steady_clock::now() + std::chrono::seconds(5));
 * auto result = executor.Run(lease.handle(), request, timeout, lease.token());
 * lease.Release(OutcomeFor(result));
 *
 * pool.Shutdown();
 * @endcode
 */
class SandboxPool {
public:
    /**
     * @param config Pool settings, copied
     * @param backend Environment runtime
     * @param strategy Picks among idle handles (uniform random by default)
     */
    SandboxPool(PoolConfig config,
                std::shared_ptr<backend::EnvironmentBackend> backend,
                std::unique_ptr<SelectionStrategy> strategy = nullptr);

    /// Shuts the pool down with the configured grace period if still running
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    /**
     * @brief Validate config, probe the backend, pre-warm and start the monitor
     *
     * Either every environment is created or none is left behind.
     *
     * @throws SandpoolError(INVALID_REQUEST) on invalid configuration
     * @throws SandpoolError(ENVIRONMENT_FAILURE) if the backend is unreachable
     *         or an environment cannot be created
     */
    void Start();

    /**
     * @brief Borrow an idle handle
     *
     * A deadline in the past still takes an idle handle if one is available
     * right now, but never waits.
     *
     * @throws SandpoolError(POOL_EXHAUSTED) if none turns idle before `deadline`
     * @throws SandpoolError(POOL_CLOSED) if the pool is not running
     */
    HandleLease Acquire(std::chrono::steady_clock::time_point deadline);

    /// Acquire with the configured acquire timeout
    HandleLease Acquire();

    /**
     * @brief Return a handle
     *
     * REUSABLE makes it idle again; COMPROMISED marks it unhealthy and wakes
     * the health monitor. Unknown ids (already reclaimed at shutdown) are
     * logged and ignored.
     */
    void Release(const std::string& id, ReleaseOutcome outcome);

    /// Handle counts per state
    PoolStats Stats() const;

    /// Copy of every tracked handle
    std::vector<EnvironmentHandle> Snapshot() const;

    /**
     * @brief Stop serving and destroy every environment
     *
     * Waiting acquirers fail with POOL_CLOSED. In-flight executions get
     * `grace` to finish; after that their tokens are cancelled and they get
     * a further 500 ms to return their handles before every environment
     * is destroyed. Idempotent.
     */
    void Shutdown(std::chrono::milliseconds grace);

    /// Shutdown with the configured grace period
    void Shutdown();

    bool IsRunning() const;

    const PoolConfig& GetConfig() const { return config_; }

    /// The pool's monitor, or nullptr before Start()
    HealthMonitor* GetHealthMonitor() const { return monitor_.get(); }

private:
    friend class HealthMonitor;

    /// Result of diffing tracked handles against the live set
    struct ReconcilePlan {
        std::vector<std::string> to_destroy;  ///< Removed from the pool, to be destroyed
        std::size_t deferred{0};              ///< IN_USE handles newly found missing
        std::size_t deficit{0};               ///< Environments to create
    };

    PoolConfig config_;
    std::shared_ptr<backend::EnvironmentBackend> backend_;
    std::unique_ptr<SelectionStrategy> strategy_;
    std::unique_ptr<HealthMonitor> monitor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, EnvironmentHandle> handles_;
    std::map<std::string, utils::CancellationToken> tokens_;  ///< Per IN_USE handle
    std::set<std::string> stale_;                             ///< IN_USE handles found missing
    bool started_{false};
    bool closing_{false};
    std::size_t created_total_{0};
    std::size_t destroyed_total_{0};

    // Monitor-facing operations
    ReconcilePlan PlanReconcile(const std::set<std::string>& live);
    std::string CreateEnvironment();
    void DestroyEnvironment(const std::string& id);
    bool AddHandle(const std::string& id);

    std::size_t CountInState(HandleState state) const;
};

} // namespace core
} // namespace sandpool
