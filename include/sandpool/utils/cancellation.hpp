/**
 * @file cancellation.hpp
 * @brief Shared cancellation flag for in-flight executions
 *
 * Copies of a CancellationToken share one flag. The pool hands a fresh
 * token out with every acquisition; the executor cancels it on timeout and
 * the pool cancels it on shutdown. Backends poll or wait on it.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace sandpool {
namespace utils {

class CancellationToken {
public:
    CancellationToken()
        : state_(std::make_shared<State>()) {}

    /// Set the flag and wake every waiter. Idempotent.
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Block until cancelled or `timeout` elapses
     * @return true if cancelled
     */
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
    };

    std::shared_ptr<State> state_;
};

} // namespace utils
} // namespace sandpool
