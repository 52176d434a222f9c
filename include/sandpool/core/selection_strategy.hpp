/**
 * @file selection_strategy.hpp
 * @brief Swappable policies for picking one element among candidates
 *
 * The pool uses a strategy to choose which idle handle to hand out, and
 * remote dispatch uses one to choose a host. Uniform random is the
 * production policy; the deterministic ones exist so tests can predict
 * the choice.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <random>

namespace sandpool {
namespace core {

/**
 * @class SelectionStrategy
 * @brief Chooses an index in [0, count)
 *
 * **Thread Safety**: implementations must be callable concurrently.
 */
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    /**
     * @brief Pick one of `count` candidates
     * @param count Number of candidates, must be > 0
     * @throws std::invalid_argument if count is 0
     */
    virtual std::size_t Select(std::size_t count) = 0;
};

/// Every candidate equally likely
class UniformRandomSelection : public SelectionStrategy {
public:
    UniformRandomSelection();
    explicit UniformRandomSelection(unsigned int seed);

    std::size_t Select(std::size_t count) override;

private:
    std::mutex mutex_;
    std::mt19937 generator_;
};

/// Always the first candidate
class FirstSelection : public SelectionStrategy {
public:
    std::size_t Select(std::size_t count) override;
};

/// Cycles through candidates in order
class RoundRobinSelection : public SelectionStrategy {
public:
    std::size_t Select(std::size_t count) override;

private:
    std::mutex mutex_;
    std::size_t next_{0};
};

} // namespace core
} // namespace sandpool
