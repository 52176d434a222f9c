/**
 * @file selection_strategy.cpp
 * @brief Selection policy implementations
 *
 * @date 2025
 */

#include "sandpool/core/selection_strategy.hpp"

#include <stdexcept>

namespace sandpool {
namespace core {

namespace {

void RequireCandidates(std::size_t count) {
    if (count == 0) {
        throw std::invalid_argument("selection requires at least one candidate");
    }
}

} // anonymous namespace

UniformRandomSelection::UniformRandomSelection()
    : generator_(std::random_device{}()) {}

UniformRandomSelection::UniformRandomSelection(unsigned int seed)
    : generator_(seed) {}

std::size_t UniformRandomSelection::Select(std::size_t count) {
    RequireCandidates(count);

    std::uniform_int_distribution<std::size_t> dis(0, count - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dis(generator_);
}

std::size_t FirstSelection::Select(std::size_t count) {
    RequireCandidates(count);
    return 0;
}

std::size_t RoundRobinSelection::Select(std::size_t count) {
    RequireCandidates(count);

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t index = next_ % count;
    next_ = index + 1;
    return index;
}

} // namespace core
} // namespace sandpool
