/**
 * @file exponential_backoff.hpp
 * @brief Exponential backoff strategy implementation for IntentMesh.
 *
 * Provides an implementation of IBackoffStrategy that doubles the delay
 * with each retry attempt, up to a maximum delay.
 */
#pragma once
#include "intentmesh/core/interfaces/IBackoffStrategy.hpp"
#include <algorithm>

namespace intentmesh {

    /**
     * @class ExponentialBackoff
     * @brief delay = min(base * 2^(attempt-1), max).
     */
    class ExponentialBackoff : public IBackoffStrategy {
    public:
        /**
         * @brief Construct an ExponentialBackoff strategy.
         * @param base Initial delay for the first retry
         * @param max Maximum delay for any retry
         */
        ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            uint32_t shift = attempt == 0 ? 0 : std::min<uint32_t>(attempt - 1, 30);
            long long delay = (long long)base_.count() * (1LL << shift);
            delay = std::min(delay, (long long)max_.count());
            return std::chrono::milliseconds(delay);
        }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

}
