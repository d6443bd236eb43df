/**
 * @file linear_backoff.hpp
 * @brief Linear backoff strategy implementation for IntentMesh.
 *
 * Provides an implementation of IBackoffStrategy that increases the delay linearly
 * with each retry attempt, up to a maximum delay.
 */
#pragma once
#include "intentmesh/core/interfaces/IBackoffStrategy.hpp"
#include <chrono>

namespace intentmesh {

    /**
     * @class LinearBackoff
     * @brief Linear backoff strategy for retried compositions.
     */
    class LinearBackoff : public IBackoffStrategy {
    public:
        /**
         * @brief Construct a LinearBackoff strategy.
         * @param base Delay added per attempt
         * @param max Maximum delay for any retry
         */
        LinearBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            auto d = base_ * attempt;
            return d < max_ ? d : max_;
        }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

} // namespace intentmesh
