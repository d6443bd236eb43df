/**
 * @file IBackoffStrategy.hpp
 * @brief Interface for retry backoff strategies in IntentMesh.
 *
 * Defines the IBackoffStrategy interface used by the composer's retry overlay
 * to space out attempts at a failing composition.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace intentmesh {

    /**
     * @class IBackoffStrategy
     * @brief Interface for custom retry backoff strategies.
     *
     * Implement this interface to provide custom backoff algorithms for retried compositions.
     */
    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @brief Calculate the next backoff delay.
         * @param attempt Current retry attempt (starting from 1)
         * @return Duration to wait before the next retry
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t attempt) const = 0;
    };

}
