/**
 * @file fixed_backoff.hpp
 * @brief Constant-delay backoff, used when exponential backoff is switched off.
 */
#pragma once
#include "intentmesh/core/interfaces/IBackoffStrategy.hpp"

namespace intentmesh {

    class FixedBackoff : public IBackoffStrategy {
    public:
        explicit FixedBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

        std::chrono::milliseconds nextDelay(uint32_t) const override { return delay_; }

    private:
        std::chrono::milliseconds delay_;
    };

}
