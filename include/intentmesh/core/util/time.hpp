/**
 * @file time.hpp
 * @brief Time helpers for IntentMesh.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace intentmesh {

    using SteadyClock = std::chrono::steady_clock;
    using SystemClock = std::chrono::system_clock;

    /**
     * @brief Current wall-clock time in milliseconds since the Unix epoch.
     */
    inline std::uint64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Current wall-clock time in nanoseconds since the Unix epoch.
     */
    inline std::uint64_t epochNanos()
    {
        using namespace std::chrono;
        return duration_cast<nanoseconds>(
            system_clock::now().time_since_epoch()).count();
    }
}
