/**
 * @file random.hpp
 * @brief Random token helpers used for intent identifiers.
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace intentmesh {

    /**
     * @brief Fill an 8-byte array with random data.
     *
     * Uses a thread-local Mersenne Twister engine seeded with std::random_device and high-resolution clock.
     */
    inline void randomFill(std::array<uint8_t, 8>& tok)
    {
        static thread_local std::mt19937_64 rng{
            std::random_device{}() ^ (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count()
        };
        uint64_t rnd = rng();
        for (size_t i = 0; i < tok.size(); ++i) {
            tok[i] = static_cast<uint8_t>((rnd >> (i * 8)) & 0xFF);
        }
    }

    /**
     * @brief Lowercase hexadecimal rendering of a byte array.
     */
    template <size_t N>
    inline std::string toHex(const std::array<uint8_t, N>& buf)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (auto b : buf)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

}
