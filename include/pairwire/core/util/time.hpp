/**
 * @file time.hpp
 * @brief Time helpers for pairwire.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace pairwire {

    /**
     * @brief Get the current wall-clock time in milliseconds since the Unix epoch.
     *
     * Used as the packet id. Uses std::chrono::system_clock, so the value can go
     * backwards when the host clock is adjusted.
     *
     * @return Current time in milliseconds since epoch
     */
    inline std::int64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

}
