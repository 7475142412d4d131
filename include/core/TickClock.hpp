// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_TICK_CLOCK_HPP
#define VIGIL_TICK_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace Vigil::Core {

    /**
     * @brief Epoch seconds that never go backwards.
     * The wall clock is read once, at construction; every later reading is that anchor
     * plus the steady_clock time elapsed since. Steps of the system clock (NTP, manual)
     * do not reach sample or observation timestamps.
     */
    class TickClock {
    public:
        using Steady = std::chrono::steady_clock;

        TickClock();
        TickClock(uint64_t anchorSecs, Steady::time_point origin);

        uint64_t now() const;

        // Time points before the origin map to the anchor
        uint64_t at(Steady::time_point point) const;

        uint64_t anchor() const { return anchorSecs; }

    private:
        uint64_t anchorSecs;
        Steady::time_point origin;
    };
}

#endif // VIGIL_TICK_CLOCK_HPP
