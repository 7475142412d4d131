// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/TickClock.hpp"
#include <ctime>

namespace Vigil::Core {

    TickClock::TickClock()
        : anchorSecs(static_cast<uint64_t>(std::time(nullptr))),
          origin(Steady::now()) {}

    TickClock::TickClock(uint64_t anchorSecs, Steady::time_point origin)
        : anchorSecs(anchorSecs), origin(origin) {}

    uint64_t TickClock::now() const {
        return at(Steady::now());
    }

    uint64_t TickClock::at(Steady::time_point point) const {
        if (point <= origin) {
            return anchorSecs;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(point - origin);
        return anchorSecs + static_cast<uint64_t>(elapsed.count());
    }
}
