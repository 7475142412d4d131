// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Sampler: turns the latest health snapshot into one ok/fail bit per tick

#ifndef VIGIL_SAMPLER_HPP
#define VIGIL_SAMPLER_HPP

#include <cstdint>
#include <optional>

#include "AttestationTypes.hpp"
#include "core/HealthSnapshotStore.hpp"
#include "core/SampleRing.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Core {

    /**
     * @brief Three-tier liveness predicate, evaluated once per tick:
     *   1. staleness gate    age > max_staleness        -> stale
     *   2. advancement       head - prev >= min_incr    -> advanced(+d)
     *   3. grace fallback    age <= grace_period        -> fresh(age)
     *   otherwise                                       -> stuck
     * A passing result is downgraded to headers_not_advanced when the sampled_count
     * cross-check is on and the counter did not move since the previous tick.
     *
     * Only the sampler timer thread calls into this class.
     */
    class Sampler {
    private:
        const HealthSnapshotStore& store;
        SampleRing& ring;

        uint64_t maxStalenessSecs;
        uint64_t gracePeriodSecs;
        int64_t minIncrement;
        bool requireSampledCountAdvance;

        // Values seen at the last tick whose sample reached the ring, ok or not.
        std::optional<int64_t> prevHead;
        std::optional<int64_t> prevSampledCount;

        [[nodiscard]] bool sampledCountAdvanced(std::optional<int64_t> current) const;

    public:
        Sampler(const HealthSnapshotStore& store, SampleRing& ring, const VigilUtils::PipelineConfig& config);

        /**
         * @brief Applies the predicate at `now`. Touches neither the ring nor the previous values.
         */
        [[nodiscard]] Sample evaluate(uint64_t now) const;

        /**
         * @brief evaluate() + append, then rolls the previous values forward.
         * Throws BufferInvariantViolation from the ring; an aborted tick leaves the baseline as it was.
         */
        Sample tick(uint64_t now);
    };
}

#endif
