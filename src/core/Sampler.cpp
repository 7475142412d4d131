// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/Sampler.hpp"

namespace Vigil::Core {

    Sampler::Sampler(const HealthSnapshotStore& store, SampleRing& ring, const VigilUtils::PipelineConfig& config)
        : store(store),
          ring(ring),
          maxStalenessSecs(config.maxStalenessSecs),
          gracePeriodSecs(config.gracePeriodSecs),
          minIncrement(config.minIncrement),
          requireSampledCountAdvance(config.requireSampledCountAdvance) {}

    bool Sampler::sampledCountAdvanced(std::optional<int64_t> current) const {
        if (!current) return false;
        if (!prevSampledCount) return true;  // first reading
        return *current - *prevSampledCount >= 1;
    }

    Sample Sampler::evaluate(uint64_t now) const {
        HealthSnapshot snap = store.read();

        Sample sample;
        sample.timestamp = now;
        sample.head = snap.head;
        sample.sampledCount = snap.sampledCount;

        // Observations stamped slightly in the future count as age 0
        uint64_t age = 0;
        if (snap.lastUpdate && now > *snap.lastUpdate) {
            age = now - *snap.lastUpdate;
        }

        if (!snap.lastUpdate || age > maxStalenessSecs) {
            sample.reason = {ReasonCode::STALE, static_cast<int64_t>(age)};
        } else if (!snap.head) {
            sample.reason = {ReasonCode::NO_DATA, 0};
        } else {
            bool pass = true;
            if (!prevHead) {
                sample.reason = {ReasonCode::FIRST_SAMPLE, 0};
            } else {
                int64_t advanced = *snap.head - *prevHead;
                if (advanced >= minIncrement) {
                    sample.reason = {ReasonCode::ADVANCED, advanced};
                } else if (age <= gracePeriodSecs) {
                    sample.reason = {ReasonCode::FRESH, static_cast<int64_t>(age)};
                } else {
                    sample.reason = {ReasonCode::STUCK, 0};
                    pass = false;
                }
            }

            if (pass && requireSampledCountAdvance && !sampledCountAdvanced(snap.sampledCount)) {
                sample.reason = {ReasonCode::HEADERS_NOT_ADVANCED, 0};
                pass = false;
            }
            sample.ok = pass;
        }
        return sample;
    }

    Sample Sampler::tick(uint64_t now) {
        Sample sample = evaluate(now);
        ring.append(sample);

        prevHead = sample.head;
        prevSampledCount = sample.sampledCount;
        return sample;
    }
}
