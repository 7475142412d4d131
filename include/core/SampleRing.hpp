// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_SAMPLE_RING_HPP
#define VIGIL_SAMPLE_RING_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "AttestationTypes.hpp"

namespace Vigil::Core {

    /**
     * @brief Point-in-time copy of the ring, oldest first.
     * Every appended sample gets a sequence number (1, 2, ...); samples[i] has
     * sequence firstSequence + i.
     */
    struct RingSnapshot {
        uint64_t firstSequence = 1;
        std::vector<Sample> samples;

        [[nodiscard]] uint64_t lastSequence() const { return firstSequence + samples.size() - 1; }
    };

    /**
     * @brief Fixed-capacity FIFO of samples in circular storage,
     * overwriting the oldest slot instead of blocking when full.
     * The Sampler is the only writer; the Batch Generator only takes snapshots.
     */
    class SampleRing {
    private:
        mutable std::mutex lock;
        std::vector<Sample> buffer;
        size_t head = 0;     // slot of the oldest sample
        size_t count = 0;
        uint64_t appended = 0;

    public:
        explicit SampleRing(size_t capacity);

        /**
         * @brief O(1). Evicts the oldest sample when full.
         * Throws BufferInvariantViolation (ring unchanged) on a timestamp regression.
         */
        void append(const Sample& sample);

        [[nodiscard]] RingSnapshot snapshot() const;

        [[nodiscard]] size_t size() const;
        [[nodiscard]] size_t capacity() const { return buffer.size(); }
        [[nodiscard]] uint64_t totalAppended() const;
    };
}

#endif
