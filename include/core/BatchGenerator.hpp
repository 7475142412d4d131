// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Batch Generator: commits one window of samples to a replayable digest

#ifndef VIGIL_BATCH_GENERATOR_HPP
#define VIGIL_BATCH_GENERATOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "AttestationTypes.hpp"
#include "core/SampleRing.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Core {

    struct BatchOutcome {
        std::optional<Batch> batch;   // empty when the tick was skipped
        Bitmap bitmap;
        size_t pending = 0;           // unbatched samples left in the ring after this tick
        uint64_t gapSamples = 0;      // evicted before they were batched
        std::string skipReason;
    };

    /**
     * @brief Windows are consecutive runs of at most k samples, taken oldest first from
     * the samples not yet batched, so windows never overlap. Runs only on the batch timer thread.
     */
    class BatchGenerator {
    private:
        const SampleRing& ring;
        uint64_t samplesPerWindow;
        uint32_t thresholdPpm;
        std::vector<uint8_t> salt;
        VigilUtils::PartialWindowPolicy partialPolicy;

        uint64_t lastBatchedSequence = 0;

    public:
        BatchGenerator(const SampleRing& ring, const VigilUtils::PipelineConfig& config);

        BatchOutcome tick();

        /**
         * @brief ceil(ppm * n / 1e6) in integer arithmetic.
         * 0.95 -> 950000 ppm: n=20 -> 19, n=19 -> 19, n=1 -> 1.
         */
        static uint64_t thresholdFor(uint64_t n, uint32_t thresholdPpm);

        static Bitmap buildBitmap(const std::vector<Sample>& window);

        // SHA-256(bitmap || salt)
        static Digest256 hashBitmap(const Bitmap& bitmap, const std::vector<uint8_t>& salt);

        /**
         * @brief Pure: the same ordered samples and salt always give the same batch.
         * The window spans the first and last sample timestamps, not the tick time.
         */
        static Batch summarize(const std::vector<Sample>& window, uint32_t thresholdPpm,
                               const std::vector<uint8_t>& salt, Bitmap& bitmapOut);
    };
}

#endif
