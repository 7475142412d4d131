// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/BatchGenerator.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include <algorithm>

namespace Vigil::Core {

    BatchGenerator::BatchGenerator(const SampleRing& ring, const VigilUtils::PipelineConfig& config)
        : ring(ring),
          samplesPerWindow(config.samplesPerWindow),
          thresholdPpm(config.thresholdPpm),
          salt(config.salt.begin(), config.salt.end()),
          partialPolicy(config.partialWindowPolicy) {
        if (samplesPerWindow == 0) {
            throw ConfigError("BatchGenerator needs a validated configuration (k = 0)");
        }
    }

    uint64_t BatchGenerator::thresholdFor(uint64_t n, uint32_t ppm) {
        constexpr uint64_t kMillion = 1000000;
        return (n * ppm + kMillion - 1) / kMillion;
    }

    Bitmap BatchGenerator::buildBitmap(const std::vector<Sample>& window) {
        Bitmap bitmap;
        bitmap.reserve(window.size());
        for (const auto& sample : window) {
            bitmap.push_back(sample.ok ? 1 : 0);
        }
        return bitmap;
    }

    Digest256 BatchGenerator::hashBitmap(const Bitmap& bitmap, const std::vector<uint8_t>& salt) {
        return Crypto::Sha256().update(bitmap).update(salt).finish();
    }

    Batch BatchGenerator::summarize(const std::vector<Sample>& window, uint32_t ppm,
                                    const std::vector<uint8_t>& salt, Bitmap& bitmapOut) {
        Batch batch;
        batch.n = window.size();
        batch.good = static_cast<uint64_t>(
            std::count_if(window.begin(), window.end(), [](const Sample& s) { return s.ok; }));
        batch.threshold = thresholdFor(batch.n, ppm);

        bitmapOut = buildBitmap(window);
        batch.bitmapHash = hashBitmap(bitmapOut, salt);

        if (!window.empty()) {
            batch.window.start = window.front().timestamp;
            batch.window.end = window.back().timestamp;
        }
        return batch;
    }

    BatchOutcome BatchGenerator::tick() {
        BatchOutcome outcome;
        RingSnapshot snap = ring.snapshot();

        if (snap.samples.empty()) {
            outcome.skipReason = "ring is empty";
            return outcome;
        }

        // Samples between the cursor and the oldest survivor were overwritten unbatched
        uint64_t nextWanted = lastBatchedSequence + 1;
        if (snap.firstSequence > nextWanted) {
            outcome.gapSamples = snap.firstSequence - nextWanted;
            nextWanted = snap.firstSequence;
        }

        if (nextWanted > snap.lastSequence()) {
            outcome.skipReason = "no new samples since the last batch";
            return outcome;
        }

        size_t offset = static_cast<size_t>(nextWanted - snap.firstSequence);
        size_t available = snap.samples.size() - offset;

        if (available < samplesPerWindow && partialPolicy == VigilUtils::PartialWindowPolicy::SKIP) {
            // Keep them for the next tick
            outcome.pending = available;
            outcome.skipReason = "window not full (" + std::to_string(available) + "/" +
                                 std::to_string(samplesPerWindow) + " samples)";
            if (outcome.gapSamples > 0) {
                lastBatchedSequence = nextWanted - 1;
            }
            return outcome;
        }

        size_t take = std::min<size_t>(available, samplesPerWindow);
        std::vector<Sample> window(snap.samples.begin() + offset, snap.samples.begin() + offset + take);

        Batch batch = summarize(window, thresholdPpm, salt, outcome.bitmap);
        batch.partial = take < samplesPerWindow;

        lastBatchedSequence = nextWanted + take - 1;
        outcome.pending = available - take;
        outcome.batch = batch;
        return outcome;
    }
}
