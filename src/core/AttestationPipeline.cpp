// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/AttestationPipeline.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"
#include <iostream>

namespace Vigil::Core {

    AttestationPipeline::AttestationPipeline(const VigilUtils::PipelineConfig& config,
                                             PipelineTelemetry& telemetry,
                                             Modules::AttestationArchive& archive,
                                             std::shared_ptr<Modules::RetryingPoster> poster,
                                             std::shared_ptr<const Modules::Prover> prover,
                                             std::shared_ptr<const Crypto::Ed25519Signer> signer)
        : config(config),
          telemetry(telemetry),
          ring(static_cast<size_t>(config.ringCapacity)),
          sampler(store, ring, config),
          batcher(ring, config),
          bus(config, telemetry, ring, archive, std::move(poster), std::move(prover), std::move(signer)) {}

    void AttestationPipeline::samplerTick(uint64_t now) {
        try {
            Sample sample = sampler.tick(now);

            telemetry.samples_total++;
            if (sample.ok) {
                telemetry.samples_ok++;
            } else {
                telemetry.samples_failed++;
            }

            if (VigilUtils::VERBOSE || !sample.ok) {
                std::cout << "[Sampler] " << VigilUtils::formatTimestamp(sample.timestamp)
                          << (sample.ok ? " ok " : " FAIL ") << sample.reason.toString() << std::endl;
            }

            bus.pushSample(sample);
        } catch (const BufferInvariantViolation& e) {
            telemetry.ticks_aborted++;
            std::cerr << "[Sampler] Tick aborted: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            telemetry.ticks_aborted++;
            std::cerr << "[Sampler] Unexpected failure: " << e.what() << std::endl;
        }
    }

    void AttestationPipeline::batchTick() {
        try {
            BatchOutcome outcome = batcher.tick();

            if (outcome.gapSamples > 0) {
                telemetry.gap_samples += outcome.gapSamples;
                std::cerr << "[BatchGenerator] Window gap: " << outcome.gapSamples
                          << " sample(s) were evicted before batching." << std::endl;
            }

            if (!outcome.batch) {
                telemetry.batches_skipped++;
                std::cout << "[BatchGenerator] Skipped: " << outcome.skipReason
                          << " (" << outcome.pending << " pending)" << std::endl;
                return;
            }

            const Batch& batch = *outcome.batch;
            telemetry.batches_emitted++;
            std::cout << "[BatchGenerator] " << VigilUtils::formatTimestamp(batch.window.start)
                      << " .. " << VigilUtils::formatTimestamp(batch.window.end)
                      << ": " << batch.good << "/" << batch.n << " good, threshold " << batch.threshold
                      << (batch.meetsThreshold() ? " met" : " MISSED")
                      << (batch.partial ? " (partial)" : "")
                      << " hash " << Crypto::digestHex(batch.bitmapHash).substr(0, 16) << std::endl;

            bus.pushBatch(batch, outcome.bitmap);
        } catch (const std::exception& e) {
            std::cerr << "[BatchGenerator] Tick failed: " << e.what() << std::endl;
        }
    }
}
