// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/VigilBus.hpp"
#include "core/Scheduler.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Ed25519Signer.hpp"
#include "modules/AttestationArchive.hpp"
#include "modules/LedgerPoster.hpp"
#include "modules/Prover.hpp"
#include "utils/RecordCodec.hpp"
#include "utils/StorageUtils.hpp"
#include <iostream>

namespace Vigil::Core {

    VigilBus::VigilBus(const VigilUtils::PipelineConfig& config,
                       PipelineTelemetry& telemetry,
                       const SampleRing& ring,
                       Modules::AttestationArchive& archive,
                       std::shared_ptr<Modules::RetryingPoster> poster,
                       std::shared_ptr<const Modules::Prover> prover,
                       std::shared_ptr<const Crypto::Ed25519Signer> signer)
        : config(config), telemetry(telemetry), ring(ring), archive(archive),
          poster(std::move(poster)), prover(std::move(prover)), signer(std::move(signer)) {
        if (!this->poster || !this->signer) {
            throw ConfigError("VigilBus needs a poster and a signing key");
        }
    }

    void VigilBus::pushSample(const Sample& sample) {
        sample_bus.get_subscriber().on_next(sample);
    }

    void VigilBus::pushBatch(const Batch& batch, const Bitmap& bitmap) {
        batch_bus.get_subscriber().on_next(AttestationJob{batch, bitmap});
    }

    void VigilBus::taskStarted() {
        inflight++;
        telemetry.task_started();
    }

    void VigilBus::taskFinished() {
        telemetry.task_finished();
        {
            std::lock_guard<std::mutex> guard(idleMutex);
            inflight--;
        }
        idle.notify_all();
    }

    void VigilBus::startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler) {
        auto worker = scheduler.getWorkerScheduler();

        // The counter goes up on the publishing thread, before the hop to the worker,
        // so awaitIdle() never misses a task that is queued but not yet running.
        sample_bus.get_observable()
            .subscribe(lifetime, [this, worker](Sample sample) {
                taskStarted();
                rxcpp::observable<>::just(sample)
                    .observe_on(rxcpp::observe_on_one_worker(worker))
                    .subscribe([this](Sample s) {
                        try {
                            processSample(s);
                        } catch (const std::exception& e) {
                            std::cerr << "[VigilBus] sample task failed: " << e.what() << std::endl;
                        }
                        taskFinished();
                    });
            });

        batch_bus.get_observable()
            .subscribe(lifetime, [this, worker](AttestationJob job) {
                taskStarted();
                rxcpp::observable<>::just(job)
                    .observe_on(rxcpp::observe_on_one_worker(worker))
                    .subscribe([this](AttestationJob j) {
                        try {
                            processBatch(j);
                        } catch (const std::exception& e) {
                            std::cerr << "[VigilBus] attestation task failed: " << e.what() << std::endl;
                        }
                        taskFinished();
                    });
            });

        std::cout << "[VigilBus] Sample and attestation buses active." << std::endl;
    }

    bool VigilBus::awaitIdle(std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(idleMutex);
        return idle.wait_for(lock, grace, [this] { return inflight.load() == 0; });
    }

    void VigilBus::cancelPending() {
        poster->cancel();
    }

    void VigilBus::processSample(const Sample& sample) {
        if (!archive.saveSamples(ring.snapshot())) {
            std::cerr << "[Archive] samples.json could not be written." << std::endl;
        }

        if (!config.postEverySample) return;

        try {
            LedgerEntry entry = poster->submit(config.ledgerNamespace,
                                               VigilUtils::buildSamplePayload(config.ledgerNamespace, sample));
            telemetry.record_post(true);
            if (VigilUtils::VERBOSE) {
                std::cout << "[Poster] sample @" << sample.timestamp << " -> height " << entry.height << std::endl;
            }
        } catch (const PostingError& e) {
            telemetry.record_post(false);
            std::cerr << "[Poster] sample @" << sample.timestamp << " not posted: " << e.what() << std::endl;
        }
    }

    std::optional<LedgerEntry> VigilBus::processBatch(const AttestationJob& job) {
        const Batch& batch = job.batch;
        auto key = std::make_tuple(batch.window.start, batch.window.end, Crypto::digestHex(batch.bitmapHash));
        {
            std::lock_guard<std::mutex> guard(postedMutex);
            if (!posted.insert(key).second) {
                std::cout << "[VigilBus] window " << batch.window.start << ".." << batch.window.end
                          << " already attested, skipping." << std::endl;
                return std::nullopt;
            }
            // Windows only move forward: keep as many as the ring could still rebuild
            while (posted.size() > config.ringCapacity) {
                posted.erase(posted.begin());
            }
        }

        std::optional<ProofArtifact> proof;
        std::string proofStatus = "disabled";
        if (prover) {
            try {
                proof = prover->prove(job.bitmap, batch.n, batch.threshold, batch.bitmapHash);
                proofStatus = "proved";
                telemetry.proofs_generated++;
                if (!archive.saveProof(*proof)) {
                    std::cerr << "[Archive] proof.json could not be written." << std::endl;
                }
            } catch (const ProofGenerationError& e) {
                proofStatus = "failed";
                telemetry.proofs_failed++;
                std::cerr << "[Prover] " << prover->scheme() << ": " << e.what() << std::endl;
            }
        }

        if (!archive.saveBatch(batch, job.bitmap)) {
            std::cerr << "[Archive] batch.json / bitmap.hex could not be written." << std::endl;
        }

        try {
            std::string payload = VigilUtils::buildAttestationPayload(config.ledgerNamespace, batch, proof,
                                                                      proofStatus, *signer);
            LedgerEntry entry = poster->submit(config.ledgerNamespace, payload);
            telemetry.record_post(true);
            std::cout << "[Poster] attestation " << batch.good << "/" << batch.n
                      << " (threshold " << batch.threshold << ", proof " << proofStatus << ")"
                      << " -> height " << entry.height << " commitment " << entry.commitment.substr(0, 16)
                      << std::endl;
            return entry;
        } catch (const VigilError& e) {
            // Posting gave up: the same job may be pushed again and will not be skipped
            {
                std::lock_guard<std::mutex> guard(postedMutex);
                posted.erase(key);
            }
            telemetry.record_post(false);
            std::cerr << "[Poster] attestation for window " << batch.window.start << ".." << batch.window.end
                      << " not posted: " << e.what() << std::endl;
            return std::nullopt;
        }
    }
}
