// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_BUS_HPP
#define VIGIL_BUS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include "rxcpp/rx.hpp"

#include "AttestationTypes.hpp"
#include "core/SampleRing.hpp"
#include "telemetry/PipelineTelemetry.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Crypto {
    class Ed25519Signer;
}

namespace Vigil::Modules {
    class AttestationArchive;
    class Prover;
    class RetryingPoster;
}

namespace Vigil::Core {

    class Scheduler;

    /**
     * @brief One emitted batch together with the bitmap it commits to.
     */
    struct AttestationJob {
        Batch batch;
        Bitmap bitmap;
    };

    /**
     * @brief Dual bus between the timers and the slow work.
     * The sample bus carries Layer 1 (archive + per-sample post), the batch bus carries
     * Layer 2 (prove, archive, sign, post). Every item becomes an independent task on the
     * worker scheduler, so a slow prover or ledger never delays the next tick.
     */
    class VigilBus {
    private:
        // --- The Twin Buses ---
        rxcpp::subjects::subject<Sample> sample_bus;
        rxcpp::subjects::subject<AttestationJob> batch_bus;

        const VigilUtils::PipelineConfig& config;
        PipelineTelemetry& telemetry;
        const SampleRing& ring;

        Modules::AttestationArchive& archive;
        std::shared_ptr<Modules::RetryingPoster> poster;
        std::shared_ptr<const Modules::Prover> prover;       // nullptr: proofs disabled
        std::shared_ptr<const Crypto::Ed25519Signer> signer;

        // (window.start, window.end, bitmap_hash) posted in this run, newest ring_capacity only
        std::mutex postedMutex;
        std::set<std::tuple<uint64_t, uint64_t, std::string>> posted;

        // --- In-flight tracking for bounded shutdown ---
        std::mutex idleMutex;
        std::condition_variable idle;
        std::atomic<uint32_t> inflight{0};

        void taskStarted();
        void taskFinished();

    public:
        VigilBus(const VigilUtils::PipelineConfig& config,
                 PipelineTelemetry& telemetry,
                 const SampleRing& ring,
                 Modules::AttestationArchive& archive,
                 std::shared_ptr<Modules::RetryingPoster> poster,
                 std::shared_ptr<const Modules::Prover> prover,
                 std::shared_ptr<const Crypto::Ed25519Signer> signer);

        // --- Public API (Publishing) ---
        void pushSample(const Sample& sample);
        void pushBatch(const Batch& batch, const Bitmap& bitmap);

        // --- Lifecycle Management ---
        void startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler);

        /**
         * @brief Blocks until no task is in flight or the grace period ends.
         * Returns false on timeout.
         */
        bool awaitIdle(std::chrono::milliseconds grace);

        // Interrupts posting backoffs so waiting tasks finish early
        void cancelPending();

        [[nodiscard]] uint32_t inflightTasks() const { return inflight.load(); }

        // --- Task bodies (run on the worker scheduler) ---
        void processSample(const Sample& sample);

        /**
         * @brief Returns the ledger entry, or nothing when the batch was a duplicate
         * or posting failed for good.
         */
        std::optional<LedgerEntry> processBatch(const AttestationJob& job);
    };
}

#endif
