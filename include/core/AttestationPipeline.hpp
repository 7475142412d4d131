// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_ATTESTATION_PIPELINE_HPP
#define VIGIL_ATTESTATION_PIPELINE_HPP

#include <cstdint>
#include <memory>

#include "core/BatchGenerator.hpp"
#include "core/HealthSnapshotStore.hpp"
#include "core/SampleRing.hpp"
#include "core/Sampler.hpp"
#include "core/TickClock.hpp"
#include "core/VigilBus.hpp"
#include "telemetry/PipelineTelemetry.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Core {

    /**
     * @brief Store -> Sampler -> Ring -> Batch Generator, with the bus behind both ticks.
     * The tick methods never throw: a failed tick is logged and counted, the next one runs.
     */
    class AttestationPipeline {
    private:
        const VigilUtils::PipelineConfig& config;
        PipelineTelemetry& telemetry;
        TickClock clock;

        HealthSnapshotStore store;
        SampleRing ring;
        Sampler sampler;
        BatchGenerator batcher;
        VigilBus bus;

    public:
        AttestationPipeline(const VigilUtils::PipelineConfig& config,
                            PipelineTelemetry& telemetry,
                            Modules::AttestationArchive& archive,
                            std::shared_ptr<Modules::RetryingPoster> poster,
                            std::shared_ptr<const Modules::Prover> prover,
                            std::shared_ptr<const Crypto::Ed25519Signer> signer);

        // Sampler timer thread
        void samplerTick(uint64_t now);

        // Batch timer thread
        void batchTick();

        // Shared by the sampler timer and the observation probe
        const TickClock& getClock() const { return clock; }
        HealthSnapshotStore& getStore() { return store; }
        const SampleRing& getRing() const { return ring; }
        VigilBus& getBus() { return bus; }
        PipelineTelemetry& getTelemetry() { return telemetry; }
        const VigilUtils::PipelineConfig& getConfig() const { return config; }
    };
}

#endif
