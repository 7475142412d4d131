// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline - ObservationProbe (health counter ingress)

#ifndef VIGIL_OBSERVATION_PROBE_HPP
#define VIGIL_OBSERVATION_PROBE_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include "core/HealthSnapshotStore.hpp"
#include "core/TickClock.hpp"
#include "telemetry/PipelineTelemetry.hpp"

namespace Vigil::Core {

    struct Observation {
        std::optional<int64_t> head;
        std::optional<int64_t> sampledCount;
    };

    /**
     * @brief TCP listener, one JSON object per connection: {"head": int, "sampled_count": int}.
     * Either key may be missing or null. A bare JSON body and an HTTP POST are both accepted;
     * HTTP clients get 204 on success and 400 on a rejected observation.
     */
    class ObservationProbe {
    private:
        HealthSnapshotStore& store;
        PipelineTelemetry& telemetry;
        const TickClock& clock;
        int serverFd;
        int port;
        std::atomic<bool> keepRunning;
        std::thread workerThread;

        void listenLoop();
        void handleClient(int clientFd);

    public:
        ObservationProbe(HealthSnapshotStore& store, PipelineTelemetry& telemetry,
                         const TickClock& clock, int listenPort);
        ~ObservationProbe();

        // False if the port cannot be bound
        bool start();
        void stop();

        /**
         * @brief Extracts the counters from a raw request. Throws IngestionError on
         * malformed JSON or non-integer values.
         */
        static Observation decode(const std::string& request);

        /**
         * @brief decode + recordObservation at `at`. Rejections are logged and counted.
         */
        bool ingest(const std::string& request, uint64_t at);
    };
}

#endif
