#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Vigil::Core {

struct PipelineTelemetry {
    // Sampler
    std::atomic<uint64_t> samples_total{0};
    std::atomic<uint64_t> samples_ok{0};
    std::atomic<uint64_t> samples_failed{0};
    std::atomic<uint64_t> ticks_aborted{0};

    // Batch Generator
    std::atomic<uint64_t> batches_emitted{0};
    std::atomic<uint64_t> batches_skipped{0};
    std::atomic<uint64_t> gap_samples{0};

    // Prover
    std::atomic<uint64_t> proofs_generated{0};
    std::atomic<uint64_t> proofs_failed{0};

    // Poster
    std::atomic<uint64_t> posts_ok{0};
    std::atomic<uint64_t> posts_failed{0};
    std::atomic<uint32_t> inflight_tasks{0};
    std::atomic<uint32_t> inflight_peak{0};

    // Ingestion
    std::atomic<uint64_t> observations_accepted{0};
    std::atomic<uint64_t> observations_rejected{0};

    std::atomic<PipelineState> state{PipelineState::STARTING};

    std::chrono::steady_clock::time_point started;

    PipelineTelemetry();

    void task_started();
    void task_finished();

    // A failure flips UP to DEGRADED, a success flips it back.
    void record_post(bool ok);

    [[nodiscard]] TelemetrySnapshot snapshot() const;
};

std::ostream& operator<<(std::ostream& os, const TelemetrySnapshot& snap);

}
