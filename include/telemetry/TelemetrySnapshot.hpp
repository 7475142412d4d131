#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

namespace Vigil::Core {

struct TelemetrySnapshot {
    // --- Sampler ---
    uint64_t samples_total;
    uint64_t samples_ok;
    uint64_t samples_failed;
    uint64_t ticks_aborted;      // buffer invariant violations

    // --- Batch Generator ---
    uint64_t batches_emitted;
    uint64_t batches_skipped;
    uint64_t gap_samples;        // evicted before they could be batched

    // --- Prover ---
    uint64_t proofs_generated;
    uint64_t proofs_failed;

    // --- Poster ---
    uint64_t posts_ok;
    uint64_t posts_failed;
    uint32_t inflight_tasks;
    uint32_t inflight_peak;

    // --- Ingestion ---
    uint64_t observations_accepted;
    uint64_t observations_rejected;

    PipelineState state;
    uint64_t uptime_ms;
};

}
