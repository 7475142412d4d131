// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "telemetry/PipelineTelemetry.hpp"
#include <ostream>

namespace Vigil::Core {

PipelineTelemetry::PipelineTelemetry()
    : started(std::chrono::steady_clock::now())
{
}

void PipelineTelemetry::task_started() {
    uint32_t now = ++inflight_tasks;
    uint32_t peak = inflight_peak.load();
    while (now > peak && !inflight_peak.compare_exchange_weak(peak, now)) {
    }
}

void PipelineTelemetry::task_finished() {
    inflight_tasks--;
}

void PipelineTelemetry::record_post(bool ok) {
    if (ok) {
        posts_ok++;
        PipelineState expected = PipelineState::DEGRADED;
        state.compare_exchange_strong(expected, PipelineState::UP);
    } else {
        posts_failed++;
        PipelineState expected = PipelineState::UP;
        state.compare_exchange_strong(expected, PipelineState::DEGRADED);
    }
}

TelemetrySnapshot PipelineTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.samples_total  = samples_total.load();
    snap.samples_ok     = samples_ok.load();
    snap.samples_failed = samples_failed.load();
    snap.ticks_aborted  = ticks_aborted.load();

    snap.batches_emitted = batches_emitted.load();
    snap.batches_skipped = batches_skipped.load();
    snap.gap_samples     = gap_samples.load();

    snap.proofs_generated = proofs_generated.load();
    snap.proofs_failed    = proofs_failed.load();

    snap.posts_ok       = posts_ok.load();
    snap.posts_failed   = posts_failed.load();
    snap.inflight_tasks = inflight_tasks.load();
    snap.inflight_peak  = inflight_peak.load();

    snap.observations_accepted = observations_accepted.load();
    snap.observations_rejected = observations_rejected.load();

    snap.state = state.load();

    snap.uptime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        ).count();

    return snap;
}

namespace {
    const char* stateName(PipelineState s) {
        switch (s) {
            case PipelineState::STARTING: return "STARTING";
            case PipelineState::UP:       return "UP";
            case PipelineState::DEGRADED: return "DEGRADED";
            case PipelineState::STOPPED:  return "STOPPED";
        }
        return "?";
    }
}

std::ostream& operator<<(std::ostream& os, const TelemetrySnapshot& snap) {
    os << "state=" << stateName(snap.state)
       << " samples=" << snap.samples_total << " (ok " << snap.samples_ok
       << ", failed " << snap.samples_failed << ", aborted " << snap.ticks_aborted << ")"
       << " batches=" << snap.batches_emitted << " (skipped " << snap.batches_skipped
       << ", gap samples " << snap.gap_samples << ")"
       << " proofs=" << snap.proofs_generated << " (failed " << snap.proofs_failed << ")"
       << " posts=" << snap.posts_ok << " (failed " << snap.posts_failed << ", peak inflight "
       << snap.inflight_peak << ")"
       << " observations=" << snap.observations_accepted << " (rejected "
       << snap.observations_rejected << ")";
    return os;
}

}
