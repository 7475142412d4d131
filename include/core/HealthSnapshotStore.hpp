// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_HEALTH_SNAPSHOT_STORE_HPP
#define VIGIL_HEALTH_SNAPSHOT_STORE_HPP

#include <cstdint>
#include <mutex>
#include <optional>

namespace Vigil::Core {

    /**
     * @brief The last observed counters. Always read and written as one unit.
     */
    struct HealthSnapshot {
        std::optional<int64_t> head;
        std::optional<int64_t> sampledCount;
        std::optional<uint64_t> lastUpdate;  // unix seconds
    };

    /**
     * @brief Written by the ingestion adapter, read by the Sampler tick.
     * One mutex guards the whole field group, so a reader never sees a half-updated pair.
     */
    class HealthSnapshotStore {
    private:
        mutable std::mutex mutex;
        HealthSnapshot current;

    public:
        /**
         * @brief Overwrites the fields that are present and stamps last_update = at.
         * Throws IngestionError (store unchanged) if both values are missing, a value is
         * negative, or the observation is older than the stored one.
         */
        void recordObservation(std::optional<int64_t> head,
                               std::optional<int64_t> sampledCount,
                               uint64_t at);

        [[nodiscard]] HealthSnapshot read() const;
    };
}

#endif
