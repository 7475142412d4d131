// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/HealthSnapshotStore.hpp"
#include "core/VigilErrors.hpp"
#include <string>

namespace Vigil::Core {

    void HealthSnapshotStore::recordObservation(std::optional<int64_t> head,
                                                std::optional<int64_t> sampledCount,
                                                uint64_t at) {
        if (!head && !sampledCount) {
            throw IngestionError("observation carries neither head nor sampled_count");
        }
        if ((head && *head < 0) || (sampledCount && *sampledCount < 0)) {
            throw IngestionError("observation carries a negative counter");
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (current.lastUpdate && at < *current.lastUpdate) {
            throw IngestionError("observation at " + std::to_string(at) +
                                 " is older than the snapshot (" + std::to_string(*current.lastUpdate) + ")");
        }
        if (head) current.head = head;
        if (sampledCount) current.sampledCount = sampledCount;
        current.lastUpdate = at;
    }

    HealthSnapshot HealthSnapshotStore::read() const {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }
}
