// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/SampleRing.hpp"
#include "core/VigilErrors.hpp"
#include <string>

namespace Vigil::Core {

    SampleRing::SampleRing(size_t capacity) : buffer(capacity) {
        if (capacity == 0) {
            throw BufferInvariantViolation("ring capacity must be positive");
        }
    }

    void SampleRing::append(const Sample& sample) {
        std::lock_guard<std::mutex> guard(lock);

        if (count > 0) {
            const Sample& newest = buffer[(head + count - 1) % buffer.size()];
            if (sample.timestamp < newest.timestamp) {
                throw BufferInvariantViolation("timestamp regression: " + std::to_string(sample.timestamp) +
                                               " after " + std::to_string(newest.timestamp));
            }
        }

        if (count < buffer.size()) {
            buffer[(head + count) % buffer.size()] = sample;
            count++;
        } else {
            buffer[head] = sample;
            head = (head + 1) % buffer.size();
        }
        appended++;
    }

    RingSnapshot SampleRing::snapshot() const {
        std::lock_guard<std::mutex> guard(lock);

        RingSnapshot snap;
        snap.firstSequence = appended - count + 1;
        snap.samples.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            snap.samples.push_back(buffer[(head + i) % buffer.size()]);
        }
        return snap;
    }

    size_t SampleRing::size() const {
        std::lock_guard<std::mutex> guard(lock);
        return count;
    }

    uint64_t SampleRing::totalAppended() const {
        std::lock_guard<std::mutex> guard(lock);
        return appended;
    }
}
