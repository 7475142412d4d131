// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "AttestationTypes.hpp"

namespace Vigil::Core {

    std::string SampleReason::toString() const {
        switch (code) {
            case ReasonCode::FIRST_SAMPLE:
                return "first_sample";
            case ReasonCode::ADVANCED:
                return "advanced(+" + std::to_string(detail) + ")";
            case ReasonCode::FRESH:
                return "fresh(" + std::to_string(detail) + "s)";
            case ReasonCode::STALE:
                return "stale";
            case ReasonCode::STUCK:
                return "stuck";
            case ReasonCode::HEADERS_NOT_ADVANCED:
                return "headers_not_advanced";
            case ReasonCode::NO_DATA:
                return "no_data";
        }
        return "unknown";
    }

} // namespace Vigil::Core
