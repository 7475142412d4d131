// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Consumer side: verifies ledger attestations and counts each window once

#ifndef VIGIL_ATTESTATION_INDEX_HPP
#define VIGIL_ATTESTATION_INDEX_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "modules/Prover.hpp"

namespace Vigil::Modules {

    enum class Admission { ACCEPTED, DUPLICATE, REJECTED };

    struct IndexTotals {
        uint64_t windows = 0;
        uint64_t samples = 0;
        uint64_t good = 0;
        uint64_t compliantWindows = 0;   // good >= threshold
    };

    /**
     * @brief Checks the Ed25519 signature over the canonical batch record and, when a
     * verifier is configured, the attached proof. Admitted batches are keyed by
     * (window.start, window.end, bitmap_hash): a re-posted batch is a DUPLICATE and
     * is not counted twice.
     */
    class AttestationIndex {
    private:
        std::vector<uint8_t> trustedKey;             // empty: accept the embedded key
        std::shared_ptr<const Prover> verifier;      // nullptr: proofs are not checked

        mutable std::mutex mutex;
        std::set<std::tuple<uint64_t, uint64_t, std::string>> seen;
        IndexTotals running;

    public:
        explicit AttestationIndex(std::vector<uint8_t> trustedPublicKey,
                                  std::shared_ptr<const Prover> verifier = nullptr);

        // reason (optional) receives the rejection cause
        Admission admit(const std::string& payload, std::string* reason = nullptr);

        [[nodiscard]] IndexTotals totals() const;
    };

    std::string toString(Admission admission);
}

#endif
