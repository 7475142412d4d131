// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Attestation Types: samples, windows, batches, proofs and ledger handles

#ifndef VIGIL_ATTESTATION_TYPES_HPP
#define VIGIL_ATTESTATION_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Vigil::Core {

    /**
     * @brief Why a tick produced its ok/fail bit.
     */
    enum class ReasonCode {
        FIRST_SAMPLE,          // First head reading, nothing to compare against
        ADVANCED,              // detail = head advancement
        FRESH,                 // detail = observation age in seconds
        STALE,
        STUCK,
        HEADERS_NOT_ADVANCED,  // head check passed, sampled_count did not move
        NO_DATA                // Fresh observation, but without a head value
    };

    struct SampleReason {
        ReasonCode code = ReasonCode::NO_DATA;
        int64_t detail = 0;

        // "advanced(+2)", "fresh(1s)", "stale", "stuck", ...
        [[nodiscard]] std::string toString() const;
    };

    /**
     * @brief One liveness evaluation at one tick. Never mutated after the Sampler emits it.
     */
    struct Sample {
        uint64_t timestamp = 0;
        std::optional<int64_t> head;
        std::optional<int64_t> sampledCount;
        bool ok = false;
        SampleReason reason;
    };

    struct Window {
        uint64_t start = 0;
        uint64_t end = 0;
    };

    using Digest256 = std::array<uint8_t, 32>;

    // One byte per sample in window order: 1 = ok, 0 = fail.
    using Bitmap = std::vector<uint8_t>;

    /**
     * @brief Statistical digest of one window of samples.
     */
    struct Batch {
        uint64_t n = 0;
        uint64_t good = 0;
        uint64_t threshold = 0;
        Digest256 bitmapHash{};
        Window window;

        // Emitted with fewer than k samples (partial window policy "emit").
        bool partial = false;

        [[nodiscard]] bool meetsThreshold() const { return good >= threshold; }
    };

    struct PublicInputs {
        uint64_t n = 0;
        uint64_t threshold = 0;
        Digest256 bitmapHash{};
    };

    /**
     * @brief Binds a Batch to the statement "sum(bitmap) >= threshold".
     * The scheme names the prover backend that produced the proof bytes.
     */
    struct ProofArtifact {
        PublicInputs publicInputs;
        std::string scheme;
        std::vector<uint8_t> proofBytes;
    };

    /**
     * @brief Handle returned by the ledger after an append. Immutable once returned.
     */
    struct LedgerEntry {
        std::string commitment;
        uint64_t height = 0;
        std::string ns;
        uint64_t submittedAt = 0;
    };

} // namespace Vigil::Core

#endif // VIGIL_ATTESTATION_TYPES_HPP
