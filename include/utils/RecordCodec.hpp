#ifndef VIGIL_RECORD_CODEC_HPP
#define VIGIL_RECORD_CODEC_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "AttestationTypes.hpp"

namespace Vigil::Crypto {
    class Ed25519Signer;
}

namespace VigilUtils {

    // Ledger payload tags
    extern const std::string SAMPLE_PAYLOAD_TYPE;       // "sample"
    extern const std::string ATTESTATION_PAYLOAD_TYPE;  // "batch_attestation"

    // {timestamp, head, sampled_count, ok, reason}; absent counters are null
    nlohmann::json sampleToJson(const Vigil::Core::Sample& sample);

    // {n, good, threshold, bitmap_hash, window:{start,end}}
    nlohmann::json batchToJson(const Vigil::Core::Batch& batch);

    // {public_inputs:{n, threshold, bitmap_hash}, scheme, proof}
    nlohmann::json proofToJson(const Vigil::Core::ProofArtifact& proof);

    /**
     * @brief Inverse decoders. Throw std::invalid_argument on missing fields or bad hex.
     */
    Vigil::Core::Batch batchFromJson(const nlohmann::json& j);
    Vigil::Core::ProofArtifact proofFromJson(const nlohmann::json& j);

    // 01 = ok, 00 = fail, window order
    std::string bitmapToHex(const Vigil::Core::Bitmap& bitmap);

    /**
     * @brief Canonical serialization of {batch, partial, proof_status} (sorted keys, no whitespace).
     * This exact string is what the attestation signature covers.
     */
    std::string canonicalBatchRecord(const Vigil::Core::Batch& batch, const std::string& proofStatus);

    std::string buildSamplePayload(const std::string& ns, const Vigil::Core::Sample& sample);

    /**
     * @brief Layer 2 payload. proofStatus is "proved", "failed" or "disabled".
     * Deterministic for a given batch, proof and key, so re-posting hits the same commitment.
     */
    std::string buildAttestationPayload(const std::string& ns,
                                        const Vigil::Core::Batch& batch,
                                        const std::optional<Vigil::Core::ProofArtifact>& proof,
                                        const std::string& proofStatus,
                                        const Vigil::Crypto::Ed25519Signer& signer);
}

#endif
