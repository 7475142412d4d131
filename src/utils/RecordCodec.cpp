#include "utils/RecordCodec.hpp"
#include "utils/StringUtils.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Ed25519Signer.hpp"
#include <stdexcept>

using nlohmann::json;
using namespace Vigil::Core;

namespace VigilUtils {

    const std::string SAMPLE_PAYLOAD_TYPE = "sample";
    const std::string ATTESTATION_PAYLOAD_TYPE = "batch_attestation";

    namespace {
        json optionalToJson(const std::optional<int64_t>& v) {
            return v ? json(*v) : json(nullptr);
        }

        const json& require(const json& j, const char* key) {
            if (!j.is_object() || !j.contains(key)) {
                throw std::invalid_argument(std::string("missing field: ") + key);
            }
            return j.at(key);
        }

        uint64_t requireUnsigned(const json& j, const char* key) {
            const json& v = require(j, key);
            if (!v.is_number_unsigned()) {
                throw std::invalid_argument(std::string("field is not an unsigned integer: ") + key);
            }
            return v.get<uint64_t>();
        }

        std::string requireString(const json& j, const char* key) {
            const json& v = require(j, key);
            if (!v.is_string()) {
                throw std::invalid_argument(std::string("field is not a string: ") + key);
            }
            return v.get<std::string>();
        }
    }

    json sampleToJson(const Sample& sample) {
        return json{
            {"timestamp", sample.timestamp},
            {"head", optionalToJson(sample.head)},
            {"sampled_count", optionalToJson(sample.sampledCount)},
            {"ok", sample.ok},
            {"reason", sample.reason.toString()}
        };
    }

    json batchToJson(const Batch& batch) {
        return json{
            {"n", batch.n},
            {"good", batch.good},
            {"threshold", batch.threshold},
            {"bitmap_hash", Vigil::Crypto::digestHex(batch.bitmapHash)},
            {"window", json{{"start", batch.window.start}, {"end", batch.window.end}}}
        };
    }

    json proofToJson(const ProofArtifact& proof) {
        return json{
            {"public_inputs", json{
                {"n", proof.publicInputs.n},
                {"threshold", proof.publicInputs.threshold},
                {"bitmap_hash", Vigil::Crypto::digestHex(proof.publicInputs.bitmapHash)}
            }},
            {"scheme", proof.scheme},
            {"proof", toHex(proof.proofBytes)}
        };
    }

    Batch batchFromJson(const json& j) {
        Batch batch;
        batch.n = requireUnsigned(j, "n");
        batch.good = requireUnsigned(j, "good");
        batch.threshold = requireUnsigned(j, "threshold");
        batch.bitmapHash = Vigil::Crypto::digestFromHex(requireString(j, "bitmap_hash"));
        const json& window = require(j, "window");
        batch.window.start = requireUnsigned(window, "start");
        batch.window.end = requireUnsigned(window, "end");
        if (batch.good > batch.n) {
            throw std::invalid_argument("good exceeds n");
        }
        return batch;
    }

    ProofArtifact proofFromJson(const json& j) {
        ProofArtifact proof;
        const json& inputs = require(j, "public_inputs");
        proof.publicInputs.n = requireUnsigned(inputs, "n");
        proof.publicInputs.threshold = requireUnsigned(inputs, "threshold");
        proof.publicInputs.bitmapHash = Vigil::Crypto::digestFromHex(requireString(inputs, "bitmap_hash"));
        proof.scheme = requireString(j, "scheme");
        proof.proofBytes = fromHex(requireString(j, "proof"));
        return proof;
    }

    std::string bitmapToHex(const Bitmap& bitmap) {
        return toHex(bitmap);
    }

    std::string canonicalBatchRecord(const Batch& batch, const std::string& proofStatus) {
        json record{
            {"batch", batchToJson(batch)},
            {"partial", batch.partial},
            {"proof_status", proofStatus}
        };
        return record.dump();
    }

    std::string buildSamplePayload(const std::string& ns, const Sample& sample) {
        json payload{
            {"type", SAMPLE_PAYLOAD_TYPE},
            {"namespace", ns},
            {"sample", sampleToJson(sample)}
        };
        return payload.dump();
    }

    std::string buildAttestationPayload(const std::string& ns,
                                        const Batch& batch,
                                        const std::optional<ProofArtifact>& proof,
                                        const std::string& proofStatus,
                                        const Vigil::Crypto::Ed25519Signer& signer) {
        std::string record = canonicalBatchRecord(batch, proofStatus);
        json payload{
            {"type", ATTESTATION_PAYLOAD_TYPE},
            {"namespace", ns},
            {"batch", batchToJson(batch)},
            {"partial", batch.partial},
            {"proof_status", proofStatus},
            {"proof", proof ? proofToJson(*proof) : json(nullptr)},
            {"signature", json{
                {"algorithm", "ed25519"},
                {"public_key", toHex(signer.publicKey())},
                {"value", toHex(signer.sign(record))}
            }}
        };
        return payload.dump();
    }
}
