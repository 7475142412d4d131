// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "modules/AttestationIndex.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Ed25519Signer.hpp"
#include "utils/RecordCodec.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace Vigil::Modules {

    namespace {
        Admission reject(std::string* reason, const std::string& why) {
            if (reason) *reason = why;
            if (VigilUtils::VERBOSE) {
                std::cout << "[AttestationIndex] rejected: " << why << std::endl;
            }
            return Admission::REJECTED;
        }

        bool sameInputs(const Core::PublicInputs& inputs, const Core::Batch& batch) {
            return inputs.n == batch.n && inputs.threshold == batch.threshold && inputs.bitmapHash == batch.bitmapHash;
        }
    }

    AttestationIndex::AttestationIndex(std::vector<uint8_t> trustedPublicKey, std::shared_ptr<const Prover> verifier)
        : trustedKey(std::move(trustedPublicKey)), verifier(std::move(verifier)) {}

    Admission AttestationIndex::admit(const std::string& payload, std::string* reason) {
        json doc = json::parse(payload, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return reject(reason, "payload is not a JSON object");
        }
        if (doc.value("type", std::string()) != VigilUtils::ATTESTATION_PAYLOAD_TYPE) {
            return reject(reason, "not a batch attestation");
        }

        Core::Batch batch;
        std::string proofStatus;
        std::vector<uint8_t> publicKey;
        std::vector<uint8_t> signature;
        try {
            batch = VigilUtils::batchFromJson(doc.at("batch"));
            batch.partial = doc.at("partial").get<bool>();
            proofStatus = doc.at("proof_status").get<std::string>();
            const json& sig = doc.at("signature");
            if (sig.at("algorithm").get<std::string>() != "ed25519") {
                return reject(reason, "unsupported signature algorithm");
            }
            publicKey = VigilUtils::fromHex(sig.at("public_key").get<std::string>());
            signature = VigilUtils::fromHex(sig.at("value").get<std::string>());
        } catch (const std::invalid_argument& e) {
            return reject(reason, std::string("malformed record: ") + e.what());
        } catch (const json::exception& e) {
            return reject(reason, std::string("malformed record: ") + e.what());
        }

        if (!trustedKey.empty() && publicKey != trustedKey) {
            return reject(reason, "signed by an untrusted key");
        }

        std::string record = VigilUtils::canonicalBatchRecord(batch, proofStatus);
        if (!Crypto::verifyEd25519(publicKey, std::vector<uint8_t>(record.begin(), record.end()), signature)) {
            return reject(reason, "signature does not match the batch record");
        }

        if (proofStatus == "proved") {
            if (!doc.contains("proof") || doc["proof"].is_null()) {
                return reject(reason, "proof_status is proved but no proof is attached");
            }
            Core::ProofArtifact proof;
            try {
                proof = VigilUtils::proofFromJson(doc["proof"]);
            } catch (const std::invalid_argument& e) {
                return reject(reason, std::string("malformed proof: ") + e.what());
            }
            if (!sameInputs(proof.publicInputs, batch)) {
                return reject(reason, "proof public inputs differ from the batch");
            }
            if (verifier && (proof.scheme != verifier->scheme() || !verifier->verify(proof))) {
                return reject(reason, "proof does not verify");
            }
        } else if (proofStatus != "failed" && proofStatus != "disabled") {
            return reject(reason, "unknown proof_status '" + proofStatus + "'");
        }

        std::lock_guard<std::mutex> guard(mutex);
        auto key = std::make_tuple(batch.window.start, batch.window.end, Crypto::digestHex(batch.bitmapHash));
        if (!seen.insert(key).second) {
            return Admission::DUPLICATE;
        }

        running.windows++;
        running.samples += batch.n;
        running.good += batch.good;
        if (batch.meetsThreshold()) running.compliantWindows++;
        return Admission::ACCEPTED;
    }

    IndexTotals AttestationIndex::totals() const {
        std::lock_guard<std::mutex> guard(mutex);
        return running;
    }

    std::string toString(Admission admission) {
        switch (admission) {
            case Admission::ACCEPTED: return "accepted";
            case Admission::DUPLICATE: return "duplicate";
            case Admission::REJECTED: return "rejected";
        }
        return "unknown";
    }
}
