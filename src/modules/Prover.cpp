// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "modules/Prover.hpp"
#include "core/BatchGenerator.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Ed25519Signer.hpp"
#include <algorithm>

namespace Vigil::Modules {

    namespace {
        const std::string kStatementDomain = "vigil/threshold-statement/v1";

        void appendU64(std::vector<uint8_t>& out, uint64_t v) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(v >> shift));
            }
        }
    }

    void Prover::checkStatement(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                const Core::Digest256& bitmapHash, const std::vector<uint8_t>& salt) {
        if (bitmap.size() != n) {
            throw Core::ProofGenerationError("bitmap length " + std::to_string(bitmap.size()) +
                                             " does not match n=" + std::to_string(n));
        }
        if (threshold > n) {
            throw Core::ProofGenerationError("threshold exceeds n");
        }
        if (std::any_of(bitmap.begin(), bitmap.end(), [](uint8_t b) { return b > 1; })) {
            throw Core::ProofGenerationError("bitmap contains bytes other than 00/01");
        }
        if (Core::BatchGenerator::hashBitmap(bitmap, salt) != bitmapHash) {
            throw Core::ProofGenerationError("bitmap does not hash to the committed bitmap_hash");
        }
        uint64_t good = static_cast<uint64_t>(std::count(bitmap.begin(), bitmap.end(), uint8_t{1}));
        if (good < threshold) {
            throw Core::ProofGenerationError("statement is false: good=" + std::to_string(good) +
                                             " < threshold=" + std::to_string(threshold));
        }
    }

    std::vector<uint8_t> Prover::statementBytes(const std::string& scheme, const Core::PublicInputs& inputs) {
        std::vector<uint8_t> out(kStatementDomain.begin(), kStatementDomain.end());
        out.push_back(0);
        out.insert(out.end(), scheme.begin(), scheme.end());
        out.push_back(0);
        appendU64(out, inputs.n);
        appendU64(out, inputs.threshold);
        out.insert(out.end(), inputs.bitmapHash.begin(), inputs.bitmapHash.end());
        return out;
    }

    // --- DigestProver ---

    DigestProver::DigestProver(std::vector<uint8_t> salt) : salt(std::move(salt)) {}

    Core::ProofArtifact DigestProver::prove(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                            const Core::Digest256& bitmapHash) const {
        checkStatement(bitmap, n, threshold, bitmapHash, salt);

        Core::ProofArtifact artifact;
        artifact.publicInputs = {n, threshold, bitmapHash};
        artifact.scheme = scheme();
        Core::Digest256 digest = Crypto::sha256(statementBytes(artifact.scheme, artifact.publicInputs));
        artifact.proofBytes.assign(digest.begin(), digest.end());
        return artifact;
    }

    bool DigestProver::verify(const Core::ProofArtifact& artifact) const {
        if (artifact.scheme != scheme() || artifact.publicInputs.threshold > artifact.publicInputs.n) {
            return false;
        }
        Core::Digest256 expected = Crypto::sha256(statementBytes(artifact.scheme, artifact.publicInputs));
        return artifact.proofBytes.size() == expected.size() &&
               std::equal(expected.begin(), expected.end(), artifact.proofBytes.begin());
    }

    // --- SignedProver ---

    SignedProver::SignedProver(std::shared_ptr<const Crypto::Ed25519Signer> signer, std::vector<uint8_t> salt)
        : signer(std::move(signer)), salt(std::move(salt)) {
        if (!this->signer) {
            throw Core::ConfigError("SignedProver needs a signing key");
        }
        publicKey = this->signer->publicKey();
    }

    SignedProver::SignedProver(std::vector<uint8_t> trustedPublicKey)
        : publicKey(std::move(trustedPublicKey)) {}

    Core::ProofArtifact SignedProver::prove(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                            const Core::Digest256& bitmapHash) const {
        if (!signer) {
            throw Core::ProofGenerationError("verification-only prover cannot prove");
        }
        checkStatement(bitmap, n, threshold, bitmapHash, salt);

        Core::ProofArtifact artifact;
        artifact.publicInputs = {n, threshold, bitmapHash};
        artifact.scheme = scheme();
        try {
            artifact.proofBytes = signer->sign(statementBytes(artifact.scheme, artifact.publicInputs));
        } catch (const Core::CryptoError& e) {
            throw Core::ProofGenerationError(std::string("signing the statement failed: ") + e.what());
        }
        return artifact;
    }

    bool SignedProver::verify(const Core::ProofArtifact& artifact) const {
        if (artifact.scheme != scheme() || artifact.publicInputs.threshold > artifact.publicInputs.n) {
            return false;
        }
        return Crypto::verifyEd25519(publicKey, statementBytes(artifact.scheme, artifact.publicInputs),
                                     artifact.proofBytes);
    }

    std::shared_ptr<const Prover> makeProver(const VigilUtils::PipelineConfig& config,
                                             std::shared_ptr<const Crypto::Ed25519Signer> signer) {
        if (!config.proofsEnabled) {
            return nullptr;
        }
        std::vector<uint8_t> salt(config.salt.begin(), config.salt.end());
        if (config.proverBackend == VigilUtils::ProverBackend::SIGNED) {
            return std::make_shared<SignedProver>(std::move(signer), std::move(salt));
        }
        return std::make_shared<DigestProver>(std::move(salt));
    }
}
