// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_PROVER_HPP
#define VIGIL_PROVER_HPP

#include <memory>
#include <string>
#include <vector>

#include "AttestationTypes.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Crypto {
    class Ed25519Signer;
}

namespace Vigil::Modules {

    /**
     * @brief Proves "sum(bitmap) >= threshold" for a bitmap committed as bitmap_hash.
     * prove() may take seconds and runs on the bus worker scheduler, never on a timer.
     */
    class Prover {
    public:
        virtual ~Prover() = default;

        [[nodiscard]] virtual std::string scheme() const = 0;

        /**
         * @brief Throws ProofGenerationError if good < threshold, n != bitmap length,
         * or SHA-256(bitmap || salt) != bitmap_hash.
         */
        virtual Core::ProofArtifact prove(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                          const Core::Digest256& bitmapHash) const = 0;

        // Pure. False on any tampering of public inputs, scheme or proof bytes.
        virtual bool verify(const Core::ProofArtifact& artifact) const = 0;

    protected:
        // Shared precondition check of both backends
        static void checkStatement(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                   const Core::Digest256& bitmapHash, const std::vector<uint8_t>& salt);

        // Domain-separated encoding of the scheme and public inputs
        static std::vector<uint8_t> statementBytes(const std::string& scheme, const Core::PublicInputs& inputs);
    };

    /**
     * @brief Mock backend: proof = SHA-256 over the statement bytes. Detects tampering,
     * but anyone holding the public inputs can produce it.
     */
    class DigestProver final : public Prover {
    private:
        std::vector<uint8_t> salt;

    public:
        explicit DigestProver(std::vector<uint8_t> salt);

        std::string scheme() const override { return "digest-v1"; }
        Core::ProofArtifact prove(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                  const Core::Digest256& bitmapHash) const override;
        bool verify(const Core::ProofArtifact& artifact) const override;
    };

    /**
     * @brief Proof = Ed25519 signature of the prover key over the statement bytes.
     * Verification needs only the public key; a prover instance built from a public
     * key alone can verify but not prove.
     */
    class SignedProver final : public Prover {
    private:
        std::shared_ptr<const Crypto::Ed25519Signer> signer;
        std::vector<uint8_t> publicKey;
        std::vector<uint8_t> salt;

    public:
        SignedProver(std::shared_ptr<const Crypto::Ed25519Signer> signer, std::vector<uint8_t> salt);

        // Verification-only instance
        explicit SignedProver(std::vector<uint8_t> trustedPublicKey);

        std::string scheme() const override { return "ed25519-statement-v1"; }
        Core::ProofArtifact prove(const Core::Bitmap& bitmap, uint64_t n, uint64_t threshold,
                                  const Core::Digest256& bitmapHash) const override;
        bool verify(const Core::ProofArtifact& artifact) const override;
    };

    /**
     * @brief nullptr when proofs are disabled.
     */
    std::shared_ptr<const Prover> makeProver(const VigilUtils::PipelineConfig& config,
                                             std::shared_ptr<const Crypto::Ed25519Signer> signer);
}

#endif
