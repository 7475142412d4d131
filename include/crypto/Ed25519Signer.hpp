// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_ED25519_SIGNER_HPP
#define VIGIL_ED25519_SIGNER_HPP

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace Vigil::Crypto {

    /**
     * @brief Ed25519 attestation key. Signing is deterministic, so a re-posted
     * attestation keeps the same content commitment.
     */
    class Ed25519Signer {
    private:
        struct KeyDeleter {
            void operator()(EVP_PKEY* key) const;
        };
        std::unique_ptr<EVP_PKEY, KeyDeleter> key;

        explicit Ed25519Signer(EVP_PKEY* rawKey);

    public:
        // Fresh random key for this run
        static Ed25519Signer generate();

        // 32-byte private seed
        static Ed25519Signer fromSeed(const std::vector<uint8_t>& seed);

        [[nodiscard]] std::vector<uint8_t> sign(std::string_view message) const;
        [[nodiscard]] std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

        [[nodiscard]] std::vector<uint8_t> publicKey() const;
    };

    /**
     * @brief False on any malformed key or signature, never throws.
     */
    bool verifyEd25519(const std::vector<uint8_t>& publicKey,
                       const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature);
}

#endif
