// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_DIGEST_HPP
#define VIGIL_DIGEST_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "AttestationTypes.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace Vigil::Crypto {

    /**
     * @brief Incremental SHA-256 (OpenSSL EVP). Throws CryptoError if libcrypto fails.
     */
    class Sha256 {
    private:
        struct CtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const;
        };
        std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx;

    public:
        Sha256();

        Sha256& update(const uint8_t* data, size_t len);
        Sha256& update(const std::vector<uint8_t>& bytes);
        Sha256& update(std::string_view text);

        [[nodiscard]] Core::Digest256 finish();
    };

    Core::Digest256 sha256(const std::vector<uint8_t>& bytes);
    Core::Digest256 sha256(std::string_view text);

    std::string digestHex(const Core::Digest256& digest);

    /**
     * @brief Parses 64 hex characters. Throws std::invalid_argument otherwise.
     */
    Core::Digest256 digestFromHex(const std::string& hex);

    std::string base64Encode(const std::vector<uint8_t>& bytes);
}

#endif
