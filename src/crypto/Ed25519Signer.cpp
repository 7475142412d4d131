// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "crypto/Ed25519Signer.hpp"
#include "core/VigilErrors.hpp"
#include <openssl/evp.h>

namespace Vigil::Crypto {

    namespace {
        struct MdCtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        struct PkeyCtxDeleter {
            void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
        };
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
        using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

        constexpr size_t kSignatureSize = 64;
        constexpr size_t kKeySize = 32;
    }

    void Ed25519Signer::KeyDeleter::operator()(EVP_PKEY* k) const {
        EVP_PKEY_free(k);
    }

    Ed25519Signer::Ed25519Signer(EVP_PKEY* rawKey) : key(rawKey) {}

    Ed25519Signer Ed25519Signer::generate() {
        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
            throw Core::CryptoError("Ed25519 keygen init failed");
        }
        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr) {
            throw Core::CryptoError("Ed25519 keygen failed");
        }
        return Ed25519Signer(raw);
    }

    Ed25519Signer Ed25519Signer::fromSeed(const std::vector<uint8_t>& seed) {
        if (seed.size() != kKeySize) {
            throw Core::CryptoError("Ed25519 seed must be 32 bytes");
        }
        EVP_PKEY* raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
        if (raw == nullptr) {
            throw Core::CryptoError("Ed25519 private key import failed");
        }
        return Ed25519Signer(raw);
    }

    std::vector<uint8_t> Ed25519Signer::sign(std::string_view message) const {
        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
            throw Core::CryptoError("Ed25519 sign init failed");
        }
        std::vector<uint8_t> signature(kSignatureSize);
        size_t len = signature.size();
        if (EVP_DigestSign(ctx.get(), signature.data(), &len,
                           reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
            throw Core::CryptoError("Ed25519 sign failed");
        }
        signature.resize(len);
        return signature;
    }

    std::vector<uint8_t> Ed25519Signer::sign(const std::vector<uint8_t>& message) const {
        return sign(std::string_view(reinterpret_cast<const char*>(message.data()), message.size()));
    }

    std::vector<uint8_t> Ed25519Signer::publicKey() const {
        std::vector<uint8_t> out(kKeySize);
        size_t len = out.size();
        if (EVP_PKEY_get_raw_public_key(key.get(), out.data(), &len) != 1) {
            throw Core::CryptoError("Ed25519 public key export failed");
        }
        out.resize(len);
        return out;
    }

    bool verifyEd25519(const std::vector<uint8_t>& publicKey,
                       const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature) {
        if (publicKey.size() != kKeySize || signature.size() != kSignatureSize) {
            return false;
        }
        std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> pub(
            EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()),
            EVP_PKEY_free);
        if (!pub) return false;

        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pub.get()) != 1) {
            return false;
        }
        return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                message.data(), message.size()) == 1;
    }
}
