// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "crypto/Digest.hpp"
#include "core/VigilErrors.hpp"
#include "utils/StringUtils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace Vigil::Crypto {

    void Sha256::CtxDeleter::operator()(EVP_MD_CTX* c) const {
        EVP_MD_CTX_free(c);
    }

    Sha256::Sha256() : ctx(EVP_MD_CTX_new()) {
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw Core::CryptoError("SHA-256 init failed");
        }
    }

    Sha256& Sha256::update(const uint8_t* data, size_t len) {
        if (len > 0 && EVP_DigestUpdate(ctx.get(), data, len) != 1) {
            throw Core::CryptoError("SHA-256 update failed");
        }
        return *this;
    }

    Sha256& Sha256::update(const std::vector<uint8_t>& bytes) {
        return update(bytes.data(), bytes.size());
    }

    Sha256& Sha256::update(std::string_view text) {
        return update(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    Core::Digest256 Sha256::finish() {
        Core::Digest256 out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
            throw Core::CryptoError("SHA-256 final failed");
        }
        return out;
    }

    Core::Digest256 sha256(const std::vector<uint8_t>& bytes) {
        return Sha256().update(bytes).finish();
    }

    Core::Digest256 sha256(std::string_view text) {
        return Sha256().update(text).finish();
    }

    std::string digestHex(const Core::Digest256& digest) {
        return VigilUtils::toHex(digest.data(), digest.size());
    }

    Core::Digest256 digestFromHex(const std::string& hex) {
        std::vector<uint8_t> bytes = VigilUtils::fromHex(hex);
        if (bytes.size() != 32) {
            throw std::invalid_argument("digest must be 32 bytes");
        }
        Core::Digest256 out{};
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    std::string base64Encode(const std::vector<uint8_t>& bytes) {
        std::string out(4 * ((bytes.size() + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                      static_cast<int>(bytes.size()));
        out.resize(static_cast<size_t>(written));
        return out;
    }
}
