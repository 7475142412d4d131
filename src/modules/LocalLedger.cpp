// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "modules/LedgerPoster.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace Vigil::Modules {

    namespace {
        std::string directoryFor(const std::string& ns) {
            bool plain = !ns.empty();
            for (unsigned char c : ns) {
                if (!std::isalnum(c) && c != '-' && c != '_') {
                    plain = false;
                    break;
                }
            }
            if (plain) return ns;
            return "ns-" + VigilUtils::toHex(reinterpret_cast<const uint8_t*>(ns.data()), ns.size());
        }

        std::string blobFileName(uint64_t height, const std::string& commitment) {
            char prefix[32];
            std::snprintf(prefix, sizeof(prefix), "%010llu", static_cast<unsigned long long>(height));
            return std::string(prefix) + "-" + commitment + ".json";
        }

        uint64_t unixNow() {
            return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        }
    }

    std::string contentCommitment(const std::string& ns, const std::string& payload) {
        Core::Digest256 digest = Crypto::Sha256()
            .update(ns)
            .update(std::string_view("\0", 1))
            .update(payload)
            .finish();
        return Crypto::digestHex(digest);
    }

    LocalLedger::LocalLedger(fs::path root) : root(std::move(root)) {
        if (!VigilUtils::ensureSecureDirectory(this->root.string())) {
            throw Core::PostingError("cannot create local ledger directory " + this->root.string());
        }
        loadExisting();
    }

    void LocalLedger::loadExisting() {
        std::error_code ec;
        size_t loaded = 0;
        for (const auto& nsDir : fs::directory_iterator(root, ec)) {
            if (!nsDir.is_directory()) continue;

            for (const auto& file : fs::directory_iterator(nsDir.path(), ec)) {
                const std::string fileName = file.path().filename().string();
                if (file.path().extension() != ".json" || fileName.find(".tmp.") != std::string::npos) {
                    continue;
                }

                std::string content;
                if (!VigilUtils::readFile(file.path().string(), content)) continue;

                nlohmann::json doc = nlohmann::json::parse(content, nullptr, false);
                if (doc.is_discarded() || !doc.is_object()) {
                    std::cerr << "[LocalLedger] Skipping unreadable blob " << file.path() << std::endl;
                    continue;
                }

                try {
                    StoredBlob blob;
                    blob.entry.commitment = doc.at("commitment").get<std::string>();
                    blob.entry.height = doc.at("height").get<uint64_t>();
                    blob.entry.ns = doc.at("namespace").get<std::string>();
                    blob.entry.submittedAt = doc.at("submitted_at").get<uint64_t>();
                    blob.payload = doc.at("payload").get<std::string>();

                    auto& index = namespaces[blob.entry.ns];
                    index.byHeight[blob.entry.height] = blob.entry.commitment;
                    index.byCommitment[blob.entry.commitment] = std::move(blob);
                    loaded++;
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[LocalLedger] Skipping malformed blob " << file.path() << ": " << e.what() << std::endl;
                }
            }
        }
        if (loaded > 0) {
            std::cout << "[LocalLedger] Restored " << loaded << " blobs from " << root << std::endl;
        }
    }

    Core::LedgerEntry LocalLedger::submit(const std::string& ns, const std::string& payload) {
        std::string commitment = contentCommitment(ns, payload);

        std::lock_guard<std::mutex> lock(mutex);
        auto& index = namespaces[ns];

        auto existing = index.byCommitment.find(commitment);
        if (existing != index.byCommitment.end()) {
            return existing->second.entry;
        }

        StoredBlob blob;
        blob.entry.commitment = commitment;
        blob.entry.height = index.byHeight.empty() ? 1 : index.byHeight.rbegin()->first + 1;
        blob.entry.ns = ns;
        blob.entry.submittedAt = unixNow();
        blob.payload = payload;

        fs::path dir = root / directoryFor(ns);
        if (!VigilUtils::ensureSecureDirectory(dir.string())) {
            throw Core::PostingError("cannot create namespace directory " + dir.string());
        }

        nlohmann::json doc{
            {"commitment", blob.entry.commitment},
            {"height", blob.entry.height},
            {"namespace", ns},
            {"submitted_at", blob.entry.submittedAt},
            {"payload", payload}
        };
        if (!VigilUtils::writeFileAtomic((dir / blobFileName(blob.entry.height, commitment)).string(), doc.dump(2))) {
            throw Core::PostingError("local ledger write failed for " + commitment);
        }

        index.byHeight[blob.entry.height] = commitment;
        Core::LedgerEntry entry = blob.entry;
        index.byCommitment.emplace(commitment, std::move(blob));
        return entry;
    }

    std::optional<StoredBlob> LocalLedger::fetchByCommitment(const std::string& ns, const std::string& commitment) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto nsIt = namespaces.find(ns);
        if (nsIt == namespaces.end()) return std::nullopt;
        auto it = nsIt->second.byCommitment.find(commitment);
        if (it == nsIt->second.byCommitment.end()) return std::nullopt;
        return it->second;
    }

    std::optional<StoredBlob> LocalLedger::fetchByHeight(const std::string& ns, uint64_t height) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto nsIt = namespaces.find(ns);
        if (nsIt == namespaces.end()) return std::nullopt;
        auto it = nsIt->second.byHeight.find(height);
        if (it == nsIt->second.byHeight.end()) return std::nullopt;
        return nsIt->second.byCommitment.at(it->second);
    }

    std::vector<StoredBlob> LocalLedger::entries(const std::string& ns) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<StoredBlob> out;
        auto nsIt = namespaces.find(ns);
        if (nsIt == namespaces.end()) return out;
        for (const auto& [height, commitment] : nsIt->second.byHeight) {
            out.push_back(nsIt->second.byCommitment.at(commitment));
        }
        return out;
    }
}
