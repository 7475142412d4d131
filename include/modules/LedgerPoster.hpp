// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Append-only ledger posting: mock (local directory) and real (node JSON-RPC)

#ifndef VIGIL_LEDGER_POSTER_HPP
#define VIGIL_LEDGER_POSTER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AttestationTypes.hpp"
#include "utils/PipelineConfig.hpp"

namespace Vigil::Modules {

    /**
     * @brief One append to a content-addressed ledger. Throws PostingError on failure.
     */
    class LedgerPoster {
    public:
        virtual ~LedgerPoster() = default;

        [[nodiscard]] virtual std::string name() const = 0;

        virtual Core::LedgerEntry submit(const std::string& ns, const std::string& payload) = 0;
    };

    /**
     * @brief hex SHA-256(namespace || 0x00 || payload). Identical content, identical commitment.
     */
    std::string contentCommitment(const std::string& ns, const std::string& payload);

    struct StoredBlob {
        Core::LedgerEntry entry;
        std::string payload;
    };

    /**
     * @brief Mock ledger: one JSON file per blob under <root>/<namespace>/, written atomically.
     * Heights are a per-namespace sequence starting at 1. Re-submitting identical content
     * returns the existing entry. The index is rebuilt from disk on construction.
     */
    class LocalLedger final : public LedgerPoster {
    private:
        struct NamespaceIndex {
            std::map<std::string, StoredBlob> byCommitment;
            std::map<uint64_t, std::string> byHeight;
        };

        std::filesystem::path root;
        mutable std::mutex mutex;
        std::map<std::string, NamespaceIndex> namespaces;

        void loadExisting();

    public:
        explicit LocalLedger(std::filesystem::path root);

        std::string name() const override { return "local"; }
        Core::LedgerEntry submit(const std::string& ns, const std::string& payload) override;

        std::optional<StoredBlob> fetchByCommitment(const std::string& ns, const std::string& commitment) const;
        std::optional<StoredBlob> fetchByHeight(const std::string& ns, uint64_t height) const;

        // Payloads in height order
        std::vector<StoredBlob> entries(const std::string& ns) const;
    };

    /**
     * @brief Real ledger: "blob.Submit" JSON-RPC over HTTP/1.0 on a POSIX socket.
     * The node returns the inclusion height; the commitment is the local content commitment.
     */
    class RpcLedgerPoster final : public LedgerPoster {
    private:
        std::string host;
        std::string port;
        std::string path;
        std::string authToken;
        std::chrono::milliseconds timeout;

        std::string httpPost(const std::string& body) const;

    public:
        RpcLedgerPoster(const std::string& nodeUrl, std::string authToken,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

        std::string name() const override { return "rpc"; }
        Core::LedgerEntry submit(const std::string& ns, const std::string& payload) override;

        /**
         * @brief 29-byte version-0 namespace: 0x00, 18 zero bytes, 10-byte id.
         * The id is 20 hex characters or up to 10 raw bytes, left-padded with zeros.
         */
        static std::vector<uint8_t> namespaceBytes(const std::string& ns);

        static std::string buildSubmitRequest(const std::string& ns, const std::string& payload);

        // Height from a JSON-RPC response body. Throws PostingError on an error object.
        static uint64_t parseSubmitResponse(const std::string& body);
    };

    struct RetryPolicy {
        uint32_t attempts = 5;
        std::chrono::milliseconds initialBackoff{500};
        std::chrono::milliseconds maxBackoff{8000};

        // Doubling backoff before retry number `retry` (1-based), capped at maxBackoff
        [[nodiscard]] std::chrono::milliseconds backoffBefore(uint32_t retry) const;
    };

    /**
     * @brief Bounded retries around a LedgerPoster. Thread-safe as long as the inner poster is.
     * cancel() cuts every pending backoff short; the affected submits fail with PostingError.
     */
    class RetryingPoster {
    private:
        std::shared_ptr<LedgerPoster> inner;
        RetryPolicy policy;

        std::mutex waitMutex;
        std::condition_variable wake;
        std::atomic<bool> cancelled{false};

    public:
        RetryingPoster(std::shared_ptr<LedgerPoster> inner, RetryPolicy policy);

        Core::LedgerEntry submit(const std::string& ns, const std::string& payload);

        void cancel();

        [[nodiscard]] const LedgerPoster& backend() const { return *inner; }
    };

    std::shared_ptr<LedgerPoster> makeLedgerPoster(const VigilUtils::PipelineConfig& config);

    RetryPolicy retryPolicyFrom(const VigilUtils::PipelineConfig& config);
}

#endif
