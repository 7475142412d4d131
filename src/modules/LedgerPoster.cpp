// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline - JSON-RPC poster and retry envelope

#include "modules/LedgerPoster.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace Vigil::Modules {

    namespace {
        constexpr size_t NAMESPACE_SIZE = 29;
        constexpr size_t NAMESPACE_ID_SIZE = 10;

        // Closes the descriptor on every exit path of httpPost
        struct SocketGuard {
            int fd;
            explicit SocketGuard(int fd) : fd(fd) {}
            ~SocketGuard() { if (fd >= 0) close(fd); }
            SocketGuard(const SocketGuard&) = delete;
            SocketGuard& operator=(const SocketGuard&) = delete;
        };

        uint64_t unixNow() {
            return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        }
    }

    // --- RpcLedgerPoster ---

    RpcLedgerPoster::RpcLedgerPoster(const std::string& nodeUrl, std::string authToken,
                                     std::chrono::milliseconds timeout)
        : port("80"), path("/"), authToken(std::move(authToken)), timeout(timeout) {
        const std::string scheme = "http://";
        if (nodeUrl.compare(0, scheme.size(), scheme) != 0) {
            throw Core::ConfigError("node_url must start with http://, got " + nodeUrl);
        }

        std::string rest = nodeUrl.substr(scheme.size());
        size_t slash = rest.find('/');
        if (slash != std::string::npos) {
            path = rest.substr(slash);
            rest = rest.substr(0, slash);
        }

        size_t colon = rest.rfind(':');
        if (colon != std::string::npos) {
            port = rest.substr(colon + 1);
            rest = rest.substr(0, colon);
            if (port.empty() || !std::all_of(port.begin(), port.end(), ::isdigit)) {
                throw Core::ConfigError("node_url has an invalid port: " + nodeUrl);
            }
        }
        host = rest;
        if (host.empty()) {
            throw Core::ConfigError("node_url has no host: " + nodeUrl);
        }
    }

    std::vector<uint8_t> RpcLedgerPoster::namespaceBytes(const std::string& ns) {
        std::vector<uint8_t> id;
        if (ns.size() == NAMESPACE_ID_SIZE * 2 && VigilUtils::isHex(ns)) {
            id = VigilUtils::fromHex(ns);
        } else if (ns.size() <= NAMESPACE_ID_SIZE) {
            id.assign(ns.begin(), ns.end());
        } else {
            throw Core::PostingError("namespace does not fit a 10-byte id: " + ns);
        }

        // version 0, then the id right-aligned in the 28-byte body
        std::vector<uint8_t> out(NAMESPACE_SIZE, 0);
        std::copy(id.begin(), id.end(), out.end() - static_cast<std::ptrdiff_t>(id.size()));
        return out;
    }

    std::string RpcLedgerPoster::buildSubmitRequest(const std::string& ns, const std::string& payload) {
        nlohmann::json blob{
            {"namespace", Crypto::base64Encode(namespaceBytes(ns))},
            {"data", Crypto::base64Encode(std::vector<uint8_t>(payload.begin(), payload.end()))},
            {"share_version", 0}
        };
        nlohmann::json request{
            {"jsonrpc", "2.0"},
            {"id", 1},
            {"method", "blob.Submit"},
            {"params", nlohmann::json::array({nlohmann::json::array({blob}), nlohmann::json::object()})}
        };
        return request.dump();
    }

    uint64_t RpcLedgerPoster::parseSubmitResponse(const std::string& body) {
        nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            throw Core::PostingError("node returned a non-JSON body");
        }
        if (doc.contains("error") && !doc["error"].is_null()) {
            std::string message = doc["error"].value("message", doc["error"].dump());
            throw Core::PostingError("node rejected blob: " + message);
        }
        if (!doc.contains("result") || !doc["result"].is_number_unsigned()) {
            throw Core::PostingError("node response carries no inclusion height");
        }
        return doc["result"].get<uint64_t>();
    }

    std::string RpcLedgerPoster::httpPost(const std::string& body) const {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* resolved = nullptr;
        int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &resolved);
        if (rc != 0) {
            throw Core::PostingError("cannot resolve " + host + ": " + gai_strerror(rc));
        }
        std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs(resolved, &freeaddrinfo);

        struct timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        int fd = -1;
        for (struct addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
            fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
            close(fd);
            fd = -1;
        }
        if (fd < 0) {
            throw Core::PostingError("cannot connect to " + host + ":" + port + ": " + std::strerror(errno));
        }
        SocketGuard guard(fd);

        std::string request = "POST " + path + " HTTP/1.0\r\n"
                              "Host: " + host + "\r\n"
                              "Content-Type: application/json\r\n"
                              "Content-Length: " + std::to_string(body.size()) + "\r\n";
        if (!authToken.empty()) {
            request += "Authorization: Bearer " + authToken + "\r\n";
        }
        request += "\r\n" + body;

        size_t sent = 0;
        while (sent < request.size()) {
            ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw Core::PostingError(std::string("send failed: ") + std::strerror(errno));
            }
            sent += static_cast<size_t>(n);
        }

        std::string response;
        char buffer[4096];
        while (true) {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                throw Core::PostingError(std::string("receive failed: ") + std::strerror(errno));
            }
            response.append(buffer, static_cast<size_t>(n));
        }

        size_t headerEnd = response.find("\r\n\r\n");
        if (headerEnd == std::string::npos) {
            throw Core::PostingError("truncated HTTP response from node");
        }

        // "HTTP/1.1 200 OK"
        std::string statusLine = response.substr(0, response.find("\r\n"));
        size_t sp = statusLine.find(' ');
        int status = 0;
        if (sp != std::string::npos) {
            status = std::atoi(statusLine.c_str() + sp + 1);
        }
        if (status != 200) {
            throw Core::PostingError("node answered HTTP " + std::to_string(status));
        }
        return response.substr(headerEnd + 4);
    }

    Core::LedgerEntry RpcLedgerPoster::submit(const std::string& ns, const std::string& payload) {
        std::string body = httpPost(buildSubmitRequest(ns, payload));

        Core::LedgerEntry entry;
        entry.height = parseSubmitResponse(body);
        entry.commitment = contentCommitment(ns, payload);
        entry.ns = ns;
        entry.submittedAt = unixNow();
        return entry;
    }

    // --- RetryingPoster ---

    std::chrono::milliseconds RetryPolicy::backoffBefore(uint32_t retry) const {
        if (retry == 0) return std::chrono::milliseconds(0);
        auto delay = initialBackoff;
        for (uint32_t i = 1; i < retry && delay < maxBackoff; ++i) {
            delay *= 2;
        }
        return std::min(delay, maxBackoff);
    }

    RetryingPoster::RetryingPoster(std::shared_ptr<LedgerPoster> inner, RetryPolicy policy)
        : inner(std::move(inner)), policy(policy) {
        if (!this->inner) {
            throw Core::ConfigError("RetryingPoster needs a backend");
        }
        if (this->policy.attempts == 0) {
            throw Core::ConfigError("retry_attempts must be at least 1");
        }
    }

    Core::LedgerEntry RetryingPoster::submit(const std::string& ns, const std::string& payload) {
        std::string lastError;

        for (uint32_t attempt = 1; attempt <= policy.attempts; ++attempt) {
            if (attempt > 1) {
                auto delay = policy.backoffBefore(attempt - 1);
                std::unique_lock<std::mutex> lock(waitMutex);
                if (wake.wait_for(lock, delay, [this] { return cancelled.load(); })) {
                    throw Core::PostingError("posting cancelled after " + std::to_string(attempt - 1) +
                                             " attempts: " + lastError);
                }
            }

            try {
                return inner->submit(ns, payload);
            } catch (const Core::PostingError& e) {
                lastError = e.what();
            }

            std::cerr << "[Poster] " << inner->name() << " attempt " << attempt << "/" << policy.attempts
                      << " failed: " << lastError << std::endl;
        }

        throw Core::PostingError("gave up after " + std::to_string(policy.attempts) + " attempts: " + lastError);
    }

    void RetryingPoster::cancel() {
        {
            std::lock_guard<std::mutex> lock(waitMutex);
            cancelled = true;
        }
        wake.notify_all();
    }

    // --- Factories ---

    std::shared_ptr<LedgerPoster> makeLedgerPoster(const VigilUtils::PipelineConfig& config) {
        if (config.postingMode == VigilUtils::PostingMode::MOCK) {
            return std::make_shared<LocalLedger>(std::filesystem::path(config.dataDir) / "ledger");
        }
        return std::make_shared<RpcLedgerPoster>(config.nodeUrl, config.nodeAuthToken);
    }

    RetryPolicy retryPolicyFrom(const VigilUtils::PipelineConfig& config) {
        RetryPolicy policy;
        policy.attempts = config.retryAttempts;
        policy.initialBackoff = std::chrono::milliseconds(config.retryInitialBackoffMs);
        policy.maxBackoff = std::chrono::milliseconds(config.retryMaxBackoffMs);
        return policy;
    }
}
