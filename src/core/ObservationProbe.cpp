// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline - ObservationProbe

#include "core/ObservationProbe.hpp"
#include "core/VigilErrors.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace Vigil::Core {

    namespace {
        constexpr size_t MAX_REQUEST_BYTES = 64 * 1024;

        std::optional<int64_t> counterField(const nlohmann::json& doc, const char* key) {
            if (!doc.contains(key) || doc[key].is_null()) return std::nullopt;
            const auto& v = doc[key];
            if (!v.is_number_integer()) {
                throw IngestionError(std::string("'") + key + "' is not an integer");
            }
            if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
                throw IngestionError(std::string("'") + key + "' is out of range");
            }
            return v.get<int64_t>();
        }

        // Content-Length of an HTTP request, if the headers are complete and carry one
        std::optional<size_t> expectedLength(const std::string& request) {
            size_t headerEnd = request.find("\r\n\r\n");
            if (headerEnd == std::string::npos) return std::nullopt;
            std::string headers = request.substr(0, headerEnd);
            for (auto& c : headers) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            size_t pos = headers.find("content-length:");
            if (pos == std::string::npos) return std::nullopt;
            return headerEnd + 4 + static_cast<size_t>(std::strtoull(headers.c_str() + pos + 15, nullptr, 10));
        }

        bool isHttp(const std::string& request) {
            return request.compare(0, 5, "POST ") == 0 || request.compare(0, 4, "PUT ") == 0;
        }
    }

    ObservationProbe::ObservationProbe(HealthSnapshotStore& store, PipelineTelemetry& telemetry,
                                       const TickClock& clock, int listenPort)
        : store(store), telemetry(telemetry), clock(clock), serverFd(-1), port(listenPort), keepRunning(false) {}

    ObservationProbe::~ObservationProbe() {
        stop();
    }

    bool ObservationProbe::start() {
        if (keepRunning) return true;

        serverFd = socket(AF_INET, SOCK_STREAM, 0);
        if (serverFd < 0) return false;

        int opt = 1;
        setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = INADDR_ANY;
        address.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(serverFd, (struct sockaddr*)&address, sizeof(address)) < 0 || listen(serverFd, 64) < 0) {
            std::cerr << "[ObservationProbe] Cannot listen on port " << port << ": " << std::strerror(errno) << std::endl;
            close(serverFd);
            serverFd = -1;
            return false;
        }

        keepRunning = true;
        workerThread = std::thread(&ObservationProbe::listenLoop, this);

        std::cout << "[ObservationProbe] Accepting health observations on port " << port << std::endl;
        return true;
    }

    void ObservationProbe::listenLoop() {
        while (keepRunning) {
            fd_set readable;
            FD_ZERO(&readable);
            FD_SET(serverFd, &readable);
            struct timeval pollTimeout{0, 200000};

            int ready = select(serverFd + 1, &readable, nullptr, nullptr, &pollTimeout);
            if (ready <= 0) continue;

            int clientFd = accept(serverFd, nullptr, nullptr);
            if (clientFd < 0) continue;

            handleClient(clientFd);
            close(clientFd);
        }
    }

    void ObservationProbe::handleClient(int clientFd) {
        struct timeval tcpTimeout{1, 0};
        setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tcpTimeout, sizeof(tcpTimeout));

        std::string request;
        char buffer[2048];
        while (request.size() < MAX_REQUEST_BYTES) {
            ssize_t n = read(clientFd, buffer, sizeof(buffer));
            if (n <= 0) break;
            request.append(buffer, static_cast<size_t>(n));

            auto expected = expectedLength(request);
            if (expected && request.size() >= *expected) break;
        }
        if (request.empty()) return;

        bool accepted = ingest(request, clock.now());

        if (isHttp(request)) {
            const char* reply = accepted ? "HTTP/1.0 204 No Content\r\n\r\n"
                                         : "HTTP/1.0 400 Bad Request\r\n\r\n";
            ssize_t ignored = write(clientFd, reply, std::strlen(reply));
            (void)ignored;
        }
    }

    Observation ObservationProbe::decode(const std::string& request) {
        std::string body = request;
        size_t headerEnd = request.find("\r\n\r\n");
        if (isHttp(request)) {
            if (headerEnd == std::string::npos) {
                throw IngestionError("incomplete HTTP request");
            }
            body = request.substr(headerEnd + 4);
        }

        nlohmann::json doc = nlohmann::json::parse(VigilUtils::trim(body), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            throw IngestionError("observation is not a JSON object");
        }

        Observation obs;
        obs.head = counterField(doc, "head");
        obs.sampledCount = counterField(doc, "sampled_count");
        return obs;
    }

    bool ObservationProbe::ingest(const std::string& request, uint64_t at) {
        try {
            Observation obs = decode(request);
            store.recordObservation(obs.head, obs.sampledCount, at);
            telemetry.observations_accepted++;
            if (VigilUtils::VERBOSE) {
                std::cout << "[ObservationProbe] head=" << (obs.head ? std::to_string(*obs.head) : "-")
                          << " sampled_count=" << (obs.sampledCount ? std::to_string(*obs.sampledCount) : "-")
                          << std::endl;
            }
            return true;
        } catch (const IngestionError& e) {
            telemetry.observations_rejected++;
            std::cerr << "[ObservationProbe] Observation dropped: " << e.what() << std::endl;
            return false;
        }
    }

    void ObservationProbe::stop() {
        if (!keepRunning) return;
        keepRunning = false;
        if (workerThread.joinable()) {
            workerThread.join();
        }
        if (serverFd >= 0) {
            close(serverFd);
            serverFd = -1;
        }
    }
}
