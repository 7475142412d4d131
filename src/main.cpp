// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/AttestationPipeline.hpp"
#include "core/ObservationProbe.hpp"
#include "core/Scheduler.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Ed25519Signer.hpp"
#include "modules/AttestationArchive.hpp"
#include "modules/AttestationIndex.hpp"
#include "modules/LedgerPoster.hpp"
#include "modules/Prover.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/PipelineConfig.hpp"
#include "utils/RecordCodec.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

namespace {
    volatile std::sig_atomic_t g_stopRequested = 0;

    void onSignal(int) {
        g_stopRequested = 1;
    }

    struct CliOptions {
        std::string configPath;
        std::string preset = VigilTemplates::DEFAULT_PRESET;
        bool presetGiven = false;
        bool forceMock = false;
        bool audit = false;
    };

    void printUsage(const char* argv0) {
        std::cout << "Usage: " << argv0 << " [--config <file.json>] [--preset standard|hourly|rapid]"
                  << " [--mock] [--verbose] [--audit]\n"
                  << "  --audit   verify and total the attestations in the local ledger, then exit\n";
    }

    // Startup options, then the JSON file, then --mock
    VigilUtils::PipelineConfig buildConfig(const CliOptions& cli) {
        VigilUtils::PipelineConfig config;
        if (!cli.configPath.empty()) {
            if (cli.presetGiven) {
                std::cerr << "[Config] --preset ignored, the config file selects its own preset." << std::endl;
            }
            config = VigilUtils::loadConfigFile(cli.configPath);
        } else {
            config = VigilUtils::presetConfig(cli.preset);
        }
        if (cli.forceMock) {
            config.postingMode = VigilUtils::PostingMode::MOCK;
        }
        config.validate();
        return config;
    }

    std::shared_ptr<const Vigil::Crypto::Ed25519Signer> buildSigner(const VigilUtils::PipelineConfig& config) {
        using Vigil::Crypto::Ed25519Signer;
        if (config.signingSeedHex.empty()) {
            std::cout << "[Signer] No signing_seed_hex configured, using an ephemeral key for this run." << std::endl;
            return std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
        }
        return std::make_shared<Ed25519Signer>(Ed25519Signer::fromSeed(VigilUtils::fromHex(config.signingSeedHex)));
    }

    int runAudit(const VigilUtils::PipelineConfig& config,
                 std::shared_ptr<const Vigil::Crypto::Ed25519Signer> signer) {
        using namespace Vigil::Modules;

        if (config.postingMode != VigilUtils::PostingMode::MOCK) {
            std::cerr << "[Audit] Only the local ledger can be audited (use --mock)." << std::endl;
            return 2;
        }

        // An ephemeral key cannot vouch for earlier runs: fall back to the embedded keys
        bool keyed = !config.signingSeedHex.empty();
        std::vector<uint8_t> trusted = keyed ? signer->publicKey() : std::vector<uint8_t>{};
        std::shared_ptr<const Prover> verifier;
        if (config.proverBackend == VigilUtils::ProverBackend::DIGEST || keyed) {
            verifier = makeProver(config, signer);
        }

        LocalLedger ledger(fs::path(config.dataDir) / "ledger");
        AttestationIndex index(std::move(trusted), verifier);

        uint64_t rejected = 0;
        uint64_t duplicates = 0;
        for (const auto& blob : ledger.entries(config.ledgerNamespace)) {
            nlohmann::json doc = nlohmann::json::parse(blob.payload, nullptr, false);
            if (doc.is_discarded() || doc.value("type", std::string()) != VigilUtils::ATTESTATION_PAYLOAD_TYPE) {
                continue;
            }

            std::string reason;
            Admission result = index.admit(blob.payload, &reason);
            if (result == Admission::REJECTED) {
                rejected++;
                std::cerr << "[Audit] height " << blob.entry.height << " rejected: " << reason << std::endl;
            } else if (result == Admission::DUPLICATE) {
                duplicates++;
            }
        }

        IndexTotals totals = index.totals();
        std::cout << "[Audit] namespace '" << config.ledgerNamespace << "': " << totals.windows << " window(s), "
                  << totals.good << "/" << totals.samples << " good samples, "
                  << totals.compliantWindows << " window(s) met the threshold, "
                  << duplicates << " duplicate(s), " << rejected << " rejected." << std::endl;
        return rejected == 0 ? 0 : 1;
    }
}

int main(int argc, char* argv[]) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            VigilUtils::VERBOSE = true;
        } else if (arg == "--mock") {
            cli.forceMock = true;
        } else if (arg == "--audit") {
            cli.audit = true;
        } else if ((arg == "--config" || arg == "--preset") && i + 1 < argc) {
            if (arg == "--config") {
                cli.configPath = argv[++i];
            } else {
                cli.preset = argv[++i];
                cli.presetGiven = true;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    std::cout << "--- VIGIL LIVENESS ATTESTATION ---" << std::endl;

    VigilUtils::PipelineConfig config;
    try {
        config = buildConfig(cli);
    } catch (const Vigil::Core::ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[Config] tick " << config.tickSecs << "s, window " << config.windowSecs << "s (k="
              << config.samplesPerWindow << "), posting " << VigilUtils::toString(config.postingMode)
              << ", prover " << (config.proofsEnabled ? VigilUtils::toString(config.proverBackend) : "off")
              << ", partial windows " << VigilUtils::toString(config.partialWindowPolicy) << std::endl;

    try {
        auto signer = buildSigner(config);
        if (cli.audit) {
            return runAudit(config, signer);
        }

        Vigil::Core::PipelineTelemetry telemetry;
        Vigil::Modules::AttestationArchive archive(config.dataDir);
        auto poster = std::make_shared<Vigil::Modules::RetryingPoster>(
            Vigil::Modules::makeLedgerPoster(config), Vigil::Modules::retryPolicyFrom(config));
        auto prover = Vigil::Modules::makeProver(config, signer);

        std::cout << "[Signer] Attestation key " << VigilUtils::toHex(signer->publicKey()) << std::endl;
        std::cout << "[Poster] Backend " << poster->backend().name() << ", namespace '"
                  << config.ledgerNamespace << "'" << std::endl;

        Vigil::Core::AttestationPipeline pipeline(config, telemetry, archive, poster, prover, signer);
        Vigil::Core::ObservationProbe probe(pipeline.getStore(), telemetry, pipeline.getClock(), config.ingestPort);
        Vigil::Core::Scheduler scheduler;

        if (!probe.start()) {
            std::cerr << "[Main] Ingestion port unavailable, aborting." << std::endl;
            return 1;
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        scheduler.start(pipeline);

        while (!g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\n[Main] Shutdown requested." << std::endl;
        probe.stop();
        uint32_t abandoned = scheduler.stop(std::chrono::milliseconds(config.shutdownGraceMs));

        std::cout << "[Telemetry] " << telemetry.snapshot() << std::endl;

        if (abandoned > 0) {
            // Abandoned tasks still reference the pipeline: leave without unwinding it
            std::cout.flush();
            std::exit(EXIT_SUCCESS);
        }
    } catch (const Vigil::Core::ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 2;
    } catch (const Vigil::Core::VigilError& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
