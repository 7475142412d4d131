// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/AttestationPipeline.hpp"
#include "core/Scheduler.hpp"
#include "core/VigilBus.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Ed25519Signer.hpp"
#include "modules/AttestationArchive.hpp"
#include "modules/AttestationIndex.hpp"
#include "modules/LedgerPoster.hpp"
#include "modules/Prover.hpp"
#include "utils/StorageUtils.hpp"

using namespace Vigil::Core;
using namespace Vigil::Modules;
using Vigil::Crypto::Ed25519Signer;
namespace fs = std::filesystem;

namespace {
    class DownPoster : public LedgerPoster {
    public:
        std::string name() const override { return "down"; }
        LedgerEntry submit(const std::string&, const std::string&) override {
            throw PostingError("connection refused");
        }
    };

    Sample sampleAt(uint64_t ts, bool ok) {
        Sample s;
        s.timestamp = ts;
        s.ok = ok;
        s.head = static_cast<int64_t>(ts);
        s.reason = {ok ? ReasonCode::ADVANCED : ReasonCode::STUCK, ok ? 1 : 0};
        return s;
    }
}

class VigilBusTest : public ::testing::Test {
protected:
    VigilTest::TempDir tmp;
    VigilUtils::PipelineConfig config;
    PipelineTelemetry telemetry;
    std::shared_ptr<Ed25519Signer> signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
    std::shared_ptr<LocalLedger> ledger;
    std::unique_ptr<AttestationArchive> archive;
    std::unique_ptr<SampleRing> ring;

    void SetUp() override {
        config.tickSecs = 30;
        config.windowSecs = 60;     // k = 2
        config.ringCapacity = 8;
        config.salt = "bus-test";
        config.dataDir = tmp.path().string();
        config.retryAttempts = 2;
        config.retryInitialBackoffMs = 1;
        config.retryMaxBackoffMs = 2;
        config.validate();

        ledger = std::make_shared<LocalLedger>(tmp.path() / "ledger");
        archive = std::make_unique<AttestationArchive>(tmp.path());
        ring = std::make_unique<SampleRing>(config.ringCapacity);
    }

    std::unique_ptr<VigilBus> makeBus(std::shared_ptr<LedgerPoster> backend) {
        auto poster = std::make_shared<RetryingPoster>(std::move(backend), retryPolicyFrom(config));
        return std::make_unique<VigilBus>(config, telemetry, *ring, *archive, poster,
                                          makeProver(config, signer), signer);
    }

    AttestationJob job(std::initializer_list<int> bits, uint64_t start) {
        std::vector<Sample> window;
        uint64_t ts = start;
        for (int b : bits) {
            window.push_back(sampleAt(ts, b != 0));
            ts += 30;
        }
        AttestationJob j;
        j.batch = BatchGenerator::summarize(window, config.thresholdPpm,
                                            std::vector<uint8_t>(config.salt.begin(), config.salt.end()), j.bitmap);
        return j;
    }
};

TEST_F(VigilBusTest, ProvedBatchIsArchivedSignedAndPosted) {
    auto bus = makeBus(ledger);
    auto entry = bus->processBatch(job({1, 1}, 3000));

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->height, 1u);
    EXPECT_TRUE(fs::exists(tmp.path() / "batch.json"));
    EXPECT_TRUE(fs::exists(tmp.path() / "bitmap.hex"));
    EXPECT_TRUE(fs::exists(tmp.path() / "proof.json"));

    std::string bitmapHex;
    ASSERT_TRUE(VigilUtils::readFile((tmp.path() / "bitmap.hex").string(), bitmapHex));
    EXPECT_EQ(bitmapHex, "0101\n");

    auto blob = ledger->fetchByHeight(config.ledgerNamespace, 1);
    ASSERT_TRUE(blob.has_value());
    nlohmann::json payload = nlohmann::json::parse(blob->payload);
    EXPECT_EQ(payload["type"], "batch_attestation");
    EXPECT_EQ(payload["proof_status"], "proved");
    EXPECT_EQ(payload["partial"], false);

    AttestationIndex index(signer->publicKey(), makeProver(config, signer));
    EXPECT_EQ(index.admit(blob->payload), Admission::ACCEPTED);

    EXPECT_EQ(telemetry.proofs_generated.load(), 1u);
    EXPECT_EQ(telemetry.posts_ok.load(), 1u);
}

TEST_F(VigilBusTest, SameWindowIsPostedOnlyOnce) {
    auto bus = makeBus(ledger);
    AttestationJob j = job({1, 1}, 3000);

    ASSERT_TRUE(bus->processBatch(j).has_value());
    EXPECT_FALSE(bus->processBatch(j).has_value());
    EXPECT_EQ(ledger->entries(config.ledgerNamespace).size(), 1u);
}

TEST_F(VigilBusTest, PostedSetKeepsOnlyRecentWindows) {
    auto bus = makeBus(ledger);
    for (uint64_t i = 0; i <= config.ringCapacity; i++) {
        ASSERT_TRUE(bus->processBatch(job({1, 1}, 3000 + i * 60)).has_value());
    }

    // The newest window is still remembered, the oldest one has been dropped
    EXPECT_FALSE(bus->processBatch(job({1, 1}, 3000 + config.ringCapacity * 60)).has_value());
    auto again = bus->processBatch(job({1, 1}, 3000));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->height, 1u);
    EXPECT_EQ(ledger->entries(config.ledgerNamespace).size(), config.ringCapacity + 1);
}

TEST_F(VigilBusTest, FailedProofStillPostsFlaggedBatch) {
    auto bus = makeBus(ledger);
    auto entry = bus->processBatch(job({1, 0}, 3000));

    ASSERT_TRUE(entry.has_value());
    nlohmann::json payload = nlohmann::json::parse(ledger->fetchByHeight(config.ledgerNamespace, 1)->payload);
    EXPECT_EQ(payload["proof_status"], "failed");
    EXPECT_TRUE(payload["proof"].is_null());
    EXPECT_EQ(telemetry.proofs_failed.load(), 1u);
}

TEST_F(VigilBusTest, DisabledProofsAreFlagged) {
    config.proofsEnabled = false;
    auto bus = makeBus(ledger);
    ASSERT_TRUE(bus->processBatch(job({1, 1}, 3000)).has_value());

    nlohmann::json payload = nlohmann::json::parse(ledger->fetchByHeight(config.ledgerNamespace, 1)->payload);
    EXPECT_EQ(payload["proof_status"], "disabled");
    EXPECT_FALSE(fs::exists(tmp.path() / "proof.json"));
}

TEST_F(VigilBusTest, UnreachableLedgerIsReportedNotThrown) {
    auto bus = makeBus(std::make_shared<DownPoster>());
    AttestationJob j = job({1, 1}, 3000);

    EXPECT_FALSE(bus->processBatch(j).has_value());
    EXPECT_EQ(telemetry.posts_failed.load(), 1u);
    EXPECT_TRUE(fs::exists(tmp.path() / "batch.json"));

    // A failed window may be tried again
    EXPECT_FALSE(bus->processBatch(j).has_value());
    EXPECT_EQ(telemetry.posts_failed.load(), 2u);
}

TEST_F(VigilBusTest, SampleIsArchivedAndPosted) {
    auto bus = makeBus(ledger);
    Sample s = sampleAt(1000, true);
    ring->append(s);

    bus->processSample(s);

    EXPECT_TRUE(fs::exists(tmp.path() / "samples.json"));
    auto blobs = ledger->entries(config.ledgerNamespace);
    ASSERT_EQ(blobs.size(), 1u);
    nlohmann::json payload = nlohmann::json::parse(blobs[0].payload);
    EXPECT_EQ(payload["type"], "sample");
    EXPECT_EQ(payload["sample"]["timestamp"], 1000);
    EXPECT_TRUE(payload["sample"]["sampled_count"].is_null());
}

TEST_F(VigilBusTest, SamplePostingCanBeTurnedOff) {
    config.postEverySample = false;
    auto bus = makeBus(ledger);
    Sample s = sampleAt(1000, true);
    ring->append(s);

    bus->processSample(s);
    EXPECT_TRUE(fs::exists(tmp.path() / "samples.json"));
    EXPECT_TRUE(ledger->entries(config.ledgerNamespace).empty());
}

TEST_F(VigilBusTest, ReactiveChainRunsJobsOnWorkers) {
    auto bus = makeBus(ledger);
    Scheduler scheduler;
    rxcpp::composite_subscription lifetime;
    bus->startReactive(lifetime, scheduler);

    bus->pushBatch(job({1, 1}, 3000).batch, job({1, 1}, 3000).bitmap);
    bus->pushBatch(job({1, 1}, 4000).batch, job({1, 1}, 4000).bitmap);

    EXPECT_TRUE(bus->awaitIdle(std::chrono::milliseconds(10000)));
    EXPECT_EQ(bus->inflightTasks(), 0u);
    EXPECT_EQ(ledger->entries(config.ledgerNamespace).size(), 2u);
    EXPECT_GE(telemetry.inflight_peak.load(), 1u);
    lifetime.unsubscribe();
}

TEST_F(VigilBusTest, PipelineTicksFeedTheLedger) {
    auto poster = std::make_shared<RetryingPoster>(ledger, retryPolicyFrom(config));
    AttestationPipeline pipeline(config, telemetry, *archive, poster, makeProver(config, signer), signer);
    Scheduler scheduler;
    rxcpp::composite_subscription lifetime;
    pipeline.getBus().startReactive(lifetime, scheduler);

    pipeline.getStore().recordObservation(100, 1, 995);
    pipeline.samplerTick(1000);
    pipeline.getStore().recordObservation(103, 2, 1025);
    pipeline.samplerTick(1030);
    pipeline.batchTick();

    ASSERT_TRUE(pipeline.getBus().awaitIdle(std::chrono::milliseconds(10000)));
    lifetime.unsubscribe();

    EXPECT_EQ(telemetry.samples_total.load(), 2u);
    EXPECT_EQ(telemetry.samples_ok.load(), 2u);
    EXPECT_EQ(telemetry.batches_emitted.load(), 1u);

    // Two sample records and one attestation
    auto blobs = ledger->entries(config.ledgerNamespace);
    ASSERT_EQ(blobs.size(), 3u);
    int attestations = 0;
    for (const auto& blob : blobs) {
        if (nlohmann::json::parse(blob.payload)["type"] == "batch_attestation") attestations++;
    }
    EXPECT_EQ(attestations, 1);
}

TEST_F(VigilBusTest, RegressingClockAbortsOnlyThatTick) {
    auto poster = std::make_shared<RetryingPoster>(ledger, retryPolicyFrom(config));
    config.postEverySample = false;
    AttestationPipeline pipeline(config, telemetry, *archive, poster, nullptr, signer);

    pipeline.getStore().recordObservation(100, 1, 995);
    pipeline.samplerTick(1000);
    pipeline.samplerTick(900);

    EXPECT_EQ(telemetry.ticks_aborted.load(), 1u);
    EXPECT_EQ(pipeline.getRing().size(), 1u);
}

TEST(TickClockTest, ReadingsFollowTheSteadyClockFromTheAnchor) {
    auto origin = TickClock::Steady::now();
    TickClock clock(5000, origin);

    EXPECT_EQ(clock.at(origin), 5000u);
    EXPECT_EQ(clock.at(origin + std::chrono::milliseconds(29999)), 5029u);
    EXPECT_EQ(clock.at(origin + std::chrono::seconds(3600)), 8600u);
    EXPECT_EQ(clock.at(origin - std::chrono::seconds(10)), 5000u);

    uint64_t first = clock.now();
    uint64_t second = clock.now();
    EXPECT_GE(first, 5000u);
    EXPECT_GE(second, first);
}

TEST_F(VigilBusTest, ClockStepBetweenTicksDoesNotAbortSampling) {
    auto poster = std::make_shared<RetryingPoster>(ledger, retryPolicyFrom(config));
    config.postEverySample = false;
    AttestationPipeline pipeline(config, telemetry, *archive, poster, nullptr, signer);

    // Anchored at 1000; between the second and third tick the system clock is
    // stepped back an hour, which the steady offsets below never see.
    auto origin = TickClock::Steady::now();
    TickClock clock(1000, origin);

    pipeline.getStore().recordObservation(100, 1, 995);
    pipeline.samplerTick(clock.at(origin));
    pipeline.getStore().recordObservation(101, 2, 1025);
    pipeline.samplerTick(clock.at(origin + std::chrono::seconds(30)));
    pipeline.getStore().recordObservation(102, 3, 1055);
    pipeline.samplerTick(clock.at(origin + std::chrono::seconds(60)));

    EXPECT_EQ(telemetry.ticks_aborted.load(), 0u);
    EXPECT_EQ(telemetry.samples_ok.load(), 3u);
    auto samples = pipeline.getRing().snapshot().samples;
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].timestamp, 1000u);
    EXPECT_EQ(samples[2].timestamp, 1060u);
}

TEST_F(VigilBusTest, SchedulerStopsCleanly) {
    auto poster = std::make_shared<RetryingPoster>(ledger, retryPolicyFrom(config));
    AttestationPipeline pipeline(config, telemetry, *archive, poster, makeProver(config, signer), signer);
    Scheduler scheduler;

    scheduler.start(pipeline);
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_EQ(telemetry.state.load(), PipelineState::UP);

    EXPECT_EQ(scheduler.stop(std::chrono::milliseconds(500)), 0u);
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(telemetry.state.load(), PipelineState::STOPPED);
}
