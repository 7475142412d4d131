// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/VigilErrors.hpp"
#include "utils/PipelineConfig.hpp"
#include "utils/StorageUtils.hpp"

using Vigil::Core::ConfigError;
using namespace VigilUtils;

TEST(PipelineConfigTest, DefaultsAreTheStandardPreset) {
    PipelineConfig config;
    config.validate();

    EXPECT_EQ(config.tickSecs, 30u);
    EXPECT_EQ(config.windowSecs, 600u);
    EXPECT_EQ(config.samplesPerWindow, 20u);
    EXPECT_EQ(config.maxStalenessSecs, 120u);
    EXPECT_EQ(config.gracePeriodSecs, 45u);
    EXPECT_EQ(config.ringCapacity, 288u);
    EXPECT_EQ(config.thresholdPpm, 950000u);
    EXPECT_EQ(config.postingMode, PostingMode::MOCK);
    EXPECT_EQ(config.partialWindowPolicy, PartialWindowPolicy::SKIP);
}

TEST(PipelineConfigTest, PresetsSetTimingOnly) {
    PipelineConfig hourly = presetConfig("hourly");
    hourly.validate();
    EXPECT_EQ(hourly.samplesPerWindow, 60u);
    EXPECT_EQ(hourly.gracePeriodSecs, 45u);

    PipelineConfig rapid = presetConfig("rapid");
    rapid.validate();
    EXPECT_EQ(rapid.samplesPerWindow, 2u);

    EXPECT_THROW(presetConfig("weekly"), ConfigError);
}

TEST(PipelineConfigTest, WindowMustBeMultipleOfTick) {
    PipelineConfig config;
    config.windowSecs = 610;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(PipelineConfigTest, GraceMustBeBelowStaleness) {
    PipelineConfig config;
    config.gracePeriodSecs = 120;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(PipelineConfigTest, RingMustHoldOneWindow) {
    PipelineConfig config;
    config.ringCapacity = 19;
    EXPECT_THROW(config.validate(), ConfigError);
    config.ringCapacity = 20;
    EXPECT_NO_THROW(config.validate());
}

TEST(PipelineConfigTest, RejectsOutOfRangeValues) {
    PipelineConfig zeroTick;
    zeroTick.tickSecs = 0;
    EXPECT_THROW(zeroTick.validate(), ConfigError);

    PipelineConfig fraction;
    fraction.thresholdFraction = 1.5;
    EXPECT_THROW(fraction.validate(), ConfigError);

    PipelineConfig increment;
    increment.minIncrement = 0;
    EXPECT_THROW(increment.validate(), ConfigError);

    PipelineConfig seed;
    seed.signingSeedHex = "abcd";
    EXPECT_THROW(seed.validate(), ConfigError);

    PipelineConfig backoff;
    backoff.retryInitialBackoffMs = 9000;
    EXPECT_THROW(backoff.validate(), ConfigError);
}

TEST(PipelineConfigTest, ThresholdFractionMustBeWholePartsPerMillion) {
    PipelineConfig tiny;
    tiny.thresholdFraction = 1e-7;
    EXPECT_THROW(tiny.validate(), ConfigError);

    PipelineConfig finer;
    finer.thresholdFraction = 0.9500004;
    EXPECT_THROW(finer.validate(), ConfigError);

    PipelineConfig smallest;
    smallest.thresholdFraction = 0.000001;
    smallest.validate();
    EXPECT_EQ(smallest.thresholdPpm, 1u);

    PipelineConfig odd;
    odd.thresholdFraction = 0.123457;
    odd.validate();
    EXPECT_EQ(odd.thresholdPpm, 123457u);
}

TEST(PipelineConfigTest, RealModeNeedsALedgerSizedNamespace) {
    PipelineConfig config;
    config.postingMode = PostingMode::REAL;
    config.ledgerNamespace = "far-too-long-namespace";
    EXPECT_THROW(config.validate(), ConfigError);

    config.ledgerNamespace = "0000000000000000beef";
    EXPECT_NO_THROW(config.validate());

    config.nodeUrl = "https://node";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(PipelineConfigTest, JsonOverridesUseSnakeCaseKeys) {
    PipelineConfig config;
    applyJsonOverrides(config, nlohmann::json{
        {"tick_secs", 60},
        {"window_secs", 3600},
        {"partial_window_policy", "emit"},
        {"posting_mode", "real"},
        {"prover_backend", "signed"},
        {"namespace", "vigil"}
    });
    config.validate();

    EXPECT_EQ(config.samplesPerWindow, 60u);
    EXPECT_EQ(config.partialWindowPolicy, PartialWindowPolicy::EMIT);
    EXPECT_EQ(config.postingMode, PostingMode::REAL);
    EXPECT_EQ(config.proverBackend, ProverBackend::SIGNED);
}

TEST(PipelineConfigTest, UnknownKeysAndWrongTypesAreErrors) {
    PipelineConfig config;
    EXPECT_THROW(applyJsonOverrides(config, nlohmann::json{{"tick_sec", 5}}), ConfigError);
    EXPECT_THROW(applyJsonOverrides(config, nlohmann::json{{"tick_secs", "fast"}}), ConfigError);
    EXPECT_THROW(applyJsonOverrides(config, nlohmann::json{{"posting_mode", "maybe"}}), ConfigError);
    EXPECT_THROW(applyJsonOverrides(config, nlohmann::json::array()), ConfigError);
}

TEST(PipelineConfigTest, FileSelectsPresetThenOverlays) {
    VigilTest::TempDir tmp;
    std::string path = (tmp.path() / "vigil.json").string();
    ASSERT_TRUE(writeFileAtomic(path, R"({"preset": "hourly", "threshold_fraction": 0.9, "salt": "s1"})"));

    PipelineConfig config = loadConfigFile(path);
    config.validate();
    EXPECT_EQ(config.tickSecs, 60u);
    EXPECT_EQ(config.windowSecs, 3600u);
    EXPECT_EQ(config.thresholdPpm, 900000u);
    EXPECT_EQ(config.salt, "s1");

    EXPECT_THROW(loadConfigFile((tmp.path() / "missing.json").string()), ConfigError);

    ASSERT_TRUE(writeFileAtomic(path, "{ not json"));
    EXPECT_THROW(loadConfigFile(path), ConfigError);
}
