// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include <gtest/gtest.h>

#include "core/BatchGenerator.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Digest.hpp"

using namespace Vigil::Core;

namespace {
    Sample sampleAt(uint64_t ts, bool ok) {
        Sample s;
        s.timestamp = ts;
        s.ok = ok;
        s.reason = {ok ? ReasonCode::ADVANCED : ReasonCode::STUCK, ok ? 1 : 0};
        return s;
    }

    std::vector<Sample> series(std::initializer_list<int> bits, uint64_t start = 1000) {
        std::vector<Sample> out;
        uint64_t ts = start;
        for (int b : bits) {
            out.push_back(sampleAt(ts, b != 0));
            ts += 30;
        }
        return out;
    }
}

class BatchGeneratorTest : public ::testing::Test {
protected:
    VigilUtils::PipelineConfig config;

    void SetUp() override {
        config.tickSecs = 30;
        config.windowSecs = 120;   // k = 4
        config.ringCapacity = 6;
        config.salt = "run-7";
        config.validate();
    }

    static void fill(SampleRing& ring, uint64_t from, uint64_t count, bool ok = true) {
        for (uint64_t i = 0; i < count; ++i) {
            ring.append(sampleAt((from + i) * 30, ok));
        }
    }
};

TEST(BatchThresholdTest, ExactCeilingAtBoundaries) {
    VigilUtils::PipelineConfig config;
    config.validate();
    ASSERT_EQ(config.thresholdPpm, 950000u);

    EXPECT_EQ(BatchGenerator::thresholdFor(20, config.thresholdPpm), 19u);
    EXPECT_EQ(BatchGenerator::thresholdFor(19, config.thresholdPpm), 19u);
    EXPECT_EQ(BatchGenerator::thresholdFor(1, config.thresholdPpm), 1u);
    EXPECT_EQ(BatchGenerator::thresholdFor(100, config.thresholdPpm), 95u);
    EXPECT_EQ(BatchGenerator::thresholdFor(0, config.thresholdPpm), 0u);
    EXPECT_EQ(BatchGenerator::thresholdFor(7, 1000000), 7u);
}

TEST(BatchSummaryTest, CountsAndWindowComeFromSamples) {
    Bitmap bitmap;
    std::vector<Sample> window = series({1, 1, 0, 1, 0});
    Batch batch = BatchGenerator::summarize(window, 950000, {}, bitmap);

    EXPECT_EQ(batch.n, 5u);
    EXPECT_EQ(batch.good, 3u);
    EXPECT_EQ(batch.good + (batch.n - batch.good), batch.n);
    EXPECT_EQ(batch.threshold, 5u);
    EXPECT_FALSE(batch.meetsThreshold());
    EXPECT_EQ(batch.window.start, 1000u);
    EXPECT_EQ(batch.window.end, 1120u);
    EXPECT_EQ(bitmap, (Bitmap{1, 1, 0, 1, 0}));
}

TEST(BatchSummaryTest, HashIsSha256OfBitmapThenSalt) {
    Bitmap bitmap{1, 0, 1};
    std::vector<uint8_t> salt{'a', 'b'};

    Digest256 expected = Vigil::Crypto::sha256(std::vector<uint8_t>{1, 0, 1, 'a', 'b'});
    EXPECT_EQ(BatchGenerator::hashBitmap(bitmap, salt), expected);
}

TEST(BatchSummaryTest, HashIsDeterministicAndSensitiveToEveryBit) {
    std::vector<uint8_t> salt{'s'};
    std::vector<Sample> window = series({1, 1, 1, 1, 1, 1, 1, 1, 0, 1});

    Bitmap first;
    Bitmap second;
    Batch a = BatchGenerator::summarize(window, 950000, salt, first);
    Batch b = BatchGenerator::summarize(window, 950000, salt, second);
    EXPECT_EQ(a.bitmapHash, b.bitmapHash);

    for (size_t i = 0; i < window.size(); ++i) {
        std::vector<Sample> flipped = window;
        flipped[i].ok = !flipped[i].ok;
        Bitmap ignored;
        Batch c = BatchGenerator::summarize(flipped, 950000, salt, ignored);
        EXPECT_NE(c.bitmapHash, a.bitmapHash) << "bit " << i;
    }

    Bitmap ignored;
    Batch otherSalt = BatchGenerator::summarize(window, 950000, {'t'}, ignored);
    EXPECT_NE(otherSalt.bitmapHash, a.bitmapHash);
}

TEST_F(BatchGeneratorTest, EmptyRingSkips) {
    SampleRing ring(config.ringCapacity);
    BatchGenerator generator(ring, config);

    BatchOutcome outcome = generator.tick();
    EXPECT_FALSE(outcome.batch.has_value());
    EXPECT_FALSE(outcome.skipReason.empty());
}

TEST_F(BatchGeneratorTest, SkipPolicyWaitsForFullWindow) {
    SampleRing ring(config.ringCapacity);
    BatchGenerator generator(ring, config);

    fill(ring, 1, 3);
    BatchOutcome early = generator.tick();
    EXPECT_FALSE(early.batch.has_value());
    EXPECT_EQ(early.pending, 3u);

    fill(ring, 4, 1);
    BatchOutcome full = generator.tick();
    ASSERT_TRUE(full.batch.has_value());
    EXPECT_EQ(full.batch->n, 4u);
    EXPECT_FALSE(full.batch->partial);
    EXPECT_EQ(full.batch->window.start, 30u);
    EXPECT_EQ(full.batch->window.end, 120u);
    EXPECT_EQ(full.pending, 0u);
}

TEST_F(BatchGeneratorTest, EmitPolicyFlagsPartialBatch) {
    config.partialWindowPolicy = VigilUtils::PartialWindowPolicy::EMIT;
    SampleRing ring(config.ringCapacity);
    BatchGenerator generator(ring, config);

    fill(ring, 1, 3);
    BatchOutcome outcome = generator.tick();
    ASSERT_TRUE(outcome.batch.has_value());
    EXPECT_TRUE(outcome.batch->partial);
    EXPECT_EQ(outcome.batch->n, 3u);
    EXPECT_EQ(outcome.batch->threshold, 3u);
    EXPECT_EQ(outcome.bitmap.size(), 3u);
}

TEST_F(BatchGeneratorTest, ConsecutiveWindowsNeverOverlap) {
    SampleRing ring(config.ringCapacity);
    BatchGenerator generator(ring, config);

    fill(ring, 1, 4);
    BatchOutcome first = generator.tick();
    fill(ring, 5, 2);
    BatchOutcome skipped = generator.tick();
    fill(ring, 7, 2);
    BatchOutcome second = generator.tick();

    ASSERT_TRUE(first.batch.has_value());
    EXPECT_FALSE(skipped.batch.has_value());
    ASSERT_TRUE(second.batch.has_value());
    EXPECT_LT(first.batch->window.end, second.batch->window.start);
    EXPECT_EQ(second.batch->window.start, 150u);
    EXPECT_EQ(second.batch->window.end, 240u);

    BatchOutcome idle = generator.tick();
    EXPECT_FALSE(idle.batch.has_value());
    EXPECT_EQ(idle.gapSamples, 0u);
}

TEST_F(BatchGeneratorTest, EvictedUnbatchedSamplesAreReportedAsGap) {
    SampleRing ring(config.ringCapacity);
    BatchGenerator generator(ring, config);

    fill(ring, 1, 4);
    ASSERT_TRUE(generator.tick().batch.has_value());

    // Sequences 5..12 appended, ring keeps 7..12
    fill(ring, 5, 8);
    BatchOutcome outcome = generator.tick();
    EXPECT_EQ(outcome.gapSamples, 2u);
    ASSERT_TRUE(outcome.batch.has_value());
    EXPECT_EQ(outcome.batch->window.start, 7u * 30);
    EXPECT_EQ(outcome.batch->window.end, 10u * 30);
    EXPECT_EQ(outcome.pending, 2u);
}

TEST_F(BatchGeneratorTest, UnvalidatedConfigIsRejected) {
    VigilUtils::PipelineConfig raw;
    SampleRing ring(4);
    EXPECT_THROW({ BatchGenerator generator(ring, raw); }, ConfigError);
}
