// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include <gtest/gtest.h>
#include <memory>

#include "core/BatchGenerator.hpp"
#include "core/VigilErrors.hpp"
#include "crypto/Ed25519Signer.hpp"
#include "modules/Prover.hpp"

using namespace Vigil::Core;
using namespace Vigil::Modules;
using Vigil::Crypto::Ed25519Signer;

namespace {
    const std::vector<uint8_t> kSalt{'d', 'e', 'p', 'l', 'o', 'y'};

    struct Statement {
        Bitmap bitmap;
        uint64_t n;
        uint64_t threshold;
        Digest256 hash;
    };

    // 20 samples, `failures` of them failed, threshold 19
    Statement statement(size_t failures) {
        Statement s;
        s.bitmap.assign(20, 1);
        for (size_t i = 0; i < failures; ++i) s.bitmap[i * 3 % 20] = 0;
        s.n = 20;
        s.threshold = BatchGenerator::thresholdFor(20, 950000);
        s.hash = BatchGenerator::hashBitmap(s.bitmap, kSalt);
        return s;
    }
}

class ProverBackendTest : public ::testing::TestWithParam<std::string> {
protected:
    std::shared_ptr<const Prover> prover;

    void SetUp() override {
        if (GetParam() == "digest") {
            prover = std::make_shared<DigestProver>(kSalt);
        } else {
            auto signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
            prover = std::make_shared<SignedProver>(signer, kSalt);
        }
    }
};

TEST_P(ProverBackendTest, ProofOfTrueStatementVerifies) {
    Statement s = statement(1);
    ProofArtifact artifact = prover->prove(s.bitmap, s.n, s.threshold, s.hash);

    EXPECT_EQ(artifact.scheme, prover->scheme());
    EXPECT_EQ(artifact.publicInputs.n, 20u);
    EXPECT_EQ(artifact.publicInputs.threshold, 19u);
    EXPECT_TRUE(prover->verify(artifact));
}

TEST_P(ProverBackendTest, TamperedBitmapHashFailsVerification) {
    Statement s = statement(0);
    ProofArtifact artifact = prover->prove(s.bitmap, s.n, s.threshold, s.hash);

    artifact.publicInputs.bitmapHash[5] ^= 0x01;
    EXPECT_FALSE(prover->verify(artifact));
}

TEST_P(ProverBackendTest, TamperedPublicCountsFailVerification) {
    Statement s = statement(0);
    ProofArtifact artifact = prover->prove(s.bitmap, s.n, s.threshold, s.hash);

    ProofArtifact lowered = artifact;
    lowered.publicInputs.threshold = 10;
    EXPECT_FALSE(prover->verify(lowered));

    ProofArtifact grown = artifact;
    grown.publicInputs.n = 40;
    EXPECT_FALSE(prover->verify(grown));
}

TEST_P(ProverBackendTest, TamperedProofBytesFailVerification) {
    Statement s = statement(0);
    ProofArtifact artifact = prover->prove(s.bitmap, s.n, s.threshold, s.hash);

    artifact.proofBytes.back() ^= 0x80;
    EXPECT_FALSE(prover->verify(artifact));

    artifact.proofBytes.pop_back();
    EXPECT_FALSE(prover->verify(artifact));
}

TEST_P(ProverBackendTest, FalseStatementIsRefused) {
    Statement s = statement(2);
    EXPECT_THROW(prover->prove(s.bitmap, s.n, s.threshold, s.hash), ProofGenerationError);
}

TEST_P(ProverBackendTest, BitmapNotMatchingHashIsRefused) {
    Statement s = statement(0);
    Digest256 other = BatchGenerator::hashBitmap(s.bitmap, {});
    EXPECT_THROW(prover->prove(s.bitmap, s.n, s.threshold, other), ProofGenerationError);
}

TEST_P(ProverBackendTest, LengthMismatchIsRefused) {
    Statement s = statement(0);
    EXPECT_THROW(prover->prove(s.bitmap, 21, s.threshold, s.hash), ProofGenerationError);
}

INSTANTIATE_TEST_SUITE_P(Backends, ProverBackendTest, ::testing::Values("digest", "signed"));

TEST(SignedProverTest, VerifierNeedsOnlyThePublicKey) {
    auto signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
    SignedProver prover(signer, kSalt);
    SignedProver verifier(signer->publicKey());

    Statement s = statement(0);
    ProofArtifact artifact = prover.prove(s.bitmap, s.n, s.threshold, s.hash);
    EXPECT_TRUE(verifier.verify(artifact));
    EXPECT_THROW(verifier.prove(s.bitmap, s.n, s.threshold, s.hash), ProofGenerationError);
}

TEST(SignedProverTest, OtherKeyDoesNotVerify) {
    auto signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
    SignedProver prover(signer, kSalt);
    SignedProver stranger(Ed25519Signer::generate().publicKey());

    Statement s = statement(0);
    EXPECT_FALSE(stranger.verify(prover.prove(s.bitmap, s.n, s.threshold, s.hash)));
}

TEST(ProverSchemeTest, BackendsDoNotAcceptEachOthersProofs) {
    auto signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
    DigestProver digest(kSalt);
    SignedProver signedProver(signer, kSalt);

    Statement s = statement(0);
    EXPECT_FALSE(signedProver.verify(digest.prove(s.bitmap, s.n, s.threshold, s.hash)));
    EXPECT_FALSE(digest.verify(signedProver.prove(s.bitmap, s.n, s.threshold, s.hash)));
}

TEST(ProverFactoryTest, DisabledProofsGiveNoProver) {
    VigilUtils::PipelineConfig config;
    config.proofsEnabled = false;
    auto signer = std::make_shared<Ed25519Signer>(Ed25519Signer::generate());
    EXPECT_EQ(makeProver(config, signer), nullptr);

    config.proofsEnabled = true;
    config.proverBackend = VigilUtils::ProverBackend::SIGNED;
    auto prover = makeProver(config, signer);
    ASSERT_NE(prover, nullptr);
    EXPECT_EQ(prover->scheme(), "ed25519-statement-v1");
}
