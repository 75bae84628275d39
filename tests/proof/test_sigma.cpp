// VEIL - Sigma Protocol Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>

#include "veil/core/errors.h"
#include "veil/elgamal/ciphertext.h"
#include "veil/elgamal/keys.h"
#include "veil/proof/commitment.h"
#include "veil/proof/sigma.h"

#include <utility>

namespace veil {
namespace proof {
namespace test {

using ed25519::Scalar;
using elgamal::Ciphertext;
using elgamal::KeyPair;

class SigmaTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = elgamal::GenerateKeypair();
        bob_ = elgamal::GenerateKeypair();
    }

    CrossKeyStatement MakeStatement(Amount amount, const Scalar& r) const {
        CrossKeyStatement st;
        st.destinationKey = bob_.publicKey;
        st.sourceKey = alice_.publicKey;
        Ciphertext dest = elgamal::EncryptWith(amount, bob_.publicKey, r);
        Ciphertext src = elgamal::EncryptWith(amount, alice_.publicKey, r);
        st.destinationCommitment = dest.commitment;
        st.sourceCommitment = src.commitment;
        st.handle = dest.handle;
        st.pedersenCommitment = PedersenCommit(amount, r).commitment;
        return st;
    }

    KeyPair alice_;
    KeyPair bob_;
};

// ============================================================================
// Validity
// ============================================================================

TEST_F(SigmaTest, ValidityProofVerifies) {
    auto enc = elgamal::EncryptWithRandomness(500, alice_.publicKey);
    ValidityProof proof = GenerateValidityProof(enc.ciphertext, alice_.publicKey, 500,
                                                enc.randomness);
    EXPECT_TRUE(VerifyValidityProof(proof, enc.ciphertext, alice_.publicKey));

    Bytes wire = proof.ToBytes();
    EXPECT_EQ(wire.size(), VALIDITY_PROOF_SIZE);
    EXPECT_TRUE(VerifyValidityProof(wire, enc.ciphertext, alice_.publicKey));
}

TEST_F(SigmaTest, ValidityProofBoundToCiphertext) {
    auto enc = elgamal::EncryptWithRandomness(500, alice_.publicKey);
    ValidityProof proof = GenerateValidityProof(enc.ciphertext, alice_.publicKey, 500,
                                                enc.randomness);

    Ciphertext other = elgamal::Encrypt(500, alice_.publicKey);
    EXPECT_FALSE(VerifyValidityProof(proof, other, alice_.publicKey));
    EXPECT_FALSE(VerifyValidityProof(proof, enc.ciphertext, bob_.publicKey));
}

TEST_F(SigmaTest, ValidityProofWithWrongWitnessFails) {
    auto enc = elgamal::EncryptWithRandomness(500, alice_.publicKey);
    ValidityProof wrongAmount = GenerateValidityProof(enc.ciphertext, alice_.publicKey, 501,
                                                      enc.randomness);
    EXPECT_FALSE(VerifyValidityProof(wrongAmount, enc.ciphertext, alice_.publicKey));

    ValidityProof wrongRandom = GenerateValidityProof(enc.ciphertext, alice_.publicKey, 500,
                                                      Scalar::Random());
    EXPECT_FALSE(VerifyValidityProof(wrongRandom, enc.ciphertext, alice_.publicKey));
}

TEST_F(SigmaTest, ValidityProofMalformedBytes) {
    Ciphertext ct = elgamal::Encrypt(1, alice_.publicKey);
    EXPECT_FALSE(VerifyValidityProof(Bytes(95, 0), ct, alice_.publicKey));
    EXPECT_FALSE(VerifyValidityProof(Bytes(96, 0xff), ct, alice_.publicKey));
    EXPECT_FALSE(ValidityProof::FromBytes(Bytes(97, 0)).has_value());
}

TEST_F(SigmaTest, ValidityProofRejectsBadKey) {
    auto enc = elgamal::EncryptWithRandomness(3, alice_.publicKey);
    Bytes32 bad;
    bad.fill(0xff);
    EXPECT_THROW(GenerateValidityProof(enc.ciphertext, bad, 3, enc.randomness),
                 MalformedDataError);

    ValidityProof proof = GenerateValidityProof(enc.ciphertext, alice_.publicKey, 3,
                                                enc.randomness);
    EXPECT_FALSE(VerifyValidityProof(proof, enc.ciphertext, bad));
}

// ============================================================================
// Equality (same key)
// ============================================================================

TEST_F(SigmaTest, EqualityProofVerifies) {
    auto first = elgamal::EncryptWithRandomness(1000, alice_.publicKey);
    auto second = elgamal::EncryptWithRandomness(1000, alice_.publicKey);

    EqualityProof proof = GenerateEqualityProof(first.ciphertext, second.ciphertext,
                                                alice_.publicKey, first.randomness,
                                                second.randomness);
    EXPECT_TRUE(VerifyEqualityProof(proof, first.ciphertext, second.ciphertext,
                                    alice_.publicKey));

    Bytes wire = proof.ToBytes();
    EXPECT_EQ(wire.size(), EQUALITY_PROOF_SIZE);
    EXPECT_TRUE(VerifyEqualityProof(wire, first.ciphertext, second.ciphertext,
                                    alice_.publicKey));
}

TEST_F(SigmaTest, EqualityProofDifferentAmountsFails) {
    auto first = elgamal::EncryptWithRandomness(1000, alice_.publicKey);
    auto second = elgamal::EncryptWithRandomness(999, alice_.publicKey);

    EqualityProof proof = GenerateEqualityProof(first.ciphertext, second.ciphertext,
                                                alice_.publicKey, first.randomness,
                                                second.randomness);
    EXPECT_FALSE(VerifyEqualityProof(proof, first.ciphertext, second.ciphertext,
                                     alice_.publicKey));
}

TEST_F(SigmaTest, EqualityProofSwappedCiphertextsFails) {
    auto first = elgamal::EncryptWithRandomness(8, alice_.publicKey);
    auto second = elgamal::EncryptWithRandomness(8, alice_.publicKey);
    EqualityProof proof = GenerateEqualityProof(first.ciphertext, second.ciphertext,
                                                alice_.publicKey, first.randomness,
                                                second.randomness);
    EXPECT_FALSE(VerifyEqualityProof(proof, second.ciphertext, first.ciphertext,
                                     alice_.publicKey));
}

TEST_F(SigmaTest, EqualityProofTamperedFails) {
    auto first = elgamal::EncryptWithRandomness(8, alice_.publicKey);
    auto second = elgamal::EncryptWithRandomness(8, alice_.publicKey);
    Bytes wire = GenerateEqualityProof(first.ciphertext, second.ciphertext, alice_.publicKey,
                                       first.randomness, second.randomness).ToBytes();
    wire[130] ^= 0x01;
    EXPECT_FALSE(VerifyEqualityProof(wire, first.ciphertext, second.ciphertext,
                                     alice_.publicKey));
    EXPECT_FALSE(VerifyEqualityProof(Bytes(10, 0), first.ciphertext, second.ciphertext,
                                     alice_.publicKey));
}

// ============================================================================
// Cross-key Equality
// ============================================================================

TEST_F(SigmaTest, CrossKeyProofVerifies) {
    Scalar r = Scalar::Random();
    CrossKeyStatement st = MakeStatement(3000, r);

    CrossKeyEqualityProof proof = GenerateCrossKeyEqualityProof(st, 3000, r);
    EXPECT_TRUE(VerifyCrossKeyEqualityProof(proof, st));

    Bytes wire = proof.ToBytes();
    EXPECT_EQ(wire.size(), CROSS_KEY_EQUALITY_PROOF_SIZE);
    EXPECT_TRUE(VerifyCrossKeyEqualityProof(wire, st));
}

TEST_F(SigmaTest, CrossKeyProofDetectsMismatch) {
    Scalar r = Scalar::Random();
    CrossKeyStatement st = MakeStatement(3000, r);
    CrossKeyEqualityProof proof = GenerateCrossKeyEqualityProof(st, 3000, r);

    // Source side debits a different amount
    CrossKeyStatement skewed = st;
    skewed.sourceCommitment = elgamal::EncryptWith(3001, alice_.publicKey, r).commitment;
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(proof, skewed));

    // Range proof commits to a different amount
    CrossKeyStatement wrongV = st;
    wrongV.pedersenCommitment = PedersenCommit(2999, r).commitment;
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(proof, wrongV));

    // Keys swapped
    CrossKeyStatement swapped = st;
    std::swap(swapped.destinationKey, swapped.sourceKey);
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(proof, swapped));
}

TEST_F(SigmaTest, CrossKeyProofWithWrongWitnessFails) {
    Scalar r = Scalar::Random();
    CrossKeyStatement st = MakeStatement(50, r);
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(GenerateCrossKeyEqualityProof(st, 51, r), st));
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(
        GenerateCrossKeyEqualityProof(st, 50, Scalar::Random()), st));
}

TEST_F(SigmaTest, CrossKeyProofMalformed) {
    Scalar r = Scalar::Random();
    CrossKeyStatement st = MakeStatement(50, r);
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(Bytes(191, 0), st));
    EXPECT_FALSE(VerifyCrossKeyEqualityProof(Bytes(192, 0xff), st));

    CrossKeyStatement bad = st;
    bad.destinationKey.fill(0xff);
    EXPECT_THROW(GenerateCrossKeyEqualityProof(bad, 50, r), MalformedDataError);
}

// ============================================================================
// Ciphertext-Commitment Equality
// ============================================================================

TEST_F(SigmaTest, CiphertextCommitmentProofVerifies) {
    Ciphertext ct = elgamal::Encrypt(7000, alice_.publicKey);
    Scalar rho = GenerateBlinding();
    Bytes32 V = PedersenCommit(7000, rho).commitment;

    CiphertextCommitmentProof proof = GenerateCiphertextCommitmentProof(
        ct, alice_.publicKey, V, alice_.secretKey, 7000, rho);
    EXPECT_TRUE(VerifyCiphertextCommitmentProof(proof, ct, alice_.publicKey, V));

    Bytes wire = proof.ToBytes();
    EXPECT_EQ(wire.size(), CIPHERTEXT_COMMITMENT_PROOF_SIZE);
    EXPECT_TRUE(VerifyCiphertextCommitmentProof(wire, ct, alice_.publicKey, V));
}

TEST_F(SigmaTest, CiphertextCommitmentProofDetectsMismatch) {
    Ciphertext ct = elgamal::Encrypt(7000, alice_.publicKey);
    Scalar rho = GenerateBlinding();
    Bytes32 V = PedersenCommit(7000, rho).commitment;
    CiphertextCommitmentProof proof = GenerateCiphertextCommitmentProof(
        ct, alice_.publicKey, V, alice_.secretKey, 7000, rho);

    Bytes32 otherV = PedersenCommit(7001, rho).commitment;
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(proof, ct, alice_.publicKey, otherV));

    Ciphertext otherCt = elgamal::Encrypt(7000, alice_.publicKey);
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(proof, otherCt, alice_.publicKey, V));
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(proof, ct, bob_.publicKey, V));
}

TEST_F(SigmaTest, CiphertextCommitmentProofWrongAmountFails) {
    Ciphertext ct = elgamal::Encrypt(7000, alice_.publicKey);
    Scalar rho = GenerateBlinding();
    Bytes32 V = PedersenCommit(6000, rho).commitment;
    CiphertextCommitmentProof proof = GenerateCiphertextCommitmentProof(
        ct, alice_.publicKey, V, alice_.secretKey, 6000, rho);
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(proof, ct, alice_.publicKey, V));
}

TEST_F(SigmaTest, CiphertextCommitmentProofMalformed) {
    Ciphertext ct = elgamal::Encrypt(1, alice_.publicKey);
    Bytes32 V = PedersenCommit(1, GenerateBlinding()).commitment;
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(Bytes(192, 0xff), ct, alice_.publicKey, V));
    EXPECT_FALSE(VerifyCiphertextCommitmentProof(Bytes{}, ct, alice_.publicKey, V));

    Ciphertext garbage = ct;
    garbage.handle.fill(0xff);
    EXPECT_THROW(GenerateCiphertextCommitmentProof(garbage, alice_.publicKey, V,
                                                   alice_.secretKey, 1, Scalar::One()),
                 MalformedDataError);
}

} // namespace test
} // namespace proof
} // namespace veil
