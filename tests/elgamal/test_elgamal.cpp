// VEIL - Twisted ElGamal Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>

#include "veil/core/errors.h"
#include "veil/elgamal/ciphertext.h"
#include "veil/elgamal/decryption_table.h"
#include "veil/elgamal/keys.h"

#include <algorithm>
#include <string>

namespace veil {
namespace elgamal {
namespace test {

using ed25519::Point;
using ed25519::Scalar;

namespace {

Bytes32 FilledSeed(Byte value) {
    Bytes32 seed;
    seed.fill(value);
    return seed;
}

// Encoding of P + (0, -1), i.e. (-x, -y). The result is on the curve but
// carries an order-2 component, so it lies outside the prime-order subgroup.
Bytes32 AddOrderTwoPoint(const Bytes32& encoded) {
    // 2^255 - 19, little endian
    static const Byte FIELD_PRIME[32] = {
        0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f};

    Bytes32 out;
    int borrow = 0;
    for (size_t i = 0; i < 32; ++i) {
        const int y = (i == 31) ? (encoded[i] & 0x7f) : encoded[i];
        int diff = FIELD_PRIME[i] - y - borrow;
        borrow = diff < 0 ? 1 : 0;
        out[i] = static_cast<Byte>(diff + 256 * borrow);
    }
    out[31] |= (encoded[31] & 0x80) ^ 0x80;
    return out;
}

} // anonymous namespace

class ElGamalTest : public ::testing::Test {
protected:
    void SetUp() override {
        keys_ = GenerateKeypair(FilledSeed(42));
    }

    KeyPair keys_;
};

// ============================================================================
// Keys
// ============================================================================

TEST_F(ElGamalTest, SeededKeypairIsDeterministic) {
    KeyPair again = GenerateKeypair(FilledSeed(42));
    EXPECT_EQ(again.publicKey, keys_.publicKey);
    EXPECT_EQ(again.secretKey, keys_.secretKey);

    KeyPair other = GenerateKeypair(FilledSeed(43));
    EXPECT_NE(other.publicKey, keys_.publicKey);
}

TEST_F(ElGamalTest, SecretIsClamped) {
    EXPECT_EQ(keys_.secretKey[0] & 7, 0);
    EXPECT_EQ(keys_.secretKey[31] & 128, 0);
    EXPECT_EQ(keys_.secretKey[31] & 64, 64);
}

TEST_F(ElGamalTest, PublicKeyMatchesSecret) {
    EXPECT_EQ(ed25519::ScalarBaseMultiply(keys_.SecretScalar()).ToBytes(), keys_.publicKey);
    EXPECT_TRUE(DecodePublicKey(keys_.publicKey).has_value());
}

TEST_F(ElGamalTest, RandomKeypairsDiffer) {
    KeyPair a = GenerateKeypair();
    KeyPair b = GenerateKeypair();
    EXPECT_NE(a.secretKey, b.secretKey);
    EXPECT_NE(a.publicKey, b.publicKey);
}

TEST(KeyDerivationTest, DeriveKeypair) {
    const std::string signer = "validator-signing-key";
    KeyPair a = DeriveKeypair(ByteView(signer), "account-1");
    KeyPair b = DeriveKeypair(ByteView(signer), "account-1");
    KeyPair c = DeriveKeypair(ByteView(signer), "account-2");

    EXPECT_EQ(a.publicKey, b.publicKey);
    EXPECT_EQ(a.secretKey, b.secretKey);
    EXPECT_NE(a.publicKey, c.publicKey);
}

// ============================================================================
// Encryption and Decryption
// ============================================================================

TEST_F(ElGamalTest, EncryptDecrypt) {
    Ciphertext ct = Encrypt(1000, keys_.publicKey);
    auto amount = Decrypt(ct, keys_.secretKey, 2000);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(*amount, 1000u);
}

TEST_F(ElGamalTest, EncryptZero) {
    Ciphertext ct = Encrypt(0, keys_.publicKey);
    EXPECT_EQ(Decrypt(ct, keys_.secretKey, 10), 0u);
}

TEST_F(ElGamalTest, DecryptOutsideBound) {
    Ciphertext ct = Encrypt(500, keys_.publicKey);
    EXPECT_FALSE(Decrypt(ct, keys_.secretKey, 499).has_value());
    EXPECT_EQ(Decrypt(ct, keys_.secretKey, 500), 500u);
}

TEST_F(ElGamalTest, DecryptWithWrongKey) {
    KeyPair other = GenerateKeypair(FilledSeed(7));
    Ciphertext ct = Encrypt(25, keys_.publicKey);
    EXPECT_FALSE(Decrypt(ct, other.secretKey, 1000).has_value());
}

TEST_F(ElGamalTest, EncryptionIsRandomized) {
    Ciphertext a = Encrypt(77, keys_.publicKey);
    Ciphertext b = Encrypt(77, keys_.publicKey);
    EXPECT_NE(a.commitment, b.commitment);
    EXPECT_NE(a.handle, b.handle);
    EXPECT_EQ(Decrypt(a, keys_.secretKey, 100), Decrypt(b, keys_.secretKey, 100));
}

TEST_F(ElGamalTest, EncryptWithIsDeterministic) {
    Scalar r = Scalar::FromUint64(123456789);
    Ciphertext a = EncryptWith(9, keys_.publicKey, r);
    Ciphertext b = EncryptWith(9, keys_.publicKey, r);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.handle, ed25519::ScalarBaseMultiply(r).ToBytes());
}

TEST_F(ElGamalTest, EncryptWithRandomnessReturnsNonce) {
    EncryptionResult result = EncryptWithRandomness(31, keys_.publicKey);
    EXPECT_EQ(result.ciphertext, EncryptWith(31, keys_.publicKey, result.randomness));
}

TEST_F(ElGamalTest, DecryptToPointRecoversAmountTimesG) {
    Ciphertext ct = Encrypt(12, keys_.publicKey);
    auto point = DecryptToPoint(ct, keys_.SecretScalar());
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(*point, ed25519::ScalarBaseMultiply(Scalar::FromUint64(12)));
}

// ============================================================================
// Amount Domains
// ============================================================================

TEST_F(ElGamalTest, FastDecryptDomainBoundary) {
    EXPECT_NO_THROW(Encrypt(MAX_FAST_DECRYPT_AMOUNT, keys_.publicKey));
    EXPECT_THROW(Encrypt(MAX_FAST_DECRYPT_AMOUNT + 1, keys_.publicKey), InputDomainError);
}

TEST_F(ElGamalTest, RangeProofDomainAcceptsFullWidth) {
    EXPECT_NO_THROW(Encrypt(MAX_RANGE_PROOF_AMOUNT, keys_.publicKey, AmountDomain::RangeProof));
    EXPECT_EQ(MaxAmount(AmountDomain::RangeProof), MAX_RANGE_PROOF_AMOUNT);
    EXPECT_EQ(MaxAmount(AmountDomain::FastDecrypt), MAX_FAST_DECRYPT_AMOUNT);
}

TEST_F(ElGamalTest, InvalidPublicKeyThrows) {
    Bytes32 bad;
    bad.fill(0xff);
    EXPECT_FALSE(DecodePublicKey(bad).has_value());
    EXPECT_THROW(Encrypt(1, bad), MalformedDataError);
}

// ============================================================================
// Homomorphic Operations
// ============================================================================

TEST_F(ElGamalTest, AddCiphertexts) {
    Ciphertext a = Encrypt(300, keys_.publicKey);
    Ciphertext b = Encrypt(450, keys_.publicKey);
    EXPECT_EQ(Decrypt(Add(a, b), keys_.secretKey, 1000), 750u);
}

TEST_F(ElGamalTest, SubtractCiphertexts) {
    Ciphertext a = Encrypt(1000, keys_.publicKey);
    Ciphertext b = Encrypt(400, keys_.publicKey);
    EXPECT_EQ(Decrypt(Subtract(a, b), keys_.secretKey, 1000), 600u);
}

TEST_F(ElGamalTest, SubtractBelowZeroDoesNotDecrypt) {
    Ciphertext a = Encrypt(5, keys_.publicKey);
    Ciphertext b = Encrypt(10, keys_.publicKey);
    EXPECT_FALSE(Decrypt(Subtract(a, b), keys_.secretKey, 1000).has_value());
}

TEST_F(ElGamalTest, ScaleCiphertext) {
    Ciphertext ct = Encrypt(7, keys_.publicKey);
    EXPECT_EQ(Decrypt(Scale(ct, Scalar::FromUint64(3)), keys_.secretKey, 100), 21u);
}

TEST_F(ElGamalTest, AddAndSubtractPlainAmounts) {
    Ciphertext ct = Encrypt(100, keys_.publicKey);

    Ciphertext more = AddAmount(ct, 50);
    EXPECT_EQ(more.handle, ct.handle);
    EXPECT_EQ(Decrypt(more, keys_.secretKey, 1000), 150u);

    Ciphertext less = SubtractAmount(ct, 40);
    EXPECT_EQ(less.handle, ct.handle);
    EXPECT_EQ(Decrypt(less, keys_.secretKey, 1000), 60u);
}

TEST_F(ElGamalTest, ReRandomizeKeepsPlaintext) {
    Ciphertext ct = Encrypt(64, keys_.publicKey);
    Ciphertext fresh = ReRandomize(ct, keys_.publicKey);
    EXPECT_NE(fresh.commitment, ct.commitment);
    EXPECT_NE(fresh.handle, ct.handle);
    EXPECT_EQ(Decrypt(fresh, keys_.secretKey, 100), 64u);
}

TEST_F(ElGamalTest, HomomorphicOpsRejectGarbage) {
    Ciphertext good = Encrypt(1, keys_.publicKey);
    Ciphertext garbage;
    garbage.commitment.fill(0xff);
    garbage.handle.fill(0xff);

    EXPECT_THROW(Add(good, garbage), MalformedDataError);
    EXPECT_THROW(Subtract(garbage, good), MalformedDataError);
    EXPECT_THROW(Scale(garbage, Scalar::One()), MalformedDataError);
    EXPECT_THROW(AddAmount(garbage, 1), MalformedDataError);
    EXPECT_FALSE(Decrypt(garbage, keys_.secretKey, 10).has_value());
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(ElGamalTest, SerializeLayout) {
    Ciphertext ct = Encrypt(11, keys_.publicKey);
    Bytes64 wire = SerializeCiphertext(ct);
    EXPECT_TRUE(std::equal(ct.commitment.begin(), ct.commitment.end(), wire.begin()));
    EXPECT_TRUE(std::equal(ct.handle.begin(), ct.handle.end(), wire.begin() + 32));
    EXPECT_EQ(DeserializeCiphertext(wire), ct);
}

TEST_F(ElGamalTest, DeserializeRejectsWrongLength) {
    Bytes shortBuf(63, 0);
    Bytes longBuf(65, 0);
    EXPECT_THROW(DeserializeCiphertext(shortBuf), MalformedDataError);
    EXPECT_THROW(DeserializeCiphertext(longBuf), MalformedDataError);
}

TEST_F(ElGamalTest, ValidityCheck) {
    EXPECT_TRUE(IsValidCiphertext(Encrypt(3, keys_.publicKey)));

    Ciphertext garbage;
    garbage.commitment.fill(0xff);
    EXPECT_FALSE(IsValidCiphertext(garbage));
}

TEST_F(ElGamalTest, ValidityCheckRejectsTorsion) {
    Ciphertext ct = Encrypt(3, keys_.publicKey);
    ASSERT_TRUE(Point::FromBytes(ct.handle).has_value());

    Ciphertext badHandle = ct;
    badHandle.handle = AddOrderTwoPoint(ct.handle);
    EXPECT_FALSE(IsValidCiphertext(badHandle));

    Ciphertext badCommitment = ct;
    badCommitment.commitment = AddOrderTwoPoint(ct.commitment);
    EXPECT_FALSE(IsValidCiphertext(badCommitment));

    // The order-2 point on its own
    Ciphertext smallOrder = ct;
    smallOrder.handle = AddOrderTwoPoint(Point::Identity().ToBytes());
    smallOrder.handle[31] &= 0x7f;
    EXPECT_FALSE(IsValidCiphertext(smallOrder));
}

// ============================================================================
// Decryption Table
// ============================================================================

TEST(DecryptionTableTest, RejectsBadWidth) {
    EXPECT_THROW(DecryptionTable(0), InputDomainError);
    EXPECT_THROW(DecryptionTable(MAX_TABLE_BITS + 1), InputDomainError);
}

TEST(DecryptionTableTest, AgreesWithLinearSearch) {
    DecryptionTable table(8);
    EXPECT_EQ(table.Bits(), 8u);
    EXPECT_EQ(table.BabySteps(), 256u);

    for (Amount v : {0ULL, 1ULL, 255ULL, 256ULL, 257ULL, 1000ULL, 4095ULL}) {
        Point target = ed25519::ScalarBaseMultiply(Scalar::FromUint64(v));
        EXPECT_EQ(table.Solve(target, 5000), SolveDiscreteLogLinear(target, 5000)) << v;
        EXPECT_EQ(table.Solve(target, 5000), v);
    }
}

TEST(DecryptionTableTest, RespectsBound) {
    DecryptionTable table(8);
    Point target = ed25519::ScalarBaseMultiply(Scalar::FromUint64(300));
    EXPECT_FALSE(table.Solve(target, 299).has_value());
    EXPECT_EQ(table.Solve(target, 300), 300u);
}

TEST(DecryptionTableTest, LargeAmount) {
    DecryptionTable table(12);
    const Amount v = (1ULL << 20) + 12345;
    Point target = ed25519::ScalarBaseMultiply(Scalar::FromUint64(v));
    EXPECT_EQ(table.Solve(target, 1ULL << 21), v);
}

TEST(DecryptionTableTest, DecryptCiphertext) {
    KeyPair keys = GenerateKeypair();
    DecryptionTable table(10);
    Ciphertext ct = Encrypt(70000, keys.publicKey);
    EXPECT_EQ(table.Decrypt(ct, keys.secretKey, 100000), 70000u);
    EXPECT_FALSE(table.Decrypt(ct, keys.secretKey, 69999).has_value());
}

} // namespace test
} // namespace elgamal
} // namespace veil
