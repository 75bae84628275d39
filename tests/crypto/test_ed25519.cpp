// VEIL - Edwards25519 Arithmetic Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/hex.h"
#include "veil/crypto/ed25519.h"
#include "veil/crypto/hash.h"

#include <stdexcept>
#include <vector>

using namespace veil;
using namespace veil::ed25519;

namespace {

// Group order l, little endian
const char* ORDER_HEX = "edd3f55c1a631258d69cf7a2def9de1400000000000000000000000000000010";

Scalar S(uint64_t v) { return Scalar::FromUint64(v); }

} // anonymous namespace

// ============================================================================
// Scalar
// ============================================================================

TEST(ScalarTest, Arithmetic) {
    EXPECT_EQ(S(2) + S(3), S(5));
    EXPECT_EQ(S(7) - S(3), S(4));
    EXPECT_EQ(S(6) * S(7), S(42));
    EXPECT_EQ(S(5) + (-S(5)), Scalar());
    EXPECT_TRUE(Scalar().IsZero());
    EXPECT_FALSE(Scalar::One().IsZero());
}

TEST(ScalarTest, WrapsAtGroupOrder) {
    // 0 - 1 = l - 1, and (l - 1) + 1 = 0
    Scalar minusOne = Scalar() - Scalar::One();
    EXPECT_TRUE((minusOne + Scalar::One()).IsZero());

    Bytes32 lMinusOne = HexToBytes32(ORDER_HEX);
    lMinusOne[0] -= 1;
    EXPECT_EQ(minusOne.ToBytes(), lMinusOne);
}

TEST(ScalarTest, CanonicalDecoding) {
    EXPECT_FALSE(Scalar::FromCanonicalBytes(HexToBytes32(ORDER_HEX)).has_value());

    Bytes32 lMinusOne = HexToBytes32(ORDER_HEX);
    lMinusOne[0] -= 1;
    auto s = Scalar::FromCanonicalBytes(lMinusOne);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->ToBytes(), lMinusOne);
}

TEST(ScalarTest, ReductionModOrder) {
    Bytes32 order = HexToBytes32(ORDER_HEX);
    EXPECT_TRUE(Scalar::FromBytesModOrder(order.data(), order.size()).IsZero());

    Bytes wide(64, 0);
    wide[0] = 9;
    EXPECT_EQ(Scalar::FromBytesModOrder(wide.data(), wide.size()), S(9));
}

TEST(ScalarTest, Inverse) {
    Scalar a = Scalar::Random();
    EXPECT_EQ(a * a.Inverse(), Scalar::One());
    EXPECT_THROW(Scalar().Inverse(), std::domain_error);
}

TEST(ScalarTest, RandomIsNonZeroAndDistinct) {
    Scalar a = Scalar::Random();
    Scalar b = Scalar::Random();
    EXPECT_FALSE(a.IsZero());
    EXPECT_NE(a, b);
}

// ============================================================================
// Point
// ============================================================================

TEST(PointTest, GeneratorEncoding) {
    EXPECT_EQ(BytesToHex(Point::Generator().ToBytes()),
              "5866666666666666666666666666666666666666666666666666666666666666");
}

TEST(PointTest, IdentityEncoding) {
    EXPECT_EQ(BytesToHex(Point::Identity().ToBytes()),
              "0100000000000000000000000000000000000000000000000000000000000000");
    EXPECT_TRUE(Point::Identity().IsIdentity());
    EXPECT_FALSE(Point::Generator().IsIdentity());
}

TEST(PointTest, Rfc8032PublicKey) {
    // RFC 8032 section 7.1, test 1
    Bytes32 secret = HexToBytes32(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    Bytes64 h = SHA512Hash(secret);
    h[0] &= 248;
    h[31] &= 127;
    h[31] |= 64;

    Scalar a = Scalar::FromBytesModOrder(h.data(), 32);
    EXPECT_EQ(BytesToHex(ScalarBaseMultiply(a).ToBytes()),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST(PointTest, DecodeRoundTrip) {
    Point p = ScalarBaseMultiply(Scalar::Random());
    auto decoded = Point::FromBytes(p.ToBytes());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, p);
}

TEST(PointTest, DecodeRejectsNonCanonical) {
    Bytes32 bad;
    bad.fill(0xff);
    EXPECT_FALSE(Point::FromBytes(bad).has_value());
    bad[31] = 0x7f;
    EXPECT_FALSE(Point::FromBytes(bad).has_value());
}

TEST(PointTest, DecodeAcceptsIdentity) {
    auto id = Point::FromBytes(Point::Identity().ToBytes());
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(id->IsIdentity());
}

TEST(PointTest, DecodeRejectsSmallOrder) {
    const char* smallOrder[] = {
        // (0, -1), order 2
        "ecffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
        // (+-sqrt(-1), 0), order 4
        "0000000000000000000000000000000000000000000000000000000000000000",
        "0000000000000000000000000000000000000000000000000000000000000080",
        // order 8
        "26e8958fc2b227b045c3f489f2ef98f0d5dfac05d3c63339b13802886d53fc05",
        "c7176a703d4dd84fba3c0b760d10670f2a2053fa2c39ccc64ec7fd7792ac037a",
        "26e8958fc2b227b045c3f489f2ef98f0d5dfac05d3c63339b13802886d53fc85",
    };
    for (const char* hex : smallOrder) {
        EXPECT_FALSE(Point::FromBytes(HexToBytes32(hex)).has_value()) << hex;
    }
}

TEST(PointTest, DecodeRejectsTorsionComponent) {
    // B + (0, -1) = (-x, -y): on the curve, but of order 2l
    Bytes32 mixed = HexToBytes32(
        "9599999999999999999999999999999999999999999999999999999999999999");
    EXPECT_FALSE(Point::FromBytes(mixed).has_value());

    // The same y with the sign bit cleared is -(B + T), also outside the subgroup
    mixed[31] &= 0x7f;
    EXPECT_FALSE(Point::FromBytes(mixed).has_value());
}

TEST(PointTest, GroupLaws) {
    const Point& g = Point::Generator();
    Point p = g * S(11);
    Point q = g * S(31);

    EXPECT_EQ(p + q, g * S(42));
    EXPECT_EQ(q - p, g * S(20));
    EXPECT_EQ(p + (-p), Point::Identity());
    EXPECT_EQ(p + p, g * S(22));
    EXPECT_EQ(p + Point::Identity(), p);
    EXPECT_EQ(Point::Identity() - p, -p);
}

TEST(PointTest, ScalarMultiplyDistributes) {
    const Point& g = Point::Generator();
    Scalar a = Scalar::Random();
    Scalar b = Scalar::Random();
    EXPECT_EQ(g * (a + b), g * a + g * b);
    EXPECT_EQ((g * a) * b, g * (a * b));
    EXPECT_EQ(ScalarBaseMultiply(a), g * a);
    EXPECT_TRUE((g * Scalar()).IsIdentity());
}

TEST(PointTest, OrderAnnihilatesGenerator) {
    // (l - 1)*G + G = l*G = identity
    Scalar minusOne = Scalar() - Scalar::One();
    EXPECT_TRUE((Point::Generator() * minusOne + Point::Generator()).IsIdentity());
}

TEST(PointTest, BatchToBytesMatchesToBytes) {
    std::vector<Point> points;
    points.push_back(Point::Identity());
    for (int i = 0; i < 5; ++i) {
        points.push_back(ScalarBaseMultiply(Scalar::Random()));
    }
    std::vector<Bytes32> batch = Point::BatchToBytes(points);
    ASSERT_EQ(batch.size(), points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_EQ(batch[i], points[i].ToBytes());
    }
}

// ============================================================================
// Multi-scalar multiplication
// ============================================================================

TEST(MultiScalarTest, MatchesNaiveSum) {
    std::vector<Scalar> scalars;
    std::vector<Point> points;
    Point expected;
    for (int i = 0; i < 9; ++i) {
        scalars.push_back(Scalar::Random());
        points.push_back(ScalarBaseMultiply(Scalar::Random()));
        expected += points.back() * scalars.back();
    }
    EXPECT_EQ(MultiScalarMultiply(scalars, points), expected);
}

TEST(MultiScalarTest, EmptyAndMismatch) {
    EXPECT_TRUE(MultiScalarMultiply({}, {}).IsIdentity());
    EXPECT_THROW(MultiScalarMultiply({S(1)}, {}), std::invalid_argument);
}

// ============================================================================
// Hash to point
// ============================================================================

TEST(HashToPointTest, LandsInSubgroup) {
    for (uint32_t i = 0; i < 4; ++i) {
        Point h = HashToPoint("subgroup", i);
        EXPECT_TRUE(Point::FromBytes(h.ToBytes()).has_value());
        // l * h = identity
        Scalar minusOne = Scalar() - Scalar::One();
        EXPECT_TRUE((h * minusOne + h).IsIdentity());
    }
}

TEST(HashToPointTest, DeterministicAndIndependent) {
    Point a = HashToPoint("label", 0);
    EXPECT_EQ(a, HashToPoint("label", 0));
    EXPECT_NE(a, HashToPoint("label", 1));
    EXPECT_NE(a, HashToPoint("other", 0));
    EXPECT_FALSE(a.IsIdentity());
    EXPECT_NE(a, Point::Generator());
}
