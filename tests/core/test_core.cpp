// VEIL - Core Utility Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/errors.h"
#include "veil/core/hex.h"
#include "veil/core/random.h"
#include "veil/core/types.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace veil;

// ============================================================================
// Random
// ============================================================================

TEST(RandomTest, GetRandBytesNonZero) {
    std::vector<uint8_t> bytes(32);
    GetRandBytes(bytes.data(), bytes.size());

    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    std::vector<uint8_t> bytes1(32);
    std::vector<uint8_t> bytes2(32);

    GetRandBytes(bytes1.data(), bytes1.size());
    GetRandBytes(bytes2.data(), bytes2.size());

    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
}

TEST(RandomTest, GetRandBytes32Different) {
    EXPECT_NE(GetRandBytes32(), GetRandBytes32());
}

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, RoundTrip) {
    Bytes data = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "0001abff");
    EXPECT_EQ(HexToBytes("0001abff"), data);
    EXPECT_EQ(HexToBytes("0001ABFF"), data);
}

TEST(HexTest, RejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_THROW(HexToBytes32("00"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

// ============================================================================
// Errors
// ============================================================================

TEST(ErrorsTest, Hierarchy) {
    EXPECT_THROW(throw InputDomainError("x"), std::invalid_argument);
    EXPECT_THROW(throw MalformedDataError("x"), std::invalid_argument);
    EXPECT_THROW(throw AccelerationError("x"), std::runtime_error);

    try {
        throw InsufficientBalanceError("short", 42);
    } catch (const InsufficientBalanceError& e) {
        EXPECT_EQ(e.Requested(), 42u);
        EXPECT_STREQ(e.what(), "short");
    }
}

TEST(SpanTest, Views) {
    Bytes32 arr{};
    arr[0] = 7;
    ByteView view(arr);
    EXPECT_EQ(view.size(), 32u);
    EXPECT_EQ(view[0], 7);

    std::string s = "abc";
    ByteView sv(s);
    EXPECT_EQ(sv.size(), 3u);
    EXPECT_EQ(sv[1], 'b');
}
