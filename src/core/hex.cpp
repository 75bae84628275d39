// VEIL - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace veil {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string BytesToHex(ByteView data) {
    std::string out(data.size() * 2, '0');
    for (size_t i = 0; i < data.size(); ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

Bytes HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    Bytes out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = NibbleValue(hex[2 * i]);
        int lo = NibbleValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out[i] = static_cast<Byte>((hi << 4) | lo);
    }
    return out;
}

Bytes32 HexToBytes32(const std::string& hex) {
    if (hex.size() != 64) {
        throw std::invalid_argument("Expected 64 hex characters");
    }
    Bytes raw = HexToBytes(hex);
    Bytes32 out;
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (NibbleValue(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace veil
