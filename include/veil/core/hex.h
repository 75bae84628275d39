// VEIL - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_CORE_HEX_H
#define VEIL_CORE_HEX_H

#include "veil/core/types.h"

#include <string>

namespace veil {

/// Convert bytes to lowercase hex
std::string BytesToHex(ByteView data);

/// Convert hex string to bytes (throws std::invalid_argument on bad input)
Bytes HexToBytes(const std::string& hex);

/// Convert exactly 64 hex characters to a 32-byte buffer
Bytes32 HexToBytes32(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace veil

#endif // VEIL_CORE_HEX_H
