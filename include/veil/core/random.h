// VEIL - Secure Random Number Generation Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Cryptographically secure randomness drawn from the OS entropy source.
// Every nonce, blinding factor and unseeded key in VEIL comes from here.

#ifndef VEIL_CORE_RANDOM_H
#define VEIL_CORE_RANDOM_H

#include "veil/core/types.h"

#include <cstddef>
#include <cstdint>

namespace veil {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error when the OS entropy source is unavailable.
void GetRandBytes(Byte* buf, size_t len);

/// Random 32-byte buffer
Bytes32 GetRandBytes32();

namespace detail {

/// Get entropy from OS; returns false on failure
bool GetOSEntropy(Byte* buf, size_t len);

} // namespace detail

} // namespace veil

#endif // VEIL_CORE_RANDOM_H
