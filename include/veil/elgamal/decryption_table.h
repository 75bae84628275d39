// VEIL - Baby-Step/Giant-Step Decryption Table
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Precomputes j*G -> j for j < 2^k so that a*G can be solved for a up to a
// large bound with about bound / 2^k giant steps instead of a linear walk.

#ifndef VEIL_ELGAMAL_DECRYPTION_TABLE_H
#define VEIL_ELGAMAL_DECRYPTION_TABLE_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"
#include "veil/elgamal/ciphertext.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <unordered_map>

namespace veil {
namespace elgamal {

/// Default number of baby-step bits (65536 table entries)
constexpr unsigned DEFAULT_TABLE_BITS = 16;

/// Largest supported table size
constexpr unsigned MAX_TABLE_BITS = 24;

/**
 * Immutable lookup table for bounded discrete logs. Safe to share between
 * threads once constructed.
 */
class DecryptionTable {
public:
    /**
     * Build the baby-step table.
     * @throws InputDomainError if bits is 0 or above MAX_TABLE_BITS
     */
    explicit DecryptionTable(unsigned bits = DEFAULT_TABLE_BITS);

    /// Solve target = a*G for a in [0, bound]
    std::optional<Amount> Solve(const ed25519::Point& target, Amount bound) const;

    /// Decrypt a ciphertext; nullopt beyond the bound or if it does not decode
    std::optional<Amount> Decrypt(const Ciphertext& ct, const Bytes32& secretKey,
                                  Amount bound) const;

    unsigned Bits() const { return bits_; }
    uint64_t BabySteps() const { return uint64_t(1) << bits_; }

private:
    struct EncodingHash {
        size_t operator()(const Bytes32& b) const {
            uint64_t h;
            std::memcpy(&h, b.data(), sizeof(h));
            return static_cast<size_t>(h);
        }
    };

    unsigned bits_;
    std::unordered_map<Bytes32, uint32_t, EncodingHash> babySteps_;

    /// -(2^bits)*G
    ed25519::Point giantStep_;
};

} // namespace elgamal
} // namespace veil

#endif // VEIL_ELGAMAL_DECRYPTION_TABLE_H
