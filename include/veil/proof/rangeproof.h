// VEIL - Range Proofs
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Proofs that a Pedersen commitment V = v*G + gamma*H opens to a value in a
// fixed range, without revealing v.
//
// Two encodings exist and the verifier tells them apart by length alone:
//
//   abbreviated (128 bytes)  R || z_v || z_r || c
//       Schnorr proof of knowledge of the opening (v, gamma). Used for small
//       amounts (v < 2^16).
//
//   bulletproof (610 / 674 bytes)
//       0x01 || bits || A || S || T1 || T2 || taux || mu || t
//            || (L_j || R_j) for log2(bits) rounds || a || b
//       Bulletproofs range argument over 32 or 64 bits with a logarithmic
//       inner-product argument.

#ifndef VEIL_PROOF_RANGEPROOF_H
#define VEIL_PROOF_RANGEPROOF_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"
#include "veil/proof/commitment.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace veil {
namespace proof {

// ============================================================================
// Sizes and Limits
// ============================================================================

/// Encoded size of the abbreviated proof
constexpr size_t ABBREVIATED_PROOF_SIZE = 128;

/// Amounts below this use the abbreviated proof
constexpr Amount ABBREVIATED_RANGE_LIMIT = Amount(1) << 16;

/// Bulletproof format version byte
constexpr uint8_t BULLETPROOF_VERSION = 0x01;

/// Encoded bulletproof size for a bit width: 2 + 32 * (9 + 2 * log2(bits))
constexpr size_t BulletproofSize(size_t bits) {
    return bits == 32 ? 610 : bits == 64 ? 674 : 0;
}

constexpr size_t BULLETPROOF_32_SIZE = BulletproofSize(32);
constexpr size_t BULLETPROOF_64_SIZE = BulletproofSize(64);

// ============================================================================
// Range Proof
// ============================================================================

/// Proof bytes with the commitment they speak about
struct RangeProof {
    Bytes proof;
    Bytes32 commitment{};

    size_t Size() const { return proof.size(); }
};

// ============================================================================
// Bulletproof Structure
// ============================================================================

/**
 * Decoded bulletproof.
 */
struct BulletproofData {
    uint8_t numBits{64};

    ed25519::Point A;
    ed25519::Point S;
    ed25519::Point T1;
    ed25519::Point T2;

    ed25519::Scalar taux;
    ed25519::Scalar mu;
    ed25519::Scalar t;

    /// Inner product argument rounds
    std::vector<ed25519::Point> L;
    std::vector<ed25519::Point> R;

    ed25519::Scalar a;
    ed25519::Scalar b;

    Bytes ToBytes() const;

    /// nullopt on any length, header, point or scalar encoding error
    static std::optional<BulletproofData> FromBytes(ByteView data);
};

// ============================================================================
// Generation
// ============================================================================

/**
 * Prove that `amount` is in range, choosing the encoding by magnitude:
 * abbreviated below 2^16, a 32-bit bulletproof below 2^32 and a 64-bit
 * bulletproof otherwise.
 * @throws InputDomainError if blinding is zero
 */
RangeProof GenerateRangeProof(Amount amount, const ed25519::Scalar& blinding);

/**
 * Bulletproof at a fixed width.
 * @throws InputDomainError if bits is not 32 or 64, amount >= 2^bits, or
 *         blinding is zero
 */
RangeProof GenerateBulletproof(Amount amount, const ed25519::Scalar& blinding,
                               size_t bits);

/**
 * Abbreviated proof of knowledge of the commitment opening.
 * @throws InputDomainError if amount >= 2^16 or blinding is zero
 */
RangeProof GenerateAbbreviatedProof(Amount amount, const ed25519::Scalar& blinding);

// ============================================================================
// Verification
// ============================================================================

/**
 * Verify proof bytes against a commitment. The encoding is selected by the
 * proof length; anything malformed verifies as false.
 */
bool VerifyRangeProof(ByteView proof, const Bytes32& commitment);

inline bool VerifyRangeProof(const RangeProof& proof) {
    return VerifyRangeProof(proof.proof, proof.commitment);
}

/// True iff every proof in the list verifies
bool BatchVerifyRangeProofs(const std::vector<RangeProof>& proofs);

} // namespace proof
} // namespace veil

#endif // VEIL_PROOF_RANGEPROOF_H
