// VEIL - Schnorr Validity and Equality Proofs
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Sigma protocols over twisted ElGamal ciphertexts, made non-interactive with
// a Transcript. A ciphertext under public key P = s*G is
//
//     C = a*G + r*P      (commitment)
//     D = r*G            (handle)
//
// Every verifier returns false on malformed input and never throws.

#ifndef VEIL_PROOF_SIGMA_H
#define VEIL_PROOF_SIGMA_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"
#include "veil/elgamal/ciphertext.h"

#include <cstddef>
#include <optional>

namespace veil {
namespace proof {

constexpr size_t VALIDITY_PROOF_SIZE = 96;
constexpr size_t EQUALITY_PROOF_SIZE = 160;
constexpr size_t CROSS_KEY_EQUALITY_PROOF_SIZE = 192;
constexpr size_t CIPHERTEXT_COMMITMENT_PROOF_SIZE = 192;

// ============================================================================
// Validity Proof
// ============================================================================

/**
 * Proof of knowledge of (a, r) such that C = a*G + r*P and D = r*G.
 *
 * The nonce commitments Y_C = k_a*G + k_r*P and Y_D = k_r*G are not sent;
 * the verifier rebuilds them from the challenge and responses.
 *
 * Layout: c || z_a || z_r
 */
struct ValidityProof {
    ed25519::Scalar challenge;
    ed25519::Scalar responseAmount;
    ed25519::Scalar responseRandom;

    Bytes ToBytes() const;

    /// nullopt on wrong length or non-canonical scalar
    static std::optional<ValidityProof> FromBytes(ByteView data);
};

/**
 * Prove that `ciphertext` is a well-formed encryption under `publicKey`.
 * `amount` and `randomness` must be the values the ciphertext was built with,
 * otherwise the resulting proof does not verify.
 */
ValidityProof GenerateValidityProof(const elgamal::Ciphertext& ciphertext,
                                    const Bytes32& publicKey,
                                    Amount amount,
                                    const ed25519::Scalar& randomness);

bool VerifyValidityProof(const ValidityProof& proof,
                         const elgamal::Ciphertext& ciphertext,
                         const Bytes32& publicKey);

bool VerifyValidityProof(ByteView proof,
                         const elgamal::Ciphertext& ciphertext,
                         const Bytes32& publicKey);

// ============================================================================
// Equality Proof (same key)
// ============================================================================

/**
 * Two ciphertexts under the same key P encrypt the same amount.
 *
 * Paired Schnorr proofs of the handle discrete logs r1, r2, bound together
 * by the difference equation C1 - C2 = (r1 - r2)*P.
 *
 * Layout: Y1 || Y2 || Y3 || z1 || z2
 */
struct EqualityProof {
    ed25519::Point Y1;
    ed25519::Point Y2;
    ed25519::Point Y3;
    ed25519::Scalar z1;
    ed25519::Scalar z2;

    Bytes ToBytes() const;
    static std::optional<EqualityProof> FromBytes(ByteView data);
};

EqualityProof GenerateEqualityProof(const elgamal::Ciphertext& first,
                                    const elgamal::Ciphertext& second,
                                    const Bytes32& publicKey,
                                    const ed25519::Scalar& firstRandomness,
                                    const ed25519::Scalar& secondRandomness);

bool VerifyEqualityProof(const EqualityProof& proof,
                         const elgamal::Ciphertext& first,
                         const elgamal::Ciphertext& second,
                         const Bytes32& publicKey);

bool VerifyEqualityProof(ByteView proof,
                         const elgamal::Ciphertext& first,
                         const elgamal::Ciphertext& second,
                         const Bytes32& publicKey);

// ============================================================================
// Cross-Key Equality Proof
// ============================================================================

/**
 * Statement used by transfers. With one randomness r and amount a:
 *
 *     D   = r*G                   shared handle
 *     C_d = a*G + r*P_d           destination commitment
 *     C_s = a*G + r*P_s           source-side debit commitment
 *     V   = a*G + r*H             Pedersen commitment of the range proof
 */
struct CrossKeyStatement {
    Bytes32 destinationKey{};
    Bytes32 sourceKey{};
    Bytes32 destinationCommitment{};
    Bytes32 sourceCommitment{};
    Bytes32 handle{};
    Bytes32 pedersenCommitment{};
};

/**
 * Layout: Y0 || Y1 || Y2 || Y3 || z_a || z_r
 *
 *     Y0 = k_r*G
 *     Y1 = k_a*G + k_r*P_d
 *     Y2 = k_a*G + k_r*H
 *     Y3 = k_r*(P_d - P_s)
 */
struct CrossKeyEqualityProof {
    ed25519::Point Y0;
    ed25519::Point Y1;
    ed25519::Point Y2;
    ed25519::Point Y3;
    ed25519::Scalar responseAmount;
    ed25519::Scalar responseRandom;

    Bytes ToBytes() const;
    static std::optional<CrossKeyEqualityProof> FromBytes(ByteView data);
};

/// @throws MalformedDataError if a key in the statement does not decode
CrossKeyEqualityProof GenerateCrossKeyEqualityProof(const CrossKeyStatement& statement,
                                                    Amount amount,
                                                    const ed25519::Scalar& randomness);

bool VerifyCrossKeyEqualityProof(const CrossKeyEqualityProof& proof,
                                 const CrossKeyStatement& statement);

bool VerifyCrossKeyEqualityProof(ByteView proof, const CrossKeyStatement& statement);

// ============================================================================
// Ciphertext-Commitment Equality Proof
// ============================================================================

/**
 * The ciphertext (C, D) under P = s*G and the Pedersen commitment V encrypt
 * and commit to the same amount. The owner's secret key is the witness, so
 * the randomness behind the ciphertext need not be known:
 *
 *     P = s*G,  C = a*G + s*D,  V = a*G + rho*H
 *
 * Layout: Y0 || Y1 || Y2 || z_s || z_a || z_rho
 */
struct CiphertextCommitmentProof {
    ed25519::Point Y0;
    ed25519::Point Y1;
    ed25519::Point Y2;
    ed25519::Scalar responseSecret;
    ed25519::Scalar responseAmount;
    ed25519::Scalar responseBlinding;

    Bytes ToBytes() const;
    static std::optional<CiphertextCommitmentProof> FromBytes(ByteView data);
};

/// @throws MalformedDataError if the ciphertext handle does not decode
CiphertextCommitmentProof GenerateCiphertextCommitmentProof(
    const elgamal::Ciphertext& ciphertext,
    const Bytes32& publicKey,
    const Bytes32& pedersenCommitment,
    const Bytes32& secretKey,
    Amount amount,
    const ed25519::Scalar& blinding);

bool VerifyCiphertextCommitmentProof(const CiphertextCommitmentProof& proof,
                                     const elgamal::Ciphertext& ciphertext,
                                     const Bytes32& publicKey,
                                     const Bytes32& pedersenCommitment);

bool VerifyCiphertextCommitmentProof(ByteView proof,
                                     const elgamal::Ciphertext& ciphertext,
                                     const Bytes32& publicKey,
                                     const Bytes32& pedersenCommitment);

} // namespace proof
} // namespace veil

#endif // VEIL_PROOF_SIGMA_H
