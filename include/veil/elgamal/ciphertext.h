// VEIL - Twisted ElGamal Ciphertexts
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// A ciphertext encrypting amount a under public key P with randomness r is
//   commitment C = a*G + r*P
//   handle     D = r*G
// The owner of secret s (P = s*G) recovers a*G = C - s*D and solves the
// small discrete log by bounded search. Ciphertexts under the same key are
// additively homomorphic.

#ifndef VEIL_ELGAMAL_CIPHERTEXT_H
#define VEIL_ELGAMAL_CIPHERTEXT_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"

#include <cstdint>
#include <limits>
#include <optional>

namespace veil {
namespace elgamal {

// ============================================================================
// Constants
// ============================================================================

/// Serialized ciphertext size (commitment || handle)
constexpr size_t CIPHERTEXT_SIZE = 64;

/// Largest amount accepted where decryption must stay fast
constexpr Amount MAX_FAST_DECRYPT_AMOUNT = 0xFFFFFFFFULL;

/// Largest amount accepted where values are protected by 64-bit range proofs
constexpr Amount MAX_RANGE_PROOF_AMOUNT = std::numeric_limits<Amount>::max();

/// Plaintext domain in force at an encryption call site
enum class AmountDomain {
    FastDecrypt,   // amounts up to 2^32 - 1
    RangeProof     // amounts up to 2^64 - 1
};

/// Upper bound for a domain
Amount MaxAmount(AmountDomain domain);

/// Throw InputDomainError if amount lies outside the domain
void CheckAmountDomain(Amount amount, AmountDomain domain);

// ============================================================================
// Ciphertext
// ============================================================================

struct Ciphertext {
    /// a*G + r*P
    Bytes32 commitment{};

    /// r*G
    Bytes32 handle{};

    Ciphertext() = default;
    Ciphertext(const Bytes32& c, const Bytes32& d) : commitment(c), handle(d) {}
    Ciphertext(const ed25519::Point& c, const ed25519::Point& d)
        : commitment(c.ToBytes()), handle(d.ToBytes()) {}

    bool operator==(const Ciphertext& other) const {
        return commitment == other.commitment && handle == other.handle;
    }
    bool operator!=(const Ciphertext& other) const { return !(*this == other); }
};

/// Ciphertext together with the randomness used to build it
struct EncryptionResult {
    Ciphertext ciphertext;
    ed25519::Scalar randomness;
};

// ============================================================================
// Encryption
// ============================================================================

/**
 * Encrypt under fresh randomness. Two encryptions of the same amount are
 * unlinkable.
 *
 * @throws InputDomainError if the amount exceeds the domain
 * @throws MalformedDataError if the public key does not decode
 */
Ciphertext Encrypt(Amount amount, const Bytes32& publicKey,
                   AmountDomain domain = AmountDomain::FastDecrypt);

/// Encrypt and also return the randomness, for proofs bound to it
EncryptionResult EncryptWithRandomness(Amount amount, const Bytes32& publicKey,
                                       AmountDomain domain = AmountDomain::FastDecrypt);

/// Deterministic encryption under caller-supplied randomness
Ciphertext EncryptWith(Amount amount, const Bytes32& publicKey,
                       const ed25519::Scalar& randomness,
                       AmountDomain domain = AmountDomain::FastDecrypt);

// ============================================================================
// Decryption
// ============================================================================

/**
 * Strip the key from a ciphertext: C - s*D = a*G.
 * nullopt if either component does not decode.
 */
std::optional<ed25519::Point> DecryptToPoint(const Ciphertext& ct,
                                             const ed25519::Scalar& secret);

/**
 * Recover a from a*G by linear search over 0..bound (inclusive).
 * nullopt if the value lies beyond the bound.
 */
std::optional<Amount> SolveDiscreteLogLinear(const ed25519::Point& target, Amount bound);

/**
 * Decrypt by linear search. Returns nullopt when the plaintext exceeds the
 * bound or the ciphertext does not decode.
 */
std::optional<Amount> Decrypt(const Ciphertext& ct, const Bytes32& secretKey, Amount bound);

// ============================================================================
// Homomorphic Operations
// ============================================================================
// Operands must be encrypted under the same public key; this is not checked.
// All functions throw MalformedDataError if an operand does not decode.

Ciphertext Add(const Ciphertext& a, const Ciphertext& b);
Ciphertext Subtract(const Ciphertext& a, const Ciphertext& b);

/// Multiply the plaintext by a public factor
Ciphertext Scale(const Ciphertext& ct, const ed25519::Scalar& factor);

/// Add a public amount to the plaintext (commitment only)
Ciphertext AddAmount(const Ciphertext& ct, Amount amount);

/// Remove a public amount from the plaintext (commitment only)
Ciphertext SubtractAmount(const Ciphertext& ct, Amount amount);

/// Add a fresh encryption of zero; plaintext unchanged, bytes unlinkable
Ciphertext ReRandomize(const Ciphertext& ct, const Bytes32& publicKey);

// ============================================================================
// Serialization
// ============================================================================

/// True if both components decode to group elements
bool IsValidCiphertext(const Ciphertext& ct);

/// commitment || handle
Bytes64 SerializeCiphertext(const Ciphertext& ct);

/**
 * Split 64 bytes into commitment and handle. The points are not validated;
 * use IsValidCiphertext for that.
 *
 * @throws MalformedDataError if the length is not 64
 */
Ciphertext DeserializeCiphertext(ByteView data);

} // namespace elgamal
} // namespace veil

#endif // VEIL_ELGAMAL_CIPHERTEXT_H
