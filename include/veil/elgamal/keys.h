// VEIL - ElGamal Key Generation
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Key pairs for twisted ElGamal encryption. Secret keys are 32 clamped bytes
// (the same clamping Ed25519 applies to its hashed secret); the secret scalar
// is those bytes reduced modulo the group order and the public key is
// secret * G.

#ifndef VEIL_ELGAMAL_KEYS_H
#define VEIL_ELGAMAL_KEYS_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"

#include <optional>
#include <string>

namespace veil {
namespace elgamal {

/// Domain separator mixed into key derivation seeds
constexpr const char* KEY_DERIVATION_TAG = "elgamal:";

/**
 * An ElGamal key pair.
 * The secret key is cleared from memory when the pair is destroyed.
 */
struct KeyPair {
    /// Compressed public point secret * G
    Bytes32 publicKey{};

    /// Clamped secret key bytes
    Bytes32 secretKey{};

    KeyPair() = default;
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
    ~KeyPair();

    /// Secret key as a scalar mod l
    ed25519::Scalar SecretScalar() const;
};

/// Apply the curve clamping convention to 32 secret bytes
void ClampSecret(Bytes32& secret);

/// Secret scalar for clamped (or arbitrary) secret key bytes
ed25519::Scalar SecretKeyToScalar(const Bytes32& secretKey);

/// Decode a public key; nullopt if it is not a valid group element
std::optional<ed25519::Point> DecodePublicKey(const Bytes32& publicKey);

/**
 * Generate a key pair from the OS entropy source.
 * @throws std::runtime_error if entropy is unavailable
 */
KeyPair GenerateKeypair();

/**
 * Generate a key pair deterministically: secret = clamp(SHA-256(seed)).
 * The same seed always yields the same pair.
 */
KeyPair GenerateKeypair(ByteView seed);

/**
 * Derive a key pair bound to a signer identity and a label, with no stored
 * state: seed = SHA-256(signer || "elgamal:" || label).
 */
KeyPair DeriveKeypair(ByteView signer, const std::string& label);

} // namespace elgamal
} // namespace veil

#endif // VEIL_ELGAMAL_KEYS_H
