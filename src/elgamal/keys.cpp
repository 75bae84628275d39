// VEIL - ElGamal Key Generation Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/elgamal/keys.h"
#include "veil/core/random.h"
#include "veil/crypto/hash.h"

#include <openssl/crypto.h>

namespace veil {
namespace elgamal {

namespace {

KeyPair KeypairFromSecret(Bytes32 secret) {
    ClampSecret(secret);

    KeyPair kp;
    kp.secretKey = secret;
    kp.publicKey = ed25519::ScalarBaseMultiply(SecretKeyToScalar(secret)).ToBytes();

    OPENSSL_cleanse(secret.data(), secret.size());
    return kp;
}

} // anonymous namespace

KeyPair::~KeyPair() {
    OPENSSL_cleanse(secretKey.data(), secretKey.size());
}

ed25519::Scalar KeyPair::SecretScalar() const {
    return SecretKeyToScalar(secretKey);
}

void ClampSecret(Bytes32& secret) {
    secret[0] &= 248;
    secret[31] &= 127;
    secret[31] |= 64;
}

ed25519::Scalar SecretKeyToScalar(const Bytes32& secretKey) {
    return ed25519::Scalar::FromBytesModOrder(secretKey.data(), secretKey.size());
}

std::optional<ed25519::Point> DecodePublicKey(const Bytes32& publicKey) {
    return ed25519::Point::FromBytes(publicKey);
}

KeyPair GenerateKeypair() {
    return KeypairFromSecret(GetRandBytes32());
}

KeyPair GenerateKeypair(ByteView seed) {
    return KeypairFromSecret(SHA256Hash(seed));
}

KeyPair DeriveKeypair(ByteView signer, const std::string& label) {
    Bytes32 seed = SHA256()
        .Write(signer)
        .Write(ByteView(std::string(KEY_DERIVATION_TAG)))
        .Write(ByteView(label))
        .Finalize();
    KeyPair kp = GenerateKeypair(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return kp;
}

} // namespace elgamal
} // namespace veil
