// VEIL - Native Backend
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/engine/backend.h"
#include "veil/core/errors.h"

namespace veil {
namespace engine {

const char* BackendName(BackendKind kind) {
    switch (kind) {
        case BackendKind::Native:      return "native";
        case BackendKind::Accelerated: return "accelerated";
    }
    return "unknown";
}

elgamal::EncryptionResult NativeBackend::Encrypt(Amount amount, const Bytes32& publicKey,
                                                 elgamal::AmountDomain domain) {
    return elgamal::EncryptWithRandomness(amount, publicKey, domain);
}

std::vector<elgamal::EncryptionResult> NativeBackend::EncryptBatch(
    const std::vector<Amount>& amounts, const Bytes32& publicKey,
    elgamal::AmountDomain domain) {
    std::vector<elgamal::EncryptionResult> results;
    results.reserve(amounts.size());
    for (Amount amount : amounts) {
        results.push_back(elgamal::EncryptWithRandomness(amount, publicKey, domain));
    }
    return results;
}

std::optional<Amount> NativeBackend::Decrypt(const elgamal::Ciphertext& ct,
                                             const Bytes32& secretKey, Amount bound) {
    return elgamal::Decrypt(ct, secretKey, bound);
}

proof::PedersenCommitment NativeBackend::Commit(Amount amount, const ed25519::Scalar& blinding) {
    return proof::PedersenCommit(amount, blinding);
}

proof::RangeProof NativeBackend::GenerateRangeProof(Amount amount,
                                                    const ed25519::Scalar& blinding) {
    return proof::GenerateRangeProof(amount, blinding);
}

std::vector<proof::RangeProof> NativeBackend::GenerateRangeProofs(
    const std::vector<Amount>& amounts, const std::vector<ed25519::Scalar>& blindings) {
    if (amounts.size() != blindings.size()) {
        throw InputDomainError("GenerateRangeProofs: amounts and blindings differ in length");
    }
    std::vector<proof::RangeProof> proofs;
    proofs.reserve(amounts.size());
    for (size_t i = 0; i < amounts.size(); ++i) {
        proofs.push_back(proof::GenerateRangeProof(amounts[i], blindings[i]));
    }
    return proofs;
}

bool NativeBackend::VerifyRangeProof(const proof::RangeProof& rangeProof) {
    return proof::VerifyRangeProof(rangeProof);
}

transfer::TransferResult NativeBackend::GenerateTransferProof(
    const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
    const Bytes32& destinationKey, Amount amount) {
    return transfer::GenerateTransferProof(sourceBalance, sourceKeys, destinationKey, amount);
}

} // namespace engine
} // namespace veil
