// VEIL - Accelerated Backend
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/engine/backend.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"

#include <algorithm>
#include <string>

namespace veil {
namespace engine {

using ed25519::Point;
using ed25519::Scalar;

namespace {

util::ThreadPool::Config PoolConfig(const AcceleratedBackend::Options& options) {
    util::ThreadPool::Config config;
    config.numThreads = std::max<size_t>(1, options.maxConcurrentOps);
    config.name = "veil-accel";
    return config;
}

} // anonymous namespace

AcceleratedBackend::AcceleratedBackend(const Options& options)
    : options_(options)
    , blindingBase_(proof::Generators::Get().H())
    , decryptionTable_(options.tableBits)
    , pool_(std::make_unique<util::ThreadPool>(PoolConfig(options))) {
    if (options_.batchSize == 0) {
        throw InputDomainError("Accelerated backend batch size must be positive");
    }
    LOG_DEBUG(util::LogCategory::DISPATCH)
        << "Accelerated backend ready: " << pool_->ThreadCount() << " threads, "
        << decryptionTable_.BabySteps() << " baby steps, batch size " << options_.batchSize;
}

// ============================================================================
// ElGamal
// ============================================================================

elgamal::EncryptionResult AcceleratedBackend::Encrypt(Amount amount, const Bytes32& publicKey,
                                                      elgamal::AmountDomain domain) {
    elgamal::CheckAmountDomain(amount, domain);
    auto P = elgamal::DecodePublicKey(publicKey);
    if (!P) {
        throw MalformedDataError("Public key is not a valid curve point");
    }

    elgamal::EncryptionResult result;
    result.randomness = Scalar::Random();
    const Point C = ed25519::ScalarBaseMultiply(Scalar::FromUint64(amount)) +
                    *P * result.randomness;
    const Point D = ed25519::ScalarBaseMultiply(result.randomness);
    result.ciphertext = elgamal::Ciphertext(C, D);
    return result;
}

std::vector<elgamal::EncryptionResult> AcceleratedBackend::EncryptBatch(
    const std::vector<Amount>& amounts, const Bytes32& publicKey,
    elgamal::AmountDomain domain) {
    for (Amount amount : amounts) {
        elgamal::CheckAmountDomain(amount, domain);
    }
    auto P = elgamal::DecodePublicKey(publicKey);
    if (!P) {
        throw MalformedDataError("Public key is not a valid curve point");
    }

    std::vector<elgamal::EncryptionResult> results(amounts.size());
    auto encryptChunk = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            results[i].randomness = Scalar::Random();
            const Scalar& r = results[i].randomness;
            results[i].ciphertext = elgamal::Ciphertext(
                ed25519::ScalarBaseMultiply(Scalar::FromUint64(amounts[i])) + *P * r,
                ed25519::ScalarBaseMultiply(r));
        }
    };
    util::ParallelForChunks(*pool_, amounts.size(), options_.batchSize, encryptChunk);
    return results;
}

std::optional<Amount> AcceleratedBackend::Decrypt(const elgamal::Ciphertext& ct,
                                                  const Bytes32& secretKey, Amount bound) {
    return decryptionTable_.Decrypt(ct, secretKey, bound);
}

// ============================================================================
// Commitments and Proofs
// ============================================================================

proof::PedersenCommitment AcceleratedBackend::Commit(Amount amount, const Scalar& blinding) {
    proof::PedersenCommitment c;
    c.commitment = (ed25519::ScalarBaseMultiply(Scalar::FromUint64(amount)) +
                    blindingBase_ * blinding).ToBytes();
    return c;
}

proof::RangeProof AcceleratedBackend::GenerateRangeProof(Amount amount, const Scalar& blinding) {
    return proof::GenerateRangeProof(amount, blinding);
}

std::vector<proof::RangeProof> AcceleratedBackend::GenerateRangeProofs(
    const std::vector<Amount>& amounts, const std::vector<Scalar>& blindings) {
    if (amounts.size() != blindings.size()) {
        throw InputDomainError("GenerateRangeProofs: amounts and blindings differ in length");
    }
    std::vector<proof::RangeProof> proofs(amounts.size());
    util::ParallelForChunks(*pool_, amounts.size(), options_.batchSize,
                            [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            proofs[i] = proof::GenerateRangeProof(amounts[i], blindings[i]);
        }
    });
    return proofs;
}

bool AcceleratedBackend::VerifyRangeProof(const proof::RangeProof& rangeProof) {
    return proof::VerifyRangeProof(rangeProof);
}

transfer::TransferResult AcceleratedBackend::GenerateTransferProof(
    const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
    const Bytes32& destinationKey, Amount amount) {
    return transfer::GenerateTransferProof(sourceBalance, sourceKeys, destinationKey, amount,
                                           decryptionTable_);
}

} // namespace engine
} // namespace veil
