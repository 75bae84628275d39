// VEIL - Crypto Backends
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Two interchangeable implementations of the engine's hot operations. The
// native backend calls straight into the elgamal/proof/transfer modules one
// item at a time. The accelerated backend precomputes a decryption table once
// and fans batches out over a thread pool.
//
// Both produce byte-identical wire formats; only speed differs.

#ifndef VEIL_ENGINE_BACKEND_H
#define VEIL_ENGINE_BACKEND_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"
#include "veil/elgamal/ciphertext.h"
#include "veil/elgamal/decryption_table.h"
#include "veil/elgamal/keys.h"
#include "veil/proof/commitment.h"
#include "veil/proof/rangeproof.h"
#include "veil/transfer/transfer.h"
#include "veil/util/threadpool.h"

#include <memory>
#include <optional>
#include <vector>

namespace veil {
namespace engine {

/// Which implementation served a call
enum class BackendKind {
    Native,
    Accelerated
};

const char* BackendName(BackendKind kind);

// ============================================================================
// Backend Interface
// ============================================================================

class ICryptoBackend {
public:
    virtual ~ICryptoBackend() = default;

    virtual BackendKind Kind() const = 0;

    virtual elgamal::EncryptionResult Encrypt(Amount amount, const Bytes32& publicKey,
                                              elgamal::AmountDomain domain) = 0;

    virtual std::vector<elgamal::EncryptionResult> EncryptBatch(
        const std::vector<Amount>& amounts, const Bytes32& publicKey,
        elgamal::AmountDomain domain) = 0;

    virtual std::optional<Amount> Decrypt(const elgamal::Ciphertext& ct,
                                          const Bytes32& secretKey, Amount bound) = 0;

    virtual proof::PedersenCommitment Commit(Amount amount,
                                             const ed25519::Scalar& blinding) = 0;

    virtual proof::RangeProof GenerateRangeProof(Amount amount,
                                                 const ed25519::Scalar& blinding) = 0;

    virtual std::vector<proof::RangeProof> GenerateRangeProofs(
        const std::vector<Amount>& amounts,
        const std::vector<ed25519::Scalar>& blindings) = 0;

    virtual bool VerifyRangeProof(const proof::RangeProof& rangeProof) = 0;

    virtual transfer::TransferResult GenerateTransferProof(
        const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
        const Bytes32& destinationKey, Amount amount) = 0;
};

// ============================================================================
// Native Backend
// ============================================================================

/**
 * Single-threaded reference path. Decryption is a linear search, so it is
 * only practical for small bounds; transfers use the shared lookup table for
 * their balance check.
 */
class NativeBackend : public ICryptoBackend {
public:
    BackendKind Kind() const override { return BackendKind::Native; }

    elgamal::EncryptionResult Encrypt(Amount amount, const Bytes32& publicKey,
                                      elgamal::AmountDomain domain) override;
    std::vector<elgamal::EncryptionResult> EncryptBatch(
        const std::vector<Amount>& amounts, const Bytes32& publicKey,
        elgamal::AmountDomain domain) override;
    std::optional<Amount> Decrypt(const elgamal::Ciphertext& ct, const Bytes32& secretKey,
                                  Amount bound) override;
    proof::PedersenCommitment Commit(Amount amount, const ed25519::Scalar& blinding) override;
    proof::RangeProof GenerateRangeProof(Amount amount,
                                         const ed25519::Scalar& blinding) override;
    std::vector<proof::RangeProof> GenerateRangeProofs(
        const std::vector<Amount>& amounts,
        const std::vector<ed25519::Scalar>& blindings) override;
    bool VerifyRangeProof(const proof::RangeProof& rangeProof) override;
    transfer::TransferResult GenerateTransferProof(
        const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
        const Bytes32& destinationKey, Amount amount) override;
};

// ============================================================================
// Accelerated Backend
// ============================================================================

/**
 * Precomputed decryption table plus thread-pool fan-out for batches.
 *
 * Construction does all the expensive setup (the baby-step table) and may take a noticeable fraction of a second; the
 * dispatcher builds it once, off the calling thread.
 */
class AcceleratedBackend : public ICryptoBackend {
public:
    struct Options {
        unsigned tableBits{elgamal::DEFAULT_TABLE_BITS};
        size_t maxConcurrentOps{4};
        size_t batchSize{10};
    };

    explicit AcceleratedBackend(const Options& options);

    BackendKind Kind() const override { return BackendKind::Accelerated; }

    elgamal::EncryptionResult Encrypt(Amount amount, const Bytes32& publicKey,
                                      elgamal::AmountDomain domain) override;
    std::vector<elgamal::EncryptionResult> EncryptBatch(
        const std::vector<Amount>& amounts, const Bytes32& publicKey,
        elgamal::AmountDomain domain) override;
    std::optional<Amount> Decrypt(const elgamal::Ciphertext& ct, const Bytes32& secretKey,
                                  Amount bound) override;
    proof::PedersenCommitment Commit(Amount amount, const ed25519::Scalar& blinding) override;
    proof::RangeProof GenerateRangeProof(Amount amount,
                                         const ed25519::Scalar& blinding) override;
    std::vector<proof::RangeProof> GenerateRangeProofs(
        const std::vector<Amount>& amounts,
        const std::vector<ed25519::Scalar>& blindings) override;
    bool VerifyRangeProof(const proof::RangeProof& rangeProof) override;
    transfer::TransferResult GenerateTransferProof(
        const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
        const Bytes32& destinationKey, Amount amount) override;

    const Options& GetOptions() const { return options_; }

private:
    Options options_;
    ed25519::Point blindingBase_;
    elgamal::DecryptionTable decryptionTable_;
    std::unique_ptr<util::ThreadPool> pool_;
};

} // namespace engine
} // namespace veil

#endif // VEIL_ENGINE_BACKEND_H
