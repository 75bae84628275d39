// VEIL - Confidential Transfer Composer
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Builds the proof bundle for moving an encrypted amount from one account to
// another, and for withdrawing a public amount out of an encrypted balance.
//
// A transfer runs as a fixed pipeline:
//
//   BALANCE_CHECK -> ENCRYPT_DESTINATION -> RANGE_PROOF -> VALIDITY_PROOF
//                 -> EQUALITY_PROOF -> BUNDLE
//
// Every proof is generated against the one (amount, randomness) pair used to
// encrypt the destination amount. Any failure aborts the whole composition.

#ifndef VEIL_TRANSFER_TRANSFER_H
#define VEIL_TRANSFER_TRANSFER_H

#include "veil/core/types.h"
#include "veil/elgamal/ciphertext.h"
#include "veil/elgamal/decryption_table.h"
#include "veil/elgamal/keys.h"
#include "veil/proof/rangeproof.h"

namespace veil {
namespace transfer {

/// Largest balance the balance check will search for
constexpr Amount DEFAULT_BALANCE_BOUND = elgamal::MAX_FAST_DECRYPT_AMOUNT;

/// Range proofs attached to transfers and withdrawals are always this wide
constexpr size_t TRANSFER_RANGE_BITS = 64;

// ============================================================================
// Transfer
// ============================================================================

/**
 * Everything a verifier needs to accept a transfer.
 */
struct TransferProofBundle {
    /// Destination ciphertext of the amount (commitment || handle)
    Bytes64 encryptedTransferAmount{};

    /// Commitment half of the sender's balance after the transfer
    Bytes32 newSourceCommitment{};

    /// Cross-key equality proof (192 bytes)
    Bytes equalityProof;

    /// Validity proof of the destination ciphertext (96 bytes)
    Bytes validityProof;

    /// 64-bit bulletproof over amount*G + r*H (674 bytes)
    proof::RangeProof rangeProof;
};

struct TransferResult {
    TransferProofBundle bundle;

    /// Sender balance after the debit
    elgamal::Ciphertext newSourceBalance;

    /// Amount encrypted to the recipient
    elgamal::Ciphertext destinationCiphertext;
};

/**
 * Compose a transfer of `amount` from `sourceBalance` (owned by `sourceKeys`)
 * to `destinationKey`.
 *
 * The source balance is decrypted with `table` up to DEFAULT_BALANCE_BOUND.
 *
 * @throws InsufficientBalanceError if the balance does not decrypt within the
 *         bound or is below `amount`
 * @throws MalformedDataError if a key or the source balance does not decode
 */
TransferResult GenerateTransferProof(const elgamal::Ciphertext& sourceBalance,
                                     const elgamal::KeyPair& sourceKeys,
                                     const Bytes32& destinationKey,
                                     Amount amount,
                                     const elgamal::DecryptionTable& table);

/// As above with the process-wide default decryption table
TransferResult GenerateTransferProof(const elgamal::Ciphertext& sourceBalance,
                                     const elgamal::KeyPair& sourceKeys,
                                     const Bytes32& destinationKey,
                                     Amount amount);

/**
 * Check a bundle against the sender's balance before the transfer. The debit
 * ciphertext is rebuilt as (old - new commitment, destination handle) and all
 * three proofs must verify. Never throws.
 */
bool VerifyTransferProof(const TransferProofBundle& bundle,
                         const elgamal::Ciphertext& oldSourceBalance,
                         const Bytes32& sourceKey,
                         const Bytes32& destinationKey);

// ============================================================================
// Withdrawal
// ============================================================================

/**
 * Public-amount withdrawal. The remaining balance is committed afresh as
 * V = remaining*G + rho*H, range-proven, and tied to the new balance
 * ciphertext with a ciphertext-commitment equality proof.
 */
struct WithdrawProofBundle {
    Amount amount{0};

    /// Ciphertext-commitment equality proof (192 bytes)
    Bytes equalityProof;

    /// 64-bit bulletproof over V
    proof::RangeProof rangeProof;
};

struct WithdrawResult {
    WithdrawProofBundle bundle;
    elgamal::Ciphertext newBalance;
};

/// @throws InsufficientBalanceError if the balance is below `amount`
WithdrawResult GenerateWithdrawProof(const elgamal::Ciphertext& balance,
                                     const elgamal::KeyPair& keys,
                                     Amount amount,
                                     const elgamal::DecryptionTable& table);

WithdrawResult GenerateWithdrawProof(const elgamal::Ciphertext& balance,
                                     const elgamal::KeyPair& keys,
                                     Amount amount);

bool VerifyWithdrawProof(const WithdrawProofBundle& bundle,
                         const elgamal::Ciphertext& oldBalance,
                         const Bytes32& publicKey);

/// Shared decryption table used by the overloads without one
const elgamal::DecryptionTable& DefaultDecryptionTable();

} // namespace transfer
} // namespace veil

#endif // VEIL_TRANSFER_TRANSFER_H
