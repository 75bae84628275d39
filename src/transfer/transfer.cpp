// VEIL - Confidential Transfer Composer Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/transfer/transfer.h"
#include "veil/core/errors.h"
#include "veil/proof/commitment.h"
#include "veil/proof/sigma.h"
#include "veil/util/logging.h"

#include <string>
#include <utility>

namespace veil {
namespace transfer {

using ed25519::Point;
using ed25519::Scalar;
using elgamal::Ciphertext;

namespace {

/// Decrypt the balance and make sure it covers `amount`
Amount CheckBalance(const Ciphertext& balance, const elgamal::KeyPair& keys,
                    Amount amount, const elgamal::DecryptionTable& table) {
    if (!elgamal::IsValidCiphertext(balance)) {
        throw MalformedDataError("Source balance ciphertext does not decode");
    }

    auto decrypted = table.Decrypt(balance, keys.secretKey, DEFAULT_BALANCE_BOUND);
    if (!decrypted) {
        LOG_WARN(util::LogCategory::TRANSFER)
            << "Balance check failed: balance does not decrypt within bound "
            << DEFAULT_BALANCE_BOUND;
        throw InsufficientBalanceError("Source balance could not be decrypted", amount);
    }
    if (*decrypted < amount) {
        LOG_WARN(util::LogCategory::TRANSFER)
            << "Balance check failed: requested " << amount << ", available " << *decrypted;
        throw InsufficientBalanceError("Insufficient balance: requested " +
                                       std::to_string(amount) + ", available " +
                                       std::to_string(*decrypted), amount);
    }
    return *decrypted;
}

bool IsFullRangeProof(const proof::RangeProof& rp) {
    return rp.Size() == proof::BulletproofSize(TRANSFER_RANGE_BITS);
}

} // anonymous namespace

const elgamal::DecryptionTable& DefaultDecryptionTable() {
    static const elgamal::DecryptionTable table(elgamal::DEFAULT_TABLE_BITS);
    return table;
}

// ============================================================================
// Transfer
// ============================================================================

TransferResult GenerateTransferProof(const Ciphertext& sourceBalance,
                                     const elgamal::KeyPair& sourceKeys,
                                     const Bytes32& destinationKey,
                                     Amount amount,
                                     const elgamal::DecryptionTable& table) {
    util::ScopedLogTimer timer(util::LogCategory::TRANSFER, "Transfer proof generation");

    // BALANCE_CHECK
    CheckBalance(sourceBalance, sourceKeys, amount, table);

    // ENCRYPT_DESTINATION: one randomness for both sides, so they share D = r*G
    const Scalar r = proof::GenerateBlinding();
    const Ciphertext destination = elgamal::EncryptWith(
        amount, destinationKey, r, elgamal::AmountDomain::RangeProof);
    const Ciphertext debit = elgamal::EncryptWith(
        amount, sourceKeys.publicKey, r, elgamal::AmountDomain::RangeProof);

    // RANGE_PROOF over V = amount*G + r*H
    proof::RangeProof rangeProof = proof::GenerateBulletproof(amount, r, TRANSFER_RANGE_BITS);

    // VALIDITY_PROOF
    const proof::ValidityProof validity =
        proof::GenerateValidityProof(destination, destinationKey, amount, r);

    // EQUALITY_PROOF
    proof::CrossKeyStatement statement;
    statement.destinationKey = destinationKey;
    statement.sourceKey = sourceKeys.publicKey;
    statement.destinationCommitment = destination.commitment;
    statement.sourceCommitment = debit.commitment;
    statement.handle = destination.handle;
    statement.pedersenCommitment = rangeProof.commitment;
    const proof::CrossKeyEqualityProof equality =
        proof::GenerateCrossKeyEqualityProof(statement, amount, r);

    // BUNDLE
    TransferResult result;
    result.newSourceBalance = elgamal::Subtract(sourceBalance, debit);
    result.destinationCiphertext = destination;
    result.bundle.encryptedTransferAmount = elgamal::SerializeCiphertext(destination);
    result.bundle.newSourceCommitment = result.newSourceBalance.commitment;
    result.bundle.equalityProof = equality.ToBytes();
    result.bundle.validityProof = validity.ToBytes();
    result.bundle.rangeProof = std::move(rangeProof);

    LOG_DEBUG(util::LogCategory::TRANSFER)
        << "Composed transfer bundle: range " << result.bundle.rangeProof.Size()
        << " bytes, validity " << result.bundle.validityProof.size()
        << " bytes, equality " << result.bundle.equalityProof.size() << " bytes";
    return result;
}

TransferResult GenerateTransferProof(const Ciphertext& sourceBalance,
                                     const elgamal::KeyPair& sourceKeys,
                                     const Bytes32& destinationKey,
                                     Amount amount) {
    return GenerateTransferProof(sourceBalance, sourceKeys, destinationKey, amount,
                                 DefaultDecryptionTable());
}

bool VerifyTransferProof(const TransferProofBundle& bundle,
                         const Ciphertext& oldSourceBalance,
                         const Bytes32& sourceKey,
                         const Bytes32& destinationKey) {
    const Ciphertext destination =
        elgamal::DeserializeCiphertext(bundle.encryptedTransferAmount);

    auto oldC = Point::FromBytes(oldSourceBalance.commitment);
    auto newC = Point::FromBytes(bundle.newSourceCommitment);
    if (!oldC || !newC) {
        LOG_DEBUG(util::LogCategory::TRANSFER) << "Transfer balance commitments do not decode";
        return false;
    }
    if (!IsFullRangeProof(bundle.rangeProof)) {
        LOG_DEBUG(util::LogCategory::TRANSFER)
            << "Transfer range proof must be a " << TRANSFER_RANGE_BITS << "-bit bulletproof";
        return false;
    }

    proof::CrossKeyStatement statement;
    statement.destinationKey = destinationKey;
    statement.sourceKey = sourceKey;
    statement.destinationCommitment = destination.commitment;
    statement.sourceCommitment = (*oldC - *newC).ToBytes();
    statement.handle = destination.handle;
    statement.pedersenCommitment = bundle.rangeProof.commitment;

    const bool range = proof::VerifyRangeProof(bundle.rangeProof);
    const bool validity =
        proof::VerifyValidityProof(bundle.validityProof, destination, destinationKey);
    const bool equality = proof::VerifyCrossKeyEqualityProof(bundle.equalityProof, statement);

    if (!(range && validity && equality)) {
        LOG_DEBUG(util::LogCategory::TRANSFER)
            << "Transfer bundle rejected (range=" << range << ", validity=" << validity
            << ", equality=" << equality << ")";
        return false;
    }
    return true;
}

// ============================================================================
// Withdrawal
// ============================================================================

WithdrawResult GenerateWithdrawProof(const Ciphertext& balance,
                                     const elgamal::KeyPair& keys,
                                     Amount amount,
                                     const elgamal::DecryptionTable& table) {
    util::ScopedLogTimer timer(util::LogCategory::TRANSFER, "Withdraw proof generation");

    const Amount current = CheckBalance(balance, keys, amount, table);
    const Amount remaining = current - amount;

    WithdrawResult result;
    result.newBalance = elgamal::SubtractAmount(balance, amount);

    const Scalar rho = proof::GenerateBlinding();
    proof::RangeProof rangeProof = proof::GenerateBulletproof(remaining, rho, TRANSFER_RANGE_BITS);

    const proof::CiphertextCommitmentProof equality = proof::GenerateCiphertextCommitmentProof(
        result.newBalance, keys.publicKey, rangeProof.commitment, keys.secretKey,
        remaining, rho);

    result.bundle.amount = amount;
    result.bundle.equalityProof = equality.ToBytes();
    result.bundle.rangeProof = std::move(rangeProof);
    return result;
}

WithdrawResult GenerateWithdrawProof(const Ciphertext& balance,
                                     const elgamal::KeyPair& keys,
                                     Amount amount) {
    return GenerateWithdrawProof(balance, keys, amount, DefaultDecryptionTable());
}

bool VerifyWithdrawProof(const WithdrawProofBundle& bundle,
                         const Ciphertext& oldBalance,
                         const Bytes32& publicKey) {
    if (!elgamal::IsValidCiphertext(oldBalance)) {
        return false;
    }
    if (!IsFullRangeProof(bundle.rangeProof)) {
        return false;
    }

    const Ciphertext newBalance = elgamal::SubtractAmount(oldBalance, bundle.amount);

    const bool range = proof::VerifyRangeProof(bundle.rangeProof);
    const bool equality = proof::VerifyCiphertextCommitmentProof(
        bundle.equalityProof, newBalance, publicKey, bundle.rangeProof.commitment);
    return range && equality;
}

} // namespace transfer
} // namespace veil
