// VEIL - Twisted ElGamal Ciphertext Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/elgamal/ciphertext.h"
#include "veil/elgamal/keys.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"

#include <algorithm>
#include <string>

namespace veil {
namespace elgamal {

using ed25519::Point;
using ed25519::Scalar;

namespace {

struct DecodedCiphertext {
    Point commitment;
    Point handle;
};

std::optional<DecodedCiphertext> TryDecode(const Ciphertext& ct) {
    auto c = Point::FromBytes(ct.commitment);
    auto d = Point::FromBytes(ct.handle);
    if (!c || !d) {
        return std::nullopt;
    }
    return DecodedCiphertext{*c, *d};
}

DecodedCiphertext DecodeOrThrow(const Ciphertext& ct, const char* what) {
    auto decoded = TryDecode(ct);
    if (!decoded) {
        throw MalformedDataError(std::string(what) + ": ciphertext does not decode");
    }
    return *decoded;
}

Point DecodeKeyOrThrow(const Bytes32& publicKey) {
    auto pk = DecodePublicKey(publicKey);
    if (!pk) {
        throw MalformedDataError("Public key is not a valid group element");
    }
    return *pk;
}

} // anonymous namespace

// ============================================================================
// Domains
// ============================================================================

Amount MaxAmount(AmountDomain domain) {
    return domain == AmountDomain::FastDecrypt ? MAX_FAST_DECRYPT_AMOUNT
                                               : MAX_RANGE_PROOF_AMOUNT;
}

void CheckAmountDomain(Amount amount, AmountDomain domain) {
    if (amount > MaxAmount(domain)) {
        throw InputDomainError("Amount " + std::to_string(amount) +
                               " exceeds the maximum of " +
                               std::to_string(MaxAmount(domain)));
    }
}

// ============================================================================
// Encryption
// ============================================================================

Ciphertext EncryptWith(Amount amount, const Bytes32& publicKey,
                       const Scalar& randomness, AmountDomain domain) {
    CheckAmountDomain(amount, domain);
    Point pk = DecodeKeyOrThrow(publicKey);

    Point commitment = ed25519::ScalarBaseMultiply(Scalar::FromUint64(amount)) + pk * randomness;
    Point handle = ed25519::ScalarBaseMultiply(randomness);
    return Ciphertext(commitment, handle);
}

EncryptionResult EncryptWithRandomness(Amount amount, const Bytes32& publicKey,
                                       AmountDomain domain) {
    Scalar r = Scalar::Random();
    return EncryptionResult{EncryptWith(amount, publicKey, r, domain), r};
}

Ciphertext Encrypt(Amount amount, const Bytes32& publicKey, AmountDomain domain) {
    return EncryptWithRandomness(amount, publicKey, domain).ciphertext;
}

// ============================================================================
// Decryption
// ============================================================================

std::optional<Point> DecryptToPoint(const Ciphertext& ct, const Scalar& secret) {
    auto decoded = TryDecode(ct);
    if (!decoded) {
        return std::nullopt;
    }
    return decoded->commitment - decoded->handle * secret;
}

std::optional<Amount> SolveDiscreteLogLinear(const Point& target, Amount bound) {
    const Point& g = Point::Generator();
    Point acc;
    for (Amount j = 0;; ++j) {
        if (acc == target) {
            return j;
        }
        if (j == bound) {
            break;
        }
        acc += g;
    }
    return std::nullopt;
}

std::optional<Amount> Decrypt(const Ciphertext& ct, const Bytes32& secretKey, Amount bound) {
    auto target = DecryptToPoint(ct, SecretKeyToScalar(secretKey));
    if (!target) {
        LOG_DEBUG(util::LogCategory::ELGAMAL) << "Decrypt: ciphertext does not decode";
        return std::nullopt;
    }
    auto amount = SolveDiscreteLogLinear(*target, bound);
    if (!amount) {
        LOG_DEBUG(util::LogCategory::ELGAMAL) << "Decrypt: no plaintext within bound " << bound;
    }
    return amount;
}

// ============================================================================
// Homomorphic Operations
// ============================================================================

Ciphertext Add(const Ciphertext& a, const Ciphertext& b) {
    DecodedCiphertext x = DecodeOrThrow(a, "Add");
    DecodedCiphertext y = DecodeOrThrow(b, "Add");
    return Ciphertext(x.commitment + y.commitment, x.handle + y.handle);
}

Ciphertext Subtract(const Ciphertext& a, const Ciphertext& b) {
    DecodedCiphertext x = DecodeOrThrow(a, "Subtract");
    DecodedCiphertext y = DecodeOrThrow(b, "Subtract");
    return Ciphertext(x.commitment - y.commitment, x.handle - y.handle);
}

Ciphertext Scale(const Ciphertext& ct, const Scalar& factor) {
    DecodedCiphertext x = DecodeOrThrow(ct, "Scale");
    return Ciphertext(x.commitment * factor, x.handle * factor);
}

Ciphertext AddAmount(const Ciphertext& ct, Amount amount) {
    DecodedCiphertext x = DecodeOrThrow(ct, "AddAmount");
    Point shifted = x.commitment + ed25519::ScalarBaseMultiply(Scalar::FromUint64(amount));
    return Ciphertext(shifted.ToBytes(), ct.handle);
}

Ciphertext SubtractAmount(const Ciphertext& ct, Amount amount) {
    DecodedCiphertext x = DecodeOrThrow(ct, "SubtractAmount");
    Point shifted = x.commitment - ed25519::ScalarBaseMultiply(Scalar::FromUint64(amount));
    return Ciphertext(shifted.ToBytes(), ct.handle);
}

Ciphertext ReRandomize(const Ciphertext& ct, const Bytes32& publicKey) {
    Ciphertext zero = EncryptWith(0, publicKey, Scalar::Random());
    return Add(ct, zero);
}

// ============================================================================
// Serialization
// ============================================================================

bool IsValidCiphertext(const Ciphertext& ct) {
    return TryDecode(ct).has_value();
}

Bytes64 SerializeCiphertext(const Ciphertext& ct) {
    Bytes64 out;
    std::copy(ct.commitment.begin(), ct.commitment.end(), out.begin());
    std::copy(ct.handle.begin(), ct.handle.end(), out.begin() + 32);
    return out;
}

Ciphertext DeserializeCiphertext(ByteView data) {
    if (data.size() != CIPHERTEXT_SIZE) {
        throw MalformedDataError("Ciphertext must be " + std::to_string(CIPHERTEXT_SIZE) +
                                 " bytes, got " + std::to_string(data.size()));
    }
    Ciphertext ct;
    std::copy(data.begin(), data.begin() + 32, ct.commitment.begin());
    std::copy(data.begin() + 32, data.end(), ct.handle.begin());
    return ct;
}

} // namespace elgamal
} // namespace veil
