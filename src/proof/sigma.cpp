// VEIL - Schnorr Validity and Equality Proof Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/proof/sigma.h"
#include "veil/core/errors.h"
#include "veil/crypto/transcript.h"
#include "veil/elgamal/keys.h"
#include "veil/proof/commitment.h"
#include "veil/util/logging.h"

#include <openssl/crypto.h>

#include <string>
#include <vector>

namespace veil {
namespace proof {

using ed25519::Point;
using ed25519::Scalar;
using elgamal::Ciphertext;

namespace {

constexpr const char* VALIDITY_DOMAIN = "veil/sigma/validity";
constexpr const char* EQUALITY_DOMAIN = "veil/sigma/equality";
constexpr const char* CROSS_KEY_DOMAIN = "veil/sigma/equality-cross-key";
constexpr const char* CT_COMMITMENT_DOMAIN = "veil/sigma/ciphertext-commitment";

// ----------------------------------------------------------------------------
// Encoding helpers
// ----------------------------------------------------------------------------

void PutBytes(Bytes& out, const Bytes32& b) {
    out.insert(out.end(), b.begin(), b.end());
}

std::optional<Point> PointAt(ByteView data, size_t slot) {
    return Point::FromBytes(data.data() + 32 * slot);
}

std::optional<Scalar> ScalarAt(ByteView data, size_t slot) {
    return Scalar::FromCanonicalBytes(data.data() + 32 * slot);
}

Point DecodeOrThrow(const Bytes32& encoded, const char* what) {
    auto p = Point::FromBytes(encoded);
    if (!p) {
        throw MalformedDataError(std::string(what) + " is not a valid curve point");
    }
    return *p;
}

/// sum(scalars[i] * points[i]) == identity
bool Holds(const std::vector<Scalar>& scalars, const std::vector<Point>& points) {
    return ed25519::MultiScalarMultiply(scalars, points).IsIdentity();
}

// ----------------------------------------------------------------------------
// Challenges
// ----------------------------------------------------------------------------

Scalar ValidityChallenge(const Bytes32& publicKey, const Ciphertext& ct,
                         const Point& YC, const Point& YD) {
    Transcript transcript(VALIDITY_DOMAIN);
    transcript.AppendPoint("P", publicKey);
    transcript.AppendPoint("C", ct.commitment);
    transcript.AppendPoint("D", ct.handle);
    transcript.AppendPoint("Y_C", YC);
    transcript.AppendPoint("Y_D", YD);
    return transcript.ChallengeScalar("c");
}

Scalar EqualityChallenge(const Bytes32& publicKey, const Ciphertext& first,
                         const Ciphertext& second, const EqualityProof& proof) {
    Transcript transcript(EQUALITY_DOMAIN);
    transcript.AppendPoint("P", publicKey);
    transcript.AppendPoint("C1", first.commitment);
    transcript.AppendPoint("D1", first.handle);
    transcript.AppendPoint("C2", second.commitment);
    transcript.AppendPoint("D2", second.handle);
    transcript.AppendPoint("Y1", proof.Y1);
    transcript.AppendPoint("Y2", proof.Y2);
    transcript.AppendPoint("Y3", proof.Y3);
    return transcript.ChallengeScalar("c");
}

Scalar CrossKeyChallenge(const CrossKeyStatement& st, const CrossKeyEqualityProof& proof) {
    Transcript transcript(CROSS_KEY_DOMAIN);
    transcript.AppendPoint("P_d", st.destinationKey);
    transcript.AppendPoint("P_s", st.sourceKey);
    transcript.AppendPoint("C_d", st.destinationCommitment);
    transcript.AppendPoint("C_s", st.sourceCommitment);
    transcript.AppendPoint("D", st.handle);
    transcript.AppendPoint("V", st.pedersenCommitment);
    transcript.AppendPoint("Y0", proof.Y0);
    transcript.AppendPoint("Y1", proof.Y1);
    transcript.AppendPoint("Y2", proof.Y2);
    transcript.AppendPoint("Y3", proof.Y3);
    return transcript.ChallengeScalar("c");
}

Scalar CiphertextCommitmentChallenge(const Bytes32& publicKey, const Ciphertext& ct,
                                     const Bytes32& pedersenCommitment,
                                     const CiphertextCommitmentProof& proof) {
    Transcript transcript(CT_COMMITMENT_DOMAIN);
    transcript.AppendPoint("P", publicKey);
    transcript.AppendPoint("C", ct.commitment);
    transcript.AppendPoint("D", ct.handle);
    transcript.AppendPoint("V", pedersenCommitment);
    transcript.AppendPoint("Y0", proof.Y0);
    transcript.AppendPoint("Y1", proof.Y1);
    transcript.AppendPoint("Y2", proof.Y2);
    return transcript.ChallengeScalar("c");
}

} // anonymous namespace

// ============================================================================
// Validity Proof
// ============================================================================

Bytes ValidityProof::ToBytes() const {
    Bytes out;
    out.reserve(VALIDITY_PROOF_SIZE);
    PutBytes(out, challenge.ToBytes());
    PutBytes(out, responseAmount.ToBytes());
    PutBytes(out, responseRandom.ToBytes());
    return out;
}

std::optional<ValidityProof> ValidityProof::FromBytes(ByteView data) {
    if (data.size() != VALIDITY_PROOF_SIZE) {
        return std::nullopt;
    }
    auto c = ScalarAt(data, 0);
    auto za = ScalarAt(data, 1);
    auto zr = ScalarAt(data, 2);
    if (!c || !za || !zr) {
        return std::nullopt;
    }
    ValidityProof proof;
    proof.challenge = *c;
    proof.responseAmount = *za;
    proof.responseRandom = *zr;
    return proof;
}

ValidityProof GenerateValidityProof(const Ciphertext& ciphertext, const Bytes32& publicKey,
                                    Amount amount, const Scalar& randomness) {
    const Point P = DecodeOrThrow(publicKey, "Public key");

    const Scalar ka = Scalar::Random();
    const Scalar kr = Scalar::Random();
    const Point YC = ed25519::ScalarBaseMultiply(ka) + P * kr;
    const Point YD = ed25519::ScalarBaseMultiply(kr);

    ValidityProof proof;
    proof.challenge = ValidityChallenge(publicKey, ciphertext, YC, YD);
    proof.responseAmount = ka + proof.challenge * Scalar::FromUint64(amount);
    proof.responseRandom = kr + proof.challenge * randomness;
    return proof;
}

bool VerifyValidityProof(const ValidityProof& proof, const Ciphertext& ciphertext,
                         const Bytes32& publicKey) {
    auto P = Point::FromBytes(publicKey);
    auto C = Point::FromBytes(ciphertext.commitment);
    auto D = Point::FromBytes(ciphertext.handle);
    if (!P || !C || !D) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Validity proof statement does not decode";
        return false;
    }

    const Scalar& c = proof.challenge;
    const Point G = Point::Generator();
    const Point YC = ed25519::MultiScalarMultiply(
        {proof.responseAmount, proof.responseRandom, -c}, {G, *P, *C});
    const Point YD = ed25519::MultiScalarMultiply({proof.responseRandom, -c}, {G, *D});

    const Bytes32 expected = ValidityChallenge(publicKey, ciphertext, YC, YD).ToBytes();
    const Bytes32 actual = c.ToBytes();
    return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
}

bool VerifyValidityProof(ByteView proof, const Ciphertext& ciphertext,
                         const Bytes32& publicKey) {
    auto parsed = ValidityProof::FromBytes(proof);
    if (!parsed) {
        return false;
    }
    return VerifyValidityProof(*parsed, ciphertext, publicKey);
}

// ============================================================================
// Equality Proof
// ============================================================================

Bytes EqualityProof::ToBytes() const {
    const std::vector<Bytes32> points = Point::BatchToBytes({Y1, Y2, Y3});
    Bytes out;
    out.reserve(EQUALITY_PROOF_SIZE);
    for (const auto& p : points) {
        PutBytes(out, p);
    }
    PutBytes(out, z1.ToBytes());
    PutBytes(out, z2.ToBytes());
    return out;
}

std::optional<EqualityProof> EqualityProof::FromBytes(ByteView data) {
    if (data.size() != EQUALITY_PROOF_SIZE) {
        return std::nullopt;
    }
    auto y1 = PointAt(data, 0);
    auto y2 = PointAt(data, 1);
    auto y3 = PointAt(data, 2);
    auto z1 = ScalarAt(data, 3);
    auto z2 = ScalarAt(data, 4);
    if (!y1 || !y2 || !y3 || !z1 || !z2) {
        return std::nullopt;
    }
    EqualityProof proof;
    proof.Y1 = *y1;
    proof.Y2 = *y2;
    proof.Y3 = *y3;
    proof.z1 = *z1;
    proof.z2 = *z2;
    return proof;
}

EqualityProof GenerateEqualityProof(const Ciphertext& first, const Ciphertext& second,
                                    const Bytes32& publicKey,
                                    const Scalar& firstRandomness,
                                    const Scalar& secondRandomness) {
    const Point P = DecodeOrThrow(publicKey, "Public key");

    const Scalar k1 = Scalar::Random();
    const Scalar k2 = Scalar::Random();

    EqualityProof proof;
    proof.Y1 = ed25519::ScalarBaseMultiply(k1);
    proof.Y2 = ed25519::ScalarBaseMultiply(k2);
    proof.Y3 = P * (k1 - k2);

    const Scalar c = EqualityChallenge(publicKey, first, second, proof);
    proof.z1 = k1 + c * firstRandomness;
    proof.z2 = k2 + c * secondRandomness;
    return proof;
}

bool VerifyEqualityProof(const EqualityProof& proof, const Ciphertext& first,
                         const Ciphertext& second, const Bytes32& publicKey) {
    auto P = Point::FromBytes(publicKey);
    auto C1 = Point::FromBytes(first.commitment);
    auto D1 = Point::FromBytes(first.handle);
    auto C2 = Point::FromBytes(second.commitment);
    auto D2 = Point::FromBytes(second.handle);
    if (!P || !C1 || !D1 || !C2 || !D2) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Equality proof statement does not decode";
        return false;
    }

    const Scalar c = EqualityChallenge(publicKey, first, second, proof);
    const Point& G = Point::Generator();
    const Scalar one = Scalar::One();

    // z1*G = Y1 + c*D1
    const bool firstHandle = Holds({proof.z1, -one, -c}, {G, proof.Y1, *D1});
    // z2*G = Y2 + c*D2
    const bool secondHandle = Holds({proof.z2, -one, -c}, {G, proof.Y2, *D2});
    // (z1 - z2)*P = Y3 + c*(C1 - C2)
    const bool difference =
        Holds({proof.z1 - proof.z2, -one, -c, c}, {*P, proof.Y3, *C1, *C2});

    return firstHandle & secondHandle & difference;
}

bool VerifyEqualityProof(ByteView proof, const Ciphertext& first,
                         const Ciphertext& second, const Bytes32& publicKey) {
    auto parsed = EqualityProof::FromBytes(proof);
    if (!parsed) {
        return false;
    }
    return VerifyEqualityProof(*parsed, first, second, publicKey);
}

// ============================================================================
// Cross-Key Equality Proof
// ============================================================================

Bytes CrossKeyEqualityProof::ToBytes() const {
    const std::vector<Bytes32> points = Point::BatchToBytes({Y0, Y1, Y2, Y3});
    Bytes out;
    out.reserve(CROSS_KEY_EQUALITY_PROOF_SIZE);
    for (const auto& p : points) {
        PutBytes(out, p);
    }
    PutBytes(out, responseAmount.ToBytes());
    PutBytes(out, responseRandom.ToBytes());
    return out;
}

std::optional<CrossKeyEqualityProof> CrossKeyEqualityProof::FromBytes(ByteView data) {
    if (data.size() != CROSS_KEY_EQUALITY_PROOF_SIZE) {
        return std::nullopt;
    }
    auto y0 = PointAt(data, 0);
    auto y1 = PointAt(data, 1);
    auto y2 = PointAt(data, 2);
    auto y3 = PointAt(data, 3);
    auto za = ScalarAt(data, 4);
    auto zr = ScalarAt(data, 5);
    if (!y0 || !y1 || !y2 || !y3 || !za || !zr) {
        return std::nullopt;
    }
    CrossKeyEqualityProof proof;
    proof.Y0 = *y0;
    proof.Y1 = *y1;
    proof.Y2 = *y2;
    proof.Y3 = *y3;
    proof.responseAmount = *za;
    proof.responseRandom = *zr;
    return proof;
}

CrossKeyEqualityProof GenerateCrossKeyEqualityProof(const CrossKeyStatement& statement,
                                                    Amount amount,
                                                    const Scalar& randomness) {
    const Point Pd = DecodeOrThrow(statement.destinationKey, "Destination key");
    const Point Ps = DecodeOrThrow(statement.sourceKey, "Source key");
    const Point& H = Generators::Get().H();

    const Scalar ka = Scalar::Random();
    const Scalar kr = Scalar::Random();
    const Point kaG = ed25519::ScalarBaseMultiply(ka);

    CrossKeyEqualityProof proof;
    proof.Y0 = ed25519::ScalarBaseMultiply(kr);
    proof.Y1 = kaG + Pd * kr;
    proof.Y2 = kaG + H * kr;
    proof.Y3 = (Pd - Ps) * kr;

    const Scalar c = CrossKeyChallenge(statement, proof);
    proof.responseAmount = ka + c * Scalar::FromUint64(amount);
    proof.responseRandom = kr + c * randomness;
    return proof;
}

bool VerifyCrossKeyEqualityProof(const CrossKeyEqualityProof& proof,
                                 const CrossKeyStatement& statement) {
    auto Pd = Point::FromBytes(statement.destinationKey);
    auto Ps = Point::FromBytes(statement.sourceKey);
    auto Cd = Point::FromBytes(statement.destinationCommitment);
    auto Cs = Point::FromBytes(statement.sourceCommitment);
    auto D = Point::FromBytes(statement.handle);
    auto V = Point::FromBytes(statement.pedersenCommitment);
    if (!Pd || !Ps || !Cd || !Cs || !D || !V) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Cross-key equality statement does not decode";
        return false;
    }

    const Scalar c = CrossKeyChallenge(statement, proof);
    const Point& G = Point::Generator();
    const Point& H = Generators::Get().H();
    const Scalar one = Scalar::One();
    const Scalar& za = proof.responseAmount;
    const Scalar& zr = proof.responseRandom;

    // z_r*G = Y0 + c*D
    const bool handle = Holds({zr, -one, -c}, {G, proof.Y0, *D});
    // z_a*G + z_r*P_d = Y1 + c*C_d
    const bool destination = Holds({za, zr, -one, -c}, {G, *Pd, proof.Y1, *Cd});
    // z_a*G + z_r*H = Y2 + c*V
    const bool pedersen = Holds({za, zr, -one, -c}, {G, H, proof.Y2, *V});
    // z_r*(P_d - P_s) = Y3 + c*(C_d - C_s)
    const bool crossKey =
        Holds({zr, -zr, -one, -c, c}, {*Pd, *Ps, proof.Y3, *Cd, *Cs});

    return handle & destination & pedersen & crossKey;
}

bool VerifyCrossKeyEqualityProof(ByteView proof, const CrossKeyStatement& statement) {
    auto parsed = CrossKeyEqualityProof::FromBytes(proof);
    if (!parsed) {
        return false;
    }
    return VerifyCrossKeyEqualityProof(*parsed, statement);
}

// ============================================================================
// Ciphertext-Commitment Equality Proof
// ============================================================================

Bytes CiphertextCommitmentProof::ToBytes() const {
    const std::vector<Bytes32> points = Point::BatchToBytes({Y0, Y1, Y2});
    Bytes out;
    out.reserve(CIPHERTEXT_COMMITMENT_PROOF_SIZE);
    for (const auto& p : points) {
        PutBytes(out, p);
    }
    PutBytes(out, responseSecret.ToBytes());
    PutBytes(out, responseAmount.ToBytes());
    PutBytes(out, responseBlinding.ToBytes());
    return out;
}

std::optional<CiphertextCommitmentProof> CiphertextCommitmentProof::FromBytes(ByteView data) {
    if (data.size() != CIPHERTEXT_COMMITMENT_PROOF_SIZE) {
        return std::nullopt;
    }
    auto y0 = PointAt(data, 0);
    auto y1 = PointAt(data, 1);
    auto y2 = PointAt(data, 2);
    auto zs = ScalarAt(data, 3);
    auto za = ScalarAt(data, 4);
    auto zrho = ScalarAt(data, 5);
    if (!y0 || !y1 || !y2 || !zs || !za || !zrho) {
        return std::nullopt;
    }
    CiphertextCommitmentProof proof;
    proof.Y0 = *y0;
    proof.Y1 = *y1;
    proof.Y2 = *y2;
    proof.responseSecret = *zs;
    proof.responseAmount = *za;
    proof.responseBlinding = *zrho;
    return proof;
}

CiphertextCommitmentProof GenerateCiphertextCommitmentProof(
    const Ciphertext& ciphertext, const Bytes32& publicKey,
    const Bytes32& pedersenCommitment, const Bytes32& secretKey,
    Amount amount, const Scalar& blinding) {
    const Point D = DecodeOrThrow(ciphertext.handle, "Ciphertext handle");
    const Point& H = Generators::Get().H();
    const Scalar s = elgamal::SecretKeyToScalar(secretKey);

    const Scalar ks = Scalar::Random();
    const Scalar ka = Scalar::Random();
    const Scalar krho = Scalar::Random();
    const Point kaG = ed25519::ScalarBaseMultiply(ka);

    CiphertextCommitmentProof proof;
    proof.Y0 = ed25519::ScalarBaseMultiply(ks);
    proof.Y1 = kaG + D * ks;
    proof.Y2 = kaG + H * krho;

    const Scalar c = CiphertextCommitmentChallenge(publicKey, ciphertext,
                                                   pedersenCommitment, proof);
    proof.responseSecret = ks + c * s;
    proof.responseAmount = ka + c * Scalar::FromUint64(amount);
    proof.responseBlinding = krho + c * blinding;
    return proof;
}

bool VerifyCiphertextCommitmentProof(const CiphertextCommitmentProof& proof,
                                     const Ciphertext& ciphertext,
                                     const Bytes32& publicKey,
                                     const Bytes32& pedersenCommitment) {
    auto P = Point::FromBytes(publicKey);
    auto C = Point::FromBytes(ciphertext.commitment);
    auto D = Point::FromBytes(ciphertext.handle);
    auto V = Point::FromBytes(pedersenCommitment);
    if (!P || !C || !D || !V) {
        LOG_DEBUG(util::LogCategory::PROOF)
            << "Ciphertext-commitment statement does not decode";
        return false;
    }

    const Scalar c = CiphertextCommitmentChallenge(publicKey, ciphertext,
                                                   pedersenCommitment, proof);
    const Point& G = Point::Generator();
    const Point& H = Generators::Get().H();
    const Scalar one = Scalar::One();

    // z_s*G = Y0 + c*P
    const bool key = Holds({proof.responseSecret, -one, -c}, {G, proof.Y0, *P});
    // z_a*G + z_s*D = Y1 + c*C
    const bool ciphertextEq = Holds({proof.responseAmount, proof.responseSecret, -one, -c},
                                    {G, *D, proof.Y1, *C});
    // z_a*G + z_rho*H = Y2 + c*V
    const bool commitmentEq = Holds({proof.responseAmount, proof.responseBlinding, -one, -c},
                                    {G, H, proof.Y2, *V});

    return key & ciphertextEq & commitmentEq;
}

bool VerifyCiphertextCommitmentProof(ByteView proof, const Ciphertext& ciphertext,
                                     const Bytes32& publicKey,
                                     const Bytes32& pedersenCommitment) {
    auto parsed = CiphertextCommitmentProof::FromBytes(proof);
    if (!parsed) {
        return false;
    }
    return VerifyCiphertextCommitmentProof(*parsed, ciphertext, publicKey,
                                           pedersenCommitment);
}

} // namespace proof
} // namespace veil
