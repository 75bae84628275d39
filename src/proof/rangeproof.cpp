// VEIL - Range Proof Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/proof/rangeproof.h"
#include "veil/core/errors.h"
#include "veil/crypto/transcript.h"
#include "veil/util/logging.h"

#include <algorithm>
#include <string>
#include <utility>

namespace veil {
namespace proof {

using ed25519::Point;
using ed25519::Scalar;
using ScalarVec = std::vector<Scalar>;
using PointVec = std::vector<Point>;

namespace {

constexpr const char* ABBREVIATED_DOMAIN = "veil/range/abbreviated";
constexpr const char* BULLETPROOF_DOMAIN = "veil/range/bulletproof";

size_t RoundsFor(size_t bits) {
    return bits == 32 ? 5 : 6;
}

/// A zero blinding would publish amount*G in the clear
void CheckBlinding(const Scalar& blinding) {
    if (blinding.IsZero()) {
        throw InputDomainError("Range proof blinding must be nonzero");
    }
}

// ----------------------------------------------------------------------------
// Encoding helpers
// ----------------------------------------------------------------------------

void PutBytes(Bytes& out, const Bytes32& b) {
    out.insert(out.end(), b.begin(), b.end());
}

/// Sequential reader over a proof buffer; every accessor fails soft
class ProofReader {
public:
    explicit ProofReader(ByteView data) : data_(data) {}

    std::optional<Point> ReadPoint() {
        if (pos_ + 32 > data_.size()) {
            return std::nullopt;
        }
        auto p = Point::FromBytes(data_.data() + pos_);
        pos_ += 32;
        return p;
    }

    std::optional<Scalar> ReadScalar() {
        if (pos_ + 32 > data_.size()) {
            return std::nullopt;
        }
        auto s = Scalar::FromCanonicalBytes(data_.data() + pos_);
        pos_ += 32;
        return s;
    }

    std::optional<Byte> ReadByte() {
        if (pos_ >= data_.size()) {
            return std::nullopt;
        }
        return data_[pos_++];
    }

    bool AtEnd() const { return pos_ == data_.size(); }

private:
    ByteView data_;
    size_t pos_{0};
};

// ----------------------------------------------------------------------------
// Vector helpers
// ----------------------------------------------------------------------------

ScalarVec Powers(const Scalar& base, size_t n) {
    ScalarVec out;
    out.reserve(n);
    Scalar acc = Scalar::One();
    for (size_t i = 0; i < n; ++i) {
        out.push_back(acc);
        acc *= base;
    }
    return out;
}

ScalarVec RandomVector(size_t n) {
    ScalarVec out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(Scalar::Random());
    }
    return out;
}

Scalar Sum(const ScalarVec& v) {
    Scalar acc;
    for (const auto& s : v) {
        acc += s;
    }
    return acc;
}

/// blind*H + <l, Gi> + <r, Hi>
Point CommitVectors(const Scalar& blind, const ScalarVec& l, const ScalarVec& r) {
    const Generators& gens = Generators::Get();
    const size_t n = l.size();

    ScalarVec scalars;
    PointVec points;
    scalars.reserve(2 * n + 1);
    points.reserve(2 * n + 1);

    scalars.push_back(blind);
    points.push_back(gens.H());
    for (size_t i = 0; i < n; ++i) {
        scalars.push_back(l[i]);
        points.push_back(gens.Gi()[i]);
        scalars.push_back(r[i]);
        points.push_back(gens.Hi()[i]);
    }
    return ed25519::MultiScalarMultiply(scalars, points);
}

// ----------------------------------------------------------------------------
// Inner product argument
// ----------------------------------------------------------------------------

void ProveInnerProduct(Transcript& transcript, const Point& Q,
                       PointVec G, PointVec H, ScalarVec a, ScalarVec b,
                       BulletproofData& out) {
    size_t n = a.size();
    while (n > 1) {
        const size_t half = n / 2;

        Scalar cL, cR;
        for (size_t i = 0; i < half; ++i) {
            cL += a[i] * b[half + i];
            cR += a[half + i] * b[i];
        }

        ScalarVec ls, rs;
        PointVec lp, rp;
        ls.reserve(n + 1); lp.reserve(n + 1);
        rs.reserve(n + 1); rp.reserve(n + 1);
        for (size_t i = 0; i < half; ++i) {
            ls.push_back(a[i]);        lp.push_back(G[half + i]);
            ls.push_back(b[half + i]); lp.push_back(H[i]);
            rs.push_back(a[half + i]); rp.push_back(G[i]);
            rs.push_back(b[i]);        rp.push_back(H[half + i]);
        }
        ls.push_back(cL); lp.push_back(Q);
        rs.push_back(cR); rp.push_back(Q);

        Point L = ed25519::MultiScalarMultiply(ls, lp);
        Point R = ed25519::MultiScalarMultiply(rs, rp);
        transcript.AppendPoint("L", L);
        transcript.AppendPoint("R", R);
        out.L.push_back(L);
        out.R.push_back(R);

        const Scalar u = transcript.ChallengeScalar("u");
        const Scalar uInv = u.Inverse();

        for (size_t i = 0; i < half; ++i) {
            a[i] = a[i] * u + a[half + i] * uInv;
            b[i] = b[i] * uInv + b[half + i] * u;
            G[i] = G[i] * uInv + G[half + i] * u;
            H[i] = H[i] * u + H[half + i] * uInv;
        }
        a.resize(half);
        b.resize(half);
        G.resize(half);
        H.resize(half);
        n = half;
    }
    out.a = a[0];
    out.b = b[0];
}

// ----------------------------------------------------------------------------
// Bulletproof prover / verifier
// ----------------------------------------------------------------------------

BulletproofData ProveBulletproof(Amount amount, const Scalar& gamma, size_t n,
                                 const Point& V) {
    const Generators& gens = Generators::Get();
    const Scalar one = Scalar::One();

    BulletproofData proof;
    proof.numBits = static_cast<uint8_t>(n);

    // Bit decomposition
    ScalarVec aL(n), aR(n);
    for (size_t i = 0; i < n; ++i) {
        if ((amount >> i) & 1) {
            aL[i] = one;
        }
        aR[i] = aL[i] - one;
    }

    const Scalar alpha = Scalar::Random();
    const Scalar rho = Scalar::Random();
    const ScalarVec sL = RandomVector(n);
    const ScalarVec sR = RandomVector(n);

    proof.A = CommitVectors(alpha, aL, aR);
    proof.S = CommitVectors(rho, sL, sR);

    Transcript transcript(BULLETPROOF_DOMAIN);
    transcript.AppendU64("n", n);
    transcript.AppendPoint("V", V);
    transcript.AppendPoint("A", proof.A);
    transcript.AppendPoint("S", proof.S);
    const Scalar y = transcript.ChallengeScalar("y");
    const Scalar z = transcript.ChallengeScalar("z");
    const Scalar z2 = z * z;

    const ScalarVec yPow = Powers(y, n);
    const ScalarVec twoPow = Powers(Scalar::FromUint64(2), n);

    // l(X) = l0 + l1 X, r(X) = r0 + r1 X
    ScalarVec l0(n), r0(n), r1(n);
    for (size_t i = 0; i < n; ++i) {
        l0[i] = aL[i] - z;
        r0[i] = yPow[i] * (aR[i] + z) + z2 * twoPow[i];
        r1[i] = yPow[i] * sR[i];
    }
    const ScalarVec& l1 = sL;

    const Scalar t1 = InnerProduct(l0, r1) + InnerProduct(l1, r0);
    const Scalar t2 = InnerProduct(l1, r1);

    const Scalar tau1 = Scalar::Random();
    const Scalar tau2 = Scalar::Random();
    proof.T1 = PedersenCommitPoint(t1, tau1);
    proof.T2 = PedersenCommitPoint(t2, tau2);

    transcript.AppendPoint("T1", proof.T1);
    transcript.AppendPoint("T2", proof.T2);
    const Scalar x = transcript.ChallengeScalar("x");

    ScalarVec l(n), r(n);
    for (size_t i = 0; i < n; ++i) {
        l[i] = l0[i] + l1[i] * x;
        r[i] = r0[i] + r1[i] * x;
    }
    proof.t = InnerProduct(l, r);
    proof.taux = tau2 * x * x + tau1 * x + z2 * gamma;
    proof.mu = alpha + rho * x;

    transcript.AppendScalar("taux", proof.taux);
    transcript.AppendScalar("mu", proof.mu);
    transcript.AppendScalar("t", proof.t);
    const Scalar w = transcript.ChallengeScalar("w");
    const Point Q = gens.U() * w;

    // h'_i = y^-i h_i
    const ScalarVec yInvPow = Powers(y.Inverse(), n);
    PointVec G(gens.Gi().begin(), gens.Gi().begin() + n);
    PointVec H;
    H.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        H.push_back(gens.Hi()[i] * yInvPow[i]);
    }

    ProveInnerProduct(transcript, Q, std::move(G), std::move(H), std::move(l), std::move(r), proof);
    return proof;
}

bool VerifyBulletproof(ByteView bytes, const Bytes32& commitment) {
    auto parsed = BulletproofData::FromBytes(bytes);
    if (!parsed) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Bulletproof does not parse";
        return false;
    }
    auto V = Point::FromBytes(commitment);
    if (!V) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Range proof commitment does not decode";
        return false;
    }

    const BulletproofData& proof = *parsed;
    const Generators& gens = Generators::Get();
    const size_t n = proof.numBits;
    const size_t rounds = proof.L.size();

    Transcript transcript(BULLETPROOF_DOMAIN);
    transcript.AppendU64("n", n);
    transcript.AppendPoint("V", *V);
    transcript.AppendPoint("A", proof.A);
    transcript.AppendPoint("S", proof.S);
    const Scalar y = transcript.ChallengeScalar("y");
    const Scalar z = transcript.ChallengeScalar("z");
    transcript.AppendPoint("T1", proof.T1);
    transcript.AppendPoint("T2", proof.T2);
    const Scalar x = transcript.ChallengeScalar("x");
    transcript.AppendScalar("taux", proof.taux);
    transcript.AppendScalar("mu", proof.mu);
    transcript.AppendScalar("t", proof.t);
    const Scalar w = transcript.ChallengeScalar("w");

    ScalarVec u(rounds), uInv(rounds);
    for (size_t j = 0; j < rounds; ++j) {
        transcript.AppendPoint("L", proof.L[j]);
        transcript.AppendPoint("R", proof.R[j]);
        u[j] = transcript.ChallengeScalar("u");
        uInv[j] = u[j].Inverse();
    }

    const Scalar z2 = z * z;
    const Scalar z3 = z2 * z;
    const ScalarVec yPow = Powers(y, n);
    const ScalarVec yInvPow = Powers(y.Inverse(), n);
    const ScalarVec twoPow = Powers(Scalar::FromUint64(2), n);
    const Scalar delta = (z - z2) * Sum(yPow) - z3 * Sum(twoPow);

    // Random weight folding the polynomial check into the same MSM
    const Scalar c = Scalar::Random();

    ScalarVec scalars;
    PointVec points;
    scalars.reserve(2 * n + 2 * rounds + 8);
    points.reserve(2 * n + 2 * rounds + 8);

    // Inner product relation:
    //   A + xS - mu H + w(t - ab) U + sum(u_j^2 L_j + u_j^-2 R_j)
    //   + sum((-z - a s_i) g_i) + sum((z + (z^2 2^i - b/s_i) y^-i) h_i) == 0
    scalars.push_back(Scalar::One());  points.push_back(proof.A);
    scalars.push_back(x);              points.push_back(proof.S);
    scalars.push_back(w * (proof.t - proof.a * proof.b)); points.push_back(gens.U());
    for (size_t j = 0; j < rounds; ++j) {
        scalars.push_back(u[j] * u[j]);       points.push_back(proof.L[j]);
        scalars.push_back(uInv[j] * uInv[j]); points.push_back(proof.R[j]);
    }
    for (size_t i = 0; i < n; ++i) {
        Scalar s = Scalar::One();
        Scalar sInv = Scalar::One();
        for (size_t j = 0; j < rounds; ++j) {
            const bool bit = ((i >> (rounds - 1 - j)) & 1) != 0;
            s *= bit ? u[j] : uInv[j];
            sInv *= bit ? uInv[j] : u[j];
        }
        scalars.push_back(-z - proof.a * s);
        points.push_back(gens.Gi()[i]);
        scalars.push_back(z + (z2 * twoPow[i] - proof.b * sInv) * yInvPow[i]);
        points.push_back(gens.Hi()[i]);
    }

    // Polynomial identity, weighted by c:
    //   (t - delta) G + taux H - z^2 V - x T1 - x^2 T2 == 0
    scalars.push_back(c * (proof.t - delta)); points.push_back(gens.G());
    scalars.push_back(c * proof.taux - proof.mu); points.push_back(gens.H());
    scalars.push_back(-(c * z2));      points.push_back(*V);
    scalars.push_back(-(c * x));       points.push_back(proof.T1);
    scalars.push_back(-(c * x * x));   points.push_back(proof.T2);

    if (!ed25519::MultiScalarMultiply(scalars, points).IsIdentity()) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Bulletproof equation check failed";
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Abbreviated proof
// ----------------------------------------------------------------------------

Scalar AbbreviatedChallenge(const Point& V, const Point& R) {
    Transcript transcript(ABBREVIATED_DOMAIN);
    transcript.AppendPoint("V", V);
    transcript.AppendPoint("R", R);
    return transcript.ChallengeScalar("c");
}

bool VerifyAbbreviated(ByteView bytes, const Bytes32& commitment) {
    ProofReader reader(bytes);
    auto R = reader.ReadPoint();
    auto zv = reader.ReadScalar();
    auto zr = reader.ReadScalar();
    auto c = reader.ReadScalar();
    auto V = Point::FromBytes(commitment);
    if (!R || !zv || !zr || !c || !V || !reader.AtEnd()) {
        LOG_DEBUG(util::LogCategory::PROOF) << "Abbreviated range proof does not parse";
        return false;
    }

    if (AbbreviatedChallenge(*V, *R) != *c) {
        return false;
    }

    // zv G + zr H == R + c V
    const Generators& gens = Generators::Get();
    Point check = ed25519::MultiScalarMultiply(
        {*zv, *zr, -*c, -Scalar::One()},
        {gens.G(), gens.H(), *V, *R});
    return check.IsIdentity();
}

} // anonymous namespace

// ============================================================================
// BulletproofData Serialization
// ============================================================================

Bytes BulletproofData::ToBytes() const {
    PointVec points{A, S, T1, T2};
    for (size_t j = 0; j < L.size(); ++j) {
        points.push_back(L[j]);
        points.push_back(R[j]);
    }
    const std::vector<Bytes32> encoded = Point::BatchToBytes(points);

    Bytes out;
    out.reserve(BulletproofSize(numBits));
    out.push_back(BULLETPROOF_VERSION);
    out.push_back(numBits);
    for (size_t i = 0; i < 4; ++i) {
        PutBytes(out, encoded[i]);
    }
    PutBytes(out, taux.ToBytes());
    PutBytes(out, mu.ToBytes());
    PutBytes(out, t.ToBytes());
    for (size_t i = 4; i < encoded.size(); ++i) {
        PutBytes(out, encoded[i]);
    }
    PutBytes(out, a.ToBytes());
    PutBytes(out, b.ToBytes());
    return out;
}

std::optional<BulletproofData> BulletproofData::FromBytes(ByteView data) {
    if (data.size() != BULLETPROOF_32_SIZE && data.size() != BULLETPROOF_64_SIZE) {
        return std::nullopt;
    }

    ProofReader reader(data);
    auto version = reader.ReadByte();
    auto bits = reader.ReadByte();
    if (!version || *version != BULLETPROOF_VERSION || !bits ||
        BulletproofSize(*bits) != data.size()) {
        return std::nullopt;
    }

    BulletproofData proof;
    proof.numBits = *bits;

    auto A = reader.ReadPoint();
    auto S = reader.ReadPoint();
    auto T1 = reader.ReadPoint();
    auto T2 = reader.ReadPoint();
    auto taux = reader.ReadScalar();
    auto mu = reader.ReadScalar();
    auto t = reader.ReadScalar();
    if (!A || !S || !T1 || !T2 || !taux || !mu || !t) {
        return std::nullopt;
    }
    proof.A = *A;
    proof.S = *S;
    proof.T1 = *T1;
    proof.T2 = *T2;
    proof.taux = *taux;
    proof.mu = *mu;
    proof.t = *t;

    const size_t rounds = RoundsFor(proof.numBits);
    for (size_t j = 0; j < rounds; ++j) {
        auto L = reader.ReadPoint();
        auto R = reader.ReadPoint();
        if (!L || !R) {
            return std::nullopt;
        }
        proof.L.push_back(*L);
        proof.R.push_back(*R);
    }

    auto a = reader.ReadScalar();
    auto b = reader.ReadScalar();
    if (!a || !b || !reader.AtEnd()) {
        return std::nullopt;
    }
    proof.a = *a;
    proof.b = *b;
    return proof;
}

// ============================================================================
// Generation
// ============================================================================

RangeProof GenerateBulletproof(Amount amount, const Scalar& blinding, size_t bits) {
    if (bits != 32 && bits != 64) {
        throw InputDomainError("Bulletproof width must be 32 or 64 bits, got " +
                               std::to_string(bits));
    }
    if (bits < 64 && (amount >> bits) != 0) {
        throw InputDomainError("Amount " + std::to_string(amount) + " does not fit in " +
                               std::to_string(bits) + " bits");
    }
    CheckBlinding(blinding);

    const Point V = PedersenCommitPoint(Scalar::FromUint64(amount), blinding);

    RangeProof result;
    result.commitment = V.ToBytes();
    result.proof = ProveBulletproof(amount, blinding, bits, V).ToBytes();
    return result;
}

RangeProof GenerateAbbreviatedProof(Amount amount, const Scalar& blinding) {
    if (amount >= ABBREVIATED_RANGE_LIMIT) {
        throw InputDomainError("Abbreviated range proof requires amount < 2^16, got " +
                               std::to_string(amount));
    }
    CheckBlinding(blinding);

    const Generators& gens = Generators::Get();
    const Scalar v = Scalar::FromUint64(amount);
    const Point V = PedersenCommitPoint(v, blinding);

    const Scalar kv = Scalar::Random();
    const Scalar kr = Scalar::Random();
    const Point R = ed25519::ScalarBaseMultiply(kv) + gens.H() * kr;

    const Scalar c = AbbreviatedChallenge(V, R);
    const Scalar zv = kv + c * v;
    const Scalar zr = kr + c * blinding;

    RangeProof result;
    result.commitment = V.ToBytes();
    result.proof.reserve(ABBREVIATED_PROOF_SIZE);
    PutBytes(result.proof, R.ToBytes());
    PutBytes(result.proof, zv.ToBytes());
    PutBytes(result.proof, zr.ToBytes());
    PutBytes(result.proof, c.ToBytes());
    return result;
}

RangeProof GenerateRangeProof(Amount amount, const Scalar& blinding) {
    if (amount < ABBREVIATED_RANGE_LIMIT) {
        return GenerateAbbreviatedProof(amount, blinding);
    }
    if ((amount >> 32) == 0) {
        return GenerateBulletproof(amount, blinding, 32);
    }
    return GenerateBulletproof(amount, blinding, 64);
}

// ============================================================================
// Verification
// ============================================================================

bool VerifyRangeProof(ByteView proof, const Bytes32& commitment) {
    switch (proof.size()) {
        case ABBREVIATED_PROOF_SIZE:
            return VerifyAbbreviated(proof, commitment);
        case BULLETPROOF_32_SIZE:
        case BULLETPROOF_64_SIZE:
            return VerifyBulletproof(proof, commitment);
        default:
            LOG_DEBUG(util::LogCategory::PROOF)
                << "Range proof has unsupported length " << proof.size();
            return false;
    }
}

bool BatchVerifyRangeProofs(const std::vector<RangeProof>& proofs) {
    return std::all_of(proofs.begin(), proofs.end(),
                       [](const RangeProof& p) { return VerifyRangeProof(p); });
}

} // namespace proof
} // namespace veil
