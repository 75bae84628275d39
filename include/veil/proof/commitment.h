// VEIL - Pedersen Commitments and Generators
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Pedersen commitments V = a*G + r*H over Edwards25519, and the fixed set of
// generators shared by every proof in the engine.
//
// G is the standard base point. H, U and the vector generators g_i, h_i are
// derived by hashing fixed labels to the curve, so no discrete-log relation
// between any two of them is known to anyone.

#ifndef VEIL_PROOF_COMMITMENT_H
#define VEIL_PROOF_COMMITMENT_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"

#include <cstddef>
#include <vector>

namespace veil {
namespace proof {

/// Maximum bit width of a range proof, and the length of the vector generators
constexpr size_t MAX_RANGE_BITS = 64;

// ============================================================================
// Generators
// ============================================================================

/**
 * Process-wide generator set, built on first use.
 */
class Generators {
public:
    static const Generators& Get();

    /// Base point (values)
    const ed25519::Point& G() const { return ed25519::Point::Generator(); }

    /// Pedersen blinding generator
    const ed25519::Point& H() const { return h_; }

    /// Inner-product generator
    const ed25519::Point& U() const { return u_; }

    /// Vector generators, MAX_RANGE_BITS of each
    const std::vector<ed25519::Point>& Gi() const { return gi_; }
    const std::vector<ed25519::Point>& Hi() const { return hi_; }

private:
    Generators();

    ed25519::Point h_;
    ed25519::Point u_;
    std::vector<ed25519::Point> gi_;
    std::vector<ed25519::Point> hi_;
};

// ============================================================================
// Pedersen Commitment
// ============================================================================

/// A compressed Pedersen commitment
struct PedersenCommitment {
    Bytes32 commitment{};

    bool operator==(const PedersenCommitment& other) const {
        return commitment == other.commitment;
    }
    bool operator!=(const PedersenCommitment& other) const { return !(*this == other); }
};

/// V = value*G + blinding*H as a point
ed25519::Point PedersenCommitPoint(const ed25519::Scalar& value,
                                   const ed25519::Scalar& blinding);

/**
 * Commit to an amount. An amount of zero commits as blinding*H alone.
 */
PedersenCommitment PedersenCommit(Amount amount, const ed25519::Scalar& blinding);

/// Uniformly random nonzero blinding factor
ed25519::Scalar GenerateBlinding();

/**
 * Inner product of two scalar vectors.
 * @throws std::invalid_argument if the lengths differ
 */
ed25519::Scalar InnerProduct(const std::vector<ed25519::Scalar>& a,
                             const std::vector<ed25519::Scalar>& b);

} // namespace proof
} // namespace veil

#endif // VEIL_PROOF_COMMITMENT_H
