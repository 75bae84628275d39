// VEIL - Pedersen Commitment Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/proof/commitment.h"

#include <stdexcept>

namespace veil {
namespace proof {

using ed25519::Point;
using ed25519::Scalar;

namespace {

constexpr const char* LABEL_H = "veil/pedersen/H";
constexpr const char* LABEL_U = "veil/bulletproof/U";
constexpr const char* LABEL_GI = "veil/bulletproof/G";
constexpr const char* LABEL_HI = "veil/bulletproof/H";

} // anonymous namespace

// ============================================================================
// Generators
// ============================================================================

Generators::Generators()
    : h_(ed25519::HashToPoint(LABEL_H))
    , u_(ed25519::HashToPoint(LABEL_U)) {
    gi_.reserve(MAX_RANGE_BITS);
    hi_.reserve(MAX_RANGE_BITS);
    for (uint32_t i = 0; i < MAX_RANGE_BITS; ++i) {
        gi_.push_back(ed25519::HashToPoint(LABEL_GI, i));
        hi_.push_back(ed25519::HashToPoint(LABEL_HI, i));
    }
}

const Generators& Generators::Get() {
    static const Generators instance;
    return instance;
}

// ============================================================================
// Commitments
// ============================================================================

Point PedersenCommitPoint(const Scalar& value, const Scalar& blinding) {
    const Generators& gens = Generators::Get();
    if (value.IsZero()) {
        return gens.H() * blinding;
    }
    return ed25519::ScalarBaseMultiply(value) + gens.H() * blinding;
}

PedersenCommitment PedersenCommit(Amount amount, const Scalar& blinding) {
    PedersenCommitment c;
    c.commitment = PedersenCommitPoint(Scalar::FromUint64(amount), blinding).ToBytes();
    return c;
}

Scalar GenerateBlinding() {
    // Scalar::Random already rejects zero
    return Scalar::Random();
}

Scalar InnerProduct(const std::vector<Scalar>& a, const std::vector<Scalar>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("InnerProduct: vector lengths differ");
    }
    Scalar acc;
    for (size_t i = 0; i < a.size(); ++i) {
        acc += a[i] * b[i];
    }
    return acc;
}

} // namespace proof
} // namespace veil
