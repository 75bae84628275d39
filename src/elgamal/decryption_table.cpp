// VEIL - Baby-Step/Giant-Step Decryption Table Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/elgamal/decryption_table.h"
#include "veil/elgamal/keys.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"

#include <string>
#include <vector>

namespace veil {
namespace elgamal {

using ed25519::Point;
using ed25519::Scalar;

DecryptionTable::DecryptionTable(unsigned bits) : bits_(bits) {
    if (bits == 0 || bits > MAX_TABLE_BITS) {
        throw InputDomainError("Decryption table bits must be in [1, " +
                               std::to_string(MAX_TABLE_BITS) + "], got " +
                               std::to_string(bits));
    }

    util::ScopedLogTimer timer(util::LogCategory::ELGAMAL,
                               "Decryption table build (" + std::to_string(bits) + " bits)");

    const uint64_t m = BabySteps();
    const Point& g = Point::Generator();

    std::vector<Point> steps;
    steps.reserve(m);
    Point acc;
    for (uint64_t j = 0; j < m; ++j) {
        steps.push_back(acc);
        acc += g;
    }
    // acc is now m*G
    giantStep_ = -acc;

    std::vector<Bytes32> encoded = Point::BatchToBytes(steps);
    babySteps_.reserve(m);
    for (uint64_t j = 0; j < m; ++j) {
        babySteps_.emplace(encoded[j], static_cast<uint32_t>(j));
    }
}

std::optional<Amount> DecryptionTable::Solve(const Point& target, Amount bound) const {
    const uint64_t m = BabySteps();
    const uint64_t giantSteps = bound / m;

    Point probe = target;
    for (uint64_t i = 0; i <= giantSteps; ++i) {
        auto it = babySteps_.find(probe.ToBytes());
        if (it != babySteps_.end()) {
            const Amount candidate = i * m + it->second;
            if (candidate <= bound) {
                return candidate;
            }
            return std::nullopt;
        }
        probe += giantStep_;
    }
    return std::nullopt;
}

std::optional<Amount> DecryptionTable::Decrypt(const Ciphertext& ct, const Bytes32& secretKey,
                                               Amount bound) const {
    auto target = DecryptToPoint(ct, SecretKeyToScalar(secretKey));
    if (!target) {
        return std::nullopt;
    }
    return Solve(*target, bound);
}

} // namespace elgamal
} // namespace veil
