// VEIL - Edwards25519 Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/ed25519.h"
#include "veil/crypto/hash.h"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace veil {
namespace ed25519 {

namespace {

class SodiumInit {
public:
    SodiumInit() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }
};

void EnsureSodium() {
    static SodiumInit init;
}

// (0, 1)
constexpr Bytes32 IDENTITY_ENCODING = {{1}};

} // anonymous namespace

// ============================================================================
// Scalar Implementation
// ============================================================================

Scalar::Scalar() {
    data_.fill(0);
}

Scalar::~Scalar() {
    sodium_memzero(data_.data(), data_.size());
}

std::optional<Scalar> Scalar::FromCanonicalBytes(const Byte* data) {
    // A value below l is left unchanged by reduction
    Scalar reduced = FromBytesModOrder(data, SIZE);
    if (sodium_memcmp(reduced.data_.data(), data, SIZE) != 0) {
        return std::nullopt;
    }
    return reduced;
}

Scalar Scalar::FromBytesModOrder(const Byte* data, size_t len) {
    if (len > 64) {
        throw std::invalid_argument("Scalar reduction input exceeds 64 bytes");
    }
    std::array<Byte, 64> wide{};
    std::copy(data, data + len, wide.begin());

    Scalar result;
    crypto_core_ed25519_scalar_reduce(result.data_.data(), wide.data());
    sodium_memzero(wide.data(), wide.size());
    return result;
}

Scalar Scalar::FromUint64(uint64_t value) {
    Scalar result;
    for (size_t i = 0; i < 8; ++i) {
        result.data_[i] = static_cast<Byte>(value >> (8 * i));
    }
    return result;
}

Scalar Scalar::Random() {
    EnsureSodium();
    Scalar result;
    crypto_core_ed25519_scalar_random(result.data_.data());
    return result;
}

bool Scalar::IsZero() const {
    return sodium_is_zero(data_.data(), SIZE) == 1;
}

Scalar Scalar::operator+(const Scalar& other) const {
    Scalar result;
    crypto_core_ed25519_scalar_add(result.data_.data(), data_.data(), other.data_.data());
    return result;
}

Scalar Scalar::operator-(const Scalar& other) const {
    Scalar result;
    crypto_core_ed25519_scalar_sub(result.data_.data(), data_.data(), other.data_.data());
    return result;
}

Scalar Scalar::operator*(const Scalar& other) const {
    Scalar result;
    crypto_core_ed25519_scalar_mul(result.data_.data(), data_.data(), other.data_.data());
    return result;
}

Scalar Scalar::operator-() const {
    Scalar result;
    crypto_core_ed25519_scalar_negate(result.data_.data(), data_.data());
    return result;
}

Scalar& Scalar::operator+=(const Scalar& other) {
    *this = *this + other;
    return *this;
}

Scalar& Scalar::operator-=(const Scalar& other) {
    *this = *this - other;
    return *this;
}

Scalar& Scalar::operator*=(const Scalar& other) {
    *this = *this * other;
    return *this;
}

Scalar Scalar::Inverse() const {
    Scalar result;
    if (crypto_core_ed25519_scalar_invert(result.data_.data(), data_.data()) != 0) {
        throw std::domain_error("Cannot invert the zero scalar");
    }
    return result;
}

bool Scalar::operator==(const Scalar& other) const {
    return sodium_memcmp(data_.data(), other.data_.data(), SIZE) == 0;
}

// ============================================================================
// Point Implementation
// ============================================================================

Point::Point() : data_(IDENTITY_ENCODING) {}

std::optional<Point> Point::FromBytes(const Byte* data) {
    Point p;
    std::copy(data, data + SIZE, p.data_.begin());
    if (p.IsIdentity()) {
        return p;
    }
    // Rejects non-canonical, off-curve, small-order and non-subgroup encodings
    if (crypto_core_ed25519_is_valid_point(p.data_.data()) != 1) {
        return std::nullopt;
    }
    return p;
}

std::vector<Bytes32> Point::BatchToBytes(const std::vector<Point>& points) {
    std::vector<Bytes32> out;
    out.reserve(points.size());
    for (const Point& p : points) {
        out.push_back(p.data_);
    }
    return out;
}

bool Point::IsIdentity() const {
    return data_ == IDENTITY_ENCODING;
}

Point Point::operator+(const Point& other) const {
    Point result;
    if (crypto_core_ed25519_add(result.data_.data(), data_.data(), other.data_.data()) != 0) {
        throw std::runtime_error("Ed25519 point addition failed");
    }
    return result;
}

Point Point::operator-(const Point& other) const {
    Point result;
    if (crypto_core_ed25519_sub(result.data_.data(), data_.data(), other.data_.data()) != 0) {
        throw std::runtime_error("Ed25519 point subtraction failed");
    }
    return result;
}

Point Point::operator-() const {
    return Identity() - *this;
}

Point& Point::operator+=(const Point& other) {
    *this = *this + other;
    return *this;
}

Point& Point::operator-=(const Point& other) {
    *this = *this - other;
    return *this;
}

Point Point::operator*(const Scalar& scalar) const {
    if (IsIdentity() || scalar.IsZero()) {
        return Identity();
    }
    Point result;
    // Fails only when the product is the identity
    if (crypto_scalarmult_ed25519_noclamp(result.data_.data(), scalar.data(), data_.data()) != 0) {
        return Identity();
    }
    return result;
}

bool Point::operator==(const Point& other) const {
    return sodium_memcmp(data_.data(), other.data_.data(), SIZE) == 0;
}

const Point& Point::Generator() {
    static const Point g = [] {
        Point p;
        const Scalar one = Scalar::One();
        if (crypto_scalarmult_ed25519_base_noclamp(p.data_.data(), one.data()) != 0) {
            throw std::runtime_error("Failed to compute Ed25519 base point");
        }
        return p;
    }();
    return g;
}

// ============================================================================
// High-Level Operations
// ============================================================================

Point ScalarBaseMultiply(const Scalar& scalar) {
    if (scalar.IsZero()) {
        return Point::Identity();
    }
    Point result;
    if (crypto_scalarmult_ed25519_base_noclamp(result.data_.data(), scalar.data()) != 0) {
        return Point::Identity();
    }
    return result;
}

Point MultiScalarMultiply(const std::vector<Scalar>& scalars,
                          const std::vector<Point>& points) {
    if (scalars.size() != points.size()) {
        throw std::invalid_argument("MultiScalarMultiply: length mismatch");
    }

    Point acc;
    for (size_t i = 0; i < points.size(); ++i) {
        acc += points[i] * scalars[i];
    }
    return acc;
}

Point HashToPoint(const std::string& label, uint32_t index) {
    for (uint32_t counter = 0;; ++counter) {
        Bytes32 uniform = SHA256()
            .Write(ByteView(label))
            .WriteUint32(index)
            .WriteUint32(counter)
            .Finalize();
        Bytes32 out;
        if (crypto_core_ed25519_from_uniform(out.data(), uniform.data()) != 0) {
            continue;
        }
        auto p = Point::FromBytes(out);
        if (p && !p->IsIdentity()) {
            return *p;
        }
    }
}

} // namespace ed25519
} // namespace veil
