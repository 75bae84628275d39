// VEIL - Edwards25519 Group Operations
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Prime-order group arithmetic on Edwards25519, restricted to the subgroup of
// order l = 2^252 + 27742317777372353535851937790883648493. Scalars and points
// are kept in their 32-byte canonical encodings and every operation goes
// through libsodium's crypto_core_ed25519 and crypto_scalarmult_ed25519
// primitives.

#ifndef VEIL_CRYPTO_ED25519_H
#define VEIL_CRYPTO_ED25519_H

#include "veil/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace ed25519 {

// ============================================================================
// Scalar (integer mod l)
// ============================================================================

/**
 * A scalar modulo the group order, stored as 32 canonical little-endian bytes.
 * Used for secret keys, randomness, nonces, challenges and responses.
 */
class Scalar {
public:
    static constexpr size_t SIZE = 32;

    /// Zero
    Scalar();

    /// Destructor - securely clears memory
    ~Scalar();

    Scalar(const Scalar& other) = default;
    Scalar& operator=(const Scalar& other) = default;

    /// Parse canonical bytes; nullopt if the value is not below l
    static std::optional<Scalar> FromCanonicalBytes(const Byte* data);
    static std::optional<Scalar> FromCanonicalBytes(const Bytes32& data) {
        return FromCanonicalBytes(data.data());
    }

    /**
     * Interpret up to 64 little-endian bytes as an integer and reduce mod l.
     *
     * @throws std::invalid_argument if len exceeds 64
     */
    static Scalar FromBytesModOrder(const Byte* data, size_t len);

    static Scalar FromUint64(uint64_t value);

    /// Uniformly random nonzero scalar
    static Scalar Random();

    static Scalar One() { return FromUint64(1); }

    bool IsZero() const;

    const Bytes32& ToBytes() const { return data_; }
    const Byte* data() const { return data_.data(); }

    /// Arithmetic operations (mod l)
    Scalar operator+(const Scalar& other) const;
    Scalar operator-(const Scalar& other) const;
    Scalar operator*(const Scalar& other) const;
    Scalar operator-() const;

    Scalar& operator+=(const Scalar& other);
    Scalar& operator-=(const Scalar& other);
    Scalar& operator*=(const Scalar& other);

    /// Modular inverse; throws std::domain_error for zero
    Scalar Inverse() const;

    /// Constant-time comparison
    bool operator==(const Scalar& other) const;
    bool operator!=(const Scalar& other) const { return !(*this == other); }

private:
    Bytes32 data_;
};

// ============================================================================
// Point (element of the prime-order subgroup)
// ============================================================================

/**
 * An element of the order-l subgroup, held as its compressed encoding.
 * Every Point is either the identity or a point libsodium accepts as a valid
 * main-subgroup element, so small-order and torsion-carrying encodings never
 * enter the group arithmetic.
 */
class Point {
public:
    /// Encoded point size
    static constexpr size_t SIZE = 32;

    /// Identity element
    Point();

    /**
     * Decode 32 bytes. Accepts the identity encoding and canonical encodings
     * of points in the order-l subgroup; nullopt for anything else, including
     * the other small-order points and points with a torsion component.
     */
    static std::optional<Point> FromBytes(const Byte* data);
    static std::optional<Point> FromBytes(const Bytes32& data) {
        return FromBytes(data.data());
    }

    /// Compressed encoding
    Bytes32 ToBytes() const { return data_; }

    /// Encode many points at once
    static std::vector<Bytes32> BatchToBytes(const std::vector<Point>& points);

    bool IsIdentity() const;

    Point operator+(const Point& other) const;
    Point operator-(const Point& other) const;
    Point operator-() const;
    Point& operator+=(const Point& other);
    Point& operator-=(const Point& other);

    /// Variable-base scalar multiplication
    Point operator*(const Scalar& scalar) const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    /// The RFC 8032 base point B
    static const Point& Generator();

    static Point Identity() { return Point(); }

private:
    Bytes32 data_;

    friend Point ScalarBaseMultiply(const Scalar& scalar);
};

/// Scalar times a point (same as point * scalar)
inline Point operator*(const Scalar& scalar, const Point& point) {
    return point * scalar;
}

// ============================================================================
// High-Level Operations
// ============================================================================

/// Scalar multiplication of the base point: scalar * G
Point ScalarBaseMultiply(const Scalar& scalar);

/**
 * Multi-scalar multiplication: sum of scalars[i] * points[i].
 *
 * @throws std::invalid_argument if the vectors differ in length
 */
Point MultiScalarMultiply(const std::vector<Scalar>& scalars,
                          const std::vector<Point>& points);

/**
 * Deterministic generator derivation: SHA-256(label || index || counter) fed
 * through libsodium's Elligator 2 map, which lands in the order-l subgroup.
 * Nobody knows the discrete log of the result relative to any other generator.
 */
Point HashToPoint(const std::string& label, uint32_t index = 0);

} // namespace ed25519
} // namespace veil

#endif // VEIL_CRYPTO_ED25519_H
