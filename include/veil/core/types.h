// VEIL - Core Types Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Fundamental byte and buffer types shared by every VEIL module.

#ifndef VEIL_CORE_TYPES_H
#define VEIL_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace veil {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// Fixed 32-byte buffer (scalars, encoded points, SHA-256 digests)
using Bytes32 = std::array<Byte, 32>;

/// Fixed 64-byte buffer (SHA-512 digests, serialized ciphertexts)
using Bytes64 = std::array<Byte, 64>;

/// Plaintext token amount in base units
using Amount = uint64_t;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current wall-clock time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Milliseconds elapsed since a steady-clock start point
inline double ElapsedMillis(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = std::remove_const_t<T>;
    using pointer = T*;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(std::array<value_type, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    template<size_t N>
    constexpr Span(const std::array<value_type, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(std::vector<value_type>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    Span(const std::vector<value_type>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    /// View the characters of a string as bytes
    template<typename U = T,
             typename = std::enable_if_t<std::is_same<U, const Byte>::value>>
    Span(const std::string& str) noexcept
        : data_(reinterpret_cast<const Byte*>(str.data())), size_(str.size()) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr T& operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

private:
    pointer data_;
    size_type size_;
};

/// Read-only byte view, the common parameter type for hashing and parsing
using ByteView = Span<const Byte>;

} // namespace veil

#endif // VEIL_CORE_TYPES_H
