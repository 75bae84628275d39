// VEIL - SHA-2 Hash Functions
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Incremental SHA-256 and SHA-512 over OpenSSL's EVP digest interface.

#ifndef VEIL_CRYPTO_HASH_H
#define VEIL_CRYPTO_HASH_H

#include "veil/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>

struct evp_md_ctx_st;

namespace veil {

namespace detail {
struct EvpMdCtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
};
} // namespace detail

/// SHA-256 hasher with incremental Write/Finalize
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(ByteView data) { return Write(data.data(), data.size()); }

    /// Append a 32-bit little-endian integer
    SHA256& WriteUint32(uint32_t value);

    /// Finalize into a 32-byte digest; the hasher must be Reset before reuse
    Bytes32 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    std::unique_ptr<evp_md_ctx_st, detail::EvpMdCtxDeleter> ctx_;
};

/// SHA-512 hasher with incremental Write/Finalize
class SHA512 {
public:
    static constexpr size_t OUTPUT_SIZE = 64;

    SHA512();

    SHA512& Write(const Byte* data, size_t len);
    SHA512& Write(ByteView data) { return Write(data.data(), data.size()); }
    SHA512& WriteUint32(uint32_t value);

    Bytes64 Finalize();

    SHA512& Reset();

private:
    std::unique_ptr<evp_md_ctx_st, detail::EvpMdCtxDeleter> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// One-shot SHA-256
Bytes32 SHA256Hash(ByteView data);

/// One-shot SHA-512
Bytes64 SHA512Hash(ByteView data);

} // namespace veil

#endif // VEIL_CRYPTO_HASH_H
