// VEIL - SHA-2 Hash Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/hash.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace veil {

void detail::EvpMdCtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

namespace {

EVP_MD_CTX* NewDigestContext(const EVP_MD* md) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void DigestUpdate(EVP_MD_CTX* ctx, const Byte* data, size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void DigestFinal(EVP_MD_CTX* ctx, Byte* out) {
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx, out, &written) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

void DigestReset(EVP_MD_CTX* ctx, const EVP_MD* md) {
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void EncodeUint32(uint32_t value, Byte out[4]) {
    out[0] = static_cast<Byte>(value);
    out[1] = static_cast<Byte>(value >> 8);
    out[2] = static_cast<Byte>(value >> 16);
    out[3] = static_cast<Byte>(value >> 24);
}

} // anonymous namespace

// ============================================================================
// SHA256
// ============================================================================

SHA256::SHA256() : ctx_(NewDigestContext(EVP_sha256())) {}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    DigestUpdate(ctx_.get(), data, len);
    return *this;
}

SHA256& SHA256::WriteUint32(uint32_t value) {
    Byte buf[4];
    EncodeUint32(value, buf);
    return Write(buf, sizeof(buf));
}

Bytes32 SHA256::Finalize() {
    Bytes32 out;
    DigestFinal(ctx_.get(), out.data());
    return out;
}

SHA256& SHA256::Reset() {
    DigestReset(ctx_.get(), EVP_sha256());
    return *this;
}

// ============================================================================
// SHA512
// ============================================================================

SHA512::SHA512() : ctx_(NewDigestContext(EVP_sha512())) {}

SHA512& SHA512::Write(const Byte* data, size_t len) {
    DigestUpdate(ctx_.get(), data, len);
    return *this;
}

SHA512& SHA512::WriteUint32(uint32_t value) {
    Byte buf[4];
    EncodeUint32(value, buf);
    return Write(buf, sizeof(buf));
}

Bytes64 SHA512::Finalize() {
    Bytes64 out;
    DigestFinal(ctx_.get(), out.data());
    return out;
}

SHA512& SHA512::Reset() {
    DigestReset(ctx_.get(), EVP_sha512());
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Bytes32 SHA256Hash(ByteView data) {
    return SHA256().Write(data).Finalize();
}

Bytes64 SHA512Hash(ByteView data) {
    return SHA512().Write(data).Finalize();
}

} // namespace veil
