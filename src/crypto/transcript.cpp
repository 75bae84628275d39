// VEIL - Fiat-Shamir Transcript Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/transcript.h"
#include "veil/crypto/hash.h"

namespace veil {

namespace {

void WriteFramed(SHA256& hasher, const std::string& label, ByteView data) {
    hasher.WriteUint32(static_cast<uint32_t>(label.size()))
          .Write(ByteView(label))
          .WriteUint32(static_cast<uint32_t>(data.size()))
          .Write(data);
}

void WriteFramed(SHA512& hasher, const std::string& label, ByteView data) {
    hasher.WriteUint32(static_cast<uint32_t>(label.size()))
          .Write(ByteView(label))
          .WriteUint32(static_cast<uint32_t>(data.size()))
          .Write(data);
}

} // anonymous namespace

Transcript::Transcript(const std::string& protocolLabel) {
    state_.fill(0);
    AppendMessage("protocol", ByteView(protocolLabel));
}

void Transcript::AppendMessage(const std::string& label, ByteView data) {
    SHA256 hasher;
    hasher.Write(state_);
    WriteFramed(hasher, label, data);
    state_ = hasher.Finalize();
}

void Transcript::AppendPoint(const std::string& label, const ed25519::Point& point) {
    AppendPoint(label, point.ToBytes());
}

void Transcript::AppendPoint(const std::string& label, const Bytes32& encoded) {
    AppendMessage(label, encoded);
}

void Transcript::AppendScalar(const std::string& label, const ed25519::Scalar& scalar) {
    AppendMessage(label, scalar.ToBytes());
}

void Transcript::AppendU64(const std::string& label, uint64_t value) {
    Byte buf[8];
    for (size_t i = 0; i < 8; ++i) {
        buf[i] = static_cast<Byte>(value >> (8 * i));
    }
    AppendMessage(label, ByteView(buf, sizeof(buf)));
}

ed25519::Scalar Transcript::ChallengeScalar(const std::string& label) {
    for (;;) {
        SHA512 wide;
        wide.Write(state_);
        WriteFramed(wide, label, ByteView());
        Bytes64 digest = wide.Finalize();

        state_ = SHA256Hash(digest);

        ed25519::Scalar c = ed25519::Scalar::FromBytesModOrder(digest.data(), digest.size());
        if (!c.IsZero()) {
            return c;
        }
    }
}

} // namespace veil
