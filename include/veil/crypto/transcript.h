// VEIL - Fiat-Shamir Transcript
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// A running SHA-256 state that absorbs labelled protocol messages and squeezes
// challenge scalars. Prover and verifier must append the same messages in the
// same order to derive the same challenges.

#ifndef VEIL_CRYPTO_TRANSCRIPT_H
#define VEIL_CRYPTO_TRANSCRIPT_H

#include "veil/core/types.h"
#include "veil/crypto/ed25519.h"

#include <cstdint>
#include <string>

namespace veil {

/**
 * Fiat-Shamir transcript.
 *
 * Every append replaces the state with
 *   SHA-256(state || len(label) || label || len(data) || data)
 * where lengths are 32-bit little-endian, so no two different message
 * sequences produce the same framing.
 */
class Transcript {
public:
    /// Start a transcript bound to a protocol name
    explicit Transcript(const std::string& protocolLabel);

    void AppendMessage(const std::string& label, ByteView data);
    void AppendPoint(const std::string& label, const ed25519::Point& point);
    void AppendPoint(const std::string& label, const Bytes32& encoded);
    void AppendScalar(const std::string& label, const ed25519::Scalar& scalar);
    void AppendU64(const std::string& label, uint64_t value);

    /**
     * Derive a nonzero challenge scalar from the current state.
     * The state is ratcheted forward, so consecutive calls differ.
     */
    ed25519::Scalar ChallengeScalar(const std::string& label);

    /// Current state (for tests)
    const Bytes32& State() const { return state_; }

private:
    Bytes32 state_;
};

} // namespace veil

#endif // VEIL_CRYPTO_TRANSCRIPT_H
