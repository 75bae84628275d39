// VEIL - Error Types
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Exceptions thrown at the engine boundary. Verification failures are never
// reported through these: verifiers return false.

#ifndef VEIL_CORE_ERRORS_H
#define VEIL_CORE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace veil {

/// An amount or scalar lies outside the domain allowed at the call site
class InputDomainError : public std::invalid_argument {
public:
    explicit InputDomainError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/// A byte buffer has the wrong length or does not decode
class MalformedDataError : public std::invalid_argument {
public:
    explicit MalformedDataError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/// The source balance cannot cover the requested transfer
class InsufficientBalanceError : public std::runtime_error {
public:
    InsufficientBalanceError(const std::string& msg, uint64_t requested)
        : std::runtime_error(msg), requested_(requested) {}

    /// Amount the caller tried to move
    uint64_t Requested() const { return requested_; }

private:
    uint64_t requested_;
};

/// The accelerated backend failed; the dispatcher recovers with the native path
class AccelerationError : public std::runtime_error {
public:
    explicit AccelerationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace veil

#endif // VEIL_CORE_ERRORS_H
