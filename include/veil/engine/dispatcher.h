// VEIL - Backend Dispatcher
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Process-wide entry point that routes every engine operation to the
// accelerated backend when it is available and healthy, and to the native
// backend otherwise.
//
// Availability is decided once by a capability probe that builds the
// accelerated backend on a background thread. Concurrent first callers share
// the same in-flight probe. The outcome is cached until ResetForTesting() or
// Configure().
//
// A failing accelerated call is retried on the native backend; the caller
// sees only the native result. Each call leaves a PerformanceSample in a
// bounded ring buffer.

#ifndef VEIL_ENGINE_DISPATCHER_H
#define VEIL_ENGINE_DISPATCHER_H

#include "veil/engine/backend.h"
#include "veil/util/config.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace veil {
namespace engine {

/// Ring buffer capacity for performance samples
constexpr size_t MAX_PERFORMANCE_SAMPLES = 1000;

// ============================================================================
// Configuration
// ============================================================================

enum class Implementation {
    Auto,          // accelerated when the probe succeeds
    Native,        // never probe
    Accelerated    // wait for the probe without a timeout
};

const char* ImplementationName(Implementation impl);

/// Parse "auto", "native" or "accelerated" (case-insensitive)
std::optional<Implementation> ParseImplementation(const std::string& value);

struct DispatchConfig {
    Implementation implementation{Implementation::Auto};

    /// Record performance samples
    bool profiling{true};

    /// Items per chunk in batch operations
    size_t preferredBatchSize{10};

    /// Worker threads in the accelerated backend's pool
    size_t maxConcurrentOps{4};

    /// Longest a caller waits for the capability probe
    int64_t initTimeoutMs{5000};

    /// Range proofs slower than this log a warning
    int64_t rangeProofLatencyTargetMs{2000};

    /// Baby-step bits of the accelerated decryption table
    unsigned tableBits{elgamal::DEFAULT_TABLE_BITS};

    /**
     * Read the [dispatch] section. Missing keys keep their defaults; invalid
     * values are logged and ignored.
     */
    static DispatchConfig FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Performance Records
// ============================================================================

struct PerformanceSample {
    std::string operation;
    BackendKind backend{BackendKind::Native};
    double elapsedMs{0.0};
    size_t items{1};

    /// Served by native after the accelerated path threw
    bool fellBack{false};

    int64_t timestamp{0};
};

struct OperationStats {
    uint64_t count{0};
    uint64_t acceleratedCount{0};
    uint64_t nativeCount{0};
    uint64_t fallbackCount{0};
    double averageMs{0.0};
};

struct PerformanceStats {
    uint64_t totalOperations{0};
    uint64_t acceleratedOperations{0};
    uint64_t nativeOperations{0};
    uint64_t fallbacks{0};

    /// acceleratedOperations / totalOperations, 0 when empty
    double acceleratedRatio{0.0};

    std::map<std::string, OperationStats> operations;
};

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher {
public:
    static Dispatcher& Instance();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Replace the configuration and forget any cached probe result
    void Configure(const DispatchConfig& config);
    DispatchConfig GetConfig() const;

    /// Run (or join) the capability probe; true if accelerated is in force
    bool IsAcceleratedAvailable();

    // ---- operations ----

    elgamal::EncryptionResult Encrypt(Amount amount, const Bytes32& publicKey,
                                      elgamal::AmountDomain domain = elgamal::AmountDomain::FastDecrypt);

    /// A batch of one goes through Encrypt
    std::vector<elgamal::EncryptionResult> EncryptBatch(
        const std::vector<Amount>& amounts, const Bytes32& publicKey,
        elgamal::AmountDomain domain = elgamal::AmountDomain::FastDecrypt);

    std::optional<Amount> Decrypt(const elgamal::Ciphertext& ct, const Bytes32& secretKey,
                                  Amount bound);

    proof::PedersenCommitment Commit(Amount amount, const ed25519::Scalar& blinding);

    proof::RangeProof GenerateRangeProof(Amount amount, const ed25519::Scalar& blinding);

    /// A batch of one goes through GenerateRangeProof
    std::vector<proof::RangeProof> GenerateRangeProofs(
        const std::vector<Amount>& amounts, const std::vector<ed25519::Scalar>& blindings);

    bool VerifyRangeProof(const proof::RangeProof& rangeProof);

    transfer::TransferResult GenerateTransferProof(const elgamal::Ciphertext& sourceBalance,
                                                   const elgamal::KeyPair& sourceKeys,
                                                   const Bytes32& destinationKey,
                                                   Amount amount);

    // ---- observability ----

    PerformanceStats GetStats() const;
    std::vector<PerformanceSample> GetSamples() const;
    void ClearSamples();

    /// Make every accelerated attempt throw AccelerationError
    void SetAcceleratedFailureInjection(bool enabled);

    /// Drop the probe, samples and failure injection; restore default config
    void ResetForTesting();

private:
    Dispatcher() = default;
    ~Dispatcher();

    using BackendPtr = std::shared_ptr<ICryptoBackend>;

    /// Accelerated backend if the probe succeeded, nullptr otherwise
    BackendPtr ProbeAccelerated();

    /// Install `config`, forget the probe and wait out any in-flight one
    void ResetProbe(const DispatchConfig& config);

    template<typename Func>
    auto Run(const char* operation, size_t items, Func&& func)
        -> decltype(func(std::declval<ICryptoBackend&>()));

    void Record(const char* operation, BackendKind backend, double elapsedMs,
                size_t items, bool fellBack);

    void CheckRangeProofLatency(double elapsedMs, size_t items) const;

    mutable std::mutex mutex_;
    DispatchConfig config_;
    NativeBackend native_;

    // Probe state, guarded by mutex_
    std::shared_future<BackendPtr> probe_;
    bool probeDone_{false};
    BackendPtr accelerated_;
    uint64_t generation_{0};

    mutable std::mutex samplesMutex_;
    std::deque<PerformanceSample> samples_;

    std::atomic<bool> injectFailure_{false};
};

} // namespace engine
} // namespace veil

#endif // VEIL_ENGINE_DISPATCHER_H
