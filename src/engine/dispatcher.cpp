// VEIL - Backend Dispatcher Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/engine/dispatcher.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace veil {
namespace engine {

using Clock = std::chrono::steady_clock;

// ============================================================================
// Configuration
// ============================================================================

const char* ImplementationName(Implementation impl) {
    switch (impl) {
        case Implementation::Auto:        return "auto";
        case Implementation::Native:      return "native";
        case Implementation::Accelerated: return "accelerated";
    }
    return "unknown";
}

std::optional<Implementation> ParseImplementation(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "auto") return Implementation::Auto;
    if (lower == "native") return Implementation::Native;
    if (lower == "accelerated") return Implementation::Accelerated;
    return std::nullopt;
}

DispatchConfig DispatchConfig::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::DISPATCH_SECTION;
    DispatchConfig result;

    if (auto impl = config.TryGetString(keys::IMPLEMENTATION, section)) {
        if (auto parsed = ParseImplementation(*impl)) {
            result.implementation = *parsed;
        } else {
            LOG_WARN(util::LogCategory::CONFIG)
                << "Unknown dispatch implementation '" << *impl << "', using "
                << ImplementationName(result.implementation);
        }
    }

    result.profiling = config.GetBool(keys::PROFILING, result.profiling, section);

    const uint64_t batch = config.GetUInt(keys::BATCH_SIZE, result.preferredBatchSize, section);
    if (batch == 0) {
        LOG_WARN(util::LogCategory::CONFIG) << "dispatch.batchsize must be positive, ignoring 0";
    } else {
        result.preferredBatchSize = static_cast<size_t>(batch);
    }

    const uint64_t concurrent = config.GetUInt(keys::MAX_CONCURRENT, result.maxConcurrentOps, section);
    if (concurrent == 0) {
        LOG_WARN(util::LogCategory::CONFIG) << "dispatch.maxconcurrent must be positive, ignoring 0";
    } else {
        result.maxConcurrentOps = static_cast<size_t>(concurrent);
    }

    const int64_t timeout = config.GetInt(keys::INIT_TIMEOUT_MS, result.initTimeoutMs, section);
    if (timeout < 0) {
        LOG_WARN(util::LogCategory::CONFIG) << "dispatch.inittimeoutms must not be negative";
    } else {
        result.initTimeoutMs = timeout;
    }

    result.rangeProofLatencyTargetMs =
        config.GetInt(keys::RANGE_PROOF_TARGET_MS, result.rangeProofLatencyTargetMs, section);

    const uint64_t bits = config.GetUInt(keys::TABLE_BITS, result.tableBits, section);
    if (bits == 0 || bits > elgamal::MAX_TABLE_BITS) {
        LOG_WARN(util::LogCategory::CONFIG)
            << "dispatch.tablebits must be in [1, " << elgamal::MAX_TABLE_BITS
            << "], ignoring " << bits;
    } else {
        result.tableBits = static_cast<unsigned>(bits);
    }

    return result;
}

// ============================================================================
// Lifecycle and Probe
// ============================================================================

Dispatcher& Dispatcher::Instance() {
    static Dispatcher instance;
    return instance;
}

Dispatcher::~Dispatcher() {
    std::shared_future<BackendPtr> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = probe_;
    }
    if (pending.valid()) {
        pending.wait();
    }
}

void Dispatcher::Configure(const DispatchConfig& config) {
    ResetProbe(config);
    LOG_INFO(util::LogCategory::DISPATCH)
        << "Dispatch configured: implementation=" << ImplementationName(config.implementation)
        << " batch=" << config.preferredBatchSize
        << " concurrency=" << config.maxConcurrentOps
        << " timeout=" << config.initTimeoutMs << "ms";
}

DispatchConfig Dispatcher::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Dispatcher::ResetProbe(const DispatchConfig& config) {
    std::shared_future<BackendPtr> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = std::move(probe_);
        probe_ = std::shared_future<BackendPtr>();
        probeDone_ = false;
        accelerated_.reset();
        config_ = config;
        ++generation_;
    }
    // Outside the lock: the probe thread never takes mutex_, but callers do
    if (pending.valid()) {
        pending.wait();
    }
}

void Dispatcher::ResetForTesting() {
    ResetProbe(DispatchConfig());
    ClearSamples();
    injectFailure_.store(false);
}

Dispatcher::BackendPtr Dispatcher::ProbeAccelerated() {
    std::shared_future<BackendPtr> probe;
    DispatchConfig config;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (probeDone_) {
            return accelerated_;
        }
        if (!probe_.valid()) {
            AcceleratedBackend::Options options;
            options.tableBits = config_.tableBits;
            options.maxConcurrentOps = config_.maxConcurrentOps;
            options.batchSize = config_.preferredBatchSize;
            LOG_DEBUG(util::LogCategory::DISPATCH) << "Probing accelerated backend";
            probe_ = std::async(std::launch::async, [options]() -> BackendPtr {
                return std::make_shared<AcceleratedBackend>(options);
            }).share();
        }
        probe = probe_;
        config = config_;
        generation = generation_;
    }

    bool ready = true;
    if (config.implementation == Implementation::Accelerated) {
        probe.wait();
    } else {
        const auto timeout = std::chrono::milliseconds(config.initTimeoutMs);
        ready = probe.wait_for(timeout) == std::future_status::ready;
    }

    BackendPtr backend;
    if (ready) {
        try {
            backend = probe.get();
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DISPATCH)
                << "Accelerated backend unavailable: " << e.what();
        }
    } else {
        LOG_WARN(util::LogCategory::DISPATCH)
            << "Accelerated backend probe exceeded " << config.initTimeoutMs
            << " ms, using native";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return backend;
    }
    if (!probeDone_) {
        probeDone_ = true;
        accelerated_ = backend;
        LOG_INFO(util::LogCategory::DISPATCH)
            << "Dispatch backend: " << (accelerated_ ? "accelerated" : "native");
    }
    return accelerated_;
}

bool Dispatcher::IsAcceleratedAvailable() {
    if (GetConfig().implementation == Implementation::Native) {
        return false;
    }
    return ProbeAccelerated() != nullptr;
}

// ============================================================================
// Dispatch
// ============================================================================

template<typename Func>
auto Dispatcher::Run(const char* operation, size_t items, Func&& func)
    -> decltype(func(std::declval<ICryptoBackend&>())) {
    bool fellBack = false;

    if (GetConfig().implementation != Implementation::Native) {
        BackendPtr accelerated = ProbeAccelerated();
        if (accelerated) {
            const auto start = Clock::now();
            try {
                if (injectFailure_.load()) {
                    throw AccelerationError(std::string("Injected failure in ") + operation);
                }
                auto result = func(*accelerated);
                Record(operation, BackendKind::Accelerated, ElapsedMillis(start), items, false);
                return result;
            } catch (const InputDomainError&) {
                // Errors caused by the inputs propagate without a retry
                throw;
            } catch (const MalformedDataError&) {
                throw;
            } catch (const InsufficientBalanceError&) {
                throw;
            } catch (const std::exception& e) {
                LOG_WARN(util::LogCategory::DISPATCH)
                    << "Accelerated " << operation << " failed, falling back to native: "
                    << e.what();
                fellBack = true;
            }
        }
    }

    const auto start = Clock::now();
    auto result = func(native_);
    Record(operation, BackendKind::Native, ElapsedMillis(start), items, fellBack);
    return result;
}

elgamal::EncryptionResult Dispatcher::Encrypt(Amount amount, const Bytes32& publicKey,
                                              elgamal::AmountDomain domain) {
    return Run("encrypt", 1, [&](ICryptoBackend& b) {
        return b.Encrypt(amount, publicKey, domain);
    });
}

std::vector<elgamal::EncryptionResult> Dispatcher::EncryptBatch(
    const std::vector<Amount>& amounts, const Bytes32& publicKey,
    elgamal::AmountDomain domain) {
    if (amounts.empty()) {
        return {};
    }
    if (amounts.size() == 1) {
        return {Encrypt(amounts.front(), publicKey, domain)};
    }
    return Run("encrypt_batch", amounts.size(), [&](ICryptoBackend& b) {
        return b.EncryptBatch(amounts, publicKey, domain);
    });
}

std::optional<Amount> Dispatcher::Decrypt(const elgamal::Ciphertext& ct,
                                          const Bytes32& secretKey, Amount bound) {
    return Run("decrypt", 1, [&](ICryptoBackend& b) {
        return b.Decrypt(ct, secretKey, bound);
    });
}

proof::PedersenCommitment Dispatcher::Commit(Amount amount, const ed25519::Scalar& blinding) {
    return Run("commit", 1, [&](ICryptoBackend& b) {
        return b.Commit(amount, blinding);
    });
}

proof::RangeProof Dispatcher::GenerateRangeProof(Amount amount, const ed25519::Scalar& blinding) {
    const auto start = Clock::now();
    proof::RangeProof result = Run("range_proof", 1, [&](ICryptoBackend& b) {
        return b.GenerateRangeProof(amount, blinding);
    });
    CheckRangeProofLatency(ElapsedMillis(start), 1);
    return result;
}

std::vector<proof::RangeProof> Dispatcher::GenerateRangeProofs(
    const std::vector<Amount>& amounts, const std::vector<ed25519::Scalar>& blindings) {
    if (amounts.size() != blindings.size()) {
        throw InputDomainError("GenerateRangeProofs: amounts and blindings differ in length");
    }
    if (amounts.empty()) {
        return {};
    }
    if (amounts.size() == 1) {
        return {GenerateRangeProof(amounts.front(), blindings.front())};
    }

    const auto start = Clock::now();
    std::vector<proof::RangeProof> result = Run("range_proof_batch", amounts.size(),
        [&](ICryptoBackend& b) { return b.GenerateRangeProofs(amounts, blindings); });
    CheckRangeProofLatency(ElapsedMillis(start), amounts.size());
    return result;
}

bool Dispatcher::VerifyRangeProof(const proof::RangeProof& rangeProof) {
    return Run("verify_range_proof", 1, [&](ICryptoBackend& b) {
        return b.VerifyRangeProof(rangeProof);
    });
}

transfer::TransferResult Dispatcher::GenerateTransferProof(
    const elgamal::Ciphertext& sourceBalance, const elgamal::KeyPair& sourceKeys,
    const Bytes32& destinationKey, Amount amount) {
    return Run("transfer_proof", 1, [&](ICryptoBackend& b) {
        return b.GenerateTransferProof(sourceBalance, sourceKeys, destinationKey, amount);
    });
}

// ============================================================================
// Performance Records
// ============================================================================

void Dispatcher::CheckRangeProofLatency(double elapsedMs, size_t items) const {
    const int64_t target = GetConfig().rangeProofLatencyTargetMs;
    const double perProof = elapsedMs / static_cast<double>(std::max<size_t>(1, items));
    if (target > 0 && perProof > static_cast<double>(target)) {
        LogWarnF(util::LogCategory::DISPATCH,
                 "Range proof generation took %.1f ms per proof (target %lld ms)",
                 perProof, static_cast<long long>(target));
    }
}

void Dispatcher::Record(const char* operation, BackendKind backend, double elapsedMs,
                        size_t items, bool fellBack) {
    if (!GetConfig().profiling) {
        return;
    }

    PerformanceSample sample;
    sample.operation = operation;
    sample.backend = backend;
    sample.elapsedMs = elapsedMs;
    sample.items = items;
    sample.fellBack = fellBack;
    sample.timestamp = GetTimeMillis();

    std::lock_guard<std::mutex> lock(samplesMutex_);
    if (samples_.size() >= MAX_PERFORMANCE_SAMPLES) {
        samples_.pop_front();
    }
    samples_.push_back(std::move(sample));
}

PerformanceStats Dispatcher::GetStats() const {
    PerformanceStats stats;
    std::map<std::string, double> totalMs;

    std::lock_guard<std::mutex> lock(samplesMutex_);
    for (const auto& sample : samples_) {
        OperationStats& op = stats.operations[sample.operation];
        ++op.count;
        ++stats.totalOperations;
        if (sample.backend == BackendKind::Accelerated) {
            ++op.acceleratedCount;
            ++stats.acceleratedOperations;
        } else {
            ++op.nativeCount;
            ++stats.nativeOperations;
        }
        if (sample.fellBack) {
            ++op.fallbackCount;
            ++stats.fallbacks;
        }
        totalMs[sample.operation] += sample.elapsedMs;
    }

    for (auto& entry : stats.operations) {
        entry.second.averageMs = totalMs[entry.first] / static_cast<double>(entry.second.count);
    }
    if (stats.totalOperations > 0) {
        stats.acceleratedRatio = static_cast<double>(stats.acceleratedOperations) /
                                 static_cast<double>(stats.totalOperations);
    }
    return stats;
}

std::vector<PerformanceSample> Dispatcher::GetSamples() const {
    std::lock_guard<std::mutex> lock(samplesMutex_);
    return std::vector<PerformanceSample>(samples_.begin(), samples_.end());
}

void Dispatcher::ClearSamples() {
    std::lock_guard<std::mutex> lock(samplesMutex_);
    samples_.clear();
}

void Dispatcher::SetAcceleratedFailureInjection(bool enabled) {
    injectFailure_.store(enabled);
    LOG_DEBUG(util::LogCategory::DISPATCH)
        << "Accelerated failure injection " << (enabled ? "enabled" : "disabled");
}

} // namespace engine
} // namespace veil
