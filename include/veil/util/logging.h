// VEIL - Logging System
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Leveled, categorized logging for the engine. Entries pass a global level
// and a category filter, then go to every attached sink whose own threshold
// they meet. Nothing is printed until a sink is attached, either directly or
// through Logger::Configure with console output enabled.
//
// Secret keys, blindings and plaintext amounts of other parties are never
// logged. Amounts appear only in messages produced on the owner's side.

#ifndef VEIL_UTIL_LOGGING_H
#define VEIL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace veil {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Parse a level name, case-insensitive ("warning" and "none" accepted)
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ELGAMAL = "elgamal";
    constexpr const char* PROOF = "proof";
    constexpr const char* TRANSFER = "transfer";
    constexpr const char* DISPATCH = "dispatch";
    constexpr const char* CONFIG = "config";
    constexpr const char* BENCH = "bench";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log entries. Each sink carries its own threshold.
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Formatted lines on stdout; Warn and above go to stderr
class ConsoleSink : public LogSink {
public:
    struct Options {
        bool colors{true};
        bool timestamps{true};
        bool location{false};
    };

    ConsoleSink() : ConsoleSink(Options{}) {}
    explicit ConsoleSink(const Options& options, LogLevel level = LogLevel::Trace)
        : LogSink(level), options_(options) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;

    /// One line, no trailing newline
    std::string Format(const LogEntry& entry) const;

private:
    Options options_;
    std::mutex writeMutex_;
};

/// Forwards entries to a callable; used by tests and embedders
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
        : LogSink(level), callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override {
        if (callback_) callback_(entry);
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Settings applied in one step by Logger::Configure
struct LogOptions {
    LogLevel level{LogLevel::Info};
    /// Categories to show; empty shows all
    std::vector<std::string> categories;
    bool console{false};
    ConsoleSink::Options consoleOptions;
};

class Logger {
public:
    static Logger& Instance();

    /**
     * Apply level, category allow-list and console output. The console sink
     * installed by an earlier call is replaced, or removed when console
     * output is off. Sinks added through AddSink are left alone.
     */
    void Configure(const LogOptions& options);

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Enabling a category switches filtering to an allow-list
    void EnableCategory(const std::string& category);
    /// Mute a category regardless of the allow-list
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, std::string message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> Sinks() const;

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::shared_ptr<LogSink> console_;

    std::atomic<LogLevel> level_{LogLevel::Info};

    // Fast path: no allow-list and nothing muted
    std::atomic<bool> filtering_{false};
    mutable std::mutex filterMutex_;
    std::set<std::string> allowed_;
    std::set<std::string> muted_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Accumulates a message through operator<< and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream() {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define VEIL_LOG_ENABLED(level, category) \
    ::veil::util::Logger::Instance().WillLog(::veil::util::LogLevel::level, category)

#define VEIL_LOG(level, category) \
    if (!VEIL_LOG_ENABLED(level, category)) {} else \
        ::veil::util::LogStream(::veil::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   VEIL_LOG(Trace, category)
#define LOG_DEBUG(category)   VEIL_LOG(Debug, category)
#define LOG_INFO(category)    VEIL_LOG(Info, category)
#define LOG_WARN(category)    VEIL_LOG(Warn, category)
#define LOG_ERROR(category)   VEIL_LOG(Error, category)

#define VEIL_LOGF(level, category, ...) \
    do { \
        if (VEIL_LOG_ENABLED(level, category)) { \
            ::veil::util::Logger::Instance().LogF(::veil::util::LogLevel::level, category, \
                                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  VEIL_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   VEIL_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   VEIL_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  VEIL_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/**
 * Reports the wall time of a scope when it exits: at Debug normally, or at
 * Warn when a positive budget was given and exceeded.
 */
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation, double budgetMs = 0.0);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    double ElapsedMs() const;

private:
    const char* category_;
    std::string operation_;
    double budgetMs_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_LOGGING_H
