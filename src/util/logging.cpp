// VEIL - Logging Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace veil {
namespace util {

namespace {

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return nullptr;
    }
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void AppendTimestamp(std::ostringstream& out, std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ') << ' ';
}

} // anonymous namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string name;
    name.reserve(str.size());
    for (unsigned char c : str) {
        name.push_back(static_cast<char>(std::tolower(c)));
    }

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off" || name == "none") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::ostringstream out;
    if (options_.timestamps) {
        AppendTimestamp(out, entry.timestamp);
    }
    out << std::left << std::setw(5) << LogLevelToString(entry.level) << ' ';
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        out << '[' << entry.category << "] ";
    }
    if (options_.location && entry.file != nullptr) {
        out << Basename(entry.file) << ':' << entry.line << ' ';
    }
    out << entry.message;
    return out.str();
}

void ConsoleSink::Write(const LogEntry& entry) {
    const std::string text = Format(entry);
    FILE* stream = entry.level >= LogLevel::Warn ? stderr : stdout;
    const char* color = options_.colors ? LevelColor(entry.level) : nullptr;

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (color != nullptr && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", color, text.c_str());
    } else {
        std::fprintf(stream, "%s\n", text.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Configure(const LogOptions& options) {
    SetLevel(options.level);

    {
        std::lock_guard<std::mutex> lock(filterMutex_);
        allowed_.clear();
        muted_.clear();
        allowed_.insert(options.categories.begin(), options.categories.end());
        filtering_.store(!allowed_.empty());
    }

    std::shared_ptr<LogSink> console;
    if (options.console) {
        console = std::make_shared<ConsoleSink>(options.consoleOptions);
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (console_) {
        sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), console_), sinks_.end());
    }
    console_ = console;
    if (console_) {
        sinks_.push_back(console_);
    }
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
    if (console_ == sink) {
        console_.reset();
    }
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
    console_.reset();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

std::vector<std::shared_ptr<LogSink>> Logger::Sinks() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_;
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    muted_.erase(category);
    allowed_.insert(category);
    filtering_.store(true);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    allowed_.erase(category);
    muted_.insert(category);
    filtering_.store(true);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(filterMutex_);
    allowed_.clear();
    muted_.clear();
    filtering_.store(false);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (!filtering_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(filterMutex_);
    if (muted_.count(category) != 0) {
        return false;
    }
    return allowed_.empty() || allowed_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, std::string message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = std::move(message);
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    // Snapshot so a sink may log or detach itself while writing
    for (const auto& sink : Sinks()) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    for (const auto& sink : Sinks()) {
        sink->Flush();
    }
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation, double budgetMs)
    : category_(category)
    , operation_(std::move(operation))
    , budgetMs_(budgetMs)
    , start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    const double elapsed = ElapsedMs();
    if (budgetMs_ > 0.0 && elapsed > budgetMs_) {
        LogWarnF(category_, "%s took %.2f ms (budget %.0f ms)",
                 operation_.c_str(), elapsed, budgetMs_);
    } else {
        LogDebugF(category_, "%s took %.2f ms", operation_.c_str(), elapsed);
    }
}

double ScopedLogTimer::ElapsedMs() const {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace util
} // namespace veil
