// VEIL - Configuration Parser
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// INI-style configuration for the engine.
//
// Format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally inside [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag; "nokey" sets key=false

#ifndef VEIL_UTIL_CONFIG_H
#define VEIL_UTIL_CONFIG_H

#include "veil/util/logging.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace veil {
namespace util {

/// Maximum line length accepted by the parser
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration entries keyed by (section, key).
 *
 * Values set explicitly (parsed or Set) override defaults registered with
 * SetDefault, regardless of the order in which they arrive.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Register a default; ignored if an explicit value exists
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// Render all entries back to INI text
    std::string Dump() const;

private:
    using EntryKey = std::pair<std::string, std::string>;  // (section, key)

    std::map<EntryKey, ConfigEntry> entries_;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry);

    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
};

/// Parse a boolean spelling; nullopt if unrecognised
std::optional<bool> ParseBoolValue(const std::string& str);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    /// Section holding the engine dispatch settings
    constexpr const char* DISPATCH_SECTION = "dispatch";

    constexpr const char* IMPLEMENTATION = "implementation";   // auto|native|accelerated
    constexpr const char* PROFILING = "profiling";
    constexpr const char* BATCH_SIZE = "batchsize";
    constexpr const char* MAX_CONCURRENT = "maxconcurrent";
    constexpr const char* INIT_TIMEOUT_MS = "inittimeoutms";
    constexpr const char* RANGE_PROOF_TARGET_MS = "rangeprooftargetms";
    constexpr const char* TABLE_BITS = "tablebits";

    /// Section holding the logging settings
    constexpr const char* LOG_SECTION = "log";

    constexpr const char* LOG_LEVEL = "level";             // trace|debug|info|warn|error|off
    constexpr const char* LOG_CATEGORIES = "categories";   // comma separated, empty = all
    constexpr const char* LOG_CONSOLE = "console";
    constexpr const char* LOG_COLORS = "colors";
    constexpr const char* LOG_TIMESTAMPS = "timestamps";
    constexpr const char* LOG_LOCATION = "location";
}

/**
 * Read the [log] section into logger options. An unknown level name is
 * reported and the default level kept.
 */
LogOptions LogOptionsFromConfig(const ConfigManager& config);

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_CONFIG_H
