// VEIL - Configuration Parser Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace veil {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Unquote(const std::string& str) {
    if (str.size() < 2) {
        return str;
    }
    const char first = str.front();
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (first == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            switch (inner[i + 1]) {
                case 'n':  out += '\n'; ++i; continue;
                case 't':  out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"':  out += '"';  ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
}

bool IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

} // anonymous namespace

std::optional<bool> ParseBoolValue(const std::string& str) {
    const std::string lower = ToLower(Trim(str));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t close = trimmed.find(']');
        if (close == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = ToLower(Trim(trimmed.substr(1, close - 1)));
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
        // Bare flag, "nofoo" negates foo
        std::string key = ToLower(trimmed);
        bool negated = key.size() > 2 && key.compare(0, 2, "no") == 0;
        entry.key = negated ? key.substr(2) : key;
        entry.value = negated ? "false" : "true";
    } else {
        entry.key = ToLower(Trim(trimmed.substr(0, eq)));
        entry.value = Unquote(Trim(trimmed.substr(eq + 1)));
    }

    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: '" + entry.key + "'",
                                          source, lineNum);
        return false;
    }

    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    std::ostringstream content;
    content << file.rdbuf();
    const std::string text = content.str();
    if (text.size() > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }
    return ParseString(text, filePath);
}

// ============================================================================
// Storage
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    EntryKey key(entry.section, entry.key);
    entries_[key] = std::move(entry);
}

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto it = entries_.find(EntryKey(ToLower(section), ToLower(key)));
    return it == entries_.end() ? nullptr : &it->second;
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = ToLower(key);
    entry.value = value;
    entry.section = ToLower(section);
    entry.source = "<programmatic>";
    Store(std::move(entry));
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (Find(key, section) != nullptr) {
        return;
    }
    ConfigEntry entry;
    entry.key = ToLower(key);
    entry.value = value;
    entry.section = ToLower(section);
    entry.source = "<default>";
    entry.isDefault = true;
    Store(std::move(entry));
}

void ConfigManager::Clear() {
    entries_.clear();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (entry == nullptr) {
        return std::nullopt;
    }

    const std::string text = Trim(entry->value);
    try {
        size_t pos = 0;
        int64_t value = std::stoll(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return ParseBoolValue(entry->value);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (entry == nullptr) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        const std::string text = Trim(entry->value);
        double value = std::stod(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue,
                                const std::string& section) const {
    return TryGetDouble(key, section).value_or(defaultValue);
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& kv : entries_) {
        if (!kv.first.first.empty()) {
            sections.insert(kv.first.first);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    const std::string wanted = ToLower(section);
    for (const auto& kv : entries_) {
        if (kv.first.first == wanted) {
            keys.push_back(kv.first.second);
        }
    }
    return keys;
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    std::string current;
    bool first = true;
    for (const auto& kv : entries_) {
        if (first || kv.first.first != current) {
            current = kv.first.first;
            if (!current.empty()) {
                oss << (first ? "" : "\n") << '[' << current << "]\n";
            }
            first = false;
        }
        oss << kv.second.key << '=' << kv.second.value << '\n';
    }
    return oss.str();
}

// ============================================================================
// Logging Settings
// ============================================================================

LogOptions LogOptionsFromConfig(const ConfigManager& config) {
    namespace keys = ConfigKeys;
    const std::string section = keys::LOG_SECTION;
    LogOptions options;

    if (auto name = config.TryGetString(keys::LOG_LEVEL, section)) {
        if (auto level = ParseLogLevel(Trim(*name))) {
            options.level = *level;
        } else {
            LOG_WARN(LogCategory::CONFIG) << "Unknown log level '" << *name << "', using "
                                          << LogLevelToString(options.level);
        }
    }

    if (auto list = config.TryGetString(keys::LOG_CATEGORIES, section)) {
        std::istringstream stream(*list);
        std::string item;
        while (std::getline(stream, item, ',')) {
            item = ToLower(Trim(item));
            if (!item.empty()) {
                options.categories.push_back(item);
            }
        }
    }

    options.console = config.GetBool(keys::LOG_CONSOLE, options.console, section);
    options.consoleOptions.colors =
        config.GetBool(keys::LOG_COLORS, options.consoleOptions.colors, section);
    options.consoleOptions.timestamps =
        config.GetBool(keys::LOG_TIMESTAMPS, options.consoleOptions.timestamps, section);
    options.consoleOptions.location =
        config.GetBool(keys::LOG_LOCATION, options.consoleOptions.location, section);

    return options;
}

} // namespace util
} // namespace veil
