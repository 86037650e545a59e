// ARBITER - Configuration File Parser Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/util/config.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arbiter {
namespace util {

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }
    char first = str.front();
    char last = str.back();
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                if (const char* envValue = std::getenv(varName.c_str())) {
                    result += envValue;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    std::string fullKey = MakeKey(key, currentSection);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        lists_[fullKey].push_back(value);
        return true;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    return ParseStream(file, filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(*value, &pos);
        if (pos != value->size()) {
            return std::nullopt;
        }
        return parsed;
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

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> raw;

    auto entryIt = entries_.find(fullKey);
    if (entryIt != entries_.end()) {
        raw.push_back(entryIt->second.value);
    }
    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        raw.insert(raw.end(), listIt->second.begin(), listIt->second.end());
    }

    std::vector<std::string> result;
    for (const auto& value : raw) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[fullKey] = entry;
    lists_.erase(fullKey);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;

    for (const auto& requiredKey : requiredKeys_) {
        if (entries_.find(requiredKey) == entries_.end()) {
            errors.push_back("Required key missing: " + requiredKey);
        }
    }

    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.count(fullKey) == 0 && requiredKeys_.count(fullKey) == 0) {
                errors.push_back("Unknown key: " + fullKey +
                                 " (defined in " + entry.source + ")");
            }
        }
    }
    return errors;
}

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace arbiter
