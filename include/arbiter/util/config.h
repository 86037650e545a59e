// ARBITER - Configuration File Parser
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Parses INI-style configuration for an ARBITER deployment.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Repeating a key builds a list

#ifndef ARBITER_UTIL_CONFIG_H
#define ARBITER_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arbiter {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "arbiter.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<string>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result; entries parsed before an error are kept
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value (returns nullopt if missing or not a whole number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Boolean value (returns nullopt if missing or unrecognized)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// All values of a repeated key, in file order; comma-separated values are split
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set only if the key is absent
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys and, when allowed keys are registered, unknown keys
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// Expand ${VAR} references from the environment; unset variables expand to ""
    static std::string ExpandEnvVars(const std::string& value);

    static std::optional<bool> ParseBool(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // [oracle]
    constexpr const char* SECTION_ORACLE = "oracle";
    constexpr const char* MANAGER = "manager";

    // [log]
    constexpr const char* SECTION_LOG = "log";
    constexpr const char* LEVEL = "level";
    constexpr const char* FILE = "file";
    constexpr const char* CONSOLE = "console";

    // [store]
    constexpr const char* SECTION_STORE = "store";
    constexpr const char* ENABLED = "enabled";
    constexpr const char* PATH = "path";
}

} // namespace util
} // namespace arbiter

#endif // ARBITER_UTIL_CONFIG_H
