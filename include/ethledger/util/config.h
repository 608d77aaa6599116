// ETHLEDGER - Configuration File Parser
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Parses INI-style configuration for the signer and its tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag set to true; "nokey" sets it to false

#ifndef ETHLEDGER_UTIL_CONFIG_H
#define ETHLEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ethledger {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "ethledger.conf";

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
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

/**
 * Result of parsing a configuration source.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Configuration from files, strings and command-line arguments.
 *
 * Later sources override earlier ones for the same key; command-line
 * arguments always win. Defaults never override an explicit value.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse "-key=value", "--key=value", "-flag" and "-noflag" arguments.
     * Anything not starting with '-' is collected as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Non-option arguments from the last ParseCommandLine, in order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt if missing or not a whole decimal integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Decimal or 0x-prefixed hex; nullopt if missing, signed or malformed
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    /// nullopt if missing or not a recognised boolean word
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set only if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    /// All keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Copy entries whose keys are not set here yet (file under command line)
    void MergeDefaults(const ConfigManager& other);

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

    /// "key=value" lines, one per entry, with secrets masked
    std::string Dump() const;

    /// Keys whose values never leave the process (mnemonic, passphrase)
    static bool IsSecretKey(const std::string& key);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";

    // Signer
    constexpr const char* NETWORKID = "networkid";
    constexpr const char* DERIVATIONPATH = "derivationpath";
    constexpr const char* ASKCONFIRMATION = "askconfirmation";
    constexpr const char* ADDRESSSEARCHLIMIT = "addresssearchlimit";
    constexpr const char* NUMADDRESSES = "numaddresses";
    constexpr const char* HARDFORK = "hardfork";

    // Debug device
    constexpr const char* MNEMONIC = "mnemonic";
    constexpr const char* PASSPHRASE = "passphrase";
}

} // namespace util
} // namespace ethledger

#endif // ETHLEDGER_UTIL_CONFIG_H
