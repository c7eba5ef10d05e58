// ENDOW - Configuration File Parser
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Parses INI-style configuration files for the endow keeper.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs; a bare key is a boolean flag, "nokey" negates it
// - Section headers: [section]; vaults are declared as [vault.<name>]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef ENDOW_UTIL_CONFIG_H
#define ENDOW_UTIL_CONFIG_H

#include "endow/core/types.h"

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace endow {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".endow";

/// Default config file name (inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "endow.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Section prefix for vault declarations
constexpr const char* VAULT_SECTION_PREFIX = "vault.";

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path (or "<override>") where this was defined
    int lineNumber{0};
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
    
    /// "file:line: message" for log output
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds keeper and vault configuration.
 *
 * Values from files are loaded first; Set() is used by the daemon to apply
 * command-line overrides on top. A key repeated in the same section keeps
 * the last value and records a warning.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
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
    
    /// Signed decimal integer; nullopt if missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    /// 20-byte hex address; nullopt if missing or malformed
    std::optional<Address> TryGetAddress(const std::string& key,
                                         const std::string& section = "") const;
    
    /// Non-negative 256-bit decimal amount; nullopt if missing or malformed
    std::optional<Amount> TryGetAmount(const std::string& key,
                                       const std::string& section = "") const;
    
    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    // ========================================================================
    // Sections
    // ========================================================================
    
    /// All non-global section names, sorted
    std::vector<std::string> GetSections() const;
    
    /// Section names starting with prefix, with the prefix removed
    std::vector<std::string> GetSectionsWithPrefix(const std::string& prefix) const;
    
    std::vector<std::string> GetKeys(const std::string& section = "") const;
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    /// Register an allowed key for a section. A section name ending in '.'
    /// applies to every section with that prefix.
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Unknown keys, one message per key; empty when nothing was registered
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// $HOME/.endow
    static std::string GetDefaultDataDir();
    
    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);
    
    /// Replace ${VAR} with the environment value (empty if unset)
    static std::string ExpandEnvVars(const std::string& value);
    
    /// Parse true/false, yes/no, on/off, 1/0
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    void Store(ConfigEntry entry, ConfigParseResult* result);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Global
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";
    constexpr const char* INTERVAL = "interval";
    constexpr const char* NETWORK = "network";
    constexpr const char* SCHEDULER = "scheduler";
    constexpr const char* ADMIN = "admin";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* VENUE = "venue";
    constexpr const char* RATE = "rate";
    
    // [vault.<name>]
    constexpr const char* OWNER = "owner";
    constexpr const char* TOKEN = "token";
    constexpr const char* ASSET = "asset";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* DONATION = "donation";
    constexpr const char* GUARD = "guard";
    constexpr const char* PAYOUT = "payout";
    constexpr const char* FEE = "fee";
    constexpr const char* TICKSPACING = "tickspacing";
    constexpr const char* SUPPLY = "supply";
    constexpr const char* OWNERSHARE = "ownershare";
    constexpr const char* TAXFEE = "taxfee";
    constexpr const char* MAXTREASURY = "maxtreasury";
    constexpr const char* MINTOPUP = "mintopup";
    constexpr const char* LPFRACTION = "lpfraction";
    constexpr const char* TRANSFERINTERVAL = "transferinterval";
    constexpr const char* MINHEALTH = "minhealth";
    constexpr const char* MINLPHEALTH = "minlphealth";
    constexpr const char* TARGETLP = "targetlp";
    constexpr const char* SLIPPAGE = "slippage";
    constexpr const char* MAXBUY = "maxbuy";
    constexpr const char* COOLDOWN = "cooldown";
    constexpr const char* BLOCKSTOHOLD = "blockstohold";
    constexpr const char* TIMETOHOLD = "timetohold";
    constexpr const char* SEEDTOKENS = "seedtokens";
    constexpr const char* SEEDASSET = "seedasset";
}

} // namespace util
} // namespace endow

#endif // ENDOW_UTIL_CONFIG_H
