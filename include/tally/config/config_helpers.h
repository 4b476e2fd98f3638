#pragma once

#include <tally/core/types.h>
#include <tally/storage/storage_handle.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tally::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Integer parsing; nullopt when the text is not a whole number
std::optional<std::int64_t> parse_int(std::string_view s);

// Boolean parsing: true/false, yes/no, on/off, 1/0
std::optional<bool> parse_bool(std::string_view s);

// Parse a value from TOML config file; empty when the file or key is absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, then $TALLY_CONFIG, then the XDG location
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/tally or ~/.config/tally
std::filesystem::path get_config_dir();

/// Returns the user data directory (the ledger database lives here)
/// $XDG_DATA_HOME/tally or ~/.local/share/tally
std::filesystem::path get_data_dir();

/**
 * @brief Effective settings after defaults, config file and environment
 */
struct LedgerSettings {
    storage::StorageConfig storage;
    bool includeOverridesInArchive = false;
    std::filesystem::path configPath;
};

/**
 * @brief Resolve settings (CLI override → env → config.toml → defaults)
 *
 * Database path: db_override, then $TALLY_DB, then [storage] path, then
 * get_data_dir()/tally.db. Malformed numeric or boolean values are rejected with
 * InvalidArgument rather than silently defaulted.
 */
Result<LedgerSettings> load_settings(const std::string& config_override = "",
                                     const std::string& db_override = "");

} // namespace tally::config
