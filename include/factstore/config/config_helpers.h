#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace factstore::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * Parse a millisecond count. Returns nullopt for anything that is not a
 * non-negative integer.
 */
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

/**
 * Read `key` from `[section]` of a TOML-style config file. Returns "" when the
 * file, section or key is missing. Values are unquoted and inline `#`
 * comments outside quotes are stripped.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/**
 * Config file location: @p override_path, then $FACTSTORE_CONFIG, then
 * $XDG_CONFIG_HOME/factstore/config.toml or ~/.config/factstore/config.toml.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Data directory: $FACTSTORE_DATA_DIR, then $XDG_DATA_HOME/factstore or
 * ~/.local/share/factstore.
 */
std::filesystem::path get_data_dir();

} // namespace factstore::config
