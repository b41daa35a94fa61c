#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace cfgstore::config {

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

inline std::string trimmed(std::string_view in) {
    std::string s(in);
    trim(s);
    return s;
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
            return std::filesystem::path(home) / (path.size() > 1 ? path.substr(2) : "");
        }
    }
    return path;
}

// Non-empty environment variable or empty string
inline std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

// Flat TOML view: section -> key -> unquoted value
using FlatToml = std::map<std::string, std::map<std::string, std::string>>;

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse every [section] key = value pair of a TOML config file.
// Dotted keys outside a section ("store.backend = ...") land in their section.
FlatToml parse_config_file(const std::filesystem::path& config_path);

// Get standard config path
// Resolution: override -> $CFGSTORE_CONFIG -> $XDG_CONFIG_HOME/cfgstore/config.toml
//             -> ~/.config/cfgstore/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// Unix: $XDG_DATA_HOME/cfgstore or ~/.local/share/cfgstore
std::filesystem::path get_data_dir();

} // namespace cfgstore::config
