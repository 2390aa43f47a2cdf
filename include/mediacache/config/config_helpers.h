#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace mediacache::config {

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
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Boolean parsing: true/yes/on/1 (any case)
inline bool parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "true" || v == "yes" || v == "on" || v == "1";
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse every key of a TOML-subset file into "section.key" -> value. Values are
// unquoted and stripped of inline comments. A missing file yields an empty map.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Get standard config path
// MEDIACACHE_CONFIG, else $XDG_CONFIG_HOME/mediacache/config.toml, else
// ~/.config/mediacache/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user cache directory
/// $XDG_CACHE_HOME/mediacache or ~/.cache/mediacache
std::filesystem::path get_cache_dir();

} // namespace mediacache::config
