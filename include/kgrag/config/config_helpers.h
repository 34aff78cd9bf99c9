#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace kgrag::config {

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

// Parse every `key = value` of a TOML config file into a map keyed "section.key".
// Keys outside any section are stored without a prefix. Values are unquoted and
// stripped of inline comments. A missing file yields an empty map.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Get standard config path
// $XDG_CONFIG_HOME/kgrag/config.toml or ~/.config/kgrag/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Resolution order: explicit override, KGRAG_CONFIG env, standard path
std::filesystem::path resolve_config_path(const std::string& override_path = "");

} // namespace kgrag::config
