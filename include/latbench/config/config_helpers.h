#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <latbench/core/types.h>

namespace latbench::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/// Flattened view of a TOML-subset file: "section.key" -> unquoted value.
using ConfigMap = std::map<std::string, std::string>;

/**
 * Parse the TOML subset latbench understands: `[section]` headers, `key = value` pairs,
 * `#` comments, quoted strings and single-line arrays. Keys outside any section are stored
 * without a prefix.
 */
Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

Result<bool> parse_bool(std::string_view raw);
Result<double> parse_double(std::string_view raw);
Result<long long> parse_integer(std::string_view raw);

/// Returns $XDG_CONFIG_HOME/latbench or ~/.config/latbench
std::filesystem::path get_config_dir();

/// Resolve the config file: explicit override, then LATBENCH_CONFIG, then the XDG default.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace latbench::config
