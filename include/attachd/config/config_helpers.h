#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace attachd::config {

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

// Non-empty environment variable value
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Unsigned integer parsing; nullopt on malformed input
std::optional<std::uint64_t> parse_u64(std::string_view s);

// Parse a value from a flat TOML config file. Accepts both "[section] key = v" and
// "section.key = v" forms. Returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Resolve config file path: explicit override, ATTACHD_CONFIG, then XDG/HOME defaults.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace attachd::config
