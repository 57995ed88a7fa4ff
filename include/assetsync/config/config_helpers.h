#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace assetsync::config {

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
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Parse a value from TOML config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Typed lookups on top of parse_config_value; nullopt when absent or malformed
std::optional<long long> parse_config_int(const std::filesystem::path& config_path,
                                          const std::string& section, const std::string& key);
std::optional<double> parse_config_double(const std::filesystem::path& config_path,
                                          const std::string& section, const std::string& key);
std::optional<bool> parse_config_bool(const std::filesystem::path& config_path,
                                      const std::string& section, const std::string& key);

/// Returns the config file path
/// $XDG_CONFIG_HOME/assetsync/config.toml or ~/.config/assetsync/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (state file, verification cache)
/// $XDG_DATA_HOME/assetsync or ~/.local/share/assetsync
std::filesystem::path get_data_dir();

} // namespace assetsync::config
