#pragma once

#include <taskfed/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskfed::config {

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

// Environment lookups. Empty variables count as unset.
std::optional<std::string> get_env(const std::string& key);
std::string get_env_or(const std::string& key, const std::string& fallback);
bool get_env_bool(const std::string& key, bool fallback);
Result<int64_t> get_env_int(const std::string& key, int64_t fallback);
std::vector<std::string> get_env_list(const std::string& key);

// "my-source" -> "MY_SOURCE", used for per-source override variables
std::string env_key_for_id(std::string_view id);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/taskfed or ~/.config/taskfed
std::filesystem::path get_config_dir();

} // namespace taskfed::config
