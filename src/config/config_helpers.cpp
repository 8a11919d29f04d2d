#include <taskfed/config/config_helpers.h>
#include <taskfed/core/format.h>

#include <charconv>

namespace taskfed::config {

std::optional<std::string> get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    return get_env(key).value_or(fallback);
}

bool get_env_bool(const std::string& key, bool fallback) {
    auto value = get_env(key);
    if (!value) {
        return fallback;
    }
    return *value == "true" || *value == "1";
}

Result<int64_t> get_env_int(const std::string& key, int64_t fallback) {
    auto value = get_env(key);
    if (!value) {
        return fallback;
    }
    std::string s = *value;
    trim(s);
    int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return Error{ErrorCode::ConfigurationError, format("Invalid number for {}: {}", key, *value)};
    }
    return parsed;
}

std::vector<std::string> get_env_list(const std::string& key) {
    std::vector<std::string> out;
    auto value = get_env(key);
    if (!value) {
        return out;
    }
    size_t start = 0;
    while (start <= value->size()) {
        size_t comma = value->find(',', start);
        if (comma == std::string::npos) {
            comma = value->size();
        }
        std::string item = value->substr(start, comma - start);
        trim(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return out;
}

std::string env_key_for_id(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id) {
        out.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::filesystem::path get_config_dir() {
    if (auto xdg = get_env("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "taskfed";
    }
    if (auto home = get_env("HOME")) {
        return std::filesystem::path(*home) / ".config" / "taskfed";
    }
    return std::filesystem::path("~/.config") / "taskfed";
}

} // namespace taskfed::config
