#pragma once

#include <lore/common/text_utils.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lore::config {

using common::trim;

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
            const std::size_t skip = (path.size() > 1 && path[1] == '/') ? 2 : 1;
            return std::filesystem::path(home) / path.substr(skip);
        }
    }
    return path;
}

// "true"/"false", "yes"/"no", "on"/"off", "1"/"0"; nullopt for anything else
inline std::optional<bool> parse_bool(std::string_view s) {
    auto v = common::foldCase(common::trimmed(s));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    return std::nullopt;
}

// Parse a value from TOML config file; empty when the file, section or key is missing.
// Accepts both "[section] key = v" and "section.key = v".
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/lore or ~/.config/lore
std::filesystem::path get_config_dir();

} // namespace lore::config
