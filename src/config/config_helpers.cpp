#include <assetsync/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace assetsync::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless the '#' sits inside a quoted string
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Both "[downloader] base_url" and "downloader.base_url" are accepted
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::optional<long long> parse_config_int(const std::filesystem::path& config_path,
                                          const std::string& section, const std::string& key) {
    auto raw = parse_config_value(config_path, section, key);
    if (raw.empty())
        return std::nullopt;
    long long out = 0;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), out);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_config_double(const std::filesystem::path& config_path,
                                          const std::string& section, const std::string& key) {
    auto raw = parse_config_value(config_path, section, key);
    if (raw.empty())
        return std::nullopt;
    try {
        size_t used = 0;
        double out = std::stod(raw, &used);
        if (used != raw.size())
            return std::nullopt;
        return out;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_config_bool(const std::filesystem::path& config_path,
                                      const std::string& section, const std::string& key) {
    auto raw = parse_config_value(config_path, section, key);
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on")
        return true;
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off")
        return false;
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("ASSETSYNC_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "assetsync" / "config.toml";
    }

    return configHome / "assetsync" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("ASSETSYNC_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "assetsync";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "assetsync";
    }
    return std::filesystem::current_path() / "assetsync_data";
}

} // namespace assetsync::config
