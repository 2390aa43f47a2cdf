#include <fstream>
#include <mediacache/config/config_helpers.h>

namespace mediacache::config {

namespace {

// One "key = value" line, with the inline comment removed. False for anything else.
bool split_assignment(const std::string& line, std::string& key, std::string& value) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    trim(key);
    trim(value);

    // Remove inline comments outside quotes
    bool quoted = false;
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quoted) {
            if (c == quote) {
                quoted = false;
            }
        } else if (c == '"' || c == '\'') {
            quoted = true;
            quote = c;
        } else if (c == '#') {
            value.resize(i);
            trim(value);
            break;
        }
    }
    value = unquote(value);
    return !key.empty();
}

bool parse_section_header(const std::string& line, std::string& section) {
    if (line.empty() || line[0] != '[') {
        return false;
    }
    size_t end = line.find(']');
    if (end == std::string::npos) {
        return false;
    }
    section = line.substr(1, end - 1);
    trim(section);
    return true;
}

} // namespace

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

        if (parse_section_header(line, currentSection)) {
            in_target_section = (section.empty() || currentSection == section);
            continue;
        }

        std::string k;
        std::string v;
        if (in_target_section && split_assignment(line, k, v) && k == key) {
            return v;
        }
    }

    return "";
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (parse_section_header(line, currentSection)) {
            continue;
        }
        std::string k;
        std::string v;
        if (!split_assignment(line, k, v)) {
            continue;
        }
        // Dotted keys ("cache.root_dir") are accepted outside a section.
        values[currentSection.empty() ? k : currentSection + "." + k] = v;
    }
    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("MEDIACACHE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "mediacache" / "config.toml";
    }

    return configHome / "mediacache" / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME"); xdg_cache && *xdg_cache) {
        return std::filesystem::path(xdg_cache) / "mediacache";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "mediacache";
    }
    return std::filesystem::temp_directory_path() / "mediacache";
}

} // namespace mediacache::config
