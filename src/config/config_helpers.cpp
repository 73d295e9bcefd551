#include <factstore/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace factstore::config {

namespace {

// Position of the first '#' that is not inside a quoted string
size_t findInlineComment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return i;
        }
    }
    return std::string::npos;
}

} // namespace

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    std::string text(s);
    trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}

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

        // Check for section headers [section]
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

        size_t comment = findInlineComment(v);
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
        }
        trim(v);

        if (in_target_section && k == key) {
            return unquote(v);
        }
        // Dotted keys before any section header: "store.path = ..."
        if (!section.empty() && currentSection.empty() && k == section + "." + key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("FACTSTORE_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "factstore" / "config.toml";
    }

    return configHome / "factstore" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("FACTSTORE_DATA_DIR"); env && *env) {
        return expand_tilde(env);
    }
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "factstore";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "factstore";
    }
    return std::filesystem::current_path() / "factstore_data";
}

} // namespace factstore::config
