#include <charconv>
#include <fstream>
#include <attachd/config/config_helpers.h>

namespace attachd::config {

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    tmp = unquote(tmp);
    // TOML allows '_' digit separators
    tmp.erase(std::remove(tmp.begin(), tmp.end(), '_'), tmp.end());
    if (tmp.empty())
        return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), value);
    if (ec != std::errc() || ptr != tmp.data() + tmp.size())
        return std::nullopt;
    return value;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

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

        // Remove inline comments (outside of quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        const bool dotted = !section.empty() && k == section + "." + key;
        const bool sectioned = currentSection == section && k == key;
        if (dotted || sectioned) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("ATTACHD_CONFIG")) {
        return expand_tilde(*env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "attachd" / "config.toml";
}

} // namespace attachd::config
