#include <codegraph/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace codegraph::config {

std::optional<std::size_t> parse_positive(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    if (tmp.empty())
        return std::nullopt;
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), value);
    if (ec != std::errc{} || ptr != tmp.data() + tmp.size() || value == 0) {
        return std::nullopt;
    }
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
        trim(v);

        // Remove inline comments outside quotes
        bool inQuote = false;
        char quote = 0;
        for (size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if (inQuote) {
                if (c == quote)
                    inQuote = false;
            } else if (c == '"' || c == '\'') {
                inQuote = true;
                quote = c;
            } else if (c == '#') {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Support both "pipeline.batch_size" and "[pipeline] batch_size"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item =
            s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("CODEGRAPH_CONFIG")) {
        return expand_tilde(*env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "codegraph" / "config.toml";
    }

    return configHome / "codegraph" / "config.toml";
}

} // namespace codegraph::config
