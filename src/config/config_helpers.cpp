#include <latbench/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace latbench::config {

namespace {

// Strip a trailing `# comment` that is not inside quotes.
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            std::string out = v.substr(0, i);
            rtrim(out);
            return out;
        }
    }
    return v;
}

} // namespace

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigMap out;
    std::string line;
    std::string currentSection;
    std::size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            std::size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ConfigurationError,
                             config_path.string() + ":" + std::to_string(lineNo) +
                                 ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ConfigurationError, config_path.string() + ":" +
                                                            std::to_string(lineNo) +
                                                            ": expected key = value"};
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        if (k.empty()) {
            return Error{ErrorCode::ConfigurationError,
                         config_path.string() + ":" + std::to_string(lineNo) + ": empty key"};
        }

        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        out[fullKey] = unquote(v);
    }

    return out;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                       : comma - start);
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

Result<bool> parse_bool(std::string_view raw) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::ConfigurationError, "Not a boolean: '" + std::string(raw) + "'"};
}

Result<double> parse_double(std::string_view raw) {
    std::string v(raw);
    trim(v);
    try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) {
            return Error{ErrorCode::ConfigurationError, "Not a number: '" + v + "'"};
        }
        return d;
    } catch (const std::exception&) {
        return Error{ErrorCode::ConfigurationError, "Not a number: '" + v + "'"};
    }
}

Result<long long> parse_integer(std::string_view raw) {
    std::string v(raw);
    trim(v);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size() || v.empty()) {
        return Error{ErrorCode::ConfigurationError, "Not an integer: '" + v + "'"};
    }
    return out;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "latbench";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "latbench";
    }
    return std::filesystem::path("~/.config") / "latbench";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("LATBENCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace latbench::config
