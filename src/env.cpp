#include "unitpulse/env.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <string_view>

namespace unitpulse {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') ||
         (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        if (trimmed.starts_with("export ")) trimmed = trim(trimmed.substr(7));

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = strip_quotes(trim(trimmed.substr(eq + 1)));

        if (!key.empty()) {
            vars[key] = val;
            ::setenv(key.c_str(), val.c_str(), 0); // don't overwrite existing
        }
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str()); val && *val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& value) {
    auto lower = trim(value);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return std::tolower(c); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

} // namespace unitpulse
