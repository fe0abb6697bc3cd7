#include "oncourt/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace oncourt {

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
        if (key.empty()) continue;

        vars[key] = strip_quotes(trim(trimmed.substr(eq + 1)));
        ::setenv(key.c_str(), vars[key].c_str(), 0);
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<OutputFormat> parse_format(std::string_view name) {
    if (name == "table") return OutputFormat::Table;
    if (name == "csv") return OutputFormat::Csv;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

AppConfig config_from_env() {
    AppConfig config;

    if (auto dir = get_env("ONCOURT_DATA_DIR"); dir && !dir->empty()) {
        config.data_dir = *dir;
    }

    if (auto fmt = get_env("ONCOURT_FORMAT")) {
        if (auto parsed = parse_format(*fmt)) {
            config.format = *parsed;
        } else {
            std::cerr << "Ignoring unknown ONCOURT_FORMAT \"" << *fmt << "\"\n";
        }
    }

    return config;
}

} // namespace oncourt
