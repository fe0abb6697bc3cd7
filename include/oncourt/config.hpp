#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace oncourt {

enum class OutputFormat { Table, Csv, Json };

struct AppConfig {
    std::filesystem::path data_dir = "data";
    OutputFormat format = OutputFormat::Table;
};

// Reads KEY=VALUE lines into the process environment without overwriting
// variables that are already set.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

std::optional<OutputFormat> parse_format(std::string_view name);

// Defaults overridden by ONCOURT_DATA_DIR and ONCOURT_FORMAT.
AppConfig config_from_env();

} // namespace oncourt
