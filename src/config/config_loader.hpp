#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace mailkeep::config {

// Default location: $MAILKEEP_CONFIG, else ~/.mailkeep/config.json.
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file at config_path (if present), then environment
// overrides. Bad values are logged and leave the default in place.
Config LoadConfig(const std::filesystem::path& config_path);
Config LoadConfig();

// Storage paths resolved against storage.data_dir.
std::filesystem::path HistoryStorePath(const Config& config);
std::filesystem::path PlanStorePath(const Config& config);
std::filesystem::path OutputsPath(const Config& config);
std::filesystem::path TracesPath(const Config& config);

}  // namespace mailkeep::config
