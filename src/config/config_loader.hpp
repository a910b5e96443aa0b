#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace compass::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then ~/.compass/config.json, then COMPASS_* environment overrides.
Config LoadConfig();

// Same layering with an explicit file. A missing or malformed file keeps the
// defaults.
Config LoadConfigFromFile(const std::filesystem::path& path);

}  // namespace compass::config
