#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace codeloop::config {

// Defaults, then the JSON file ($CODELOOP_CONFIG or ~/.codeloop/config.json),
// then CODELOOP_* environment overrides. Non-positive timeouts, output caps
// and attempt budgets are replaced by their defaults.
Config LoadConfig();

// Same layering with an explicit file; a missing file keeps defaults.
Config LoadConfigFromPath(const std::filesystem::path& config_path);

std::filesystem::path DefaultConfigPath();

}  // namespace codeloop::config
