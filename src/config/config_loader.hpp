#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace scriptbox::config {

// Defaults, then ~/.scriptbox/config.json (or $SCRIPTBOX_CONFIG), then
// SCRIPTBOX_* environment overrides.
Config LoadConfig();

Config LoadConfigFromFile(const std::filesystem::path& path);
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace scriptbox::config
