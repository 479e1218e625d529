#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace threatweaver::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.threatweaver/config.json, then environment variables.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Expands a leading "~" against $HOME.
std::filesystem::path ResolveWorkspaceRoot(const SandboxConfig& config);

}  // namespace threatweaver::config
