#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "sandbox/tool_config.hpp"

namespace threatweaver::sandbox {

// Caller-facing presets. The provider does not enforce any of these limits.
struct ToolProfile {
    std::string tool;
    std::string category;
    std::string image;
    int timeout = 0;
    double cpu_limit = 0.0;
    int memory_limit = 0;
    bool network_isolated = true;
    std::vector<std::string> params;
};

const std::vector<ToolProfile>& ToolProfiles();
const ToolProfile* FindToolProfile(const std::string& tool);

ToolConfig GetSubfinderConfig(const std::string& domain, const std::string& output_file);
ToolConfig GetHttpxConfig(const std::string& input_file, const std::string& output_file);
ToolConfig GetNmapConfig(const std::string& target, const std::string& output_file);
ToolConfig GetNucleiConfig(const std::string& target_file, const std::string& output_file);
ToolConfig GetSqlmapConfig(const std::string& target_url, const std::string& output_dir);

// Throws ConfigurationError for an unknown tool or a missing parameter.
ToolConfig GetToolConfig(const std::string& tool,
                         const std::unordered_map<std::string, std::string>& params);

}  // namespace threatweaver::sandbox
