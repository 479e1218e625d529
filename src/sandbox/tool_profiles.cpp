#include "sandbox/tool_profiles.hpp"

#include <algorithm>

#include "sandbox/sandbox_errors.hpp"
#include "utils/common.hpp"

namespace threatweaver::sandbox {
namespace {

ToolConfigBuilder FromProfile(const std::string& tool) {
    const auto* profile = FindToolProfile(tool);
    ToolConfigBuilder builder(tool);
    builder.Image(profile->image)
        .Command(tool)
        .Timeout(profile->timeout)
        .CpuLimit(profile->cpu_limit)
        .MemoryLimit(profile->memory_limit)
        .NetworkIsolated(profile->network_isolated);
    return builder;
}

const std::string& RequireParam(const std::string& tool,
                                const std::unordered_map<std::string, std::string>& params,
                                const std::string& name) {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) {
        throw ConfigurationError("Tool '" + tool + "' requires parameter '" + name + "'");
    }
    return it->second;
}

}  // namespace

const std::vector<ToolProfile>& ToolProfiles() {
    static const std::vector<ToolProfile> kProfiles = {
        {"subfinder", "subdomain discovery", "projectdiscovery/subfinder:latest",
         1800, 1.0, 1024, true, {"domain", "output_file"}},
        {"httpx", "HTTP probing", "projectdiscovery/httpx:latest",
         1800, 2.0, 2048, true, {"input_file", "output_file"}},
        {"nmap", "port scanning", "instrumentisto/nmap:latest",
         3600, 2.0, 2048, true, {"target", "output_file"}},
        {"nuclei", "template vuln scan", "projectdiscovery/nuclei:latest",
         3600, 2.0, 4096, true, {"target_file", "output_file"}},
        // Injection testing has to reach the live target.
        {"sqlmap", "injection testing", "pberba/sqlmap:latest",
         3600, 2.0, 2048, false, {"target_url", "output_dir"}},
    };
    return kProfiles;
}

const ToolProfile* FindToolProfile(const std::string& tool) {
    const auto& profiles = ToolProfiles();
    auto it = std::find_if(profiles.begin(), profiles.end(), [&tool](const ToolProfile& profile) {
        return profile.tool == tool;
    });
    return it == profiles.end() ? nullptr : &*it;
}

ToolConfig GetSubfinderConfig(const std::string& domain, const std::string& output_file) {
    return FromProfile("subfinder")
        .Args({"-d", domain, "-o", output_file, "-silent"})
        .Build();
}

ToolConfig GetHttpxConfig(const std::string& input_file, const std::string& output_file) {
    return FromProfile("httpx")
        .Args({"-l", input_file, "-o", output_file, "-json", "-silent", "-tech-detect", "-status-code"})
        .Build();
}

ToolConfig GetNmapConfig(const std::string& target, const std::string& output_file) {
    return FromProfile("nmap")
        .Args({"-sV", "-sC", "-T4", "-oX", output_file, "--max-retries", "2", "--host-timeout", "30m", target})
        .Build();
}

ToolConfig GetNucleiConfig(const std::string& target_file, const std::string& output_file) {
    return FromProfile("nuclei")
        .Args({"-l", target_file, "-o", output_file, "-json", "-silent", "-severity", "critical,high,medium"})
        .Build();
}

ToolConfig GetSqlmapConfig(const std::string& target_url, const std::string& output_dir) {
    return FromProfile("sqlmap")
        .Args({"-u", target_url, "--batch", "--random-agent", "--output-dir", output_dir, "--dump",
               "--threads", "5"})
        .Build();
}

ToolConfig GetToolConfig(const std::string& tool,
                         const std::unordered_map<std::string, std::string>& params) {
    if (tool == "subfinder") {
        return GetSubfinderConfig(RequireParam(tool, params, "domain"),
                                  RequireParam(tool, params, "output_file"));
    }
    if (tool == "httpx") {
        return GetHttpxConfig(RequireParam(tool, params, "input_file"),
                              RequireParam(tool, params, "output_file"));
    }
    if (tool == "nmap") {
        return GetNmapConfig(RequireParam(tool, params, "target"),
                             RequireParam(tool, params, "output_file"));
    }
    if (tool == "nuclei") {
        return GetNucleiConfig(RequireParam(tool, params, "target_file"),
                               RequireParam(tool, params, "output_file"));
    }
    if (tool == "sqlmap") {
        return GetSqlmapConfig(RequireParam(tool, params, "target_url"),
                               RequireParam(tool, params, "output_dir"));
    }

    std::vector<std::string> names;
    for (const auto& profile : ToolProfiles()) {
        names.push_back(profile.tool);
    }
    throw ConfigurationError("Unknown tool: " + tool + ". Available tools: " +
                             threatweaver::utils::Join(names, ", "));
}

}  // namespace threatweaver::sandbox
