#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include "utils/common.hpp"

namespace threatweaver::config {
namespace {

using threatweaver::utils::GetEnv;

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyE2BConfig(E2BConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ApplyString(target.api_key, source, "apiKey");
    ApplyString(target.template_id, source, "templateId");
    ApplyString(target.domain, source, "domain");
    ApplyString(target.api_url, source, "apiUrl");
    ApplyString(target.sandbox_url, source, "sandboxUrl");
    if (source.contains("useProxy") && source["useProxy"].is_boolean()) {
        target.use_proxy = source["useProxy"].get<bool>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return threatweaver::utils::GetHomePath() / ".threatweaver" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyString(config.sandbox.provider, sandbox, "provider");
        ApplyString(config.sandbox.docker_host, sandbox, "dockerHost");
        ApplyString(config.sandbox.workspace_root, sandbox, "workspaceRoot");
        if (sandbox.contains("e2b")) {
            ApplyE2BConfig(config.sandbox.e2b, sandbox["e2b"]);
        }
        if (sandbox.contains("cpuLimit") && sandbox["cpuLimit"].is_number()) {
            config.sandbox.cpu_limit = sandbox["cpuLimit"].get<double>();
        }
        if (sandbox.contains("memoryLimit") && sandbox["memoryLimit"].is_number_integer()) {
            config.sandbox.memory_limit = sandbox["memoryLimit"].get<int>();
        }
        if (sandbox.contains("timeout") && sandbox["timeout"].is_number_integer()) {
            config.sandbox.timeout = sandbox["timeout"].get<int>();
        }
        if (sandbox.contains("networkLimit") && sandbox["networkLimit"].is_number_integer()) {
            config.sandbox.network_limit = sandbox["networkLimit"].get<int>();
        }
        if (sandbox.contains("readOnlyFilesystem") && sandbox["readOnlyFilesystem"].is_boolean()) {
            config.sandbox.read_only_filesystem = sandbox["readOnlyFilesystem"].get<bool>();
        }
        if (sandbox.contains("networkIsolated") && sandbox["networkIsolated"].is_boolean()) {
            config.sandbox.network_isolated = sandbox["networkIsolated"].get<bool>();
        }
        if (sandbox.contains("workerThreads") && sandbox["workerThreads"].is_number_integer()) {
            config.sandbox.worker_threads = sandbox["workerThreads"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

void ApplyConfigFromEnv(Config& config) {
    auto& sandbox = config.sandbox;

    const auto provider = GetEnv("SANDBOX_PROVIDER");
    if (!provider.empty()) {
        sandbox.provider = provider;
    }

    const auto api_key = GetEnv("E2B_API_KEY");
    if (!api_key.empty()) {
        sandbox.e2b.api_key = api_key;
    }

    const auto template_id = GetEnv("E2B_TEMPLATE_ID");
    if (!template_id.empty()) {
        sandbox.e2b.template_id = template_id;
    }

    const auto domain = GetEnv("E2B_DOMAIN");
    if (!domain.empty()) {
        sandbox.e2b.domain = domain;
    }

    const auto api_url = GetEnv("E2B_API_URL");
    if (!api_url.empty()) {
        sandbox.e2b.api_url = api_url;
    }

    const auto sandbox_url = GetEnv("E2B_SANDBOX_URL");
    if (!sandbox_url.empty()) {
        sandbox.e2b.sandbox_url = sandbox_url;
    }

    const auto docker_host = GetEnv("DOCKER_HOST");
    if (!docker_host.empty()) {
        sandbox.docker_host = docker_host;
    }

    const auto cpu_limit = GetEnv("SANDBOX_CPU_LIMIT");
    if (!cpu_limit.empty()) {
        sandbox.cpu_limit = ParseDouble(cpu_limit, sandbox.cpu_limit);
    }

    const auto memory_limit = GetEnv("SANDBOX_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        sandbox.memory_limit = ParseInt(memory_limit, sandbox.memory_limit);
    }

    const auto timeout = GetEnv("SANDBOX_TIMEOUT");
    if (!timeout.empty()) {
        sandbox.timeout = ParseInt(timeout, sandbox.timeout);
    }

    const auto network_limit = GetEnv("SANDBOX_NETWORK_LIMIT");
    if (!network_limit.empty()) {
        sandbox.network_limit = ParseInt(network_limit, sandbox.network_limit);
    }

    const auto read_only = GetEnv("SANDBOX_READ_ONLY_FILESYSTEM");
    if (!read_only.empty()) {
        sandbox.read_only_filesystem = ParseBool(read_only);
    }

    const auto network_isolated = GetEnv("SANDBOX_NETWORK_ISOLATED");
    if (!network_isolated.empty()) {
        sandbox.network_isolated = ParseBool(network_isolated);
    }

    const auto workspace_root = GetEnv("SANDBOX_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        sandbox.workspace_root = workspace_root;
    }

    const auto worker_threads = GetEnv("SANDBOX_WORKER_THREADS");
    if (!worker_threads.empty()) {
        sandbox.worker_threads = ParseInt(worker_threads, sandbox.worker_threads);
    }

    const auto log_level = GetEnv("THREATWEAVER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[config] ignoring " << config_path.string() << ": " << ex.what() << std::endl;
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

std::filesystem::path ResolveWorkspaceRoot(const SandboxConfig& config) {
    const auto& root = config.workspace_root;
    if (root == "~") {
        return threatweaver::utils::GetHomePath();
    }
    if (root.rfind("~/", 0) == 0) {
        return threatweaver::utils::GetHomePath() / root.substr(2);
    }
    return std::filesystem::path(root);
}

}  // namespace threatweaver::config
