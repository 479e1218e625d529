#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config_loader.hpp"
#include "providers/sandbox_factory.hpp"
#include "sandbox/sandbox_errors.hpp"
#include "sandbox/tool_profiles.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

namespace sandbox = threatweaver::sandbox;

constexpr int kExitSuccess = 0;
constexpr int kExitToolFailure = 1;
constexpr int kExitTimeout = 2;
constexpr int kExitSandboxFailure = 3;
constexpr int kExitConfigError = 4;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  threatweaver-sandbox health\n"
              << "  threatweaver-sandbox exec [--scan-id ID] [--workspace DIR] [--timeout S] [--name N] -- CMD [ARGS...]\n"
              << "  threatweaver-sandbox tool NAME key=value...\n"
              << "  threatweaver-sandbox profiles" << std::endl;
}

std::string GenerateScanId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "scan-" + std::to_string(ms);
}

nlohmann::json BuildResultJson(const std::string& scan_id, const sandbox::ExecutionResult& result) {
    nlohmann::json files = nlohmann::json::object();
    for (const auto& [path, content] : result.output_files) {
        files[path] = content;
    }
    return {
        {"scan_id", scan_id},
        {"success", result.success},
        {"exit_code", result.exit_code},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"duration", result.duration},
        {"output_files", files},
        {"error", result.error.has_value() ? nlohmann::json(*result.error) : nlohmann::json(nullptr)}
    };
}

void PrintJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void PrintError(const std::string& kind, const std::string& message) {
    PrintJson({{"error", kind}, {"message", message}});
}

std::unique_ptr<sandbox::SandboxProvider> MakeProvider(const threatweaver::config::Config& config) {
    return threatweaver::providers::CreateSandboxProvider(config.sandbox);
}

// Runs Execute on a worker thread so a signal can tear the sandbox down while
// the run is still in flight.
int RunScan(sandbox::SandboxProvider& provider,
            const sandbox::ToolConfig& tool,
            const std::filesystem::path& workspace_dir,
            const std::string& scan_id) {
    std::optional<sandbox::ExecutionResult> result;
    std::exception_ptr failure;
    std::atomic<bool> done{false};

    InstallSignalHandlers();
    std::thread worker([&]() {
        try {
            result = provider.Execute(tool, workspace_dir, scan_id);
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        done.store(true);
    });

    bool interrupted = false;
    while (!done.load()) {
        if (g_signal != 0 && !interrupted) {
            interrupted = true;
            threatweaver::utils::Log(threatweaver::utils::LogMessage{
                threatweaver::utils::LogLevel::kWarn, "cli", "interrupted, tearing down sandbox",
                {{"scan_id", scan_id}, {"signal", std::to_string(g_signal)}}});
            provider.Cleanup(scan_id);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const sandbox::SandboxTimeoutError& ex) {
            PrintJson({{"scan_id", scan_id},
                       {"error", "timeout"},
                       {"message", ex.what()},
                       {"timeout", ex.TimeoutSeconds()},
                       {"elapsed", ex.ElapsedSeconds()}});
            return kExitTimeout;
        } catch (const sandbox::SandboxExecutionError& ex) {
            PrintJson({{"scan_id", scan_id},
                       {"error", "sandbox"},
                       {"stage", ex.Stage()},
                       {"message", ex.what()},
                       {"elapsed", ex.ElapsedSeconds()}});
            return kExitSandboxFailure;
        } catch (const std::exception& ex) {
            PrintJson({{"scan_id", scan_id}, {"error", "sandbox"}, {"message", ex.what()}});
            return kExitSandboxFailure;
        }
    }

    PrintJson(BuildResultJson(scan_id, *result));
    return result->success ? kExitSuccess : kExitToolFailure;
}

int RunHealth(const threatweaver::config::Config& config) {
    auto provider = MakeProvider(config);
    const bool healthy = provider->HealthCheck();
    PrintJson({{"provider", provider->Name()}, {"healthy", healthy}});
    return healthy ? kExitSuccess : kExitToolFailure;
}

int RunExec(const threatweaver::config::Config& config, int argc, char** argv) {
    std::string scan_id;
    std::string workspace;
    std::string name = "exec";
    int timeout = config.sandbox.timeout;
    std::vector<std::string> command;

    int i = 2;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (i + 1 >= argc) {
            throw sandbox::ConfigurationError("Missing value for " + arg);
        }
        if (arg == "--scan-id") {
            scan_id = argv[++i];
        } else if (arg == "--workspace") {
            workspace = argv[++i];
        } else if (arg == "--timeout") {
            try {
                timeout = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                throw sandbox::ConfigurationError("Invalid --timeout value: " + std::string(argv[i]));
            }
        } else if (arg == "--name") {
            name = argv[++i];
        } else {
            throw sandbox::ConfigurationError("Unknown option: " + arg);
        }
    }
    for (; i < argc; ++i) {
        command.emplace_back(argv[i]);
    }
    if (command.empty()) {
        throw sandbox::ConfigurationError("exec requires a command after --");
    }

    auto tool = sandbox::ToolConfigBuilder(name)
                    .Command(command.front())
                    .Args(std::vector<std::string>(command.begin() + 1, command.end()))
                    .Timeout(timeout)
                    .CpuLimit(config.sandbox.cpu_limit)
                    .MemoryLimit(config.sandbox.memory_limit)
                    .NetworkIsolated(config.sandbox.network_isolated)
                    .ReadOnlyFilesystem(config.sandbox.read_only_filesystem)
                    .Build();

    if (scan_id.empty()) {
        scan_id = GenerateScanId();
    }
    const std::filesystem::path workspace_dir = workspace.empty()
        ? threatweaver::config::ResolveWorkspaceRoot(config.sandbox) / scan_id
        : std::filesystem::path(workspace);

    auto provider = MakeProvider(config);
    return RunScan(*provider, tool, workspace_dir, scan_id);
}

int RunTool(const threatweaver::config::Config& config, int argc, char** argv) {
    if (argc < 3) {
        throw sandbox::ConfigurationError("tool requires a tool name");
    }
    const std::string name = argv[2];
    std::unordered_map<std::string, std::string> params;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto pos = arg.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw sandbox::ConfigurationError("Expected key=value, got: " + arg);
        }
        params[arg.substr(0, pos)] = arg.substr(pos + 1);
    }

    const auto tool = sandbox::GetToolConfig(name, params);
    const std::string scan_id = GenerateScanId();
    const auto workspace_dir = threatweaver::config::ResolveWorkspaceRoot(config.sandbox) / scan_id;

    auto provider = MakeProvider(config);
    return RunScan(*provider, tool, workspace_dir, scan_id);
}

int RunProfiles() {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& profile : sandbox::ToolProfiles()) {
        json.push_back({
            {"tool", profile.tool},
            {"category", profile.category},
            {"image", profile.image},
            {"timeout", profile.timeout},
            {"cpu_limit", profile.cpu_limit},
            {"memory_limit", profile.memory_limit},
            {"network_isolated", profile.network_isolated},
            {"params", profile.params}
        });
    }
    PrintJson(json);
    return kExitSuccess;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitConfigError;
    }

    const std::string command = argv[1];
    if (command == "profiles") {
        return RunProfiles();
    }

    auto config = threatweaver::config::LoadConfig();
    threatweaver::utils::LogConfig log_config{};
    log_config.min_level = threatweaver::utils::ParseLogLevel(config.logging.level);
    threatweaver::utils::SetLogConfig(log_config);

    try {
        if (command == "health") {
            return RunHealth(config);
        }
        if (command == "exec") {
            return RunExec(config, argc, argv);
        }
        if (command == "tool") {
            return RunTool(config, argc, argv);
        }
    } catch (const sandbox::UnsupportedProviderError& ex) {
        PrintError("unsupported_provider", ex.what());
        return kExitConfigError;
    } catch (const sandbox::ConfigurationError& ex) {
        PrintError("configuration", ex.what());
        return kExitConfigError;
    }

    PrintUsage();
    return kExitConfigError;
}
