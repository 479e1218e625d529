#include "sandbox/remote_sandbox_provider.hpp"

#include <fstream>
#include <future>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "sandbox/sandbox_errors.hpp"
#include "sandbox/script_builder.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace threatweaver::sandbox {
namespace {

using threatweaver::utils::Log;
using threatweaver::utils::LogLevel;
using threatweaver::utils::LogMessage;

constexpr const char* kLogTag = "sandbox";
constexpr const char* kHealthCheckCode = "print('health check OK')\n";
constexpr std::chrono::milliseconds kQueuePoll{50};

std::string FormatSeconds(double seconds) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(2);
    out << seconds << "s";
    return out.str();
}

void WriteLocalCopy(const std::filesystem::path& target, const std::string& content) {
    std::filesystem::create_directories(target.parent_path());
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "cannot open " + target.string());
    }
    output << content;
    if (!output) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "cannot write " + target.string());
    }
}

}  // namespace

class RemoteSandboxProvider::TeardownGuard {
public:
    TeardownGuard(RemoteSandboxProvider& provider, std::shared_ptr<SandboxHandle> handle)
        : provider_(provider)
        , handle_(std::move(handle)) {}

    ~TeardownGuard() {
        provider_.Teardown(handle_);
    }

    TeardownGuard(const TeardownGuard&) = delete;
    TeardownGuard& operator=(const TeardownGuard&) = delete;

private:
    RemoteSandboxProvider& provider_;
    std::shared_ptr<SandboxHandle> handle_;
};

RemoteSandboxProvider::RemoteSandboxProvider(std::unique_ptr<RemoteSandboxClient> client,
                                             RemoteSandboxOptions options)
    : client_(std::move(client))
    , options_(std::move(options))
    , pool_(options_.worker_threads)
    , run_pool_(options_.worker_threads) {}

RemoteSandboxProvider::~RemoteSandboxProvider() = default;

ExecutionResult RemoteSandboxProvider::Execute(const ToolConfig& config,
                                               const std::filesystem::path& workspace_dir,
                                               const std::string& scan_id) {
    const auto start = std::chrono::steady_clock::now();
    Log(LogMessage{LogLevel::kInfo, kLogTag, "execute", {
        {"tool", config.name},
        {"scan_id", scan_id},
        {"provider", Name()},
        {"template", options_.template_id.empty() ? "(default)" : options_.template_id},
    }});

    std::shared_ptr<SandboxHandle> handle;
    try {
        handle = CreateSandbox(config, scan_id);
    } catch (const std::exception& ex) {
        const auto elapsed = threatweaver::utils::SecondsSince(start);
        Log(LogMessage{LogLevel::kError, kLogTag, "create failed", {
            {"tool", config.name}, {"scan_id", scan_id}, {"elapsed", FormatSeconds(elapsed)}, {"error", ex.what()}}});
        throw SandboxExecutionError("create", ex.what(), elapsed);
    }

    TeardownGuard guard(*this, handle);
    const char* stage = "sync-in";
    try {
        EnsureWorkspace(*handle);

        stage = "run";
        const auto execution = RunTool(*handle, config, start);

        stage = "sync-out";
        auto output_files = DownloadWorkspace(*handle, workspace_dir);

        auto stderr_text = execution.stderr_text;
        if (execution.error) {
            if (!stderr_text.empty()) {
                stderr_text += "\n";
            }
            stderr_text += *execution.error;
        }
        auto extraction = ExtractExitCode(stderr_text);

        ExecutionResult result{};
        result.exit_code = extraction.exit_code.value_or(execution.error ? -1 : 0);
        result.error = execution.error;
        result.success = IsSuccessful(result.exit_code, result.error);
        result.stdout_text = threatweaver::utils::Trim(execution.stdout_text);
        result.stderr_text = threatweaver::utils::Trim(extraction.stderr_text);
        result.output_files = std::move(output_files);
        result.duration = threatweaver::utils::SecondsSince(start);

        Log(LogMessage{LogLevel::kInfo, kLogTag, "completed", {
            {"tool", config.name},
            {"scan_id", scan_id},
            {"exit_code", std::to_string(result.exit_code)},
            {"success", result.success ? "true" : "false"},
            {"files", std::to_string(result.output_files.size())},
            {"duration", FormatSeconds(result.duration)},
        }});
        return result;
    } catch (const SandboxTimeoutError&) {
        throw;
    } catch (const std::exception& ex) {
        const auto elapsed = threatweaver::utils::SecondsSince(start);
        Log(LogMessage{LogLevel::kError, kLogTag, "execute failed", {
            {"tool", config.name},
            {"scan_id", scan_id},
            {"stage", stage},
            {"elapsed", FormatSeconds(elapsed)},
            {"error", ex.what()},
        }});
        throw SandboxExecutionError(stage, ex.what(), elapsed);
    }
}

void RemoteSandboxProvider::Cleanup(const std::string& scan_id) {
    auto handle = registry_.Take(scan_id);
    if (!handle) {
        Log(LogMessage{LogLevel::kDebug, kLogTag, "cleanup: nothing tracked", {{"scan_id", scan_id}}});
        return;
    }
    KillSandbox(handle, "cleanup");
}

bool RemoteSandboxProvider::HealthCheck() {
    std::optional<SandboxSession> session;
    bool healthy = false;
    try {
        CreateSandboxRequest request{};
        request.template_id = options_.template_id;
        request.lifetime_s = static_cast<int>(options_.call_timeout.count());
        request.metadata["purpose"] = "health-check";
        auto client = client_;
        session = pool_.Submit([client, request]() { return client->CreateSandbox(request); }).get();

        const auto execution = RunCode(*session, kHealthCheckCode);
        healthy = !execution.error.has_value();
        if (!healthy) {
            Log(LogMessage{LogLevel::kWarn, kLogTag, "health check run failed", {
                {"sandbox_id", session->sandbox_id}, {"error", *execution.error}}});
        }
    } catch (const std::exception& ex) {
        Log(LogMessage{LogLevel::kError, kLogTag, "health check failed", {{"error", ex.what()}}});
        healthy = false;
    }

    if (session) {
        try {
            auto client = client_;
            const auto checked = *session;
            pool_.Submit([client, checked]() { client->KillSandbox(checked); }).get();
        } catch (const std::exception& ex) {
            Log(LogMessage{LogLevel::kWarn, kLogTag, "health check teardown failed", {
                {"sandbox_id", session->sandbox_id}, {"error", ex.what()}}});
            healthy = false;
        }
    }
    return healthy;
}

std::shared_ptr<SandboxHandle> RemoteSandboxProvider::CreateSandbox(const ToolConfig& config,
                                                                    const std::string& scan_id) {
    CreateSandboxRequest request{};
    request.template_id = options_.template_id;
    request.lifetime_s = config.timeout + static_cast<int>(options_.lifetime_grace.count());
    request.metadata["scan_id"] = scan_id;
    request.metadata["tool"] = config.name;

    auto client = client_;
    auto session = pool_.Submit([client, request]() { return client->CreateSandbox(request); }).get();

    auto handle = std::make_shared<SandboxHandle>(std::move(session), scan_id);
    auto displaced = registry_.Insert(handle);
    if (displaced) {
        // The displaced sandbox still belongs to its own execute() call,
        // which tears it down.
        Log(LogMessage{LogLevel::kWarn, kLogTag, "scan already had a live sandbox", {
            {"scan_id", scan_id}, {"previous", displaced->RemoteId()}}});
    }
    Log(LogMessage{LogLevel::kInfo, kLogTag, "created", {
        {"scan_id", scan_id}, {"sandbox_id", handle->RemoteId()}}});
    return handle;
}

void RemoteSandboxProvider::EnsureWorkspace(const SandboxHandle& handle) {
    const auto execution = RunCode(handle.Session(), BuildEnsureWorkspaceScript());
    if (execution.error) {
        throw RemoteApiError("cannot create " + std::string(kWorkspaceRoot) + ": " + *execution.error);
    }
    Log(LogMessage{LogLevel::kDebug, kLogTag, "synced in", {
        {"sandbox_id", handle.RemoteId()}, {"workspace", kWorkspaceRoot}}});
}

CodeExecution RemoteSandboxProvider::RunTool(const SandboxHandle& handle,
                                             const ToolConfig& config,
                                             std::chrono::steady_clock::time_point start) {
    const auto code = BuildToolScript(config);
    const auto deadline = std::chrono::seconds(config.timeout);
    const auto read_timeout = deadline + options_.call_timeout;
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto client = client_;
    const auto session = handle.Session();

    std::vector<std::string> argv{config.command};
    argv.insert(argv.end(), config.args.begin(), config.args.end());
    Log(LogMessage{LogLevel::kInfo, kLogTag, "running", {
        {"sandbox_id", handle.RemoteId()},
        {"command", threatweaver::utils::Join(argv, " ")},
        {"timeout", std::to_string(config.timeout) + "s"},
    }});

    // The deadline covers the run only; time spent queued behind other scans
    // on run_pool_ does not count against config.timeout.
    auto started = std::make_shared<std::promise<void>>();
    auto started_future = started->get_future();
    auto future = run_pool_.Submit([client, session, code, read_timeout, cancel, started]() {
        started->set_value();
        if (cancel->load()) {
            throw RemoteApiError("execute: cancelled");
        }
        return client->RunCode(session, code, read_timeout, cancel);
    });
    while (started_future.wait_for(kQueuePoll) == std::future_status::timeout) {
        if (handle.IsTornDown()) {
            cancel->store(true);
            Log(LogMessage{LogLevel::kWarn, kLogTag, "run dropped from queue", {
                {"tool", config.name}, {"sandbox_id", handle.RemoteId()}}});
            throw RemoteApiError("execute: sandbox torn down before the run started");
        }
    }
    if (future.wait_for(deadline) == std::future_status::timeout) {
        cancel->store(true);
        const auto elapsed = threatweaver::utils::SecondsSince(start);
        Log(LogMessage{LogLevel::kError, kLogTag, "timed out", {
            {"tool", config.name},
            {"sandbox_id", handle.RemoteId()},
            {"elapsed", FormatSeconds(elapsed)},
            {"limit", std::to_string(config.timeout) + "s"},
        }});
        throw SandboxTimeoutError(config.timeout, elapsed);
    }
    return future.get();
}

std::map<std::string, std::string> RemoteSandboxProvider::DownloadWorkspace(
    const SandboxHandle& handle,
    const std::filesystem::path& workspace_dir) {
    std::map<std::string, std::string> output_files;

    CodeExecution listing{};
    try {
        listing = RunCode(handle.Session(), BuildListWorkspaceScript());
    } catch (const std::exception& ex) {
        Log(LogMessage{LogLevel::kWarn, kLogTag, "workspace listing failed", {
            {"sandbox_id", handle.RemoteId()}, {"error", ex.what()}}});
        return output_files;
    }
    if (listing.error) {
        Log(LogMessage{LogLevel::kWarn, kLogTag, "workspace listing failed", {
            {"sandbox_id", handle.RemoteId()}, {"error", *listing.error}}});
        return output_files;
    }

    auto client = client_;
    const auto session = handle.Session();
    for (const auto& relative : ParseWorkspaceListing(listing.stdout_text)) {
        const auto remote_path = std::string(kWorkspaceRoot) + "/" + relative;
        std::string content;
        try {
            content = pool_.Submit([client, session, remote_path]() {
                return client->ReadFile(session, remote_path);
            }).get();
        } catch (const std::exception& ex) {
            Log(LogMessage{LogLevel::kWarn, kLogTag, "download skipped", {
                {"path", remote_path}, {"error", ex.what()}}});
            continue;
        }

        try {
            WriteLocalCopy(workspace_dir / std::filesystem::path(relative), content);
        } catch (const std::exception& ex) {
            Log(LogMessage{LogLevel::kWarn, kLogTag, "local copy failed", {
                {"path", remote_path}, {"workspace", workspace_dir.string()}, {"error", ex.what()}}});
            continue;
        }
        Log(LogMessage{LogLevel::kInfo, kLogTag, "downloaded", {
            {"path", remote_path}, {"bytes", std::to_string(content.size())}}});
        output_files.emplace(remote_path, std::move(content));
    }
    return output_files;
}

void RemoteSandboxProvider::Teardown(const std::shared_ptr<SandboxHandle>& handle) {
    KillSandbox(handle, "teardown");
    registry_.Remove(handle->ScanId(), handle);
}

void RemoteSandboxProvider::KillSandbox(const std::shared_ptr<SandboxHandle>& handle, const char* reason) {
    if (!handle->ClaimTeardown()) {
        return;
    }
    try {
        auto client = client_;
        const auto session = handle->Session();
        pool_.Submit([client, session]() { client->KillSandbox(session); }).get();
        Log(LogMessage{LogLevel::kInfo, kLogTag, "torn down", {
            {"scan_id", handle->ScanId()}, {"sandbox_id", handle->RemoteId()}, {"reason", reason}}});
    } catch (const std::exception& ex) {
        Log(LogMessage{LogLevel::kWarn, kLogTag, "teardown failed", {
            {"scan_id", handle->ScanId()},
            {"sandbox_id", handle->RemoteId()},
            {"reason", reason},
            {"error", ex.what()},
        }});
    }
}

CodeExecution RemoteSandboxProvider::RunCode(const SandboxSession& session, const std::string& code) {
    auto client = client_;
    const auto read_timeout = options_.call_timeout;
    return pool_.Submit([client, session, code, read_timeout]() {
        return client->RunCode(session, code, read_timeout, nullptr);
    }).get();
}

}  // namespace threatweaver::sandbox
