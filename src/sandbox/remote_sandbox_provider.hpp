#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "sandbox/remote_client.hpp"
#include "sandbox/sandbox_provider.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "sandbox/worker_pool.hpp"

namespace threatweaver::sandbox {

struct RemoteSandboxOptions {
    std::string provider_name = "e2b";
    std::string template_id;
    std::size_t worker_threads = 8;
    // Added to the tool timeout for the remote auto-expiry.
    std::chrono::seconds lifetime_grace{120};
    // Upper bound for create, sync and kill calls.
    std::chrono::seconds call_timeout{120};
};

class RemoteSandboxProvider : public SandboxProvider {
public:
    RemoteSandboxProvider(std::unique_ptr<RemoteSandboxClient> client,
                          RemoteSandboxOptions options = {});
    ~RemoteSandboxProvider() override;

    ExecutionResult Execute(const ToolConfig& config,
                            const std::filesystem::path& workspace_dir,
                            const std::string& scan_id) override;
    void Cleanup(const std::string& scan_id) override;
    bool HealthCheck() override;
    std::string Name() const override { return options_.provider_name; }

    const std::string& TemplateId() const { return options_.template_id; }
    bool IsTracked(const std::string& scan_id) const { return registry_.Contains(scan_id); }
    std::size_t ActiveSandboxes() const { return registry_.Size(); }

private:
    class TeardownGuard;

    std::shared_ptr<SandboxHandle> CreateSandbox(const ToolConfig& config, const std::string& scan_id);
    void EnsureWorkspace(const SandboxHandle& handle);
    CodeExecution RunTool(const SandboxHandle& handle,
                          const ToolConfig& config,
                          std::chrono::steady_clock::time_point start);
    std::map<std::string, std::string> DownloadWorkspace(const SandboxHandle& handle,
                                                         const std::filesystem::path& workspace_dir);
    void Teardown(const std::shared_ptr<SandboxHandle>& handle);
    void KillSandbox(const std::shared_ptr<SandboxHandle>& handle, const char* reason);

    CodeExecution RunCode(const SandboxSession& session, const std::string& code);

    std::shared_ptr<RemoteSandboxClient> client_;
    RemoteSandboxOptions options_;
    ActiveSandboxRegistry registry_;
    // Pools are the last members: joined first on destruction, while client_
    // is still alive. Tool runs get their own pool so an abandoned run can
    // never hold up the kill that ends it.
    WorkerPool pool_;
    WorkerPool run_pool_;
};

}  // namespace threatweaver::sandbox
