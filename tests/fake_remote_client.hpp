#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/remote_client.hpp"
#include "sandbox/script_builder.hpp"

namespace threatweaver::test {

using threatweaver::sandbox::CancelFlag;
using threatweaver::sandbox::CodeExecution;
using threatweaver::sandbox::CreateSandboxRequest;
using threatweaver::sandbox::RemoteApiError;
using threatweaver::sandbox::SandboxSession;

struct FakeSandbox {
    SandboxSession session;
    CreateSandboxRequest request;
    // Absolute remote path -> content.
    std::map<std::string, std::string> files;
    std::atomic<bool> killed{false};
};

// Plays the remote backend in-process. The tool script is answered by
// `tool_behavior`; the workspace scripts are answered from the sandbox's file
// map. Failure switches are read at call time.
class FakeRemoteClient : public threatweaver::sandbox::RemoteSandboxClient {
public:
    using ToolBehavior = std::function<CodeExecution(FakeSandbox&, const std::string& code, const CancelFlag&)>;

    std::atomic<bool> fail_create{false};
    std::atomic<bool> fail_ensure_workspace{false};
    std::atomic<bool> fail_listing{false};
    std::atomic<bool> fail_kill{false};
    std::atomic<bool> fail_health_code{false};

    void SetToolBehavior(ToolBehavior behavior) {
        std::lock_guard<std::mutex> lock(mutex_);
        tool_behavior_ = std::move(behavior);
    }

    void FailReadsOf(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_reads_.insert(path);
    }

    SandboxSession CreateSandbox(const CreateSandboxRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++create_calls_;
        if (fail_create.load()) {
            throw RemoteApiError("create sandbox: HTTP 429 quota exceeded", 429);
        }
        auto sandbox = std::make_shared<FakeSandbox>();
        sandbox->session.sandbox_id = "sbx-" + std::to_string(++next_id_);
        sandbox->session.client_id = "client";
        sandbox->session.access_token = "token-" + std::to_string(next_id_);
        sandbox->request = request;
        sandboxes_[sandbox->session.sandbox_id] = sandbox;
        return sandbox->session;
    }

    CodeExecution RunCode(const SandboxSession& session,
                          const std::string& code,
                          std::chrono::seconds,
                          const CancelFlag& cancel) override {
        auto sandbox = Find(session);
        if (sandbox->killed.load()) {
            throw RemoteApiError("execute: HTTP 502 sandbox not found", 502);
        }

        if (code == threatweaver::sandbox::BuildEnsureWorkspaceScript()) {
            if (fail_ensure_workspace.load()) {
                throw RemoteApiError("execute: request failed (connection reset)");
            }
            return {};
        }

        if (code == threatweaver::sandbox::BuildListWorkspaceScript()) {
            if (fail_listing.load()) {
                throw RemoteApiError("execute: request failed (read timeout)");
            }
            nlohmann::json listing = nlohmann::json::array();
            const std::string prefix = std::string(threatweaver::sandbox::kWorkspaceRoot) + "/";
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& entry : sandbox->files) {
                    if (entry.first.rfind(prefix, 0) == 0) {
                        listing.push_back(entry.first.substr(prefix.size()));
                    }
                }
            }
            CodeExecution execution{};
            execution.stdout_text = listing.dump() + "\n";
            return execution;
        }

        if (code.find("health check OK") != std::string::npos) {
            CodeExecution execution{};
            if (fail_health_code.load()) {
                execution.error = "NameError: name 'print' is not defined";
            } else {
                execution.stdout_text = "health check OK\n";
            }
            return execution;
        }

        ToolBehavior behavior;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++tool_runs_;
            behavior = tool_behavior_;
        }
        if (!behavior) {
            CodeExecution execution{};
            execution.stderr_text = "\n__E2B_EXIT_CODE__=0\n";
            return execution;
        }
        return behavior(*sandbox, code, cancel);
    }

    std::string ReadFile(const SandboxSession& session, const std::string& path) override {
        auto sandbox = Find(session);
        std::lock_guard<std::mutex> lock(mutex_);
        ++read_calls_;
        if (failing_reads_.count(path) > 0) {
            throw RemoteApiError("read " + path + ": HTTP 500 internal error", 500);
        }
        auto it = sandbox->files.find(path);
        if (it == sandbox->files.end()) {
            throw RemoteApiError("read " + path + ": HTTP 404 not found", 404);
        }
        return it->second;
    }

    void KillSandbox(const SandboxSession& session) override {
        auto sandbox = Find(session);
        std::lock_guard<std::mutex> lock(mutex_);
        ++kill_calls_;
        killed_ids_.push_back(session.sandbox_id);
        if (fail_kill.load()) {
            throw RemoteApiError("kill sandbox: HTTP 500 internal error", 500);
        }
        sandbox->killed.store(true);
    }

    int CreateCalls() const { std::lock_guard<std::mutex> lock(mutex_); return create_calls_; }
    int KillCalls() const { std::lock_guard<std::mutex> lock(mutex_); return kill_calls_; }
    int ToolRuns() const { std::lock_guard<std::mutex> lock(mutex_); return tool_runs_; }
    std::vector<std::string> KilledIds() const { std::lock_guard<std::mutex> lock(mutex_); return killed_ids_; }

    std::shared_ptr<FakeSandbox> Sandbox(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(id);
        return it == sandboxes_.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<FakeSandbox>> Sandboxes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<FakeSandbox>> result;
        for (const auto& entry : sandboxes_) {
            result.push_back(entry.second);
        }
        return result;
    }

    // Writes a file into a sandbox the way a command running in it would.
    void WriteFile(FakeSandbox& sandbox, const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        sandbox.files[path] = content;
    }

private:
    std::shared_ptr<FakeSandbox> Find(const SandboxSession& session) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(session.sandbox_id);
        if (it == sandboxes_.end()) {
            throw RemoteApiError("unknown sandbox " + session.sandbox_id, 404);
        }
        return it->second;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeSandbox>> sandboxes_;
    std::set<std::string> failing_reads_;
    ToolBehavior tool_behavior_;
    int next_id_ = 0;
    int create_calls_ = 0;
    int kill_calls_ = 0;
    int read_calls_ = 0;
    int tool_runs_ = 0;
    std::vector<std::string> killed_ids_;
};

// Sleeps in short steps; returns false as soon as the run is cancelled or the
// sandbox is killed.
inline bool SleepInSandbox(const FakeSandbox& sandbox, const CancelFlag& cancel, std::chrono::milliseconds total) {
    const auto until = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < until) {
        if ((cancel && cancel->load()) || sandbox.killed.load()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

inline CodeExecution Finished(const std::string& stdout_text, const std::string& stderr_text, int exit_code) {
    CodeExecution execution{};
    execution.stdout_text = stdout_text;
    execution.stderr_text = stderr_text + "\n__E2B_EXIT_CODE__=" + std::to_string(exit_code) + "\n";
    return execution;
}

}  // namespace threatweaver::test
