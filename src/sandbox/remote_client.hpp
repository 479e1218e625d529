#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace threatweaver::sandbox {

struct SandboxSession {
    std::string sandbox_id;
    std::string client_id;
    std::string access_token;
};

struct CreateSandboxRequest {
    std::string template_id;
    // Remote auto-expiry in seconds; bounds the lifetime of a sandbox whose
    // teardown never arrives.
    int lifetime_s = 0;
    std::map<std::string, std::string> metadata;
};

struct CodeExecution {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

class RemoteApiError : public std::runtime_error {
public:
    RemoteApiError(const std::string& message, int status = 0)
        : std::runtime_error(message)
        , status_(status) {}

    // HTTP status, 0 for transport-level failures.
    int Status() const { return status_; }

private:
    int status_ = 0;
};

// Blocking calls against a remote sandbox backend. Every method may throw
// RemoteApiError. Implementations must be safe to call from several threads.
class RemoteSandboxClient {
public:
    virtual ~RemoteSandboxClient() = default;

    virtual SandboxSession CreateSandbox(const CreateSandboxRequest& request) = 0;
    virtual CodeExecution RunCode(const SandboxSession& session,
                                  const std::string& code,
                                  std::chrono::seconds read_timeout,
                                  const CancelFlag& cancel) = 0;
    virtual std::string ReadFile(const SandboxSession& session, const std::string& path) = 0;
    virtual void KillSandbox(const SandboxSession& session) = 0;
};

}  // namespace threatweaver::sandbox
