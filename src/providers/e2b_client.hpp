#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "sandbox/remote_client.hpp"

namespace httplib {
class Client;
}

namespace threatweaver::providers {

inline constexpr int kCodeInterpreterPort = 49999;
inline constexpr int kEnvdPort = 49983;
inline constexpr const char* kDefaultE2BDomain = "e2b.app";
inline constexpr const char* kDefaultE2BTemplate = "code-interpreter-v1";

struct E2BClientOptions {
    std::string api_key;
    std::string domain = kDefaultE2BDomain;
    // Empty: https://api.{domain}
    std::string api_url;
    // Empty: https://{port}-{sandbox_id}.{domain}. When set, every sandbox
    // port is reached through this one base URL.
    std::string sandbox_url;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{60};
    bool use_proxy = true;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 0;
    // No trailing slash, query or fragment.
    std::string path;

    std::string Origin() const;
};

// Accepts http and https only. A missing port is taken from the scheme;
// `default_scheme` applies to values like "proxy.local:3128".
std::optional<UrlParts> SplitUrl(const std::string& url, const std::string& default_scheme = "https");

// Only the last four characters of a long secret survive.
std::string RedactSecret(const std::string& secret);

// Incremental parser for the NDJSON event stream returned by /execute.
class ExecutionStreamParser {
public:
    void Feed(const char* data, std::size_t size);
    void Finish();

    const threatweaver::sandbox::CodeExecution& Result() const { return result_; }
    const std::string& Raw() const { return raw_; }

private:
    void HandleLine(const std::string& line);

    std::string buffer_;
    std::string raw_;
    threatweaver::sandbox::CodeExecution result_;
};

class E2BClient : public threatweaver::sandbox::RemoteSandboxClient {
public:
    explicit E2BClient(E2BClientOptions options);

    threatweaver::sandbox::SandboxSession CreateSandbox(
        const threatweaver::sandbox::CreateSandboxRequest& request) override;
    threatweaver::sandbox::CodeExecution RunCode(
        const threatweaver::sandbox::SandboxSession& session,
        const std::string& code,
        std::chrono::seconds read_timeout,
        const threatweaver::sandbox::CancelFlag& cancel) override;
    std::string ReadFile(const threatweaver::sandbox::SandboxSession& session,
                         const std::string& path) override;
    void KillSandbox(const threatweaver::sandbox::SandboxSession& session) override;

    const std::string& ApiUrl() const { return api_url_; }
    std::string SandboxUrl(const threatweaver::sandbox::SandboxSession& session, int port) const;

private:
    struct Endpoint {
        std::unique_ptr<httplib::Client> client;
        std::string base_path;
    };

    Endpoint Connect(const std::string& base_url, std::chrono::seconds read_timeout) const;

    E2BClientOptions options_;
    std::string api_url_;
};

}  // namespace threatweaver::providers
