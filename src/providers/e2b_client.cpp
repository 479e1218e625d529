#include "providers/e2b_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace threatweaver::providers {
namespace {

using threatweaver::sandbox::CancelFlag;
using threatweaver::sandbox::CodeExecution;
using threatweaver::sandbox::CreateSandboxRequest;
using threatweaver::sandbox::RemoteApiError;
using threatweaver::sandbox::SandboxSession;
using threatweaver::utils::GetEnv;
using threatweaver::utils::Log;
using threatweaver::utils::LogLevel;
using threatweaver::utils::LogMessage;

constexpr const char* kLogTag = "e2b";
constexpr std::size_t kMaxErrorBody = 512;

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c);
        }
    }
    return encoded.str();
}

void ApplyProxy(httplib::Client& client) {
    for (const auto* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        const auto value = GetEnv(name);
        if (value.empty()) {
            continue;
        }
        if (const auto proxy = SplitUrl(value, "http")) {
            client.set_proxy(proxy->host, proxy->port);
            return;
        }
        Log(LogMessage{LogLevel::kWarn, kLogTag, "ignoring malformed proxy", {{"variable", name}}});
    }
}

std::string Truncate(const std::string& value, std::size_t max_len) {
    if (value.size() <= max_len) {
        return value;
    }
    return value.substr(0, max_len) + "...(truncated)";
}

[[noreturn]] void ThrowTransportError(const std::string& what, httplib::Error err) {
    throw RemoteApiError(what + ": request failed (httplib error=" +
                         std::to_string(static_cast<int>(err)) + ", " + httplib::to_string(err) + ")");
}

[[noreturn]] void ThrowHttpError(const std::string& what, int status, const std::string& body) {
    throw RemoteApiError(what + ": HTTP " + std::to_string(status) + " " + Truncate(body, kMaxErrorBody), status);
}

httplib::Headers SandboxHeaders(const SandboxSession& session, int port) {
    httplib::Headers headers{
        {"E2b-Sandbox-Id", session.sandbox_id},
        {"E2b-Sandbox-Port", std::to_string(port)},
    };
    if (!session.access_token.empty()) {
        headers.emplace("X-Access-Token", session.access_token);
    }
    return headers;
}

}  // namespace

std::string UrlParts::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<UrlParts> SplitUrl(const std::string& url, const std::string& default_scheme) {
    UrlParts parts{};
    std::string rest = threatweaver::utils::Trim(url);

    const auto scheme_end = rest.find("://");
    if (scheme_end == std::string::npos) {
        parts.scheme = default_scheme;
    } else {
        parts.scheme = rest.substr(0, scheme_end);
        rest.erase(0, scheme_end + 3);
    }
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        return std::nullopt;
    }

    const auto authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);
    if (authority_end != std::string::npos && rest[authority_end] == '/') {
        parts.path = rest.substr(authority_end, rest.find_first_of("?#", authority_end) - authority_end);
    }
    while (!parts.path.empty() && parts.path.back() == '/') {
        parts.path.pop_back();
    }

    // Credentials in a proxy URL are not forwarded.
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    const auto colon = authority.rfind(':');
    parts.host = authority.substr(0, colon);
    if (parts.host.empty()) {
        return std::nullopt;
    }
    if (colon == std::string::npos) {
        parts.port = parts.scheme == "https" ? 443 : 80;
        return parts;
    }

    const auto port_text = authority.substr(colon + 1);
    if (port_text.empty() || port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    parts.port = std::stoi(port_text);
    if (parts.port < 1 || parts.port > 65535) {
        return std::nullopt;
    }
    return parts;
}

std::string RedactSecret(const std::string& secret) {
    constexpr std::size_t kVisible = 4;
    if (secret.size() < kVisible * 3) {
        return "[redacted]";
    }
    return "[redacted]..." + secret.substr(secret.size() - kVisible);
}

void ExecutionStreamParser::Feed(const char* data, std::size_t size) {
    raw_.append(data, size);
    buffer_.append(data, size);
    std::size_t newline = 0;
    while ((newline = buffer_.find('\n')) != std::string::npos) {
        HandleLine(buffer_.substr(0, newline));
        buffer_.erase(0, newline + 1);
    }
}

void ExecutionStreamParser::Finish() {
    if (!buffer_.empty()) {
        HandleLine(buffer_);
        buffer_.clear();
    }
}

void ExecutionStreamParser::HandleLine(const std::string& line) {
    const auto trimmed = threatweaver::utils::Trim(line);
    if (trimmed.empty()) {
        return;
    }
    auto event = nlohmann::json::parse(trimmed, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        return;
    }
    const auto type = event.value("type", "");
    if (type == "stdout") {
        result_.stdout_text += event.value("text", "");
    } else if (type == "stderr") {
        result_.stderr_text += event.value("text", "");
    } else if (type == "error") {
        const auto name = event.value("name", "Error");
        const auto value = event.value("value", "");
        result_.error = value.empty() ? name : name + ": " + value;
    }
}

E2BClient::E2BClient(E2BClientOptions options)
    : options_(std::move(options)) {
    if (options_.domain.empty()) {
        options_.domain = kDefaultE2BDomain;
    }
    api_url_ = options_.api_url.empty() ? "https://api." + options_.domain : options_.api_url;
    if (!api_url_.empty() && api_url_.back() == '/') {
        api_url_.pop_back();
    }
}

std::string E2BClient::SandboxUrl(const SandboxSession& session, int port) const {
    if (!options_.sandbox_url.empty()) {
        return options_.sandbox_url;
    }
    return "https://" + std::to_string(port) + "-" + session.sandbox_id + "." + options_.domain;
}

E2BClient::Endpoint E2BClient::Connect(const std::string& base_url, std::chrono::seconds read_timeout) const {
    const auto parts = SplitUrl(base_url);
    if (!parts) {
        throw RemoteApiError("invalid endpoint URL: " + base_url);
    }

    Endpoint endpoint{};
    endpoint.client = std::make_unique<httplib::Client>(parts->Origin());
    endpoint.client->set_connection_timeout(options_.connect_timeout);
    endpoint.client->set_read_timeout(read_timeout);
    endpoint.client->set_keep_alive(false);
    if (options_.use_proxy) {
        ApplyProxy(*endpoint.client);
    }
    endpoint.base_path = parts->path;
    return endpoint;
}

SandboxSession E2BClient::CreateSandbox(const CreateSandboxRequest& request) {
    auto endpoint = Connect(api_url_, options_.request_timeout);

    nlohmann::json payload = nlohmann::json::object();
    payload["templateID"] = request.template_id.empty() ? std::string(kDefaultE2BTemplate) : request.template_id;
    if (request.lifetime_s > 0) {
        payload["timeout"] = request.lifetime_s;
    }
    if (!request.metadata.empty()) {
        payload["metadata"] = request.metadata;
    }

    Log(LogMessage{LogLevel::kDebug, kLogTag, "POST /sandboxes", {
        {"api", api_url_}, {"template", payload["templateID"].get<std::string>()}, {"api_key", RedactSecret(options_.api_key)}}});

    httplib::Headers headers{{"X-API-Key", options_.api_key}};
    auto response = endpoint.client->Post(
        (endpoint.base_path + "/sandboxes").c_str(), headers, payload.dump(), "application/json");
    if (!response) {
        ThrowTransportError("create sandbox", response.error());
    }
    if (response->status >= 400) {
        ThrowHttpError("create sandbox", response->status, response->body);
    }

    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("sandboxID") || !json["sandboxID"].is_string()) {
        throw RemoteApiError("create sandbox: invalid response " + Truncate(response->body, kMaxErrorBody),
                             response->status);
    }

    SandboxSession session{};
    session.sandbox_id = json["sandboxID"].get<std::string>();
    if (json.contains("clientID") && json["clientID"].is_string()) {
        session.client_id = json["clientID"].get<std::string>();
    }
    if (json.contains("envdAccessToken") && json["envdAccessToken"].is_string()) {
        session.access_token = json["envdAccessToken"].get<std::string>();
    }
    return session;
}

CodeExecution E2BClient::RunCode(const SandboxSession& session,
                                 const std::string& code,
                                 std::chrono::seconds read_timeout,
                                 const CancelFlag& cancel) {
    auto endpoint = Connect(SandboxUrl(session, kCodeInterpreterPort), read_timeout);

    nlohmann::json payload = {{"code", code}};

    ExecutionStreamParser parser;
    httplib::Request req;
    req.method = "POST";
    req.path = endpoint.base_path + "/execute";
    req.headers = SandboxHeaders(session, kCodeInterpreterPort);
    req.set_header("Content-Type", "application/json");
    req.body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.content_receiver = [&parser, &cancel](const char* data, std::size_t size, uint64_t, uint64_t) {
        parser.Feed(data, size);
        return !(cancel && cancel->load());
    };

    auto response = endpoint.client->send(req);
    if (cancel && cancel->load()) {
        throw RemoteApiError("execute: cancelled");
    }
    if (!response) {
        ThrowTransportError("execute", response.error());
    }
    if (response->status >= 400) {
        ThrowHttpError("execute", response->status, parser.Raw());
    }
    parser.Finish();
    return parser.Result();
}

std::string E2BClient::ReadFile(const SandboxSession& session, const std::string& path) {
    auto endpoint = Connect(SandboxUrl(session, kEnvdPort), options_.request_timeout);
    const auto target = endpoint.base_path + "/files?path=" + UrlEncode(path) + "&username=user";

    auto response = endpoint.client->Get(target.c_str(), SandboxHeaders(session, kEnvdPort));
    if (!response) {
        ThrowTransportError("read " + path, response.error());
    }
    if (response->status >= 400) {
        ThrowHttpError("read " + path, response->status, response->body);
    }
    return response->body;
}

void E2BClient::KillSandbox(const SandboxSession& session) {
    auto endpoint = Connect(api_url_, options_.request_timeout);
    const auto target = endpoint.base_path + "/sandboxes/" + UrlEncode(session.sandbox_id);

    httplib::Headers headers{{"X-API-Key", options_.api_key}};
    auto response = endpoint.client->Delete(target.c_str(), headers);
    if (!response) {
        ThrowTransportError("kill sandbox", response.error());
    }
    if (response->status == 404) {
        Log(LogMessage{LogLevel::kDebug, kLogTag, "sandbox already gone", {{"sandbox_id", session.sandbox_id}}});
        return;
    }
    if (response->status >= 400) {
        ThrowHttpError("kill sandbox", response->status, response->body);
    }
}

}  // namespace threatweaver::providers
