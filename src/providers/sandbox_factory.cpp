#include "providers/sandbox_factory.hpp"

#include <algorithm>

#include "sandbox/sandbox_errors.hpp"
#include "utils/logging.hpp"

namespace threatweaver::providers {

E2BClientOptions ResolveE2BOptions(const threatweaver::config::SandboxConfig& config) {
    E2BClientOptions options{};
    options.api_key = config.e2b.api_key;
    options.domain = config.e2b.domain.empty() ? kDefaultE2BDomain : config.e2b.domain;
    options.api_url = config.e2b.api_url;
    options.sandbox_url = config.e2b.sandbox_url;
    options.use_proxy = config.e2b.use_proxy;
    return options;
}

threatweaver::sandbox::RemoteSandboxOptions ResolveSandboxOptions(
    const threatweaver::config::SandboxConfig& config) {
    threatweaver::sandbox::RemoteSandboxOptions options{};
    options.provider_name = config.provider;
    options.template_id = config.e2b.template_id;
    options.worker_threads = static_cast<std::size_t>(std::max(config.worker_threads, 1));
    return options;
}

std::unique_ptr<threatweaver::sandbox::SandboxProvider> CreateSandboxProvider(
    const threatweaver::config::SandboxConfig& config) {
    threatweaver::utils::Log(threatweaver::utils::LogMessage{
        threatweaver::utils::LogLevel::kInfo, "sandbox", "creating provider", {{"provider", config.provider}}});

    if (config.provider == "e2b") {
        if (config.e2b.api_key.empty()) {
            throw threatweaver::sandbox::ConfigurationError(
                "E2B_API_KEY environment variable is required for E2B provider");
        }
        return std::make_unique<threatweaver::sandbox::RemoteSandboxProvider>(
            std::make_unique<E2BClient>(ResolveE2BOptions(config)),
            ResolveSandboxOptions(config));
    }

    if (config.provider == "docker") {
        throw threatweaver::sandbox::UnsupportedProviderError(
            config.provider,
            "Docker sandbox provider not yet implemented. Use provider='e2b'");
    }

    throw threatweaver::sandbox::ConfigurationError(
        "Unknown sandbox provider: " + config.provider + ". Available providers: e2b, docker");
}

}  // namespace threatweaver::providers
