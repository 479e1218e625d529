#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "providers/e2b_client.hpp"
#include "sandbox/remote_sandbox_provider.hpp"
#include "sandbox/sandbox_provider.hpp"

namespace threatweaver::providers {

E2BClientOptions ResolveE2BOptions(const threatweaver::config::SandboxConfig& config);
threatweaver::sandbox::RemoteSandboxOptions ResolveSandboxOptions(
    const threatweaver::config::SandboxConfig& config);

// Fails fast: ConfigurationError for a missing credential or unknown
// provider, UnsupportedProviderError for a provider without an
// implementation.
std::unique_ptr<threatweaver::sandbox::SandboxProvider> CreateSandboxProvider(
    const threatweaver::config::SandboxConfig& config);

}  // namespace threatweaver::providers
