#pragma once

#include <filesystem>
#include <string>

#include "sandbox/execution_result.hpp"
#include "sandbox/tool_config.hpp"

namespace threatweaver::sandbox {

class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    // Runs one command to completion in a fresh sandbox. A non-zero exit is
    // reported in the result. Throws SandboxTimeoutError or
    // SandboxExecutionError; the sandbox is torn down in every case.
    virtual ExecutionResult Execute(const ToolConfig& config,
                                    const std::filesystem::path& workspace_dir,
                                    const std::string& scan_id) = 0;

    // Idempotent. Unknown scan ids are ignored.
    virtual void Cleanup(const std::string& scan_id) = 0;

    // Never throws.
    virtual bool HealthCheck() = 0;

    virtual std::string Name() const = 0;
};

}  // namespace threatweaver::sandbox
