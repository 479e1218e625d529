#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace threatweaver::sandbox {

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid or missing configuration. Raised before any remote call is made.
class ConfigurationError : public SandboxError {
public:
    explicit ConfigurationError(const std::string& message)
        : SandboxError(message) {}
};

class UnsupportedProviderError : public ConfigurationError {
public:
    UnsupportedProviderError(const std::string& provider, const std::string& message)
        : ConfigurationError(message)
        , provider_(provider) {}

    const std::string& Provider() const { return provider_; }

private:
    std::string provider_;
};

// The run step exceeded its deadline. The remote sandbox has already been
// torn down when this reaches the caller.
class SandboxTimeoutError : public SandboxError {
public:
    SandboxTimeoutError(int timeout_s, double elapsed_s)
        : SandboxError("Execution exceeded timeout of " + std::to_string(timeout_s) + "s")
        , timeout_s_(timeout_s)
        , elapsed_s_(elapsed_s) {}

    int TimeoutSeconds() const { return timeout_s_; }
    double ElapsedSeconds() const { return elapsed_s_; }

private:
    int timeout_s_ = 0;
    double elapsed_s_ = 0.0;
};

// Infrastructure failure during create, sync or run.
class SandboxExecutionError : public SandboxError {
public:
    SandboxExecutionError(std::string stage, const std::string& detail, double elapsed_s)
        : SandboxError("Execution failed during " + stage + ": " + detail)
        , stage_(std::move(stage))
        , elapsed_s_(elapsed_s) {}

    const std::string& Stage() const { return stage_; }
    double ElapsedSeconds() const { return elapsed_s_; }

private:
    std::string stage_;
    double elapsed_s_ = 0.0;
};

}  // namespace threatweaver::sandbox
