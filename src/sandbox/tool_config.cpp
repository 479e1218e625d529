#include "sandbox/tool_config.hpp"

#include <utility>

#include "sandbox/sandbox_errors.hpp"

namespace threatweaver::sandbox {

ToolConfigBuilder::ToolConfigBuilder(std::string name) {
    config_.name = std::move(name);
}

ToolConfigBuilder& ToolConfigBuilder::Image(std::string image) {
    config_.image = std::move(image);
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::Command(std::string command) {
    config_.command = std::move(command);
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::Arg(std::string arg) {
    config_.args.push_back(std::move(arg));
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::Args(std::vector<std::string> args) {
    config_.args = std::move(args);
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::Env(const std::string& key, std::string value) {
    config_.env[key] = std::move(value);
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::Timeout(int seconds) {
    config_.timeout = seconds;
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::CpuLimit(double cores) {
    config_.cpu_limit = cores;
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::MemoryLimit(int megabytes) {
    config_.memory_limit = megabytes;
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::NetworkIsolated(bool isolated) {
    config_.network_isolated = isolated;
    return *this;
}

ToolConfigBuilder& ToolConfigBuilder::ReadOnlyFilesystem(bool read_only) {
    config_.read_only_filesystem = read_only;
    return *this;
}

ToolConfig ToolConfigBuilder::Build() const {
    if (config_.command.empty()) {
        throw ConfigurationError("ToolConfig '" + config_.name + "': command must not be empty");
    }
    if (config_.timeout <= 0) {
        throw ConfigurationError("ToolConfig '" + config_.name + "': timeout must be positive, got " +
                                 std::to_string(config_.timeout));
    }
    return config_;
}

}  // namespace threatweaver::sandbox
