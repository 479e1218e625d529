#pragma once

#include <map>
#include <string>
#include <vector>

namespace threatweaver::sandbox {

struct ToolConfig {
    std::string name;
    std::string image;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    int timeout = 3600;
    double cpu_limit = 2.0;
    int memory_limit = 4096;
    bool network_isolated = true;
    bool read_only_filesystem = true;
};

class ToolConfigBuilder {
public:
    explicit ToolConfigBuilder(std::string name);

    ToolConfigBuilder& Image(std::string image);
    ToolConfigBuilder& Command(std::string command);
    ToolConfigBuilder& Arg(std::string arg);
    ToolConfigBuilder& Args(std::vector<std::string> args);
    ToolConfigBuilder& Env(const std::string& key, std::string value);
    ToolConfigBuilder& Timeout(int seconds);
    ToolConfigBuilder& CpuLimit(double cores);
    ToolConfigBuilder& MemoryLimit(int megabytes);
    ToolConfigBuilder& NetworkIsolated(bool isolated);
    ToolConfigBuilder& ReadOnlyFilesystem(bool read_only);

    // Throws ConfigurationError for an empty command or a non-positive timeout.
    ToolConfig Build() const;

private:
    ToolConfig config_;
};

}  // namespace threatweaver::sandbox
