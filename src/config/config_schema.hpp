#pragma once

#include <string>

namespace threatweaver::config {

struct E2BConfig {
    std::string api_key;
    std::string template_id;
    std::string domain = "e2b.app";
    std::string api_url;
    std::string sandbox_url;
    bool use_proxy = true;
};

struct SandboxConfig {
    // "e2b" or "docker"; only e2b has an implementation.
    std::string provider = "e2b";
    E2BConfig e2b;
    std::string docker_host = "unix:///var/run/docker.sock";

    double cpu_limit = 2.0;
    int memory_limit = 4096;
    int timeout = 3600;
    int network_limit = 10;

    bool read_only_filesystem = true;
    bool network_isolated = true;

    std::string workspace_root = "~/.threatweaver/workspace";
    int worker_threads = 8;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    LoggingConfig logging;
};

}  // namespace threatweaver::config
