#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>

#include <unistd.h>

#include "config/config_loader.hpp"
#include "utils/logging.hpp"

namespace {

namespace fs = std::filesystem;

using threatweaver::config::ApplyConfigFromEnv;
using threatweaver::config::ApplyConfigFromJson;
using threatweaver::config::Config;
using threatweaver::config::LoadConfig;
using threatweaver::config::ResolveWorkspaceRoot;

const char* const kManagedVariables[] = {
    "SANDBOX_PROVIDER", "E2B_API_KEY", "E2B_TEMPLATE_ID", "E2B_DOMAIN", "E2B_API_URL",
    "E2B_SANDBOX_URL", "DOCKER_HOST", "SANDBOX_CPU_LIMIT", "SANDBOX_MEMORY_LIMIT",
    "SANDBOX_TIMEOUT", "SANDBOX_NETWORK_LIMIT", "SANDBOX_READ_ONLY_FILESYSTEM",
    "SANDBOX_NETWORK_ISOLATED", "SANDBOX_WORKSPACE_ROOT", "SANDBOX_WORKER_THREADS",
    "THREATWEAVER_LOG_LEVEL", "HOME",
};

// Clears the recognised variables for the duration of a test and restores
// them afterwards.
class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : kManagedVariables) {
            const char* value = std::getenv(name);
            saved_[name] = value ? std::optional<std::string>(value) : std::nullopt;
            if (std::string(name) != "HOME") {
                ::unsetenv(name);
            }
        }
        dir_ = fs::temp_directory_path() / ("threatweaver-config-" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        for (const auto& [name, value] : saved_) {
            if (value) {
                ::setenv(name.c_str(), value->c_str(), 1);
            } else {
                ::unsetenv(name.c_str());
            }
        }
        fs::remove_all(dir_);
    }

    fs::path WriteConfig(const std::string& content) {
        const auto path = dir_ / "config.json";
        std::ofstream output(path);
        output << content;
        return path;
    }

    std::map<std::string, std::optional<std::string>> saved_;
    fs::path dir_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFileOrEnvironment) {
    const auto config = LoadConfig(dir_ / "missing.json");
    EXPECT_EQ(config.sandbox.provider, "e2b");
    EXPECT_TRUE(config.sandbox.e2b.api_key.empty());
    EXPECT_EQ(config.sandbox.e2b.domain, "e2b.app");
    EXPECT_DOUBLE_EQ(config.sandbox.cpu_limit, 2.0);
    EXPECT_EQ(config.sandbox.memory_limit, 4096);
    EXPECT_EQ(config.sandbox.timeout, 3600);
    EXPECT_EQ(config.sandbox.network_limit, 10);
    EXPECT_TRUE(config.sandbox.read_only_filesystem);
    EXPECT_TRUE(config.sandbox.network_isolated);
    EXPECT_EQ(config.sandbox.docker_host, "unix:///var/run/docker.sock");
    EXPECT_EQ(config.sandbox.workspace_root, "~/.threatweaver/workspace");
    EXPECT_EQ(config.sandbox.worker_threads, 8);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoaderTest, ReadsJsonFile) {
    const auto path = WriteConfig(R"({
        "sandbox": {
            "provider": "e2b",
            "e2b": {"apiKey": "e2b_file_key", "templateId": "tw-scanner", "domain": "sandbox.internal", "useProxy": false},
            "cpuLimit": 4.5,
            "memoryLimit": 8192,
            "timeout": 600,
            "networkIsolated": false,
            "workspaceRoot": "/srv/scans",
            "workerThreads": 3
        },
        "logging": {"level": "debug"}
    })");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.e2b.api_key, "e2b_file_key");
    EXPECT_EQ(config.sandbox.e2b.template_id, "tw-scanner");
    EXPECT_EQ(config.sandbox.e2b.domain, "sandbox.internal");
    EXPECT_FALSE(config.sandbox.e2b.use_proxy);
    EXPECT_DOUBLE_EQ(config.sandbox.cpu_limit, 4.5);
    EXPECT_EQ(config.sandbox.memory_limit, 8192);
    EXPECT_EQ(config.sandbox.timeout, 600);
    EXPECT_FALSE(config.sandbox.network_isolated);
    EXPECT_EQ(config.sandbox.workspace_root, "/srv/scans");
    EXPECT_EQ(config.sandbox.worker_threads, 3);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    const auto path = WriteConfig("{ \"sandbox\": ");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.provider, "e2b");
    EXPECT_EQ(config.sandbox.timeout, 3600);
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"timeout": "soon", "provider": 7}})"));
    EXPECT_EQ(config.sandbox.timeout, 3600);
    EXPECT_EQ(config.sandbox.provider, "e2b");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteConfig(R"({"sandbox": {"timeout": 600, "e2b": {"apiKey": "from-file"}}})");
    ::setenv("E2B_API_KEY", "from-env", 1);
    ::setenv("SANDBOX_TIMEOUT", "120", 1);
    ::setenv("SANDBOX_PROVIDER", "docker", 1);
    ::setenv("E2B_TEMPLATE_ID", "custom", 1);
    ::setenv("SANDBOX_CPU_LIMIT", "0.5", 1);
    ::setenv("SANDBOX_NETWORK_ISOLATED", "false", 1);
    ::setenv("THREATWEAVER_LOG_LEVEL", "warn", 1);

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.e2b.api_key, "from-env");
    EXPECT_EQ(config.sandbox.timeout, 120);
    EXPECT_EQ(config.sandbox.provider, "docker");
    EXPECT_EQ(config.sandbox.e2b.template_id, "custom");
    EXPECT_DOUBLE_EQ(config.sandbox.cpu_limit, 0.5);
    EXPECT_FALSE(config.sandbox.network_isolated);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, MalformedNumbersKeepPreviousValue) {
    ::setenv("SANDBOX_MEMORY_LIMIT", "lots", 1);
    ::setenv("SANDBOX_WORKER_THREADS", "", 1);
    Config config{};
    config.sandbox.memory_limit = 2048;
    ApplyConfigFromEnv(config);
    EXPECT_EQ(config.sandbox.memory_limit, 2048);
    EXPECT_EQ(config.sandbox.worker_threads, 8);
}

TEST_F(ConfigLoaderTest, ResolvesHomeRelativeWorkspace) {
    ::setenv("HOME", "/home/analyst", 1);
    Config config{};
    EXPECT_EQ(ResolveWorkspaceRoot(config.sandbox), fs::path("/home/analyst/.threatweaver/workspace"));
    config.sandbox.workspace_root = "/srv/scans";
    EXPECT_EQ(ResolveWorkspaceRoot(config.sandbox), fs::path("/srv/scans"));
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    using threatweaver::utils::LogLevel;
    using threatweaver::utils::ParseLogLevel;
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("verbose", LogLevel::kError), LogLevel::kError);
}

}  // namespace
