#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/config_loader.hpp"
#include "sandbox/workspace.hpp"

using codeloop::config::LoadConfigFromPath;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path WriteConfig(const std::string& text) {
        const auto path = dir_.Path() / "config.json";
        std::ofstream output(path, std::ios::trunc);
        output << text;
        return path;
    }

    static constexpr const char* kVariables[] = {
        "CODELOOP_SANDBOX__IMAGE",
        "CODELOOP_SANDBOX_TIMEOUT_S",
        "CODELOOP_SANDBOX__COMMAND",
        "CODELOOP_ORCHESTRATOR__MAX_ATTEMPTS",
        "CODELOOP_PROVIDERS__OPENAI__API_KEY",
        "CODELOOP_STORAGE__SAVE_ARTIFACTS",
        "CODELOOP_LOG_LEVEL",
    };

    codeloop::sandbox::Workspace dir_ = codeloop::sandbox::Workspace::Create({}, "codeloop_config_");
};

}  // namespace

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    const auto config = LoadConfigFromPath(dir_.Path() / "absent.json");
    EXPECT_EQ(config.sandbox.image, "codeloop-python:3.12");
    EXPECT_EQ(config.sandbox.mount_path, "/app");
    EXPECT_EQ(config.sandbox.command, (std::vector<std::string>{"python3", "main.py"}));
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_EQ(config.sandbox.output_cap_bytes, 65536u);
    EXPECT_EQ(config.orchestrator.max_attempts, 5);
    EXPECT_EQ(config.orchestrator.max_generation_retries, 2);
    EXPECT_EQ(config.orchestrator.max_infrastructure_retries, 2);
    EXPECT_EQ(config.orchestrator.stderr_error_patterns.size(), 3u);
    EXPECT_TRUE(config.storage.save_artifacts);
}

TEST_F(ConfigLoaderTest, ReadsCamelCaseJson) {
    const auto path = WriteConfig(R"({
        "sandbox": {
            "image": "my-python:1",
            "command": ["python3", "-m", "pytest", "-q"],
            "timeoutS": 12,
            "outputCapBytes": 4096,
            "memoryLimit": "1g",
            "pidsLimit": 32,
            "cpus": 0.5,
            "mapHostUser": false
        },
        "orchestrator": {
            "maxAttempts": 3,
            "maxInfrastructureRetries": 0,
            "stderrErrorPatterns": ["^boom"]
        },
        "generator": {"model": "claude-3-5-sonnet", "maxTokens": 2048, "temperature": 0.1},
        "providers": {"anthropic": {"apiKey": "sk-ant", "apiBase": "https://example.test"}},
        "storage": {"dataDir": "/var/lib/codeloop", "saveArtifacts": false},
        "logging": {"level": "debug"}
    })");

    const auto config = LoadConfigFromPath(path);
    EXPECT_EQ(config.sandbox.image, "my-python:1");
    EXPECT_EQ(config.sandbox.command, (std::vector<std::string>{"python3", "-m", "pytest", "-q"}));
    EXPECT_EQ(config.sandbox.timeout_s, 12);
    EXPECT_EQ(config.sandbox.output_cap_bytes, 4096u);
    EXPECT_EQ(config.sandbox.memory_limit, "1g");
    EXPECT_EQ(config.sandbox.pids_limit, 32);
    EXPECT_DOUBLE_EQ(config.sandbox.cpus, 0.5);
    EXPECT_FALSE(config.sandbox.map_host_user);
    EXPECT_EQ(config.orchestrator.max_attempts, 3);
    EXPECT_EQ(config.orchestrator.max_infrastructure_retries, 0);
    EXPECT_EQ(config.orchestrator.stderr_error_patterns, (std::vector<std::string>{"^boom"}));
    EXPECT_EQ(config.generator.model, "claude-3-5-sonnet");
    EXPECT_EQ(config.generator.max_tokens, 2048);
    EXPECT_EQ(config.providers.anthropic.api_key, "sk-ant");
    EXPECT_EQ(config.providers.anthropic.api_base, "https://example.test");
    EXPECT_EQ(config.storage.data_dir, "/var/lib/codeloop");
    EXPECT_FALSE(config.storage.save_artifacts);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, InvalidJsonKeepsDefaults) {
    const auto path = WriteConfig("{ \"sandbox\": { \"image\": ");
    const auto config = LoadConfigFromPath(path);
    EXPECT_EQ(config.sandbox.image, "codeloop-python:3.12");
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    const auto path = WriteConfig(R"({"sandbox": {"timeoutS": "ten", "command": []}})");
    const auto config = LoadConfigFromPath(path);
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_EQ(config.sandbox.command, (std::vector<std::string>{"python3", "main.py"}));
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteConfig(R"({"sandbox": {"image": "from-file:1", "timeoutS": 12}})");
    ::setenv("CODELOOP_SANDBOX__IMAGE", "from-env:2", 1);
    ::setenv("CODELOOP_SANDBOX_TIMEOUT_S", "45", 1);
    ::setenv("CODELOOP_SANDBOX__COMMAND", "python3 -u main.py", 1);
    ::setenv("CODELOOP_ORCHESTRATOR__MAX_ATTEMPTS", "7", 1);
    ::setenv("CODELOOP_PROVIDERS__OPENAI__API_KEY", "sk-env", 1);
    ::setenv("CODELOOP_STORAGE__SAVE_ARTIFACTS", "no", 1);
    ::setenv("CODELOOP_LOG_LEVEL", "warn", 1);

    const auto config = LoadConfigFromPath(path);
    EXPECT_EQ(config.sandbox.image, "from-env:2");
    EXPECT_EQ(config.sandbox.timeout_s, 45);
    EXPECT_EQ(config.sandbox.command, (std::vector<std::string>{"python3", "-u", "main.py"}));
    EXPECT_EQ(config.orchestrator.max_attempts, 7);
    EXPECT_EQ(config.providers.openai.api_key, "sk-env");
    EXPECT_FALSE(config.storage.save_artifacts);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, NonNumericEnvironmentValueKeepsCurrent) {
    ::setenv("CODELOOP_ORCHESTRATOR__MAX_ATTEMPTS", "many", 1);
    const auto config = LoadConfigFromPath(dir_.Path() / "absent.json");
    EXPECT_EQ(config.orchestrator.max_attempts, 5);
}

TEST_F(ConfigLoaderTest, NonPositiveLimitsFallBackToDefaults) {
    const auto path = WriteConfig(R"({
        "sandbox": {"timeoutS": 0, "buildTimeoutS": -5, "outputCapBytes": -1},
        "orchestrator": {"maxAttempts": 0},
        "generator": {"requestTimeoutS": -1}
    })");
    const auto config = LoadConfigFromPath(path);
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_EQ(config.sandbox.build_timeout_s, 900);
    EXPECT_EQ(config.sandbox.output_cap_bytes, 65536u);
    EXPECT_EQ(config.orchestrator.max_attempts, 5);
    EXPECT_EQ(config.generator.request_timeout_s, 180);

    const auto zero_cap = LoadConfigFromPath(WriteConfig(R"({"sandbox": {"outputCapBytes": 0}})"));
    EXPECT_EQ(zero_cap.sandbox.output_cap_bytes, 65536u);
}

TEST_F(ConfigLoaderTest, ZeroTimeoutFromEnvironmentIsRejected) {
    ::setenv("CODELOOP_SANDBOX_TIMEOUT_S", "0", 1);
    const auto config = LoadConfigFromPath(dir_.Path() / "absent.json");
    EXPECT_EQ(config.sandbox.timeout_s, 30);
}
