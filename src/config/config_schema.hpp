#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codeloop::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    ProviderConfig gemini;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
};

struct GeneratorConfig {
    std::string model = "gpt-4o-mini";
    int max_tokens = 8192;
    double temperature = 0.4;
    int request_timeout_s = 180;
    // Ask OpenAI-style endpoints for a JSON object reply.
    bool json_mode = true;
};

struct SandboxConfig {
    std::string runtime = "docker";
    std::string image = "codeloop-python:3.12";
    std::string recipe_path;
    std::string mount_path = "/app";
    std::string workspace_root;
    std::string workspace_prefix = "codeloop_ws_";
    std::string instance_prefix = "codeloop-";
    std::vector<std::string> command = {"python3", "main.py"};
    int timeout_s = 30;
    int build_timeout_s = 900;
    std::size_t output_cap_bytes = 64 * 1024;
    std::string memory_limit = "512m";
    int pids_limit = 128;
    double cpus = 1.0;
    bool map_host_user = true;
};

inline std::vector<std::string> DefaultStderrErrorPatterns() {
    return {
        R"(Traceback \(most recent call last\))",
        R"(^\s*[A-Za-z_][A-Za-z0-9_.]*(Error|Exception)(:|$))",
        R"(^(FATAL|Fatal error|panic):)"
    };
}

struct OrchestratorConfig {
    int max_attempts = 5;
    int max_generation_retries = 2;
    int max_infrastructure_retries = 2;
    std::vector<std::string> stderr_error_patterns = DefaultStderrErrorPatterns();
};

struct StorageConfig {
    std::string data_dir = "~/.codeloop";
    bool save_artifacts = true;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    OrchestratorConfig orchestrator;
    GeneratorConfig generator;
    ProvidersConfig providers;
    StorageConfig storage;
    LoggingConfig logging;
};

}  // namespace codeloop::config
