#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::config {
namespace {

using codeloop::utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

std::vector<std::string> ReadStringArray(const nlohmann::json& source) {
    std::vector<std::string> items;
    for (const auto& item : source) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

void ApplySandboxConfig(SandboxConfig& sandbox, const nlohmann::json& data) {
    if (data.contains("runtime") && data["runtime"].is_string()) {
        sandbox.runtime = data["runtime"].get<std::string>();
    }
    if (data.contains("image") && data["image"].is_string()) {
        sandbox.image = data["image"].get<std::string>();
    }
    if (data.contains("recipePath") && data["recipePath"].is_string()) {
        sandbox.recipe_path = data["recipePath"].get<std::string>();
    }
    if (data.contains("mountPath") && data["mountPath"].is_string()) {
        sandbox.mount_path = data["mountPath"].get<std::string>();
    }
    if (data.contains("workspaceRoot") && data["workspaceRoot"].is_string()) {
        sandbox.workspace_root = data["workspaceRoot"].get<std::string>();
    }
    if (data.contains("command") && data["command"].is_array()) {
        auto command = ReadStringArray(data["command"]);
        if (!command.empty()) {
            sandbox.command = std::move(command);
        }
    }
    if (data.contains("timeoutS") && data["timeoutS"].is_number_integer()) {
        sandbox.timeout_s = data["timeoutS"].get<int>();
    }
    if (data.contains("buildTimeoutS") && data["buildTimeoutS"].is_number_integer()) {
        sandbox.build_timeout_s = data["buildTimeoutS"].get<int>();
    }
    if (data.contains("outputCapBytes") && data["outputCapBytes"].is_number_integer()) {
        const auto cap = data["outputCapBytes"].get<long long>();
        if (cap > 0) {
            sandbox.output_cap_bytes = static_cast<std::size_t>(cap);
        } else {
            codeloop::utils::LogWarn("config", "sandbox.outputCapBytes must be positive, keeping " +
                                                   std::to_string(sandbox.output_cap_bytes));
        }
    }
    if (data.contains("memoryLimit") && data["memoryLimit"].is_string()) {
        sandbox.memory_limit = data["memoryLimit"].get<std::string>();
    }
    if (data.contains("pidsLimit") && data["pidsLimit"].is_number_integer()) {
        sandbox.pids_limit = data["pidsLimit"].get<int>();
    }
    if (data.contains("cpus") && data["cpus"].is_number()) {
        sandbox.cpus = data["cpus"].get<double>();
    }
    if (data.contains("mapHostUser") && data["mapHostUser"].is_boolean()) {
        sandbox.map_host_user = data["mapHostUser"].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }

    if (data.contains("orchestrator") && data["orchestrator"].is_object()) {
        const auto& orchestrator = data["orchestrator"];
        if (orchestrator.contains("maxAttempts") && orchestrator["maxAttempts"].is_number_integer()) {
            config.orchestrator.max_attempts = orchestrator["maxAttempts"].get<int>();
        }
        if (orchestrator.contains("maxGenerationRetries") &&
            orchestrator["maxGenerationRetries"].is_number_integer()) {
            config.orchestrator.max_generation_retries = orchestrator["maxGenerationRetries"].get<int>();
        }
        if (orchestrator.contains("maxInfrastructureRetries") &&
            orchestrator["maxInfrastructureRetries"].is_number_integer()) {
            config.orchestrator.max_infrastructure_retries =
                orchestrator["maxInfrastructureRetries"].get<int>();
        }
        if (orchestrator.contains("stderrErrorPatterns") && orchestrator["stderrErrorPatterns"].is_array()) {
            config.orchestrator.stderr_error_patterns = ReadStringArray(orchestrator["stderrErrorPatterns"]);
        }
    }

    if (data.contains("generator") && data["generator"].is_object()) {
        const auto& generator = data["generator"];
        if (generator.contains("model") && generator["model"].is_string()) {
            config.generator.model = generator["model"].get<std::string>();
        }
        if (generator.contains("maxTokens") && generator["maxTokens"].is_number_integer()) {
            config.generator.max_tokens = generator["maxTokens"].get<int>();
        }
        if (generator.contains("temperature") && generator["temperature"].is_number()) {
            config.generator.temperature = generator["temperature"].get<double>();
        }
        if (generator.contains("requestTimeoutS") && generator["requestTimeoutS"].is_number_integer()) {
            config.generator.request_timeout_s = generator["requestTimeoutS"].get<int>();
        }
        if (generator.contains("jsonMode") && generator["jsonMode"].is_boolean()) {
            config.generator.json_mode = generator["jsonMode"].get<bool>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("gemini")) {
            ApplyProviderConfig(config.providers.gemini, providers["gemini"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        const auto& storage = data["storage"];
        if (storage.contains("dataDir") && storage["dataDir"].is_string()) {
            config.storage.data_dir = storage["dataDir"].get<std::string>();
        }
        if (storage.contains("saveArtifacts") && storage["saveArtifacts"].is_boolean()) {
            config.storage.save_artifacts = storage["saveArtifacts"].get<bool>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = codeloop::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        codeloop::utils::LogWarn("config", "ignoring non-integer value: " + value);
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        codeloop::utils::LogWarn("config", "ignoring non-numeric value: " + value);
        return fallback;
    }
}

// Commands in the environment are whitespace separated; quoting is not supported.
std::vector<std::string> SplitWords(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

void ApplyEnvOverrides(Config& config) {
    const auto runtime = GetEnvFallback("CODELOOP_SANDBOX__RUNTIME", "CODELOOP_SANDBOX_RUNTIME");
    if (!runtime.empty()) {
        config.sandbox.runtime = runtime;
    }

    const auto image = GetEnvFallback("CODELOOP_SANDBOX__IMAGE", "CODELOOP_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto recipe = GetEnvFallback("CODELOOP_SANDBOX__RECIPE_PATH", "CODELOOP_SANDBOX_RECIPE_PATH");
    if (!recipe.empty()) {
        config.sandbox.recipe_path = recipe;
    }

    const auto workspace_root = GetEnvFallback(
        "CODELOOP_SANDBOX__WORKSPACE_ROOT",
        "CODELOOP_SANDBOX_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        config.sandbox.workspace_root = workspace_root;
    }

    const auto command = GetEnvFallback("CODELOOP_SANDBOX__COMMAND", "CODELOOP_SANDBOX_COMMAND");
    if (!command.empty()) {
        auto words = SplitWords(command);
        if (!words.empty()) {
            config.sandbox.command = std::move(words);
        }
    }

    const auto timeout = GetEnvFallback("CODELOOP_SANDBOX__TIMEOUT_S", "CODELOOP_SANDBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto output_cap = GetEnvFallback(
        "CODELOOP_SANDBOX__OUTPUT_CAP_BYTES",
        "CODELOOP_SANDBOX_OUTPUT_CAP_BYTES");
    if (!output_cap.empty()) {
        const auto value = ParseInt(output_cap, static_cast<int>(config.sandbox.output_cap_bytes));
        if (value > 0) {
            config.sandbox.output_cap_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto max_attempts = GetEnvFallback(
        "CODELOOP_ORCHESTRATOR__MAX_ATTEMPTS",
        "CODELOOP_MAX_ATTEMPTS");
    if (!max_attempts.empty()) {
        config.orchestrator.max_attempts = ParseInt(max_attempts, config.orchestrator.max_attempts);
    }

    const auto model = GetEnvFallback("CODELOOP_GENERATOR__MODEL", "CODELOOP_MODEL");
    if (!model.empty()) {
        config.generator.model = model;
    }

    const auto max_tokens = GetEnvFallback("CODELOOP_GENERATOR__MAX_TOKENS", "CODELOOP_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.generator.max_tokens = ParseInt(max_tokens, config.generator.max_tokens);
    }

    const auto temperature = GetEnvFallback("CODELOOP_GENERATOR__TEMPERATURE", "CODELOOP_TEMPERATURE");
    if (!temperature.empty()) {
        config.generator.temperature = ParseDouble(temperature, config.generator.temperature);
    }

    const auto request_timeout = GetEnvFallback(
        "CODELOOP_GENERATOR__REQUEST_TIMEOUT_S", "CODELOOP_REQUEST_TIMEOUT_S");
    if (!request_timeout.empty()) {
        config.generator.request_timeout_s = ParseInt(request_timeout, config.generator.request_timeout_s);
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "CODELOOP_PROVIDERS__USE_PROXY_FOR_LLM",
        "CODELOOP_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    struct ProviderEnv {
        ProviderConfig* target;
        const char* key_primary;
        const char* key_secondary;
        const char* base_primary;
        const char* base_secondary;
    };
    const ProviderEnv provider_envs[] = {
        {&config.providers.anthropic,
         "CODELOOP_PROVIDERS__ANTHROPIC__API_KEY", "ANTHROPIC_API_KEY",
         "CODELOOP_PROVIDERS__ANTHROPIC__API_BASE", "CODELOOP_PROVIDERS_ANTHROPIC_API_BASE"},
        {&config.providers.openai,
         "CODELOOP_PROVIDERS__OPENAI__API_KEY", "OPENAI_API_KEY",
         "CODELOOP_PROVIDERS__OPENAI__API_BASE", "CODELOOP_PROVIDERS_OPENAI_API_BASE"},
        {&config.providers.openrouter,
         "CODELOOP_PROVIDERS__OPENROUTER__API_KEY", "OPENROUTER_API_KEY",
         "CODELOOP_PROVIDERS__OPENROUTER__API_BASE", "CODELOOP_PROVIDERS_OPENROUTER_API_BASE"},
        {&config.providers.gemini,
         "CODELOOP_PROVIDERS__GEMINI__API_KEY", "GEMINI_API_KEY",
         "CODELOOP_PROVIDERS__GEMINI__API_BASE", "CODELOOP_PROVIDERS_GEMINI_API_BASE"},
        {&config.providers.vllm,
         "CODELOOP_PROVIDERS__VLLM__API_KEY", "CODELOOP_PROVIDERS_VLLM_API_KEY",
         "CODELOOP_PROVIDERS__VLLM__API_BASE", "CODELOOP_PROVIDERS_VLLM_API_BASE"},
    };
    for (const auto& env : provider_envs) {
        const auto key = GetEnvFallback(env.key_primary, env.key_secondary);
        if (!key.empty()) {
            env.target->api_key = key;
        }
        const auto base = GetEnvFallback(env.base_primary, env.base_secondary);
        if (!base.empty()) {
            env.target->api_base = base;
        }
    }

    const auto data_dir = GetEnvFallback("CODELOOP_STORAGE__DATA_DIR", "CODELOOP_DATA_DIR");
    if (!data_dir.empty()) {
        config.storage.data_dir = data_dir;
    }

    const auto save_artifacts = GetEnvFallback(
        "CODELOOP_STORAGE__SAVE_ARTIFACTS",
        "CODELOOP_SAVE_ARTIFACTS");
    if (!save_artifacts.empty()) {
        config.storage.save_artifacts = ParseBool(save_artifacts);
    }

    const auto log_level = GetEnvFallback("CODELOOP_LOGGING__LEVEL", "CODELOOP_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

// A non-positive value would disable a deadline or a bound; those fall back
// to the defaults.
void ClampLimits(Config& config) {
    const Config defaults{};
    const auto require_positive = [](int& value, int fallback, const char* name) {
        if (value <= 0) {
            codeloop::utils::LogWarn("config", std::string(name) + " must be positive, using " +
                                                   std::to_string(fallback));
            value = fallback;
        }
    };
    require_positive(config.sandbox.timeout_s, defaults.sandbox.timeout_s, "sandbox.timeoutS");
    require_positive(config.sandbox.build_timeout_s, defaults.sandbox.build_timeout_s, "sandbox.buildTimeoutS");
    require_positive(config.generator.request_timeout_s, defaults.generator.request_timeout_s,
                     "generator.requestTimeoutS");
    require_positive(config.orchestrator.max_attempts, defaults.orchestrator.max_attempts,
                     "orchestrator.maxAttempts");
    if (config.sandbox.output_cap_bytes == 0) {
        codeloop::utils::LogWarn("config", "sandbox.outputCapBytes must be positive, using " +
                                               std::to_string(defaults.sandbox.output_cap_bytes));
        config.sandbox.output_cap_bytes = defaults.sandbox.output_cap_bytes;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("CODELOOP_CONFIG");
    if (!explicit_path.empty()) {
        return codeloop::utils::ExpandHome(explicit_path);
    }
    return codeloop::utils::GetHomePath() / ".codeloop" / "config.json";
}

Config LoadConfigFromPath(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            // Keep defaults on parse errors
            codeloop::utils::LogWarn(
                "config",
                "failed to parse " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvOverrides(config);
    ClampLimits(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromPath(DefaultConfigPath());
}

}  // namespace codeloop::config
