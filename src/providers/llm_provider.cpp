#include "providers/llm_provider.hpp"

#include "providers/chat_provider.hpp"

namespace codeloop::providers {
namespace {

struct NamedProvider {
    const char* name;
    const codeloop::config::ProviderConfig* config;
    const char* default_base;
};

}  // namespace

ProviderSettings ResolveProviderSettings(const codeloop::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.generator.model.empty() ? "gpt-4o-mini" : config.generator.model;
    settings.request_timeout = std::chrono::seconds(config.generator.request_timeout_s > 0
        ? config.generator.request_timeout_s
        : 180);
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;

    const NamedProvider candidates[] = {
        {"openrouter", &config.providers.openrouter, "https://openrouter.ai/api/v1"},
        {"anthropic", &config.providers.anthropic, ""},
        {"openai", &config.providers.openai, ""},
        {"gemini", &config.providers.gemini, "https://generativelanguage.googleapis.com/v1beta/openai"},
    };
    for (const auto& candidate : candidates) {
        if (candidate.config->api_key.empty()) {
            continue;
        }
        settings.name = candidate.name;
        settings.api_key = candidate.config->api_key;
        settings.api_base = candidate.config->api_base.empty() ? candidate.default_base : candidate.config->api_base;
        return settings;
    }

    // A local vLLM server may run without a key.
    const auto& vllm = config.providers.vllm;
    if (!vllm.api_key.empty() || !vllm.api_base.empty()) {
        settings.name = "vllm";
        settings.api_key = vllm.api_key;
        settings.api_base = vllm.api_base;
    }
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const codeloop::config::Config& config) {
    return std::make_unique<HttpChatProvider>(ResolveProviderSettings(config));
}

}  // namespace codeloop::providers
