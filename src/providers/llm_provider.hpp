#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace codeloop::providers {

struct Message {
    std::string role;
    std::string content;
};

struct ChatRequest {
    std::vector<Message> messages;
    // Empty means the provider default.
    std::string model;
    int max_tokens = 8192;
    double temperature = 0.4;
    // Reply must be a single JSON object.
    bool json_output = false;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
    // The model stopped at max_tokens; a JSON reply is probably cut off.
    bool IsTruncated() const { return finish_reason == "length" || finish_reason == "max_tokens"; }
};

// Transport and HTTP failures come back as IsError() responses, not exceptions.
class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(const ChatRequest& request) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

struct ProviderSettings {
    std::string name;
    std::string api_key;
    std::string api_base;
    std::string model;
    std::chrono::seconds request_timeout{180};
    bool use_proxy_for_llm = false;
};

// First configured of openrouter, anthropic, openai, gemini, vllm.
ProviderSettings ResolveProviderSettings(const codeloop::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const codeloop::config::Config& config);

}  // namespace codeloop::providers
