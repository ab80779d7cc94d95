#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "providers/llm_provider.hpp"

namespace codeloop::providers {

enum class ChatStyle {
    kOpenAI,     // POST <base>/chat/completions
    kAnthropic   // POST <base>/messages
};

struct ChatEndpoint {
    ChatStyle style = ChatStyle::kOpenAI;
    // "https://host:443"
    std::string origin;
    // "/v1/chat/completions"
    std::string path;
};

// One blocking HTTPS call per Chat() through cpp-httplib.
class HttpChatProvider : public LLMProvider {
public:
    explicit HttpChatProvider(ProviderSettings settings);

    LLMResponse Chat(const ChatRequest& request) override;
    std::string GetDefaultModel() const override { return settings_.model; }

    static ChatEndpoint ResolveEndpoint(const ProviderSettings& settings, const std::string& model);
    static nlohmann::json BuildPayload(ChatStyle style, const ChatRequest& request, const std::string& model);
    static LLMResponse ParseResponse(ChatStyle style, const std::string& body);

private:
    ProviderSettings settings_;
};

}  // namespace codeloop::providers
