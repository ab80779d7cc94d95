#include "providers/chat_provider.hpp"

#include <stdexcept>

#include <httplib.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::providers {
namespace {

using codeloop::utils::GetEnv;
using codeloop::utils::ToLower;

constexpr const char* kAnthropicBase = "https://api.anthropic.com/v1";
constexpr const char* kOpenAIBase = "https://api.openai.com/v1";
constexpr const char* kAnthropicVersion = "2023-06-01";

LLMResponse ErrorResponse(const std::string& message) {
    LLMResponse response{};
    response.content = message;
    response.finish_reason = "error";
    return response;
}

// "http[s]://host[:port][/base]" -> origin and base path without a trailing slash.
void SplitUrl(const std::string& url, std::string& origin, std::string& base_path) {
    std::string rest = url;
    bool https = true;
    if (rest.rfind("https://", 0) == 0) {
        rest = rest.substr(8);
    } else if (rest.rfind("http://", 0) == 0) {
        https = false;
        rest = rest.substr(7);
    }

    std::string authority = rest;
    base_path.clear();
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        base_path = rest.substr(slash);
    }
    while (!base_path.empty() && base_path.back() == '/') {
        base_path.pop_back();
    }

    std::string host = authority;
    int port = https ? 443 : 80;
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        host = authority.substr(0, colon);
        port = std::stoi(authority.substr(colon + 1));
    }
    if (host.empty()) {
        throw std::invalid_argument("api base without a host: " + url);
    }
    origin = (https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

bool ProxyFromEnv(std::string& host, int& port) {
    const char* names[] = {"HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"};
    for (const auto* name : names) {
        auto value = GetEnv(name);
        if (value.empty()) {
            continue;
        }
        const auto scheme = value.find("://");
        if (scheme != std::string::npos) {
            value = value.substr(scheme + 3);
        }
        value = value.substr(0, value.find('/'));
        const auto colon = value.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            continue;
        }
        try {
            port = std::stoi(value.substr(colon + 1));
        } catch (const std::exception&) {
            continue;
        }
        host = value.substr(0, colon);
        if (port > 0) {
            return true;
        }
    }
    return false;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return key.empty() ? "(none)" : "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

// {"error": {"message": ...}} from either API, or the raw body.
std::string ErrorDetail(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("error")) {
        const auto& error = json["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        if (error.is_string()) {
            return error.get<std::string>();
        }
    }
    return body.substr(0, 300);
}

int UsageValue(const nlohmann::json& usage, const char* key) {
    return usage.contains(key) && usage[key].is_number_integer() ? usage[key].get<int>() : 0;
}

}  // namespace

HttpChatProvider::HttpChatProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

ChatEndpoint HttpChatProvider::ResolveEndpoint(const ProviderSettings& settings, const std::string& model) {
    ChatEndpoint endpoint{};
    const auto base_lower = ToLower(settings.api_base);
    bool anthropic = settings.name == "anthropic" || base_lower.find("anthropic.com") != std::string::npos;
    if (settings.name.empty() && settings.api_base.empty()) {
        anthropic = ToLower(model).find("claude") != std::string::npos;
    }
    endpoint.style = anthropic ? ChatStyle::kAnthropic : ChatStyle::kOpenAI;

    std::string base = settings.api_base;
    if (base.empty()) {
        base = anthropic ? kAnthropicBase : kOpenAIBase;
    }
    std::string base_path;
    SplitUrl(base, endpoint.origin, base_path);
    endpoint.path = base_path + (anthropic ? "/messages" : "/chat/completions");
    return endpoint;
}

nlohmann::json HttpChatProvider::BuildPayload(ChatStyle style, const ChatRequest& request, const std::string& model) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = request.max_tokens;
    payload["temperature"] = request.temperature;
    payload["messages"] = nlohmann::json::array();

    if (style == ChatStyle::kAnthropic) {
        // No response-format switch here; the system prompt carries the format.
        std::string system;
        for (const auto& message : request.messages) {
            if (message.role == "system") {
                system += system.empty() ? message.content : "\n" + message.content;
            } else {
                payload["messages"].push_back({{"role", message.role}, {"content", message.content}});
            }
        }
        if (!system.empty()) {
            payload["system"] = system;
        }
        return payload;
    }

    for (const auto& message : request.messages) {
        payload["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }
    if (request.json_output) {
        payload["response_format"] = {{"type", "json_object"}};
    }
    return payload;
}

LLMResponse HttpChatProvider::ParseResponse(ChatStyle style, const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return ErrorResponse("invalid response body");
    }

    LLMResponse response{};
    if (style == ChatStyle::kAnthropic) {
        if (!json.contains("content") || !json["content"].is_array()) {
            return ErrorResponse("response without content blocks");
        }
        for (const auto& block : json["content"]) {
            if (block.is_object() && block.contains("type") && block["type"] == "text" &&
                block.contains("text") && block["text"].is_string()) {
                response.content += block["text"].get<std::string>();
            }
        }
        if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
            response.finish_reason = json["stop_reason"].get<std::string>();
        }
        if (json.contains("usage") && json["usage"].is_object()) {
            const int input = UsageValue(json["usage"], "input_tokens");
            const int output = UsageValue(json["usage"], "output_tokens");
            response.usage["prompt_tokens"] = input;
            response.usage["completion_tokens"] = output;
            response.usage["total_tokens"] = input + output;
        }
        return response;
    }

    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return ErrorResponse("response without choices");
    }
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].is_object()) {
        const auto& message = choice["message"];
        if (message.contains("content") && message["content"].is_string()) {
            response.content = message["content"].get<std::string>();
        }
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        response.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        const auto& usage = json["usage"];
        response.usage["prompt_tokens"] = UsageValue(usage, "prompt_tokens");
        response.usage["completion_tokens"] = UsageValue(usage, "completion_tokens");
        response.usage["total_tokens"] = UsageValue(usage, "total_tokens");
    }
    return response;
}

LLMResponse HttpChatProvider::Chat(const ChatRequest& request) {
    const auto model = request.model.empty() ? settings_.model : request.model;
    ChatEndpoint endpoint{};
    try {
        endpoint = ResolveEndpoint(settings_, model);
    } catch (const std::exception& ex) {
        codeloop::utils::LogError("llm", std::string("bad api base: ") + ex.what());
        return ErrorResponse(std::string("bad api base: ") + ex.what());
    }
    const bool anthropic = endpoint.style == ChatStyle::kAnthropic;

    httplib::Client client(endpoint.origin);
    client.set_connection_timeout(30);
    client.set_read_timeout(static_cast<time_t>(settings_.request_timeout.count()));
    client.set_write_timeout(30);
    if (settings_.use_proxy_for_llm) {
        std::string proxy_host;
        int proxy_port = 0;
        if (ProxyFromEnv(proxy_host, proxy_port)) {
            client.set_proxy(proxy_host, proxy_port);
        }
    }

    httplib::Headers headers;
    if (!settings_.api_key.empty()) {
        if (anthropic) {
            headers.emplace("x-api-key", settings_.api_key);
        } else {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }
    }
    if (anthropic) {
        headers.emplace("anthropic-version", kAnthropicVersion);
    }

    codeloop::utils::LogDebug("llm", "POST " + endpoint.origin + endpoint.path + " model=" + model +
                                         " key=" + MaskKey(settings_.api_key));
    const auto payload = BuildPayload(endpoint.style, request, model)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto result = client.Post(endpoint.path, headers, payload, "application/json");
    if (!result) {
        const auto reason = httplib::to_string(result.error());
        codeloop::utils::LogError("llm", "request to " + endpoint.origin + " failed: " + reason);
        return ErrorResponse("request failed: " + reason);
    }
    if (result->status >= 400) {
        const auto detail = ErrorDetail(result->body);
        codeloop::utils::LogError("llm", "HTTP " + std::to_string(result->status) + ": " + detail);
        return ErrorResponse("HTTP " + std::to_string(result->status) + ": " + detail);
    }

    auto response = ParseResponse(endpoint.style, result->body);
    if (!response.IsError() && response.usage.count("total_tokens") > 0) {
        codeloop::utils::LogDebug("llm", "tokens used: " + std::to_string(response.usage["total_tokens"]));
    }
    return response;
}

}  // namespace codeloop::providers
