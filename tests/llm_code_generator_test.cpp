#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "generator/llm_code_generator.hpp"

using codeloop::generator::GenerationError;
using codeloop::generator::GenerationRequest;
using codeloop::generator::LlmCodeGenerator;
using codeloop::providers::LLMResponse;

namespace {

class CannedProvider : public codeloop::providers::LLMProvider {
public:
    LLMResponse Chat(const codeloop::providers::ChatRequest& request) override {
        last_request = request;
        return response;
    }

    std::string GetDefaultModel() const override { return "default-model"; }

    LLMResponse response;
    codeloop::providers::ChatRequest last_request;
};

GenerationRequest InitialRequest() {
    GenerationRequest request{};
    request.objective = "sum two numbers";
    request.constraints = {"no third-party packages"};
    request.command = {"python3", "main.py"};
    return request;
}

}  // namespace

TEST(LlmCodeGeneratorTest, ParsesBareJson) {
    const auto files = LlmCodeGenerator::ParseReply(
        R"({"files": [{"relative_path": "main.py", "content": "print(1 + 2)\n"}]})");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relative_path, "main.py");
    EXPECT_EQ(files[0].content, "print(1 + 2)\n");
}

TEST(LlmCodeGeneratorTest, ParsesFencedJsonWithProse) {
    const std::string reply =
        "Here is the program:\n"
        "```json\n"
        "{\"files\": [{\"relative_path\": \"main.py\", \"content\": \"import util\\n\"},\n"
        "             {\"relative_path\": \"util.py\", \"content\": \"X = 1\\n\"}]}\n"
        "```\n"
        "Let me know if it works.";
    const auto files = LlmCodeGenerator::ParseReply(reply);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[1].relative_path, "util.py");
    EXPECT_EQ(files[1].content, "X = 1\n");
}

TEST(LlmCodeGeneratorTest, ExtractsObjectFromSurroundingText) {
    const auto files = LlmCodeGenerator::ParseReply(
        "Sure! {\"files\": [{\"relative_path\": \"a.py\", \"content\": \"\"}]} Done.");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relative_path, "a.py");
    EXPECT_TRUE(files[0].content.empty());
}

TEST(LlmCodeGeneratorTest, MalformedRepliesAreGenerationErrors) {
    EXPECT_THROW(LlmCodeGenerator::ParseReply("I cannot help with that."), GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply("{\"files\": "), GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"json({"code": "print(1)"})json"), GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"({"files": []})"), GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"({"files": ["main.py"]})"), GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"({"files": [{"relative_path": 3, "content": ""}]})"),
                 GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"({"files": [{"relative_path": "", "content": ""}]})"),
                 GenerationError);
    EXPECT_THROW(LlmCodeGenerator::ParseReply(R"({"files": [{"relative_path": "main.py"}]})"), GenerationError);
}

TEST(LlmCodeGeneratorTest, InitialPromptCarriesObjectiveAndCommand) {
    const auto messages = LlmCodeGenerator::BuildMessages(InitialRequest());
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role, "system");
    EXPECT_NE(messages[0].content.find("relative_path"), std::string::npos);
    EXPECT_EQ(messages[1].role, "user");
    EXPECT_NE(messages[1].content.find("sum two numbers"), std::string::npos);
    EXPECT_NE(messages[1].content.find("- no third-party packages"), std::string::npos);
    EXPECT_NE(messages[1].content.find("python3 main.py"), std::string::npos);
    EXPECT_EQ(messages[1].content.find("EXECUTION FEEDBACK"), std::string::npos);
}

TEST(LlmCodeGeneratorTest, RefinementPromptCarriesFilesAndFeedback) {
    auto request = InitialRequest();
    request.attempt = 3;
    request.previous_files = {{"main.py", "print(undefined)\n"}};
    request.feedback = "Status: exit 1 after 40ms\nNameError: name 'undefined' is not defined";

    const auto messages = LlmCodeGenerator::BuildMessages(request);
    ASSERT_EQ(messages.size(), 2u);
    const auto& prompt = messages[1].content;
    EXPECT_NE(prompt.find("attempt 2"), std::string::npos);
    EXPECT_NE(prompt.find("--- PREVIOUS FILES ---"), std::string::npos);
    EXPECT_NE(prompt.find("print(undefined)"), std::string::npos);
    EXPECT_NE(prompt.find("--- EXECUTION FEEDBACK ---"), std::string::npos);
    EXPECT_NE(prompt.find("NameError"), std::string::npos);
}

TEST(LlmCodeGeneratorTest, GenerateUsesConfiguredModel) {
    CannedProvider provider;
    provider.response.content = R"({"files": [{"relative_path": "main.py", "content": "print('hi')\n"}]})";
    codeloop::config::GeneratorConfig config{};
    config.model = "claude-3-5-sonnet";
    config.max_tokens = 1024;
    LlmCodeGenerator generator(provider, config);

    const auto files = generator.Generate(InitialRequest());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(provider.last_request.model, "claude-3-5-sonnet");
    EXPECT_EQ(provider.last_request.max_tokens, 1024);
    EXPECT_EQ(provider.last_request.messages.size(), 2u);
    EXPECT_TRUE(provider.last_request.json_output);
}

TEST(LlmCodeGeneratorTest, EmptyModelFallsBackToProviderDefault) {
    CannedProvider provider;
    provider.response.content = R"({"files": [{"relative_path": "main.py", "content": ""}]})";
    codeloop::config::GeneratorConfig config{};
    config.model.clear();
    LlmCodeGenerator generator(provider, config);

    generator.Generate(InitialRequest());
    EXPECT_EQ(provider.last_request.model, "default-model");
}

TEST(LlmCodeGeneratorTest, ProviderErrorsBecomeGenerationErrors) {
    CannedProvider provider;
    provider.response.content = "HTTP 401: invalid api key";
    provider.response.finish_reason = "error";
    LlmCodeGenerator generator(provider, codeloop::config::GeneratorConfig{});

    try {
        generator.Generate(InitialRequest());
        FAIL() << "expected GenerationError";
    } catch (const GenerationError& ex) {
        EXPECT_NE(std::string(ex.what()).find("invalid api key"), std::string::npos);
    }

    provider.response.finish_reason = "stop";
    provider.response.content.clear();
    EXPECT_THROW(generator.Generate(InitialRequest()), GenerationError);
}
