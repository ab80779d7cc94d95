#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "generator/code_generator.hpp"
#include "providers/llm_provider.hpp"

namespace codeloop::generator {

// Asks a chat model for {"files":[{"relative_path":..,"content":..}]}.
class LlmCodeGenerator : public CodeGenerator {
public:
    LlmCodeGenerator(codeloop::providers::LLMProvider& provider,
                     codeloop::config::GeneratorConfig config);

    codeloop::sandbox::ProgramFiles Generate(const GenerationRequest& request) override;

    static std::vector<codeloop::providers::Message> BuildMessages(const GenerationRequest& request);
    // Accepts the object bare or inside a Markdown code fence.
    // Throws GenerationError.
    static codeloop::sandbox::ProgramFiles ParseReply(const std::string& reply);

private:
    codeloop::providers::LLMProvider& provider_;
    codeloop::config::GeneratorConfig config_;
};

}  // namespace codeloop::generator
