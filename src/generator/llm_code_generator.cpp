#include "generator/llm_code_generator.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::generator {
namespace {

constexpr const char* kSystemPrompt =
    "You are an expert Python developer. You write complete, runnable programs.\n"
    "Reply with a single JSON object and nothing else, in the form\n"
    "{\"files\": [{\"relative_path\": \"main.py\", \"content\": \"...\"}]}\n"
    "Paths are relative to the workspace root. Always return every file the "
    "program needs, not a diff. The program runs without network access, so use "
    "only the standard library and preinstalled packages.";

std::string StripCodeFence(const std::string& reply) {
    const auto open = reply.find("```");
    if (open != std::string::npos) {
        const auto body = reply.find('\n', open);
        const auto close = reply.rfind("```");
        if (body != std::string::npos && close > body) {
            return reply.substr(body + 1, close - body - 1);
        }
    }
    const auto first = reply.find('{');
    const auto last = reply.rfind('}');
    if (first != std::string::npos && last != std::string::npos && last > first) {
        return reply.substr(first, last - first + 1);
    }
    return reply;
}

std::string FilesAsJson(const codeloop::sandbox::ProgramFiles& files) {
    nlohmann::json json;
    json["files"] = nlohmann::json::array();
    for (const auto& file : files) {
        json["files"].push_back({{"relative_path", file.relative_path}, {"content", file.content}});
    }
    return json.dump(2);
}

std::string BuildInitialPrompt(const GenerationRequest& request, const std::string& command) {
    std::ostringstream prompt;
    prompt << "Generate a set of Python files for the following objective.\n"
           << "The aim of the program you are writing is: \"" << request.objective << "\"\n\n";
    if (!request.constraints.empty()) {
        prompt << "Constraints:\n";
        for (const auto& constraint : request.constraints) {
            prompt << "- " << constraint << "\n";
        }
        prompt << "\n";
    }
    prompt << "The files are placed in " << request.mount_path
           << " inside a sandbox and the following command is run from that directory:\n"
           << "--- COMMAND ---\n" << command << "\n--- END COMMAND ---\n";
    return prompt.str();
}

std::string BuildRefinementPrompt(const GenerationRequest& request, const std::string& command) {
    std::ostringstream prompt;
    prompt << "Your previous attempt (attempt " << request.attempt - 1 << ") had issues.\n"
           << "Your original aim was: \"" << request.objective << "\"\n"
           << "The command used for execution was: \"" << command << "\"\n\n";
    if (!request.constraints.empty()) {
        prompt << "Constraints:\n";
        for (const auto& constraint : request.constraints) {
            prompt << "- " << constraint << "\n";
        }
        prompt << "\n";
    }
    prompt << "You previously generated the following files:\n"
           << "--- PREVIOUS FILES ---\n" << FilesAsJson(request.previous_files) << "\n--- END PREVIOUS FILES ---\n\n"
           << "When the command was run, it produced the following result:\n"
           << "--- EXECUTION FEEDBACK ---\n" << request.feedback << "\n--- END EXECUTION FEEDBACK ---\n\n"
           << "Based on this feedback, fix the code and provide a new, complete version of all the files.\n";
    return prompt.str();
}

}  // namespace

LlmCodeGenerator::LlmCodeGenerator(codeloop::providers::LLMProvider& provider,
                                   codeloop::config::GeneratorConfig config)
    : provider_(provider)
    , config_(std::move(config)) {}

std::vector<codeloop::providers::Message> LlmCodeGenerator::BuildMessages(const GenerationRequest& request) {
    const auto command = codeloop::utils::Join(request.command, " ");
    std::vector<codeloop::providers::Message> messages;
    messages.push_back({"system", kSystemPrompt});
    messages.push_back({"user", request.IsRefinement()
                                    ? BuildRefinementPrompt(request, command)
                                    : BuildInitialPrompt(request, command)});
    return messages;
}

codeloop::sandbox::ProgramFiles LlmCodeGenerator::ParseReply(const std::string& reply) {
    auto json = nlohmann::json::parse(StripCodeFence(reply), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw GenerationError("model reply is not a JSON object");
    }
    if (!json.contains("files") || !json["files"].is_array()) {
        throw GenerationError("model reply has no \"files\" array");
    }

    codeloop::sandbox::ProgramFiles files;
    for (const auto& entry : json["files"]) {
        if (!entry.is_object()) {
            throw GenerationError("file entry is not an object");
        }
        if (!entry.contains("relative_path") || !entry["relative_path"].is_string()) {
            throw GenerationError("file entry without relative_path");
        }
        const auto path = entry["relative_path"].get<std::string>();
        if (path.empty()) {
            throw GenerationError("file entry with an empty relative_path");
        }
        if (!entry.contains("content") || !entry["content"].is_string()) {
            throw GenerationError("file " + path + " has no string content");
        }
        files.push_back({path, entry["content"].get<std::string>()});
    }
    if (files.empty()) {
        throw GenerationError("model returned no files");
    }
    return files;
}

codeloop::sandbox::ProgramFiles LlmCodeGenerator::Generate(const GenerationRequest& request) {
    const auto model = config_.model.empty() ? provider_.GetDefaultModel() : config_.model;
    codeloop::utils::LogInfo("generator", "requesting " + std::string(request.IsRefinement() ? "refinement" : "initial") +
                                              " code from " + model + " (attempt " + std::to_string(request.attempt) + ")");

    codeloop::providers::ChatRequest chat{};
    chat.messages = BuildMessages(request);
    chat.model = model;
    chat.max_tokens = config_.max_tokens;
    chat.temperature = config_.temperature;
    chat.json_output = config_.json_mode;

    const auto response = provider_.Chat(chat);
    if (response.IsError()) {
        throw GenerationError("provider error: " + response.content);
    }
    if (response.content.empty()) {
        throw GenerationError("provider returned an empty reply");
    }
    if (response.IsTruncated()) {
        codeloop::utils::LogWarn("generator", "reply stopped at the token limit (" +
                                                  std::to_string(config_.max_tokens) + ")");
    }

    auto files = ParseReply(response.content);
    codeloop::utils::LogInfo("generator", "received " + std::to_string(files.size()) + " file(s)");
    return files;
}

}  // namespace codeloop::generator
