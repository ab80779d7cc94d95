#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"

namespace codeloop::generator {

// The generation capability failed to produce files. Programs that fail to
// run are not GenerationErrors.
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GenerationRequest {
    std::string objective;
    std::vector<std::string> constraints;
    std::vector<std::string> command;
    std::string mount_path = "/app";
    int attempt = 1;
    // Empty on the first attempt.
    codeloop::sandbox::ProgramFiles previous_files;
    std::string feedback;

    bool IsRefinement() const { return !previous_files.empty() && !feedback.empty(); }
};

class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    // Complete file set for the next attempt. Throws GenerationError.
    virtual codeloop::sandbox::ProgramFiles Generate(const GenerationRequest& request) = 0;
};

}  // namespace codeloop::generator
