#pragma once

#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "orchestrator/session_state.hpp"
#include "sandbox/sandbox_types.hpp"

namespace codeloop::orchestrator {

struct Analysis {
    Classification classification = Classification::kProgramFailure;
    std::string feedback;
};

// Turns an ExecutionResult into a classification and the feedback text handed
// to the next generation.
class ResultAnalyzer {
public:
    // Patterns are Perl syntax and tested against each stderr line. Invalid
    // patterns are logged and skipped. Matching uses Boost.Regex, whose engine
    // does not recurse per character, so a single very long line is safe.
    explicit ResultAnalyzer(const std::vector<std::string>& stderr_error_patterns);

    Analysis Analyze(const codeloop::sandbox::ExecutionResult& result,
                     const SuccessCriterion& criterion) const;

    bool StderrHasErrors(const std::string& stderr_text) const;

    // Sets message to a one-line reason when the criterion fails.
    static bool CriterionMet(const SuccessCriterion& criterion,
                             const std::string& stdout_text,
                             std::string& message);

    static std::string BuildFeedback(const codeloop::sandbox::ExecutionResult& result,
                                     const std::string& verdict_line);

private:
    std::vector<boost::regex> error_patterns_;
};

}  // namespace codeloop::orchestrator
