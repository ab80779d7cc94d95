#include "orchestrator/result_analyzer.hpp"

#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::orchestrator {
namespace {

// Boost.Regex throws std::runtime_error when a match gets too expensive;
// such a line counts as no match.
bool SearchLine(const std::string& line, const boost::regex& pattern) {
    try {
        return boost::regex_search(line, pattern);
    } catch (const std::runtime_error& ex) {
        codeloop::utils::LogWarn("analyzer", std::string("pattern search gave up: ") + ex.what());
        return false;
    }
}

std::string FirstMatchingLine(const std::vector<boost::regex>& patterns, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        for (const auto& pattern : patterns) {
            if (SearchLine(line, pattern)) {
                return line;
            }
        }
    }
    return {};
}

}  // namespace

ResultAnalyzer::ResultAnalyzer(const std::vector<std::string>& stderr_error_patterns) {
    for (const auto& pattern : stderr_error_patterns) {
        try {
            error_patterns_.emplace_back(pattern, boost::regex::perl);
        } catch (const boost::regex_error& ex) {
            codeloop::utils::LogWarn("analyzer", "ignoring invalid stderr pattern '" + pattern + "': " + ex.what());
        }
    }
}

bool ResultAnalyzer::StderrHasErrors(const std::string& stderr_text) const {
    if (stderr_text.empty()) {
        return false;
    }
    return !FirstMatchingLine(error_patterns_, stderr_text).empty();
}

bool ResultAnalyzer::CriterionMet(const SuccessCriterion& criterion,
                                  const std::string& stdout_text,
                                  std::string& message) {
    switch (criterion.kind) {
        case CriterionKind::kExitZero:
            return true;
        case CriterionKind::kStdoutEquals:
            if (codeloop::utils::TrimRight(stdout_text) == codeloop::utils::TrimRight(criterion.expected)) {
                return true;
            }
            message = "stdout does not equal the expected output:\n" + criterion.expected;
            return false;
        case CriterionKind::kStdoutContains:
            if (stdout_text.find(criterion.expected) != std::string::npos) {
                return true;
            }
            message = "stdout does not contain the expected text: " + criterion.expected;
            return false;
        case CriterionKind::kStdoutMatches:
            try {
                const boost::regex pattern(criterion.expected, boost::regex::perl);
                if (boost::regex_search(stdout_text, pattern)) {
                    return true;
                }
                message = "stdout does not match the pattern: " + criterion.expected;
            } catch (const boost::regex_error& ex) {
                message = "invalid success pattern '" + criterion.expected + "': " + ex.what();
            } catch (const std::runtime_error& ex) {
                message = "success pattern too expensive to evaluate: " + std::string(ex.what());
            }
            return false;
    }
    message = "unknown success criterion";
    return false;
}

std::string ResultAnalyzer::BuildFeedback(const codeloop::sandbox::ExecutionResult& result,
                                          const std::string& verdict_line) {
    std::ostringstream feedback;
    feedback << "Status: " << result.StatusText() << " after " << result.duration.count() << "ms\n"
             << verdict_line << "\n\n"
             << "STDOUT:\n" << result.stdout_text << "\n\n"
             << "STDERR:\n" << result.stderr_text;
    return feedback.str();
}

Analysis ResultAnalyzer::Analyze(const codeloop::sandbox::ExecutionResult& result,
                                 const SuccessCriterion& criterion) const {
    Analysis analysis{};
    if (result.Cancelled()) {
        analysis.classification = Classification::kCancelled;
        analysis.feedback = BuildFeedback(result, "Result: the run was cancelled.");
        return analysis;
    }
    if (result.TimedOut()) {
        analysis.classification = Classification::kTimedOut;
        analysis.feedback = BuildFeedback(
            result, "Result: the program did not finish before the timeout and was killed. "
                    "Make sure it terminates on its own and does not wait for input.");
        return analysis;
    }
    if (result.exit_code != 0) {
        analysis.classification = Classification::kProgramFailure;
        analysis.feedback = BuildFeedback(
            result, "Result: the program failed with exit code " + std::to_string(result.exit_code) + ".");
        return analysis;
    }
    const auto error_line = FirstMatchingLine(error_patterns_, result.stderr_text);
    if (!error_line.empty()) {
        analysis.classification = Classification::kProgramFailure;
        analysis.feedback = BuildFeedback(
            result, "Result: the program exited with 0 but reported an error on stderr: " + error_line);
        return analysis;
    }

    std::string message;
    if (CriterionMet(criterion, result.stdout_text, message)) {
        analysis.classification = Classification::kSucceeded;
        analysis.feedback = BuildFeedback(result, "Result: success.");
    } else {
        analysis.classification = Classification::kCriterionNotMet;
        analysis.feedback = BuildFeedback(result, "Result: the program ran but " + message);
    }
    return analysis;
}

}  // namespace codeloop::orchestrator
