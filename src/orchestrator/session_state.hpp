#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"

namespace codeloop::orchestrator {

enum class CriterionKind {
    kExitZero,
    kStdoutEquals,
    kStdoutContains,
    kStdoutMatches
};

struct SuccessCriterion {
    CriterionKind kind = CriterionKind::kExitZero;
    // Expected text or Perl-syntax pattern; unused for kExitZero.
    std::string expected;
};

struct Task {
    std::string objective;
    std::vector<std::string> constraints;
    // Empty means the configured command / timeout.
    std::vector<std::string> command;
    std::optional<std::chrono::seconds> timeout;
    SuccessCriterion criterion;
};

enum class Classification {
    kSucceeded,
    kCriterionNotMet,
    kProgramFailure,
    kTimedOut,
    kCancelled
};

struct Attempt {
    int ordinal = 0;
    codeloop::sandbox::ProgramFiles files;
    codeloop::sandbox::ExecutionResult result;
    Classification classification = Classification::kProgramFailure;
    std::string feedback;
};

enum class OrchestratorState {
    kPlanning,
    kGenerating,
    kExecuting,
    kAnalyzing,
    kRetrying,
    kSucceeded,
    kFailed,
    kAborted
};

enum class Verdict {
    kNone,
    kSucceeded,
    kFailed,
    kAborted
};

enum class AbortReason {
    kNone,
    kAttemptsExhausted,
    kInfrastructureFailure,
    kGenerationFailed,
    kCancelled
};

struct SessionState {
    std::string id;
    Task task;
    std::vector<Attempt> attempts;
    OrchestratorState state = OrchestratorState::kPlanning;
    Verdict verdict = Verdict::kNone;
    AbortReason abort_reason = AbortReason::kNone;
    // Message of the fault behind a Failed or infrastructure Aborted verdict.
    std::string error;
    std::string last_feedback;
    int max_attempts = 0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    bool Finished() const { return verdict != Verdict::kNone; }
};

inline const char* ToString(CriterionKind kind) {
    switch (kind) {
        case CriterionKind::kExitZero: return "exit_zero";
        case CriterionKind::kStdoutEquals: return "stdout_equals";
        case CriterionKind::kStdoutContains: return "stdout_contains";
        case CriterionKind::kStdoutMatches: return "stdout_matches";
    }
    return "unknown";
}

inline const char* ToString(Classification classification) {
    switch (classification) {
        case Classification::kSucceeded: return "succeeded";
        case Classification::kCriterionNotMet: return "criterion_not_met";
        case Classification::kProgramFailure: return "program_failure";
        case Classification::kTimedOut: return "timed_out";
        case Classification::kCancelled: return "cancelled";
    }
    return "unknown";
}

inline const char* ToString(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::kPlanning: return "planning";
        case OrchestratorState::kGenerating: return "generating";
        case OrchestratorState::kExecuting: return "executing";
        case OrchestratorState::kAnalyzing: return "analyzing";
        case OrchestratorState::kRetrying: return "retrying";
        case OrchestratorState::kSucceeded: return "succeeded";
        case OrchestratorState::kFailed: return "failed";
        case OrchestratorState::kAborted: return "aborted";
    }
    return "unknown";
}

inline const char* ToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::kNone: return "none";
        case Verdict::kSucceeded: return "succeeded";
        case Verdict::kFailed: return "failed";
        case Verdict::kAborted: return "aborted";
    }
    return "unknown";
}

inline const char* ToString(AbortReason reason) {
    switch (reason) {
        case AbortReason::kNone: return "";
        case AbortReason::kAttemptsExhausted: return "attempts_exhausted";
        case AbortReason::kInfrastructureFailure: return "infrastructure_failure";
        case AbortReason::kGenerationFailed: return "generation_failed";
        case AbortReason::kCancelled: return "cancelled";
    }
    return "unknown";
}

// Accepts the names produced by ToString(CriterionKind); unknown names map to
// kExitZero.
inline CriterionKind ParseCriterionKind(const std::string& name) {
    if (name == "stdout_equals") {
        return CriterionKind::kStdoutEquals;
    }
    if (name == "stdout_contains") {
        return CriterionKind::kStdoutContains;
    }
    if (name == "stdout_matches") {
        return CriterionKind::kStdoutMatches;
    }
    return CriterionKind::kExitZero;
}

}  // namespace codeloop::orchestrator
