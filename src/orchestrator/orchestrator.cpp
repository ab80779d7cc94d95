#include "orchestrator/orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <random>
#include <sstream>

#include "sandbox/sandbox_errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::orchestrator {

std::string NewSessionId() {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution(0, 0xffffff);
    std::ostringstream oss;
    oss << codeloop::utils::FormatTime(codeloop::utils::Now(), "%Y%m%d-%H%M%S") << "-"
        << std::hex << std::setw(6) << std::setfill('0') << distribution(generator);
    return oss.str();
}

OrchestratorOptions OrchestratorOptionsFromConfig(const codeloop::config::Config& config) {
    OrchestratorOptions options{};
    options.max_attempts = config.orchestrator.max_attempts;
    options.max_generation_retries = config.orchestrator.max_generation_retries;
    options.max_infrastructure_retries = config.orchestrator.max_infrastructure_retries;
    options.command = config.sandbox.command;
    options.timeout = std::chrono::seconds(config.sandbox.timeout_s);
    options.mount_path = config.sandbox.mount_path;
    options.stderr_error_patterns = config.orchestrator.stderr_error_patterns;
    return options;
}

Orchestrator::Orchestrator(codeloop::generator::CodeGenerator& generator,
                           codeloop::sandbox::Sandbox& sandbox,
                           OrchestratorOptions options)
    : generator_(generator)
    , sandbox_(sandbox)
    , options_(std::move(options))
    , analyzer_(options_.stderr_error_patterns) {
    options_.max_attempts = std::max(1, options_.max_attempts);
    options_.max_generation_retries = std::max(0, options_.max_generation_retries);
    options_.max_infrastructure_retries = std::max(0, options_.max_infrastructure_retries);
    if (options_.timeout.count() <= 0) {
        codeloop::utils::LogWarn("orchestrator", "non-positive timeout, using " +
                                                     std::to_string(OrchestratorOptions{}.timeout.count()) + "s");
        options_.timeout = OrchestratorOptions{}.timeout;
    }
}

std::chrono::milliseconds Orchestrator::EffectiveTimeout(const Task& task) const {
    if (task.timeout && task.timeout->count() > 0) {
        return std::chrono::milliseconds(*task.timeout);
    }
    return std::chrono::milliseconds(options_.timeout);
}

SessionState Orchestrator::Run(Task task, const codeloop::sandbox::CancelToken* cancel) {
    Context context{};
    context.cancel = cancel;
    context.command = task.command.empty() ? options_.command : task.command;
    context.timeout = EffectiveTimeout(task);

    auto& session = context.session;
    session.id = NewSessionId();
    session.task = std::move(task);
    session.max_attempts = options_.max_attempts;
    session.started_at = codeloop::utils::Now();
    session.state = OrchestratorState::kPlanning;
    codeloop::utils::LogInfo("orchestrator", "session " + session.id + " started, up to " +
                                                 std::to_string(session.max_attempts) + " attempts");
    Drive(context);
    return std::move(session);
}

SessionState Orchestrator::Resume(SessionState previous, const codeloop::sandbox::CancelToken* cancel) {
    if (previous.verdict == Verdict::kSucceeded) {
        codeloop::utils::LogWarn("orchestrator", "session " + previous.id + " already succeeded");
        return previous;
    }

    Context context{};
    context.cancel = cancel;
    context.command = previous.task.command.empty() ? options_.command : previous.task.command;
    context.timeout = EffectiveTimeout(previous.task);

    auto& session = context.session;
    session = std::move(previous);
    session.max_attempts = options_.max_attempts;
    session.verdict = Verdict::kNone;
    session.abort_reason = AbortReason::kNone;
    session.error.clear();
    if (session.last_feedback.empty() && !session.attempts.empty()) {
        session.last_feedback = session.attempts.back().feedback;
    }
    session.state = session.attempts.empty() ? OrchestratorState::kPlanning : OrchestratorState::kRetrying;
    codeloop::utils::LogInfo("orchestrator", "session " + session.id + " resumed after " +
                                                 std::to_string(session.attempts.size()) + " of " +
                                                 std::to_string(session.max_attempts) + " attempts");

    // Earlier attempts count against the budget.
    if (static_cast<int>(session.attempts.size()) >= session.max_attempts) {
        session.error = "attempt budget already used";
        Finish(session, Verdict::kAborted, AbortReason::kAttemptsExhausted);
    }
    Drive(context);
    return std::move(session);
}

void Orchestrator::Drive(Context& context) {
    auto& session = context.session;
    while (!session.Finished()) {
        if (IsCancelled(context)) {
            session.error = "cancelled by caller";
            Finish(session, Verdict::kAborted, AbortReason::kCancelled);
            break;
        }
        switch (session.state) {
            case OrchestratorState::kPlanning:
            case OrchestratorState::kRetrying:
                Plan(context);
                Transition(session, OrchestratorState::kGenerating);
                break;
            case OrchestratorState::kGenerating:
                Generate(context);
                break;
            case OrchestratorState::kExecuting:
                Execute(context);
                break;
            case OrchestratorState::kAnalyzing:
                Analyze(context);
                break;
            case OrchestratorState::kSucceeded:
            case OrchestratorState::kFailed:
            case OrchestratorState::kAborted:
                break;
        }
    }

    session.finished_at = codeloop::utils::Now();
    std::string summary = "session " + session.id + " " + ToString(session.verdict) + " after " +
                          std::to_string(session.attempts.size()) + " attempt(s)";
    if (session.abort_reason != AbortReason::kNone) {
        summary += " (" + std::string(ToString(session.abort_reason)) + ")";
    }
    if (session.verdict == Verdict::kSucceeded) {
        codeloop::utils::LogInfo("orchestrator", summary);
    } else {
        codeloop::utils::LogWarn("orchestrator", summary);
    }
}

void Orchestrator::Plan(Context& context) const {
    const auto& session = context.session;
    auto& request = context.request;
    request = codeloop::generator::GenerationRequest{};
    request.objective = session.task.objective;
    request.constraints = session.task.constraints;
    request.command = context.command;
    request.mount_path = options_.mount_path;
    request.attempt = static_cast<int>(session.attempts.size()) + 1;
    if (!session.attempts.empty()) {
        request.previous_files = session.attempts.back().files;
        request.feedback = session.last_feedback;
    }
}

void Orchestrator::Generate(Context& context) {
    auto& session = context.session;
    const int tries = options_.max_generation_retries + 1;
    for (int i = 1; i <= tries; ++i) {
        if (IsCancelled(context)) {
            return;
        }
        try {
            context.files = generator_.Generate(context.request);
            if (context.files.empty()) {
                throw codeloop::generator::GenerationError("generator returned no files");
            }
            session.error.clear();
            Transition(session, OrchestratorState::kExecuting);
            return;
        } catch (const codeloop::generator::GenerationError& ex) {
            session.error = ex.what();
            codeloop::utils::LogWarn("orchestrator", "generation failed (" + std::to_string(i) + "/" +
                                                         std::to_string(tries) + "): " + ex.what());
        } catch (const std::exception& ex) {
            session.error = std::string("unexpected generator error: ") + ex.what();
            codeloop::utils::LogError("orchestrator", "generator threw (" + std::to_string(i) + "/" +
                                                          std::to_string(tries) + "): " + ex.what());
        }
    }
    Finish(session, Verdict::kFailed, AbortReason::kGenerationFailed);
}

void Orchestrator::Execute(Context& context) {
    auto& session = context.session;
    const int tries = options_.max_infrastructure_retries + 1;
    context.result.reset();
    for (int i = 1; i <= tries; ++i) {
        if (IsCancelled(context)) {
            return;
        }
        try {
            context.result = sandbox_.Run(context.files, context.command, context.timeout, context.cancel);
            session.error.clear();
            Transition(session, OrchestratorState::kAnalyzing);
            return;
        } catch (const codeloop::sandbox::SandboxError& ex) {
            session.error = ex.what();
            codeloop::utils::LogWarn("orchestrator", "infrastructure failure (" + std::to_string(i) + "/" +
                                                         std::to_string(tries) + "): " + ex.what());
        } catch (const std::exception& ex) {
            session.error = std::string("unexpected sandbox error: ") + ex.what();
            codeloop::utils::LogError("orchestrator", "sandbox threw (" + std::to_string(i) + "/" +
                                                          std::to_string(tries) + "): " + ex.what());
        }
    }
    Finish(session, Verdict::kAborted, AbortReason::kInfrastructureFailure);
}

void Orchestrator::Analyze(Context& context) {
    auto& session = context.session;
    const auto& result = *context.result;
    auto analysis = analyzer_.Analyze(result, session.task.criterion);

    Attempt attempt{};
    attempt.ordinal = static_cast<int>(session.attempts.size()) + 1;
    attempt.files = std::move(context.files);
    attempt.result = result;
    attempt.classification = analysis.classification;
    attempt.feedback = std::move(analysis.feedback);
    session.last_feedback = attempt.feedback;
    session.attempts.push_back(std::move(attempt));
    context.result.reset();

    const auto& appended = session.attempts.back();
    codeloop::utils::LogInfo("orchestrator", "attempt " + std::to_string(appended.ordinal) + "/" +
                                                 std::to_string(session.max_attempts) + ": " +
                                                 ToString(appended.classification));
    if (on_attempt_) {
        try {
            on_attempt_(session, appended);
        } catch (const std::exception& ex) {
            codeloop::utils::LogError("orchestrator", std::string("attempt callback threw: ") + ex.what());
        }
    }

    if (appended.classification == Classification::kSucceeded) {
        Finish(session, Verdict::kSucceeded, AbortReason::kNone);
    } else if (appended.classification == Classification::kCancelled) {
        session.error = "cancelled by caller";
        Finish(session, Verdict::kAborted, AbortReason::kCancelled);
    } else if (static_cast<int>(session.attempts.size()) >= session.max_attempts) {
        Finish(session, Verdict::kAborted, AbortReason::kAttemptsExhausted);
    } else {
        Transition(session, OrchestratorState::kRetrying);
    }
}

void Orchestrator::Transition(SessionState& session, OrchestratorState next) {
    codeloop::utils::LogDebug("orchestrator", std::string(ToString(session.state)) + " -> " + ToString(next));
    session.state = next;
}

void Orchestrator::Finish(SessionState& session, Verdict verdict, AbortReason reason) {
    if (session.Finished()) {
        return;
    }
    session.verdict = verdict;
    session.abort_reason = reason;
    switch (verdict) {
        case Verdict::kSucceeded:
            Transition(session, OrchestratorState::kSucceeded);
            break;
        case Verdict::kFailed:
            Transition(session, OrchestratorState::kFailed);
            break;
        case Verdict::kAborted:
        case Verdict::kNone:
            Transition(session, OrchestratorState::kAborted);
            break;
    }
}

bool Orchestrator::IsCancelled(const Context& context) {
    return context.cancel && context.cancel->IsCancelled();
}

}  // namespace codeloop::orchestrator
