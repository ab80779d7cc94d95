#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "generator/code_generator.hpp"
#include "orchestrator/result_analyzer.hpp"
#include "orchestrator/session_state.hpp"
#include "sandbox/cancel_token.hpp"
#include "sandbox/sandbox.hpp"

namespace codeloop::orchestrator {

struct OrchestratorOptions {
    int max_attempts = 5;
    int max_generation_retries = 2;
    int max_infrastructure_retries = 2;
    std::vector<std::string> command = {"python3", "main.py"};
    std::chrono::seconds timeout{30};
    std::string mount_path = "/app";
    std::vector<std::string> stderr_error_patterns = codeloop::config::DefaultStderrErrorPatterns();
};

OrchestratorOptions OrchestratorOptionsFromConfig(const codeloop::config::Config& config);

// Called after every appended Attempt.
using AttemptCallback = std::function<void(const SessionState&, const Attempt&)>;

// Drives one session through
//   Planning -> Generating -> Executing -> Analyzing -> Retrying -> Generating ...
// until Succeeded, Failed or Aborted. Run() is sequential within a session;
// one Orchestrator may run several sessions from different threads.
class Orchestrator {
public:
    Orchestrator(codeloop::generator::CodeGenerator& generator,
                 codeloop::sandbox::Sandbox& sandbox,
                 OrchestratorOptions options);

    void SetAttemptCallback(AttemptCallback callback) { on_attempt_ = std::move(callback); }

    // Never throws; generation, infrastructure and program faults end up in
    // the returned verdict.
    SessionState Run(Task task, const codeloop::sandbox::CancelToken* cancel = nullptr);

    // Continues a stored session under its own id. The next generation sees
    // the last attempt's files and feedback, ordinals carry on, and earlier
    // attempts count against max_attempts. A succeeded session is returned
    // unchanged.
    SessionState Resume(SessionState previous, const codeloop::sandbox::CancelToken* cancel = nullptr);

    const OrchestratorOptions& Options() const { return options_; }

private:
    struct Context {
        SessionState session;
        codeloop::generator::GenerationRequest request;
        codeloop::sandbox::ProgramFiles files;
        std::optional<codeloop::sandbox::ExecutionResult> result;
        std::vector<std::string> command;
        std::chrono::milliseconds timeout{0};
        const codeloop::sandbox::CancelToken* cancel = nullptr;
    };

    // Task timeout when positive, otherwise the configured one.
    std::chrono::milliseconds EffectiveTimeout(const Task& task) const;
    void Drive(Context& context);
    void Plan(Context& context) const;
    void Generate(Context& context);
    void Execute(Context& context);
    void Analyze(Context& context);

    static void Transition(SessionState& session, OrchestratorState next);
    static void Finish(SessionState& session, Verdict verdict, AbortReason reason);
    static bool IsCancelled(const Context& context);

    codeloop::generator::CodeGenerator& generator_;
    codeloop::sandbox::Sandbox& sandbox_;
    OrchestratorOptions options_;
    ResultAnalyzer analyzer_;
    AttemptCallback on_attempt_;
};

// "<yyyymmdd-HHMMSS>-<6 hex>".
std::string NewSessionId();

}  // namespace codeloop::orchestrator
