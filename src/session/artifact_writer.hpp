#pragma once

#include <filesystem>
#include <string>

#include "orchestrator/session_state.hpp"

namespace codeloop::session {

// Debug copies of every attempt under <runs_dir>/<session_id>/:
//   objective.txt
//   attempt_NN/code/...          program files as generated
//   attempt_NN/execution_report.txt
//   attempt_NN/feedback.txt
//   session.json                 final SessionState
// Write failures are logged and reported through the return value only.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path runs_dir);

    std::filesystem::path SessionDir(const std::string& session_id) const;

    bool WriteAttempt(const codeloop::orchestrator::SessionState& session,
                      const codeloop::orchestrator::Attempt& attempt) const;
    bool WriteSession(const codeloop::orchestrator::SessionState& session) const;

    static std::string ExecutionReport(const codeloop::orchestrator::Attempt& attempt);

private:
    bool WriteText(const std::filesystem::path& path, const std::string& content) const;

    std::filesystem::path runs_dir_;
};

}  // namespace codeloop::session
