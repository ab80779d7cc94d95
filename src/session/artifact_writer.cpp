#include "session/artifact_writer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "session/session_json.hpp"
#include "utils/logging.hpp"

namespace codeloop::session {
namespace {

std::string AttemptDirName(int ordinal) {
    std::ostringstream oss;
    oss << "attempt_" << std::setw(2) << std::setfill('0') << ordinal;
    return oss.str();
}

// Generated paths were already validated by the workspace, but a stored
// session may come from anywhere.
bool IsSafeRelative(const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path runs_dir)
    : runs_dir_(std::move(runs_dir)) {}

std::filesystem::path ArtifactWriter::SessionDir(const std::string& session_id) const {
    return runs_dir_ / session_id;
}

std::string ArtifactWriter::ExecutionReport(const codeloop::orchestrator::Attempt& attempt) {
    const auto& result = attempt.result;
    std::ostringstream report;
    report << "--- EXECUTION REPORT ---\n"
           << "Attempt: " << attempt.ordinal << "\n"
           << "Classification: " << codeloop::orchestrator::ToString(attempt.classification) << "\n"
           << "Timed Out: " << (result.TimedOut() ? "true" : "false") << "\n"
           << "Status: " << result.StatusText() << "\n"
           << "Duration: " << result.duration.count() << "ms\n"
           << "--- STDOUT ---\n"
           << (result.stdout_text.empty() ? "No standard output." : result.stdout_text) << "\n"
           << "--- STDERR ---\n"
           << (result.stderr_text.empty() ? "No standard error." : result.stderr_text) << "\n";
    if (!result.teardown_warnings.empty()) {
        report << "--- TEARDOWN WARNINGS ---\n";
        for (const auto& warning : result.teardown_warnings) {
            report << warning << "\n";
        }
    }
    report << "--- END REPORT ---\n";
    return report.str();
}

bool ArtifactWriter::WriteAttempt(const codeloop::orchestrator::SessionState& session,
                                  const codeloop::orchestrator::Attempt& attempt) const {
    const auto session_dir = SessionDir(session.id);
    const auto attempt_dir = session_dir / AttemptDirName(attempt.ordinal);

    bool ok = true;
    std::error_code ec;
    if (!std::filesystem::exists(session_dir / "objective.txt", ec)) {
        ok = WriteText(session_dir / "objective.txt", session.task.objective) && ok;
    }
    for (const auto& file : attempt.files) {
        const std::filesystem::path relative(file.relative_path);
        if (!IsSafeRelative(relative)) {
            codeloop::utils::LogWarn("artifacts", "skipping unsafe path " + file.relative_path);
            ok = false;
            continue;
        }
        ok = WriteText(attempt_dir / "code" / relative, file.content) && ok;
    }
    ok = WriteText(attempt_dir / "execution_report.txt", ExecutionReport(attempt)) && ok;
    ok = WriteText(attempt_dir / "feedback.txt", attempt.feedback) && ok;
    if (ok) {
        codeloop::utils::LogDebug("artifacts", "saved attempt " + std::to_string(attempt.ordinal) + " to " +
                                                   attempt_dir.string());
    }
    return ok;
}

bool ArtifactWriter::WriteSession(const codeloop::orchestrator::SessionState& session) const {
    const auto path = SessionDir(session.id) / "session.json";
    const bool ok = WriteText(path, SessionToJson(session).dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    if (ok) {
        codeloop::utils::LogInfo("artifacts", "session artifacts in " + SessionDir(session.id).string());
    }
    return ok;
}

bool ArtifactWriter::WriteText(const std::filesystem::path& path, const std::string& content) const {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        codeloop::utils::LogWarn("artifacts", "cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        codeloop::utils::LogWarn("artifacts", "cannot open " + path.string());
        return false;
    }
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output) {
        codeloop::utils::LogWarn("artifacts", "write failed for " + path.string());
        return false;
    }
    return true;
}

}  // namespace codeloop::session
