#include "session/session_json.hpp"

#include "utils/common.hpp"

namespace codeloop::session {

using codeloop::orchestrator::AbortReason;
using codeloop::orchestrator::Classification;
using codeloop::orchestrator::Verdict;
using codeloop::sandbox::ExitKind;

nlohmann::json FilesToJson(const codeloop::sandbox::ProgramFiles& files) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& file : files) {
        json.push_back({{"relative_path", file.relative_path}, {"content", file.content}});
    }
    return json;
}

codeloop::sandbox::ProgramFiles FilesFromJson(const nlohmann::json& json) {
    codeloop::sandbox::ProgramFiles files;
    if (!json.is_array()) {
        return files;
    }
    for (const auto& entry : json) {
        if (!entry.is_object()) {
            continue;
        }
        files.push_back({entry.value("relative_path", ""), entry.value("content", "")});
    }
    return files;
}

nlohmann::json TaskToJson(const codeloop::orchestrator::Task& task) {
    nlohmann::json json;
    json["objective"] = task.objective;
    json["constraints"] = task.constraints;
    json["command"] = task.command;
    if (task.timeout) {
        json["timeoutS"] = task.timeout->count();
    }
    json["criterion"] = {
        {"kind", codeloop::orchestrator::ToString(task.criterion.kind)},
        {"expected", task.criterion.expected}
    };
    return json;
}

codeloop::orchestrator::Task TaskFromJson(const nlohmann::json& json) {
    codeloop::orchestrator::Task task{};
    if (!json.is_object()) {
        return task;
    }
    task.objective = json.value("objective", "");
    if (json.contains("constraints") && json["constraints"].is_array()) {
        for (const auto& item : json["constraints"]) {
            if (item.is_string()) {
                task.constraints.push_back(item.get<std::string>());
            }
        }
    }
    if (json.contains("command") && json["command"].is_array()) {
        for (const auto& item : json["command"]) {
            if (item.is_string()) {
                task.command.push_back(item.get<std::string>());
            }
        }
    }
    if (json.contains("timeoutS") && json["timeoutS"].is_number_integer()) {
        task.timeout = std::chrono::seconds(json["timeoutS"].get<long long>());
    }
    if (json.contains("criterion") && json["criterion"].is_object()) {
        const auto& criterion = json["criterion"];
        task.criterion.kind = codeloop::orchestrator::ParseCriterionKind(criterion.value("kind", ""));
        task.criterion.expected = criterion.value("expected", "");
    }
    return task;
}

nlohmann::json ResultToJson(const codeloop::sandbox::ExecutionResult& result) {
    nlohmann::json json;
    json["kind"] = codeloop::sandbox::ToString(result.kind);
    json["exitCode"] = result.exit_code;
    json["durationMs"] = result.duration.count();
    json["stdout"] = result.stdout_text;
    json["stderr"] = result.stderr_text;
    json["stdoutTruncated"] = result.stdout_truncated;
    json["stderrTruncated"] = result.stderr_truncated;
    json["teardownWarnings"] = result.teardown_warnings;
    return json;
}

nlohmann::json SessionToJson(const codeloop::orchestrator::SessionState& session) {
    nlohmann::json json;
    json["id"] = session.id;
    json["task"] = TaskToJson(session.task);
    json["verdict"] = codeloop::orchestrator::ToString(session.verdict);
    json["abortReason"] = codeloop::orchestrator::ToString(session.abort_reason);
    json["error"] = session.error;
    json["maxAttempts"] = session.max_attempts;
    json["startedAt"] = codeloop::utils::FormatTime(session.started_at, "%Y-%m-%dT%H:%M:%S");
    json["finishedAt"] = codeloop::utils::FormatTime(session.finished_at, "%Y-%m-%dT%H:%M:%S");
    json["attempts"] = nlohmann::json::array();
    for (const auto& attempt : session.attempts) {
        json["attempts"].push_back({
            {"ordinal", attempt.ordinal},
            {"classification", codeloop::orchestrator::ToString(attempt.classification)},
            {"files", FilesToJson(attempt.files)},
            {"result", ResultToJson(attempt.result)},
            {"feedback", attempt.feedback}
        });
    }
    return json;
}

Verdict ParseVerdict(const std::string& text) {
    if (text == "succeeded") {
        return Verdict::kSucceeded;
    }
    if (text == "failed") {
        return Verdict::kFailed;
    }
    if (text == "aborted") {
        return Verdict::kAborted;
    }
    return Verdict::kNone;
}

AbortReason ParseAbortReason(const std::string& text) {
    if (text == "attempts_exhausted") {
        return AbortReason::kAttemptsExhausted;
    }
    if (text == "infrastructure_failure") {
        return AbortReason::kInfrastructureFailure;
    }
    if (text == "generation_failed") {
        return AbortReason::kGenerationFailed;
    }
    if (text == "cancelled") {
        return AbortReason::kCancelled;
    }
    return AbortReason::kNone;
}

Classification ParseClassification(const std::string& text) {
    if (text == "criterion_not_met") {
        return Classification::kCriterionNotMet;
    }
    if (text == "program_failure") {
        return Classification::kProgramFailure;
    }
    if (text == "timed_out") {
        return Classification::kTimedOut;
    }
    if (text == "cancelled") {
        return Classification::kCancelled;
    }
    return Classification::kSucceeded;
}

ExitKind ParseExitKind(const std::string& text) {
    if (text == "timed_out") {
        return ExitKind::kTimedOut;
    }
    if (text == "cancelled") {
        return ExitKind::kCancelled;
    }
    return ExitKind::kExited;
}

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

}  // namespace codeloop::session
