#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "orchestrator/session_state.hpp"
#include "sandbox/sandbox_types.hpp"

namespace codeloop::session {

nlohmann::json FilesToJson(const codeloop::sandbox::ProgramFiles& files);
codeloop::sandbox::ProgramFiles FilesFromJson(const nlohmann::json& json);

nlohmann::json TaskToJson(const codeloop::orchestrator::Task& task);
codeloop::orchestrator::Task TaskFromJson(const nlohmann::json& json);

nlohmann::json ResultToJson(const codeloop::sandbox::ExecutionResult& result);
nlohmann::json SessionToJson(const codeloop::orchestrator::SessionState& session);

// Inverse of the ToString() names; unknown text maps to the first value.
codeloop::orchestrator::Verdict ParseVerdict(const std::string& text);
codeloop::orchestrator::AbortReason ParseAbortReason(const std::string& text);
codeloop::orchestrator::Classification ParseClassification(const std::string& text);
codeloop::sandbox::ExitKind ParseExitKind(const std::string& text);

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point point);
std::chrono::system_clock::time_point FromEpochMillis(std::int64_t millis);

}  // namespace codeloop::session
