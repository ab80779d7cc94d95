#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/session_state.hpp"
#include "sqlite3.h"

namespace codeloop::session {

struct SessionSummary {
    std::string id;
    std::string objective;
    codeloop::orchestrator::Verdict verdict = codeloop::orchestrator::Verdict::kNone;
    codeloop::orchestrator::AbortReason abort_reason = codeloop::orchestrator::AbortReason::kNone;
    int attempts = 0;
    int max_attempts = 0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// Finished sessions in <data_dir>/sessions.db. A database that cannot be
// opened leaves the store inert: Save() returns false, queries return nothing.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path db_path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    bool IsOpen() const { return db_ != nullptr; }
    const std::filesystem::path& Path() const { return db_path_; }

    // Replaces any stored session with the same id.
    bool Save(const codeloop::orchestrator::SessionState& session);
    // Most recent first.
    std::vector<SessionSummary> List(std::size_t limit = 50) const;
    std::optional<codeloop::orchestrator::SessionState> Load(const std::string& id) const;

private:
    void EnsureSchema();
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace codeloop::session
