#include "session/session_store.hpp"

#include <nlohmann/json.hpp>

#include "session/session_json.hpp"
#include "utils/logging.hpp"

namespace codeloop::session {
namespace {

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// sqlite3_column_text stops at the first NUL; program output may contain one.
std::string ColumnBytes(sqlite3_stmt* stmt, int column) {
    const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, column));
    const auto size = sqlite3_column_bytes(stmt, column);
    return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

}  // namespace

SessionStore::SessionStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::Save(const codeloop::orchestrator::SessionState& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    if (!Exec(db_, "BEGIN TRANSACTION;")) {
        return false;
    }

    bool ok = true;
    sqlite3_stmt* stmt = nullptr;
    const std::string upsert_sql =
        "INSERT INTO sessions(id, objective, verdict, abort_reason, error, attempts, max_attempts, "
        "started_at, finished_at, task) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET objective=excluded.objective, verdict=excluded.verdict, "
        "abort_reason=excluded.abort_reason, error=excluded.error, attempts=excluded.attempts, "
        "max_attempts=excluded.max_attempts, started_at=excluded.started_at, "
        "finished_at=excluded.finished_at, task=excluded.task;";
    if (sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        BindText(stmt, 1, session.id);
        BindText(stmt, 2, session.task.objective);
        BindText(stmt, 3, codeloop::orchestrator::ToString(session.verdict));
        BindText(stmt, 4, codeloop::orchestrator::ToString(session.abort_reason));
        BindText(stmt, 5, session.error);
        sqlite3_bind_int(stmt, 6, static_cast<int>(session.attempts.size()));
        sqlite3_bind_int(stmt, 7, session.max_attempts);
        sqlite3_bind_int64(stmt, 8, ToEpochMillis(session.started_at));
        sqlite3_bind_int64(stmt, 9, ToEpochMillis(session.finished_at));
        BindText(stmt, 10, TaskToJson(session.task).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        ok = sqlite3_step(stmt) == SQLITE_DONE;
    } else {
        ok = false;
    }
    sqlite3_finalize(stmt);

    if (ok) {
        if (sqlite3_prepare_v2(db_, "DELETE FROM attempts WHERE session_id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, session.id);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        } else {
            ok = false;
        }
        sqlite3_finalize(stmt);
    }

    const std::string insert_sql =
        "INSERT INTO attempts(session_id, ordinal, classification, exit_kind, exit_code, duration_ms, "
        "stdout_truncated, stderr_truncated, files, stdout, stderr, feedback, teardown_warnings) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    if (ok && sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        ok = false;
    }
    if (ok) {
        for (const auto& attempt : session.attempts) {
            const auto& result = attempt.result;
            BindText(stmt, 1, session.id);
            sqlite3_bind_int(stmt, 2, attempt.ordinal);
            BindText(stmt, 3, codeloop::orchestrator::ToString(attempt.classification));
            BindText(stmt, 4, codeloop::sandbox::ToString(result.kind));
            sqlite3_bind_int(stmt, 5, result.exit_code);
            sqlite3_bind_int64(stmt, 6, result.duration.count());
            sqlite3_bind_int(stmt, 7, result.stdout_truncated ? 1 : 0);
            sqlite3_bind_int(stmt, 8, result.stderr_truncated ? 1 : 0);
            BindText(stmt, 9, FilesToJson(attempt.files).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            BindText(stmt, 10, result.stdout_text);
            BindText(stmt, 11, result.stderr_text);
            BindText(stmt, 12, attempt.feedback);
            BindText(stmt, 13, nlohmann::json(result.teardown_warnings).dump());
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                ok = false;
                break;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);
    }

    if (!ok) {
        codeloop::utils::LogError("store", std::string("failed to save session ") + session.id + ": " + sqlite3_errmsg(db_));
        Exec(db_, "ROLLBACK;");
        return false;
    }
    return Exec(db_, "COMMIT;");
}

std::vector<SessionSummary> SessionStore::List(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> sessions;
    if (!db_) {
        return sessions;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT id, objective, verdict, abort_reason, attempts, max_attempts, started_at, finished_at "
        "FROM sessions ORDER BY started_at DESC LIMIT ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return sessions;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionSummary info{};
        info.id = SafeText(sqlite3_column_text(stmt, 0));
        info.objective = SafeText(sqlite3_column_text(stmt, 1));
        info.verdict = ParseVerdict(SafeText(sqlite3_column_text(stmt, 2)));
        info.abort_reason = ParseAbortReason(SafeText(sqlite3_column_text(stmt, 3)));
        info.attempts = sqlite3_column_int(stmt, 4);
        info.max_attempts = sqlite3_column_int(stmt, 5);
        info.started_at = FromEpochMillis(sqlite3_column_int64(stmt, 6));
        info.finished_at = FromEpochMillis(sqlite3_column_int64(stmt, 7));
        sessions.push_back(std::move(info));
    }
    sqlite3_finalize(stmt);
    return sessions;
}

std::optional<codeloop::orchestrator::SessionState> SessionStore::Load(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string session_sql =
        "SELECT verdict, abort_reason, error, max_attempts, started_at, finished_at, task "
        "FROM sessions WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, session_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    BindText(stmt, 1, id);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    codeloop::orchestrator::SessionState session{};
    session.id = id;
    session.verdict = ParseVerdict(SafeText(sqlite3_column_text(stmt, 0)));
    session.abort_reason = ParseAbortReason(SafeText(sqlite3_column_text(stmt, 1)));
    session.error = SafeText(sqlite3_column_text(stmt, 2));
    session.max_attempts = sqlite3_column_int(stmt, 3);
    session.started_at = FromEpochMillis(sqlite3_column_int64(stmt, 4));
    session.finished_at = FromEpochMillis(sqlite3_column_int64(stmt, 5));
    session.task = TaskFromJson(nlohmann::json::parse(SafeText(sqlite3_column_text(stmt, 6)), nullptr, false));
    sqlite3_finalize(stmt);

    switch (session.verdict) {
        case codeloop::orchestrator::Verdict::kSucceeded:
            session.state = codeloop::orchestrator::OrchestratorState::kSucceeded;
            break;
        case codeloop::orchestrator::Verdict::kFailed:
            session.state = codeloop::orchestrator::OrchestratorState::kFailed;
            break;
        case codeloop::orchestrator::Verdict::kAborted:
        case codeloop::orchestrator::Verdict::kNone:
            session.state = codeloop::orchestrator::OrchestratorState::kAborted;
            break;
    }

    const std::string attempt_sql =
        "SELECT ordinal, classification, exit_kind, exit_code, duration_ms, stdout_truncated, "
        "stderr_truncated, files, stdout, stderr, feedback, teardown_warnings "
        "FROM attempts WHERE session_id = ? ORDER BY ordinal ASC;";
    if (sqlite3_prepare_v2(db_, attempt_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        BindText(stmt, 1, id);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            codeloop::orchestrator::Attempt attempt{};
            attempt.ordinal = sqlite3_column_int(stmt, 0);
            attempt.classification = ParseClassification(SafeText(sqlite3_column_text(stmt, 1)));
            auto& result = attempt.result;
            result.kind = ParseExitKind(SafeText(sqlite3_column_text(stmt, 2)));
            result.exit_code = sqlite3_column_int(stmt, 3);
            result.duration = std::chrono::milliseconds(sqlite3_column_int64(stmt, 4));
            result.stdout_truncated = sqlite3_column_int(stmt, 5) != 0;
            result.stderr_truncated = sqlite3_column_int(stmt, 6) != 0;
            attempt.files = FilesFromJson(nlohmann::json::parse(SafeText(sqlite3_column_text(stmt, 7)), nullptr, false));
            result.stdout_text = ColumnBytes(stmt, 8);
            result.stderr_text = ColumnBytes(stmt, 9);
            attempt.feedback = ColumnBytes(stmt, 10);
            const auto warnings = nlohmann::json::parse(SafeText(sqlite3_column_text(stmt, 11)), nullptr, false);
            if (warnings.is_array()) {
                for (const auto& warning : warnings) {
                    if (warning.is_string()) {
                        result.teardown_warnings.push_back(warning.get<std::string>());
                    }
                }
            }
            session.attempts.push_back(std::move(attempt));
        }
    }
    sqlite3_finalize(stmt);

    if (!session.attempts.empty()) {
        session.last_feedback = session.attempts.back().feedback;
    }
    return session;
}

void SessionStore::EnsureSchema() {
    if (db_) {
        return;
    }
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        codeloop::utils::LogError("store", "failed to open sqlite db: " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, 5000);
    Exec(db_, "PRAGMA journal_mode=WAL;");
    const bool ok =
        Exec(db_, "CREATE TABLE IF NOT EXISTS sessions ("
                  "id TEXT PRIMARY KEY,"
                  "objective TEXT,"
                  "verdict TEXT,"
                  "abort_reason TEXT,"
                  "error TEXT,"
                  "attempts INTEGER,"
                  "max_attempts INTEGER,"
                  "started_at INTEGER,"
                  "finished_at INTEGER,"
                  "task TEXT"
                  ");") &&
        Exec(db_, "CREATE TABLE IF NOT EXISTS attempts ("
                  "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  "session_id TEXT,"
                  "ordinal INTEGER,"
                  "classification TEXT,"
                  "exit_kind TEXT,"
                  "exit_code INTEGER,"
                  "duration_ms INTEGER,"
                  "stdout_truncated INTEGER,"
                  "stderr_truncated INTEGER,"
                  "files TEXT,"
                  "stdout TEXT,"
                  "stderr TEXT,"
                  "feedback TEXT,"
                  "teardown_warnings TEXT"
                  ");") &&
        Exec(db_, "CREATE INDEX IF NOT EXISTS idx_attempts_session ON attempts(session_id);");
    if (!ok) {
        codeloop::utils::LogError("store", "failed to create schema in " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            codeloop::utils::LogError("store", std::string("sqlite exec error: ") + err);
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::string SessionStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace codeloop::session
