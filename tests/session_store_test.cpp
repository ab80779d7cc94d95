#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>

#include "orchestrator/session_state.hpp"
#include "sandbox/workspace.hpp"
#include "session/session_store.hpp"

using codeloop::orchestrator::AbortReason;
using codeloop::orchestrator::Attempt;
using codeloop::orchestrator::Classification;
using codeloop::orchestrator::CriterionKind;
using codeloop::orchestrator::OrchestratorState;
using codeloop::orchestrator::SessionState;
using codeloop::orchestrator::Verdict;
using codeloop::sandbox::ExitKind;
using codeloop::session::SessionStore;

namespace {

std::chrono::system_clock::time_point At(std::int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

SessionState MakeSession(const std::string& id, std::int64_t started_ms) {
    SessionState session{};
    session.id = id;
    session.task.objective = "print the answer";
    session.task.constraints = {"stdlib only"};
    session.task.command = {"python3", "main.py"};
    session.task.timeout = std::chrono::seconds(5);
    session.task.criterion = {CriterionKind::kStdoutEquals, "42"};
    session.max_attempts = 3;
    session.started_at = At(started_ms);
    session.finished_at = At(started_ms + 1500);

    Attempt failed{};
    failed.ordinal = 1;
    failed.files = {{"main.py", "print(4 2)\n"}};
    failed.result.kind = ExitKind::kExited;
    failed.result.exit_code = 1;
    failed.result.stderr_text = std::string("SyntaxError: invalid syntax\n") + '\0' + "tail";
    failed.result.duration = std::chrono::milliseconds(120);
    failed.result.stderr_truncated = true;
    failed.result.teardown_warnings = {"failed to remove instance codeloop-1"};
    failed.classification = Classification::kProgramFailure;
    failed.feedback = "Status: exit 1 after 120ms";

    Attempt passed{};
    passed.ordinal = 2;
    passed.files = {{"main.py", "print(42)\n"}, {"lib/util.py", ""}};
    passed.result.kind = ExitKind::kExited;
    passed.result.exit_code = 0;
    passed.result.stdout_text = "42\n";
    passed.result.duration = std::chrono::milliseconds(80);
    passed.classification = Classification::kSucceeded;
    passed.feedback = "Status: exit 0 after 80ms";

    session.attempts = {failed, passed};
    session.verdict = Verdict::kSucceeded;
    session.state = OrchestratorState::kSucceeded;
    return session;
}

class SessionStoreTest : public ::testing::Test {
protected:
    codeloop::sandbox::Workspace dir_ = codeloop::sandbox::Workspace::Create({}, "codeloop_store_");
};

}  // namespace

TEST_F(SessionStoreTest, SaveAndLoadKeepsTheWholeSession) {
    SessionStore store(dir_.Path() / "nested" / "sessions.db");
    ASSERT_TRUE(store.IsOpen());
    ASSERT_TRUE(store.Save(MakeSession("s1", 1700000000000)));

    const auto loaded = store.Load("s1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->verdict, Verdict::kSucceeded);
    EXPECT_EQ(loaded->state, OrchestratorState::kSucceeded);
    EXPECT_EQ(loaded->abort_reason, AbortReason::kNone);
    EXPECT_EQ(loaded->max_attempts, 3);
    EXPECT_EQ(loaded->started_at, At(1700000000000));
    EXPECT_EQ(loaded->finished_at, At(1700000001500));

    EXPECT_EQ(loaded->task.objective, "print the answer");
    EXPECT_EQ(loaded->task.constraints, (std::vector<std::string>{"stdlib only"}));
    EXPECT_EQ(loaded->task.command, (std::vector<std::string>{"python3", "main.py"}));
    ASSERT_TRUE(loaded->task.timeout.has_value());
    EXPECT_EQ(*loaded->task.timeout, std::chrono::seconds(5));
    EXPECT_EQ(loaded->task.criterion.kind, CriterionKind::kStdoutEquals);
    EXPECT_EQ(loaded->task.criterion.expected, "42");

    ASSERT_EQ(loaded->attempts.size(), 2u);
    const auto& first = loaded->attempts[0];
    EXPECT_EQ(first.ordinal, 1);
    EXPECT_EQ(first.classification, Classification::kProgramFailure);
    EXPECT_EQ(first.result.exit_code, 1);
    EXPECT_EQ(first.result.stderr_text, std::string("SyntaxError: invalid syntax\n") + '\0' + "tail");
    EXPECT_TRUE(first.result.stderr_truncated);
    EXPECT_FALSE(first.result.stdout_truncated);
    EXPECT_EQ(first.result.duration, std::chrono::milliseconds(120));
    EXPECT_EQ(first.result.teardown_warnings.size(), 1u);
    ASSERT_EQ(first.files.size(), 1u);
    EXPECT_EQ(first.files[0].content, "print(4 2)\n");

    const auto& second = loaded->attempts[1];
    EXPECT_EQ(second.classification, Classification::kSucceeded);
    EXPECT_EQ(second.result.stdout_text, "42\n");
    ASSERT_EQ(second.files.size(), 2u);
    EXPECT_EQ(second.files[1].relative_path, "lib/util.py");
    EXPECT_EQ(loaded->last_feedback, "Status: exit 0 after 80ms");
}

TEST_F(SessionStoreTest, SaveReplacesAttemptsOfTheSameSession) {
    SessionStore store(dir_.Path() / "sessions.db");
    auto session = MakeSession("s1", 1000);
    ASSERT_TRUE(store.Save(session));

    session.attempts.resize(1);
    session.verdict = Verdict::kAborted;
    session.abort_reason = AbortReason::kCancelled;
    ASSERT_TRUE(store.Save(session));

    const auto loaded = store.Load("s1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->attempts.size(), 1u);
    EXPECT_EQ(loaded->verdict, Verdict::kAborted);
    EXPECT_EQ(loaded->abort_reason, AbortReason::kCancelled);
    EXPECT_EQ(loaded->state, OrchestratorState::kAborted);
    EXPECT_EQ(store.List().size(), 1u);
}

TEST_F(SessionStoreTest, ListIsNewestFirstAndLimited) {
    SessionStore store(dir_.Path() / "sessions.db");
    ASSERT_TRUE(store.Save(MakeSession("old", 1000)));
    ASSERT_TRUE(store.Save(MakeSession("new", 3000)));
    ASSERT_TRUE(store.Save(MakeSession("mid", 2000)));

    const auto all = store.List();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "new");
    EXPECT_EQ(all[1].id, "mid");
    EXPECT_EQ(all[2].id, "old");
    EXPECT_EQ(all[0].attempts, 2);
    EXPECT_EQ(all[0].max_attempts, 3);
    EXPECT_EQ(all[0].verdict, Verdict::kSucceeded);
    EXPECT_EQ(all[0].objective, "print the answer");

    EXPECT_EQ(store.List(1).size(), 1u);
}

TEST_F(SessionStoreTest, DataSurvivesReopening) {
    const auto path = dir_.Path() / "sessions.db";
    {
        SessionStore store(path);
        ASSERT_TRUE(store.Save(MakeSession("s1", 1000)));
    }
    SessionStore reopened(path);
    EXPECT_TRUE(reopened.Load("s1").has_value());
}

TEST_F(SessionStoreTest, UnknownIdIsEmpty) {
    SessionStore store(dir_.Path() / "sessions.db");
    EXPECT_FALSE(store.Load("missing").has_value());
}

TEST_F(SessionStoreTest, UnopenableDatabaseIsInert) {
    const auto blocker = dir_.Path() / "blocker";
    std::ofstream(blocker) << "not a directory";

    SessionStore store(blocker / "sessions.db");
    EXPECT_FALSE(store.IsOpen());
    EXPECT_FALSE(store.Save(MakeSession("s1", 1000)));
    EXPECT_TRUE(store.List().empty());
    EXPECT_FALSE(store.Load("s1").has_value());
}
