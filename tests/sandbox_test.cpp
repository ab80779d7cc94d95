#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "fake_runtime.hpp"
#include "sandbox/image_cache.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/sandbox_errors.hpp"
#include "sandbox/workspace.hpp"

using codeloop::sandbox::CancelToken;
using codeloop::sandbox::ExitKind;
using codeloop::sandbox::ImageBuildError;
using codeloop::sandbox::ImageCache;
using codeloop::sandbox::InstanceStartError;
using codeloop::sandbox::ProgramFiles;
using codeloop::sandbox::Sandbox;
using codeloop::sandbox::SandboxOptions;
using codeloop::sandbox::Workspace;
using codeloop::sandbox::WorkspaceError;
using codeloop::test::LocalProcessRuntime;

namespace {

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::make_unique<Workspace>(Workspace::Create({}, "codeloop_sandbox_root_"));
        options_.image = {"codeloop-test:1", "FROM scratch\n"};
        options_.workspace_root = root_->Path();
        options_.workspace_prefix = "ws_";
        options_.instance_prefix = "test-";
        runtime_.AddImage("codeloop-test:1");
    }

    // Workspaces left under the root after a run.
    std::size_t LeftoverWorkspaces() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root_->Path())) {
            (void)entry;
            ++count;
        }
        return count;
    }

    Sandbox MakeSandbox() { return Sandbox(runtime_, cache_, options_); }

    LocalProcessRuntime runtime_;
    ImageCache cache_{runtime_};
    SandboxOptions options_;
    std::unique_ptr<Workspace> root_;
};

const ProgramFiles kPrintOk = {{"main.sh", "echo ok\n"}};

}  // namespace

TEST_F(SandboxTest, RunsProgramAndReportsOutput) {
    auto sandbox = MakeSandbox();
    const auto result = sandbox.Run(kPrintOk, {"sh", "main.sh"}, std::chrono::seconds(10));

    EXPECT_EQ(result.kind, ExitKind::kExited);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "ok\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_TRUE(result.teardown_warnings.empty());
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
    EXPECT_EQ(runtime_.LiveInstances(), 0u);
}

TEST_F(SandboxTest, MountsTheWorkspaceWithOptions) {
    options_.memory_limit = "256m";
    options_.pids_limit = 64;
    options_.user = "1000:1000";
    auto sandbox = MakeSandbox();
    sandbox.Run(kPrintOk, {"sh", "main.sh"}, std::chrono::seconds(10));

    const auto spec = runtime_.LastSpec();
    EXPECT_EQ(spec.image, "codeloop-test:1");
    EXPECT_EQ(spec.mount_path, "/app");
    EXPECT_EQ(spec.host_workspace.parent_path(), root_->Path());
    EXPECT_EQ(spec.memory_limit, "256m");
    EXPECT_EQ(spec.pids_limit, 64);
    EXPECT_EQ(spec.user, "1000:1000");
    EXPECT_EQ(spec.name.rfind("test-", 0), 0u);
}

TEST_F(SandboxTest, ProgramFailureIsDataNotAnError) {
    auto sandbox = MakeSandbox();
    const ProgramFiles files = {{"main.sh", "echo 'Traceback (most recent call last):' >&2\nexit 1\n"}};
    const auto result = sandbox.Run(files, {"sh", "main.sh"}, std::chrono::seconds(10));

    EXPECT_EQ(result.kind, ExitKind::kExited);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("Traceback"), std::string::npos);
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, TimeoutKillsAndCleansUp) {
    auto sandbox = MakeSandbox();
    const ProgramFiles files = {{"main.sh", "sleep 30\n"}};
    const auto start = std::chrono::steady_clock::now();
    const auto result = sandbox.Run(files, {"sh", "main.sh"}, std::chrono::seconds(2));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.kind, ExitKind::kTimedOut);
    EXPECT_TRUE(result.TimedOut());
    EXPECT_GE(result.duration, std::chrono::milliseconds(2000));
    EXPECT_LT(result.duration, std::chrono::milliseconds(3000));
    EXPECT_LT(elapsed, std::chrono::seconds(4));
    EXPECT_EQ(runtime_.Killed().size(), 1u);
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
    EXPECT_EQ(runtime_.LiveInstances(), 0u);
}

TEST_F(SandboxTest, CancellationStopsAndCleansUp) {
    auto sandbox = MakeSandbox();
    CancelToken cancel;
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancel.Cancel();
    });
    const auto result = sandbox.Run({{"main.sh", "sleep 30\n"}}, {"sh", "main.sh"}, std::chrono::seconds(20), &cancel);
    canceller.join();

    EXPECT_TRUE(result.Cancelled());
    EXPECT_EQ(runtime_.Killed().size(), 1u);
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
    EXPECT_EQ(runtime_.LiveInstances(), 0u);
}

TEST_F(SandboxTest, OutputIsCapped) {
    options_.output_cap_bytes = 10;
    auto sandbox = MakeSandbox();
    const auto result = sandbox.Run({{"main.sh", "printf '0123456789ABCDEF'\n"}}, {"sh", "main.sh"},
                                    std::chrono::seconds(10));
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stdout_text, "0123456789" + codeloop::sandbox::TruncationMarker(6));
}

TEST_F(SandboxTest, StartFailureStillRemovesInstanceAndWorkspace) {
    runtime_.failing_creates = 1;
    auto sandbox = MakeSandbox();
    EXPECT_THROW(sandbox.Run(kPrintOk, {"sh", "main.sh"}, std::chrono::seconds(10)), InstanceStartError);

    ASSERT_EQ(runtime_.Created().size(), 1u);
    ASSERT_EQ(runtime_.Removed().size(), 1u);
    EXPECT_EQ(runtime_.Removed().front(), runtime_.Created().front());
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, BuildFailureRemovesWorkspace) {
    options_.image = {"codeloop-missing:1", "FROM nowhere\n"};
    runtime_.failing_builds = 1;
    auto sandbox = MakeSandbox();
    EXPECT_THROW(sandbox.Run(kPrintOk, {"sh", "main.sh"}, std::chrono::seconds(10)), ImageBuildError);
    EXPECT_TRUE(runtime_.Created().empty());
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, InvalidFilePathIsAWorkspaceError) {
    auto sandbox = MakeSandbox();
    EXPECT_THROW(sandbox.Run({{"../outside.sh", "echo no\n"}}, {"sh", "main.sh"}, std::chrono::seconds(10)),
                 WorkspaceError);
    EXPECT_TRUE(runtime_.Created().empty());
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, TeardownFailureIsReportedNotRaised) {
    runtime_.fail_remove = true;
    auto sandbox = MakeSandbox();
    const auto result = sandbox.Run(kPrintOk, {"sh", "main.sh"}, std::chrono::seconds(10));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "ok\n");
    ASSERT_EQ(result.teardown_warnings.size(), 1u);
    EXPECT_NE(result.teardown_warnings.front().find("failed to remove instance"), std::string::npos);
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, ConcurrentRunsUseSeparateWorkspacesAndInstances) {
    auto sandbox = MakeSandbox();
    const ProgramFiles files = {{"main.sh", "pwd\n"}};
    codeloop::sandbox::ExecutionResult first;
    codeloop::sandbox::ExecutionResult second;
    std::thread a([&]() { first = sandbox.Run(files, {"sh", "main.sh"}, std::chrono::seconds(10)); });
    std::thread b([&]() { second = sandbox.Run(files, {"sh", "main.sh"}, std::chrono::seconds(10)); });
    a.join();
    b.join();

    EXPECT_NE(first.stdout_text, second.stdout_text);
    const auto created = runtime_.Created();
    ASSERT_EQ(created.size(), 2u);
    EXPECT_NE(created[0], created[1]);
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}

TEST_F(SandboxTest, NonPositiveTimeoutIsRejected) {
    auto sandbox = MakeSandbox();
    const ProgramFiles sleeper = {{"main.sh", "sleep 3\n"}};
    EXPECT_THROW(sandbox.Run(sleeper, {"sh", "main.sh"}, std::chrono::milliseconds(0)), std::invalid_argument);
    EXPECT_THROW(sandbox.Run(sleeper, {"sh", "main.sh"}, std::chrono::milliseconds(-1)), std::invalid_argument);
    EXPECT_TRUE(runtime_.Created().empty());
    EXPECT_EQ(LeftoverWorkspaces(), 0u);
}
