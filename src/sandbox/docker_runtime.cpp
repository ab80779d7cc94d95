#include "sandbox/docker_runtime.hpp"

#include <sstream>
#include <unistd.h>

#include "sandbox/sandbox_errors.hpp"
#include "sandbox/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::sandbox {
namespace {

constexpr auto kCliTimeout = std::chrono::seconds(60);
constexpr std::size_t kCliOutputCap = 256 * 1024;

bool Contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

std::string Describe(const ProcessResult& result) {
    if (result.launch_failed) {
        return result.error;
    }
    if (result.timed_out) {
        return "runtime command timed out";
    }
    const auto text = codeloop::utils::TrimRight(result.error.empty() ? result.output : result.error);
    return "exit " + std::to_string(result.exit_code) + (text.empty() ? "" : ": " + text);
}

}  // namespace

std::string HostUserSpec() {
    return std::to_string(::getuid()) + ":" + std::to_string(::getgid());
}

DockerRuntime::DockerRuntime(std::string binary, std::chrono::seconds build_timeout)
    : binary_(std::move(binary))
    , build_timeout_(build_timeout) {}

ProcessResult DockerRuntime::RunCli(const std::vector<std::string>& args, std::chrono::seconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions options{};
    options.timeout = timeout;
    options.output_cap_bytes = kCliOutputCap;
    codeloop::utils::LogDebug("runtime", codeloop::utils::Join(argv, " "));
    return ProcessRunner::Run(argv, options);
}

bool DockerRuntime::IsAvailable() const {
    const auto result = RunCli({"version", "--format", "{{.Server.Version}}"}, std::chrono::seconds(10));
    return !result.launch_failed && !result.timed_out && result.exit_code == 0;
}

std::optional<std::string> DockerRuntime::InspectImage(const std::string& tag) {
    const auto result = RunCli({"image", "inspect", "--format", "{{.Id}}", tag}, kCliTimeout);
    if (result.launch_failed || result.timed_out || result.exit_code != 0) {
        return std::nullopt;
    }
    return codeloop::utils::TrimRight(result.output);
}

BuildOutcome DockerRuntime::BuildImage(const ImageDescriptor& descriptor) {
    BuildOutcome outcome{};
    try {
        auto context = Workspace::Create({}, "codeloop_build_");
        context.WriteFile("Dockerfile", descriptor.recipe);

        codeloop::utils::LogInfo("runtime", "building image " + descriptor.tag);
        const auto result = RunCli(
            {"build", "--tag", descriptor.tag, "--file", (context.Path() / "Dockerfile").string(),
             context.Path().string()},
            build_timeout_);
        outcome.log = result.output;
        if (!result.error.empty()) {
            outcome.log += (outcome.log.empty() ? "" : "\n") + result.error;
        }
        outcome.success = !result.launch_failed && !result.timed_out && result.exit_code == 0;
        if (!outcome.success) {
            outcome.log += "\n" + Describe(result);
        }
    } catch (const WorkspaceError& ex) {
        outcome.success = false;
        outcome.log = std::string("cannot prepare build context: ") + ex.what();
    }
    return outcome;
}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const std::string& binary, const InstanceSpec& spec) {
    std::vector<std::string> args = {
        binary,
        "create",
        "--name", spec.name,
        "--network", "none",
        "--mount", "type=bind,source=" + spec.host_workspace.string() + ",target=" + spec.mount_path,
        "--workdir", spec.mount_path,
        "--read-only",
        "--tmpfs", "/tmp:rw,size=64m",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--env", "HOME=/tmp"
    };
    if (!spec.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(spec.memory_limit);
        args.push_back("--memory-swap");
        args.push_back(spec.memory_limit);
    }
    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }
    if (spec.cpus > 0.0) {
        std::ostringstream cpus;
        cpus << spec.cpus;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }
    if (!spec.user.empty()) {
        args.push_back("--user");
        args.push_back(spec.user);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

void DockerRuntime::CreateInstance(const InstanceSpec& spec) {
    auto argv = BuildCreateArgs(binary_, spec);
    argv.erase(argv.begin());
    const auto result = RunCli(argv, kCliTimeout);
    if (result.launch_failed || result.timed_out || result.exit_code != 0) {
        throw InstanceStartError("cannot create instance " + spec.name + ": " + Describe(result));
    }
}

ProcessResult DockerRuntime::StartInstance(const std::string& name, const ProcessOptions& options) {
    ProcessOptions attach_options = options;
    attach_options.working_dir.clear();
    auto result = ProcessRunner::Run({binary_, "start", "--attach", name}, attach_options);
    if (result.launch_failed) {
        throw InstanceStartError("cannot start instance " + name + ": " + result.error);
    }
    // The engine reports its own start failures on stderr before any program output.
    if (!result.timed_out && !result.cancelled && result.exit_code != 0 &&
        result.error.rfind("Error response from daemon", 0) == 0) {
        throw InstanceStartError("cannot start instance " + name + ": " + Describe(result));
    }
    return result;
}

bool DockerRuntime::KillInstance(const std::string& name) {
    const auto result = RunCli({"kill", name}, kCliTimeout);
    if (!result.launch_failed && !result.timed_out && result.exit_code == 0) {
        return true;
    }
    if (Contains(result.error, "is not running") || Contains(result.error, "No such container")) {
        return true;
    }
    codeloop::utils::LogWarn("runtime", "kill " + name + " failed: " + Describe(result));
    return false;
}

bool DockerRuntime::RemoveInstance(const std::string& name) {
    const auto result = RunCli({"rm", "--force", "--volumes", name}, kCliTimeout);
    if (!result.launch_failed && !result.timed_out && result.exit_code == 0) {
        return true;
    }
    if (Contains(result.error, "No such container")) {
        return true;
    }
    codeloop::utils::LogWarn("runtime", "remove " + name + " failed: " + Describe(result));
    return false;
}

}  // namespace codeloop::sandbox
