#include "sandbox/sandbox.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "sandbox/docker_runtime.hpp"
#include "sandbox/image_recipe.hpp"
#include "sandbox/sandbox_errors.hpp"
#include "sandbox/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::sandbox {
namespace {

std::string RandomSuffix() {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution(0, 0xffffff);
    std::ostringstream oss;
    oss << std::hex << std::setw(6) << std::setfill('0') << distribution(generator);
    return oss.str();
}

ExecutionResult ToExecutionResult(const ProcessResult& process) {
    ExecutionResult result{};
    if (process.cancelled) {
        result.kind = ExitKind::kCancelled;
    } else if (process.timed_out) {
        result.kind = ExitKind::kTimedOut;
    } else {
        result.kind = ExitKind::kExited;
        result.exit_code = process.exit_code;
    }
    result.stdout_text = process.output;
    result.stderr_text = process.error;
    result.stdout_truncated = process.output_truncated;
    result.stderr_truncated = process.error_truncated;
    result.duration = process.duration;
    return result;
}

void AddWarning(ExecutionResult& result, const std::string& warning) {
    codeloop::utils::LogWarn("sandbox", warning);
    result.teardown_warnings.push_back(warning);
}

}  // namespace

SandboxOptions SandboxOptionsFromConfig(const codeloop::config::SandboxConfig& config) {
    SandboxOptions options{};
    options.image = DescriptorFromConfig(config);
    options.mount_path = config.mount_path;
    if (!config.workspace_root.empty()) {
        options.workspace_root = codeloop::utils::ExpandHome(config.workspace_root);
    }
    options.workspace_prefix = config.workspace_prefix;
    options.instance_prefix = config.instance_prefix;
    options.output_cap_bytes = config.output_cap_bytes;
    options.memory_limit = config.memory_limit;
    options.pids_limit = config.pids_limit;
    options.cpus = config.cpus;
    if (config.map_host_user) {
        options.user = HostUserSpec();
    }
    return options;
}

InstanceLease::InstanceLease(ContainerRuntime& runtime, std::string name)
    : runtime_(runtime)
    , name_(std::move(name)) {}

InstanceLease::~InstanceLease() {
    if (released_) {
        return;
    }
    try {
        if (!Release()) {
            codeloop::utils::LogWarn("sandbox", "instance " + name_ + " was not removed");
        }
    } catch (const std::exception& ex) {
        codeloop::utils::LogWarn("sandbox", "instance " + name_ + " was not removed: " + ex.what());
    }
}

bool InstanceLease::Release() {
    if (released_) {
        return true;
    }
    released_ = true;
    return runtime_.RemoveInstance(name_);
}

Sandbox::Sandbox(ContainerRuntime& runtime, ImageCache& cache, SandboxOptions options)
    : runtime_(runtime)
    , cache_(cache)
    , options_(std::move(options)) {}

std::string Sandbox::NextInstanceName() {
    const auto ordinal = counter_.fetch_add(1) + 1;
    return options_.instance_prefix + std::to_string(::getpid()) + "-" + std::to_string(ordinal) + "-" +
           RandomSuffix();
}

ExecutionResult Sandbox::Run(const ProgramFiles& files,
                             const std::vector<std::string>& command,
                             std::chrono::milliseconds timeout,
                             const CancelToken* cancel) {
    if (command.empty()) {
        throw InstanceStartError("no command to run");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("sandbox runs need a positive timeout, got " +
                                    std::to_string(timeout.count()) + "ms");
    }

    auto workspace = Workspace::Create(options_.workspace_root, options_.workspace_prefix);
    for (const auto& file : files) {
        workspace.WriteFile(file.relative_path, file.content);
    }

    const auto image = cache_.Ensure(options_.image);

    InstanceSpec spec{};
    spec.name = NextInstanceName();
    spec.image = image.tag;
    spec.host_workspace = workspace.Path();
    spec.mount_path = options_.mount_path;
    spec.command = command;
    spec.memory_limit = options_.memory_limit;
    spec.pids_limit = options_.pids_limit;
    spec.cpus = options_.cpus;
    spec.user = options_.user;

    ExecutionResult result{};
    {
        InstanceLease lease(runtime_, spec.name);
        runtime_.CreateInstance(spec);

        ProcessOptions process_options{};
        process_options.timeout = timeout;
        process_options.output_cap_bytes = options_.output_cap_bytes;
        process_options.working_dir = workspace.Path();
        process_options.cancel = cancel;

        codeloop::utils::LogInfo("sandbox", "running " + codeloop::utils::Join(command, " ") + " in " + spec.name);
        result = ToExecutionResult(runtime_.StartInstance(spec.name, process_options));
        codeloop::utils::LogInfo("sandbox", spec.name + " finished: " + result.StatusText() + " after " +
                                                std::to_string(result.duration.count()) + "ms");

        // Only the attached client was killed; the instance may still run.
        if (!result.Exited()) {
            try {
                if (!runtime_.KillInstance(spec.name)) {
                    AddWarning(result, "failed to stop instance " + spec.name);
                }
            } catch (const std::exception& ex) {
                AddWarning(result, "failed to stop instance " + spec.name + ": " + ex.what());
            }
        }
        try {
            if (!lease.Release()) {
                AddWarning(result, "failed to remove instance " + spec.name);
            }
        } catch (const std::exception& ex) {
            AddWarning(result, "failed to remove instance " + spec.name + ": " + ex.what());
        }
    }

    const auto ec = workspace.Remove();
    if (ec) {
        AddWarning(result, "failed to remove workspace " + workspace.Path().string() + ": " + ec.message());
    }
    return result;
}

}  // namespace codeloop::sandbox
