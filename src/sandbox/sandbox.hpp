#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/cancel_token.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/image_cache.hpp"
#include "sandbox/sandbox_types.hpp"

namespace codeloop::sandbox {

struct SandboxOptions {
    ImageDescriptor image;
    std::string mount_path = "/app";
    std::filesystem::path workspace_root;
    std::string workspace_prefix = "codeloop_ws_";
    std::string instance_prefix = "codeloop-";
    std::size_t output_cap_bytes = 64 * 1024;
    std::string memory_limit;
    int pids_limit = 0;
    double cpus = 0.0;
    std::string user;
};

// Throws ImageBuildError when sandbox.recipePath cannot be read.
SandboxOptions SandboxOptionsFromConfig(const codeloop::config::SandboxConfig& config);

// Removes its instance when it goes out of scope. Armed before the instance
// is created, so a half-created instance is still removed.
class InstanceLease {
public:
    InstanceLease(ContainerRuntime& runtime, std::string name);
    ~InstanceLease();

    InstanceLease(const InstanceLease&) = delete;
    InstanceLease& operator=(const InstanceLease&) = delete;

    const std::string& Name() const { return name_; }

    // Removes the instance now. Returns false when the runtime reports a
    // failure; the lease is spent either way.
    bool Release();

private:
    ContainerRuntime& runtime_;
    std::string name_;
    bool released_ = false;
};

// One isolated execution per Run() call. A Sandbox holds no per-run state,
// so one instance may serve several sessions at once.
class Sandbox {
public:
    Sandbox(ContainerRuntime& runtime, ImageCache& cache, SandboxOptions options);

    // Writes files into a fresh workspace, runs command in a new instance
    // with the workspace mounted at the mount path, then removes the instance
    // and the workspace. Program failures are reported in the result.
    // Throws WorkspaceError, ImageBuildError or InstanceStartError; the
    // workspace and instance are gone by the time it returns or throws.
    // A non-positive timeout is rejected with std::invalid_argument before
    // anything is created.
    ExecutionResult Run(const ProgramFiles& files,
                        const std::vector<std::string>& command,
                        std::chrono::milliseconds timeout,
                        const CancelToken* cancel = nullptr);

    const SandboxOptions& Options() const { return options_; }

private:
    std::string NextInstanceName();

    ContainerRuntime& runtime_;
    ImageCache& cache_;
    SandboxOptions options_;
    std::atomic<unsigned long> counter_{0};
};

}  // namespace codeloop::sandbox
