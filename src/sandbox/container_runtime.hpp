#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/process_runner.hpp"

namespace codeloop::sandbox {

struct ImageDescriptor {
    std::string tag;
    // Dockerfile text.
    std::string recipe;
};

struct ImageHandle {
    std::string tag;
    std::string image_id;
    bool built_by_this_process = false;

    bool operator==(const ImageHandle& other) const {
        return tag == other.tag && image_id == other.image_id;
    }
};

struct BuildOutcome {
    bool success = false;
    std::string log;
};

struct InstanceSpec {
    std::string name;
    std::string image;
    std::filesystem::path host_workspace;
    std::string mount_path = "/app";
    std::vector<std::string> command;
    std::string memory_limit;
    int pids_limit = 0;
    double cpus = 0.0;
    // "uid:gid"; empty runs as the image's default user.
    std::string user;
};

// The capability set the sandbox and image cache need from a container
// engine. Implementations must be usable from several sessions at once.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Image id when the tag exists locally.
    virtual std::optional<std::string> InspectImage(const std::string& tag) = 0;
    virtual BuildOutcome BuildImage(const ImageDescriptor& descriptor) = 0;

    // Throws InstanceStartError.
    virtual void CreateInstance(const InstanceSpec& spec) = 0;
    // Runs the created instance to completion, or until the deadline or
    // cancellation in options. Throws InstanceStartError when the engine
    // cannot start it.
    virtual ProcessResult StartInstance(const std::string& name, const ProcessOptions& options) = 0;

    // Both return false on failure; a missing instance counts as success.
    virtual bool KillInstance(const std::string& name) = 0;
    virtual bool RemoveInstance(const std::string& name) = 0;
};

}  // namespace codeloop::sandbox
