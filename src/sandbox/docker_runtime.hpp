#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/container_runtime.hpp"

namespace codeloop::sandbox {

// ContainerRuntime on top of the docker CLI. Any binary accepting the same
// arguments (podman) works.
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string binary = "docker",
                           std::chrono::seconds build_timeout = std::chrono::seconds(900));

    std::optional<std::string> InspectImage(const std::string& tag) override;
    BuildOutcome BuildImage(const ImageDescriptor& descriptor) override;
    void CreateInstance(const InstanceSpec& spec) override;
    ProcessResult StartInstance(const std::string& name, const ProcessOptions& options) override;
    bool KillInstance(const std::string& name) override;
    bool RemoveInstance(const std::string& name) override;

    bool IsAvailable() const;

    // Full argv of the `create` call: no network, the workspace as the only
    // bind mount, read-only root with a private /tmp, no capabilities.
    static std::vector<std::string> BuildCreateArgs(const std::string& binary, const InstanceSpec& spec);

private:
    ProcessResult RunCli(const std::vector<std::string>& args, std::chrono::seconds timeout) const;

    std::string binary_;
    std::chrono::seconds build_timeout_;
};

// "uid:gid" of this process.
std::string HostUserSpec();

}  // namespace codeloop::sandbox
