#pragma once

#include <stdexcept>
#include <string>

namespace codeloop::sandbox {

// Environment-level faults. Program failures never raise; they are reported
// inside ExecutionResult.
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class WorkspaceError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class ImageBuildError : public SandboxError {
public:
    ImageBuildError(const std::string& message, std::string build_log)
        : SandboxError(message)
        , build_log_(std::move(build_log)) {}

    const std::string& BuildLog() const { return build_log_; }

private:
    std::string build_log_;
};

class InstanceStartError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

}  // namespace codeloop::sandbox
