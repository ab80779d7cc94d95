#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace codeloop::sandbox {

struct ProgramFile {
    std::string relative_path;
    std::string content;
};

using ProgramFiles = std::vector<ProgramFile>;

enum class ExitKind {
    kExited,
    kTimedOut,
    kCancelled
};

inline const char* ToString(ExitKind kind) {
    switch (kind) {
        case ExitKind::kExited: return "exited";
        case ExitKind::kTimedOut: return "timed_out";
        case ExitKind::kCancelled: return "cancelled";
    }
    return "unknown";
}

struct ExecutionResult {
    ExitKind kind = ExitKind::kExited;
    // Only meaningful when kind == kExited.
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds duration{0};
    // Cleanup problems after capture. Never affects the fields above.
    std::vector<std::string> teardown_warnings;

    bool Exited() const { return kind == ExitKind::kExited; }
    bool TimedOut() const { return kind == ExitKind::kTimedOut; }
    bool Cancelled() const { return kind == ExitKind::kCancelled; }

    std::string StatusText() const {
        switch (kind) {
            case ExitKind::kExited: return "exit " + std::to_string(exit_code);
            case ExitKind::kTimedOut: return "timed out";
            case ExitKind::kCancelled: return "cancelled";
        }
        return "unknown";
    }
};

}  // namespace codeloop::sandbox
