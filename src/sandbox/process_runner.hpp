#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/cancel_token.hpp"

namespace codeloop::sandbox {

struct ProcessOptions {
    // Zero means no deadline.
    std::chrono::milliseconds timeout{0};
    // Per stream. Bytes past the cap are drained and counted, not kept.
    std::size_t output_cap_bytes = 64 * 1024;
    std::filesystem::path working_dir;
    const CancelToken* cancel = nullptr;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool launch_failed = false;
    std::string output;
    std::string error;
    bool output_truncated = false;
    bool error_truncated = false;
    std::chrono::milliseconds duration{0};
};

// Appended to a capped stream after the kept prefix.
std::string TruncationMarker(std::size_t omitted_bytes);

class ProcessRunner {
public:
    // argv[0] is resolved through PATH unless it contains a slash. The child
    // is killed (SIGKILL) when the deadline passes or the token is cancelled.
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options);
};

}  // namespace codeloop::sandbox
