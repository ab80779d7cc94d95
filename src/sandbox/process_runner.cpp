#include "sandbox/process_runner.hpp"

#include <boost/process/v1.hpp>
#include <chrono>
#include <istream>
#include <system_error>
#include <thread>
#include <sys/wait.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeloop::sandbox {
namespace bp = boost::process::v1;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

class BoundedCapture {
public:
    explicit BoundedCapture(std::size_t cap)
        : cap_(cap) {}

    void Drain(std::istream& input) {
        char buffer[4096];
        while (true) {
            input.read(buffer, sizeof(buffer));
            const auto count = static_cast<std::size_t>(input.gcount());
            if (count == 0) {
                break;
            }
            Append(buffer, count);
        }
    }

    bool Truncated() const { return omitted_ > 0; }

    std::string Text() const {
        if (omitted_ == 0) {
            return kept_;
        }
        return kept_ + TruncationMarker(omitted_);
    }

private:
    void Append(const char* data, std::size_t count) {
        const auto room = cap_ > kept_.size() ? cap_ - kept_.size() : 0;
        const auto take = count < room ? count : room;
        kept_.append(data, take);
        omitted_ += count - take;
    }

    std::size_t cap_;
    std::string kept_;
    std::size_t omitted_ = 0;
};

std::filesystem::path ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return std::filesystem::path(name);
    }
    const auto found = bp::search_path(name);
    return std::filesystem::path(found.string());
}

}  // namespace

std::string TruncationMarker(std::size_t omitted_bytes) {
    return "\n[codeloop: output truncated, " + std::to_string(omitted_bytes) + " bytes omitted]\n";
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    ProcessResult result{};
    if (argv.empty()) {
        result.launch_failed = true;
        result.error = "Error: exec failed: empty command";
        return result;
    }

    const auto executable = ResolveExecutable(argv.front());
    if (executable.empty()) {
        result.launch_failed = true;
        result.error = "Error: exec failed: " + argv.front() + " not found in PATH";
        return result;
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    const auto working_dir = options.working_dir.empty()
        ? std::filesystem::current_path()
        : options.working_dir;

    BoundedCapture stdout_capture(options.output_cap_bytes);
    BoundedCapture stderr_capture(options.output_cap_bytes);
    bp::ipstream stdout_stream;
    bp::ipstream stderr_stream;

    const auto start = std::chrono::steady_clock::now();
    // The child leads its own process group so a kill also reaches anything
    // it forked that still holds the output pipes.
    bp::group process_group;
    bp::child child_process;
    try {
        child_process = bp::child(
            bp::exe = executable.string(),
            bp::args = args,
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_stream,
            bp::std_err > stderr_stream,
            process_group);
    } catch (const bp::process_error& ex) {
        result.launch_failed = true;
        result.error = std::string("Error: exec failed: ") + ex.what();
        return result;
    }

    std::thread stdout_reader([&]() { stdout_capture.Drain(stdout_stream); });
    std::thread stderr_reader([&]() { stderr_capture.Drain(stderr_stream); });

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    std::error_code ec;
    while (child_process.running(ec)) {
        if (options.cancel && options.cancel->IsCancelled()) {
            result.cancelled = true;
            break;
        }
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    const auto stopped = std::chrono::steady_clock::now();

    if (result.timed_out || result.cancelled) {
        std::error_code kill_ec;
        process_group.terminate(kill_ec);
        child_process.terminate(kill_ec);
        if (kill_ec) {
            codeloop::utils::LogWarn("process", "terminate failed: " + kill_ec.message());
        }
    } else if (ec) {
        codeloop::utils::LogWarn("process", "wait failed: " + ec.message());
    } else {
        const int status = child_process.native_exit_code();
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        // Leftover background processes would keep the pipes open.
        std::error_code group_ec;
        process_group.terminate(group_ec);
    }

    stdout_reader.join();
    stderr_reader.join();

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(stopped - start);
    result.output = stdout_capture.Text();
    result.error = stderr_capture.Text();
    result.output_truncated = stdout_capture.Truncated();
    result.error_truncated = stderr_capture.Truncated();
    return result;
}

}  // namespace codeloop::sandbox
