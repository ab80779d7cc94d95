#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "generator/llm_code_generator.hpp"
#include "orchestrator/orchestrator.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/docker_runtime.hpp"
#include "sandbox/image_cache.hpp"
#include "sandbox/image_recipe.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/sandbox_errors.hpp"
#include "session/artifact_writer.hpp"
#include "session/session_store.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

constexpr int kExitSucceeded = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;
constexpr int kExitAborted = 3;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  codeloop [--config PATH] [--verbose] run (--objective TEXT | --objective-file PATH)\n"
        << "           [--constraint TEXT]... [--max-attempts N] [--timeout SECONDS]\n"
        << "           [--expect-stdout TEXT | --expect-contains TEXT | --expect-match REGEX]\n"
        << "           [--no-artifacts] [-- COMMAND ARGS...]\n"
        << "  codeloop [--config PATH] [--verbose] run --resume SESSION_ID [--max-attempts N] [--no-artifacts]\n"
        << "  codeloop [--config PATH] build-image\n"
        << "  codeloop [--config PATH] history [--limit N]\n"
        << "  codeloop [--config PATH] show SESSION_ID\n";
}

struct GlobalOptions {
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

std::optional<GlobalOptions> ParseGlobal(int argc, char** argv) {
    GlobalOptions options{};
    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            break;
        }
    }
    if (i >= argc) {
        return std::nullopt;
    }
    options.command = argv[i++];
    for (; i < argc; ++i) {
        options.args.emplace_back(argv[i]);
    }
    return options;
}

std::optional<int> ParsePositive(const std::string& text) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size() || value <= 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::filesystem::path DataDir(const codeloop::config::Config& config) {
    return codeloop::utils::ExpandHome(config.storage.data_dir);
}

int ExitCodeFor(codeloop::orchestrator::Verdict verdict) {
    switch (verdict) {
        case codeloop::orchestrator::Verdict::kSucceeded: return kExitSucceeded;
        case codeloop::orchestrator::Verdict::kFailed: return kExitFailed;
        case codeloop::orchestrator::Verdict::kAborted:
        case codeloop::orchestrator::Verdict::kNone: return kExitAborted;
    }
    return kExitAborted;
}

void PrintSession(const codeloop::orchestrator::SessionState& session, bool with_reports) {
    std::cout << "Session:   " << session.id << "\n"
              << "Objective: " << session.task.objective << "\n"
              << "Verdict:   " << codeloop::orchestrator::ToString(session.verdict);
    if (session.abort_reason != codeloop::orchestrator::AbortReason::kNone) {
        std::cout << " (" << codeloop::orchestrator::ToString(session.abort_reason) << ")";
    }
    std::cout << "\n"
              << "Attempts:  " << session.attempts.size() << "/" << session.max_attempts << "\n";
    if (!session.error.empty()) {
        std::cout << "Error:     " << session.error << "\n";
    }

    for (const auto& attempt : session.attempts) {
        if (with_reports) {
            std::cout << "\n" << codeloop::session::ArtifactWriter::ExecutionReport(attempt);
            for (const auto& file : attempt.files) {
                std::cout << "  file: " << file.relative_path << " (" << file.content.size() << " bytes)\n";
            }
        } else {
            std::cout << "  #" << attempt.ordinal << " " << codeloop::orchestrator::ToString(attempt.classification)
                      << " [" << attempt.result.StatusText() << ", " << attempt.result.duration.count() << "ms]\n";
        }
    }
    if (!with_reports && !session.attempts.empty()) {
        const auto& last = session.attempts.back();
        std::cout << "\n--- final program output ---\n" << last.result.stdout_text;
        if (session.verdict != codeloop::orchestrator::Verdict::kSucceeded && !last.feedback.empty()) {
            std::cout << "\n--- last feedback ---\n" << last.feedback << "\n";
        }
    }
    std::cout << std::flush;
}

int RunSession(const codeloop::config::Config& config, const std::vector<std::string>& args) {
    codeloop::orchestrator::Task task{};
    bool save_artifacts = config.storage.save_artifacts;
    std::optional<int> max_attempts;
    std::optional<std::string> resume_id;
    bool task_options = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();
        const bool defines_task = arg != "--resume" && arg != "--max-attempts" && arg != "--no-artifacts";
        task_options = task_options || defines_task;
        if (arg == "--") {
            task.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        } else if (arg == "--resume" && has_value) {
            resume_id = args[++i];
        } else if (arg == "--objective" && has_value) {
            task.objective = args[++i];
        } else if (arg == "--objective-file" && has_value) {
            const auto text = ReadTextFile(args[++i]);
            if (!text) {
                std::cerr << "Cannot read objective file: " << args[i] << std::endl;
                return kExitUsage;
            }
            task.objective = codeloop::utils::TrimRight(*text);
        } else if (arg == "--constraint" && has_value) {
            task.constraints.push_back(args[++i]);
        } else if (arg == "--max-attempts" && has_value) {
            max_attempts = ParsePositive(args[++i]);
            if (!max_attempts) {
                std::cerr << "--max-attempts expects a positive integer" << std::endl;
                return kExitUsage;
            }
        } else if (arg == "--timeout" && has_value) {
            const auto seconds = ParsePositive(args[++i]);
            if (!seconds) {
                std::cerr << "--timeout expects a positive number of seconds" << std::endl;
                return kExitUsage;
            }
            task.timeout = std::chrono::seconds(*seconds);
        } else if (arg == "--expect-stdout" && has_value) {
            task.criterion = {codeloop::orchestrator::CriterionKind::kStdoutEquals, args[++i]};
        } else if (arg == "--expect-contains" && has_value) {
            task.criterion = {codeloop::orchestrator::CriterionKind::kStdoutContains, args[++i]};
        } else if (arg == "--expect-match" && has_value) {
            task.criterion = {codeloop::orchestrator::CriterionKind::kStdoutMatches, args[++i]};
        } else if (arg == "--no-artifacts") {
            save_artifacts = false;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            PrintUsage();
            return kExitUsage;
        }
    }
    const auto data_dir = DataDir(config);
    codeloop::session::SessionStore store(data_dir / "sessions.db");
    std::optional<codeloop::orchestrator::SessionState> resumed;
    if (resume_id) {
        if (task_options) {
            std::cerr << "--resume takes the task from the stored session; only --max-attempts and "
                      << "--no-artifacts may be combined with it." << std::endl;
            return kExitUsage;
        }
        resumed = store.Load(*resume_id);
        if (!resumed) {
            std::cerr << "No session " << *resume_id << std::endl;
            return kExitUsage;
        }
        if (resumed->verdict == codeloop::orchestrator::Verdict::kSucceeded) {
            std::cout << "Session " << resumed->id << " already succeeded." << std::endl;
            return kExitSucceeded;
        }
    } else if (task.objective.empty()) {
        std::cerr << "An objective is required (--objective or --objective-file)." << std::endl;
        return kExitUsage;
    }

    codeloop::sandbox::SandboxOptions sandbox_options;
    try {
        sandbox_options = codeloop::sandbox::SandboxOptionsFromConfig(config.sandbox);
    } catch (const codeloop::sandbox::ImageBuildError& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitUsage;
    }

    auto provider = codeloop::providers::CreateProvider(config);
    if (!provider) {
        std::cerr << "Failed to create provider." << std::endl;
        return kExitUsage;
    }
    const auto settings = codeloop::providers::ResolveProviderSettings(config);
    if (settings.api_key.empty() && settings.api_base.empty()) {
        codeloop::utils::LogWarn("cli", "no provider key configured; generation requests will fail");
    }

    codeloop::sandbox::DockerRuntime runtime(config.sandbox.runtime,
                                             std::chrono::seconds(config.sandbox.build_timeout_s));
    if (!runtime.IsAvailable()) {
        codeloop::utils::LogWarn("cli", config.sandbox.runtime + " is not reachable; executions will fail");
    }
    codeloop::sandbox::ImageCache images(runtime);
    codeloop::sandbox::Sandbox sandbox(runtime, images, std::move(sandbox_options));
    codeloop::generator::LlmCodeGenerator generator(*provider, config.generator);

    auto orchestrator_options = codeloop::orchestrator::OrchestratorOptionsFromConfig(config);
    if (max_attempts) {
        orchestrator_options.max_attempts = *max_attempts;
    }
    codeloop::orchestrator::Orchestrator orchestrator(generator, sandbox, std::move(orchestrator_options));

    codeloop::session::ArtifactWriter artifacts(data_dir / "runs");
    if (save_artifacts) {
        orchestrator.SetAttemptCallback(
            [&artifacts](const codeloop::orchestrator::SessionState& session,
                         const codeloop::orchestrator::Attempt& attempt) {
                artifacts.WriteAttempt(session, attempt);
            });
    }

    codeloop::sandbox::CancelToken cancel;
    std::atomic<bool> finished{false};
    InstallSignalHandlers();
    std::thread watcher([&cancel, &finished]() {
        while (!finished.load()) {
            if (g_signal != 0 && !cancel.IsCancelled()) {
                codeloop::utils::LogWarn("cli", "interrupt received, cancelling session");
                cancel.Cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    const auto session = resumed ? orchestrator.Resume(std::move(*resumed), &cancel)
                                 : orchestrator.Run(std::move(task), &cancel);
    finished.store(true);
    watcher.join();

    if (save_artifacts) {
        artifacts.WriteSession(session);
    }
    if (!store.Save(session)) {
        codeloop::utils::LogWarn("cli", "session " + session.id + " was not saved to history");
    }

    PrintSession(session, false);
    return ExitCodeFor(session.verdict);
}

int BuildImage(const codeloop::config::Config& config) {
    try {
        const auto descriptor = codeloop::sandbox::DescriptorFromConfig(config.sandbox);
        codeloop::sandbox::DockerRuntime runtime(config.sandbox.runtime,
                                                 std::chrono::seconds(config.sandbox.build_timeout_s));
        codeloop::sandbox::ImageCache images(runtime);
        const auto handle = images.Ensure(descriptor);
        std::cout << handle.tag << " " << handle.image_id
                  << (handle.built_by_this_process ? " (built)" : " (already present)") << std::endl;
        return kExitSucceeded;
    } catch (const codeloop::sandbox::ImageBuildError& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.BuildLog().empty()) {
            std::cerr << ex.BuildLog() << std::endl;
        }
        return kExitAborted;
    } catch (const codeloop::sandbox::SandboxError& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitAborted;
    }
}

int ShowHistory(const codeloop::config::Config& config, const std::vector<std::string>& args) {
    std::size_t limit = 20;
    if (args.size() == 2 && args[0] == "--limit") {
        const auto value = ParsePositive(args[1]);
        if (!value) {
            std::cerr << "--limit expects a positive integer" << std::endl;
            return kExitUsage;
        }
        limit = static_cast<std::size_t>(*value);
    } else if (!args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    codeloop::session::SessionStore store(DataDir(config) / "sessions.db");
    const auto sessions = store.List(limit);
    if (sessions.empty()) {
        std::cout << "No sessions recorded." << std::endl;
        return kExitSucceeded;
    }
    for (const auto& info : sessions) {
        std::cout << info.id << "  " << codeloop::utils::FormatTime(info.started_at, "%Y-%m-%d %H:%M:%S") << "  "
                  << codeloop::orchestrator::ToString(info.verdict) << "  " << info.attempts << "/"
                  << info.max_attempts << "  " << info.objective.substr(0, 60) << "\n";
    }
    std::cout << std::flush;
    return kExitSucceeded;
}

int ShowSession(const codeloop::config::Config& config, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }
    codeloop::session::SessionStore store(DataDir(config) / "sessions.db");
    const auto session = store.Load(args[0]);
    if (!session) {
        std::cerr << "No session " << args[0] << std::endl;
        return kExitUsage;
    }
    PrintSession(*session, true);
    return kExitSucceeded;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseGlobal(argc, argv);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }

    const auto config = options->config_path
        ? codeloop::config::LoadConfigFromPath(*options->config_path)
        : codeloop::config::LoadConfig();
    codeloop::utils::LogConfig log_config{};
    log_config.min_level = options->verbose
        ? codeloop::utils::LogLevel::kDebug
        : codeloop::utils::ParseLogLevel(config.logging.level);
    codeloop::utils::ConfigureLogging(log_config);

    if (options->command == "run") {
        return RunSession(config, options->args);
    }
    if (options->command == "build-image") {
        return BuildImage(config);
    }
    if (options->command == "history") {
        return ShowHistory(config, options->args);
    }
    if (options->command == "show") {
        return ShowSession(config, options->args);
    }
    PrintUsage();
    return kExitUsage;
}
