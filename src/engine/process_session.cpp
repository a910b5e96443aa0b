#include "engine/process_session.hpp"

#include <array>
#include <atomic>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <cerrno>
#include <memory>
#include <poll.h>
#include <sys/ioctl.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

#include "engine/pseudo_terminal.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/terminal_text.hpp"

namespace compass::engine {
namespace bp = boost::process;

namespace {

using compass::models::StepStatus;
using compass::utils::LogLevel;

std::string ResolveExecutable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    return bp::search_path(program).string();
}

// Forwards decodable chunks until the child has exited and the master has
// nothing left to read. Chunks that are not valid UTF-8 on their own are
// dropped.
void PumpOutput(int master_fd, const std::atomic<bool>& child_exited, const OutputSink& sink) {
    std::array<char, kReadChunkSize> buffer{};
    while (true) {
        struct pollfd poll_fd {};
        poll_fd.fd = master_fd;
        poll_fd.events = POLLIN;
        const int ready = ::poll(&poll_fd, 1, 50);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            if (child_exited.load()) {
                break;
            }
            continue;
        }
        const auto count = ::read(master_fd, buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            // EIO: every slave descriptor is closed.
            break;
        }
        if (count == 0) {
            break;
        }
        if (auto text = compass::utils::DecodeChunk(buffer.data(), static_cast<std::size_t>(count))) {
            if (sink) {
                sink(*text);
            }
        }
    }
}

}  // namespace

ProcessSession::ProcessSession(ExecutionState state)
    : state_(std::move(state)) {}

std::map<std::string, std::string> ProcessSession::MergeEnvironment(
    const ExecutionState& state,
    const compass::languages::LanguageStrategy& strategy) {
    std::map<std::string, std::string> merged(state.env_vars.begin(), state.env_vars.end());
    for (const auto& [key, value] : strategy.EnvVars()) {
        merged[key] = value;
    }
    return merged;
}

Invocation ProcessSession::BuildInvocation(const ExecutionState& state,
                                           const compass::languages::LanguageStrategy& strategy,
                                           const std::filesystem::path& prepared_path) {
    Invocation invocation{};
    invocation.working_dir = state.current_dir;
    const auto run_command = strategy.RunCommand(prepared_path);
    const auto env = MergeEnvironment(state, strategy);

    if (!state.sandbox_enabled) {
        invocation.argv = run_command;
        invocation.env = env;
        return invocation;
    }

    const auto host_temp_dir = prepared_path.parent_path();
    const auto host_prefix = host_temp_dir.string() + "/";
    const auto container_prefix = std::string(kContainerTempDir) + "/";
    std::vector<std::string> rewritten;
    rewritten.reserve(run_command.size());
    for (const auto& arg : run_command) {
        rewritten.push_back(compass::utils::ReplaceAll(arg, host_prefix, container_prefix));
    }

    auto& argv = invocation.argv;
    argv = {
        state.container_runtime,
        "run",
        "--rm",
        "-t",
        "-v",
        state.current_dir.string() + ":" + kContainerWorkspace,
        "-w",
        kContainerWorkspace,
        "-v",
        host_temp_dir.string() + ":" + kContainerTempDir
    };
    for (const auto& [key, value] : env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    argv.push_back(state.docker_image);
    argv.push_back("sh");
    argv.push_back("-c");
    // Joined without quoting: arguments containing spaces or shell
    // metacharacters are split by the inner shell.
    argv.push_back(compass::utils::Join(rewritten, " "));
    return invocation;
}

StepStatus ProcessSession::Run(const std::string& content,
                               const std::optional<std::string>& language,
                               const OutputSink& sink) const {
    auto emit = [&sink](const std::string& line) {
        if (sink) {
            sink(line);
        }
    };

    PseudoTerminal pty;
    const auto pty_error = pty.Open(kPtyRows, kPtyCols);
    if (!pty_error.empty()) {
        emit("Error opening PTY: " + pty_error + "\n");
        return StepStatus::Failed;
    }

    const auto strategy = compass::languages::LanguageStrategy::FromTag(language);
    std::filesystem::path prepared_path;
    try {
        prepared_path = strategy.Prepare(content, std::filesystem::temp_directory_path());
    } catch (const std::exception& ex) {
        emit(std::string("Failed to prepare code: ") + ex.what() + "\n");
        return StepStatus::Failed;
    }

    const auto invocation = BuildInvocation(state_, strategy, prepared_path);
    compass::utils::Log(LogLevel::kDebug, "session", "spawn",
                        {{"argv", compass::utils::Join(invocation.argv, " ")},
                         {"cwd", invocation.working_dir.string()},
                         {"sandbox", state_.sandbox_enabled ? "true" : "false"}});

    const auto executable = ResolveExecutable(invocation.argv.front());
    if (executable.empty()) {
        emit("Error spawning process: '" + invocation.argv.front() + "' not found\n");
        strategy.Cleanup(prepared_path);
        return StepStatus::Failed;
    }

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : invocation.env) {
        env[key] = value;
    }
    const std::vector<std::string> arguments(invocation.argv.begin() + 1, invocation.argv.end());
    const int slave_fd = pty.slave();

    std::unique_ptr<bp::child> child;
    try {
        child = std::make_unique<bp::child>(
            bp::exe = executable,
            bp::args = arguments,
            env,
            bp::start_dir = invocation.working_dir.string(),
            bp::extend::on_exec_setup = [slave_fd](auto&) {
                ::setsid();
                ::ioctl(slave_fd, TIOCSCTTY, 0);
                ::dup2(slave_fd, STDIN_FILENO);
                ::dup2(slave_fd, STDOUT_FILENO);
                ::dup2(slave_fd, STDERR_FILENO);
            });
    } catch (const std::system_error& ex) {
        emit(std::string("Error spawning process: ") + ex.what() + "\n");
        strategy.Cleanup(prepared_path);
        return StepStatus::Failed;
    }

    pty.CloseSlave();

    std::atomic<bool> child_exited{false};
    const int master_fd = pty.master();
    std::thread reader([master_fd, &child_exited, &sink]() {
        PumpOutput(master_fd, child_exited, sink);
    });

    std::error_code wait_error;
    child->wait(wait_error);
    const int exit_code = wait_error ? -1 : child->exit_code();
    child_exited.store(true);

    strategy.Cleanup(prepared_path);

    reader.join();
    pty.CloseMaster();

    if (wait_error) {
        emit("Error waiting for process: " + wait_error.message() + "\n");
        return StepStatus::Failed;
    }
    compass::utils::Log(LogLevel::kDebug, "session", "exit", {{"code", std::to_string(exit_code)}});
    return exit_code == 0 ? StepStatus::Success : StepStatus::Failed;
}

}  // namespace compass::engine
