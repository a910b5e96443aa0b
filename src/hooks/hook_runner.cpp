#include "hooks/hook_runner.hpp"

#include <boost/process.hpp>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "languages/artifact.hpp"
#include "utils/logging.hpp"

namespace compass::hooks {
namespace bp = boost::process;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds interval) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
    return false;
}

}  // namespace

HookResult HookRunner::RunHookSync(const std::string& command,
                                   const std::unordered_map<std::string, std::string>& env_vars,
                                   const std::filesystem::path& working_dir,
                                   std::chrono::seconds timeout) {
    HookResult result{};
    const auto id = compass::languages::GenerateArtifactId();
    const auto temp_dir = std::filesystem::temp_directory_path();
    const auto stdout_path = temp_dir / ("compass_hook_out_" + id + ".log");
    const auto stderr_path = temp_dir / ("compass_hook_err_" + id + ".log");

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : env_vars) {
        env[key] = value;
    }

    std::error_code dir_ec;
    const auto start_dir = (!working_dir.empty() && std::filesystem::is_directory(working_dir, dir_ec))
                               ? working_dir
                               : std::filesystem::current_path(dir_ec);

    try {
        bp::child child_process(
            "/bin/sh",
            "-c",
            command,
            env,
            bp::start_dir = start_dir.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        int status = 0;
        const pid_t pid = child_process.id();
        bool finished = WaitUntil(pid, status, std::chrono::steady_clock::now() + timeout,
                                  std::chrono::milliseconds(100));
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, status, std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                 std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadFile(stdout_path);
    if (result.error.empty()) {
        result.error = ReadFile(stderr_path);
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

void HookRunner::TriggerHook(const std::optional<std::string>& command,
                             const std::unordered_map<std::string, std::string>& env,
                             const std::filesystem::path& working_dir) {
    if (!command.has_value() || command->empty()) {
        return;
    }
    std::thread([command = *command, env, working_dir]() {
        const auto result = RunHookSync(command, env, working_dir);
        if (result.timed_out) {
            compass::utils::Log(compass::utils::LogLevel::kWarn, "hook", "timed out",
                                {{"command", command}});
        } else if (result.exit_code != 0) {
            compass::utils::Log(compass::utils::LogLevel::kWarn, "hook", "failed",
                                {{"command", command},
                                 {"exit_code", std::to_string(result.exit_code)},
                                 {"stderr", result.error}});
        } else {
            compass::utils::Log(compass::utils::LogLevel::kDebug, "hook", "completed",
                                {{"command", command}});
        }
    }).detach();
}

}  // namespace compass::hooks
