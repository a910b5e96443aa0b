#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "checker/dependency_checker.hpp"
#include "conditions/condition_evaluator.hpp"
#include "config/config_loader.hpp"
#include "engine/step_runner.hpp"
#include "headless/rpc_server.hpp"
#include "infrastructure/container_runtime.hpp"
#include "models/step_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

struct CliOptions {
    std::string command;
    std::filesystem::path steps_path;
    std::optional<std::filesystem::path> config_path;
    std::optional<bool> sandbox;
    std::optional<std::string> image;
    bool assume_yes = false;
    bool keep_going = false;
    compass::engine::VariableStore variables;
};

void PrintUsage() {
    std::cout << "Usage: compass_cli check <steps.json> [--config FILE]\n"
                 "       compass_cli run <steps.json> [--sandbox] [--image IMG] [--yes] [--keep-going]\n"
                 "                   [--var KEY=VALUE]... [--config FILE]\n"
                 "       compass_cli serve <steps.json> [--sandbox] [--image IMG] [--config FILE]"
              << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 3) {
        return std::nullopt;
    }
    CliOptions options;
    options.command = argv[1];
    options.steps_path = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--sandbox") {
            options.sandbox = true;
        } else if (arg == "--yes" || arg == "-y") {
            options.assume_yes = true;
        } else if (arg == "--keep-going") {
            options.keep_going = true;
        } else if (arg == "--image" && has_value) {
            options.image = argv[++i];
        } else if (arg == "--config" && has_value) {
            options.config_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--var" && has_value) {
            const std::string pair = argv[++i];
            const auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cout << "Invalid --var, expected KEY=VALUE: " << pair << std::endl;
                return std::nullopt;
            }
            options.variables[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else {
            std::cout << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

std::optional<std::string> NonEmpty(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

compass::engine::ExecutionState BuildState(const compass::config::Config& config,
                                           const std::filesystem::path& fallback_dir) {
    auto state = compass::engine::ExecutionState::FromCurrentProcess();
    if (!config.execution.working_dir.empty()) {
        state.current_dir = config.execution.working_dir;
    } else if (!fallback_dir.empty()) {
        state.current_dir = fallback_dir;
    }
    state.sandbox_enabled = config.sandbox.enabled;
    state.docker_image = config.sandbox.image;
    state.container_runtime = config.sandbox.runtime;
    return state;
}

bool Confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    answer = compass::utils::Trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

int RunCheck(const std::vector<compass::models::Step>& steps) {
    const auto result = compass::checker::CheckDependencies(steps);
    for (const auto& name : result.present) {
        std::cout << "  found    " << name << std::endl;
    }
    for (const auto& name : result.missing) {
        std::cout << "  missing  " << name << std::endl;
    }
    if (!result.missing.empty()) {
        std::cout << result.missing.size() << " missing dependencies." << std::endl;
        return 1;
    }
    std::cout << "All dependencies found." << std::endl;
    return 0;
}

int RunSteps(std::vector<compass::models::Step> steps,
             const compass::config::Config& config,
             CliOptions options) {
    compass::conditions::StandardEvaluator evaluator;
    compass::engine::HookSettings hooks;
    hooks.trusted = config.hooks.trusted;
    hooks.config.pre_run = NonEmpty(config.hooks.pre_run);
    hooks.config.post_run = NonEmpty(config.hooks.post_run);
    hooks.config.on_success = NonEmpty(config.hooks.on_success);
    hooks.config.on_failure = NonEmpty(config.hooks.on_failure);

    const auto step_count = steps.size();
    compass::engine::StepRunner runner(std::move(steps), BuildState(config, {}), evaluator, hooks);
    runner.SetObserver([](const compass::bus::ExecutionMessage& message) {
        if (const auto* partial = std::get_if<compass::bus::OutputPartial>(&message)) {
            std::cout << partial->text << std::flush;
        }
    });

    auto variables = config.variables;
    for (const auto& [key, value] : options.variables) {
        variables[key] = value;
    }
    const bool bypass_all = config.execution.bypass_safety;

    int failures = 0;
    for (std::size_t index = 0; index < step_count; ++index) {
        const auto& step = runner.steps()[index];
        if (!step.IsExecutable()) {
            continue;
        }
        std::cout << "\n== " << (index + 1) << ". " << step.title << std::endl;

        bool bypass = bypass_all;
        auto result = runner.Trigger(index, variables, bypass);
        while (result.outcome == compass::engine::TriggerOutcome::NeedsPlaceholders) {
            for (const auto& name : result.missing_placeholders) {
                std::cout << "Value for " << name << ": " << std::flush;
                std::string value;
                if (!std::getline(std::cin, value)) {
                    std::cout << "\nNo value for " << name << ", aborting." << std::endl;
                    return 1;
                }
                variables[name] = value;
            }
            result = runner.Trigger(index, variables, bypass);
        }
        if (result.outcome == compass::engine::TriggerOutcome::GateRejected) {
            std::cout << result.rejection->message << std::endl;
            if (!options.assume_yes && !Confirm("Run anyway?")) {
                std::cout << "Step not run." << std::endl;
                ++failures;
                if (!options.keep_going) {
                    break;
                }
                continue;
            }
            bypass = true;
            result = runner.Trigger(index, variables, bypass);
        }

        switch (result.outcome) {
            case compass::engine::TriggerOutcome::Skipped:
                std::cout << "Skipped: condition not met." << std::endl;
                continue;
            case compass::engine::TriggerOutcome::EmptyCommand:
                continue;
            case compass::engine::TriggerOutcome::Dispatched:
                break;
            default:
                std::cout << "Step could not be started." << std::endl;
                ++failures;
                continue;
        }

        // No execution timeout: a hung step blocks here until it exits.
        while (!runner.WaitIdle(std::chrono::seconds(1))) {
        }

        const auto& finished = runner.steps()[index];
        if (finished.status == compass::models::StepStatus::Success) {
            std::cout << "\n-- " << compass::engine::kFinishedSuccess << std::endl;
            continue;
        }
        std::cout << "\n-- " << compass::engine::kFinishedFailure << std::endl;
        if (const auto& advice = runner.recovery(index)) {
            std::cout << "Hint: " << advice->message << std::endl;
            if (advice->fix_command.has_value()) {
                std::cout << "Try: " << *advice->fix_command << std::endl;
            }
        }
        ++failures;
        if (!options.keep_going) {
            break;
        }
    }
    return failures == 0 ? 0 : 1;
}

int RunServe(std::vector<compass::models::Step> steps,
             const compass::config::Config& config,
             const std::filesystem::path& steps_path) {
    std::error_code ec;
    auto base_dir = std::filesystem::absolute(steps_path, ec).parent_path();
    compass::headless::RpcServer server(std::move(steps), BuildState(config, base_dir));
    server.Serve(std::cin, std::cout);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }

    auto config = options->config_path ? compass::config::LoadConfigFromFile(*options->config_path)
                                       : compass::config::LoadConfig();
    if (options->sandbox) {
        config.sandbox.enabled = *options->sandbox;
    }
    if (options->image) {
        config.sandbox.image = *options->image;
    }
    compass::utils::LogConfig log_config{};
    log_config.min_level = compass::utils::LogLevelFromString(config.logging.level, compass::utils::LogLevel::kInfo);
    compass::utils::Configure(log_config);

    std::vector<compass::models::Step> steps;
    try {
        steps = compass::models::LoadStepsFromFile(options->steps_path);
    } catch (const compass::models::StepFileError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }

    if (options->command == "check") {
        return RunCheck(steps);
    }

    if (config.sandbox.enabled) {
        if (auto problem = compass::infrastructure::EnsureRuntimeAvailable(config.sandbox.runtime)) {
            std::cout << *problem << std::endl;
            return 1;
        }
    }

    if (options->command == "run") {
        return RunSteps(std::move(steps), config, *options);
    }
    if (options->command == "serve") {
        return RunServe(std::move(steps), config, options->steps_path);
    }

    PrintUsage();
    return 1;
}
