#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace compass::hooks {

inline constexpr std::chrono::seconds kDefaultHookTimeout{30};

struct HookConfig {
    std::optional<std::string> pre_run;
    std::optional<std::string> post_run;
    std::optional<std::string> on_success;
    std::optional<std::string> on_failure;

    bool HasAny() const {
        return pre_run.has_value() || post_run.has_value() || on_success.has_value() ||
               on_failure.has_value();
    }
};

struct HookResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

class HookRunner {
public:
    // Blocking. `env` is layered over the inherited environment.
    static HookResult RunHookSync(const std::string& command,
                                  const std::unordered_map<std::string, std::string>& env,
                                  const std::filesystem::path& working_dir,
                                  std::chrono::seconds timeout = kDefaultHookTimeout);

    // Fire and forget; failures are only logged.
    static void TriggerHook(const std::optional<std::string>& command,
                            const std::unordered_map<std::string, std::string>& env,
                            const std::filesystem::path& working_dir);
};

}  // namespace compass::hooks
