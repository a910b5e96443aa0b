#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace compass::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadBool(sandbox, "enabled", config.sandbox.enabled);
        ReadString(sandbox, "image", config.sandbox.image);
        ReadString(sandbox, "runtime", config.sandbox.runtime);
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadBool(execution, "bypassSafety", config.execution.bypass_safety);
        ReadString(execution, "workingDir", config.execution.working_dir);
    }

    if (data.contains("hooks") && data["hooks"].is_object()) {
        const auto& hooks = data["hooks"];
        ReadString(hooks, "preRun", config.hooks.pre_run);
        ReadString(hooks, "postRun", config.hooks.post_run);
        ReadString(hooks, "onSuccess", config.hooks.on_success);
        ReadString(hooks, "onFailure", config.hooks.on_failure);
        ReadBool(hooks, "trusted", config.hooks.trusted);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }

    if (data.contains("variables") && data["variables"].is_object()) {
        for (const auto& [key, value] : data["variables"].items()) {
            if (value.is_string()) {
                config.variables[key] = value.get<std::string>();
            }
        }
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

void ApplyFile(Config& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        // Keep defaults on parse errors
        compass::utils::Log(compass::utils::LogLevel::kWarn, "config", "ignoring malformed config",
                            {{"path", path.string()}, {"error", ex.what()}});
    }
}

void ApplyEnvironment(Config& config) {
    const auto sandbox_enabled = GetEnvFallback("COMPASS_SANDBOX__ENABLED", "COMPASS_SANDBOX_ENABLED");
    if (!sandbox_enabled.empty()) {
        config.sandbox.enabled = ParseBool(sandbox_enabled);
    }

    const auto sandbox_image = GetEnvFallback("COMPASS_SANDBOX__IMAGE", "COMPASS_SANDBOX_IMAGE");
    if (!sandbox_image.empty()) {
        config.sandbox.image = sandbox_image;
    }

    const auto sandbox_runtime = GetEnv("COMPASS_SANDBOX__RUNTIME");
    if (!sandbox_runtime.empty()) {
        config.sandbox.runtime = sandbox_runtime;
    }

    const auto bypass_safety = GetEnv("COMPASS_EXECUTION__BYPASS_SAFETY");
    if (!bypass_safety.empty()) {
        config.execution.bypass_safety = ParseBool(bypass_safety);
    }

    const auto working_dir = GetEnv("COMPASS_EXECUTION__WORKING_DIR");
    if (!working_dir.empty()) {
        config.execution.working_dir = working_dir;
    }

    const auto pre_run = GetEnv("COMPASS_HOOKS__PRE_RUN");
    if (!pre_run.empty()) {
        config.hooks.pre_run = pre_run;
    }
    const auto post_run = GetEnv("COMPASS_HOOKS__POST_RUN");
    if (!post_run.empty()) {
        config.hooks.post_run = post_run;
    }
    const auto on_success = GetEnv("COMPASS_HOOKS__ON_SUCCESS");
    if (!on_success.empty()) {
        config.hooks.on_success = on_success;
    }
    const auto on_failure = GetEnv("COMPASS_HOOKS__ON_FAILURE");
    if (!on_failure.empty()) {
        config.hooks.on_failure = on_failure;
    }
    const auto trusted = GetEnv("COMPASS_HOOKS__TRUSTED");
    if (!trusted.empty()) {
        config.hooks.trusted = ParseBool(trusted);
    }

    const auto log_level = GetEnv("COMPASS_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".compass" / "config.json";
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    ApplyFile(config, path);
    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(DefaultConfigPath());
}

}  // namespace compass::config
