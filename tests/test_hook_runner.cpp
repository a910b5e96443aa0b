#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>

#include "hooks/hook_runner.hpp"
#include "languages/artifact.hpp"

using compass::hooks::HookConfig;
using compass::hooks::HookRunner;

TEST(HookRunner, HasAny) {
    HookConfig config;
    EXPECT_FALSE(config.HasAny());
    config.on_failure = "echo failed";
    EXPECT_TRUE(config.HasAny());
}

TEST(HookRunner, RunsWithInjectedEnvironment) {
    const auto result = HookRunner::RunHookSync("echo $COMPASS_HOOK_VAR; exit 4",
                                                {{"COMPASS_HOOK_VAR", "from-step"}}, "/tmp");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 4);
    EXPECT_EQ(result.output, "from-step\n");
}

TEST(HookRunner, RunsInWorkingDirectory) {
    const auto result = HookRunner::RunHookSync("pwd", {}, "/");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "/\n");
}

TEST(HookRunner, TimesOut) {
    const auto result = HookRunner::RunHookSync("sleep 10", {}, "/tmp", std::chrono::seconds(1));
    EXPECT_TRUE(result.timed_out);
}

TEST(HookRunner, TriggerRunsInBackground) {
    const auto marker = std::filesystem::temp_directory_path() /
                        ("compass_hook_" + compass::languages::GenerateArtifactId());
    HookRunner::TriggerHook("touch " + marker.string(), {}, "/tmp");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!std::filesystem::exists(marker) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(std::filesystem::exists(marker));
    std::filesystem::remove(marker);
}

TEST(HookRunner, TriggerIgnoresEmptyCommand) {
    HookRunner::TriggerHook(std::nullopt, {}, "/tmp");
    HookRunner::TriggerHook(std::string(), {}, "/tmp");
}
