#include <gtest/gtest.h>

#include <filesystem>

#include "engine/execution_manager.hpp"

using namespace compass::bus;
using compass::engine::ExecutionManager;
using compass::engine::ExecutionState;
using compass::models::StepStatus;

namespace {

// Collects messages for one execution until its Finished arrives.
std::pair<std::string, Finished> WaitForFinish(ExecutionManager& manager) {
    std::string output;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (std::chrono::steady_clock::now() < deadline) {
        auto message = manager.WaitMessage(std::chrono::milliseconds(100));
        if (!message) {
            continue;
        }
        if (const auto* partial = std::get_if<OutputPartial>(&*message)) {
            output += partial->text;
        } else {
            return {output, std::get<Finished>(*message)};
        }
    }
    ADD_FAILURE() << "execution did not finish";
    return {output, Finished{}};
}

}  // namespace

TEST(ExecutionManager, ReportsOutputThenFinished) {
    ExecutionManager manager;
    manager.ExecuteBackground(3, "echo background", std::nullopt, false);
    const auto [output, finished] = WaitForFinish(manager);
    EXPECT_EQ(finished.index, 3u);
    EXPECT_EQ(finished.status, StepStatus::Success);
    EXPECT_NE(output.find("background"), std::string::npos);
}

TEST(ExecutionManager, StateMergesOnlyOnApply) {
    auto initial = ExecutionState::FromCurrentProcess();
    initial.current_dir = "/";
    ExecutionManager manager(initial);
    manager.ExecuteBackground(0, "cd /tmp\nexport COMPASS_MERGE=1", std::nullopt, false);
    const auto [output, finished] = WaitForFinish(manager);
    EXPECT_EQ(finished.current_dir, std::filesystem::canonical("/tmp"));
    EXPECT_EQ(manager.state().current_dir, std::filesystem::path("/"));
    EXPECT_EQ(manager.state().env_vars.count("COMPASS_MERGE"), 0u);

    manager.ApplyFinished(finished);
    EXPECT_EQ(manager.state().current_dir, std::filesystem::canonical("/tmp"));
    EXPECT_EQ(manager.state().env_vars.at("COMPASS_MERGE"), "1");
}

TEST(ExecutionManager, GateRejectionArrivesAsFailed) {
    ExecutionManager manager;
    manager.ExecuteBackground(1, "rm -rf /", std::nullopt, false);
    const auto [output, finished] = WaitForFinish(manager);
    EXPECT_EQ(finished.status, StepStatus::Failed);
    EXPECT_NE(output.find("Safety alert"), std::string::npos);
}

TEST(ExecutionManager, PollNeverBlocks) {
    ExecutionManager manager;
    EXPECT_TRUE(manager.PollMessages().empty());
    EXPECT_EQ(manager.InFlight(), 0u);
}
