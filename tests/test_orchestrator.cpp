#include <gtest/gtest.h>

#include <filesystem>
#include <mutex>

#include "engine/orchestrator.hpp"

using compass::engine::ExecutionState;
using compass::engine::GateRejection;
using compass::engine::Orchestrator;
using compass::models::StepStatus;

namespace {

struct Captured {
    std::mutex mutex;
    std::string text;

    compass::engine::OutputSink Sink() {
        return [this](const std::string& chunk) {
            std::lock_guard<std::mutex> lock(mutex);
            text += chunk;
        };
    }
};

}  // namespace

TEST(Orchestrator, DangerousPatternBlocksExecution) {
    Orchestrator orchestrator;
    Captured captured;
    const auto status = orchestrator.Execute("rm -rf /", std::nullopt, false, captured.Sink());
    EXPECT_EQ(status, StepStatus::Failed);
    EXPECT_EQ(captured.text, "Safety alert: Dangerous pattern detected ('rm -rf /'). Execution blocked.\n");
}

TEST(Orchestrator, MissingDependencyBlocksExecution) {
    Orchestrator orchestrator;
    Captured captured;
    const auto status = orchestrator.Execute("definitely-not-a-real-binary-xyz", std::nullopt, false,
                                             captured.Sink());
    EXPECT_EQ(status, StepStatus::Failed);
    EXPECT_EQ(captured.text, "Requirement not met: 'definitely-not-a-real-binary-xyz' is not installed.\n");
}

TEST(Orchestrator, CheckGatesReportsKind) {
    const auto safety = Orchestrator::CheckGates("echo x > /dev/sda", std::string("bash"));
    ASSERT_TRUE(safety.has_value());
    EXPECT_EQ(safety->kind, GateRejection::Kind::Safety);
    EXPECT_EQ(safety->detail, "> /dev/sd");

    const auto dependency = Orchestrator::CheckGates("x = 1", std::string("ts"));
    if (dependency.has_value()) {
        EXPECT_EQ(dependency->kind, GateRejection::Kind::Dependency);
    }
    EXPECT_EQ(Orchestrator::CheckGates("echo fine", std::nullopt), std::nullopt);
}

TEST(Orchestrator, BypassSkipsGates) {
    Orchestrator orchestrator;
    Captured captured;
    const auto status = orchestrator.Execute("echo 'mkfs is harmless here'", std::nullopt, true, captured.Sink());
    EXPECT_EQ(status, StepStatus::Success);
    EXPECT_NE(captured.text.find("mkfs is harmless here"), std::string::npos);
}

TEST(Orchestrator, BuiltinsOnlyNeedNoProcess) {
    Orchestrator orchestrator;
    Captured captured;
    const auto status = orchestrator.Execute("cd /tmp\nexport GREETING=hi", std::nullopt, false, captured.Sink());
    EXPECT_EQ(status, StepStatus::Success);
    EXPECT_EQ(orchestrator.state().current_dir, std::filesystem::canonical("/tmp"));
    EXPECT_EQ(orchestrator.state().env_vars.at("GREETING"), "hi");
    EXPECT_NE(captured.text.find("export: GREETING=hi (Handled by Compass)"), std::string::npos);
}

TEST(Orchestrator, StateCarriesIntoLaterExecutions) {
    Orchestrator orchestrator;
    Captured first;
    orchestrator.Execute("export COMPASS_CARRIED=yes\ncd /", std::nullopt, false, first.Sink());
    Captured second;
    EXPECT_EQ(orchestrator.Execute("pwd\necho $COMPASS_CARRIED", std::nullopt, false, second.Sink()),
              StepStatus::Success);
    EXPECT_NE(second.text.find("/\r\n"), std::string::npos);
    EXPECT_NE(second.text.find("yes"), std::string::npos);
}
