#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <utility>
#include <optional>
#include <string>
#include <vector>

#include "analysis/recovery_advisor.hpp"
#include "bus/events.hpp"
#include "conditions/condition_evaluator.hpp"
#include "engine/command_assembler.hpp"
#include "engine/execution_manager.hpp"
#include "engine/orchestrator.hpp"
#include "hooks/hook_runner.hpp"
#include "models/step_types.hpp"

namespace compass::engine {

inline constexpr const char* kSkippedLine = "\n> Skipped: Condition not met.\n";
inline constexpr const char* kFinishSeparator = "\n\n---\n";
inline constexpr const char* kFinishedSuccess = "Execution finished successfully.";
inline constexpr const char* kFinishedFailure = "Execution failed.";

enum class TriggerOutcome {
    Dispatched,
    InvalidIndex,
    AlreadyRunning,
    Skipped,
    NeedsPlaceholders,
    EmptyCommand,
    GateRejected
};

struct TriggerResult {
    TriggerOutcome outcome = TriggerOutcome::Dispatched;
    // Set for NeedsPlaceholders.
    std::vector<std::string> missing_placeholders;
    // Set for GateRejected. The caller may confirm and trigger again with
    // bypass_gates.
    std::optional<GateRejection> rejection;
};

struct HookSettings {
    compass::hooks::HookConfig config;
    bool trusted = false;
};

// Step-level driver over an ExecutionManager: owns the steps, applies the
// messages coming back from background executions and keeps the shared
// state merged.
class StepRunner {
public:
    using MessageObserver = std::function<void(const compass::bus::ExecutionMessage&)>;

    StepRunner(std::vector<compass::models::Step> steps,
               ExecutionState state,
               const compass::conditions::ConditionEvaluator& evaluator,
               HookSettings hooks = {});

    TriggerResult Trigger(std::size_t index, const VariableStore& variables, bool bypass_gates);

    // Applies everything queued so far. Returns the number of messages applied.
    std::size_t Pump();

    // Applies messages until nothing is in flight or the timeout expires.
    bool WaitIdle(std::chrono::milliseconds timeout);

    void HandleMessage(const compass::bus::ExecutionMessage& message);

    void SetObserver(MessageObserver observer) { observer_ = std::move(observer); }

    const std::vector<compass::models::Step>& steps() const { return steps_; }
    const std::optional<compass::analysis::RecoveryRecommendation>& recovery(std::size_t index) const {
        return recovery_.at(index);
    }
    ExecutionState& state() { return manager_.state(); }
    const ExecutionState& state() const { return manager_.state(); }

private:
    std::vector<compass::models::Step> steps_;
    std::vector<std::optional<compass::analysis::RecoveryRecommendation>> recovery_;
    ExecutionManager manager_;
    const compass::conditions::ConditionEvaluator& evaluator_;
    HookSettings hooks_;
    MessageObserver observer_;
};

}  // namespace compass::engine
