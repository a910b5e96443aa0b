#include "engine/step_runner.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/terminal_text.hpp"

namespace compass::engine {

using compass::bus::ExecutionMessage;
using compass::bus::Finished;
using compass::bus::OutputPartial;
using compass::hooks::HookRunner;
using compass::models::StepStatus;

StepRunner::StepRunner(std::vector<compass::models::Step> steps,
                       ExecutionState state,
                       const compass::conditions::ConditionEvaluator& evaluator,
                       HookSettings hooks)
    : steps_(std::move(steps))
    , recovery_(steps_.size())
    , manager_(std::move(state))
    , evaluator_(evaluator)
    , hooks_(std::move(hooks)) {}

TriggerResult StepRunner::Trigger(std::size_t index, const VariableStore& variables, bool bypass_gates) {
    TriggerResult result;
    if (index >= steps_.size()) {
        result.outcome = TriggerOutcome::InvalidIndex;
        return result;
    }
    auto& step = steps_[index];
    if (step.status == StepStatus::Running) {
        result.outcome = TriggerOutcome::AlreadyRunning;
        return result;
    }

    if (step.condition.has_value() && !evaluator_.Evaluate(*step.condition)) {
        step.status = StepStatus::Skipped;
        step.output += kSkippedLine;
        result.outcome = TriggerOutcome::Skipped;
        return result;
    }

    for (const auto& name : CommandAssembler::GetRequiredPlaceholders(step)) {
        if (variables.count(name) == 0) {
            result.missing_placeholders.push_back(name);
        }
    }
    if (!result.missing_placeholders.empty()) {
        result.outcome = TriggerOutcome::NeedsPlaceholders;
        return result;
    }

    auto content = CommandAssembler::BuildCommand(step, variables);
    if (compass::utils::Trim(content).empty()) {
        result.outcome = TriggerOutcome::EmptyCommand;
        return result;
    }
    std::optional<std::string> language;
    if (!step.code_blocks.empty()) {
        language = step.code_blocks.front().language;
    }

    if (!bypass_gates) {
        if (auto rejection = Orchestrator::CheckGates(content, language)) {
            result.outcome = TriggerOutcome::GateRejected;
            result.rejection = std::move(rejection);
            return result;
        }
    }

    if (hooks_.trusted) {
        HookRunner::TriggerHook(hooks_.config.pre_run, state().env_vars, state().current_dir);
    }

    step.status = StepStatus::Running;
    step.output.clear();
    recovery_[index].reset();
    compass::utils::Log(compass::utils::LogLevel::kDebug, "runner", "dispatch",
                        {{"index", std::to_string(index)}, {"title", step.title}});
    // Without bypass the orchestrator runs the gates again on the worker thread.
    manager_.ExecuteBackground(index, std::move(content), std::move(language), bypass_gates);
    return result;
}

void StepRunner::HandleMessage(const ExecutionMessage& message) {
    std::visit([this](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if (payload.index >= steps_.size()) {
            return;
        }
        auto& step = steps_[payload.index];
        if constexpr (std::is_same_v<T, OutputPartial>) {
            compass::utils::AppendOutput(step.output, payload.text);
        } else {
            step.status = payload.status;
            if (hooks_.trusted) {
                const auto& hook = payload.status == StepStatus::Success ? hooks_.config.on_success
                                                                         : hooks_.config.on_failure;
                HookRunner::TriggerHook(hook, payload.env_vars, payload.current_dir);
                HookRunner::TriggerHook(hooks_.config.post_run, payload.env_vars, payload.current_dir);
            }
            if (payload.status == StepStatus::Failed) {
                recovery_[payload.index] = compass::analysis::AnalyzeError(step.output);
            }
            step.output += kFinishSeparator;
            if (payload.status == StepStatus::Success) {
                step.output += kFinishedSuccess;
            } else if (payload.status == StepStatus::Failed) {
                step.output += kFinishedFailure;
            }
            manager_.ApplyFinished(payload);
        }
    }, message);

    if (observer_) {
        observer_(message);
    }
}

std::size_t StepRunner::Pump() {
    const auto messages = manager_.PollMessages();
    for (const auto& message : messages) {
        HandleMessage(message);
    }
    return messages.size();
}

bool StepRunner::WaitIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        Pump();
        if (manager_.InFlight() == 0) {
            // The Finished message is published before the counter drops.
            Pump();
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (auto message = manager_.WaitMessage(std::min(remaining, std::chrono::milliseconds(100)))) {
            HandleMessage(*message);
        }
    }
}

}  // namespace compass::engine
