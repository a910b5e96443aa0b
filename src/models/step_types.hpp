#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace compass::models {

enum class StepStatus {
    Pending,
    Running,
    Success,
    Failed,
    Skipped
};

inline const char* ToString(StepStatus status) {
    switch (status) {
        case StepStatus::Pending: return "Pending";
        case StepStatus::Running: return "Running";
        case StepStatus::Success: return "Success";
        case StepStatus::Failed: return "Failed";
        case StepStatus::Skipped: return "Skipped";
    }
    return "Pending";
}

inline StepStatus StepStatusFromString(const std::string& value) {
    if (value == "Running") {
        return StepStatus::Running;
    }
    if (value == "Success") {
        return StepStatus::Success;
    }
    if (value == "Failed") {
        return StepStatus::Failed;
    }
    if (value == "Skipped") {
        return StepStatus::Skipped;
    }
    return StepStatus::Pending;
}

enum class ConditionKind {
    Os,
    EnvVarExists,
    FileExists
};

// Precondition gating whether a step runs or is marked Skipped.
struct Condition {
    ConditionKind kind = ConditionKind::Os;
    std::string value;

    static Condition Os(std::string name) { return {ConditionKind::Os, std::move(name)}; }
    static Condition EnvVarExists(std::string name) {
        return {ConditionKind::EnvVarExists, std::move(name)};
    }
    static Condition FileExists(std::string path) {
        return {ConditionKind::FileExists, std::move(path)};
    }
};

struct CodeBlock {
    std::optional<std::string> language;
    std::string content;
    std::vector<std::string> placeholders;
};

struct Step {
    std::string title;
    std::string description;
    std::vector<CodeBlock> code_blocks;
    StepStatus status = StepStatus::Pending;
    std::string output;
    std::optional<Condition> condition;

    bool IsExecutable() const { return !code_blocks.empty(); }
};

}  // namespace compass::models
