#pragma once

#include <optional>
#include <string>

#include "engine/execution_state.hpp"
#include "engine/process_session.hpp"
#include "models/step_types.hpp"

namespace compass::engine {

struct GateRejection {
    enum class Kind {
        Dependency,
        Safety
    };
    Kind kind = Kind::Dependency;
    // Text reported to the user.
    std::string message;
    // Missing-binary message or the matched pattern.
    std::string detail;
};

// Runs one code block: dependency gate, safety gate, cd/export
// interception, then a ProcessSession on a snapshot of the state.
class Orchestrator {
public:
    Orchestrator();
    explicit Orchestrator(ExecutionState state);

    compass::models::StepStatus Execute(const std::string& content,
                                        const std::optional<std::string>& language,
                                        bool bypass_gates,
                                        const OutputSink& sink);

    // Dependency gate then safety gate, without side effects.
    static std::optional<GateRejection> CheckGates(const std::string& content,
                                                   const std::optional<std::string>& language);

    ExecutionState& state() { return state_; }
    const ExecutionState& state() const { return state_; }

private:
    ExecutionState state_;
};

}  // namespace compass::engine
