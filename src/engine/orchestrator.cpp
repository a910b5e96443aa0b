#include "engine/orchestrator.hpp"

#include <utility>

#include "engine/builtin_interceptor.hpp"
#include "languages/language_strategy.hpp"
#include "security/dependency_gate.hpp"
#include "security/safety_gate.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace compass::engine {

using compass::languages::LanguageStrategy;
using compass::models::StepStatus;

Orchestrator::Orchestrator()
    : state_(ExecutionState::FromCurrentProcess()) {}

Orchestrator::Orchestrator(ExecutionState state)
    : state_(std::move(state)) {}

std::optional<GateRejection> Orchestrator::CheckGates(const std::string& content,
                                                      const std::optional<std::string>& language) {
    const auto strategy = LanguageStrategy::FromTag(language);

    const auto missing = LanguageStrategy::IsShellTag(language)
                             ? compass::security::DependencyGate::Validate(content)
                             : compass::security::DependencyGate::ValidateBinary(strategy.RequiredCommand());
    if (missing.has_value()) {
        return GateRejection{GateRejection::Kind::Dependency, *missing, *missing};
    }

    const auto pattern = compass::security::SafetyGate::Check(content, strategy.DangerousPatterns());
    if (pattern.has_value()) {
        return GateRejection{
            GateRejection::Kind::Safety,
            "Safety alert: Dangerous pattern detected ('" + *pattern + "'). Execution blocked.",
            *pattern};
    }
    return std::nullopt;
}

StepStatus Orchestrator::Execute(const std::string& content,
                                 const std::optional<std::string>& language,
                                 bool bypass_gates,
                                 const OutputSink& sink) {
    auto emit = [&sink](const std::string& text) {
        if (sink) {
            sink(text);
        }
    };

    if (!bypass_gates) {
        if (auto rejection = CheckGates(content, language)) {
            compass::utils::Log(compass::utils::LogLevel::kInfo, "orchestrator", "blocked",
                                {{"reason", rejection->kind == GateRejection::Kind::Safety ? "safety" : "dependency"},
                                 {"detail", rejection->detail}});
            emit(rejection->message + "\n");
            return StepStatus::Failed;
        }
    }

    const auto intercepted = BuiltinInterceptor::Process(content, state_);
    if (!intercepted.simulated_output.empty()) {
        emit(intercepted.simulated_output);
    }
    if (compass::utils::Trim(intercepted.forwarded).empty()) {
        return StepStatus::Success;
    }

    ProcessSession session(state_);
    return session.Run(intercepted.forwarded, language, sink);
}

}  // namespace compass::engine
