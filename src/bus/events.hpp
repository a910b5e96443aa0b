#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>

#include "models/step_types.hpp"

namespace compass::bus {

struct OutputPartial {
    std::size_t index = 0;
    std::string text;
};

// Terminal message for one dispatched execution, carrying the state the
// execution ended with so the caller can merge it.
struct Finished {
    std::size_t index = 0;
    compass::models::StepStatus status = compass::models::StepStatus::Failed;
    std::filesystem::path current_dir;
    std::unordered_map<std::string, std::string> env_vars;
};

using ExecutionMessage = std::variant<OutputPartial, Finished>;

inline std::size_t MessageIndex(const ExecutionMessage& message) {
    return std::visit([](const auto& payload) { return payload.index; }, message);
}

}  // namespace compass::bus
