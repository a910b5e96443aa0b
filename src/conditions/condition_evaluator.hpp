#pragma once

#include <string>

#include "models/step_types.hpp"

namespace compass::conditions {

class ConditionEvaluator {
public:
    virtual ~ConditionEvaluator() = default;
    virtual bool Evaluate(const compass::models::Condition& condition) const = 0;
};

// Checks against the running platform, process environment and filesystem.
class StandardEvaluator : public ConditionEvaluator {
public:
    bool Evaluate(const compass::models::Condition& condition) const override;

    // "linux", "macos", "windows", "freebsd" or "unknown".
    static std::string CurrentOs();
};

}  // namespace compass::conditions
