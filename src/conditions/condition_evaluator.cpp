#include "conditions/condition_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace compass::conditions {
namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

std::string StandardEvaluator::CurrentOs() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

bool StandardEvaluator::Evaluate(const compass::models::Condition& condition) const {
    switch (condition.kind) {
        case compass::models::ConditionKind::Os: {
            auto wanted = ToLower(condition.value);
            if (wanted == "darwin" || wanted == "mac") {
                wanted = "macos";
            }
            return wanted == CurrentOs();
        }
        case compass::models::ConditionKind::EnvVarExists:
            return std::getenv(condition.value.c_str()) != nullptr;
        case compass::models::ConditionKind::FileExists: {
            std::error_code ec;
            return std::filesystem::exists(condition.value, ec);
        }
    }
    return false;
}

}  // namespace compass::conditions
