#include "security/safety_gate.hpp"

namespace compass::security {

std::optional<std::string> SafetyGate::Check(const std::string& content,
                                             const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (content.find(pattern) != std::string::npos) {
            return pattern;
        }
    }
    return std::nullopt;
}

}  // namespace compass::security
