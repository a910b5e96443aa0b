#pragma once

#include <optional>
#include <string>
#include <vector>

namespace compass::security {

// Plain substring scan for known-dangerous operations. Advisory only:
// obfuscated or dynamically built commands pass.
class SafetyGate {
public:
    // First pattern, in list order, contained in content.
    static std::optional<std::string> Check(const std::string& content,
                                            const std::vector<std::string>& patterns);
};

}  // namespace compass::security
