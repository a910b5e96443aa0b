#pragma once

#include <optional>
#include <string>

namespace compass::security {

// Pre-flight check that the binary a command needs is on the search path.
// Both operations return std::nullopt when satisfied, otherwise a message
// naming the missing binary.
class DependencyGate {
public:
    // Looks at the first token of the trimmed content, skipping a leading
    // sudo. Assignments and shell builtins are always accepted.
    static std::optional<std::string> Validate(const std::string& content);

    static std::optional<std::string> ValidateBinary(const std::string& binary_name);

    static bool IsOnSearchPath(const std::string& binary_name);
};

}  // namespace compass::security
