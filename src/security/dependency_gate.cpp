#include "security/dependency_gate.hpp"

#include <boost/process/search_path.hpp>
#include <filesystem>
#include <system_error>
#include <unordered_set>

#include "utils/common.hpp"

namespace compass::security {
namespace {

const std::unordered_set<std::string>& ExemptTokens() {
    static const std::unordered_set<std::string> kExempt = {
        "cd", "export", "set", "exit", "echo", "unset", "source", ".", "alias",
        "true", "false", "test", "[", "pwd", "if", "for", "while", "case", "function"
    };
    return kExempt;
}

}  // namespace

bool DependencyGate::IsOnSearchPath(const std::string& binary_name) {
    if (binary_name.empty()) {
        return false;
    }
    if (binary_name.find('/') != std::string::npos) {
        std::error_code ec;
        return std::filesystem::is_regular_file(binary_name, ec);
    }
    return !boost::process::search_path(binary_name).empty();
}

std::optional<std::string> DependencyGate::ValidateBinary(const std::string& binary_name) {
    if (!IsOnSearchPath(binary_name)) {
        return "Missing dependency: '" + binary_name + "' is not installed or not in PATH.";
    }
    return std::nullopt;
}

std::optional<std::string> DependencyGate::Validate(const std::string& content) {
    const auto tokens = compass::utils::SplitWhitespace(compass::utils::Trim(content));
    if (tokens.empty()) {
        return std::nullopt;
    }
    std::size_t index = 0;
    if (tokens[index] == "sudo") {
        ++index;
        if (index >= tokens.size()) {
            return std::nullopt;
        }
    }
    const auto& binary_name = tokens[index];
    if (binary_name.find('=') != std::string::npos || ExemptTokens().count(binary_name) > 0) {
        return std::nullopt;
    }
    if (!IsOnSearchPath(binary_name)) {
        return "Requirement not met: '" + binary_name + "' is not installed.";
    }
    return std::nullopt;
}

}  // namespace compass::security
