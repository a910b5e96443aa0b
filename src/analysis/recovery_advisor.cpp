#include "analysis/recovery_advisor.hpp"

#include <regex>

#include "utils/common.hpp"

namespace compass::analysis {

using compass::utils::Contains;

std::optional<RecoveryRecommendation> AnalyzeError(const std::string& output) {
    static const std::regex kPortInUse(
        "(address already in use|EADDRINUSE|bind: address already in use)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex kPythonModule("ModuleNotFoundError: No module named '([^']+)'");

    if (std::regex_search(output, kPortInUse)) {
        // No fix command: the port number is not reliably recoverable.
        return RecoveryRecommendation{
            "Port seems to be occupied. You might want to kill the process utilizing it.",
            std::nullopt};
    }
    if (Contains(output, "Permission denied") || Contains(output, "EACCES")) {
        return RecoveryRecommendation{
            "Permission denied. You might need 'sudo' or check file permissions.",
            std::nullopt};
    }
    std::smatch match;
    if (std::regex_search(output, match, kPythonModule)) {
        const auto module = match[1].str();
        return RecoveryRecommendation{
            "Python module '" + module + "' is missing.",
            "pip install " + module};
    }
    if (Contains(output, "command not found") || Contains(output, "not recognized as an internal")) {
        return RecoveryRecommendation{
            "Command not found. Ensure it is installed and in your PATH.",
            std::nullopt};
    }
    if (Contains(output, "Could not get lock /var/lib/dpkg/lock")) {
        return RecoveryRecommendation{
            "APT database is locked. Another process might be installing software.",
            std::string("sudo fuser -v /var/lib/dpkg/lock")};
    }
    return std::nullopt;
}

}  // namespace compass::analysis
