#pragma once

#include <optional>
#include <string>

namespace compass::analysis {

struct RecoveryRecommendation {
    std::string message;
    std::optional<std::string> fix_command;
};

// Matches the captured output of a failed step against a few well-known
// failure signatures. First match wins.
std::optional<RecoveryRecommendation> AnalyzeError(const std::string& output);

}  // namespace compass::analysis
