#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "models/step_types.hpp"

namespace compass::checker {

struct CheckResult {
    // Both sorted ascending.
    std::vector<std::string> present;
    std::vector<std::string> missing;
};

using BinaryResolver = std::function<bool(const std::string&)>;

// Heuristic scan of every code block for the external commands it needs.
std::set<std::string> CollectCandidates(const std::vector<compass::models::Step>& steps);

CheckResult Partition(const std::set<std::string>& candidates, const BinaryResolver& resolver);

// CollectCandidates resolved against the search path.
CheckResult CheckDependencies(const std::vector<compass::models::Step>& steps);

}  // namespace compass::checker
