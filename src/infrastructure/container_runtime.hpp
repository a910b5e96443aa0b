#pragma once

#include <optional>
#include <string>

namespace compass::infrastructure {

// std::nullopt when `<runtime> info` succeeds, otherwise a message telling
// the user whether the runtime is missing or just not running.
std::optional<std::string> EnsureRuntimeAvailable(const std::string& runtime);

}  // namespace compass::infrastructure
