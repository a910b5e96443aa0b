#pragma once

#include <string>

#include "engine/execution_state.hpp"

namespace compass::engine {

struct InterceptResult {
    // Lines left for the real shell, joined with '\n'.
    std::string forwarded;
    // Confirmation lines for the cd/export lines that were consumed.
    std::string simulated_output;
};

// Emulates cd and export across otherwise independent child processes by
// applying them to the session state. Line-prefix matching only; no shell
// grammar.
class BuiltinInterceptor {
public:
    static InterceptResult Process(const std::string& content, ExecutionState& state);
};

}  // namespace compass::engine
