#include "engine/execution_state.hpp"

#include <system_error>

namespace compass::engine {

ExecutionState ExecutionState::FromCurrentProcess() {
    ExecutionState state{};
    std::error_code ec;
    state.current_dir = std::filesystem::current_path(ec);
    if (ec) {
        state.current_dir = ".";
    }
    return state;
}

}  // namespace compass::engine
