#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bus/message_bus.hpp"
#include "engine/execution_state.hpp"

namespace compass::engine {

// Dispatches executions onto background threads and hands their messages
// back to the caller. Owns the authoritative ExecutionState; background
// work only ever sees a copy.
class ExecutionManager {
public:
    ExecutionManager();
    explicit ExecutionManager(ExecutionState state);

    // Returns immediately. The execution publishes zero or more
    // OutputPartial messages followed by exactly one Finished.
    void ExecuteBackground(std::size_t index,
                           std::string content,
                           std::optional<std::string> language,
                           bool bypass_gates);

    std::vector<compass::bus::ExecutionMessage> PollMessages();
    std::optional<compass::bus::ExecutionMessage> WaitMessage(std::chrono::milliseconds timeout);

    // Replaces current_dir and env_vars with the finished execution's.
    void ApplyFinished(const compass::bus::Finished& finished);

    std::size_t InFlight() const;

    ExecutionState& state() { return state_; }
    const ExecutionState& state() const { return state_; }

private:
    ExecutionState state_;
    std::shared_ptr<compass::bus::MessageBus> bus_;
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

}  // namespace compass::engine
