#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "bus/events.hpp"

namespace compass::bus {

// Unbounded multi-producer queue of execution messages.
class MessageBus {
public:
    void Publish(const ExecutionMessage& msg);
    bool TryConsume(ExecutionMessage& msg, std::chrono::milliseconds timeout);
    // Everything queued right now, in publish order. Never blocks.
    std::vector<ExecutionMessage> Drain();

private:
    std::queue<ExecutionMessage> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace compass::bus
