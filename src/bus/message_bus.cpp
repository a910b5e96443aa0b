#include "bus/message_bus.hpp"

#include <utility>

namespace compass::bus {

void MessageBus::Publish(const ExecutionMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(msg);
    }
    cv_.notify_one();
}

bool MessageBus::TryConsume(ExecutionMessage& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    msg = std::move(queue_.front());
    queue_.pop();
    return true;
}

std::vector<ExecutionMessage> MessageBus::Drain() {
    std::vector<ExecutionMessage> messages;
    std::lock_guard<std::mutex> lock(mutex_);
    messages.reserve(queue_.size());
    while (!queue_.empty()) {
        messages.push_back(std::move(queue_.front()));
        queue_.pop();
    }
    return messages;
}

}  // namespace compass::bus
