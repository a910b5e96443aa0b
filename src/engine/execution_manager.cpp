#include "engine/execution_manager.hpp"

#include <exception>
#include <thread>
#include <utility>

#include "engine/orchestrator.hpp"
#include "utils/logging.hpp"

namespace compass::engine {

using compass::bus::ExecutionMessage;
using compass::bus::Finished;
using compass::bus::MessageBus;
using compass::bus::OutputPartial;
using compass::models::StepStatus;

ExecutionManager::ExecutionManager()
    : ExecutionManager(ExecutionState::FromCurrentProcess()) {}

ExecutionManager::ExecutionManager(ExecutionState state)
    : state_(std::move(state))
    , bus_(std::make_shared<MessageBus>())
    , in_flight_(std::make_shared<std::atomic<std::size_t>>(0)) {}

void ExecutionManager::ExecuteBackground(std::size_t index,
                                         std::string content,
                                         std::optional<std::string> language,
                                         bool bypass_gates) {
    in_flight_->fetch_add(1);
    auto bus = bus_;
    auto in_flight = in_flight_;
    std::thread([bus, in_flight, index, snapshot = state_, content = std::move(content),
                 language = std::move(language), bypass_gates]() mutable {
        Orchestrator orchestrator(std::move(snapshot));
        auto status = StepStatus::Failed;
        try {
            status = orchestrator.Execute(content, language, bypass_gates,
                                          [&bus, index](const std::string& text) {
                                              bus->Publish(OutputPartial{index, text});
                                          });
        } catch (const std::exception& ex) {
            compass::utils::Log(compass::utils::LogLevel::kError, "manager", "execution raised",
                                {{"index", std::to_string(index)}, {"error", ex.what()}});
            bus->Publish(OutputPartial{index, std::string("Error: ") + ex.what() + "\n"});
        }
        const auto& final_state = orchestrator.state();
        bus->Publish(Finished{index, status, final_state.current_dir, final_state.env_vars});
        in_flight->fetch_sub(1);
    }).detach();
}

std::vector<ExecutionMessage> ExecutionManager::PollMessages() {
    return bus_->Drain();
}

std::optional<ExecutionMessage> ExecutionManager::WaitMessage(std::chrono::milliseconds timeout) {
    ExecutionMessage msg;
    if (!bus_->TryConsume(msg, timeout)) {
        return std::nullopt;
    }
    return msg;
}

void ExecutionManager::ApplyFinished(const Finished& finished) {
    state_.current_dir = finished.current_dir;
    state_.env_vars = finished.env_vars;
}

std::size_t ExecutionManager::InFlight() const {
    return in_flight_->load();
}

}  // namespace compass::engine
