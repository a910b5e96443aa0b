#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/orchestrator.hpp"
#include "models/step_types.hpp"
#include "nlohmann/json.hpp"

namespace compass::headless {

inline constexpr int kParseError = -32700;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;

// Line-delimited JSON-RPC 2.0 driver. One request per line; responses and
// `log` notifications are written one JSON document per line.
class RpcServer {
public:
    RpcServer(std::vector<compass::models::Step> steps, compass::engine::ExecutionState state);

    // Runs until the input reaches EOF.
    void Serve(std::istream& input, std::ostream& output);

    void HandleLine(const std::string& line, std::ostream& output);

    const std::vector<compass::models::Step>& steps() const { return steps_; }

private:
    void ExecuteStep(const nlohmann::json& id, const nlohmann::json& params, std::ostream& output);
    void WriteLine(std::ostream& output, const nlohmann::json& message);
    void SendResult(std::ostream& output, const nlohmann::json& id, nlohmann::json result);
    void SendError(std::ostream& output, const nlohmann::json& id, int code, const std::string& message);

    std::vector<compass::models::Step> steps_;
    compass::engine::Orchestrator orchestrator_;
    std::mutex write_mutex_;
};

}  // namespace compass::headless
