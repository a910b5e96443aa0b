#include "headless/rpc_server.hpp"

#include <istream>
#include <ostream>
#include <utility>

#include "checker/dependency_checker.hpp"
#include "models/step_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace compass::headless {

using compass::models::StepStatus;

RpcServer::RpcServer(std::vector<compass::models::Step> steps, compass::engine::ExecutionState state)
    : steps_(std::move(steps))
    , orchestrator_(std::move(state)) {}

void RpcServer::Serve(std::istream& input, std::ostream& output) {
    std::string line;
    while (std::getline(input, line)) {
        HandleLine(line, output);
    }
}

void RpcServer::HandleLine(const std::string& line, std::ostream& output) {
    const auto text = compass::utils::Trim(line);
    if (text.empty()) {
        return;
    }

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        SendError(output, nullptr, kParseError, std::string("Parse error: ") + ex.what());
        return;
    }
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        SendError(output, request.is_object() ? request.value("id", nlohmann::json()) : nlohmann::json(),
                  kParseError, "Parse error: missing method");
        return;
    }

    const auto id = request.value("id", nlohmann::json());
    const auto method = request["method"].get<std::string>();
    const auto params = request.value("params", nlohmann::json::object());
    compass::utils::Log(compass::utils::LogLevel::kDebug, "rpc", "request", {{"method", method}});

    if (method == "get_steps") {
        SendResult(output, id, compass::models::StepsToJson(steps_));
    } else if (method == "execute_step") {
        ExecuteStep(id, params, output);
    } else if (method == "check_dependencies") {
        const auto result = compass::checker::CheckDependencies(steps_);
        SendResult(output, id, {{"present", result.present}, {"missing", result.missing}});
    } else {
        SendError(output, id, kMethodNotFound, "Method not found");
    }
}

void RpcServer::ExecuteStep(const nlohmann::json& id, const nlohmann::json& params, std::ostream& output) {
    if (!params.is_object() || !params.contains("index") || !params["index"].is_number_unsigned()) {
        SendError(output, id, kInvalidParams, "Invalid params: missing index");
        return;
    }
    const auto index = params["index"].get<std::size_t>();
    if (index >= steps_.size()) {
        SendError(output, id, kInvalidParams, "Invalid params: index out of bounds");
        return;
    }

    std::string collected;
    auto sink = [this, &collected, &output](const std::string& text) {
        collected += text;
        WriteLine(output, {{"jsonrpc", "2.0"}, {"method", "log"}, {"params", {{"output", text}}}});
    };

    auto final_status = StepStatus::Success;
    // Headless callers have already decided to run the step, so gates are bypassed.
    for (const auto& block : steps_[index].code_blocks) {
        const auto status = orchestrator_.Execute(block.content, block.language, true, sink);
        if (status != StepStatus::Success) {
            final_status = status;
            break;
        }
    }

    auto& step = steps_[index];
    step.status = final_status;
    if (!collected.empty()) {
        step.output = collected;
    }
    SendResult(output, id, {{"status", compass::models::ToString(final_status)}, {"output", step.output}});
}

void RpcServer::WriteLine(std::ostream& output, const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    output << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    output.flush();
}

void RpcServer::SendResult(std::ostream& output, const nlohmann::json& id, nlohmann::json result) {
    WriteLine(output, {{"jsonrpc", "2.0"}, {"result", std::move(result)}, {"id", id}});
}

void RpcServer::SendError(std::ostream& output, const nlohmann::json& id, int code, const std::string& message) {
    WriteLine(output, {{"jsonrpc", "2.0"}, {"error", {{"code", code}, {"message", message}}}, {"id", id}});
}

}  // namespace compass::headless
