#include <gtest/gtest.h>

#include <sstream>

#include "headless/rpc_server.hpp"

using compass::engine::ExecutionState;
using compass::headless::RpcServer;
using compass::models::CodeBlock;
using compass::models::Step;

namespace {

std::vector<Step> SampleSteps() {
    Step first;
    first.title = "Greet";
    first.code_blocks.push_back(CodeBlock{std::string("sh"), "echo rpc-hello", {}});
    first.code_blocks.push_back(CodeBlock{std::nullopt, "exit 2", {}});
    first.code_blocks.push_back(CodeBlock{std::nullopt, "echo unreachable", {}});
    Step second;
    second.title = "Empty";
    return {first, second};
}

std::vector<nlohmann::json> ReadLines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

}  // namespace

TEST(RpcServer, GetSteps) {
    RpcServer server(SampleSteps(), ExecutionState::FromCurrentProcess());
    std::ostringstream output;
    server.HandleLine(R"({"jsonrpc":"2.0","method":"get_steps","id":1})", output);
    const auto lines = ReadLines(output.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["id"], 1);
    ASSERT_TRUE(lines[0]["result"].is_array());
    EXPECT_EQ(lines[0]["result"][0]["title"], "Greet");
}

TEST(RpcServer, ExecuteStepStreamsLogsAndStopsAtFailure) {
    RpcServer server(SampleSteps(), ExecutionState::FromCurrentProcess());
    std::ostringstream output;
    server.HandleLine(R"({"jsonrpc":"2.0","method":"execute_step","params":{"index":0},"id":2})", output);
    const auto lines = ReadLines(output.str());
    ASSERT_GE(lines.size(), 2u);
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) {
        EXPECT_EQ(lines[i]["method"], "log");
    }
    const auto& response = lines.back();
    EXPECT_EQ(response["id"], 2);
    EXPECT_EQ(response["result"]["status"], "Failed");
    const auto text = response["result"]["output"].get<std::string>();
    EXPECT_NE(text.find("rpc-hello"), std::string::npos);
    EXPECT_EQ(text.find("unreachable"), std::string::npos);
    EXPECT_EQ(server.steps()[0].status, compass::models::StepStatus::Failed);
}

TEST(RpcServer, ErrorCodes) {
    RpcServer server(SampleSteps(), ExecutionState::FromCurrentProcess());
    std::ostringstream output;
    server.HandleLine("{not json", output);
    server.HandleLine(R"({"jsonrpc":"2.0","method":"execute_step","params":{"index":9},"id":3})", output);
    server.HandleLine(R"({"jsonrpc":"2.0","method":"execute_step","params":{},"id":4})", output);
    server.HandleLine(R"({"jsonrpc":"2.0","method":"launch_rockets","id":5})", output);
    const auto lines = ReadLines(output.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0]["error"]["code"], compass::headless::kParseError);
    EXPECT_TRUE(lines[0]["id"].is_null());
    EXPECT_EQ(lines[1]["error"]["code"], compass::headless::kInvalidParams);
    EXPECT_EQ(lines[1]["error"]["message"], "Invalid params: index out of bounds");
    EXPECT_EQ(lines[2]["error"]["code"], compass::headless::kInvalidParams);
    EXPECT_EQ(lines[3]["error"]["code"], compass::headless::kMethodNotFound);
}

TEST(RpcServer, ServeReadsUntilEof) {
    RpcServer server(SampleSteps(), ExecutionState::FromCurrentProcess());
    std::istringstream input(
        "\n"
        R"({"jsonrpc":"2.0","method":"check_dependencies","id":6})"
        "\n");
    std::ostringstream output;
    server.Serve(input, output);
    const auto lines = ReadLines(output.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0]["result"]["missing"].is_array());
    EXPECT_TRUE(lines[0]["result"]["present"].is_array());
}
