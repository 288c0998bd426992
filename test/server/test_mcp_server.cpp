#include <catch2/catch_test_macros.hpp>

#include <berry_mcp/core/version.hpp>
#include <berry_mcp/registry/typed_tool.hpp>
#include <berry_mcp/server/mcp_server.hpp>
#include <berry_mcp/server/tool_context.hpp>

#include "mocks/recording_transport.hpp"

#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace berry_mcp;
using berry_mcp::testing::RecordingTransport;

namespace {

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    RegisterFunction(registry, "add", "Add two integers",
                     {Arg("a"), Arg("b")},
                     [](int a, int b) { return a + b; });
    RegisterFunction(registry, "fail", "Always throws",
                     {Arg("reason").Default(std::string("broken"))},
                     [](const std::string& reason) -> int {
                         throw std::runtime_error(reason);
                     });
    RegisterFunction(registry, "panic", "Throws a value that is not an exception class",
                     {},
                     []() -> int { throw 42; });
    RegisterFunction(registry, "panic_async", "Async tool whose task throws a string",
                     {},
                     []() -> std::future<int> {
                         return std::async(std::launch::async, []() -> int {
                             throw std::string("lost");
                         });
                     });
    RegisterFunction(registry, "soft_fail", "Reports an error object",
                     {},
                     [] { return nlohmann::json{{"error", "quota exceeded"}}; });
    RegisterFunction(registry, "stats", "Returns an object",
                     {},
                     [] { return nlohmann::json{{"count", 2}}; });
    RegisterFunction(registry, "stream", "Reports progress and streams chunks",
                     {Arg("parts")},
                     [](int parts, ToolContext& context) -> std::future<std::string> {
                         return std::async(std::launch::async, [parts, &context] {
                             for (int i = 1; i <= parts; ++i) {
                                 context.ReportProgress(i, parts);
                                 context.SendChunk({{"part", i}});
                             }
                             return "streamed " + std::to_string(parts);
                         });
                     });
    return registry;
}

nlohmann::json CallRequest(const nlohmann::json& id, const std::string& name,
                           const nlohmann::json& arguments) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", name}, {"arguments", arguments}}}
    };
}

std::string ContentText(const nlohmann::json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

} // anonymous namespace

// ===========================================================================
// ToolOutcome
// ===========================================================================

TEST_CASE("ToolOutcome: FromValue mapping", "[server][outcome]") {
    CHECK(ToolOutcome::FromValue("plain").text == "plain");
    CHECK_FALSE(ToolOutcome::FromValue("plain").is_error);

    auto number = ToolOutcome::FromValue(8);
    CHECK(number.text == "8");
    CHECK_FALSE(number.is_error);

    auto error = ToolOutcome::FromValue({{"error", "nope"}});
    CHECK(error.is_error);
    CHECK(error.text == "nope");

    auto structured = ToolOutcome::FromValue({{"error", {{"code", 3}}}});
    CHECK(structured.is_error);
    CHECK(structured.text == "{\"code\":3}");

    CHECK(ToolOutcome::FromValue(nullptr).text == "null");
}

TEST_CASE("ToolOutcome: ToJson shape", "[server][outcome]") {
    CHECK(ToolOutcome::Failure("bad").ToJson() == nlohmann::json{
        {"content", {{{"type", "text"}, {"text", "bad"}}}},
        {"isError", true}
    });
}

// ===========================================================================
// initialize / tools/list / ping
// ===========================================================================

TEST_CASE("McpServer: initialize reports identity and capabilities", "[server]") {
    McpServer server(ServerInfo{"unit-server", "9.9.9"}, MakeTestRegistry());
    CHECK_FALSE(server.IsInitialized());

    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", {{"clientInfo", {{"name", "tester"}, {"version", "1.0"}}},
                    {"protocolVersion", "2024-11-05"}}}
    };

    for (int attempt = 0; attempt < 2; ++attempt) {
        auto response = server.HandleMessage(request);
        REQUIRE(response.has_value());
        auto& result = (*response)["result"];
        CHECK(result["protocolVersion"] == kProtocolVersion);
        CHECK(result["serverInfo"] == nlohmann::json{{"name", "unit-server"},
                                                     {"version", "9.9.9"}});
        CHECK(result["capabilities"]["tools"]["dynamicRegistration"] == false);
        CHECK(server.IsInitialized());
    }
}

TEST_CASE("McpServer: tools/list in registration order", "[server]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 7);
    CHECK(tools[0]["name"] == "add");
    CHECK(tools[0]["description"] == "Add two integers");
    CHECK(tools[0]["inputSchema"]["properties"]["a"]["type"] == "integer");
    CHECK(tools[0]["inputSchema"]["required"] == nlohmann::json::array({"a", "b"}));
    CHECK(tools[6]["name"] == "stream");
    CHECK_FALSE(tools[6]["inputSchema"]["properties"].contains("context"));
}

TEST_CASE("McpServer: ping and lifecycle notifications", "[server]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());

    auto pong = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
    REQUIRE(pong.has_value());
    CHECK((*pong)["result"] == nlohmann::json::object());

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
         {"params", {{"requestId", 4}}}}).has_value());
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/call success", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage(CallRequest(1, "add", {{"a", 5}, {"b", 3}}));

    REQUIRE(response.has_value());
    CHECK(*response == nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", {{{"type", "text"}, {"text", "8"}}}},
                    {"isError", false}}}
    });
}

TEST_CASE("McpServer: unknown tool is a tool-level failure", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage(CallRequest(1, "missing", {{"a", 5}, {"b", 3}}));

    REQUIRE(response.has_value());
    CHECK_FALSE(response->contains("error"));
    CHECK((*response)["result"]["isError"] == true);
    CHECK(ContentText(*response).find("Tool not found: missing") != std::string::npos);
}

TEST_CASE("McpServer: missing tool name", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"}, {"params", {{"arguments", {}}}}});

    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    CHECK(ContentText(*response) == "Missing required parameter: 'name'");
}

TEST_CASE("McpServer: non-object arguments", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage(CallRequest(3, "add", nlohmann::json::array({1, 2})));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    CHECK(ContentText(*response) == "Tool execution error: arguments must be an object");
}

TEST_CASE("McpServer: tool exceptions become isError content", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());

    auto thrown = server.HandleMessage(CallRequest(4, "fail", {{"reason", "disk full"}}));
    REQUIRE(thrown.has_value());
    CHECK((*thrown)["result"]["isError"] == true);
    CHECK(ContentText(*thrown) == "Tool execution error: disk full");

    auto bad_args = server.HandleMessage(CallRequest(5, "add", {{"a", "five"}, {"b", 3}}));
    REQUIRE(bad_args.has_value());
    CHECK((*bad_args)["result"]["isError"] == true);
    CHECK(ContentText(*bad_args).find("Invalid type for argument 'a'") != std::string::npos);

    auto missing = server.HandleMessage(CallRequest(6, "add", {{"a", 1}}));
    REQUIRE(missing.has_value());
    CHECK(ContentText(*missing) == "Tool execution error: Missing required argument: b");
}

TEST_CASE("McpServer: non-standard exceptions become isError content", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());

    for (const auto* name : {"panic", "panic_async"}) {
        std::optional<nlohmann::json> response;
        REQUIRE_NOTHROW(response = server.HandleMessage(CallRequest(9, name,
                                                                    nlohmann::json::object())));
        REQUIRE(response.has_value());
        CHECK((*response)["id"] == 9);
        CHECK((*response)["result"]["isError"] == true);
        CHECK(ContentText(*response) == "Tool execution error: unknown exception");
    }

    // The server keeps answering afterwards.
    auto after = server.HandleMessage(CallRequest(10, "add", {{"a", 1}, {"b", 2}}));
    REQUIRE(after.has_value());
    CHECK(ContentText(*after) == "3");
}

TEST_CASE("McpServer: Run survives a handler throwing a non-standard value", "[server][run]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    server.Engine().SetRequestHandler("ping",
        [](const nlohmann::json&, const RequestContext&) -> Result<nlohmann::json, RpcError> {
            throw 7;
        });
    RecordingTransport transport;
    transport.EnqueueReceive({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    transport.EnqueueReceive(CallRequest(2, "panic", nlohmann::json::object()));
    transport.EnqueueReceive(CallRequest(3, "add", {{"a", 1}, {"b", 1}}));

    REQUIRE(server.Run(transport).IsOk());
    auto sent = transport.Sent();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["error"]["code"] == -32000);
    CHECK(sent[1]["result"]["isError"] == true);
    CHECK(sent[2]["result"]["content"][0]["text"] == "2");
    CHECK(transport.CloseCount() == 1);
}

TEST_CASE("McpServer: error objects and structured results", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());

    auto soft = server.HandleMessage(CallRequest(1, "soft_fail", nlohmann::json::object()));
    REQUIRE(soft.has_value());
    CHECK((*soft)["result"]["isError"] == true);
    CHECK(ContentText(*soft) == "quota exceeded");

    auto stats = server.HandleMessage(CallRequest(2, "stats", nlohmann::json::object()));
    REQUIRE(stats.has_value());
    CHECK((*stats)["result"]["isError"] == false);
    CHECK(nlohmann::json::parse(ContentText(*stats)) == nlohmann::json{{"count", 2}});
}

TEST_CASE("McpServer: missing arguments default to an empty object", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"}, {"params", {{"name", "fail"}}}});
    REQUIRE(response.has_value());
    CHECK(ContentText(*response) == "Tool execution error: broken");
}

TEST_CASE("McpServer: progress and chunks reach the transport", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    RecordingTransport transport;
    REQUIRE(server.Connect(transport).IsOk());

    auto request = CallRequest("op-7", "stream", {{"parts", 2}});
    request["params"]["_meta"] = {{"progressToken", "tok"}};
    auto response = server.HandleMessage(request);

    REQUIRE(response.has_value());
    CHECK(ContentText(*response) == "streamed 2");

    auto progress = transport.SentNotifications("notifications/progress");
    REQUIRE(progress.size() == 2);
    CHECK(progress[0]["params"]["progressToken"] == "tok");
    CHECK(progress[0]["params"]["progress"] == 1.0);
    CHECK(progress[1]["params"]["total"] == 2.0);

    auto chunks = transport.SentNotifications("notifications/streaming/chunk");
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0]["params"]["operation_id"] == "op-7");
    CHECK(chunks[0]["params"]["sequence"] == 1);
    CHECK(chunks[1]["params"]["sequence"] == 2);
    CHECK(chunks[1]["params"]["data"]["part"] == 2);
    CHECK(chunks[1]["params"]["type"] == "data");
}

TEST_CASE("McpServer: no progress without a token", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    RecordingTransport transport;
    REQUIRE(server.Connect(transport).IsOk());

    auto response = server.HandleMessage(CallRequest(9, "stream", {{"parts", 1}}));
    REQUIRE(response.has_value());
    CHECK(transport.SentNotifications("notifications/progress").empty());
    CHECK(transport.SentNotifications("notifications/streaming/chunk").size() == 1);
}

TEST_CASE("McpServer: concurrent calls", "[server][call]") {
    McpServer server(ServerInfo{}, MakeTestRegistry(), ServerOptions{2, nullptr});

    std::vector<std::future<std::optional<nlohmann::json>>> calls;
    for (int i = 0; i < 8; ++i) {
        calls.push_back(std::async(std::launch::async, [&server, i] {
            return server.HandleMessage(CallRequest(i, "add", {{"a", i}, {"b", 1}}));
        }));
    }
    for (int i = 0; i < 8; ++i) {
        auto response = calls[i].get();
        REQUIRE(response.has_value());
        CHECK((*response)["id"] == i);
        CHECK(ContentText(*response) == std::to_string(i + 1));
    }
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("McpServer: Run answers requests until input ends", "[server][run]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    RecordingTransport transport;
    transport.EnqueueReceive({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    transport.EnqueueReceive({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    transport.EnqueueReceive(CallRequest(2, "add", {{"a", 2}, {"b", 2}}));
    transport.EnqueueReceive({{"jsonrpc", "1.0"}, {"id", 3}, {"method", "ping"}});

    auto result = server.Run(transport);
    REQUIRE(result.IsOk());

    auto sent = transport.Sent();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["id"] == 1);
    CHECK(sent[1]["result"]["content"][0]["text"] == "4");
    CHECK(sent[2]["error"]["code"] == -32600);
    CHECK(transport.ConnectCount() == 1);
    CHECK(transport.CloseCount() == 1);
}

TEST_CASE("McpServer: Run reports a failed connect", "[server][run]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    RecordingTransport transport;
    transport.FailConnect(Error{"Connect", "no stdin", ErrorCategory::Transport, std::nullopt});

    auto result = server.Run(transport);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "no stdin");
    CHECK(transport.CloseCount() == 1);
    CHECK(transport.Sent().empty());
}

TEST_CASE("McpServer: SendNotification goes through the connected transport", "[server]") {
    McpServer server(ServerInfo{}, MakeTestRegistry());
    server.SendNotification("notifications/message", {{"level", "info"}});

    RecordingTransport transport;
    REQUIRE(server.Connect(transport).IsOk());
    server.SendNotification("notifications/message", {{"level", "info"}});

    auto sent = transport.SentNotifications("notifications/message");
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["params"]["level"] == "info");
}

// ===========================================================================
// ToolContext
// ===========================================================================

TEST_CASE("ToolContext: operation id follows the request id", "[server][context]") {
    CHECK(ToolContext("abc", std::nullopt, {}).OperationId() == "abc");
    CHECK(ToolContext(12, std::nullopt, {}).OperationId() == "12");

    ToolContext anonymous(nullptr, std::nullopt, {});
    CHECK(anonymous.OperationId().rfind("op_", 0) == 0);
    CHECK(anonymous.OperationId().size() == 11);
}

TEST_CASE("ToolContext: progress message and chunk counter", "[server][context]") {
    std::vector<std::pair<std::string, nlohmann::json>> sent;
    ToolContext context(1, nlohmann::json(5),
                        [&sent](const std::string& method, const nlohmann::json& params) {
                            sent.emplace_back(method, params);
                        });

    context.ReportProgress(0.5, std::nullopt, std::string("halfway"));
    context.SendChunk("a");
    context.SendChunk("b");

    REQUIRE(sent.size() == 3);
    CHECK(sent[0].second["progressToken"] == 5);
    CHECK(sent[0].second["message"] == "halfway");
    CHECK_FALSE(sent[0].second.contains("total"));
    CHECK(sent[2].second["sequence"] == 2);
    CHECK(context.ChunksSent() == 2);
}

TEST_CASE("ToolContext: notifier failures are contained", "[server][context]") {
    ToolContext context(1, nlohmann::json("t"),
                        [](const std::string&, const nlohmann::json&) {
                            throw std::runtime_error("closed");
                        });
    CHECK_NOTHROW(context.ReportProgress(1));
    CHECK_NOTHROW(context.SendChunk(nullptr));
    CHECK(context.Elicitation() == nullptr);
}
