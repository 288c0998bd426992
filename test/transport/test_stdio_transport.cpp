#include <catch2/catch_test_macros.hpp>

#include <berry_mcp/transport/stdio_transport.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using namespace berry_mcp;

namespace {

// Drains the transport until end of input.
std::vector<nlohmann::json> ReceiveAll(StdioTransport& transport) {
    std::vector<nlohmann::json> messages;
    while (auto message = transport.Receive()) {
        messages.push_back(std::move(*message));
    }
    return messages;
}

std::vector<nlohmann::json> OutputLines(const std::ostringstream& out) {
    std::vector<nlohmann::json> lines;
    std::istringstream stream(out.str());
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// Receive
// ===========================================================================

TEST_CASE("StdioTransport: receives lines in order", "[transport][stdio]") {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    auto messages = ReceiveAll(transport);
    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["id"] == 1);
    CHECK(messages[1]["method"] == "tools/list");
    CHECK(transport.IsInputClosed());
    CHECK(out.str().empty());
}

TEST_CASE("StdioTransport: blank and padded lines", "[transport][stdio]") {
    std::istringstream in("\n   \r\n  {\"jsonrpc\":\"2.0\",\"method\":\"x\"}  \r\n\n");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    auto messages = ReceiveAll(transport);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["method"] == "x");
}

TEST_CASE("StdioTransport: malformed line answered with parse error", "[transport][stdio]") {
    std::istringstream in(
        "{not json\n"
        "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    auto messages = ReceiveAll(transport);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["id"] == 7);

    auto written = OutputLines(out);
    REQUIRE(written.size() == 1);
    CHECK(written[0]["jsonrpc"] == "2.0");
    CHECK(written[0]["id"].is_null());
    CHECK(written[0]["error"]["code"] == -32700);
    auto message = written[0]["error"]["message"].get<std::string>();
    CHECK(message.rfind("Parse error: ", 0) == 0);
}

TEST_CASE("StdioTransport: final line without newline still delivered",
          "[transport][stdio]") {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    auto messages = ReceiveAll(transport);
    REQUIRE(messages.size() == 2);
    CHECK(messages[1]["id"] == 2);
}

TEST_CASE("StdioTransport: end of input mid-line does not hang", "[transport][stdio]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"meth");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    CHECK_FALSE(transport.Receive().has_value());
    CHECK_FALSE(transport.Receive().has_value());
    CHECK(transport.IsInputClosed());

    auto written = OutputLines(out);
    REQUIRE(written.size() == 1);
    CHECK(written[0]["error"]["code"] == -32700);
}

TEST_CASE("StdioTransport: empty input ends immediately", "[transport][stdio]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());
    CHECK_FALSE(transport.Receive().has_value());
}

// ===========================================================================
// Send
// ===========================================================================

TEST_CASE("StdioTransport: Send writes one line and adds jsonrpc", "[transport][stdio]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.Send({{"id", 1}, {"result", {{"ok", true}}}});
    transport.Send({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});

    auto written = OutputLines(out);
    REQUIRE(written.size() == 2);
    CHECK(written[0]["jsonrpc"] == "2.0");
    CHECK(written[0]["result"]["ok"] == true);
    CHECK(written[1]["method"] == "notifications/progress");

    auto text = out.str();
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
}

TEST_CASE("StdioTransport: Send keeps working after end of input", "[transport][stdio]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());

    auto messages = ReceiveAll(transport);
    REQUIRE(messages.size() == 1);
    transport.Send({{"id", 1}, {"result", nlohmann::json::object()}});
    CHECK(OutputLines(out).size() == 1);
}

TEST_CASE("StdioTransport: invalid UTF-8 in output is replaced", "[transport][stdio]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.Send({{"id", 1}, {"result", std::string("bad \xff byte")}});
    auto written = OutputLines(out);
    REQUIRE(written.size() == 1);
    CHECK(written[0]["id"] == 1);
}

// ===========================================================================
// Close
// ===========================================================================

TEST_CASE("StdioTransport: Close is idempotent and stops output", "[transport][stdio]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out, std::chrono::milliseconds(200));
    REQUIRE(transport.Connect().IsOk());

    transport.Close();
    transport.Close();
    CHECK(transport.IsClosed());
    CHECK(transport.IsInputClosed());
    CHECK_FALSE(transport.Receive().has_value());

    transport.Send({{"id", 2}, {"result", 1}});
    CHECK(out.str().empty());
}

TEST_CASE("StdioTransport: Connect after Close fails", "[transport][stdio]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);
    transport.Close();

    auto result = transport.Connect();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
}

TEST_CASE("StdioTransport: second Connect is harmless", "[transport][stdio]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);
    REQUIRE(transport.Connect().IsOk());
    CHECK(transport.Connect().IsOk());
    CHECK(transport.Name() == "stdio");
}
