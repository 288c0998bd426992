#pragma once

#include <berry_mcp/core/result.hpp>
#include <berry_mcp/core/version.hpp>
#include <berry_mcp/protocol/protocol_engine.hpp>
#include <berry_mcp/registry/tool_registry.hpp>
#include <berry_mcp/transport/transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace berry_mcp {

class ElicitationManager;
class WorkerPool;

struct ServerInfo {
    std::string name = kDefaultServerName;
    std::string version = kVersion;
};

struct ServerOptions {
    std::size_t worker_threads = 4;
    ElicitationManager* elicitation = nullptr; // non-owning, optional
};

// ---------------------------------------------------------------------------
// ToolOutcome: the tool-level result channel of tools/call.
//
// A failed tool is still a successful JSON-RPC exchange: it answers with
// isError:true and the failure text as content.
// ---------------------------------------------------------------------------
struct ToolOutcome {
    bool is_error = false;
    std::string text;

    static ToolOutcome Success(std::string text) { return {false, std::move(text)}; }
    static ToolOutcome Failure(std::string text) { return {true, std::move(text)}; }

    // Maps a tool's return value: a string is used as-is, an object with an
    // "error" key is a failure, anything else is serialised.
    static ToolOutcome FromValue(const nlohmann::json& value);

    // {"content": [{"type": "text", "text": ...}], "isError": ...}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over any ITransport.
//
// Implements the MCP methods on top of a ProtocolEngine:
//   - initialize
//   - tools/list
//   - tools/call (honours params._meta.progressToken)
//   - ping
//   - notifications/initialized, notifications/cancelled (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ServerInfo info, ToolRegistry registry, ServerOptions options = {});
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Routes the transport's inbound messages here and our notifications to
    // the transport, then connects it. The transport must outlive the server
    // or be closed first.
    Result<void, Error> Connect(ITransport& transport);

    // Receive -> handle -> send until the transport runs dry. A failing
    // iteration is logged and the loop goes on. Always closes the transport.
    Result<void, Error> Run(ITransport& transport);

    // Process one JSON-RPC message; nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    void SendNotification(const std::string& method, const nlohmann::json& params);

    [[nodiscard]] ProtocolEngine& Engine() noexcept { return engine_; }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

    // True once a client has sent initialize.
    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    void RegisterHandlers();

    Result<nlohmann::json, RpcError> HandleInitialize(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleToolsList();
    Result<nlohmann::json, RpcError> HandleToolsCall(const nlohmann::json& params,
                                                     const RequestContext& request);

    ToolOutcome CallTool(const ToolDescriptor& tool, const nlohmann::json& arguments,
                         const nlohmann::json& request_id,
                         std::optional<nlohmann::json> progress_token);

    ServerInfo info_;
    ToolRegistry registry_;
    ServerOptions options_;
    ProtocolEngine engine_;
    std::unique_ptr<WorkerPool> tool_pool_;
    std::atomic<bool> initialized_{false};
};

} // namespace berry_mcp
