#pragma once

#include <berry_mcp/core/result.hpp>
#include <berry_mcp/protocol/json_rpc.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {

// Per-request information handed to a handler.
struct RequestContext {
    nlohmann::json id;   // null for notifications
    std::string method;
};

// ---------------------------------------------------------------------------
// ProtocolEngine: JSON-RPC 2.0 validation, routing and response
// formatting. Holds no per-message state; safe to call HandleMessage from
// several threads once handlers are registered.
//
//   1. jsonrpc != "2.0"        -> -32600, id null
//   2. missing method          -> -32600, id echoed
//   3. unknown method          -> -32601 "Method not found: <m>"
//   4. handler Err(RpcError)   -> that error
//   5. handler throws          -> -32000 "Server error executing method ..."
//
// Notifications (no id) never produce a response, not even an error.
// ---------------------------------------------------------------------------
class ProtocolEngine {
public:
    using RequestHandler = std::function<Result<nlohmann::json, RpcError>(
        const nlohmann::json& params, const RequestContext& context)>;
    using Sender = std::function<void(const nlohmann::json& message)>;

    void SetRequestHandler(const std::string& method, RequestHandler handler);

    [[nodiscard]] bool HasHandler(const std::string& method) const;
    [[nodiscard]] std::vector<std::string> Methods() const;

    // Returns the response to send, or nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    // Outbound channel for server-initiated notifications.
    void SetSender(Sender sender);
    [[nodiscard]] bool HasSender() const;

    // Builds the notification and hands it to the sender. Without a sender
    // the call is logged and dropped; sender exceptions are logged.
    void SendNotification(const std::string& method,
                          const nlohmann::json& params = nullptr);

private:
    nlohmann::json FormatResult(const nlohmann::json& id, const nlohmann::json& result) const;

    std::map<std::string, RequestHandler> handlers_;
    Sender sender_;
    mutable std::mutex mutex_;
};

} // namespace berry_mcp
