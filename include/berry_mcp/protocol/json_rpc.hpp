#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace berry_mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";

// JSON-RPC 2.0 error codes.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerError = -32000;

// ---------------------------------------------------------------------------
// RpcError: protocol-level failure returned by a request handler.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = kServerError;
    std::string message;
    std::optional<nlohmann::json> data;

    // {"code", "message", "data"?}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// {"jsonrpc":"2.0","id":id,"result":result}
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);

// {"jsonrpc":"2.0","id":id,"error":{...}}
nlohmann::json MakeError(const nlohmann::json& id, const RpcError& error);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);

// {"jsonrpc":"2.0","method":method,"params":params}; null params become {}.
nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params = nullptr);

// A message whose id is absent or null.
[[nodiscard]] bool IsNotification(const nlohmann::json& message);

// Adds "jsonrpc":"2.0" when an object lacks it.
void EnsureJsonRpcVersion(nlohmann::json& message);

} // namespace berry_mcp
