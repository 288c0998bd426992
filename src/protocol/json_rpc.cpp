#include <berry_mcp/protocol/json_rpc.hpp>

namespace berry_mcp {

nlohmann::json RpcError::ToJson() const {
    nlohmann::json j = {{"code", code}, {"message", message}};
    if (data.has_value() && !data->is_null()) {
        j["data"] = *data;
    }
    return j;
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, const RpcError& error) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error.ToJson()}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
    return MakeError(id, RpcError{code, message, std::nullopt});
}

nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

bool IsNotification(const nlohmann::json& message) {
    if (!message.is_object()) return false;
    auto it = message.find("id");
    return it == message.end() || it->is_null();
}

void EnsureJsonRpcVersion(nlohmann::json& message) {
    if (message.is_object() && !message.contains("jsonrpc")) {
        message["jsonrpc"] = kJsonRpcVersion;
    }
}

} // namespace berry_mcp
