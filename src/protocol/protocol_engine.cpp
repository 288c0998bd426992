#include <berry_mcp/protocol/protocol_engine.hpp>

#include <berry_mcp/core/ids.hpp>
#include <berry_mcp/core/log.hpp>

#include <exception>

namespace berry_mcp {

namespace {

constexpr std::size_t kLogPreview = 150;
constexpr std::size_t kResultPreview = 500;

std::string Preview(const nlohmann::json& message) {
    auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > kLogPreview) text = text.substr(0, kLogPreview) + "...";
    return text;
}

std::string IdText(const nlohmann::json& id) {
    return id.is_null() ? "none" : id.dump();
}

nlohmann::json InvalidRequest(const nlohmann::json& id, const std::string& reason) {
    return MakeError(id, RpcError{kInvalidRequest, "Invalid Request", reason});
}

} // anonymous namespace

void ProtocolEngine::SetRequestHandler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[method] = std::move(handler);
    LogDebug("protocol", "Registered request handler for method: " + method);
}

bool ProtocolEngine::HasHandler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(method) > 0;
}

std::vector<std::string> ProtocolEngine::Methods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> methods;
    for (const auto& [method, handler] : handlers_) {
        methods.push_back(method);
    }
    return methods;
}

std::optional<nlohmann::json> ProtocolEngine::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        LogWarn("protocol", "Message is not a JSON object: " + Preview(message));
        return InvalidRequest(nullptr, "Invalid JSON-RPC version");
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != kJsonRpcVersion) {
        LogWarn("protocol", "Invalid JSON-RPC version in message: " + Preview(message));
        return InvalidRequest(nullptr, "Invalid JSON-RPC version");
    }

    nlohmann::json id = message.contains("id") ? message["id"] : nlohmann::json();
    const bool is_notification = id.is_null();

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string() ||
        method_it->get_ref<const std::string&>().empty()) {
        LogWarn("protocol", "Missing method in message: " + Preview(message));
        return InvalidRequest(id, "'method' parameter is missing");
    }
    const auto method = method_it->get<std::string>();

    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(method);
        if (it != handlers_.end()) handler = it->second;
    }
    if (!handler) {
        LogWarn("protocol", "No handler found for method '" + method + "' (ID: " +
                                IdText(id) + ")");
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }

    nlohmann::json params = nlohmann::json::object();
    if (auto p = message.find("params"); p != message.end() && !p->is_null()) {
        params = *p;
    }

    RequestContext context{id, method};
    try {
        LogDebug("protocol", "Calling handler for method '" + method + "' (ID: " +
                                 IdText(id) + ")");
        auto outcome = handler(params, context);

        if (is_notification) {
            if (outcome.IsErr()) {
                LogWarn("protocol", "Notification '" + method + "' failed: " +
                                        outcome.Error().message);
            } else {
                LogDebug("protocol", "Notification for method '" + method + "' processed");
            }
            return std::nullopt;
        }

        if (outcome.IsErr()) {
            return MakeError(id, outcome.Error());
        }
        return FormatResult(id, outcome.Value());
    } catch (const std::exception& e) {
        auto type = ExceptionTypeName(e);
        auto detailed = "Server error executing method '" + method + "': " + type + ": " +
                        e.what();
        LogError("protocol", "Exception during handler execution for '" + method +
                                 "' (ID: " + IdText(id) + "): " + detailed);
        if (is_notification) return std::nullopt;

        RpcError error{kServerError, detailed, std::nullopt};
        if (GlobalLogger().IsEnabled(LogLevel::Debug)) {
            error.data = nlohmann::json{
                {"exception", type},
                {"what", e.what()},
                {"method", method},
                {"id", id}
            };
        }
        return MakeError(id, error);
    } catch (...) {
        auto detailed = "Server error executing method '" + method + "': unknown exception";
        LogError("protocol", "Exception during handler execution for '" + method +
                                 "' (ID: " + IdText(id) + "): " + detailed);
        if (is_notification) return std::nullopt;

        RpcError error{kServerError, detailed, std::nullopt};
        if (GlobalLogger().IsEnabled(LogLevel::Debug)) {
            error.data = nlohmann::json{
                {"exception", "unknown"},
                {"method", method},
                {"id", id}
            };
        }
        return MakeError(id, error);
    }
}

nlohmann::json ProtocolEngine::FormatResult(const nlohmann::json& id,
                                            const nlohmann::json& result) const {
    try {
        (void)result.dump();
        return MakeResult(id, result);
    } catch (const nlohmann::json::type_error& e) {
        LogError("protocol", "Result for request ID " + IdText(id) +
                                 " is not JSON serializable: " + e.what());
        auto text = result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > kResultPreview) text = text.substr(0, kResultPreview);
        return MakeResult(id, "[Non-Serializable Result: " + std::string(result.type_name()) +
                                  "] " + text);
    }
}

void ProtocolEngine::SetSender(Sender sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_ = std::move(sender);
    LogInfo("protocol", "Send implementation configured");
}

bool ProtocolEngine::HasSender() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(sender_);
}

void ProtocolEngine::SendNotification(const std::string& method, const nlohmann::json& params) {
    Sender sender;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sender = sender_;
    }
    if (!sender) {
        LogError("protocol", "Cannot send notification '" + method +
                                 "': no send implementation configured");
        return;
    }

    try {
        LogDebug("protocol", "Sending notification: " + method);
        sender(MakeNotification(method, params));
    } catch (const std::exception& e) {
        LogError("protocol", "Failed to send notification '" + method + "': " + e.what());
    } catch (...) {
        LogError("protocol", "Failed to send notification '" + method + "': unknown exception");
    }
}

} // namespace berry_mcp
