#pragma once

#include <berry_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace berry_mcp {

// Processes one inbound message and returns the response, if any.
using MessageHandler =
    std::function<std::optional<nlohmann::json>(const nlohmann::json& message)>;

// ---------------------------------------------------------------------------
// ITransport: moves JSON-RPC messages between the server and its clients.
//
// Pull transports (stdio) deliver inbound messages through Receive(); push
// transports (HTTP/SSE) call the message handler from their own threads.
// Send() may be called from any thread.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<void, Error> Connect() = 0;

    // Deliver one outbound message. Never throws; failures are logged.
    virtual void Send(const nlohmann::json& message) = 0;

    // Next inbound message; nullopt once the transport has no more input.
    // Push transports keep the default, which logs and returns nullopt.
    virtual std::optional<nlohmann::json> Receive();

    virtual void Close() = 0;

    // Push transports route inbound messages through this handler.
    virtual void SetMessageHandler(MessageHandler handler);

    [[nodiscard]] virtual std::string Name() const = 0;
};

} // namespace berry_mcp
