#include <berry_mcp/transport/transport.hpp>

#include <berry_mcp/core/log.hpp>

namespace berry_mcp {

std::optional<nlohmann::json> ITransport::Receive() {
    LogWarn("transport", Name() + " transport does not support receive()");
    return std::nullopt;
}

void ITransport::SetMessageHandler(MessageHandler /*handler*/) {
    LogDebug("transport", Name() + " transport ignores the message handler");
}

} // namespace berry_mcp
