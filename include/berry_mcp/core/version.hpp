#pragma once

namespace berry_mcp {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDefaultServerName = "berry-mcp-server";

// MCP revision negotiated in `initialize`.
constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace berry_mcp
