#pragma once

#include <berry_mcp/core/log.hpp>
#include <berry_mcp/core/version.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {

enum class TransportKind {
    Stdio,
    Http,
};

enum class LogFormat {
    Text,
    Json,
};

struct HttpConfig {
    std::string host = "localhost";
    uint16_t port = 8000;
    int keepalive_seconds = 15;
    int client_queue_capacity = 100;
    int send_timeout_ms = 500;
    int shutdown_timeout_ms = 200;
    int background_threads = 4;
};

struct AuthConfig {
    bool require_auth = false;
    std::vector<std::string> tokens;
    std::optional<std::string> token_env; // env var holding a bearer token
};

struct ServerConfig {
    TransportKind transport = TransportKind::Stdio;
    std::string server_name = kDefaultServerName;
    std::string server_version = kVersion;
    HttpConfig http;
    AuthConfig auth;
    std::vector<std::string> tool_modules; // empty = every built-in module
    int worker_threads = 4;
    int elicitation_timeout_seconds = 300;
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Text;
    std::optional<std::string> log_file;
};

std::string TransportName(TransportKind kind);

} // namespace berry_mcp
