#include <berry_mcp/config/config_loader.hpp>

#include <berry_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace berry_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::nullopt};
}

std::string Lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

Result<uint16_t, Error> ToPort(long long value, const std::string& source) {
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(MakeConfigError(
            "Invalid port from " + source + ": " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

Result<LogLevel, Error> ToLogLevel(std::string_view text) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Unknown log level: " + std::string(text)));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

// Read the optional `http:` section into config.http.
Result<void, Error> ParseYamlHttp(const YAML::Node& node, HttpConfig& http) {
    if (node["host"]) http.host = node["host"].as<std::string>();
    if (node["port"]) {
        auto port = ToPort(node["port"].as<long long>(), "config file");
        if (port.IsErr()) return Result<void, Error>::Err(port.Error());
        http.port = port.Value();
    }
    if (node["keepalive_seconds"]) {
        http.keepalive_seconds = node["keepalive_seconds"].as<int>();
    }
    if (node["client_queue_capacity"]) {
        http.client_queue_capacity = node["client_queue_capacity"].as<int>();
    }
    if (node["send_timeout_ms"]) {
        http.send_timeout_ms = node["send_timeout_ms"].as<int>();
    }
    if (node["shutdown_timeout_ms"]) {
        http.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
    }
    if (node["background_threads"]) {
        http.background_threads = node["background_threads"].as<int>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

std::string TransportName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "stdio";
}

Result<TransportKind, Error> ParseTransport(std::string_view text) {
    auto value = Lower(text);
    if (value == "stdio") return Result<TransportKind, Error>::Ok(TransportKind::Stdio);
    if (value == "http" || value == "sse") {
        return Result<TransportKind, Error>::Ok(TransportKind::Http);
    }
    return Result<TransportKind, Error>::Err(
        MakeConfigError("Unknown transport: " + std::string(text) +
                        " (expected stdio or http)"));
}

Result<LogFormat, Error> ParseLogFormat(std::string_view text) {
    auto value = Lower(text);
    if (value == "text") return Result<LogFormat, Error>::Ok(LogFormat::Text);
    if (value == "json") return Result<LogFormat, Error>::Ok(LogFormat::Json);
    return Result<LogFormat, Error>::Err(
        MakeConfigError("Unknown log format: " + std::string(text)));
}

std::vector<std::string> SplitList(std::string_view text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();
        auto item = Trim(text.substr(start, comma - start));
        if (!item.empty()) items.push_back(std::move(item));
        start = comma + 1;
    }
    return items;
}

// ---------------------------------------------------------------------------
// ParseCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("berry-mcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Model Context Protocol server exposing tools over stdio or HTTP/SSE.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("Transport: stdio or http (env: BERRY_MCP_TRANSPORT)");
    program.add_argument("--host")
        .help("Bind address for the http transport (env: BERRY_MCP_HOST)");
    program.add_argument("--port")
        .help("Port for the http transport (env: BERRY_MCP_PORT)")
        .scan<'i', int>();
    program.add_argument("--server-name")
        .help("Server name reported by initialize (env: BERRY_MCP_SERVER_NAME)");
    program.add_argument("--log-level")
        .help("DEBUG, INFO, WARNING or ERROR (env: BERRY_MCP_LOG_LEVEL)");
    program.add_argument("--log-format")
        .help("text or json");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--tools")
        .help("Comma-separated tool modules to load (env: BERRY_MCP_TOOLS)");
    program.add_argument("--require-auth")
        .help("Require a bearer token on HTTP requests")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--auth-token-env")
        .help("Environment variable holding the accepted bearer token");
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.transport = program.present("--transport");
    cli.host = program.present("--host");
    cli.port = program.present<int>("--port");
    cli.server_name = program.present("--server-name");
    cli.log_level = program.present("--log-level");
    cli.log_format = program.present("--log-format");
    cli.log_file = program.present("--log-file");
    cli.tools = program.present("--tools");
    cli.auth_token_env = program.present("--auth-token-env");
    cli.require_auth = program.get<bool>("--require-auth");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ServerConfig config;
    try {
        if (const auto server = root["server"]) {
            if (server["name"]) config.server_name = server["name"].as<std::string>();
            if (server["version"]) {
                config.server_version = server["version"].as<std::string>();
            }
            if (server["transport"]) {
                auto kind = ParseTransport(server["transport"].as<std::string>());
                if (kind.IsErr()) return Result<ServerConfig, Error>::Err(kind.Error());
                config.transport = kind.Value();
            }
            if (server["workers"]) config.worker_threads = server["workers"].as<int>();
        }

        if (const auto http = root["http"]) {
            auto parsed = ParseYamlHttp(http, config.http);
            if (parsed.IsErr()) return Result<ServerConfig, Error>::Err(parsed.Error());
        }

        if (const auto auth = root["auth"]) {
            if (auth["require"]) config.auth.require_auth = auth["require"].as<bool>();
            if (auth["tokens"]) {
                for (const auto& token : auth["tokens"]) {
                    config.auth.tokens.push_back(token.as<std::string>());
                }
            }
            if (auth["token_env"]) {
                config.auth.token_env = auth["token_env"].as<std::string>();
            }
        }

        if (const auto tools = root["tools"]) {
            for (const auto& module : tools) {
                config.tool_modules.push_back(module.as<std::string>());
            }
        }

        if (root["elicitation_timeout_seconds"]) {
            config.elicitation_timeout_seconds =
                root["elicitation_timeout_seconds"].as<int>();
        }

        if (const auto logging = root["logging"]) {
            if (logging["level"]) {
                auto level = ToLogLevel(logging["level"].as<std::string>());
                if (level.IsErr()) return Result<ServerConfig, Error>::Err(level.Error());
                config.log_level = level.Value();
            }
            if (logging["format"]) {
                auto format = ParseLogFormat(logging["format"].as<std::string>());
                if (format.IsErr()) return Result<ServerConfig, Error>::Err(format.Error());
                config.log_format = format.Value();
            }
            if (logging["file"]) config.log_file = logging["file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> ApplyEnvironment(ServerConfig config,
                                             const EnvLookup& env) {
    if (auto value = env("BERRY_MCP_TRANSPORT")) {
        auto kind = ParseTransport(*value);
        if (kind.IsErr()) return Result<ServerConfig, Error>::Err(kind.Error());
        config.transport = kind.Value();
    }
    if (auto value = env("BERRY_MCP_HOST")) {
        config.http.host = *value;
    }
    if (auto value = env("BERRY_MCP_PORT")) {
        long long port = 0;
        try {
            port = std::stoll(*value);
        } catch (const std::exception&) {
            return Result<ServerConfig, Error>::Err(
                MakeConfigError("BERRY_MCP_PORT is not a number: " + *value));
        }
        auto checked = ToPort(port, "BERRY_MCP_PORT");
        if (checked.IsErr()) return Result<ServerConfig, Error>::Err(checked.Error());
        config.http.port = checked.Value();
    }
    if (auto value = env("BERRY_MCP_LOG_LEVEL")) {
        auto level = ToLogLevel(*value);
        if (level.IsErr()) return Result<ServerConfig, Error>::Err(level.Error());
        config.log_level = level.Value();
    }
    if (auto value = env("BERRY_MCP_SERVER_NAME")) {
        if (!value->empty()) config.server_name = *value;
    }
    if (auto value = env("BERRY_MCP_TOOLS")) {
        config.tool_modules = SplitList(*value);
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyCli
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> ApplyCli(ServerConfig config, const CliOptions& cli) {
    if (cli.transport) {
        auto kind = ParseTransport(*cli.transport);
        if (kind.IsErr()) return Result<ServerConfig, Error>::Err(kind.Error());
        config.transport = kind.Value();
    }
    if (cli.host) config.http.host = *cli.host;
    if (cli.port) {
        auto port = ToPort(*cli.port, "--port");
        if (port.IsErr()) return Result<ServerConfig, Error>::Err(port.Error());
        config.http.port = port.Value();
    }
    if (cli.server_name) config.server_name = *cli.server_name;
    if (cli.log_level) {
        auto level = ToLogLevel(*cli.log_level);
        if (level.IsErr()) return Result<ServerConfig, Error>::Err(level.Error());
        config.log_level = level.Value();
    }
    if (cli.log_format) {
        auto format = ParseLogFormat(*cli.log_format);
        if (format.IsErr()) return Result<ServerConfig, Error>::Err(format.Error());
        config.log_format = format.Value();
    }
    if (cli.log_file) config.log_file = *cli.log_file;
    if (cli.tools) config.tool_modules = SplitList(*cli.tools);
    if (cli.auth_token_env) config.auth.token_env = *cli.auth_token_env;
    if (cli.require_auth) config.auth.require_auth = true;
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ResolveAuthTokens
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> ResolveAuthTokens(ServerConfig config,
                                              const EnvLookup& env) {
    if (!config.auth.token_env.has_value()) {
        return Result<ServerConfig, Error>::Ok(std::move(config));
    }
    const auto& var = *config.auth.token_env;
    auto value = env(var);
    if (!value.has_value() || value->empty()) {
        return Result<ServerConfig, Error>::Err(MakeConfigError(
            "Environment variable '" + var + "' not set (specified by auth token_env)"));
    }
    config.auth.tokens.push_back(*value);
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.server_name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.transport == TransportKind::Http) {
        if (config.http.host.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
        }
        if (config.http.port == 0) {
            return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
        }
    }
    if (config.http.keepalive_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("keepalive_seconds must be positive"));
    }
    if (config.http.client_queue_capacity <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("client_queue_capacity must be positive"));
    }
    if (config.http.send_timeout_ms <= 0 || config.http.shutdown_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.http.background_threads <= 0 || config.worker_threads <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Thread counts must be positive"));
    }
    if (config.elicitation_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("elicitation_timeout_seconds must be positive"));
    }
    if (config.auth.require_auth && config.auth.tokens.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Authentication required but no token configured (tokens or token_env)"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadConfig(const CliOptions& cli, const EnvLookup& env) {
    ServerConfig base;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) return yaml;
        base = std::move(yaml).Value();
    }

    auto with_env = ApplyEnvironment(std::move(base), env);
    if (with_env.IsErr()) return with_env;

    auto with_cli = ApplyCli(std::move(with_env).Value(), cli);
    if (with_cli.IsErr()) return with_cli;

    auto resolved = ResolveAuthTokens(std::move(with_cli).Value(), env);
    if (resolved.IsErr()) return resolved;

    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) return Result<ServerConfig, Error>::Err(valid.Error());
    return resolved;
}

} // namespace berry_mcp
