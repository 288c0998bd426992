#pragma once

#include <berry_mcp/config/app_config.hpp>
#include <berry_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berry_mcp {

// Command-line flags as given; unset flags stay empty so that lower
// precedence sources (YAML, environment) are not overwritten.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> transport;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> server_name;
    std::optional<std::string> log_level;
    std::optional<std::string> log_format;
    std::optional<std::string> log_file;
    std::optional<std::string> tools;
    std::optional<std::string> auth_token_env;
    bool require_auth = false;
    bool show_version = false;
};

// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// EnvLookup backed by std::getenv.
EnvLookup ProcessEnvironment();

// Parse argv into CliOptions.
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv);

// Parse a YAML config file on top of the built-in defaults.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Apply BERRY_MCP_* environment variables.
Result<ServerConfig, Error> ApplyEnvironment(ServerConfig config,
                                             const EnvLookup& env);

// Apply command-line flags (highest precedence).
Result<ServerConfig, Error> ApplyCli(ServerConfig config, const CliOptions& cli);

// If auth.token_env is set, read it and append the token to auth.tokens.
Result<ServerConfig, Error> ResolveAuthTokens(ServerConfig config,
                                              const EnvLookup& env);

// Validate that values are present and sane.
Result<void, Error> ValidateConfig(const ServerConfig& config);

// defaults < YAML (--config) < environment < CLI, then token resolution
// and validation.
Result<ServerConfig, Error> LoadConfig(const CliOptions& cli, const EnvLookup& env);

Result<TransportKind, Error> ParseTransport(std::string_view text);
Result<LogFormat, Error> ParseLogFormat(std::string_view text);

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> SplitList(std::string_view text);

} // namespace berry_mcp
