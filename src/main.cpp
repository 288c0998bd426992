#include <berry_mcp/auth/authenticator.hpp>
#include <berry_mcp/config/config_loader.hpp>
#include <berry_mcp/core/log.hpp>
#include <berry_mcp/core/terminal.hpp>
#include <berry_mcp/core/version.hpp>
#include <berry_mcp/elicitation/elicitation_manager.hpp>
#include <berry_mcp/registry/tool_catalog.hpp>
#include <berry_mcp/server/mcp_server.hpp>
#include <berry_mcp/tools/builtin_tools.hpp>
#include <berry_mcp/transport/sse_transport.hpp>
#include <berry_mcp/transport/stdio_transport.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;

std::atomic<bool> g_stop_requested{false};

extern "C" void OnStopSignal(int /*signal*/) {
    g_stop_requested.store(true);
}

// Watches for SIGINT/SIGTERM off the signal handler and closes the transport
// from a normal thread.
class StopWatcher {
public:
    explicit StopWatcher(berry_mcp::ITransport& transport)
        : thread_([this, &transport] {
              while (!done_.load()) {
                  if (g_stop_requested.load()) {
                      berry_mcp::LogInfo("main", "Stop requested, shutting down");
                      transport.Close();
                      return;
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~StopWatcher() {
        done_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    StopWatcher(const StopWatcher&) = delete;
    StopWatcher& operator=(const StopWatcher&) = delete;

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

void InitLogging(const berry_mcp::ServerConfig& config) {
    using namespace berry_mcp;
    const bool json = config.log_format == LogFormat::Json;

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file, json);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), config.log_level);
            return;
        }
        std::cerr << "Cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }

    if (json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
    } else {
        bool use_color = !NoColorEnvSet() && IsStderrTty();
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), config.log_level);
    }
}

int Fail(const berry_mcp::Error& error) {
    berry_mcp::LogError("main", error.ToString());
    std::cerr << "Error: " << error.ToString() << "\n";
    return error.ExitCode();
}

int RunStdio(berry_mcp::McpServer& server) {
    berry_mcp::StdioTransport transport;
    StopWatcher watcher(transport);
    auto result = server.Run(transport);
    if (result.IsErr()) return Fail(result.Error());
    return kExitSuccess;
}

int RunHttp(berry_mcp::McpServer& server, const berry_mcp::ServerConfig& config,
            berry_mcp::ElicitationManager& elicitation) {
    using namespace berry_mcp;

    SseTransport transport(SseOptionsFromConfig(config));
    if (config.auth.require_auth || !config.auth.tokens.empty()) {
        transport.SetAuthenticator(
            std::make_shared<BearerTokenAuthenticator>(config.auth.tokens));
    }
    transport.SetElicitationManager(&elicitation);
    transport.SetInfoProvider([&server] {
        return nlohmann::json{{"tools_count", server.Registry().Size()}};
    });

    auto connected = server.Connect(transport);
    if (connected.IsErr()) {
        transport.Close();
        return Fail(connected.Error());
    }

    StopWatcher watcher(transport);
    auto listened = transport.Listen();
    transport.Close();
    if (listened.IsErr()) return Fail(listened.Error());
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace berry_mcp;

    auto cli = ParseCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "Error: " << cli.Error().message << "\n";
        return cli.Error().ExitCode();
    }
    if (cli.Value().show_version) {
        std::cout << "berry-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config_result = LoadConfig(cli.Value(), ProcessEnvironment());
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.Error().ToString() << "\n";
        return config_result.Error().ExitCode();
    }
    const ServerConfig config = config_result.Value();

    InitLogging(config);
    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);

    LogInfo("main", "Starting " + config.server_name + " v" + config.server_version +
                        " (" + TransportName(config.transport) + ")");

    ToolRegistry registry;
    auto loaded = AutoDiscover(registry, MakeBuiltinCatalog(), config.tool_modules);
    LogInfo("main", "Loaded " + std::to_string(loaded) + " tool modules, " +
                        std::to_string(registry.Size()) + " tools");

    // Prompts go out as server notifications; the server exists only after
    // the manager it is handed, hence the late-bound pointer.
    McpServer* server_ref = nullptr;
    ElicitationManager elicitation(
        [&server_ref](const std::string& method, const nlohmann::json& params) {
            if (server_ref) server_ref->SendNotification(method, params);
        },
        std::chrono::seconds(config.elicitation_timeout_seconds));

    ServerOptions options;
    options.worker_threads = static_cast<std::size_t>(config.worker_threads);
    // Over stdio the loop is busy while a tool waits, so no answer could arrive.
    options.elicitation = config.transport == TransportKind::Http ? &elicitation : nullptr;

    McpServer server(ServerInfo{config.server_name, config.server_version},
                     std::move(registry), options);
    server_ref = &server;

    int code = config.transport == TransportKind::Http
                   ? RunHttp(server, config, elicitation)
                   : RunStdio(server);

    LogInfo("main", "Shutdown complete");
    return code;
}
