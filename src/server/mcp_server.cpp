#include <berry_mcp/server/mcp_server.hpp>

#include <berry_mcp/core/log.hpp>
#include <berry_mcp/core/worker_pool.hpp>
#include <berry_mcp/server/tool_context.hpp>

#include <algorithm>
#include <exception>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// ToolOutcome
// ---------------------------------------------------------------------------

ToolOutcome ToolOutcome::FromValue(const nlohmann::json& value) {
    if (value.is_string()) return Success(value.get<std::string>());
    if (value.is_object() && value.contains("error")) {
        const auto& error = value["error"];
        return Failure(error.is_string()
                           ? error.get<std::string>()
                           : error.dump(-1, ' ', false,
                                        nlohmann::json::error_handler_t::replace));
    }
    return Success(value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

nlohmann::json ToolOutcome::ToJson() const {
    return {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", is_error}
    };
}

// ---------------------------------------------------------------------------
// McpServer
// ---------------------------------------------------------------------------

McpServer::McpServer(ServerInfo info, ToolRegistry registry, ServerOptions options)
    : info_(std::move(info)),
      registry_(std::move(registry)),
      options_(options),
      tool_pool_(std::make_unique<WorkerPool>(std::max<std::size_t>(1, options.worker_threads),
                                              "tools")) {
    RegisterHandlers();
    LogInfo("server", "MCP server '" + info_.name + "' v" + info_.version + " with " +
                          std::to_string(registry_.Size()) + " tools");
}

McpServer::~McpServer() {
    tool_pool_->Shutdown();
}

void McpServer::RegisterHandlers() {
    engine_.SetRequestHandler("initialize",
        [this](const nlohmann::json& params, const RequestContext&) {
            return HandleInitialize(params);
        });
    engine_.SetRequestHandler("tools/list",
        [this](const nlohmann::json&, const RequestContext&) {
            return HandleToolsList();
        });
    engine_.SetRequestHandler("tools/call",
        [this](const nlohmann::json& params, const RequestContext& request) {
            return HandleToolsCall(params, request);
        });
    engine_.SetRequestHandler("ping",
        [](const nlohmann::json&, const RequestContext&) {
            return Result<nlohmann::json, RpcError>::Ok(nlohmann::json::object());
        });
    engine_.SetRequestHandler("notifications/initialized",
        [](const nlohmann::json&, const RequestContext&) {
            LogInfo("server", "Client initialization complete");
            return Result<nlohmann::json, RpcError>::Ok(nlohmann::json());
        });
    engine_.SetRequestHandler("notifications/cancelled",
        [](const nlohmann::json& params, const RequestContext&) {
            auto request_id = params.value("requestId", nlohmann::json());
            LogInfo("server", "Client cancelled request " + request_id.dump() +
                                  " (in-flight calls run to completion)");
            return Result<nlohmann::json, RpcError>::Ok(nlohmann::json());
        });
}

Result<void, Error> McpServer::Connect(ITransport& transport) {
    engine_.SetSender([&transport](const nlohmann::json& message) { transport.Send(message); });
    transport.SetMessageHandler(
        [this](const nlohmann::json& message) { return HandleMessage(message); });
    LogInfo("server", "Connecting " + transport.Name() + " transport");
    return transport.Connect();
}

Result<void, Error> McpServer::Run(ITransport& transport) {
    auto connected = Connect(transport);
    if (connected.IsErr()) {
        LogError("server", "Transport connect failed: " + connected.Error().message);
        transport.Close();
        return connected;
    }

    LogInfo("server", "Server loop started");
    while (true) {
        try {
            auto message = transport.Receive();
            if (!message) {
                LogInfo("server", "Transport has no more input");
                break;
            }
            auto response = HandleMessage(*message);
            if (response) transport.Send(*response);
        } catch (const std::exception& e) {
            LogError("server", std::string("Error in server loop: ") + e.what());
        } catch (...) {
            LogError("server", "Error in server loop: unknown exception");
        }
    }

    transport.Close();
    LogInfo("server", "Server loop finished");
    return Result<void, Error>::Ok();
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    return engine_.HandleMessage(message);
}

void McpServer::SendNotification(const std::string& method, const nlohmann::json& params) {
    engine_.SendNotification(method, params);
}

// ---------------------------------------------------------------------------
// Method handlers
// ---------------------------------------------------------------------------

Result<nlohmann::json, RpcError> McpServer::HandleInitialize(const nlohmann::json& params) {
    auto client = params.value("clientInfo", nlohmann::json::object());
    LogInfo("server", "Initialize from client " + client.value("name", std::string("unknown")) +
                          " " + client.value("version", std::string("")));
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    result["capabilities"] = {
        {"tools", {{"dynamicRegistration", false}}}
    };
    return Result<nlohmann::json, RpcError>::Ok(std::move(result));
}

Result<nlohmann::json, RpcError> McpServer::HandleToolsList() {
    auto tools = nlohmann::json::array();
    for (const auto& tool : registry_.Tools()) {
        tools.push_back(tool.ToListEntry());
    }
    return Result<nlohmann::json, RpcError>::Ok(nlohmann::json{{"tools", std::move(tools)}});
}

Result<nlohmann::json, RpcError> McpServer::HandleToolsCall(const nlohmann::json& params,
                                                            const RequestContext& request) {
    using R = Result<nlohmann::json, RpcError>;

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() ||
        name_it->get_ref<const std::string&>().empty()) {
        return R::Ok(ToolOutcome::Failure("Missing required parameter: 'name'").ToJson());
    }
    const auto name = name_it->get<std::string>();

    const ToolDescriptor* tool = registry_.Find(name);
    if (!tool) {
        LogWarn("server", "Tool not found: " + name);
        return R::Ok(ToolOutcome::Failure("Tool not found: " + name).ToJson());
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto a = params.find("arguments"); a != params.end() && !a->is_null()) {
        if (!a->is_object()) {
            return R::Ok(ToolOutcome::Failure("Tool execution error: arguments must be an object")
                             .ToJson());
        }
        arguments = *a;
    }

    std::optional<nlohmann::json> progress_token;
    if (auto meta = params.find("_meta"); meta != params.end() && meta->is_object()) {
        if (auto token = meta->find("progressToken"); token != meta->end()) {
            progress_token = *token;
        }
    }

    LogInfo("server", "Calling tool '" + name + "' (ID: " + request.id.dump() + ")");
    return R::Ok(CallTool(*tool, arguments, request.id, std::move(progress_token)).ToJson());
}

ToolOutcome McpServer::CallTool(const ToolDescriptor& tool, const nlohmann::json& arguments,
                                const nlohmann::json& request_id,
                                std::optional<nlohmann::json> progress_token) {
    ToolContext context(
        request_id, std::move(progress_token),
        [this](const std::string& method, const nlohmann::json& params) {
            engine_.SendNotification(method, params);
        },
        options_.elicitation);

    try {
        nlohmann::json value;
        if (tool.is_async) {
            // The context stays on this frame until the future is ready.
            value = tool.async_callable(arguments, context).get();
        } else {
            value = tool_pool_
                        ->Submit([&tool, &arguments, &context] {
                            return tool.callable(arguments, context);
                        })
                        .get();
        }
        auto outcome = ToolOutcome::FromValue(value);
        if (outcome.is_error) {
            LogWarn("server", "Tool '" + tool.name + "' reported an error: " + outcome.text);
        } else {
            LogDebug("server", "Tool '" + tool.name + "' completed");
        }
        return outcome;
    } catch (const std::exception& e) {
        LogError("server", "Tool '" + tool.name + "' failed: " + e.what());
        return ToolOutcome::Failure(std::string("Tool execution error: ") + e.what());
    } catch (...) {
        LogError("server", "Tool '" + tool.name + "' failed with a non-standard exception");
        return ToolOutcome::Failure("Tool execution error: unknown exception");
    }
}

} // namespace berry_mcp
