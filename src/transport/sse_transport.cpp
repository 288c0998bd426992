#include <berry_mcp/transport/sse_transport.hpp>

#include <berry_mcp/core/ids.hpp>
#include <berry_mcp/core/log.hpp>
#include <berry_mcp/core/worker_pool.hpp>
#include <berry_mcp/elicitation/elicitation_manager.hpp>
#include <berry_mcp/protocol/json_rpc.hpp>

#include <httplib.h>

#include <algorithm>
#include <exception>
#include <future>
#include <sstream>
#include <vector>

namespace berry_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

double NowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

std::string Dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpReply ErrorReply(int status, const std::string& message) {
    return HttpReply{status, nlohmann::json{{"error", message}}};
}

nlohmann::json Acknowledgement(const nlohmann::json& id, const std::string& status,
                               const std::string& message) {
    return MakeResult(id, {{"status", status}, {"message", message}});
}

// Event type on the stream: progress notifications and other notifications
// are told apart from responses.
std::string EventTypeFor(const nlohmann::json& message) {
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) return "message";
    const auto& name = method->get_ref<const std::string&>();
    if (name == "notifications/progress") return "progress";
    if (name.rfind("notifications/", 0) == 0) return "system";
    return "message";
}

std::string EventIdFor(const nlohmann::json& message) {
    auto id = message.find("id");
    if (id != message.end()) {
        if (id->is_string()) return "sse_" + id->get<std::string>();
        if (id->is_number()) return "sse_" + id->dump();
    }
    return "sse_" + RandomHex(8);
}

HttpHeaders ToHttpHeaders(const httplib::Headers& headers) {
    HttpHeaders result;
    for (const auto& [name, value] : headers) {
        result.emplace(name, value);
    }
    return result;
}

void WriteReply(httplib::Response& res, const HttpReply& reply) {
    res.status = reply.status;
    if (reply.body) {
        res.set_content(Dump(*reply.body), kJsonContentType);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

SseOptions SseOptionsFromConfig(const ServerConfig& config) {
    SseOptions options;
    options.host = config.http.host;
    options.port = config.http.port;
    options.keepalive = std::chrono::seconds(config.http.keepalive_seconds);
    options.queue_capacity = static_cast<std::size_t>(config.http.client_queue_capacity);
    options.send_timeout = std::chrono::milliseconds(config.http.send_timeout_ms);
    options.shutdown_timeout = std::chrono::milliseconds(config.http.shutdown_timeout_ms);
    options.background_threads = static_cast<std::size_t>(config.http.background_threads);
    options.require_auth = config.auth.require_auth;
    options.server_name = config.server_name;
    options.server_version = config.server_version;
    return options;
}

std::string FormatSseEvent(const SseEvent& event) {
    std::ostringstream out;
    if (!event.comment.empty()) {
        out << ": " << event.comment << "\n\n";
        return out.str();
    }
    if (!event.event.empty()) out << "event: " << event.event << '\n';
    std::istringstream lines(event.data);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        out << "data: " << line << '\n';
        any = true;
    }
    if (!any) out << "data: \n";
    if (!event.id.empty()) out << "id: " << event.id << '\n';
    out << '\n';
    return out.str();
}

// ---------------------------------------------------------------------------
// Impl: the httplib server and the listen state.
// ---------------------------------------------------------------------------

struct SseTransport::Impl {
    httplib::Server server;
    std::atomic<bool> routes_registered{false};
};

SseTransport::SseTransport(SseOptions options)
    : options_(std::move(options)),
      impl_(std::make_unique<Impl>()),
      background_(std::make_unique<WorkerPool>(
          std::max<std::size_t>(1, options_.background_threads), "sse-background")) {}

SseTransport::~SseTransport() {
    Close();
}

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------

void SseTransport::SetMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
    LogDebug("sse", "Message handler configured");
}

void SseTransport::SetAuthenticator(std::shared_ptr<const IAuthenticator> authenticator) {
    authenticator_ = std::move(authenticator);
}

void SseTransport::SetElicitationManager(ElicitationManager* manager) {
    elicitation_ = manager;
}

void SseTransport::SetInfoProvider(std::function<nlohmann::json()> provider) {
    info_provider_ = std::move(provider);
}

// ---------------------------------------------------------------------------
// Connect / Listen / Stop
// ---------------------------------------------------------------------------

Result<void, Error> SseTransport::Connect() {
    if (closed_.load()) {
        return Result<void, Error>::Err(Error{"SseTransport::Connect", "Transport is closed",
                                              ErrorCategory::Transport, std::nullopt});
    }
    if (options_.require_auth && !authenticator_) {
        return Result<void, Error>::Err(Error{"SseTransport::Connect",
                                              "Authentication required but no authenticator configured",
                                              ErrorCategory::Config, std::nullopt});
    }
    if (connected_.exchange(true)) {
        LogWarn("sse", "Already connected");
        return Result<void, Error>::Ok();
    }
    RegisterRoutes();
    LogInfo("sse", "Routes registered for " + options_.host + ":" +
                       std::to_string(options_.port));
    return Result<void, Error>::Ok();
}

void SseTransport::RegisterRoutes() {
    auto& server = impl_->server;

    auto post = [this](const httplib::Request& req, httplib::Response& res) {
        WriteReply(res, HandlePost(req.body, ToHttpHeaders(req.headers)));
    };
    server.Post("/", post);
    server.Post("/message", post);
    server.Post("/sse", post);

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(Dump(HandleInfo()), kJsonContentType);
    });
    server.Get("/ping", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(Dump(HandlePing()), kJsonContentType);
    });
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(Dump(HandleHealth()), kJsonContentType);
    });

    server.Get("/sse", [this](const httplib::Request& req, httplib::Response& res) {
        if (auto denied = CheckAuth(ToHttpHeaders(req.headers))) {
            WriteReply(res, *denied);
            return;
        }
        auto client = OpenClient();
        if (!client) {
            WriteReply(res, ErrorReply(503, "Server is shutting down"));
            return;
        }

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_header("X-Accel-Buffering", "no");

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(options_.keepalive);
        res.set_chunked_content_provider(
            "text/event-stream",
            [client, wait](std::size_t, httplib::DataSink& sink) {
                auto event = client->Next(wait);
                if (!event) {
                    if (client->IsClosed()) {
                        sink.done();
                        return true;
                    }
                    auto ts = static_cast<long long>(NowSeconds());
                    event = SseEvent{"", "", "", "keep-alive ts=" + std::to_string(ts)};
                }
                auto frame = FormatSseEvent(*event);
                return sink.write(frame.data(), frame.size());
            },
            [this, client](bool) { RemoveClient(client->Id()); });
    });

    if (elicitation_) {
        server.Post("/elicitation/response",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        WriteReply(res, HandleElicitationResponse(
                                            req.body, ToHttpHeaders(req.headers)));
                    });
        server.Get("/elicitation/active",
                   [this](const httplib::Request& req, httplib::Response& res) {
                       WriteReply(res, HandleActivePrompts(ToHttpHeaders(req.headers)));
                   });
    }

    server.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown";
            try {
                if (ep) std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
            }
            LogError("sse", "Unhandled error on " + req.method + " " + req.path + ": " + what);
            WriteReply(res, ErrorReply(500, "Internal server error"));
        });

    impl_->routes_registered = true;
}

Result<void, Error> SseTransport::Listen() {
    if (!impl_->routes_registered.load()) {
        return Result<void, Error>::Err(Error{"SseTransport::Listen",
                                              "Connect() must be called before Listen()",
                                              ErrorCategory::Transport, std::nullopt});
    }
    if (closed_.load()) {
        return Result<void, Error>::Err(Error{"SseTransport::Listen", "Transport is closed",
                                              ErrorCategory::Transport, std::nullopt});
    }
    LogInfo("sse", "Listening on http://" + options_.host + ":" +
                       std::to_string(options_.port));
    if (!impl_->server.listen(options_.host, options_.port)) {
        if (closed_.load()) return Result<void, Error>::Ok();
        return Result<void, Error>::Err(Error{"SseTransport::Listen",
                                              "Failed to bind " + options_.host + ":" +
                                                  std::to_string(options_.port),
                                              ErrorCategory::Transport, std::nullopt});
    }
    LogInfo("sse", "Listener stopped");
    return Result<void, Error>::Ok();
}

void SseTransport::Stop() {
    impl_->server.stop();
}

// ---------------------------------------------------------------------------
// Authentication
// ---------------------------------------------------------------------------

std::optional<HttpReply> SseTransport::CheckAuth(const HttpHeaders& headers) const {
    if (!options_.require_auth) return std::nullopt;
    if (!authenticator_) {
        LogError("sse", "Authentication required but no authenticator configured");
        return ErrorReply(401, "Authentication required");
    }
    auto outcome = authenticator_->Authenticate(headers);
    if (outcome.IsErr()) return ErrorReply(401, outcome.Error().message);
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// POST handling
// ---------------------------------------------------------------------------

HttpReply SseTransport::HandlePost(const std::string& body, const HttpHeaders& headers) {
    if (auto denied = CheckAuth(headers)) return *denied;
    if (closed_.load()) return ErrorReply(503, "Server is shutting down");

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        LogWarn("sse", std::string("Invalid JSON in POST body: ") + e.what());
        return ErrorReply(400, std::string("Invalid JSON: ") + e.what());
    }

    if (!request.is_object() || request.value("jsonrpc", nlohmann::json()) != kJsonRpcVersion) {
        return ErrorReply(400, "Invalid JSON-RPC structure");
    }
    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string() ||
        method_it->get_ref<const std::string&>().empty()) {
        return ErrorReply(400, "Missing method parameter");
    }
    const auto method = method_it->get<std::string>();
    const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (!handler) {
        LogError("sse", "No message handler configured");
        return ErrorReply(501, "No message handler configured");
    }

    LogDebug("sse", "POST " + method + " (ID: " + (id.is_null() ? "none" : id.dump()) + ")");

    try {
        if (method == "initialize") {
            auto response = handler(request);
            if (response && response->is_object()) return HttpReply{200, *response};
            LogError("sse", "Initialize produced no response");
            return HttpReply{500, MakeError(id, kServerError, "Initialize failed")};
        }

        if (method == "tools/call") {
            auto params = request.find("params");
            if (params != request.end() && !params->is_object()) {
                return ErrorReply(400, "Invalid parameters for tools/call");
            }
            BeginBackground();
            try {
                background_->Submit([this, request] { RunInBackground(request); });
            } catch (const std::exception& e) {
                EndBackground();
                LogWarn("sse", std::string("Rejected tools/call: ") + e.what());
                return ErrorReply(503, "Server is shutting down");
            }
            return HttpReply{202, Acknowledgement(id, "accepted",
                                                  "Request accepted for background execution")};
        }

        auto response = handler(request);
        if (response) {
            Send(*response);
            return HttpReply{202, Acknowledgement(id, "processed", "Request processed")};
        }
        if (id.is_null()) return HttpReply{204, std::nullopt};
        return HttpReply{202, Acknowledgement(id, "processed", "Request processed")};
    } catch (const std::exception& e) {
        LogError("sse", "Error handling '" + method + "': " + ExceptionTypeName(e) + ": " +
                            e.what());
        return ErrorReply(500, "Internal server error");
    } catch (...) {
        LogError("sse", "Error handling '" + method + "': unknown exception");
        return ErrorReply(500, "Internal server error");
    }
}

void SseTransport::BeginBackground() {
    std::lock_guard<std::mutex> lock(background_mutex_);
    ++background_inflight_;
}

void SseTransport::EndBackground() {
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        --background_inflight_;
    }
    background_idle_.notify_all();
}

void SseTransport::RunInBackground(nlohmann::json request) {
    // Balances the BeginBackground() done by HandlePost on every exit path.
    struct InflightGuard {
        SseTransport* self;
        ~InflightGuard() { self->EndBackground(); }
    } inflight{this};

    const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }

    try {
        if (!handler) {
            Send(MakeError(id, kServerError, "No message handler configured"));
        } else if (auto response = handler(request)) {
            Send(*response);
        } else {
            Send(Acknowledgement(id, "processed", "Background task completed"));
        }
    } catch (const std::exception& e) {
        LogError("sse", "Background tools/call failed (ID: " + id.dump() + "): " + e.what());
        Send(MakeError(id, kServerError,
                       std::string("Background execution failed: ") + e.what()));
    } catch (...) {
        LogError("sse", "Background tools/call failed (ID: " + id.dump() +
                            "): unknown exception");
        Send(MakeError(id, kServerError, "Background execution failed: unknown exception"));
    }
}

bool SseTransport::WaitForBackground(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(background_mutex_);
    return background_idle_.wait_for(lock, timeout, [this] { return background_inflight_ == 0; });
}

// ---------------------------------------------------------------------------
// Elicitation endpoints
// ---------------------------------------------------------------------------

HttpReply SseTransport::HandleElicitationResponse(const std::string& body,
                                                  const HttpHeaders& headers) {
    if (auto denied = CheckAuth(headers)) return *denied;
    if (!elicitation_) return ErrorReply(501, "Elicitation not supported");

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return ErrorReply(400, std::string("Invalid JSON: ") + e.what());
    }
    if (!payload.is_object()) return ErrorReply(400, "Invalid elicitation response");

    auto prompt_id = payload.find("prompt_id");
    if (prompt_id == payload.end() || !prompt_id->is_string() ||
        prompt_id->get_ref<const std::string&>().empty()) {
        return ErrorReply(400, "Missing prompt_id");
    }
    auto response = payload.value("response", nlohmann::json());
    if (!elicitation_->HandleResponse(prompt_id->get<std::string>(), response)) {
        return ErrorReply(404, "Unknown prompt_id");
    }
    return HttpReply{200, nlohmann::json{{"status", "received"}}};
}

HttpReply SseTransport::HandleActivePrompts(const HttpHeaders& headers) const {
    if (auto denied = CheckAuth(headers)) return *denied;
    if (!elicitation_) return ErrorReply(501, "Elicitation not supported");

    auto prompts = nlohmann::json::array();
    for (const auto& prompt : elicitation_->ActivePrompts()) {
        prompts.push_back(prompt.ToJson());
    }
    return HttpReply{200, nlohmann::json{{"active_prompts", std::move(prompts)}}};
}

// ---------------------------------------------------------------------------
// Status endpoints
// ---------------------------------------------------------------------------

nlohmann::json SseTransport::HandlePing() const {
    return {
        {"status", "ok"},
        {"timestamp", NowSeconds()},
        {"connected_clients", ClientCount()}
    };
}

nlohmann::json SseTransport::HandleHealth() const {
    nlohmann::json health = {
        {"status", "healthy"},
        {"timestamp", NowSeconds()},
        {"connected_clients", ClientCount()},
        {"features", {
            {"authentication", authenticator_ != nullptr},
            {"authentication_required", options_.require_auth},
            {"elicitation", elicitation_ != nullptr}
        }}
    };
    if (elicitation_) health["active_prompts"] = elicitation_->ActiveCount();
    return health;
}

nlohmann::json SseTransport::HandleInfo() const {
    nlohmann::json info = {
        {"name", options_.server_name},
        {"version", options_.server_version},
        {"transport", "HTTP/SSE"},
        {"endpoints", {
            {"message", "POST /message"},
            {"events", "GET /sse"},
            {"ping", "GET /ping"},
            {"health", "GET /health"}
        }}
    };
    if (elicitation_) {
        info["endpoints"]["elicitation_response"] = "POST /elicitation/response";
        info["endpoints"]["elicitation_active"] = "GET /elicitation/active";
    }
    if (info_provider_) {
        try {
            auto extra = info_provider_();
            if (extra.is_object()) info.update(extra);
        } catch (const std::exception& e) {
            LogWarn("sse", std::string("Server info provider failed: ") + e.what());
        } catch (...) {
            LogWarn("sse", "Server info provider failed: unknown exception");
        }
    }
    return info;
}

// ---------------------------------------------------------------------------
// Clients and broadcast
// ---------------------------------------------------------------------------

std::shared_ptr<ClientConnection> SseTransport::OpenClient() {
    if (closed_.load()) return nullptr;

    auto client = std::make_shared<ClientConnection>("client_" + RandomHex(8),
                                                     options_.queue_capacity);
    client->Enqueue(SseEvent{"system",
                             Dump({{"type", "connected"},
                                   {"message", "SSE connection established"}}),
                             "conn_" + RandomHex(8), ""},
                    std::chrono::milliseconds(0));

    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_[client->Id()] = client;
        count = clients_.size();
    }
    LogInfo("sse", "SSE client connected. Total clients: " + std::to_string(count));
    return client;
}

void SseTransport::RemoveClient(const std::string& client_id) {
    std::shared_ptr<ClientConnection> client;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(client_id);
        if (it == clients_.end()) return;
        client = it->second;
        clients_.erase(it);
        count = clients_.size();
    }
    client->Close();
    LogInfo("sse", "SSE client disconnected. Remaining clients: " + std::to_string(count));
}

std::size_t SseTransport::ClientCount() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void SseTransport::Send(const nlohmann::json& message) {
    if (closed_.load()) {
        LogDebug("sse", "Dropping message sent after close");
        return;
    }

    nlohmann::json outbound = message;
    EnsureJsonRpcVersion(outbound);
    SseEvent event{EventTypeFor(outbound), Dump(outbound), EventIdFor(outbound), ""};

    std::vector<std::shared_ptr<ClientConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [id, client] : clients_) targets.push_back(client);
    }
    if (targets.empty()) {
        LogDebug("sse", "No SSE clients connected, event " + event.id + " not delivered");
        return;
    }

    for (const auto& client : targets) {
        if (!client->Enqueue(event, options_.send_timeout)) {
            LogWarn("sse", "SSE client " + client->Id() + " queue full, skipping event " +
                               event.id);
        }
    }
    LogDebug("sse", "Broadcast " + event.event + " event " + event.id + " to " +
                        std::to_string(targets.size()) + " client(s)");
}

// ---------------------------------------------------------------------------
// Close
// ---------------------------------------------------------------------------

void SseTransport::Close() {
    if (closed_.exchange(true)) return;
    LogInfo("sse", "Closing SSE transport");

    std::vector<std::shared_ptr<ClientConnection>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [id, client] : clients_) clients.push_back(client);
    }

    auto shutdown = Dump({{"type", "shutdown"}, {"reason", "server_stopping"}});
    std::vector<std::future<bool>> pending;
    pending.reserve(clients.size());
    for (const auto& client : clients) {
        pending.push_back(std::async(std::launch::async, [this, client, shutdown] {
            return client->Enqueue(SseEvent{"system", shutdown, "shut_" + RandomHex(8), ""},
                                   options_.shutdown_timeout);
        }));
    }
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (!pending[i].get()) {
            LogWarn("sse", "Could not deliver shutdown event to " + clients[i]->Id());
        }
    }

    // The list is cleared only once every client has its shutdown event.
    std::map<std::string, std::shared_ptr<ClientConnection>> remaining;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        remaining.swap(clients_);
    }
    for (const auto& [id, client] : remaining) client->Close();

    // Blocked prompts would otherwise hold background workers until they time out.
    if (elicitation_) {
        for (const auto& prompt : elicitation_->ActivePrompts()) {
            elicitation_->CancelPrompt(prompt.id);
        }
    }

    Stop();
    background_->Shutdown();
    LogInfo("sse", "SSE transport closed");
}

} // namespace berry_mcp
