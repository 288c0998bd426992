#pragma once

#include <berry_mcp/auth/authenticator.hpp>
#include <berry_mcp/config/app_config.hpp>
#include <berry_mcp/core/blocking_queue.hpp>
#include <berry_mcp/core/version.hpp>
#include <berry_mcp/transport/transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace berry_mcp {

class ElicitationManager;
class WorkerPool;

// ---------------------------------------------------------------------------
// SseOptions: listener address and delivery limits of the HTTP/SSE transport.
// ---------------------------------------------------------------------------
struct SseOptions {
    std::string host = "localhost";
    uint16_t port = 8000;
    std::chrono::seconds keepalive{15};
    std::size_t queue_capacity = 100;
    std::chrono::milliseconds send_timeout{500};
    std::chrono::milliseconds shutdown_timeout{200};
    std::size_t background_threads = 4;
    bool require_auth = false;
    std::string server_name = kDefaultServerName;
    std::string server_version = kVersion;
};

SseOptions SseOptionsFromConfig(const ServerConfig& config);

// One frame on the event stream. A non-empty `comment` makes it a comment
// frame; the other fields are then ignored.
struct SseEvent {
    std::string event;
    std::string data;
    std::string id;
    std::string comment;
};

// "event: ...\ndata: ...\nid: ...\n\n"; multi-line data gets one data: line
// per line. Comment frames render as ": <comment>\n\n".
std::string FormatSseEvent(const SseEvent& event);

// HTTP status plus JSON body. No body means an empty response (204).
struct HttpReply {
    int status = 200;
    std::optional<nlohmann::json> body;
};

// ---------------------------------------------------------------------------
// ClientConnection: outbound queue of one open event stream.
// ---------------------------------------------------------------------------
class ClientConnection {
public:
    ClientConnection(std::string id, std::size_t capacity)
        : id_(std::move(id)), queue_(capacity) {}

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }

    // False when the queue stayed full for `timeout` or the client is closed.
    bool Enqueue(SseEvent event, std::chrono::milliseconds timeout) {
        return queue_.PushFor(std::move(event), timeout);
    }

    // Next event, or nullopt after `wait` (keep-alive due) or once closed
    // and drained.
    std::optional<SseEvent> Next(std::chrono::milliseconds wait) {
        return queue_.PopFor(wait);
    }

    void Close() { queue_.Close(); }
    [[nodiscard]] bool IsClosed() const { return queue_.IsClosed(); }
    [[nodiscard]] std::size_t Pending() const { return queue_.Size(); }

private:
    std::string id_;
    BlockingQueue<SseEvent> queue_;
};

// ---------------------------------------------------------------------------
// SseTransport: HTTP POST for inbound JSON-RPC, Server-Sent Events for
// everything outbound.
//
// Uses pimpl to keep httplib out of the public header. The request logic
// (HandlePost, HandlePing, OpenClient, ...) is public so it can be driven
// without sockets.
//
//   initialize   answered inline (200)
//   tools/call   acknowledged (202), executed on a background pool, result
//                broadcast to every stream
//   other        handled inline, result broadcast, acknowledged (202/204)
// ---------------------------------------------------------------------------
class SseTransport : public ITransport {
public:
    explicit SseTransport(SseOptions options = {});
    ~SseTransport() override;

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;
    SseTransport(SseTransport&&) = delete;
    SseTransport& operator=(SseTransport&&) = delete;

    // -- ITransport ----------------------------------------------------------

    // Registers the HTTP routes. Serving starts with Listen().
    Result<void, Error> Connect() override;

    // Broadcast to every open stream.
    void Send(const nlohmann::json& message) override;

    // Shutdown event to every stream, stop the listener, drain background work.
    void Close() override;

    void SetMessageHandler(MessageHandler handler) override;

    [[nodiscard]] std::string Name() const override { return "sse"; }

    // -- Serving -------------------------------------------------------------

    // Binds and serves until Stop() or Close(). Blocks the calling thread.
    Result<void, Error> Listen();
    void Stop();

    // -- Optional collaborators (set before Connect) --------------------------

    void SetAuthenticator(std::shared_ptr<const IAuthenticator> authenticator);

    // Non-owning; must outlive the transport.
    void SetElicitationManager(ElicitationManager* manager);

    // Extra fields merged into the GET / server info (e.g. tools_count).
    void SetInfoProvider(std::function<nlohmann::json()> provider);

    // -- Request logic ---------------------------------------------------------

    HttpReply HandlePost(const std::string& body, const HttpHeaders& headers = {});
    HttpReply HandleElicitationResponse(const std::string& body,
                                        const HttpHeaders& headers = {});
    HttpReply HandleActivePrompts(const HttpHeaders& headers = {}) const;
    [[nodiscard]] nlohmann::json HandlePing() const;
    [[nodiscard]] nlohmann::json HandleHealth() const;
    [[nodiscard]] nlohmann::json HandleInfo() const;

    // Registers a stream and queues its `connected` event. nullptr once closed.
    std::shared_ptr<ClientConnection> OpenClient();
    void RemoveClient(const std::string& client_id);
    [[nodiscard]] std::size_t ClientCount() const;

    // Waits until no background tools/call is queued or running.
    bool WaitForBackground(std::chrono::milliseconds timeout);

    [[nodiscard]] bool IsClosed() const noexcept { return closed_.load(); }
    [[nodiscard]] const SseOptions& Options() const noexcept { return options_; }

private:
    struct Impl;

    // nullopt when the request may proceed, else the 401 reply.
    std::optional<HttpReply> CheckAuth(const HttpHeaders& headers) const;
    void RunInBackground(nlohmann::json request);
    void BeginBackground();
    void EndBackground();
    void RegisterRoutes();

    SseOptions options_;
    std::unique_ptr<Impl> impl_;
    std::unique_ptr<WorkerPool> background_;

    mutable std::mutex handler_mutex_;
    MessageHandler handler_;
    std::shared_ptr<const IAuthenticator> authenticator_;
    ElicitationManager* elicitation_ = nullptr;
    std::function<nlohmann::json()> info_provider_;

    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<ClientConnection>> clients_;

    std::mutex background_mutex_;
    std::condition_variable background_idle_;
    std::size_t background_inflight_ = 0;

    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
};

} // namespace berry_mcp
