#include <berry_mcp/transport/stdio_transport.hpp>

#include <berry_mcp/core/blocking_queue.hpp>
#include <berry_mcp/core/log.hpp>
#include <berry_mcp/protocol/json_rpc.hpp>

#include <condition_variable>
#include <exception>
#include <string>

namespace berry_mcp {

// Shared with the reader thread so that a reader detached on Close() never
// touches a destroyed transport. The reader handles each line while holding
// `mutex`, and only if `owner_gone` is still false.
struct StdioTransport::ReaderState {
    BlockingQueue<nlohmann::json> queue;
    std::mutex mutex;
    std::condition_variable finished_cv;
    bool finished = false;
    bool owner_gone = false;
    std::atomic<bool> input_closed{false};
};

namespace {

std::string Trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

const char* MessageKind(const nlohmann::json& message) {
    if (message.contains("result")) return "response";
    if (message.contains("error")) return "error";
    if (message.contains("method")) return "notification";
    return "unknown";
}

} // anonymous namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out,
                               std::chrono::milliseconds close_timeout)
    : in_(in), out_(out), close_timeout_(close_timeout),
      state_(std::make_shared<ReaderState>()) {}

StdioTransport::~StdioTransport() {
    Close();
}

Result<void, Error> StdioTransport::Connect() {
    if (closed_.load()) {
        return Result<void, Error>::Err(Error{"StdioTransport::Connect",
                                              "Transport is closed",
                                              ErrorCategory::Transport, std::nullopt});
    }
    if (connected_.exchange(true)) {
        LogWarn("stdio", "Already connected");
        return Result<void, Error>::Ok();
    }
    reader_ = std::thread(&StdioTransport::ReadLoop, state_, std::ref(in_), this);
    LogInfo("stdio", "Connected, reading from input stream");
    return Result<void, Error>::Ok();
}

void StdioTransport::ReadLoop(std::shared_ptr<ReaderState> state, std::istream& in,
                              StdioTransport* owner) {
    LogDebug("stdio", "Reader started");
    std::string line;
    try {
        // getline also yields a final fragment that has no newline.
        while (std::getline(in, line)) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->owner_gone) break;
            owner->HandleLine(line, *state);
        }
        LogInfo("stdio", "End of input");
    } catch (const std::exception& e) {
        LogError("stdio", std::string("Reader failed: ") + e.what());
    }

    state->input_closed = true;
    state->queue.Close();
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
    }
    state->finished_cv.notify_all();
    LogDebug("stdio", "Reader finished");
}

void StdioTransport::HandleLine(const std::string& raw, ReaderState& state) {
    auto line = Trim(raw);
    if (line.empty()) return;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        LogWarn("stdio", std::string("Invalid JSON: ") + e.what());
        Send(MakeError(nullptr, kParseError, std::string("Parse error: ") + e.what()));
        return;
    }

    if (!state.queue.Push(std::move(message))) {
        LogDebug("stdio", "Dropping message read after close");
    }
}

void StdioTransport::Send(const nlohmann::json& message) {
    if (closed_.load()) {
        LogWarn("stdio", "Attempted send on closed transport");
        return;
    }

    nlohmann::json outbound = message;
    EnsureJsonRpcVersion(outbound);
    auto line = outbound.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_ << line << '\n';
        out_.flush();
        if (!out_) {
            LogError("stdio", "Failed to write to output stream");
            return;
        }
    }

    auto id = outbound.contains("id") ? outbound["id"].dump() : std::string("N/A");
    LogDebug("stdio", std::string("Sent ") + MessageKind(outbound) + " (ID: " + id + ")");
}

std::optional<nlohmann::json> StdioTransport::Receive() {
    if (closed_.load()) return std::nullopt;
    // Pop drains what is queued, then returns nullopt once the reader has
    // closed the queue at end of input.
    return state_->queue.Pop();
}

bool StdioTransport::IsInputClosed() const {
    return closed_.load() || state_->input_closed.load();
}

void StdioTransport::Close() {
    if (closed_.exchange(true)) return;
    LogInfo("stdio", "Closing");

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->owner_gone = true;
    }
    state_->queue.Close();

    if (reader_.joinable()) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool finished = state_->finished_cv.wait_for(
            lock, close_timeout_, [this] { return state_->finished; });
        lock.unlock();
        if (finished) {
            reader_.join();
        } else {
            LogWarn("stdio", "Reader still blocked on input, detaching");
            reader_.detach();
        }
    }
    LogInfo("stdio", "Closed");
}

} // namespace berry_mcp
