#pragma once

#include <berry_mcp/transport/transport.hpp>

#include <nlohmann/json.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// RecordingTransport: hand-written pull transport for offline tests.
//
// Usage:
//   RecordingTransport transport;
//   transport.EnqueueReceive({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
//   server.Run(transport);
//   CHECK(transport.Sent().size() == 1);
//
// Scripted messages are handed out FIFO; once the script is exhausted
// Receive() returns nullopt, which ends a server loop.
// ---------------------------------------------------------------------------
class RecordingTransport : public ITransport {
public:
    RecordingTransport() = default;

    // -- Scripting ------------------------------------------------------------

    void EnqueueReceive(nlohmann::json message) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(std::move(message));
    }

    void FailConnect(Error error) { connect_error_ = std::move(error); }

    // -- ITransport -------------------------------------------------------------

    Result<void, Error> Connect() override {
        ++connect_count_;
        if (connect_error_) return Result<void, Error>::Err(*connect_error_);
        return Result<void, Error>::Ok();
    }

    void Send(const nlohmann::json& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
    }

    std::optional<nlohmann::json> Receive() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inbound_.empty()) return std::nullopt;
        auto message = std::move(inbound_.front());
        inbound_.pop_front();
        return message;
    }

    void Close() override { ++close_count_; }

    [[nodiscard]] std::string Name() const override { return "recording"; }

    // -- Inspection ---------------------------------------------------------------

    [[nodiscard]] std::vector<nlohmann::json> Sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    // Sent messages whose "method" equals `method`.
    [[nodiscard]] std::vector<nlohmann::json> SentNotifications(
        const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> matches;
        for (const auto& message : sent_) {
            if (message.value("method", "") == method) matches.push_back(message);
        }
        return matches;
    }

    [[nodiscard]] int ConnectCount() const { return connect_count_; }
    [[nodiscard]] int CloseCount() const { return close_count_; }

private:
    mutable std::mutex mutex_;
    std::deque<nlohmann::json> inbound_;
    std::vector<nlohmann::json> sent_;
    std::optional<Error> connect_error_;
    int connect_count_ = 0;
    int close_count_ = 0;
};

} // namespace testing
} // namespace berry_mcp
