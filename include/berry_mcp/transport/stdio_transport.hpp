#pragma once

#include <berry_mcp/transport/transport.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON over a pair of streams.
//
// A reader thread splits the input into lines and queues decoded messages;
// a line that is not valid JSON is answered with a -32700 error and
// skipped. End of input (including a final line without a newline) queues
// an end marker, after which Receive() returns nullopt. Send() writes one
// line per message and flushes; it keeps working after end of input and
// stops only after Close().
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            std::chrono::milliseconds close_timeout =
                                std::chrono::milliseconds(1000));
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    Result<void, Error> Connect() override;
    void Send(const nlohmann::json& message) override;
    std::optional<nlohmann::json> Receive() override;
    void Close() override;

    [[nodiscard]] std::string Name() const override { return "stdio"; }

    // True after end of input was read or Close() ran.
    [[nodiscard]] bool IsInputClosed() const;
    [[nodiscard]] bool IsClosed() const { return closed_.load(); }

private:
    struct ReaderState;

    static void ReadLoop(std::shared_ptr<ReaderState> state, std::istream& in,
                         StdioTransport* owner);
    void HandleLine(const std::string& line, ReaderState& state);

    std::istream& in_;
    std::ostream& out_;
    std::chrono::milliseconds close_timeout_;
    std::shared_ptr<ReaderState> state_;
    std::thread reader_;
    std::mutex write_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
};

} // namespace berry_mcp
