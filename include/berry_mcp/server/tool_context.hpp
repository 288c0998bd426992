#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace berry_mcp {

class ElicitationManager;

// ---------------------------------------------------------------------------
// ToolContext: per-call handle a tool body receives for talking back to the
// client while it runs.
//
// Progress goes out as notifications/progress and only when the caller sent
// a progress token. Stream chunks go out as notifications/streaming/chunk
// with a sequence number starting at 1.
// ---------------------------------------------------------------------------
class ToolContext {
public:
    using Notifier =
        std::function<void(const std::string& method, const nlohmann::json& params)>;

    ToolContext(nlohmann::json request_id,
                std::optional<nlohmann::json> progress_token,
                Notifier notifier,
                ElicitationManager* elicitation = nullptr);

    ToolContext(const ToolContext&) = delete;
    ToolContext& operator=(const ToolContext&) = delete;

    [[nodiscard]] const nlohmann::json& RequestId() const noexcept { return request_id_; }
    [[nodiscard]] const std::optional<nlohmann::json>& ProgressToken() const noexcept {
        return progress_token_;
    }
    [[nodiscard]] const std::string& OperationId() const noexcept { return operation_id_; }

    // No-op without a progress token.
    void ReportProgress(double progress,
                        std::optional<double> total = std::nullopt,
                        std::optional<std::string> message = std::nullopt);

    void SendChunk(const nlohmann::json& data);

    void Notify(const std::string& method, const nlohmann::json& params);

    // nullptr when the transport cannot carry prompts.
    [[nodiscard]] ElicitationManager* Elicitation() const noexcept { return elicitation_; }

    [[nodiscard]] std::uint64_t ChunksSent() const noexcept { return sequence_.load(); }

private:
    nlohmann::json request_id_;
    std::optional<nlohmann::json> progress_token_;
    Notifier notifier_;
    ElicitationManager* elicitation_;
    std::string operation_id_;
    std::atomic<std::uint64_t> sequence_{0};
};

} // namespace berry_mcp
