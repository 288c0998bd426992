#include <berry_mcp/server/tool_context.hpp>

#include <berry_mcp/core/ids.hpp>
#include <berry_mcp/core/log.hpp>

#include <chrono>
#include <exception>

namespace berry_mcp {

namespace {

std::string OperationIdFor(const nlohmann::json& request_id) {
    if (request_id.is_string()) return request_id.get<std::string>();
    if (request_id.is_number()) return request_id.dump();
    return "op_" + RandomHex(8);
}

double NowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

ToolContext::ToolContext(nlohmann::json request_id,
                         std::optional<nlohmann::json> progress_token,
                         Notifier notifier,
                         ElicitationManager* elicitation)
    : request_id_(std::move(request_id)),
      progress_token_(std::move(progress_token)),
      notifier_(std::move(notifier)),
      elicitation_(elicitation),
      operation_id_(OperationIdFor(request_id_)) {}

void ToolContext::ReportProgress(double progress, std::optional<double> total,
                                 std::optional<std::string> message) {
    if (!progress_token_ || progress_token_->is_null()) return;

    nlohmann::json params = {
        {"progressToken", *progress_token_},
        {"progress", progress}
    };
    if (total) params["total"] = *total;
    if (message) params["message"] = *message;
    Notify("notifications/progress", params);
}

void ToolContext::SendChunk(const nlohmann::json& data) {
    auto sequence = ++sequence_;
    Notify("notifications/streaming/chunk", {
        {"operation_id", operation_id_},
        {"sequence", sequence},
        {"type", "data"},
        {"data", data},
        {"timestamp", NowSeconds()}
    });
}

void ToolContext::Notify(const std::string& method, const nlohmann::json& params) {
    if (!notifier_) {
        LogDebug("tool", "No notifier for " + method + ", dropping");
        return;
    }
    try {
        notifier_(method, params);
    } catch (const std::exception& e) {
        LogWarn("tool", "Failed to send " + method + ": " + e.what());
    } catch (...) {
        LogWarn("tool", "Failed to send " + method + ": unknown exception");
    }
}

} // namespace berry_mcp
