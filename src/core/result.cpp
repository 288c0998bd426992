#include <berry_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace berry_mcp {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:         return 2;
        case ErrorCategory::Protocol:       return 3;
        case ErrorCategory::Transport:      return 4;
        case ErrorCategory::Tool:           return 5;
        case ErrorCategory::Authentication: return 6;
        case ErrorCategory::Timeout:        return 10;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::Protocol:       return "protocol";
        case ErrorCategory::Transport:      return "transport";
        case ErrorCategory::Tool:           return "tool";
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (detail.has_value()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace berry_mcp
