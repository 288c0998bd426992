#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {

enum class PromptType {
    Confirmation,
    Input,
    Choice,
};

const char* PromptTypeName(PromptType type);

struct ElicitationChoice {
    std::string value;
    std::string label;
    std::string description;
};

// ---------------------------------------------------------------------------
// ElicitationPrompt: a question put to the human behind the client.
// ---------------------------------------------------------------------------
struct ElicitationPrompt {
    std::string id;  // generated by SendPrompt when empty
    PromptType type = PromptType::Confirmation;
    std::string title;
    std::string message;
    nlohmann::json default_value;  // returned on timeout or invalid answer
    std::string placeholder;
    std::optional<std::size_t> max_length;
    std::vector<ElicitationChoice> choices;
    bool allow_multiple = false;
    std::optional<std::chrono::seconds> timeout;
    std::string priority = "normal";
    nlohmann::json context = nlohmann::json::object();

    static ElicitationPrompt Confirmation(std::string title, std::string message,
                                          bool default_response = false);
    static ElicitationPrompt Input(std::string title, std::string message,
                                   std::string default_value = "",
                                   std::string placeholder = "");
    static ElicitationPrompt Choice(std::string title, std::string message,
                                    std::vector<ElicitationChoice> choices,
                                    bool allow_multiple = false);

    // Params of the notifications/elicitation message.
    [[nodiscard]] nlohmann::json ToParams() const;

    // Summary listed by GET /elicitation/active.
    [[nodiscard]] nlohmann::json ToJson() const;

    // Confirmation: boolean. Input: string within max_length. Choice: one
    // of the choice values, or a list of them when allow_multiple.
    [[nodiscard]] bool ValidateResponse(const nlohmann::json& response) const;
};

// ---------------------------------------------------------------------------
// ElicitationManager: sends prompts as notifications and blocks the
// calling tool until the client answers through HandleResponse().
//
// A prompt that times out, is cancelled or gets an invalid answer resolves
// to its default value; timeouts and invalid answers are reported with
// notifications/elicitation/timeout and notifications/elicitation/error.
// ---------------------------------------------------------------------------
class ElicitationManager {
public:
    using Notifier =
        std::function<void(const std::string& method, const nlohmann::json& params)>;

    explicit ElicitationManager(Notifier notifier,
                                std::chrono::seconds default_timeout =
                                    std::chrono::seconds(300));

    ElicitationManager(const ElicitationManager&) = delete;
    ElicitationManager& operator=(const ElicitationManager&) = delete;

    // Blocks until answered, timed out or cancelled.
    nlohmann::json SendPrompt(ElicitationPrompt prompt);

    bool Confirm(const std::string& title, const std::string& message,
                 bool default_response = false);

    // Deliver a client answer. False when no such prompt is waiting.
    bool HandleResponse(const std::string& prompt_id, const nlohmann::json& response);

    // Resolve a waiting prompt with its default. False when unknown.
    bool CancelPrompt(const std::string& prompt_id);

    [[nodiscard]] std::vector<ElicitationPrompt> ActivePrompts() const;
    [[nodiscard]] std::size_t ActiveCount() const;

    [[nodiscard]] std::chrono::seconds DefaultTimeout() const noexcept {
        return default_timeout_;
    }

private:
    struct Pending {
        ElicitationPrompt prompt;
        std::optional<nlohmann::json> response;
        bool cancelled = false;
    };

    void Notify(const std::string& method, const nlohmann::json& params);

    Notifier notifier_;
    std::chrono::seconds default_timeout_;
    std::map<std::string, std::shared_ptr<Pending>> active_;
    mutable std::mutex mutex_;
    std::condition_variable answered_;
};

} // namespace berry_mcp
