#include <berry_mcp/elicitation/elicitation_manager.hpp>

#include <berry_mcp/core/ids.hpp>
#include <berry_mcp/core/log.hpp>

#include <algorithm>
#include <exception>

namespace berry_mcp {

const char* PromptTypeName(PromptType type) {
    switch (type) {
        case PromptType::Confirmation: return "confirmation";
        case PromptType::Input:        return "input";
        case PromptType::Choice:       return "choice";
    }
    return "confirmation";
}

// ---------------------------------------------------------------------------
// ElicitationPrompt
// ---------------------------------------------------------------------------

ElicitationPrompt ElicitationPrompt::Confirmation(std::string title, std::string message,
                                                  bool default_response) {
    ElicitationPrompt prompt;
    prompt.type = PromptType::Confirmation;
    prompt.title = std::move(title);
    prompt.message = std::move(message);
    prompt.default_value = default_response;
    return prompt;
}

ElicitationPrompt ElicitationPrompt::Input(std::string title, std::string message,
                                           std::string default_value,
                                           std::string placeholder) {
    ElicitationPrompt prompt;
    prompt.type = PromptType::Input;
    prompt.title = std::move(title);
    prompt.message = std::move(message);
    prompt.default_value = std::move(default_value);
    prompt.placeholder = std::move(placeholder);
    return prompt;
}

ElicitationPrompt ElicitationPrompt::Choice(std::string title, std::string message,
                                            std::vector<ElicitationChoice> choices,
                                            bool allow_multiple) {
    ElicitationPrompt prompt;
    prompt.type = PromptType::Choice;
    prompt.title = std::move(title);
    prompt.message = std::move(message);
    prompt.choices = std::move(choices);
    prompt.allow_multiple = allow_multiple;
    prompt.default_value = allow_multiple ? nlohmann::json::array() : nlohmann::json("");
    return prompt;
}

nlohmann::json ElicitationPrompt::ToParams() const {
    nlohmann::json params = {
        {"type", PromptTypeName(type)},
        {"id", id},
        {"title", title},
        {"message", message},
        {"default", default_value},
        {"timeout", timeout ? nlohmann::json(timeout->count()) : nlohmann::json()},
        {"priority", priority},
        {"context", context}
    };

    switch (type) {
        case PromptType::Confirmation:
            break;
        case PromptType::Input:
            params["placeholder"] = placeholder;
            if (max_length) params["max_length"] = *max_length;
            break;
        case PromptType::Choice: {
            auto list = nlohmann::json::array();
            for (const auto& choice : choices) {
                list.push_back({{"value", choice.value},
                                {"label", choice.label},
                                {"description", choice.description}});
            }
            params["choices"] = std::move(list);
            params["allow_multiple"] = allow_multiple;
            break;
        }
    }
    return params;
}

nlohmann::json ElicitationPrompt::ToJson() const {
    return {
        {"id", id},
        {"type", PromptTypeName(type)},
        {"title", title},
        {"message", message},
        {"timeout_seconds", timeout ? nlohmann::json(timeout->count()) : nlohmann::json()},
        {"priority", priority},
        {"context", context}
    };
}

bool ElicitationPrompt::ValidateResponse(const nlohmann::json& response) const {
    auto is_choice = [this](const nlohmann::json& value) {
        if (!value.is_string()) return false;
        const auto& text = value.get_ref<const std::string&>();
        return std::any_of(choices.begin(), choices.end(),
                           [&](const ElicitationChoice& c) { return c.value == text; });
    };

    switch (type) {
        case PromptType::Confirmation:
            return response.is_boolean();
        case PromptType::Input:
            if (!response.is_string()) return false;
            return !max_length || response.get_ref<const std::string&>().size() <= *max_length;
        case PromptType::Choice:
            if (!allow_multiple) return is_choice(response);
            if (!response.is_array()) return false;
            return std::all_of(response.begin(), response.end(), is_choice);
    }
    return false;
}

// ---------------------------------------------------------------------------
// ElicitationManager
// ---------------------------------------------------------------------------

ElicitationManager::ElicitationManager(Notifier notifier,
                                       std::chrono::seconds default_timeout)
    : notifier_(std::move(notifier)), default_timeout_(default_timeout) {}

void ElicitationManager::Notify(const std::string& method, const nlohmann::json& params) {
    if (!notifier_) {
        LogWarn("elicitation", "No notifier configured, dropping " + method);
        return;
    }
    try {
        notifier_(method, params);
    } catch (const std::exception& e) {
        LogError("elicitation", "Failed to send " + method + ": " + e.what());
    } catch (...) {
        LogError("elicitation", "Failed to send " + method + ": unknown exception");
    }
}

nlohmann::json ElicitationManager::SendPrompt(ElicitationPrompt prompt) {
    if (prompt.id.empty()) prompt.id = RandomHex(32);
    if (!prompt.timeout) prompt.timeout = default_timeout_;

    auto pending = std::make_shared<Pending>();
    pending->prompt = prompt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_[prompt.id] = pending;
    }

    LogInfo("elicitation", "Executing elicitation prompt: " + prompt.title);
    Notify("notifications/elicitation", prompt.ToParams());

    std::unique_lock<std::mutex> lock(mutex_);
    bool resolved = answered_.wait_for(lock, *prompt.timeout, [&] {
        return pending->response.has_value() || pending->cancelled;
    });
    active_.erase(prompt.id);
    auto response = pending->response;
    bool cancelled = pending->cancelled;
    lock.unlock();

    if (!resolved) {
        LogWarn("elicitation", "Elicitation prompt '" + prompt.title + "' timed out");
        Notify("notifications/elicitation/timeout",
               {{"id", prompt.id}, {"title", prompt.title}});
        return prompt.default_value;
    }
    if (cancelled) {
        LogInfo("elicitation", "Prompt cancelled: " + prompt.title);
        return prompt.default_value;
    }
    if (!prompt.ValidateResponse(*response)) {
        auto error = "Invalid response: " + response->dump();
        LogError("elicitation", "Elicitation error for '" + prompt.title + "': " + error);
        Notify("notifications/elicitation/error",
               {{"id", prompt.id}, {"title", prompt.title}, {"error", error}});
        return prompt.default_value;
    }

    LogInfo("elicitation", "Elicitation prompt completed: " + prompt.title);
    return *response;
}

bool ElicitationManager::Confirm(const std::string& title, const std::string& message,
                                 bool default_response) {
    auto answer = SendPrompt(ElicitationPrompt::Confirmation(title, message, default_response));
    return answer.is_boolean() ? answer.get<bool>() : default_response;
}

bool ElicitationManager::HandleResponse(const std::string& prompt_id,
                                        const nlohmann::json& response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(prompt_id);
        if (it == active_.end() || it->second->response || it->second->cancelled) {
            LogWarn("elicitation", "No pending prompt with id " + prompt_id);
            return false;
        }
        it->second->response = response;
    }
    answered_.notify_all();
    return true;
}

bool ElicitationManager::CancelPrompt(const std::string& prompt_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(prompt_id);
        if (it == active_.end()) return false;
        LogInfo("elicitation", "Cancelling prompt: " + it->second->prompt.title);
        it->second->cancelled = true;
    }
    answered_.notify_all();
    return true;
}

std::vector<ElicitationPrompt> ElicitationManager::ActivePrompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ElicitationPrompt> prompts;
    prompts.reserve(active_.size());
    for (const auto& [id, pending] : active_) {
        prompts.push_back(pending->prompt);
    }
    return prompts;
}

std::size_t ElicitationManager::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace berry_mcp
