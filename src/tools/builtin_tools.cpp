#include <berry_mcp/tools/builtin_tools.hpp>

#include <berry_mcp/elicitation/elicitation_manager.hpp>
#include <berry_mcp/registry/typed_tool.hpp>
#include <berry_mcp/server/tool_context.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace berry_mcp {

namespace {

constexpr int kMaxCountdownSteps = 1000;

std::string FormatTime(bool utc) {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
#ifdef _WIN32
    if (utc) gmtime_s(&parts, &time_t_now); else localtime_s(&parts, &time_t_now);
#else
    if (utc) gmtime_r(&time_t_now, &parts); else localtime_r(&time_t_now, &parts);
#endif
    std::ostringstream oss;
    oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%SZ" : "%Y-%m-%dT%H:%M:%S%z");
    return oss.str();
}

} // anonymous namespace

std::string TransformCase(const std::string& text, CaseMode mode) {
    std::string out = text;
    bool word_start = true;
    for (auto& ch : out) {
        auto c = static_cast<unsigned char>(ch);
        switch (mode) {
            case CaseMode::Upper:
                ch = static_cast<char>(std::toupper(c));
                break;
            case CaseMode::Lower:
                ch = static_cast<char>(std::tolower(c));
                break;
            case CaseMode::Title:
                ch = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
                break;
        }
        word_start = std::isspace(c) != 0;
    }
    return out;
}

// ---------------------------------------------------------------------------
// math
// ---------------------------------------------------------------------------

void RegisterMathTools(ToolRegistry& registry) {
    RegisterFunction(registry, "add", "Add two integers",
                     {Arg("a").Describe("First addend"), Arg("b").Describe("Second addend")},
                     [](long long a, long long b) { return a + b; });

    RegisterFunction(registry, "divide", "Divide a by b",
                     {Arg("a").Describe("Dividend"), Arg("b").Describe("Divisor")},
                     [](double a, double b) {
                         if (b == 0.0) throw std::domain_error("Division by zero");
                         return a / b;
                     });

    RegisterFunction(registry, "sum", "Sum a list of numbers",
                     {Arg("values").Describe("Numbers to add up")},
                     [](const std::vector<double>& values) {
                         return std::accumulate(values.begin(), values.end(), 0.0);
                     });
}

// ---------------------------------------------------------------------------
// text
// ---------------------------------------------------------------------------

void RegisterTextTools(ToolRegistry& registry) {
    RegisterFunction(registry, "echo", "Echo a message back",
                     {Arg("message").Describe("Text to echo")},
                     [](const std::string& message) { return message; });

    RegisterFunction(registry, "word_count", "Count words, lines and characters in a text",
                     {Arg("text").Describe("Text to analyse")},
                     [](const std::string& text) {
                         std::istringstream words(text);
                         std::size_t word_total = 0;
                         std::string word;
                         while (words >> word) ++word_total;

                         std::size_t lines = text.empty() ? 0 : 1;
                         for (char c : text) {
                             if (c == '\n') ++lines;
                         }
                         return nlohmann::json{{"words", word_total},
                                               {"lines", lines},
                                               {"characters", text.size()}};
                     });

    RegisterFunction(registry, "transform_case", "Change the letter case of a text",
                     {Arg("text").Describe("Text to transform"),
                      Arg("mode").Describe("Target case").Default(CaseMode::Upper)},
                     [](const std::string& text, CaseMode mode) {
                         return TransformCase(text, mode);
                     });
}

// ---------------------------------------------------------------------------
// system
// ---------------------------------------------------------------------------

void RegisterSystemTools(ToolRegistry& registry) {
    RegisterFunction(registry, "server_time", "Current server time in ISO 8601",
                     {Arg("utc").Describe("UTC instead of local time").Default(true)},
                     [](bool utc) { return FormatTime(utc); });

    RegisterFunction(
        registry, "countdown",
        "Count down in steps, reporting progress and streaming each step",
        {Arg("steps").Describe("Number of steps").Default(3),
         Arg("delay_ms").Describe("Pause between steps in milliseconds").Default(100)},
        [](int steps, int delay_ms, ToolContext& context) -> std::future<std::string> {
            if (steps < 0 || steps > kMaxCountdownSteps) {
                throw std::invalid_argument("steps must be between 0 and " +
                                            std::to_string(kMaxCountdownSteps));
            }
            if (delay_ms < 0) throw std::invalid_argument("delay_ms must not be negative");

            return std::async(std::launch::async, [steps, delay_ms, &context] {
                for (int i = 1; i <= steps; ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                    context.ReportProgress(i, steps,
                                           "Step " + std::to_string(i) + " of " +
                                               std::to_string(steps));
                    context.SendChunk({{"step", i}, {"remaining", steps - i}});
                }
                return "Countdown finished after " + std::to_string(steps) + " steps";
            });
        });

    RegisterFunction(registry, "confirm_action",
                     "Ask the user to confirm an action before it is carried out",
                     {Arg("action").Describe("Action to confirm")},
                     [](const std::string& action, ToolContext& context) {
                         auto* elicitation = context.Elicitation();
                         if (!elicitation) {
                             return "Declined: no interactive client to confirm '" + action +
                                    "'";
                         }
                         bool confirmed = elicitation->Confirm(
                             "Confirm action", "Proceed with: " + action + "?", false);
                         return std::string(confirmed ? "Confirmed: " : "Declined: ") + action;
                     });
}

ToolCatalog MakeBuiltinCatalog() {
    ToolCatalog catalog;
    catalog.Add("math", "Arithmetic on numbers", RegisterMathTools);
    catalog.Add("text", "Text utilities", RegisterTextTools);
    catalog.Add("system", "Server clock, progress demo and confirmations", RegisterSystemTools);
    return catalog;
}

} // namespace berry_mcp
