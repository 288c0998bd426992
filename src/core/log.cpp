#include <berry_mcp/core/log.hpp>
#include <berry_mcp/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace berry_mcp {

namespace {

struct LevelStyle {
    const char* name;
    const char* tag;   // fixed width, for aligned colour output
    const char* color;
};

LevelStyle StyleOf(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"DEBUG", "DEBUG", ansi::kDim};
        case LogLevel::Info:  return {"INFO", "INFO ", ansi::kCyan};
        case LogLevel::Warn:  return {"WARN", "WARN ", ansi::kYellow};
        case LogLevel::Error: return {"ERROR", "ERROR", ansi::kRed};
    }
    return {"UNKNOWN", "     ", ""};
}

std::tm Calendar(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

// 2024-11-05T10:15:30.123Z
std::string UtcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const auto calendar = Calendar(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&calendar, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

// 10:15:30, local time
std::string LocalClock() {
    const auto calendar = Calendar(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), false);
    std::ostringstream oss;
    oss << std::put_time(&calendar, "%H:%M:%S");
    return oss.str();
}

// Messages often quote client input; a newline in it must not fake a record.
std::string SingleLine(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (byte < 0x20 && c != '\t') {
            char escaped[8];
            std::snprintf(escaped, sizeof(escaped), "\\x%02x", byte);
            out += escaped;
        } else {
            out += c;
        }
    }
    return out;
}

std::string PlainLine(LogLevel level, std::string_view component, std::string_view message) {
    return UtcTimestamp() + " [" + StyleOf(level).name + "] [" + std::string(component) +
           "] " + SingleLine(message) + "\n";
}

std::string JsonLine(LogLevel level, std::string_view component, std::string_view message) {
    nlohmann::json record = {
        {"ts", UtcTimestamp()},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (unsigned char c : text) upper += static_cast<char>(std::toupper(c));

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    std::cerr << PlainLine(level, component, message);
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        out_ << PlainLine(level, component, message);
        return;
    }

    // 10:15:30 INFO  [sse] message; errors are red throughout.
    const auto style = StyleOf(level);
    std::string line;
    line += std::string(ansi::kDim) + LocalClock() + ansi::kReset + " ";
    line += std::string(style.color) + style.tag + ansi::kReset + " ";
    line += std::string(ansi::kDim) + "[" + std::string(component) + "]" + ansi::kReset + " ";
    if (level == LogLevel::Error) {
        line += std::string(style.color) + SingleLine(message) + ansi::kReset;
    } else {
        line += SingleLine(message);
    }
    out_ << line << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    out_ << JsonLine(level, component, message);
}

FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::app), json_(json) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    file_ << (json_ ? JsonLine(level, component, message)
                    : PlainLine(level, component, message));
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetSink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::SetLevel(LogLevel level) {
    min_level_.store(level);
}

LogLevel Logger::Level() const {
    return min_level_.load();
}

bool Logger::IsEnabled(LogLevel level) const {
    return level >= min_level_.load();
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (!IsEnabled(level)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------

Logger& GlobalLogger() {
    static Logger instance(std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    auto& logger = GlobalLogger();
    logger.SetSink(std::move(sink));
    logger.SetLevel(min_level);
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace berry_mcp
