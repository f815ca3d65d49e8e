#include <openapi_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace openapi_mcp {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiGrey = "\033[90m";

struct LevelStyle {
    const char* name;
    const char* color;
};

LevelStyle StyleFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"DEBUG", "\033[90m"};
        case LogLevel::Info:  return {"INFO", "\033[36m"};
        case LogLevel::Warn:  return {"WARN", "\033[33m"};
        case LogLevel::Error: return {"ERROR", "\033[1;31m"};
    }
    return {"?", ""};
}

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<NullSink>(),
                                                LogLevel::Error);
    return slot;
}

} // anonymous namespace

LogLevel LevelForFlags(bool verbose, bool debug) {
    if (debug) return LogLevel::Debug;
    if (verbose) return LogLevel::Info;
    return LogLevel::Warn;
}

ConsoleSink::ConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    const auto style = StyleFor(level);
    if (use_color_) {
        out_ << kAnsiGrey << Timestamp() << kAnsiReset << ' '
             << style.color << std::left << std::setw(5) << style.name << kAnsiReset << ' '
             << kAnsiGrey << component << ':' << kAnsiReset << ' ' << message << '\n';
    } else {
        out_ << Timestamp() << ' ' << std::left << std::setw(5) << style.name << ' '
             << component << ": " << message << '\n';
    }
    // The sink may be a log file; keep it current for tail -f.
    out_.flush();
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json record = {
        {"ts", Timestamp()},
        {"level", StyleFor(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Upstream bodies are not guaranteed UTF-8.
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    sink_->Write(level, component, message);
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace openapi_mcp
