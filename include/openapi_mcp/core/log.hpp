#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string_view>

namespace openapi_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Map the --verbose/--debug switches onto a minimum level.
/// Neither set means warnings and errors only.
LogLevel LevelForFlags(bool verbose, bool debug);

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// "<timestamp> LEVEL component: message", one line per record. stdout
// carries the MCP stream, so the default target is stderr.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: ts, level, component, message.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Warn);

    void SetLevel(LogLevel level);

    /// Lets callers skip building expensive messages (request dumps).
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// Installed once by main(). Until then records are discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace openapi_mcp
