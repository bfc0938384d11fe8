#pragma once

#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace plm_cfg {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Component tags used by the library. Sinks accept any string; these are
// the ones the loader, resolver and AsConnector client emit.
namespace log_component {
constexpr const char* kPlmXml      = "plmxml";       // document parsing, product graph
constexpr const char* kLookLib     = "looklib";      // LookLibrary groups and conflicts
constexpr const char* kPrTags      = "prtags";       // PR tag expression matching
constexpr const char* kResolver    = "resolver";
constexpr const char* kHttp        = "http";         // raw AsConnector traffic
constexpr const char* kAsConnector = "asconnector";  // typed AsConnector calls, retries
constexpr const char* kApply       = "apply";        // configuration apply workflow

// Width of the component column in color console output.
constexpr std::size_t kColumnWidth = 11;
} // namespace log_component

// Abstract log sink. Implementations decide where and how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines to a stream, optionally with ANSI colors:
//   12:00:00 INFO  [resolver   ] Resolved '+AB': 3 visible, 1 hidden
//   2024-01-01T12:00:00.000Z [INFO] [resolver] Resolved '+AB': ...  (plain)
// In color mode, Debug and Info messages of the traffic components (http,
// asconnector) are dimmed; errors are always red.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// Plain lines appended to a log file. Falls back to stderr if the file
// cannot be opened.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
};

// JSON lines: {"ts":"...","level":"...","component":"...","message":"..."}
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Replace the global logger. Until called, all messages are discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace plm_cfg
