#include <plm_cfg/core/log.hpp>
#include <plm_cfg/core/ansi.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace plm_cfg {

namespace {

struct LevelStyle {
    const char* name;  // as written to files and JSON
    const char* tag;   // fixed width for the console column
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

bool IsTrafficComponent(std::string_view component) {
    return component == log_component::kHttp ||
           component == log_component::kAsConnector;
}

std::tm ToTm(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

// "2024-01-01T12:00:00.000Z" for files and JSON, "12:00:00" local for the
// console.
std::string Timestamp(bool iso) {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    if (!iso) {
        const auto local = ToTm(secs, false);
        oss << std::put_time(&local, "%H:%M:%S");
        return oss.str();
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto utc = ToTm(secs, true);
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string FormatPlainLine(LogLevel level, std::string_view component,
                            std::string_view message) {
    std::string line = Timestamp(true);
    line += " [";
    line += StyleOf(level).name;
    line += "] [";
    line += component;
    line += "] ";
    line += message;
    line += '\n';
    return line;
}

void AppendJsonString(std::string& out, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += kHex[(c >> 4) & 0x0f];
                    out += kHex[c & 0x0f];
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        out_ << FormatPlainLine(level, component, message);
        return;
    }

    const auto style = StyleOf(level);
    std::string padded(component);
    if (padded.size() < log_component::kColumnWidth) {
        padded.resize(log_component::kColumnWidth, ' ');
    }

    const char* message_color = "";
    if (level == LogLevel::Error) {
        message_color = style.color;
    } else if (level != LogLevel::Warn && IsTrafficComponent(component)) {
        message_color = ansi::kDim;
    }

    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << style.color << style.tag << ansi::kReset << ' '
         << ansi::kDim << '[' << padded << ']' << ansi::kReset << ' ';
    if (*message_color != '\0') {
        out_ << message_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path) : file_(path, std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const auto line = FormatPlainLine(level, component, message);
    if (!file_.is_open()) {
        std::cerr << line;
        return;
    }
    file_ << line;
    file_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    std::string line = "{\"ts\":\"" + Timestamp(true) + "\",\"level\":\"" +
                       StyleOf(level).name + "\",\"component\":";
    AppendJsonString(line, component);
    line += ",\"message\":";
    AppendJsonString(line, message);
    line += "}\n";
    out_ << line;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
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
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

// Library code logs unconditionally; embedders that never install a sink
// get silence.
class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<DiscardSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
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

} // namespace plm_cfg
