#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace canvascore {

/// Severity of a log message, ordered from most to least verbose
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Short lowercase name ("trace", "warn", ...)
const char* logLevelName(LogLevel level);

/// Parse a level name as accepted in config files and LOG_LEVEL.
/// Accepts "warning" and "err" as aliases. Case-insensitive.
std::optional<LogLevel> parseLogLevel(std::string_view text);

/**
 * @brief Sink for formatted log messages
 *
 * The canvas core never talks to a logging framework directly; it goes
 * through Logger, which forwards to one ILoggerBackend. Hosts embedding the
 * core in an application with its own logging install a backend of their own:
 *
 * @code
 * class HostLog : public canvascore::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setThreshold(static_cast<int>(level)); }
 *     void flush() override { host_->flush(); }
 * };
 *
 * canvascore::Logger::setBackend(std::make_unique<HostLog>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// Emit an already formatted message
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /// Drop messages below this level
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace canvascore
