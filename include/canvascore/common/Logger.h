#pragma once

#include "canvascore/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace canvascore {

/**
 * @brief Process-wide logging facade
 *
 * All canvascore components log through the LOG_* macros below. The facade
 * lazily creates the default backend (spdlog when built with
 * CANVASCORE_USE_SPDLOG, DefaultBackend otherwise) unless the host injected
 * one with setBackend().
 *
 * Capture mode keeps a copy of every message in memory, which is how the
 * tests check that rejected mutations and failed writes are reported:
 * @code
 * canvascore::Logger::enableCapture(true);
 * controller.deleteNode(missing);
 * auto warnings = canvascore::Logger::getCapturedLogs("[warn]");
 * @endcode
 */
class Logger {
public:
    /// Replace the backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the default console backend if none is set
    static void initialize();

    /// Install the default backend, optionally also writing canvascore.log into logDir
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured lines, oldest first
     * @param pattern Substring filter (empty = all)
     * @param maxLines Keep only the newest maxLines matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string& message, const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace canvascore

#define LOG_TRACE(...) canvascore::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) canvascore::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  canvascore::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  canvascore::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) canvascore::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
