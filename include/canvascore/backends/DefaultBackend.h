#pragma once

#include "canvascore/common/ILoggerBackend.h"
#include <mutex>

namespace canvascore {

/**
 * @brief Dependency-free stdout backend
 *
 * Used when the library is built without spdlog. Lines look like
 * `[12:04:31.207] [warn] GraphStore::apply() - ...` with ANSI colored levels.
 * Honors LOG_LEVEL at construction.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    const char* levelToColor(LogLevel level);
    std::string getTimestamp();
};

}  // namespace canvascore
