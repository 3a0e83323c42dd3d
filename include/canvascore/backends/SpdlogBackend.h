#pragma once

#include "canvascore/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace canvascore {

/**
 * @brief spdlog-based backend (default when CANVASCORE_USE_SPDLOG is defined)
 *
 * Console sink always; a truncating file sink `<logDir>/canvascore.log` when
 * file logging is requested. LOG_LEVEL or SPDLOG_LEVEL override the initial
 * debug level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace canvascore
