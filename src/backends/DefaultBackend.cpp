#include "canvascore/backends/DefaultBackend.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <iostream>

namespace canvascore {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {
    if (const char* env = std::getenv("LOG_LEVEL")) {
        if (auto parsed = parseLogLevel(env)) {
            currentLevel_ = *parsed;
        }
    }
}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << getTimestamp() << "] ["
              << levelToColor(level) << logLevelName(level) << "\033[0m] "
              << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: return "";
    }
    return "";
}

std::string DefaultBackend::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

}  // namespace canvascore
