#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include <absl/strings/string_view.h>

namespace treewatch {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    NONE
};

// Accepts "debug", "info", "warning", "error" and "none" in any case.
// Unknown names fall back to INFO.
LogLevel ParseLogLevel(absl::string_view name);

absl::string_view LogLevelName(LogLevel level);

// Process-wide logger shared by the manager, its worker threads and the CLI.
// Each line carries a UTC timestamp and the level, and is written whole.
class Logger {
public:
    static Logger& Instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;
    bool IsEnabled(LogLevel level) const;

    // Redirects output; nullptr restores std::clog. The stream must outlive
    // its use by the logger.
    void SetSink(std::ostream* sink);

    void Log(LogLevel level, absl::string_view message);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    std::ostream* sink_ = nullptr;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(msg) treewatch::Logger::Instance().Log(treewatch::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) treewatch::Logger::Instance().Log(treewatch::LogLevel::INFO, msg)
#define LOG_WARNING(msg) treewatch::Logger::Instance().Log(treewatch::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) treewatch::Logger::Instance().Log(treewatch::LogLevel::ERROR, msg)

}  // namespace treewatch
