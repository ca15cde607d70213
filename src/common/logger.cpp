#include "treewatch/common/logger.h"

#include <iostream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace treewatch {

LogLevel ParseLogLevel(absl::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "debug") {
        return LogLevel::DEBUG;
    }
    if (lowered == "warning" || lowered == "warn") {
        return LogLevel::WARNING;
    }
    if (lowered == "error") {
        return LogLevel::ERROR;
    }
    if (lowered == "none" || lowered == "off") {
        return LogLevel::NONE;
    }
    return LogLevel::INFO;
}

absl::string_view LogLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::NONE:
        return "NONE";
    }
    return "UNKNOWN";
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::NONE && level >= level_;
}

void Logger::SetSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::Log(LogLevel level, absl::string_view message) {
    if (level == LogLevel::NONE) {
        return;
    }
    const std::string line = absl::StrCat(
        absl::FormatTime("%Y-%m-%d %H:%M:%E3S", absl::Now(), absl::UTCTimeZone()),
        " [", LogLevelName(level), "] ", message, "\n");

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }
    std::ostream& out = sink_ != nullptr ? *sink_ : std::clog;
    out << line;
    out.flush();
}

}  // namespace treewatch
