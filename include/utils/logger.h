#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <vector>

namespace curator {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getErrorCount();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    static void setAllowSensitiveLogging(bool allow);
    static bool isAllowSensitiveLogging();
    static std::string redactAddress(const std::string& address);

    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
};

#define CURATOR_LOG(level, category, msg) \
    do { if (curator::utils::Logger::getLevel() <= (level)) curator::utils::Logger::log((level), (category), (msg)); } while(0)

}
}
