#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <sstream>
#include <filesystem>
#include <deque>
#include <algorithm>
#include <cctype>

namespace curator {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;
static std::atomic<uint64_t> errorCount{0};
static std::function<void(const LogEntry&)> logCallback;
static std::deque<LogEntry> recentLogs;
static const size_t maxRecentLogs = 1000;
static std::atomic<bool> allowSensitive{false};

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static std::string sanitize(const std::string& in) {
    std::string s = in;
    const std::vector<std::string> keys = {"password", "secret", "token", "api_key"};
    for (const auto& k : keys) {
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t i = pos + k.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == ':' || s[i] == '=')) i++;
            size_t end = i;
            while (end < s.size() && s[end] != '"' && s[end] != ' ' && s[end] != ',' && s[end] != '\n') end++;
            if (i < end) {
                s.replace(i, end - i, "[REDACTED]");
                pos = i + 10;
            } else pos += k.size();
        }
    }
    return s;
}

static void rotateLocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    std::filesystem::remove(logPath + "." + std::to_string(maxFiles), ec);
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        if (std::filesystem::exists(oldPath, ec)) {
            std::filesystem::rename(oldPath, logPath + "." + std::to_string(i + 1), ec);
        }
    }
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::string outMsg = allowSensitive ? msg : sanitize(msg);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << outMsg << "\n";
    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) std::cerr << line;
        else std::cout << line;
    }

    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }

    if (level >= LogLevel::ERROR) errorCount++;

    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();

    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }

    if (logCallback) {
        logCallback(entry);
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    logFile.open(path, std::ios::app);
    const char* env = std::getenv("SEEDCURATOR_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFiles = std::max<uint32_t>(count, 1);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, "", msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCallback = callback;
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    errorCount = 0;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

bool Logger::isAllowSensitiveLogging() {
    return allowSensitive;
}

std::string Logger::redactAddress(const std::string& address) {
    if (allowSensitive) return address;
    if (address.length() > 10) {
        return address.substr(0, 6) + "..." + address.substr(address.length() - 4);
    }
    return address;
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "trace") return LogLevel::TRACE;
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    if (v == "fatal") return LogLevel::FATAL;
    if (v == "off") return LogLevel::OFF;
    return fallback;
}

}
}
