#include "../include/otm/shared/Logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace otm::shared {

namespace {
    std::string g_appName;
    std::mutex g_logMutex;
    std::atomic<int> g_minLevel{ static_cast<int>(LogLevel::Info) };

    std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        std::time_t tt = system_clock::to_time_t(now);
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &tt);
#else
        localtime_r(&tt, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    bool enabled(LogLevel level) {
        return static_cast<int>(level) >= g_minLevel.load(std::memory_order_relaxed);
    }

    void write(std::ostream& os, LogLevel level, const char* levelName,
               const std::string& category, const std::string& message) {
        if (!enabled(level)) {
            return;
        }
        std::scoped_lock lock(g_logMutex);
        os << '[' << timestamp() << "] [" << (g_appName.empty() ? "OTM" : g_appName) << "] ["
           << levelName << "] [" << category << "] " << message << '\n';
    }
}

void initLogger(const std::string& appName) {
    std::scoped_lock lock(g_logMutex);
    g_appName = appName;
}

void setLogLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_minLevel.load(std::memory_order_relaxed));
}

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

void logDebug(const std::string& category, const std::string& message) {
    write(std::cout, LogLevel::Debug, "DEBUG", category, message);
}

void logInfo(const std::string& category, const std::string& message) {
    write(std::cout, LogLevel::Info, "INFO", category, message);
}

void logWarn(const std::string& category, const std::string& message) {
    write(std::cout, LogLevel::Warn, "WARN", category, message);
}

void logError(const std::string& category, const std::string& message) {
    write(std::cerr, LogLevel::Error, "ERROR", category, message);
}

} // namespace otm::shared
