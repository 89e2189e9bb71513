#pragma once

#include <string>
#include <cstdint>

namespace zackathon {
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

struct LogFileOptions {
    uint64_t maxBytes = 10 * 1024 * 1024;
    // Rotated copies kept beside the live file: path.1 .. path.(maxFiles - 1).
    uint32_t maxFiles = 5;
};

class Logger {
public:
    // Opens (appending) the log file and creates its directory.
    static bool init(const std::string& path, const LogFileOptions& options = LogFileOptions());
    static void shutdown();
    static void setLevel(LogLevel level);
    static bool setLevel(const std::string& name);
    static LogLevel getLevel();
    static void enableConsole(bool enable);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& category, const std::string& msg);

    // Also switched on by ZACKATHON_ALLOW_SENSITIVE_LOGS=1 at init.
    static void setAllowSensitiveLogging(bool allow);

    // Account identities are shortened to 0x1234...abcd unless sensitive logging is on.
    static std::string redactAddress(const std::string& address);
};

#define LOG_TRACE(msg) zackathon::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (zackathon::utils::Logger::getLevel() <= zackathon::utils::LogLevel::DEBUG) zackathon::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) zackathon::utils::Logger::info(msg)
#define LOG_WARN(msg) zackathon::utils::Logger::warn(msg)
#define LOG_ERROR(msg) zackathon::utils::Logger::error(msg)
#define LOG_FATAL(msg) zackathon::utils::Logger::fatal(msg)

}
}
