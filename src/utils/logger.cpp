#include "utils/logger.h"
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <cstdlib>

namespace zackathon {
namespace utils {

namespace {

std::atomic<LogLevel> currentLevel{LogLevel::INFO};
std::atomic<bool> consoleEnabled{true};
std::atomic<bool> allowSensitive{false};

// The optional log file and its rotation policy.
struct FileSink {
    std::mutex mtx;
    std::ofstream out;
    std::string path;
    LogFileOptions options;

    void rotateLocked() {
        out.close();
        std::error_code ec;
        uint32_t keep = options.maxFiles > 0 ? options.maxFiles - 1 : 0;
        if (keep == 0) {
            std::filesystem::remove(path, ec);
        } else {
            std::filesystem::remove(path + "." + std::to_string(keep), ec);
            for (uint32_t i = keep; i-- > 1; ) {
                std::filesystem::rename(path + "." + std::to_string(i),
                                        path + "." + std::to_string(i + 1), ec);
            }
            std::filesystem::rename(path, path + ".1", ec);
        }
        out.open(path, std::ios::app);
    }

    void write(const std::string& line) {
        if (!out.is_open()) return;
        out << line;
        out.flush();
        if (options.maxBytes > 0 && static_cast<uint64_t>(out.tellp()) > options.maxBytes) rotateLocked();
    }
};

FileSink& sink() {
    static FileSink instance;
    return instance;
}

const char* levelTag(LogLevel level) {
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

std::string formatLine(LogLevel level, const std::string& category, const std::string& msg) {
    time_t now = std::time(nullptr);
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::string line = std::string(timeBuf) + " [" + levelTag(level) + "]";
    if (!category.empty()) line += " [" + category + "]";
    return line + " " + msg + "\n";
}

void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;
    std::string line = formatLine(level, category, msg);

    FileSink& file = sink();
    std::lock_guard<std::mutex> lock(file.mtx);
    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) std::cerr << line;
        else std::cout << line;
    }
    file.write(line);
}

}

bool Logger::init(const std::string& path, const LogFileOptions& options) {
    FileSink& file = sink();
    std::lock_guard<std::mutex> lock(file.mtx);
    if (file.out.is_open()) file.out.close();

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    file.path = path;
    file.options = options;
    file.out.open(path, std::ios::app);

    const char* env = std::getenv("ZACKATHON_ALLOW_SENSITIVE_LOGS");
    if (env && (std::string(env) == "1" || std::string(env) == "true")) allowSensitive = true;
    return file.out.is_open();
}

void Logger::shutdown() {
    FileSink& file = sink();
    std::lock_guard<std::mutex> lock(file.mtx);
    if (file.out.is_open()) file.out.close();
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

bool Logger::setLevel(const std::string& name) {
    if (name == "trace") setLevel(LogLevel::TRACE);
    else if (name == "debug") setLevel(LogLevel::DEBUG);
    else if (name == "info") setLevel(LogLevel::INFO);
    else if (name == "warn") setLevel(LogLevel::WARN);
    else if (name == "error") setLevel(LogLevel::ERROR);
    else if (name == "off") setLevel(LogLevel::OFF);
    else return false;
    return true;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::trace(const std::string& msg) { writeLog(LogLevel::TRACE, "", msg); }
void Logger::debug(const std::string& msg) { writeLog(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { writeLog(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { writeLog(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { writeLog(LogLevel::ERROR, "", msg); }
void Logger::fatal(const std::string& msg) { writeLog(LogLevel::FATAL, "", msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

std::string Logger::redactAddress(const std::string& address) {
    if (allowSensitive) return address;
    if (address.length() > 12) {
        return address.substr(0, 6) + "..." + address.substr(address.length() - 4);
    }
    return "[REDACTED_ADDR]";
}

}
}
