#ifndef LOCKSTAKE_UTIL_LOGGER_HPP
#define LOCKSTAKE_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Thread-safe levelled logger shared by every LockStake component.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::warn("[StakeLedger] rejected ...");
 *   - logger::setLogLevel(logger::parseLogLevel("debug"));
 *   - logger::enableFileOutput("lockstake.log");
 */

namespace lockstake {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Upper-case name printed in each log line.
 */
inline const char *logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

/**
 * @brief Parse a level name as written in a config file (case-insensitive).
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "info")     return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Process-wide logger:
 *  - one mutex around level, sinks and writes
 *  - stdout always, a file optionally
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Mirror every line into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise truncates.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Silence stdout (tests keep the file sink, if any).
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << logLevelName(level) << "] " << msg << '\n';

        if (consoleEnabled_) {
            std::cout << line.str();
            std::cout.flush();
        }

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace lockstake

#endif // LOCKSTAKE_UTIL_LOGGER_HPP
