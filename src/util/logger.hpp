#ifndef REWARDLEDGER_UTIL_LOGGER_HPP
#define REWARDLEDGER_UTIL_LOGGER_HPP

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
 * @brief Thread-safe process-wide logger for the reward ledger.
 *
 * Usage:
 *   - logger::info("[Component] message");
 *   - logger::setLogLevel(logger::parseLogLevel("DEBUG"));
 *   - logger::enableFileOutput("reward_ledger.log", true);
 *
 * Settlement paths log at INFO, rejected operations at WARN and the
 * emergency withdrawal at CRITICAL, so an operator can tail the file
 * output for anything that bypassed normal bookkeeping.
 */

namespace rewardledger {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

inline const char* logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name from configuration ("debug", "WARN", ...).
 * @throw std::invalid_argument for an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")                      return LogLevel::DEBUG;
    if (upper == "INFO")                       return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR")                      return LogLevel::ERROR;
    if (upper == "CRITICAL")                   return LogLevel::CRITICAL;
    throw std::invalid_argument("logger::parseLogLevel: unknown level '" + name + "'");
}

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
     * @brief Mirror every line into a file as well as the console.
     * @param filename Log file path.
     * @param append Keep existing content when true.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
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

    /// Silence console output, e.g. under test runners. File output is unaffected.
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

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

        if (consoleOutput_) {
            // WARN and above go to stderr; stdout carries CLI responses
            std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
            out << line.str();
            out.flush();
        }

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , consoleOutput_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleOutput_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().log(LogLevel::DEBUG, msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().log(LogLevel::INFO, msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().log(LogLevel::WARN, msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().log(LogLevel::ERROR, msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().log(LogLevel::CRITICAL, msg);
}

} // namespace logger
} // namespace util
} // namespace rewardledger

#endif // REWARDLEDGER_UTIL_LOGGER_HPP
