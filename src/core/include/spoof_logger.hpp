#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace spoof {

/**
 * @brief Logging levels for the capture engine
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Writes timestamped lines to the console and, optionally, to an
 * append-only file. Every line carries the component that emitted it
 * ("capture", "store", "server", ...) so fingerprint events can be
 * grepped out of a busy honeypot log.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool isEnabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_ && level_ != LogLevel::NONE;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_enabled_ = false;
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void log(LogLevel level, const char* component, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_ || level_ == LogLevel::NONE) return;

        std::string formatted = formatMessage(level, component, msg);

        if (console_enabled_) {
            if (level >= LogLevel::WARN) {
                std::cerr << formatted << std::endl;
            } else {
                std::cout << formatted << std::endl;
            }
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << '\n';
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatMessage(LogLevel level, const char* component,
                                     const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] "
            << '(' << (component ? component : "spoof") << ") " << msg;
        return oss.str();
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Convenience macros. `component` is a string literal naming the emitter.
#define SPOOF_LOG_TRACE(component, msg) spoof::Logger::instance().log(spoof::LogLevel::TRACE, component, msg)
#define SPOOF_LOG_DEBUG(component, msg) spoof::Logger::instance().log(spoof::LogLevel::DEBUG, component, msg)
#define SPOOF_LOG_INFO(component, msg)  spoof::Logger::instance().log(spoof::LogLevel::INFO,  component, msg)
#define SPOOF_LOG_WARN(component, msg)  spoof::Logger::instance().log(spoof::LogLevel::WARN,  component, msg)
#define SPOOF_LOG_ERROR(component, msg) spoof::Logger::instance().log(spoof::LogLevel::ERROR, component, msg)
#define SPOOF_LOG_FATAL(component, msg) spoof::Logger::instance().log(spoof::LogLevel::FATAL, component, msg)

} // namespace spoof
