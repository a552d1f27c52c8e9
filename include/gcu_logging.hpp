/*
 * ============================================================================
 * GCU LOGGING
 * ============================================================================
 *
 * Minimal leveled logger shared by every worker and the scheduler.
 *
 *   - ILogger        : contract (one virtual, level helpers on top)
 *   - StreamLogger   : timestamped lines to any std::ostream, thread-safe
 *   - TeeLogger      : fan-out to several loggers (console + error log)
 *   - NullLogger     : discards everything
 *
 * Line format:
 *   2026-10-19 12:00:00 WARNING [bms] BMS not connected: read failed
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_LOGGING_HPP
#define GCU_LOGGING_HPP

#include <ctime>
#include <exception>
#include <mutex>
#include <ostream>
#include <string>
#include <typeinfo>
#include <vector>

namespace gcu {

enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/* ================= LOGGER CONTRACT ================= */

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(LogLevel level, const std::string& source, const std::string& message) = 0;

    void debug(const std::string& source, const std::string& message) {
        log(LogLevel::DEBUG, source, message);
    }
    void info(const std::string& source, const std::string& message) {
        log(LogLevel::INFO, source, message);
    }
    void warning(const std::string& source, const std::string& message) {
        log(LogLevel::WARNING, source, message);
    }
    void error(const std::string& source, const std::string& message) {
        log(LogLevel::ERROR, source, message);
    }
    void critical(const std::string& source, const std::string& message) {
        log(LogLevel::CRITICAL, source, message);
    }
};

/* ================= NULL LOGGER ================= */

class NullLogger final : public ILogger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
};

/* ================= STREAM LOGGER ================= */

class StreamLogger final : public ILogger {
public:
    explicit StreamLogger(std::ostream& out, LogLevel min_level = LogLevel::DEBUG)
        : out_(out), min_level_(min_level) {}

    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (static_cast<int>(level) < static_cast<int>(min_level_)) return;

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << timestamp() << " " << to_string(level)
             << " [" << source << "] " << message << "\n";
        out_.flush();
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    // Local wall-clock time, second resolution
    static std::string timestamp() {
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
        return buf;
    }

private:
    std::ostream& out_;
    LogLevel min_level_;
    std::mutex mutex_;
};

/* ================= TEE LOGGER ================= */

class TeeLogger final : public ILogger {
public:
    TeeLogger() = default;

    void add(ILogger& sink) { sinks_.push_back(&sink); }

    void log(LogLevel level, const std::string& source, const std::string& message) override {
        for (ILogger* sink : sinks_) {
            sink->log(level, source, message);
        }
    }

private:
    std::vector<ILogger*> sinks_;
};

// Record an exception with its dynamic type name
inline void log_exception(ILogger& logger, const std::string& source, const std::exception& e) {
    logger.error(source, std::string(typeid(e).name()) + " raised: " + e.what());
}

} // namespace gcu

#endif // GCU_LOGGING_HPP
