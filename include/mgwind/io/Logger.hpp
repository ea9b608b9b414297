#pragma once

#include "mgwind/core/Types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace mgwind::io {

// Logger wrapper class
class Logger {
public:
    enum class Level {
        TRACE = SPDLOG_LEVEL_TRACE,
        DEBUG = SPDLOG_LEVEL_DEBUG,
        INFO = SPDLOG_LEVEL_INFO,
        WARN = SPDLOG_LEVEL_WARN,
        ERROR = SPDLOG_LEVEL_ERROR,
        CRITICAL = SPDLOG_LEVEL_CRITICAL,
        OFF = SPDLOG_LEVEL_OFF
    };

    // Get singleton instance
    static Logger* getInstance() {
        static Logger instance;
        return &instance;
    }

    // Rebuild the sinks. An empty `logFile` logs to the console only.
    void initialize(const std::string& logFile = "",
                    Level consoleLevel = Level::INFO,
                    Level fileLevel = Level::DEBUG);

    // Logging functions
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->critical(fmt, std::forward<Args>(args)...);
    }

    // Set console level
    void setLevel(Level level);

    // Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
    static Level parseLevel(const std::string& name);

    void flush() { logger_->flush(); }

    // Performance timer
    class Timer {
    public:
        explicit Timer(const std::string& name, Logger* logger = getInstance())
            : name_(name), logger_(logger), start_(std::chrono::steady_clock::now()) {
            logger_->debug("Timer '{}' started", name_);
        }

        ~Timer() {
            logger_->info("Timer '{}' elapsed: {:.3f} ms", name_, elapsed() * 1000.0);
        }

        // Seconds since construction
        double elapsed() const {
            auto now = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - start_);
            return duration.count() / 1.0e6;
        }

    private:
        std::string name_;
        Logger* logger_;
        std::chrono::steady_clock::time_point start_;
    };

    std::unique_ptr<Timer> createTimer(const std::string& name) {
        return std::make_unique<Timer>(name, this);
    }

    // Named values, one per line
    void logSummary(const std::string& title, const std::map<std::string, Real>& values) {
        info("{}:", title);
        for (const auto& entry : values) {
            info("  {:<16s}: {:.6e}", entry.first, entry.second);
        }
    }

private:
    std::shared_ptr<spdlog::logger> logger_;

    Logger() { initialize(); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

// Convenience macros
#define MGWIND_LOG_TRACE(...) mgwind::io::Logger::getInstance()->trace(__VA_ARGS__)
#define MGWIND_LOG_DEBUG(...) mgwind::io::Logger::getInstance()->debug(__VA_ARGS__)
#define MGWIND_LOG_INFO(...) mgwind::io::Logger::getInstance()->info(__VA_ARGS__)
#define MGWIND_LOG_WARN(...) mgwind::io::Logger::getInstance()->warn(__VA_ARGS__)

#define MGWIND_CONCAT_IMPL(a, b) a##b
#define MGWIND_CONCAT(a, b) MGWIND_CONCAT_IMPL(a, b)

// Scoped timer; several may share one scope
#define MGWIND_LOG_TIMER(name) \
    auto MGWIND_CONCAT(_timer_, __LINE__) = mgwind::io::Logger::getInstance()->createTimer(name)

} // namespace mgwind::io
