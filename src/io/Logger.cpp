// === src/io/Logger.cpp ===
#include "mgwind/io/Logger.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace mgwind::io {

void Logger::initialize(const std::string& logFile, Level consoleLevel, Level fileLevel) {
    // Console sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(consoleLevel));
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    // File sink
    if (!logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        file_sink->set_level(static_cast<spdlog::level::level_enum>(fileLevel));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    if (logger_) {
        spdlog::drop(logger_->name());
    }
    logger_ = std::make_shared<spdlog::logger>("mgwind", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::trace);
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
}

void Logger::setLevel(Level level) {
    // The first sink is always the console
    logger_->sinks().front()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::parseLevel(const std::string& name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "critical") return Level::CRITICAL;
    if (name == "off") return Level::OFF;
    throw ConfigurationError("Unknown log level: " + name);
}

} // namespace mgwind::io
