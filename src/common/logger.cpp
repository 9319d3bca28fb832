/**
 * @file logger.cpp
 * @brief spdlog configuration
 */

#include "dependabot/common/logger.h"
#include "dependabot/common/config_manager.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <vector>

namespace dependabot::common {

void Logger::initialize(
    const std::string& name,
    const std::string& logLevel,
    bool logToFile,
    const std::string& logFile
) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(consoleSink);

        // File sink (if enabled)
        if (logToFile && !logFile.empty()) {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
            );
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(fileSink);
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(logLevel));

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::info("Logger initialized: name={}, level={}, file={}",
                     name, logLevel, logToFile ? logFile : "none");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::initializeFromConfig(const std::string& name) {
    const auto& config = ConfigManager::getInstance();
    initialize(name,
               config.getString(ConfigManager::LOG_LEVEL, "info"),
               config.getBool(ConfigManager::LOG_TO_FILE, false),
               config.getString(ConfigManager::LOG_FILE));
}

void Logger::setLevel(const std::string& level) {
    spdlog::set_level(parseLevel(level));
    spdlog::info("Log level changed to: {}", level);
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "info") {
        return spdlog::level::info;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "critical") {
        return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void Logger::flush() {
    spdlog::default_logger()->flush();
}

} // namespace dependabot::common
