/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard console/file configuration.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace dependabot::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize logger
     * @param name Logger name shown in every line
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    );

    /**
     * @brief Initialize logger from LOG_LEVEL / LOG_TO_FILE / LOG_FILE
     */
    static void initializeFromConfig(const std::string& name);

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level);

    /**
     * @brief Parse level name, unknown names map to info
     */
    static spdlog::level::level_enum parseLevel(const std::string& level);

    /**
     * @brief Flush all loggers
     */
    static void flush();
};

} // namespace dependabot::common
