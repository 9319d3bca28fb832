/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and process-wide settings.
 * Features:
 * - Environment variable access with defaults
 * - Runtime overrides via set()
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace dependabot::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    // Singleton instance
    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    // Delete copy and move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     * @param key Environment variable name
     * @param defaultValue Default if not found
     * @return Environment variable value
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Temp files (owned by the temp-file allocator)
    static constexpr const char* TMP_DIR_PATH = "DEPENDABOT_TMP_DIR_PATH";
    static constexpr const char* TMP_FILE_PREFIX = "DEPENDABOT_TMP_FILE_PREFIX";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    /// @name Defaults
    static constexpr const char* DEFAULT_TMP_DIR_PATH = "/tmp";
    static constexpr const char* DEFAULT_TMP_FILE_PREFIX = "dependabot_";
};

} // namespace dependabot::common
