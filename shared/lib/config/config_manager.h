/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables with defaults.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Runtime overrides (command line flags)
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace common {

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

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

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
     * @brief Get integer configuration value
     *
     * Unparsable values fall back to the default with a warning.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

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

    // Output
    static constexpr const char* OUTPUT_DIR = "PESEL_OUTPUT_DIR";
    static constexpr const char* PROGRESS = "PESEL_PROGRESS";

    // Batch
    static constexpr const char* BATCH_START_YEAR = "PESEL_BATCH_START_YEAR";
    static constexpr const char* BATCH_END_YEAR = "PESEL_BATCH_END_YEAR";
    static constexpr const char* BATCH_JOBS = "PESEL_BATCH_JOBS";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    /// @name Defaults
    static constexpr const char* DEFAULT_OUTPUT_DIR = "generated_pesels";
    static constexpr int DEFAULT_BATCH_START_YEAR = 1950;
    static constexpr int DEFAULT_BATCH_END_YEAR = 2030;
};

} // namespace common
