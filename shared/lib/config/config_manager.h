/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Runtime overrides (command-line flags, tests)
 * - Thread-safe singleton pattern
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Values set through set() take precedence over the process environment.
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
     * @brief Get integer configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or not an integer
     * @return Configuration value
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
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
     * @brief Drop an override (the environment becomes visible again)
     */
    void remove(const std::string& key);

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

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    // Generator
    static constexpr const char* MAX_ATTEMPTS = "IDFORGE_MAX_ATTEMPTS";
    static constexpr const char* MIN_BIRTH_YEAR = "IDFORGE_MIN_BIRTH_YEAR";
    static constexpr const char* MAX_BIRTH_YEAR = "IDFORGE_MAX_BIRTH_YEAR";
    static constexpr const char* BATCH_LIMIT = "IDFORGE_BATCH_LIMIT";
    static constexpr const char* THREADS = "IDFORGE_THREADS";
};

} // namespace common
