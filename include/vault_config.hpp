/**
 * @file vault_config.hpp
 * @brief Configuration management for the FolderVault archive engine.
 *
 * Defines the tunables of the backup and restore pipelines (chunk size, compression
 * level, progress cadence, password retry cap) and the logging helpers shared by
 * every component.
 *
 * @note Configuration is loaded from a JSON file. Every key is optional; missing keys
 * fall back to the defaults documented on each member.
 */

#ifndef VAULT_CONFIG_HPP
#define VAULT_CONFIG_HPP

#include <cstddef>
#include <string>
#include <json/json.h>

/**
 * @brief Configuration class for the archive engine.
 *
 * Either default-constructed or loaded from a JSON configuration file, then validated.
 */
class VaultConfig {
public:
    /**
     * @brief Constructs a configuration holding the built-in defaults.
     */
    VaultConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Loads settings from the specified file, applying defaults where needed.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, unparsable or holds invalid values.
     */
    explicit VaultConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @param configJson Parsed configuration object.
     * @throws std::runtime_error If a value is out of range.
     */
    static VaultConfig fromJson(const Json::Value& configJson);

    /**
     * @brief Logs a message to stdout and to the configured log file.
     *
     * @param message Message to log. Must never contain secret material.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and to the configured error log file.
     *
     * @param message Error message to log. Must never contain secret material.
     */
    void logError(const std::string& message) const;

    std::string logFile;                  ///< Log file path; empty means console only.
    std::string errorLogFile;             ///< Error log file path; empty means console only.
    std::size_t chunkSize = 64 * 1024;    ///< Streaming chunk size in bytes.
    int compressionLevel = 9;             ///< Deflate level, 0..9.
    int progressInterval = 10;            ///< Report progress every N completed entries.
    int maxPasswordAttempts = 3;          ///< Password retry cap for one restore operation.
    bool verifyChecksums = true;          ///< Read every entry once during restore pre-flight.
    std::string encryption = "aes256";    ///< libarchive zip encryption method.
    std::string tempSuffix = ".partial";  ///< Suffix of the in-progress archive file.
    bool quiet = false;                   ///< Suppress console echo of informational log lines.

private:
    void validate() const;
};

#endif // VAULT_CONFIG_HPP
