#pragma once

#include "core/types/ScanConfig.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace devsweep::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the default sweep parameters and the export and logging
 * preferences. Command-line options are applied on top of these values.
 */
struct AppConfig {
    // Sweep defaults
    core::ScanConfig scan; ///< Range, ports, workers, timeout, services and options.

    // Export settings
    std::string exportDirectory{"."}; ///< Directory receiving exported results.
    bool exportJson{true};            ///< Write a JSON report after the sweep.
    bool exportCsv{true};             ///< Write a CSV report after the sweep.
    bool exportAll{false};            ///< Export closed and failed targets too.

    // Logging
    std::string logLevel{"info"}; ///< Console log level name.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of application configuration from a JSON file.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with the defaults.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the rotating log file.
     * @return Path to devsweep.log.
     */
    std::filesystem::path logPath() const;

    /**
     * @brief Returns the configuration directory path as a string.
     * @return Configuration directory path.
     */
    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Serializes a configuration.
     * @param config Configuration to serialize.
     * @return JSON document with scan, services, options, export and logging sections.
     */
    static nlohmann::json toJson(const AppConfig& config);

    /**
     * @brief Reads a configuration, keeping defaults for absent keys.
     * @param j JSON document as produced by toJson().
     * @return The resulting configuration.
     */
    static AppConfig fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace devsweep::infra
