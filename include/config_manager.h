#ifndef PROXFUSION_CONFIG_MANAGER_H
#define PROXFUSION_CONFIG_MANAGER_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"

/**
 * @brief Configuration Manager for ProxFusion
 *
 * Manages runtime configuration stored on disk as JSON.
 * Provides validation, defaults, and save/load functionality.
 *
 * Features:
 * - JSON serialization/deserialization
 * - Default values for all settings (missing keys keep their default)
 * - Validation of all parameters
 * - Factory reset capability
 */
class ConfigManager {
public:
    /**
     * @brief Threshold sensor slot configuration
     */
    struct SensorSlotConfig {
        bool enabled;                 // false = sensor absent (not loaded)
        float threshold;              // Reading below this is "near"
        float thresholdLatch;         // Reading must reach this to report "far"
        uint32_t samplingDelayMs;     // Sampling period while resumed
    };

    /**
     * @brief Fusion behaviour
     */
    struct FusionConfig {
        bool secondarySafe;                   // Keep secondary on while active
        uint32_t secondaryPingIntervalMs;     // Re-arm delay after rejected "near"
        char tag[SENSOR_TAG_MAX_LEN];         // Log tag
    };

    /**
     * @brief Runtime configuration structure
     */
    struct Config {
        FusionConfig fusion;

        // One-shot check
        uint32_t checkTimeoutMs;           // ms

        // Sensors
        SensorSlotConfig primary;
        SensorSlotConfig secondary;

        // Logging
        uint8_t logLevel;                  // LOG_LEVEL_VERBOSE..LOG_LEVEL_NONE
        bool serialLoggingEnabled;         // Console output
        bool fileLoggingEnabled;           // Append to logFilePath
        char logFilePath[LOG_FILE_PATH_MAX];
    };

    ConfigManager();
    ~ConfigManager();

    /**
     * @brief Load configuration from a JSON file
     *
     * On failure the current configuration is left at defaults and
     * getLastError() describes the problem.
     *
     * @param path File to read
     * @return true if config loaded and validated
     */
    bool load(const char* path);

    /**
     * @brief Save current configuration as JSON
     *
     * @param path File to (over)write
     * @return true if config saved successfully
     */
    bool save(const char* path);

    /**
     * @brief Reset configuration to factory defaults
     */
    void reset();

    /**
     * @brief Validate current configuration
     *
     * Checks all values are within acceptable ranges.
     *
     * @return true if configuration is valid
     */
    bool validate();

    const Config& getConfig() const;

    /**
     * @brief Set configuration
     *
     * @param config New configuration (will be validated)
     * @return true if config is valid and was set; defaults are restored
     *         otherwise
     */
    bool setConfig(const Config& config);

    /**
     * @brief Get configuration as JSON string
     *
     * @param buffer Output buffer
     * @param bufferSize Size of buffer
     * @return true if JSON generated successfully
     */
    bool toJSON(char* buffer, size_t bufferSize);

    /**
     * @brief Load configuration from JSON string
     *
     * Keys that are absent keep their default value.
     *
     * @param json JSON string
     * @return true if JSON parsed and the result is valid
     */
    bool fromJSON(const char* json);

    /**
     * @brief Log the current configuration at INFO level
     */
    void print();

    const char* getLastError() const;

private:
    Config m_config;                       ///< Current configuration
    char m_lastError[128];                 ///< Last error message

    void loadDefaults();
    bool validateParameters();
    bool validateSensorSlot(const SensorSlotConfig& slot, const char* name);
    void setError(const char* error);
};

#endif // PROXFUSION_CONFIG_MANAGER_H
