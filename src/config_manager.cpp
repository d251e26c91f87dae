#include "config_manager.h"
#include "logger.h"
#include <ArduinoJson.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static void copyString(char* dest, const char* src, size_t destSize) {
    strncpy(dest, src ? src : "", destSize - 1);
    dest[destSize - 1] = '\0';
}

ConfigManager::ConfigManager() {
    memset(m_lastError, 0, sizeof(m_lastError));
    loadDefaults();
}

ConfigManager::~ConfigManager() {
}

bool ConfigManager::load(const char* path) {
    if (path == nullptr || path[0] == '\0') {
        setError("No config file path");
        return false;
    }

    FILE* file = fopen(path, "rb");
    if (!file) {
        setError("Failed to open config file");
        LOG_ERROR("ConfigManager: Cannot open %s", path);
        return false;
    }

    // Read file into buffer
    long size = -1;
    if (fseek(file, 0, SEEK_END) == 0) {
        size = ftell(file);
    }
    if (size <= 0 || size > CONFIG_FILE_MAX_SIZE || fseek(file, 0, SEEK_SET) != 0) {
        setError("Invalid config file size");
        fclose(file);
        return false;
    }

    char* buffer = (char*)malloc((size_t)size + 1);
    if (!buffer) {
        setError("Out of memory");
        fclose(file);
        return false;
    }

    size_t bytesRead = fread(buffer, 1, (size_t)size, file);
    buffer[bytesRead] = '\0';
    fclose(file);

    if (bytesRead != (size_t)size) {
        setError("Failed to read config file");
        free(buffer);
        return false;
    }

    // Parse JSON
    bool result = fromJSON(buffer);
    free(buffer);

    if (result) {
        LOG_INFO("ConfigManager: Loaded %s", path);
    } else {
        LOG_ERROR("ConfigManager: Failed to load %s: %s", path, m_lastError);
    }

    return result;
}

bool ConfigManager::save(const char* path) {
    if (path == nullptr || path[0] == '\0') {
        setError("No config file path");
        return false;
    }

    char buffer[CONFIG_JSON_CAPACITY];
    if (!toJSON(buffer, sizeof(buffer))) {
        LOG_ERROR("ConfigManager: Config save FAILED: %s", m_lastError);
        return false;
    }

    FILE* file = fopen(path, "w");
    if (!file) {
        setError("Failed to open config file for writing");
        LOG_ERROR("ConfigManager: Cannot open %s for writing", path);
        return false;
    }

    size_t length = strlen(buffer);
    size_t written = fwrite(buffer, 1, length, file);
    bool closed = fclose(file) == 0;

    if (written != length || !closed) {
        setError("Failed to write config to file");
        LOG_ERROR("ConfigManager: Config save FAILED: short write to %s", path);
        return false;
    }

    LOG_INFO("ConfigManager: Config saved to %s (%u bytes)", path, (unsigned)written);
    return true;
}

void ConfigManager::reset() {
    LOG_INFO("ConfigManager: Resetting to factory defaults");
    loadDefaults();
}

bool ConfigManager::validate() {
    if (!validateParameters()) {
        LOG_WARN("ConfigManager: Invalid configuration: %s", m_lastError);
        return false;
    }

    LOG_DEBUG("ConfigManager: Configuration validated");
    return true;
}

const ConfigManager::Config& ConfigManager::getConfig() const {
    return m_config;
}

bool ConfigManager::setConfig(const Config& config) {
    m_config = config;

    if (!validate()) {
        // Restore defaults on invalid config
        loadDefaults();
        return false;
    }

    return true;
}

bool ConfigManager::toJSON(char* buffer, size_t bufferSize) {
    DynamicJsonDocument doc(CONFIG_JSON_CAPACITY);

    // Fusion
    JsonObject fusion = doc.createNestedObject("fusion");
    fusion["secondarySafe"] = m_config.fusion.secondarySafe;
    fusion["secondaryPingIntervalMs"] = m_config.fusion.secondaryPingIntervalMs;
    fusion["tag"] = (const char*)m_config.fusion.tag;

    // One-shot check
    JsonObject check = doc.createNestedObject("check");
    check["timeoutMs"] = m_config.checkTimeoutMs;

    // Sensors
    const SensorSlotConfig* slots[2] = { &m_config.primary, &m_config.secondary };
    const char* slotNames[2] = { "primary", "secondary" };
    for (int i = 0; i < 2; i++) {
        JsonObject sensorObj = doc.createNestedObject(slotNames[i]);
        sensorObj["enabled"] = slots[i]->enabled;
        sensorObj["threshold"] = slots[i]->threshold;
        sensorObj["thresholdLatch"] = slots[i]->thresholdLatch;
        sensorObj["samplingDelayMs"] = slots[i]->samplingDelayMs;
    }

    // Logging
    JsonObject logging = doc.createNestedObject("logging");
    logging["level"] = m_config.logLevel;
    logging["serialEnabled"] = m_config.serialLoggingEnabled;
    logging["fileEnabled"] = m_config.fileLoggingEnabled;
    logging["filePath"] = (const char*)m_config.logFilePath;

    if (doc.overflowed()) {
        setError("JSON document capacity exceeded");
        return false;
    }

    // serializeJson() truncates silently, so measure first
    if (measureJson(doc) >= bufferSize) {
        setError("JSON buffer too small");
        return false;
    }

    size_t size = serializeJson(doc, buffer, bufferSize);

    if (size == 0) {
        setError("JSON buffer too small");
        return false;
    }

    return true;
}

bool ConfigManager::fromJSON(const char* json) {
    if (json == nullptr) {
        setError("No JSON input");
        return false;
    }

    LOG_DEBUG("ConfigManager: Loading config from JSON (%u bytes)", (unsigned)strlen(json));

    DynamicJsonDocument doc(CONFIG_JSON_CAPACITY);
    DeserializationError error = deserializeJson(doc, json);

    if (error) {
        setError(error.c_str());
        LOG_ERROR("ConfigManager: JSON parse error: %s", error.c_str());
        return false;
    }

    if (!doc.is<JsonObject>()) {
        setError("Config root is not an object");
        return false;
    }

    // Start from defaults so missing keys fall back
    loadDefaults();

    // Fusion
    if (doc.containsKey("fusion")) {
        m_config.fusion.secondarySafe = doc["fusion"]["secondarySafe"] | false;
        m_config.fusion.secondaryPingIntervalMs =
            doc["fusion"]["secondaryPingIntervalMs"] | (uint32_t)SECONDARY_PING_INTERVAL_MS;
        copyString(m_config.fusion.tag, doc["fusion"]["tag"] | "proximity", sizeof(m_config.fusion.tag));
    }

    // One-shot check
    if (doc.containsKey("check")) {
        m_config.checkTimeoutMs = doc["check"]["timeoutMs"] | (uint32_t)PROX_CHECK_TIMEOUT_MS;
    }

    // Sensors
    SensorSlotConfig* slots[2] = { &m_config.primary, &m_config.secondary };
    const char* slotNames[2] = { "primary", "secondary" };
    for (int i = 0; i < 2; i++) {
        if (!doc.containsKey(slotNames[i])) {
            continue;
        }
        JsonObject sensorObj = doc[slotNames[i]];
        slots[i]->enabled = sensorObj["enabled"] | true;
        slots[i]->threshold = sensorObj["threshold"] | SENSOR_DEFAULT_THRESHOLD;
        // Latch defaults to the threshold (no hysteresis band)
        slots[i]->thresholdLatch = sensorObj["thresholdLatch"] | slots[i]->threshold;
        slots[i]->samplingDelayMs = sensorObj["samplingDelayMs"] | (uint32_t)SENSOR_DEFAULT_SAMPLING_MS;
    }

    // Logging
    if (doc.containsKey("logging")) {
        m_config.logLevel = doc["logging"]["level"] | LOG_LEVEL_INFO;
        m_config.serialLoggingEnabled = doc["logging"]["serialEnabled"] | true;
        m_config.fileLoggingEnabled = doc["logging"]["fileEnabled"] | false;
        copyString(m_config.logFilePath, doc["logging"]["filePath"] | "", sizeof(m_config.logFilePath));
    }

    if (!validate()) {
        // Keep the error message, drop the bad values
        loadDefaults();
        return false;
    }

    return true;
}

void ConfigManager::print() {
    LOG_INFO("=== Configuration ===");
    LOG_INFO("Fusion: tag=%s, secondarySafe=%s, pingInterval=%ums",
             m_config.fusion.tag,
             m_config.fusion.secondarySafe ? "yes" : "no",
             m_config.fusion.secondaryPingIntervalMs);
    LOG_INFO("Check: timeout=%ums", m_config.checkTimeoutMs);
    LOG_INFO("Primary: enabled=%s, threshold=%.2f, latch=%.2f, delay=%ums",
             m_config.primary.enabled ? "yes" : "no",
             m_config.primary.threshold, m_config.primary.thresholdLatch,
             m_config.primary.samplingDelayMs);
    LOG_INFO("Secondary: enabled=%s, threshold=%.2f, latch=%.2f, delay=%ums",
             m_config.secondary.enabled ? "yes" : "no",
             m_config.secondary.threshold, m_config.secondary.thresholdLatch,
             m_config.secondary.samplingDelayMs);
    LOG_INFO("Logging: level=%u, serial=%s, file=%s%s%s",
             m_config.logLevel,
             m_config.serialLoggingEnabled ? "enabled" : "disabled",
             m_config.fileLoggingEnabled ? "enabled" : "disabled",
             m_config.fileLoggingEnabled ? " -> " : "",
             m_config.fileLoggingEnabled ? m_config.logFilePath : "");
}

const char* ConfigManager::getLastError() const {
    return m_lastError;
}

void ConfigManager::loadDefaults() {
    memset(&m_config, 0, sizeof(Config));

    // Fusion
    m_config.fusion.secondarySafe = false;
    m_config.fusion.secondaryPingIntervalMs = SECONDARY_PING_INTERVAL_MS;
    copyString(m_config.fusion.tag, "proximity", sizeof(m_config.fusion.tag));

    m_config.checkTimeoutMs = PROX_CHECK_TIMEOUT_MS;

    // Sensors
    m_config.primary.enabled = true;
    m_config.primary.threshold = SENSOR_DEFAULT_THRESHOLD;
    m_config.primary.thresholdLatch = SENSOR_DEFAULT_THRESHOLD_LATCH;
    m_config.primary.samplingDelayMs = SENSOR_DEFAULT_SAMPLING_MS;
    m_config.secondary = m_config.primary;

    // Logging
    m_config.logLevel = LOG_LEVEL_INFO;
    m_config.serialLoggingEnabled = true;
    m_config.fileLoggingEnabled = false;
    m_config.logFilePath[0] = '\0';
}

bool ConfigManager::validateSensorSlot(const SensorSlotConfig& slot, const char* name) {
    char message[96];

    if (!slot.enabled) {
        return true;  // Absent sensor, values unused
    }

    if (slot.threshold > slot.thresholdLatch) {
        snprintf(message, sizeof(message), "Invalid %s threshold (must be <= thresholdLatch)", name);
        setError(message);
        return false;
    }

    if (slot.samplingDelayMs < SENSOR_SAMPLING_MIN_MS || slot.samplingDelayMs > SENSOR_SAMPLING_MAX_MS) {
        snprintf(message, sizeof(message), "Invalid %s sampling delay (%u-%ums)",
                 name, (unsigned)SENSOR_SAMPLING_MIN_MS, (unsigned)SENSOR_SAMPLING_MAX_MS);
        setError(message);
        return false;
    }

    return true;
}

bool ConfigManager::validateParameters() {
    // Fusion
    if (m_config.fusion.secondaryPingIntervalMs < SECONDARY_PING_INTERVAL_MIN_MS ||
        m_config.fusion.secondaryPingIntervalMs > SECONDARY_PING_INTERVAL_MAX_MS) {
        setError("Invalid secondary ping interval (100-60000ms)");
        return false;
    }

    // One-shot check
    if (m_config.checkTimeoutMs < 1 || m_config.checkTimeoutMs > PROX_CHECK_TIMEOUT_MAX_MS) {
        setError("Invalid check timeout (1-60000ms)");
        return false;
    }

    // Sensors
    if (!m_config.primary.enabled) {
        // Allowed (fusion reports not loaded), but worth knowing
        LOG_WARN("ConfigManager: Primary sensor disabled");
    }

    if (!validateSensorSlot(m_config.primary, "primary") ||
        !validateSensorSlot(m_config.secondary, "secondary")) {
        return false;
    }

    // Log level (0=VERBOSE to 5=NONE)
    if (m_config.logLevel > LOG_LEVEL_NONE) {
        setError("Invalid log level");
        return false;
    }

    if (m_config.fileLoggingEnabled && m_config.logFilePath[0] == '\0') {
        setError("File logging enabled without a file path");
        return false;
    }

    return true;
}

void ConfigManager::setError(const char* error) {
    copyString(m_lastError, error, sizeof(m_lastError));
}
