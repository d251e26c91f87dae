#ifndef PROXFUSION_CONFIG_H
#define PROXFUSION_CONFIG_H

// ============================================================================
// ProxFusion Configuration File
// ============================================================================
// Compile-time constants for the dual-sensor proximity fusion library.
// Runtime-tunable values live in ConfigManager; the constants below are the
// defaults it falls back to.
// ============================================================================

// ============================================================================
// System Constants
// ============================================================================

#define PROXFUSION_VERSION      "0.3.0"
#define PROXFUSION_NAME         "ProxFusion"

// ============================================================================
// Fusion Timing (milliseconds)
// ============================================================================

// How long the secondary sensor stays dormant after a conflicting reading
// (primary near, secondary far) before it is resumed for another look.
#define SECONDARY_PING_INTERVAL_MS      5000

#define SECONDARY_PING_INTERVAL_MIN_MS  100
#define SECONDARY_PING_INTERVAL_MAX_MS  60000

// One-shot proximity check
#define PROX_CHECK_TIMEOUT_MS           500
#define PROX_CHECK_TIMEOUT_MAX_MS       60000

// ============================================================================
// Threshold Sensor Defaults
// ============================================================================

#define SENSOR_DEFAULT_SAMPLING_MS      200     // Sampling period when resumed
#define SENSOR_SAMPLING_MIN_MS          10
#define SENSOR_SAMPLING_MAX_MS          10000

#define SENSOR_DEFAULT_THRESHOLD        5.0f    // cm, typical phone prox "near"
#define SENSOR_DEFAULT_THRESHOLD_LATCH  5.0f    // cm, release level (no hysteresis)

#define SENSOR_TAG_MAX_LEN              48

// ============================================================================
// Scheduler
// ============================================================================

#define TIMER_POOL_SIZE                 16

// ============================================================================
// Logging Configuration
// ============================================================================

// Log Levels (must match Logger::LogLevel enum)
#define LOG_LEVEL_VERBOSE  0
#define LOG_LEVEL_DEBUG    1
#define LOG_LEVEL_INFO     2
#define LOG_LEVEL_WARN     3
#define LOG_LEVEL_ERROR    4
#define LOG_LEVEL_NONE     5

// Override with -DLOG_LEVEL=LOG_LEVEL_DEBUG for fusion tracing
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// Circular Buffer Size (number of log entries)
#define LOG_BUFFER_SIZE    256

// Log File Configuration
#define LOG_FILE_PATH_MAX   128
#define LOG_FLUSH_PENDING   10         // Flush after this many pending entries
#define LOG_FLUSH_INTERVAL  60000      // Flush to file every 60 seconds

// ============================================================================
// Configuration File
// ============================================================================

#define CONFIG_FILE_MAX_SIZE    4096
#define CONFIG_JSON_CAPACITY    2048

#endif // PROXFUSION_CONFIG_H
