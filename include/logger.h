#ifndef PROXFUSION_LOGGER_H
#define PROXFUSION_LOGGER_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>
#include "config.h"

/**
 * @brief Logger for ProxFusion
 *
 * Provides structured logging with multiple log levels, circular buffer storage,
 * and optional file persistence.
 *
 * Features:
 * - Multiple log levels (VERBOSE, DEBUG, INFO, WARN, ERROR)
 * - Circular buffer for recent logs
 * - Timestamp support (Clock::millis())
 * - Console output (stdout)
 * - Optional append-only file logging
 * - Memory efficient (fixed-size entries, no heap use per message)
 *
 * Not thread-safe. Like the rest of the library it is meant to be driven from
 * the confinement thread.
 */
class Logger {
public:
    /**
     * @brief Log entry structure
     */
    struct LogEntry {
        uint32_t sequenceNumber;   // Monotonic sequence since start
        uint32_t timestamp;        // Clock::millis() when logged
        uint8_t level;             // Log level
        char message[128];         // Log message
    };

    /**
     * @brief Log levels
     */
    enum LogLevel {
        LEVEL_VERBOSE = LOG_LEVEL_VERBOSE,
        LEVEL_DEBUG   = LOG_LEVEL_DEBUG,
        LEVEL_INFO    = LOG_LEVEL_INFO,
        LEVEL_WARN    = LOG_LEVEL_WARN,
        LEVEL_ERROR   = LOG_LEVEL_ERROR,
        LEVEL_NONE    = LOG_LEVEL_NONE
    };

    Logger();
    ~Logger();

    /**
     * @brief Initialize the logger
     *
     * @param level Minimum log level to record
     * @param serialEnabled Enable console output
     * @param filePath Log file to append to, nullptr disables file logging
     * @return true if initialization successful (file problems only disable
     *         file logging, they do not fail begin())
     */
    bool begin(LogLevel level = LEVEL_INFO, bool serialEnabled = true, const char* filePath = nullptr);

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    /**
     * @brief Enable/disable console logging
     */
    void setSerialEnabled(bool enabled);

    /**
     * @brief Enable/disable file logging
     *
     * @param enabled True to enable
     * @param filePath Path to append to (ignored when disabling)
     * @return true if the file could be opened (or logging was disabled)
     */
    bool setFileEnabled(bool enabled, const char* filePath = nullptr);

    bool isFileEnabled() const { return m_fileEnabled; }

    void verbose(const char* format, ...);
    void debug(const char* format, ...);
    void info(const char* format, ...);
    void warn(const char* format, ...);
    void error(const char* format, ...);

    /**
     * @brief Log a message at specified level
     *
     * @param level Log level
     * @param format Printf-style format string
     * @param ... Format arguments
     */
    void log(LogLevel level, const char* format, ...);

    /**
     * @brief Get number of log entries in buffer
     *
     * @return uint32_t Number of entries
     */
    uint32_t getEntryCount() const;

    /**
     * @brief Get log entry by index
     *
     * @param index Index (0 = oldest, count-1 = newest)
     * @param entry Output entry
     * @return true if entry exists
     */
    bool getEntry(uint32_t index, LogEntry& entry) const;

    /**
     * @brief Clear all log entries from buffer
     */
    void clear();

    /**
     * @brief Flush pending entries to the log file (if file logging enabled)
     *
     * @return true if flush successful
     */
    bool flush();

    /**
     * @brief Print all buffered log entries to the console
     */
    void printAll();

    static const char* getLevelName(LogLevel level);

private:
    LogLevel m_level;                       ///< Current log level
    bool m_serialEnabled;                   ///< Console output enabled
    bool m_fileEnabled;                     ///< File logging enabled
    bool m_initialized;                     ///< Initialization complete
    char m_filePath[LOG_FILE_PATH_MAX];     ///< Log file path

    // Circular buffer
    LogEntry m_buffer[LOG_BUFFER_SIZE];     ///< Log entry buffer
    uint32_t m_bufferHead;                  ///< Write index
    uint32_t m_bufferTail;                  ///< Read index (oldest)
    uint32_t m_totalEntries;                ///< Total entries ever logged
    uint32_t m_sequenceCounter;             ///< Next sequence number

    // File logging
    uint32_t m_lastFlushTime;               ///< Last flush time (millis)
    uint32_t m_pendingWrites;               ///< Entries pending flush

    void vlog(LogLevel level, const char* format, va_list args);
    void addEntry(LogLevel level, const char* message);
    void writeToSerial(const LogEntry& entry);
    void writeEntry(FILE* out, const LogEntry& entry);

    /**
     * @brief Format timestamp as HH:MM:SS.mmm
     */
    void formatTimestamp(uint32_t timestamp, char* buffer, size_t bufferSize);
};

// Global logger instance
extern Logger g_logger;

// Convenience macros
#define LOG_VERBOSE(...) g_logger.verbose(__VA_ARGS__)
#define LOG_DEBUG(...) g_logger.debug(__VA_ARGS__)
#define LOG_INFO(...)  g_logger.info(__VA_ARGS__)
#define LOG_WARN(...)  g_logger.warn(__VA_ARGS__)
#define LOG_ERROR(...) g_logger.error(__VA_ARGS__)

#endif // PROXFUSION_LOGGER_H
