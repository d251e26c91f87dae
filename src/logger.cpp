#include "logger.h"
#include "clock.h"
#include <string.h>

// Global logger instance
Logger g_logger;

Logger::Logger()
    : m_level((LogLevel)LOG_LEVEL)
    , m_serialEnabled(true)
    , m_fileEnabled(false)
    , m_initialized(false)
    , m_bufferHead(0)
    , m_bufferTail(0)
    , m_totalEntries(0)
    , m_sequenceCounter(0)
    , m_lastFlushTime(0)
    , m_pendingWrites(0)
{
    memset(m_filePath, 0, sizeof(m_filePath));
    memset(m_buffer, 0, sizeof(m_buffer));
}

Logger::~Logger() {
    if (m_fileEnabled && m_pendingWrites > 0) {
        flush();
    }
}

bool Logger::begin(LogLevel level, bool serialEnabled, const char* filePath) {
    if (m_initialized) {
        return true;
    }

    m_level = level;
    m_serialEnabled = serialEnabled;

    if (filePath && filePath[0] != '\0') {
        if (!setFileEnabled(true, filePath) && m_serialEnabled) {
            printf("[Logger] WARNING: Cannot open %s, file logging disabled\n", filePath);
        }
    }

    m_initialized = true;

    if (m_serialEnabled) {
        printf("[Logger] Level: %s, Serial: %s, File: %s\n",
               getLevelName(m_level),
               m_serialEnabled ? "ON" : "OFF",
               m_fileEnabled ? m_filePath : "OFF");
    }

    return true;
}

void Logger::setLevel(LogLevel level) {
    m_level = level;
}

Logger::LogLevel Logger::getLevel() const {
    return m_level;
}

void Logger::setSerialEnabled(bool enabled) {
    m_serialEnabled = enabled;
}

bool Logger::setFileEnabled(bool enabled, const char* filePath) {
    if (!enabled) {
        if (m_fileEnabled && m_pendingWrites > 0) {
            flush();
        }
        m_fileEnabled = false;
        return true;
    }

    if (filePath && filePath[0] != '\0') {
        strncpy(m_filePath, filePath, sizeof(m_filePath) - 1);
        m_filePath[sizeof(m_filePath) - 1] = '\0';
    }
    if (m_filePath[0] == '\0') {
        return false;
    }

    // Probe that the file is writable before committing
    FILE* file = fopen(m_filePath, "a");
    if (!file) {
        m_fileEnabled = false;
        return false;
    }
    fclose(file);

    m_fileEnabled = true;
    m_pendingWrites = 0;
    m_lastFlushTime = Clock::millis();
    return true;
}

void Logger::verbose(const char* format, ...) {
    if (m_level > LEVEL_VERBOSE) return;

    va_list args;
    va_start(args, format);
    vlog(LEVEL_VERBOSE, format, args);
    va_end(args);
}

void Logger::debug(const char* format, ...) {
    if (m_level > LEVEL_DEBUG) return;

    va_list args;
    va_start(args, format);
    vlog(LEVEL_DEBUG, format, args);
    va_end(args);
}

void Logger::info(const char* format, ...) {
    if (m_level > LEVEL_INFO) return;

    va_list args;
    va_start(args, format);
    vlog(LEVEL_INFO, format, args);
    va_end(args);
}

void Logger::warn(const char* format, ...) {
    if (m_level > LEVEL_WARN) return;

    va_list args;
    va_start(args, format);
    vlog(LEVEL_WARN, format, args);
    va_end(args);
}

void Logger::error(const char* format, ...) {
    if (m_level > LEVEL_ERROR) return;

    va_list args;
    va_start(args, format);
    vlog(LEVEL_ERROR, format, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* format, ...) {
    if (m_level > level) return;

    va_list args;
    va_start(args, format);
    vlog(level, format, args);
    va_end(args);
}

void Logger::vlog(LogLevel level, const char* format, va_list args) {
    char buffer[128];
    vsnprintf(buffer, sizeof(buffer), format, args);
    addEntry(level, buffer);
}

uint32_t Logger::getEntryCount() const {
    if (m_totalEntries < LOG_BUFFER_SIZE) {
        return m_totalEntries;
    }
    return LOG_BUFFER_SIZE;
}

bool Logger::getEntry(uint32_t index, LogEntry& entry) const {
    uint32_t count = getEntryCount();
    if (index >= count) {
        return false;
    }

    uint32_t bufferIndex = (m_bufferTail + index) % LOG_BUFFER_SIZE;
    entry = m_buffer[bufferIndex];
    return true;
}

void Logger::clear() {
    m_bufferHead = 0;
    m_bufferTail = 0;
    m_totalEntries = 0;
    m_pendingWrites = 0;
    memset(m_buffer, 0, sizeof(m_buffer));
}

bool Logger::flush() {
    if (!m_fileEnabled || m_pendingWrites == 0) {
        return true;
    }

    FILE* file = fopen(m_filePath, "a");
    if (!file) {
        return false;
    }

    // Pending entries that already rotated out of the ring are lost
    uint32_t count = getEntryCount();
    for (uint32_t i = count > m_pendingWrites ? count - m_pendingWrites : 0; i < count; i++) {
        LogEntry entry;
        if (getEntry(i, entry)) {
            writeEntry(file, entry);
        }
    }

    bool ok = ferror(file) == 0;
    fclose(file);
    m_pendingWrites = 0;
    m_lastFlushTime = Clock::millis();

    return ok;
}

void Logger::printAll() {
    if (!m_serialEnabled) {
        return;
    }

    printf("\n========================================\n");
    printf("Log Buffer\n");
    printf("========================================\n");

    uint32_t count = getEntryCount();
    if (count == 0) {
        printf("(empty)\n");
    } else {
        for (uint32_t i = 0; i < count; i++) {
            LogEntry entry;
            if (getEntry(i, entry)) {
                writeEntry(stdout, entry);
            }
        }
    }

    printf("========================================\n\n");
}

const char* Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LEVEL_VERBOSE: return "VERBOSE";
        case LEVEL_DEBUG: return "DEBUG";
        case LEVEL_INFO:  return "INFO ";
        case LEVEL_WARN:  return "WARN ";
        case LEVEL_ERROR: return "ERROR";
        case LEVEL_NONE:  return "NONE ";
        default:          return "?????";
    }
}

void Logger::addEntry(LogLevel level, const char* message) {
    LogEntry entry;
    entry.sequenceNumber = m_sequenceCounter++;
    entry.timestamp = Clock::millis();
    entry.level = level;
    strncpy(entry.message, message, sizeof(entry.message) - 1);
    entry.message[sizeof(entry.message) - 1] = '\0';

    // Add to circular buffer
    m_buffer[m_bufferHead] = entry;
    m_bufferHead = (m_bufferHead + 1) % LOG_BUFFER_SIZE;

    // If buffer is full, advance tail
    if (m_totalEntries >= LOG_BUFFER_SIZE) {
        m_bufferTail = (m_bufferTail + 1) % LOG_BUFFER_SIZE;
    }

    m_totalEntries++;

    if (m_serialEnabled) {
        writeToSerial(entry);
    }

    if (!m_fileEnabled) {
        return;
    }

    m_pendingWrites++;

    if (m_pendingWrites >= LOG_FLUSH_PENDING ||
        entry.timestamp - m_lastFlushTime >= LOG_FLUSH_INTERVAL) {
        flush();
    }
}

void Logger::writeToSerial(const LogEntry& entry) {
    writeEntry(stdout, entry);
    fflush(stdout);
}

void Logger::writeEntry(FILE* out, const LogEntry& entry) {
    char timestamp[16];
    formatTimestamp(entry.timestamp, timestamp, sizeof(timestamp));

    fprintf(out, "[%s] [%s] %s\n",
            timestamp,
            getLevelName((LogLevel)entry.level),
            entry.message);
}

void Logger::formatTimestamp(uint32_t timestamp, char* buffer, size_t bufferSize) {
    uint32_t seconds = timestamp / 1000;
    uint32_t minutes = seconds / 60;
    uint32_t hours = minutes / 60;

    seconds %= 60;
    minutes %= 60;
    hours %= 24;

    snprintf(buffer, bufferSize, "%02u:%02u:%02u.%03u",
             hours, minutes, seconds, timestamp % 1000);
}
