#include "proximity_sensor.h"
#include "logger.h"
#include <algorithm>
#include <stdio.h>
#include <string.h>

ProximitySensor::ProximitySensor(ThresholdSensor& primary,
                                 ThresholdSensor& secondary,
                                 DelayableExecutor& delayableExecutor,
                                 Execution& execution)
    : m_primary(primary)
    , m_secondary(secondary)
    , m_delayableExecutor(delayableExecutor)
    , m_execution(execution)
    , m_primaryEventListener(*this)
    , m_secondaryEventListener(*this)
    , m_paused(false)
    , m_registered(false)
    , m_secondarySafe(false)
    , m_initializedListeners(false)
    , m_hasLastPrimaryEvent(false)
    , m_hasLastEvent(false)
    , m_cancelSecondaryHandle(DelayableExecutor::INVALID_HANDLE)
    , m_secondaryPingIntervalMs(SECONDARY_PING_INTERVAL_MS)
    , m_alerting(false)
{
    memset(m_tag, 0, sizeof(m_tag));
}

ProximitySensor::~ProximitySensor() {
    cancelSecondaryRearm();

    // The children outlive us; do not leave them holding our listeners
    if (m_initializedListeners) {
        m_primary.unregisterListener(&m_primaryEventListener);
        m_secondary.unregisterListener(&m_secondaryEventListener);
    }
}

void ProximitySensor::setTag(const char* tag) {
    m_execution.assertIsMainThread();
    strncpy(m_tag, tag ? tag : "", sizeof(m_tag) - 1);
    m_tag[sizeof(m_tag) - 1] = '\0';

    char childTag[SENSOR_TAG_MAX_LEN + 16];
    snprintf(childTag, sizeof(childTag), "%s:%s", m_tag, getSensorRoleName(SENSOR_ROLE_PRIMARY));
    m_primary.setTag(childTag);
    snprintf(childTag, sizeof(childTag), "%s:%s", m_tag, getSensorRoleName(SENSOR_ROLE_SECONDARY));
    m_secondary.setTag(childTag);
}

void ProximitySensor::setDelay(uint32_t delayMs) {
    m_execution.assertIsMainThread();
    m_primary.setDelay(delayMs);
    m_secondary.setDelay(delayMs);
}

void ProximitySensor::pause() {
    m_execution.assertIsMainThread();
    m_paused = true;
    unregisterInternal();
}

void ProximitySensor::resume() {
    m_execution.assertIsMainThread();
    m_paused = false;
    registerInternal();
}

void ProximitySensor::setSecondarySafe(bool safe) {
    m_execution.assertIsMainThread();
    m_secondarySafe = safe;
    LOG_DEBUG("ProxSensor[%s]: Secondary safe %s", m_tag, safe ? "on" : "off");

    if (!m_secondarySafe) {
        m_secondary.pause();
    } else {
        m_secondary.resume();
    }
}

void ProximitySensor::setSecondaryPingIntervalMs(uint32_t intervalMs) {
    m_execution.assertIsMainThread();
    m_secondaryPingIntervalMs = intervalMs;
}

bool ProximitySensor::isLoaded() const {
    return m_primary.isLoaded();
}

void ProximitySensor::registerListener(Listener* listener) {
    m_execution.assertIsMainThread();
    if (!isLoaded() || listener == nullptr) {
        return;
    }

    if (std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end()) {
        LOG_DEBUG("ProxSensor[%s]: Listener registered multiple times", m_tag);
    } else {
        m_listeners.push_back(listener);
    }
    registerInternal();
}

void ProximitySensor::registerInternal() {
    m_execution.assertIsMainThread();
    if (m_registered || m_paused || m_listeners.empty()) {
        return;
    }

    if (!m_initializedListeners) {
        m_primary.registerListener(&m_primaryEventListener);
        if (!m_secondarySafe) {
            m_secondary.pause();
        }
        m_secondary.registerListener(&m_secondaryEventListener);
        m_initializedListeners = true;
    }

    LOG_DEBUG("ProxSensor[%s]: Registering sensor listener", m_tag);
    m_primary.resume();
    m_registered = true;
}

void ProximitySensor::unregisterListener(Listener* listener) {
    m_execution.assertIsMainThread();
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                      m_listeners.end());
    if (m_listeners.empty()) {
        unregisterInternal();
    }
}

void ProximitySensor::unregisterInternal() {
    m_execution.assertIsMainThread();
    if (!m_registered) {
        return;
    }

    LOG_DEBUG("ProxSensor[%s]: Unregistering sensor listener", m_tag);
    m_primary.pause();
    m_secondary.pause();
    cancelSecondaryRearm();

    // Forget what we know
    m_hasLastPrimaryEvent = false;
    m_hasLastEvent = false;
    m_registered = false;
}

ProximityState ProximitySensor::isNear() const {
    if (!isLoaded() || !m_hasLastEvent) {
        return PROXIMITY_UNKNOWN;
    }
    return proximityStateFromBelow(m_lastEvent.getBelow());
}

void ProximitySensor::alertListeners() {
    m_execution.assertIsMainThread();
    if (m_alerting.exchange(true)) {
        return;
    }

    if (m_hasLastEvent) {
        // Listeners can clear m_lastEvent or mutate m_listeners
        ThresholdSensorEvent lastEvent = m_lastEvent;
        std::vector<Listener*> listeners(m_listeners);
        for (Listener* listener : listeners) {
            listener->onThresholdCrossed(lastEvent);
        }
    }

    m_alerting.store(false);
}

bool ProximitySensor::formatStatus(char* buffer, size_t bufferSize) const {
    int written = snprintf(buffer, bufferSize,
                           "{registered=%s, paused=%s, near=%s, primaryLoaded=%s, "
                           "secondaryLoaded=%s, secondarySafe=%s, rearmPending=%s, listeners=%u}",
                           m_registered ? "true" : "false",
                           m_paused ? "true" : "false",
                           getProximityStateName(isNear()),
                           m_primary.isLoaded() ? "true" : "false",
                           m_secondary.isLoaded() ? "true" : "false",
                           m_secondarySafe ? "true" : "false",
                           isSecondaryRearmPending() ? "true" : "false",
                           (unsigned)m_listeners.size());
    return written >= 0 && (size_t)written < bufferSize;
}

// =========================================================================
// Sensor Callbacks
// =========================================================================

void ProximitySensor::onPrimarySensorEvent(const ThresholdSensorEvent& event) {
    m_execution.assertIsMainThread();
    if (m_hasLastPrimaryEvent && event.getBelow() == m_lastPrimaryEvent.getBelow()) {
        return;
    }

    m_lastPrimaryEvent = event;
    m_hasLastPrimaryEvent = true;

    if (m_secondarySafe && m_secondary.isLoaded()) {
        LOG_DEBUG("ProxSensor[%s]: Primary sensor reported %s. Checking secondary.",
                  m_tag, event.getBelow() ? "near" : "far");
        if (!isSecondaryRearmPending()) {
            m_secondary.resume();
        }
        return;
    }

    if (!m_secondary.isLoaded()) {
        LOG_DEBUG("ProxSensor[%s]: Primary sensor event: %s. No secondary.",
                  m_tag, event.getBelow() ? "near" : "far");
        onSensorEvent(event);
    } else if (event.getBelow()) {
        // Covered? Check secondary.
        LOG_DEBUG("ProxSensor[%s]: Primary sensor event: near. Checking secondary.", m_tag);
        cancelSecondaryRearm();
        m_secondary.resume();
    } else {
        // Uncovered. Report immediately.
        onSensorEvent(event);
    }
}

void ProximitySensor::onSecondarySensorEvent(const ThresholdSensorEvent& event) {
    m_execution.assertIsMainThread();

    // Without a "near" from both sensors, and unless the secondary may stay
    // on, the secondary goes back to sleep
    bool primaryNear = m_hasLastPrimaryEvent && m_lastPrimaryEvent.getBelow();
    if (!m_secondarySafe && (!primaryNear || !event.getBelow())) {
        m_secondary.pause();
        if (!primaryNear) {
            // Only check the secondary as long as the primary thinks we're near
            cancelSecondaryRearm();
            return;
        }
        // Primary near, secondary far: look again in a moment
        scheduleSecondaryRearm();
    }

    LOG_DEBUG("ProxSensor[%s]: Secondary sensor event: %s.",
              m_tag, event.getBelow() ? "near" : "far");

    if (!m_paused && m_registered) {
        onSensorEvent(event);
    }
}

void ProximitySensor::onSensorEvent(const ThresholdSensorEvent& event) {
    m_execution.assertIsMainThread();
    if (m_hasLastEvent && event.getBelow() == m_lastEvent.getBelow()) {
        return;
    }

    if (!m_secondarySafe && !event.getBelow()) {
        m_secondary.pause();
    }

    m_lastEvent = event;
    m_hasLastEvent = true;
    LOG_INFO("ProxSensor[%s]: Proximity %s", m_tag, event.getBelow() ? "near" : "far");
    alertListeners();
}

// =========================================================================
// Secondary Re-arm
// =========================================================================

void ProximitySensor::scheduleSecondaryRearm() {
    cancelSecondaryRearm();

    m_cancelSecondaryHandle = m_delayableExecutor.executeDelayed([this]() {
        m_cancelSecondaryHandle = DelayableExecutor::INVALID_HANDLE;
        LOG_DEBUG("ProxSensor[%s]: Re-checking secondary", m_tag);
        m_secondary.resume();
    }, m_secondaryPingIntervalMs);

    if (m_cancelSecondaryHandle == DelayableExecutor::INVALID_HANDLE) {
        LOG_WARN("ProxSensor[%s]: Could not schedule secondary re-check", m_tag);
    }
}

void ProximitySensor::cancelSecondaryRearm() {
    if (m_cancelSecondaryHandle == DelayableExecutor::INVALID_HANDLE) {
        return;
    }

    m_delayableExecutor.cancel(m_cancelSecondaryHandle);
    m_cancelSecondaryHandle = DelayableExecutor::INVALID_HANDLE;
}
