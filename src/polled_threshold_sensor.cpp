#include "polled_threshold_sensor.h"
#include "clock.h"
#include "logger.h"
#include <algorithm>
#include <string.h>

PolledThresholdSensor::PolledThresholdSensor(ThresholdSource* source, Execution& execution, bool mock_mode)
    : m_source(source)
    , m_execution(execution)
    , m_mockMode(mock_mode)
    , m_threshold(SENSOR_DEFAULT_THRESHOLD)
    , m_thresholdLatch(SENSOR_DEFAULT_THRESHOLD_LATCH)
    , m_delayMs(SENSOR_DEFAULT_SAMPLING_MS)
    , m_paused(false)
    , m_sampling(false)
    , m_hasLastBelow(false)
    , m_lastBelow(false)
    , m_lastSampleTime(0)
    , m_hasSampled(false)
    , m_hasMockReading(false)
    , m_mockReading(0.0f)
    , m_eventCount(0)
    , m_lastEventTime(0)
{
    memset(m_tag, 0, sizeof(m_tag));
}

PolledThresholdSensor::~PolledThresholdSensor() {
    // Listeners are not owned
}

bool PolledThresholdSensor::setThreshold(float threshold, float thresholdLatch) {
    m_execution.assertIsMainThread();
    if (threshold > thresholdLatch) {
        LOG_ERROR("ThresholdSensor[%s]: threshold %.2f above latch %.2f, ignored",
                  m_tag, threshold, thresholdLatch);
        return false;
    }

    m_threshold = threshold;
    m_thresholdLatch = thresholdLatch;
    LOG_DEBUG("ThresholdSensor[%s]: threshold=%.2f latch=%.2f", m_tag, threshold, thresholdLatch);
    return true;
}

bool PolledThresholdSensor::isLoaded() const {
    if (m_mockMode) {
        return true;
    }
    return m_source != nullptr && m_source->available();
}

void PolledThresholdSensor::setTag(const char* tag) {
    m_execution.assertIsMainThread();
    strncpy(m_tag, tag ? tag : "", sizeof(m_tag) - 1);
    m_tag[sizeof(m_tag) - 1] = '\0';
}

void PolledThresholdSensor::setDelay(uint32_t delayMs) {
    m_execution.assertIsMainThread();
    if (delayMs < SENSOR_SAMPLING_MIN_MS) {
        delayMs = SENSOR_SAMPLING_MIN_MS;
    }
    m_delayMs = delayMs;
}

void PolledThresholdSensor::registerListener(Listener* listener) {
    m_execution.assertIsMainThread();
    if (!isLoaded() || listener == nullptr) {
        return;
    }

    if (std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end()) {
        LOG_WARN("ThresholdSensor[%s]: Listener registered multiple times", m_tag);
        return;
    }

    m_listeners.push_back(listener);
    startSampling();
}

void PolledThresholdSensor::unregisterListener(Listener* listener) {
    m_execution.assertIsMainThread();
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                      m_listeners.end());
    if (m_listeners.empty()) {
        stopSampling();
    }
}

void PolledThresholdSensor::pause() {
    m_execution.assertIsMainThread();
    m_paused = true;
    stopSampling();
}

void PolledThresholdSensor::resume() {
    m_execution.assertIsMainThread();
    m_paused = false;
    startSampling();
}

void PolledThresholdSensor::update() {
    m_execution.assertIsMainThread();
    if (!m_sampling) {
        return;
    }

    uint32_t now = Clock::millis();
    if (m_hasSampled && now - m_lastSampleTime < m_delayMs) {
        return;
    }

    float value;
    if (!takeReading(value)) {
        return;
    }

    m_lastSampleTime = now;
    m_hasSampled = true;
    onReading(value);
}

void PolledThresholdSensor::mockSetReading(float value) {
    if (!m_mockMode) {
        LOG_WARN("ThresholdSensor[%s]: mockSetReading() called but mock mode not enabled", m_tag);
        return;
    }

    m_mockReading = value;
    m_hasMockReading = true;
}

void PolledThresholdSensor::startSampling() {
    if (m_sampling || m_paused || m_listeners.empty() || !isLoaded()) {
        return;
    }

    LOG_DEBUG("ThresholdSensor[%s]: Sampling every %u ms", m_tag, m_delayMs);
    m_sampling = true;
    m_hasSampled = false;
    m_hasLastBelow = false;  // Report the first sample to the new subscription
}

void PolledThresholdSensor::stopSampling() {
    if (!m_sampling) {
        return;
    }

    LOG_DEBUG("ThresholdSensor[%s]: Sampling stopped", m_tag);
    m_sampling = false;
    m_hasLastBelow = false;
}

bool PolledThresholdSensor::takeReading(float& value) {
    if (m_mockMode) {
        if (!m_hasMockReading) {
            return false;
        }
        value = m_mockReading;
        return true;
    }

    return m_source != nullptr && m_source->read(value);
}

void PolledThresholdSensor::onReading(float value) {
    bool below;
    if (value < m_threshold) {
        below = true;
    } else if (value >= m_thresholdLatch) {
        below = false;
    } else {
        return;  // Inside the hysteresis band
    }

    if (m_hasLastBelow && m_lastBelow == below) {
        return;
    }

    m_hasLastBelow = true;
    m_lastBelow = below;
    m_eventCount++;
    m_lastEventTime = Clock::millis();

    LOG_VERBOSE("ThresholdSensor[%s]: %.2f -> %s", m_tag, value, below ? "below" : "above");
    dispatch(ThresholdSensorEvent(below, Clock::nanos()));
}

void PolledThresholdSensor::dispatch(const ThresholdSensorEvent& event) {
    // Listeners may unregister (or pause us) from inside the callback
    std::vector<Listener*> listeners(m_listeners);
    for (Listener* listener : listeners) {
        listener->onThresholdCrossed(event);
    }
}
