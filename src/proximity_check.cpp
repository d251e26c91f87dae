#include "proximity_check.h"
#include "logger.h"

ProximityCheck::ProximityCheck(ProximitySensor& sensor, DelayableExecutor& delayableExecutor,
                               Execution& execution)
    : m_sensor(sensor)
    , m_delayableExecutor(delayableExecutor)
    , m_execution(execution)
    , m_listener(*this)
    , m_registered(false)
    , m_timeoutHandle(DelayableExecutor::INVALID_HANDLE)
{
    m_sensor.setTag("prox_check");
}

ProximityCheck::~ProximityCheck() {
    // Pending callbacks are dropped, not answered
    unregister();
}

void ProximityCheck::setTag(const char* tag) {
    m_execution.assertIsMainThread();
    m_sensor.setTag(tag);
}

void ProximityCheck::check(uint32_t timeoutMs, Callback callback) {
    m_execution.assertIsMainThread();
    if (!m_sensor.isLoaded()) {
        if (callback) {
            callback(PROXIMITY_UNKNOWN);
        }
        return;
    }

    if (callback) {
        m_callbacks.push_back(callback);
    }

    if (m_registered) {
        return;
    }

    m_registered = true;
    m_sensor.registerListener(&m_listener);

    // Registration can already have answered us (sensor state known)
    if (!m_registered) {
        return;
    }

    m_timeoutHandle = m_delayableExecutor.executeDelayed([this]() { onTimeout(); }, timeoutMs);
    if (m_timeoutHandle == DelayableExecutor::INVALID_HANDLE) {
        LOG_WARN("ProxCheck: Could not schedule timeout, answering now");
        unregister();
        onProximityEvent(PROXIMITY_UNKNOWN);
    }
}

void ProximityCheck::onTimeout() {
    m_timeoutHandle = DelayableExecutor::INVALID_HANDLE;
    if (!m_registered) {
        return;  // Already answered
    }

    LOG_DEBUG("ProxCheck: Timed out");
    unregister();
    onProximityEvent(PROXIMITY_UNKNOWN);
}

void ProximityCheck::onProximityEvent(ProximityState state) {
    // Swap out first: a callback may start a new check()
    std::vector<Callback> callbacks;
    callbacks.swap(m_callbacks);
    unregister();

    for (Callback& callback : callbacks) {
        callback(state);
    }
}

void ProximityCheck::unregister() {
    if (m_timeoutHandle != DelayableExecutor::INVALID_HANDLE) {
        m_delayableExecutor.cancel(m_timeoutHandle);
        m_timeoutHandle = DelayableExecutor::INVALID_HANDLE;
    }

    if (m_registered) {
        m_registered = false;
        m_sensor.unregisterListener(&m_listener);
    }
}
