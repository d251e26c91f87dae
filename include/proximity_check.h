#ifndef PROXFUSION_PROXIMITY_CHECK_H
#define PROXFUSION_PROXIMITY_CHECK_H

#include <stdint.h>
#include <functional>
#include <vector>
#include "sensor_types.h"
#include "proximity_sensor.h"
#include "delayable_executor.h"
#include "execution.h"

/**
 * @brief One-shot, time-bounded proximity query
 *
 * Briefly registers on a ProximitySensor and reports the first reading, or
 * PROXIMITY_UNKNOWN if nothing arrives before the timeout (or the sensor is
 * not loaded). Callers that ask while a check is already running share it;
 * all of them are answered together.
 *
 * Usage:
 * ```cpp
 * ProximityCheck check(prox, scheduler, execution);
 * check.check(500, [](ProximityState state) {
 *     if (state != PROXIMITY_NEAR) wakeScreen();
 * });
 * ```
 */
class ProximityCheck {
public:
    /**
     * @brief Result callback type
     */
    typedef std::function<void(ProximityState state)> Callback;

    /**
     * @brief Construct a new ProximityCheck
     *
     * Tags the sensor "prox_check".
     */
    ProximityCheck(ProximitySensor& sensor, DelayableExecutor& delayableExecutor,
                   Execution& execution);

    ~ProximityCheck();

    /**
     * @brief Set a descriptive tag for the sensor registration
     */
    void setTag(const char* tag);

    /**
     * @brief Query the proximity sensor, timing out if no result
     *
     * The callback runs exactly once: immediately with PROXIMITY_UNKNOWN if
     * the sensor is not loaded, otherwise on the first reading or the
     * timeout, whichever comes first.
     *
     * @param timeoutMs How long to wait for a reading
     * @param callback Receives the result
     */
    void check(uint32_t timeoutMs, Callback callback);

    /**
     * @brief true while a check is waiting for its result
     */
    bool isPending() const { return m_registered; }

    size_t getPendingCallbackCount() const { return m_callbacks.size(); }

private:
    class CheckListener : public ThresholdSensor::Listener {
    public:
        explicit CheckListener(ProximityCheck& owner) : m_owner(owner) {}
        void onThresholdCrossed(const ThresholdSensorEvent& event) override {
            m_owner.onProximityEvent(proximityStateFromBelow(event.getBelow()));
        }
    private:
        ProximityCheck& m_owner;
    };

    ProximitySensor& m_sensor;
    DelayableExecutor& m_delayableExecutor;
    Execution& m_execution;
    CheckListener m_listener;
    std::vector<Callback> m_callbacks;
    bool m_registered;
    DelayableExecutor::CancelHandle m_timeoutHandle;

    void onTimeout();
    void onProximityEvent(ProximityState state);
    void unregister();
};

#endif // PROXFUSION_PROXIMITY_CHECK_H
