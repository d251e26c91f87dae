#ifndef PROXFUSION_PROXIMITY_SENSOR_H
#define PROXFUSION_PROXIMITY_SENSOR_H

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <vector>
#include "config.h"
#include "sensor_types.h"
#include "threshold_sensor.h"
#include "delayable_executor.h"
#include "execution.h"

/**
 * @file proximity_sensor.h
 * @brief Dual-sensor proximity fusion
 *
 * Combines a primary and a secondary ThresholdSensor into a single debounced
 * near/far signal.
 *
 * The primary sensor is a cheap, always-on first-pass check. When it reports
 * "near", the secondary sensor is woken up to confirm or reject the reading,
 * and nothing is reported until it does. When both are loaded, the secondary
 * is the source of truth for "near".
 *
 * "Far" is reported as soon as the primary sees it, without waiting on the
 * secondary, and lets the secondary go back to sleep. A false "near" disables
 * things the user is looking at; a false "far" is comparatively harmless.
 *
 * If the secondary reports "far" while the primary still says "near", the
 * secondary is paused and re-armed after the ping interval
 * (SECONDARY_PING_INTERVAL_MS by default) for another look.
 *
 * Secondary-safe mode keeps the secondary running whenever the fused sensor is
 * active, independent of the primary.
 *
 * If the secondary is not loaded, primary events pass straight through. If
 * the primary is not loaded, the whole sensor reports !isLoaded() and
 * registering is a no-op.
 *
 * Every method must be called on the confinement thread (see Execution).
 *
 * Usage:
 * ```cpp
 * ProximitySensor prox(primary, secondary, scheduler, execution);
 * prox.setTag("dialer");
 * prox.registerListener(&screenController);
 *
 * while (running) {
 *     primary.update();
 *     secondary.update();
 *     scheduler.update();
 * }
 * ```
 */
class ProximitySensor : public ThresholdSensor {
public:
    /**
     * @brief Construct a new ProximitySensor
     *
     * Nothing is registered with the underlying sensors until the first
     * listener arrives.
     *
     * @param primary First-pass sensor
     * @param secondary Confirmation sensor (may report !isLoaded())
     * @param delayableExecutor Scheduler for secondary re-arm tasks
     * @param execution Confinement-thread checker
     */
    ProximitySensor(ThresholdSensor& primary,
                    ThresholdSensor& secondary,
                    DelayableExecutor& delayableExecutor,
                    Execution& execution);

    ~ProximitySensor() override;

    // =========================================================================
    // ThresholdSensor Interface Implementation
    // =========================================================================

    /**
     * @brief Returns false if no primary proximity sensor is available
     */
    bool isLoaded() const override;

    /**
     * @brief Tag this sensor and its two children ("<tag>:primary", ...)
     */
    void setTag(const char* tag) override;

    /**
     * @brief Forward the sampling delay to both sensors
     */
    void setDelay(uint32_t delayMs) override;

    /**
     * @brief Add a listener
     *
     * Activates the underlying sensors if this is the first listener. If the
     * sensor is paused, activation happens on resume().
     */
    void registerListener(Listener* listener) override;

    /**
     * @brief Remove a listener
     *
     * When the last listener is removed the underlying sensors are released
     * and the last known readings are forgotten.
     */
    void unregisterListener(Listener* listener) override;

    /**
     * @brief Release the underlying sensors without dropping listeners
     */
    void pause() override;

    /**
     * @brief Re-acquire the underlying sensors (no-op without listeners)
     */
    void resume() override;

    // =========================================================================
    // Fusion Control
    // =========================================================================

    /**
     * @brief Set whether the secondary sensor may stay on indefinitely
     *
     * true: the secondary is resumed now and kept on while active, regardless
     * of what the primary reports.
     * false: the secondary is paused now and only woken to confirm "near".
     */
    void setSecondarySafe(bool safe);

    bool isSecondarySafe() const { return m_secondarySafe; }

    /**
     * @brief Delay before the secondary is re-checked after a rejected "near"
     */
    void setSecondaryPingIntervalMs(uint32_t intervalMs);

    uint32_t getSecondaryPingIntervalMs() const { return m_secondaryPingIntervalMs; }

    // =========================================================================
    // Status
    // =========================================================================

    /**
     * @brief Returns true if registered with the underlying sensors
     */
    bool isRegistered() const { return m_registered; }

    bool isPaused() const { return m_paused; }

    /**
     * @brief Last fused reading
     *
     * @return PROXIMITY_UNKNOWN if not loaded or nothing seen since activation
     */
    ProximityState isNear() const;

    /**
     * @brief true while a secondary re-arm task is scheduled
     */
    bool isSecondaryRearmPending() const {
        return m_cancelSecondaryHandle != DelayableExecutor::INVALID_HANDLE;
    }

    size_t getListenerCount() const { return m_listeners.size(); }

    /**
     * @brief Write a one-line status summary
     *
     * @return false if the buffer was too small (output is truncated)
     */
    bool formatStatus(char* buffer, size_t bufferSize) const;

    /**
     * @brief Send the last fused reading to every listener again
     *
     * Calls made while a broadcast is already running (for example from a
     * listener callback) return immediately.
     */
    void alertListeners();

protected:
    void registerInternal();
    void unregisterInternal();

private:
    class PrimaryEventListener : public Listener {
    public:
        explicit PrimaryEventListener(ProximitySensor& owner) : m_owner(owner) {}
        void onThresholdCrossed(const ThresholdSensorEvent& event) override {
            m_owner.onPrimarySensorEvent(event);
        }
    private:
        ProximitySensor& m_owner;
    };

    class SecondaryEventListener : public Listener {
    public:
        explicit SecondaryEventListener(ProximitySensor& owner) : m_owner(owner) {}
        void onThresholdCrossed(const ThresholdSensorEvent& event) override {
            m_owner.onSecondarySensorEvent(event);
        }
    private:
        ProximitySensor& m_owner;
    };

    ThresholdSensor& m_primary;
    ThresholdSensor& m_secondary;
    DelayableExecutor& m_delayableExecutor;
    Execution& m_execution;

    PrimaryEventListener m_primaryEventListener;
    SecondaryEventListener m_secondaryEventListener;

    std::vector<Listener*> m_listeners;
    char m_tag[SENSOR_TAG_MAX_LEN];

    // Fusion state
    bool m_paused;
    bool m_registered;
    bool m_secondarySafe;
    bool m_initializedListeners;
    bool m_hasLastPrimaryEvent;
    ThresholdSensorEvent m_lastPrimaryEvent;
    bool m_hasLastEvent;
    ThresholdSensorEvent m_lastEvent;
    DelayableExecutor::CancelHandle m_cancelSecondaryHandle;
    uint32_t m_secondaryPingIntervalMs;
    std::atomic<bool> m_alerting;

    void onPrimarySensorEvent(const ThresholdSensorEvent& event);
    void onSecondarySensorEvent(const ThresholdSensorEvent& event);
    void onSensorEvent(const ThresholdSensorEvent& event);

    void scheduleSecondaryRearm();
    void cancelSecondaryRearm();
};

#endif // PROXFUSION_PROXIMITY_SENSOR_H
