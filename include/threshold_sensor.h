#ifndef PROXFUSION_THRESHOLD_SENSOR_H
#define PROXFUSION_THRESHOLD_SENSOR_H

#include <stdint.h>
#include "sensor_types.h"

/**
 * @file threshold_sensor.h
 * @brief Abstract base class for binary threshold sensors
 *
 * A threshold sensor reports only crossings: "below threshold" (near) and
 * "above threshold" (far), never a magnitude. Both the hardware-facing
 * sensors and the fused ProximitySensor implement this interface, so the
 * fused output can be handed to anything that accepts a raw sensor.
 *
 * Usage:
 * ```cpp
 * class MyListener : public ThresholdSensor::Listener {
 *     void onThresholdCrossed(const ThresholdSensorEvent& event) override {
 *         setScreenEnabled(!event.getBelow());
 *     }
 * };
 *
 * MyListener listener;
 * sensor->registerListener(&listener);
 * ```
 */
class ThresholdSensor {
public:
    /**
     * @brief Receiver of threshold crossing events
     *
     * Identified by pointer. The sensor does not own its listeners; a
     * listener must be unregistered before it is destroyed.
     */
    class Listener {
    public:
        virtual ~Listener() = default;

        /**
         * @brief Called on the confinement thread for each crossing
         */
        virtual void onThresholdCrossed(const ThresholdSensorEvent& event) = 0;
    };

    virtual ~ThresholdSensor() = default;

    /**
     * @brief Check if the underlying hardware exists
     *
     * A sensor that is not loaded never calls back.
     */
    virtual bool isLoaded() const = 0;

    /**
     * @brief Set a descriptive tag used in log output
     */
    virtual void setTag(const char* tag) = 0;

    /**
     * @brief Set the sampling period
     *
     * @param delayMs Sampling delay in milliseconds
     */
    virtual void setDelay(uint32_t delayMs) = 0;

    /**
     * @brief Add a listener
     *
     * Registering the same listener twice is logged and ignored.
     */
    virtual void registerListener(Listener* listener) = 0;

    /**
     * @brief Remove a listener (no-op if not registered)
     */
    virtual void unregisterListener(Listener* listener) = 0;

    /**
     * @brief Stop sampling without dropping listener registrations
     *
     * Idempotent.
     */
    virtual void pause() = 0;

    /**
     * @brief Restart sampling if any listeners are registered
     *
     * Idempotent; never duplicates listener registrations.
     */
    virtual void resume() = 0;
};

#endif // PROXFUSION_THRESHOLD_SENSOR_H
