#ifndef PROXFUSION_POLLED_THRESHOLD_SENSOR_H
#define PROXFUSION_POLLED_THRESHOLD_SENSOR_H

#include <stdint.h>
#include <vector>
#include "config.h"
#include "threshold_sensor.h"
#include "execution.h"

/**
 * @brief Raw reading provider behind a PolledThresholdSensor
 *
 * Implemented by whatever talks to the actual hardware (IIO node, I2C
 * driver, simulation). Readings are in the sensor's native unit; for most
 * proximity parts that is centimetres, smaller meaning closer.
 */
class ThresholdSource {
public:
    virtual ~ThresholdSource() = default;

    /**
     * @brief true if the hardware is present
     */
    virtual bool available() const = 0;

    /**
     * @brief Take one reading
     *
     * @param value Output reading
     * @return true if a reading was produced
     */
    virtual bool read(float& value) = 0;
};

/**
 * @brief ThresholdSensor over a polled raw reading
 *
 * Converts a stream of raw readings into threshold crossing events.
 *
 * Threshold and latch:
 * - reading < threshold         -> "below" (near)
 * - reading >= thresholdLatch   -> "above" (far)
 * - in between                  -> no change (hysteresis band)
 *
 * Only changes are reported, except that the first sample after every
 * resume() is always reported so new subscribers learn the current state.
 *
 * Sampling only runs while resumed with at least one listener registered.
 * update() must be called from the loop on the confinement thread.
 *
 * Mock mode bypasses the source: readings come from mockSetReading().
 */
class PolledThresholdSensor : public ThresholdSensor {
public:
    /**
     * @brief Construct a new PolledThresholdSensor
     *
     * @param source Raw reading provider, nullptr for "no hardware"
     * @param execution Confinement-thread checker
     * @param mock_mode True to take readings from mockSetReading()
     */
    PolledThresholdSensor(ThresholdSource* source, Execution& execution, bool mock_mode = false);

    ~PolledThresholdSensor() override;

    /**
     * @brief Configure threshold and release level
     *
     * @param threshold Readings below this are "near"
     * @param thresholdLatch Readings at or above this are "far"
     * @return false (and keeps the previous values) if threshold > thresholdLatch
     */
    bool setThreshold(float threshold, float thresholdLatch);

    /**
     * @brief Sample the source if due (call every loop iteration)
     */
    void update();

    // =========================================================================
    // ThresholdSensor Interface Implementation
    // =========================================================================

    bool isLoaded() const override;
    void setTag(const char* tag) override;
    void setDelay(uint32_t delayMs) override;
    void registerListener(Listener* listener) override;
    void unregisterListener(Listener* listener) override;
    void pause() override;
    void resume() override;

    // =========================================================================
    // Status
    // =========================================================================

    /**
     * @brief true while sampling (resumed with listeners)
     */
    bool isSampling() const { return m_sampling; }

    bool isPaused() const { return m_paused; }

    size_t getListenerCount() const { return m_listeners.size(); }

    float getThreshold() const { return m_threshold; }
    float getThresholdLatch() const { return m_thresholdLatch; }
    uint32_t getDelay() const { return m_delayMs; }
    const char* getTag() const { return m_tag; }

    /**
     * @brief Number of crossing events delivered since construction
     */
    uint32_t getEventCount() const { return m_eventCount; }

    /**
     * @brief Clock::millis() of the last delivered event
     */
    uint32_t getLastEventTime() const { return m_lastEventTime; }

    // =========================================================================
    // Mock Mode Interface
    // =========================================================================

    bool isMockMode() const { return m_mockMode; }

    /**
     * @brief Inject the next raw reading (mock mode only)
     *
     * Picked up on the next due update().
     */
    void mockSetReading(float value);

private:
    ThresholdSource* m_source;      ///< Raw reading provider (not owned)
    Execution& m_execution;         ///< Confinement checker
    bool m_mockMode;                ///< Mock mode enabled

    std::vector<Listener*> m_listeners;
    char m_tag[SENSOR_TAG_MAX_LEN];

    // Configuration
    float m_threshold;
    float m_thresholdLatch;
    uint32_t m_delayMs;

    // State
    bool m_paused;                  ///< pause() requested
    bool m_sampling;                ///< Actively sampling
    bool m_hasLastBelow;            ///< m_lastBelow valid since last start
    bool m_lastBelow;               ///< Last reported polarity
    uint32_t m_lastSampleTime;      ///< Clock::millis() of last sample
    bool m_hasSampled;              ///< At least one sample since last start

    // Mock mode state
    bool m_hasMockReading;
    float m_mockReading;

    // Statistics
    uint32_t m_eventCount;
    uint32_t m_lastEventTime;

    void startSampling();
    void stopSampling();
    bool takeReading(float& value);
    void onReading(float value);
    void dispatch(const ThresholdSensorEvent& event);
};

#endif // PROXFUSION_POLLED_THRESHOLD_SENSOR_H
