#ifndef PROXFUSION_SENSOR_TYPES_H
#define PROXFUSION_SENSOR_TYPES_H

#include <stdint.h>

/**
 * @file sensor_types.h
 * @brief Common sensor type definitions and structures
 *
 * Value types shared by the threshold sensors, the proximity fusion core
 * and its consumers.
 */

/**
 * @brief A single threshold crossing reported by a sensor
 *
 * Immutable once constructed. The timestamp is informational only; ordering
 * and debounce decisions look at `below` alone.
 */
class ThresholdSensorEvent {
public:
    ThresholdSensorEvent() : m_below(false), m_timestampNs(0) {}
    ThresholdSensorEvent(bool below, int64_t timestampNs)
        : m_below(below), m_timestampNs(timestampNs) {}

    /**
     * @brief true when the reading is below the threshold ("near")
     */
    bool getBelow() const { return m_below; }

    /**
     * @brief Monotonic sample time in nanoseconds
     */
    int64_t getTimestampNs() const { return m_timestampNs; }

private:
    bool m_below;
    int64_t m_timestampNs;
};

/**
 * @brief Fused proximity reading as seen by consumers
 *
 * PROXIMITY_UNKNOWN means "no value": the sensor is unavailable, has not
 * reported since it was activated, or a one-shot check timed out.
 */
enum ProximityState {
    PROXIMITY_UNKNOWN = 0,  ///< No reading available
    PROXIMITY_NEAR = 1,     ///< Object covering the sensor
    PROXIMITY_FAR = 2       ///< Sensor uncovered
};

/**
 * @brief Role of a sensor within the fusion pair
 */
enum SensorRole {
    SENSOR_ROLE_PRIMARY = 0,    ///< Always-on, low-power first-pass sensor
    SENSOR_ROLE_SECONDARY = 1   ///< Power-hungry confirmation sensor
};

inline ProximityState proximityStateFromBelow(bool below) {
    return below ? PROXIMITY_NEAR : PROXIMITY_FAR;
}

inline const char* getProximityStateName(ProximityState state) {
    switch (state) {
        case PROXIMITY_NEAR:    return "near";
        case PROXIMITY_FAR:     return "far";
        case PROXIMITY_UNKNOWN: return "null";
        default:                return "?";
    }
}

inline const char* getSensorRoleName(SensorRole role) {
    switch (role) {
        case SENSOR_ROLE_PRIMARY:   return "primary";
        case SENSOR_ROLE_SECONDARY: return "secondary";
        default:                    return "unknown";
    }
}

#endif // PROXFUSION_SENSOR_TYPES_H
