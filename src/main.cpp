/**
 * @file main.cpp
 * @brief ProxFusion simulator
 *
 * Runs a scripted dual-sensor timeline through the fusion engine on a
 * simulated clock and logs every fused reading.
 *
 * Usage: proxfusion_sim [config.json]
 *
 * Timeline (distances in cm, "near" below the configured threshold):
 * - 0 ms      both sensors far
 * - 1000 ms   primary near, secondary still far: "near" rejected, re-arm
 * - 3000 ms   secondary near (not yet sampled, it is asleep)
 * - re-arm    secondary confirms: fused "near"
 * - 8000 ms   primary far: fused "far" immediately
 * - 9000 ms   one-shot check started
 * - 9200 ms   primary near again, confirmed by the secondary, answers the check
 */

#include <stdio.h>
#include <stdint.h>
#include "config.h"
#include "clock.h"
#include "logger.h"
#include "config_manager.h"
#include "execution.h"
#include "timer_scheduler.h"
#include "polled_threshold_sensor.h"
#include "proximity_sensor.h"
#include "proximity_check.h"

// ============================================================================
// Simulated Time
// ============================================================================

static uint32_t s_simTimeMs = 0;

static uint32_t simMillis() {
    return s_simTimeMs;
}

#define SIM_STEP_MS      10
#define SIM_DURATION_MS  10000
#define SIM_CHECK_AT_MS  9000

// ============================================================================
// Scripted Sensor Source
// ============================================================================

struct ScriptStep {
    uint32_t atMs;
    float value;
};

/**
 * @brief ThresholdSource replaying a fixed timeline against Clock::millis()
 */
class ScriptedSource : public ThresholdSource {
public:
    ScriptedSource(const ScriptStep* steps, size_t count)
        : m_steps(steps), m_count(count) {}

    bool available() const override { return m_count > 0; }

    bool read(float& value) override {
        uint32_t now = Clock::millis();
        bool found = false;
        for (size_t i = 0; i < m_count && m_steps[i].atMs <= now; i++) {
            value = m_steps[i].value;
            found = true;
        }
        return found;
    }

private:
    const ScriptStep* m_steps;
    size_t m_count;
};

static const ScriptStep PRIMARY_SCRIPT[] = {
    { 0,    10.0f },
    { 1000,  2.0f },
    { 8000, 10.0f },
    { 9200,  2.0f },
};

static const ScriptStep SECONDARY_SCRIPT[] = {
    { 0,    10.0f },
    { 3000,  2.0f },
};

// ============================================================================
// Fused Output
// ============================================================================

class FusedEventPrinter : public ThresholdSensor::Listener {
public:
    FusedEventPrinter() : m_count(0) {}

    void onThresholdCrossed(const ThresholdSensorEvent& event) override {
        m_count++;
        LOG_INFO("[Sim] t=%ums fused event #%u: %s",
                 (uint32_t)(event.getTimestampNs() / 1000000LL), m_count,
                 event.getBelow() ? "NEAR" : "FAR");
    }

    uint32_t getCount() const { return m_count; }

private:
    uint32_t m_count;
};

static void printBanner() {
    printf("\n");
    printf("========================================\n");
    printf("  %s Simulator v%s\n", PROXFUSION_NAME, PROXFUSION_VERSION);
    printf("========================================\n");
    printf("\n");
}

static void printUsage(const char* argv0) {
    printf("Usage: %s [config.json]\n", argv0);
}

static bool configureSensor(PolledThresholdSensor& sensor, const ConfigManager::SensorSlotConfig& slot) {
    sensor.setDelay(slot.samplingDelayMs);
    return sensor.setThreshold(slot.threshold, slot.thresholdLatch);
}

int main(int argc, char** argv) {
    if (argc > 2) {
        printUsage(argv[0]);
        return 1;
    }

    printBanner();

    // ========================================================================
    // Configuration
    // ========================================================================

    ConfigManager configManager;
    if (argc == 2 && !configManager.load(argv[1])) {
        fprintf(stderr, "Config error: %s\n", configManager.getLastError());
        return 1;
    }
    const ConfigManager::Config& config = configManager.getConfig();

    Clock::s_timeFunc = simMillis;

    g_logger.begin((Logger::LogLevel)config.logLevel,
                   config.serialLoggingEnabled,
                   config.fileLoggingEnabled ? config.logFilePath : nullptr);
    configManager.print();

    // ========================================================================
    // Sensors and Fusion
    // ========================================================================

    MainThreadExecution execution;
    TimerScheduler scheduler;

    ScriptedSource primarySource(PRIMARY_SCRIPT, sizeof(PRIMARY_SCRIPT) / sizeof(PRIMARY_SCRIPT[0]));
    ScriptedSource secondarySource(SECONDARY_SCRIPT, sizeof(SECONDARY_SCRIPT) / sizeof(SECONDARY_SCRIPT[0]));

    // A disabled slot gets no source and reports !isLoaded()
    PolledThresholdSensor primary(config.primary.enabled ? &primarySource : nullptr, execution);
    PolledThresholdSensor secondary(config.secondary.enabled ? &secondarySource : nullptr, execution);

    if (!configureSensor(primary, config.primary) || !configureSensor(secondary, config.secondary)) {
        LOG_ERROR("[Sim] Invalid sensor thresholds");
        return 1;
    }

    ProximitySensor prox(primary, secondary, scheduler, execution);
    prox.setTag(config.fusion.tag);
    prox.setSecondaryPingIntervalMs(config.fusion.secondaryPingIntervalMs);
    prox.setSecondarySafe(config.fusion.secondarySafe);

    if (!prox.isLoaded()) {
        LOG_WARN("[Sim] No primary sensor, fusion disabled");
    }

    FusedEventPrinter printer;
    prox.registerListener(&printer);

    // Constructing the check retags the sensor "prox_check"
    ProximityCheck check(prox, scheduler, execution);
    check.setTag(config.fusion.tag);

    // ========================================================================
    // Main Loop
    // ========================================================================

    bool checkStarted = false;
    ProximityState checkResult = PROXIMITY_UNKNOWN;
    bool checkAnswered = false;
    uint32_t checkAnsweredAt = 0;

    for (s_simTimeMs = 0; s_simTimeMs <= SIM_DURATION_MS; s_simTimeMs += SIM_STEP_MS) {
        if (!checkStarted && s_simTimeMs >= SIM_CHECK_AT_MS) {
            checkStarted = true;
            LOG_INFO("[Sim] t=%ums starting proximity check (timeout %ums)",
                     s_simTimeMs, config.checkTimeoutMs);
            check.check(config.checkTimeoutMs, [&](ProximityState state) {
                checkResult = state;
                checkAnswered = true;
                checkAnsweredAt = Clock::millis();
            });
        }

        primary.update();
        secondary.update();
        scheduler.update();
    }

    // ========================================================================
    // Summary
    // ========================================================================

    char status[256];
    prox.formatStatus(status, sizeof(status));
    LOG_INFO("[Sim] Fused events: %u", printer.getCount());
    LOG_INFO("[Sim] Status: %s", status);
    if (checkAnswered) {
        LOG_INFO("[Sim] Check answered at t=%ums: %s",
                 checkAnsweredAt, getProximityStateName(checkResult));
    } else {
        LOG_WARN("[Sim] Check never answered");
    }

    prox.unregisterListener(&printer);
    g_logger.flush();
    Clock::s_timeFunc = nullptr;
    return 0;
}
