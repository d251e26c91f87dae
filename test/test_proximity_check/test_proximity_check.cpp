/**
 * @file test_proximity_check.cpp
 * @brief Unit tests for the one-shot ProximityCheck.
 */

#include <unity.h>
#include <algorithm>
#include <string>
#include <vector>
#include "config.h"
#include "logger.h"
#include "sensor_types.h"
#include "threshold_sensor.h"
#include "delayable_executor.h"
#include "execution.h"
#include "proximity_sensor.h"
#include "proximity_check.h"

// =========================================================================
// Fakes
// =========================================================================

class FakeThresholdSensor : public ThresholdSensor {
public:
    FakeThresholdSensor() : loaded(true), paused(false) {}

    bool isLoaded() const override { return loaded; }
    void setTag(const char* t) override { tag = t ? t : ""; }
    void setDelay(uint32_t d) override { (void)d; }

    void registerListener(Listener* listener) override {
        if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
            listeners.push_back(listener);
        }
    }

    void unregisterListener(Listener* listener) override {
        listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
    }

    void pause() override { paused = true; }
    void resume() override { paused = false; }

    void fire(bool below) {
        std::vector<Listener*> snapshot(listeners);
        for (Listener* listener : snapshot) {
            listener->onThresholdCrossed(ThresholdSensorEvent(below, 0));
        }
    }

    bool loaded;
    bool paused;
    std::string tag;
    std::vector<Listener*> listeners;
};

class FakeExecution : public Execution {
public:
    FakeExecution() : assertCount(0) {}
    void assertIsMainThread() override { assertCount++; }
    bool isMainThread() const override { return true; }
    int assertCount;
};

class FakeDelayableExecutor : public DelayableExecutor {
public:
    struct Pending {
        CancelHandle handle;
        uint32_t delayMs;
        Task task;
    };

    FakeDelayableExecutor() : nextHandle(1), scheduleCount(0) {}

    CancelHandle executeDelayed(Task task, uint32_t delayMs) override {
        Pending pending;
        pending.handle = nextHandle++;
        pending.delayMs = delayMs;
        pending.task = task;
        tasks.push_back(pending);
        scheduleCount++;
        return pending.handle;
    }

    void cancel(CancelHandle handle) override {
        for (size_t i = 0; i < tasks.size(); i++) {
            if (tasks[i].handle == handle) {
                tasks.erase(tasks.begin() + i);
                return;
            }
        }
    }

    void runAll() {
        std::vector<Pending> due;
        due.swap(tasks);
        for (Pending& pending : due) {
            pending.task();
        }
    }

    CancelHandle nextHandle;
    int scheduleCount;
    std::vector<Pending> tasks;
};

// =========================================================================
// Test fixtures
// =========================================================================

static FakeThresholdSensor* primary = nullptr;
static FakeThresholdSensor* secondary = nullptr;
static FakeExecution* execution = nullptr;
static FakeDelayableExecutor* executor = nullptr;
static ProximitySensor* prox = nullptr;
static ProximityCheck* check = nullptr;

static std::vector<ProximityState> results;

static void recordResult(ProximityState state) {
    results.push_back(state);
}

void setUp(void) {
    g_logger.setSerialEnabled(false);
    results.clear();
    primary = new FakeThresholdSensor();
    secondary = new FakeThresholdSensor();
    secondary->loaded = false;  // Primary events pass straight through
    execution = new FakeExecution();
    executor = new FakeDelayableExecutor();
    prox = new ProximitySensor(*primary, *secondary, *executor, *execution);
    check = new ProximityCheck(*prox, *executor, *execution);
}

void tearDown(void) {
    delete check;
    check = nullptr;
    delete prox;
    prox = nullptr;
    delete executor;
    executor = nullptr;
    delete execution;
    execution = nullptr;
    delete secondary;
    secondary = nullptr;
    delete primary;
    primary = nullptr;
}

// =========================================================================
// Tests
// =========================================================================

void test_construction_tags_sensor(void) {
    TEST_ASSERT_EQUAL_STRING("prox_check:primary", primary->tag.c_str());

    check->setTag("wake");
    TEST_ASSERT_EQUAL_STRING("wake:primary", primary->tag.c_str());
    TEST_ASSERT_EQUAL_STRING("wake:secondary", secondary->tag.c_str());
}

void test_unavailable_sensor_answers_unknown_immediately(void) {
    primary->loaded = false;

    check->check(500, recordResult);

    TEST_ASSERT_EQUAL(1, (int)results.size());
    TEST_ASSERT_EQUAL(PROXIMITY_UNKNOWN, results[0]);
    TEST_ASSERT_FALSE(check->isPending());
    TEST_ASSERT_EQUAL(0, executor->scheduleCount);
    TEST_ASSERT_EQUAL(0, (int)primary->listeners.size());
}

void test_check_registers_and_schedules_timeout(void) {
    check->check(750, recordResult);

    TEST_ASSERT_TRUE(check->isPending());
    TEST_ASSERT_TRUE(prox->isRegistered());
    TEST_ASSERT_EQUAL(1, (int)prox->getListenerCount());
    TEST_ASSERT_EQUAL(1, (int)executor->tasks.size());
    TEST_ASSERT_EQUAL_UINT32(750, executor->tasks[0].delayMs);
    TEST_ASSERT_EQUAL(0, (int)results.size());
}

void test_first_reading_answers_and_unregisters(void) {
    check->check(500, recordResult);

    primary->fire(true);

    TEST_ASSERT_EQUAL(1, (int)results.size());
    TEST_ASSERT_EQUAL(PROXIMITY_NEAR, results[0]);
    TEST_ASSERT_FALSE(check->isPending());
    TEST_ASSERT_FALSE(prox->isRegistered());
    TEST_ASSERT_EQUAL(0, (int)prox->getListenerCount());
    TEST_ASSERT_EQUAL(0, (int)executor->tasks.size());  // Timeout cancelled

    // Later readings go nowhere
    primary->fire(false);
    TEST_ASSERT_EQUAL(1, (int)results.size());
}

void test_timeout_answers_unknown(void) {
    check->check(500, recordResult);

    executor->runAll();

    TEST_ASSERT_EQUAL(1, (int)results.size());
    TEST_ASSERT_EQUAL(PROXIMITY_UNKNOWN, results[0]);
    TEST_ASSERT_FALSE(check->isPending());
    TEST_ASSERT_EQUAL(0, (int)prox->getListenerCount());
}

void test_concurrent_checks_share_registration(void) {
    check->check(500, recordResult);
    check->check(500, recordResult);
    check->check(500, recordResult);

    TEST_ASSERT_EQUAL(1, executor->scheduleCount);
    TEST_ASSERT_EQUAL(1, (int)prox->getListenerCount());
    TEST_ASSERT_EQUAL(3, (int)check->getPendingCallbackCount());

    primary->fire(false);

    TEST_ASSERT_EQUAL(3, (int)results.size());
    for (size_t i = 0; i < results.size(); i++) {
        TEST_ASSERT_EQUAL(PROXIMITY_FAR, results[i]);
    }
    TEST_ASSERT_EQUAL(0, (int)check->getPendingCallbackCount());
}

void test_stale_timeout_delivers_nothing(void) {
    check->check(500, recordResult);
    DelayableExecutor::Task timeout = executor->tasks[0].task;

    primary->fire(true);
    TEST_ASSERT_EQUAL(1, (int)results.size());

    timeout();

    TEST_ASSERT_EQUAL(1, (int)results.size());
    TEST_ASSERT_FALSE(check->isPending());
}

void test_new_check_after_answer_registers_again(void) {
    check->check(500, recordResult);
    primary->fire(true);

    check->check(500, recordResult);

    TEST_ASSERT_TRUE(check->isPending());
    TEST_ASSERT_EQUAL(2, executor->scheduleCount);

    // Sensor history was reset by the teardown, so "near" again counts
    primary->fire(true);
    TEST_ASSERT_EQUAL(2, (int)results.size());
    TEST_ASSERT_EQUAL(PROXIMITY_NEAR, results[1]);
}

void test_callback_may_start_new_check(void) {
    int answers = 0;
    ProximityCheck* target = check;
    ProximityCheck::Callback again = [&](ProximityState state) {
        (void)state;
        answers++;
    };

    check->check(500, [&](ProximityState state) {
        results.push_back(state);
        target->check(500, again);
    });

    primary->fire(false);

    TEST_ASSERT_EQUAL(1, (int)results.size());
    TEST_ASSERT_TRUE(check->isPending());
    TEST_ASSERT_EQUAL(0, answers);

    executor->runAll();
    TEST_ASSERT_EQUAL(1, answers);
}

void test_check_and_set_tag_check_thread(void) {
    primary->loaded = false;  // No registration, so only the check's own assertion counts

    int before = execution->assertCount;
    check->check(500, recordResult);
    TEST_ASSERT_EQUAL(before + 1, execution->assertCount);

    before = execution->assertCount;
    check->setTag("wake");
    TEST_ASSERT_TRUE(execution->assertCount >= before + 1);
}

void test_destroying_pending_check_releases_sensor(void) {
    check->check(500, recordResult);

    delete check;
    check = nullptr;

    TEST_ASSERT_EQUAL(0, (int)prox->getListenerCount());
    TEST_ASSERT_EQUAL(0, (int)executor->tasks.size());
    TEST_ASSERT_EQUAL(0, (int)results.size());
}

// =========================================================================
// Unity main
// =========================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    UNITY_BEGIN();

    RUN_TEST(test_construction_tags_sensor);
    RUN_TEST(test_unavailable_sensor_answers_unknown_immediately);
    RUN_TEST(test_check_registers_and_schedules_timeout);
    RUN_TEST(test_first_reading_answers_and_unregisters);
    RUN_TEST(test_timeout_answers_unknown);
    RUN_TEST(test_concurrent_checks_share_registration);
    RUN_TEST(test_stale_timeout_delivers_nothing);
    RUN_TEST(test_new_check_after_answer_registers_again);
    RUN_TEST(test_callback_may_start_new_check);
    RUN_TEST(test_check_and_set_tag_check_thread);
    RUN_TEST(test_destroying_pending_check_releases_sensor);

    return UNITY_END();
}
