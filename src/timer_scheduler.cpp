#include "timer_scheduler.h"
#include "clock.h"
#include "logger.h"

TimerScheduler::TimerScheduler()
    : m_nextHandle(1)
{
}

DelayableExecutor::CancelHandle TimerScheduler::executeDelayed(Task task, uint32_t delayMs) {
    if (!task) {
        LOG_WARN("TimerScheduler: Refusing to schedule empty task");
        return INVALID_HANDLE;
    }

    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        if (!m_timers[i].active) {
            m_timers[i].active = true;
            m_timers[i].handle = m_nextHandle++;
            m_timers[i].dueTime = Clock::millis() + delayMs;
            m_timers[i].task = std::move(task);

            // Skip 0 on wrap so INVALID_HANDLE is never handed out
            if (m_nextHandle == INVALID_HANDLE) {
                m_nextHandle = 1;
            }

            LOG_VERBOSE("TimerScheduler: Scheduled #%u in %u ms", m_timers[i].handle, delayMs);
            return m_timers[i].handle;
        }
    }

    LOG_ERROR("TimerScheduler: No free timers (%u in use)", (unsigned)TIMER_POOL_SIZE);
    return INVALID_HANDLE;
}

void TimerScheduler::cancel(CancelHandle handle) {
    if (handle == INVALID_HANDLE) {
        return;
    }

    int slot = findSlot(handle);
    if (slot < 0) {
        return;  // Already ran or already cancelled
    }

    LOG_VERBOSE("TimerScheduler: Cancelled #%u", handle);
    release(m_timers[slot]);
}

uint8_t TimerScheduler::update() {
    uint32_t now = Clock::millis();

    // Tasks scheduled while this pass runs wait for the next update()
    CancelHandle limit = m_nextHandle;
    uint8_t ran = 0;

    int slot;
    while ((slot = findEarliestDue(now, limit)) >= 0) {
        // Free the slot before running so the task can reuse it or cancel
        // its own (now stale) handle harmlessly
        Task task = std::move(m_timers[slot].task);
        release(m_timers[slot]);

        task();
        ran++;
    }

    return ran;
}

uint8_t TimerScheduler::getPendingCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        if (m_timers[i].active) count++;
    }
    return count;
}

bool TimerScheduler::isPending(CancelHandle handle) const {
    return handle != INVALID_HANDLE && findSlot(handle) >= 0;
}

uint32_t TimerScheduler::getTimeToNextMs() const {
    uint32_t now = Clock::millis();
    uint32_t best = UINT32_MAX;

    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        if (!m_timers[i].active) continue;

        int32_t remaining = (int32_t)(m_timers[i].dueTime - now);
        if (remaining <= 0) {
            return 0;
        }
        if ((uint32_t)remaining < best) {
            best = (uint32_t)remaining;
        }
    }

    return best;
}

void TimerScheduler::clear() {
    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        if (m_timers[i].active) {
            release(m_timers[i]);
        }
    }
}

int TimerScheduler::findSlot(CancelHandle handle) const {
    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        if (m_timers[i].active && m_timers[i].handle == handle) {
            return i;
        }
    }
    return -1;
}

int TimerScheduler::findEarliestDue(uint32_t now, CancelHandle limit) const {
    int best = -1;

    for (uint8_t i = 0; i < TIMER_POOL_SIZE; i++) {
        const Timer& timer = m_timers[i];
        if (!timer.active) continue;
        if ((int32_t)(timer.handle - limit) >= 0) continue;   // Scheduled during this pass
        if ((int32_t)(now - timer.dueTime) < 0) continue;     // Not due yet

        if (best < 0) {
            best = i;
            continue;
        }

        const Timer& current = m_timers[best];
        int32_t diff = (int32_t)(timer.dueTime - current.dueTime);
        if (diff < 0 || (diff == 0 && (int32_t)(timer.handle - current.handle) < 0)) {
            best = i;
        }
    }

    return best;
}

void TimerScheduler::release(Timer& timer) {
    timer.active = false;
    timer.handle = INVALID_HANDLE;
    timer.dueTime = 0;
    timer.task = nullptr;
}
