#ifndef PROXFUSION_TIMER_SCHEDULER_H
#define PROXFUSION_TIMER_SCHEDULER_H

#include <stdint.h>
#include "config.h"
#include "delayable_executor.h"

/**
 * @brief Non-blocking one-shot timer pool
 *
 * Concrete DelayableExecutor for a single-threaded main loop. Timers are
 * checked on every update() call, which must come from the confinement
 * thread, so every task also runs there.
 *
 * - Fixed pool of TIMER_POOL_SIZE slots, no allocation besides the task
 *   closures themselves.
 * - Handles increase monotonically and are never reused, so a stale handle
 *   can never cancel somebody else's task.
 * - Tasks may schedule or cancel other tasks (including themselves).
 *   Tasks scheduled from inside update() run on a later update().
 *
 * Usage:
 * ```cpp
 * TimerScheduler scheduler;
 * scheduler.executeDelayed([]() { LOG_INFO("ping"); }, 5000);
 *
 * while (running) {
 *     scheduler.update();
 * }
 * ```
 */
class TimerScheduler : public DelayableExecutor {
public:
    TimerScheduler();

    CancelHandle executeDelayed(Task task, uint32_t delayMs) override;
    void cancel(CancelHandle handle) override;

    /**
     * @brief Run all due tasks (call every loop iteration)
     *
     * Due tasks run in due-time order; ties run in scheduling order.
     *
     * @return Number of tasks that ran
     */
    uint8_t update();

    /**
     * @brief Number of scheduled, not yet run tasks
     */
    uint8_t getPendingCount() const;

    /**
     * @brief Check whether a handle still refers to a pending task
     */
    bool isPending(CancelHandle handle) const;

    /**
     * @brief Milliseconds until the earliest pending task, 0 if one is due,
     *        UINT32_MAX if none are pending
     */
    uint32_t getTimeToNextMs() const;

    /**
     * @brief Drop every pending task without running it
     */
    void clear();

private:
    struct Timer {
        bool active = false;          ///< Slot in use
        CancelHandle handle = 0;      ///< Identity returned to the caller
        uint32_t dueTime = 0;         ///< Clock::millis() when due
        Task task;                    ///< Work to run
    };

    Timer m_timers[TIMER_POOL_SIZE];
    CancelHandle m_nextHandle;

    int findSlot(CancelHandle handle) const;
    int findEarliestDue(uint32_t now, CancelHandle limit) const;
    void release(Timer& timer);
};

#endif // PROXFUSION_TIMER_SCHEDULER_H
