#ifndef PROXFUSION_DELAYABLE_EXECUTOR_H
#define PROXFUSION_DELAYABLE_EXECUTOR_H

#include <stdint.h>
#include <functional>

/**
 * @brief Delayed task scheduling on the confinement thread
 *
 * Tasks run on the same thread that drives the sensors, at least delayMs
 * after they were scheduled (not necessarily exactly).
 */
class DelayableExecutor {
public:
    /**
     * @brief Handle to a scheduled task, 0 means "no task"
     */
    typedef uint32_t CancelHandle;

    static constexpr CancelHandle INVALID_HANDLE = 0;

    typedef std::function<void()> Task;

    virtual ~DelayableExecutor() = default;

    /**
     * @brief Run task once after delayMs
     *
     * @return Handle for cancel(), or INVALID_HANDLE if it could not be scheduled
     */
    virtual CancelHandle executeDelayed(Task task, uint32_t delayMs) = 0;

    /**
     * @brief Cancel a scheduled task
     *
     * Cancelling a task that already ran, was already cancelled, or
     * INVALID_HANDLE is a no-op.
     */
    virtual void cancel(CancelHandle handle) = 0;
};

#endif // PROXFUSION_DELAYABLE_EXECUTOR_H
