#ifndef PROXFUSION_CLOCK_H
#define PROXFUSION_CLOCK_H

#include <stdint.h>

/**
 * @brief Monotonic millisecond time source
 *
 * All timing in the library (scheduler due times, sensor sampling, log
 * timestamps) is read through Clock::millis(). Wraps at 2^32 ms (~49 days);
 * callers compare with unsigned subtraction.
 */
class Clock {
public:
    /**
     * @brief Milliseconds since the first call
     */
    static uint32_t millis();

    /**
     * @brief Monotonic nanoseconds, used for event timestamps
     */
    static int64_t nanos();

    // Testability seam: replace the time source for unit tests.
    // nullptr restores the steady clock.
    static uint32_t (*s_timeFunc)();
};

#endif // PROXFUSION_CLOCK_H
