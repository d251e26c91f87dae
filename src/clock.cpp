#include "clock.h"

#include <chrono>

uint32_t (*Clock::s_timeFunc)() = nullptr;

static std::chrono::steady_clock::time_point startTime() {
    static const std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();
    return s_start;
}

uint32_t Clock::millis() {
    if (s_timeFunc) {
        return s_timeFunc();
    }

    auto elapsed = std::chrono::steady_clock::now() - startTime();
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

int64_t Clock::nanos() {
    if (s_timeFunc) {
        return (int64_t)s_timeFunc() * 1000000LL;
    }

    auto elapsed = std::chrono::steady_clock::now() - startTime();
    return (int64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
}
