#pragma once

#include <chrono>
#include <ratio>
#include <stdexcept>

#include "guard.hpp"

namespace wordhint::timing {

// Accumulating stopwatch. Durations are in Period units (seconds by default)
template <typename Rep = double, typename Period = std::ratio<1>>
struct Timer {
private:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<Rep, Period>;

    Clock::time_point tp;
    Duration elapsed = Duration::zero();
    bool running = false;

public:
    constexpr Timer() noexcept = default;

    void start() {
        guard::hybridGuard<std::logic_error>(!running, "start() called while timer is already running");
        running = true;
        tp = Clock::now();
    }

    void stop() {
        guard::hybridGuard<std::logic_error>(running, "stop() called without corresponding start()");
        elapsed += std::chrono::duration_cast<Duration>(Clock::now() - tp);
        running = false;
    }

    // Stops the timer if running and returns the total elapsed time
    Duration end() {
        if (running) stop();
        return elapsed;
    }

    void reset() noexcept {
        elapsed = Duration::zero();
        running = false;
    }
};

}
