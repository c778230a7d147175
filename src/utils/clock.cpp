#include "utils/clock.hpp"
#include <chrono>
#include <thread>

namespace updown {

EpochMs SystemClock::now_ms() const {
    return updown::now_ms();
}

void SystemClock::sleep_ms(int64_t ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void ManualClock::sleep_ms(int64_t ms) {
    sleep_calls_.fetch_add(1);
    if (ms <= 0) return;
    slept_.fetch_add(ms);
    now_.fetch_add(ms);
}

std::shared_ptr<Clock> make_system_clock() {
    return std::make_shared<SystemClock>();
}

} // namespace updown
