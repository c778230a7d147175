#pragma once

#include <atomic>
#include <memory>
#include "common/types.hpp"

namespace updown {

/**
 * Time source and sleep abstraction shared by every component.
 *
 * Components never read the system clock directly, so retry ladders,
 * hysteresis windows and cooldowns can be driven deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual EpochMs now_ms() const = 0;
    virtual void sleep_ms(int64_t ms) = 0;
};

/**
 * Wall clock backed by std::chrono::system_clock and std::this_thread.
 */
class SystemClock : public Clock {
public:
    EpochMs now_ms() const override;
    void sleep_ms(int64_t ms) override;
};

/**
 * Manually advanced clock. Sleeping advances time instantly.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(EpochMs start_ms = 1'700'000'000'000) : now_(start_ms) {}

    EpochMs now_ms() const override { return now_.load(); }
    void sleep_ms(int64_t ms) override;

    void advance_ms(int64_t ms) { now_.fetch_add(ms); }
    void set_ms(EpochMs ms) { now_.store(ms); }

    int64_t total_slept_ms() const { return slept_.load(); }
    int sleep_calls() const { return sleep_calls_.load(); }

private:
    std::atomic<EpochMs> now_;
    std::atomic<int64_t> slept_{0};
    std::atomic<int> sleep_calls_{0};
};

std::shared_ptr<Clock> make_system_clock();

} // namespace updown
