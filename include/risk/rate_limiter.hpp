#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class RequestKind {
    ORDER,
    CANCEL,
    REPLACE
};

inline std::string request_kind_to_string(RequestKind k) {
    switch (k) {
        case RequestKind::ORDER: return "ORDER";
        case RequestKind::CANCEL: return "CANCEL";
        case RequestKind::REPLACE: return "REPLACE";
    }
    return "UNKNOWN";
}

struct RateLimitResult {
    bool allowed{true};
    std::string reason;      // Reason code when blocked
    int64_t wait_ms{0};      // How long until the block lifts

    explicit operator bool() const { return allowed; }
};

/**
 * Admission-control port consulted before every non-priority order.
 */
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual RateLimitResult check_allowed(const std::string& market_id, RequestKind kind) = 0;
    virtual void record_event(const std::string& market_id, RequestKind kind) = 0;
    virtual void record_failure(const std::string& market_id) = 0;
};

/**
 * Sliding-window order rate limiter with pauses and a circuit breaker.
 *
 * DESIGN:
 * - Events are counted over a 60s sliding window, per market and globally
 * - Crossing a market threshold pauses that market; crossing a global
 *   threshold pauses everything
 * - Consecutive failures on a market trip a breaker that resets itself
 *   after circuit_breaker_reset_ms
 */
class OrderRateLimiter : public RateLimiter {
public:
    OrderRateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock);

    RateLimitResult check_allowed(const std::string& market_id, RequestKind kind) override;
    void record_event(const std::string& market_id, RequestKind kind) override;
    void record_failure(const std::string& market_id) override;

    void reset_failures(const std::string& market_id);
    void force_reset_circuit_breaker(const std::string& market_id);
    void clear();

    nlohmann::json status() const;

    static constexpr int64_t WINDOW_MS = 60000;

private:
    struct Event {
        EpochMs ts;
        RequestKind kind;
    };

    struct MarketWindow {
        std::deque<Event> events;
        EpochMs paused_until{0};
        int consecutive_failures{0};
        EpochMs circuit_open_at{0};
        bool circuit_open{false};
    };

    RateLimitConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, MarketWindow> markets_;
    std::deque<Event> global_events_;
    EpochMs global_paused_until_{0};

    static void prune(std::deque<Event>& events, EpochMs now);
    static int count_cancel_replace(const std::deque<Event>& events);
};

} // namespace updown
