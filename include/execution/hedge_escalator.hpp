#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/order_gateway.hpp"
#include "market_data/venue_client.hpp"
#include "risk/funding.hpp"
#include "risk/rate_limiter.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class HedgeMode {
    NORMAL,
    PANIC,      // < panic threshold to expiry: accept partial liquidity
    SURVIVAL    // < survival threshold: higher price cap, no pair-cost gate
};

inline std::string hedge_mode_to_string(HedgeMode m) {
    switch (m) {
        case HedgeMode::NORMAL: return "NORMAL";
        case HedgeMode::PANIC: return "PANIC";
        case HedgeMode::SURVIVAL: return "SURVIVAL";
    }
    return "UNKNOWN";
}

enum class HedgeErrorCode {
    NONE,
    NO_LIQUIDITY,
    INSUFFICIENT_FUNDS,
    RATE_LIMITED,
    API_ERROR,
    MAX_RETRIES,
    ABORTED,
    PAIR_COST_WORSENING
};

inline std::string hedge_error_to_string(HedgeErrorCode c) {
    switch (c) {
        case HedgeErrorCode::NONE: return "NONE";
        case HedgeErrorCode::NO_LIQUIDITY: return "NO_LIQUIDITY";
        case HedgeErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case HedgeErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case HedgeErrorCode::API_ERROR: return "API_ERROR";
        case HedgeErrorCode::MAX_RETRIES: return "MAX_RETRIES";
        case HedgeErrorCode::ABORTED: return "ABORTED";
        case HedgeErrorCode::PAIR_COST_WORSENING: return "PAIR_COST_WORSENING";
    }
    return "UNKNOWN";
}

struct HedgeRequest {
    MarketKey key;
    std::string token_id;
    Outcome side{Outcome::UP};          // Outcome being bought to complete the pair
    Size target_shares{0.0};
    Price initial_price{0.0};
    double seconds_remaining{0.0};
    std::optional<Price> avg_other_side_cost;
    std::optional<Price> price_cap;     // Ceiling for every step, on top of the mode cap
};

struct HedgeResult {
    bool ok{false};
    std::string order_id;
    Size filled_shares{0.0};
    Price avg_price{0.0};
    HedgeErrorCode error_code{HedgeErrorCode::NONE};
    std::string error;
    int attempts{0};

    explicit operator bool() const { return ok; }
};

enum class HedgeEventType {
    HEDGE_ATTEMPT,
    HEDGE_FAILED,
    HEDGE_ESCALATE_STEP,
    HEDGE_ABORTED,
    HEDGE_SUCCESS
};

inline std::string hedge_event_type_to_string(HedgeEventType t) {
    switch (t) {
        case HedgeEventType::HEDGE_ATTEMPT: return "HEDGE_ATTEMPT";
        case HedgeEventType::HEDGE_FAILED: return "HEDGE_FAILED";
        case HedgeEventType::HEDGE_ESCALATE_STEP: return "HEDGE_ESCALATE_STEP";
        case HedgeEventType::HEDGE_ABORTED: return "HEDGE_ABORTED";
        case HedgeEventType::HEDGE_SUCCESS: return "HEDGE_SUCCESS";
    }
    return "UNKNOWN";
}

struct HedgeEvent {
    HedgeEventType type{HedgeEventType::HEDGE_ATTEMPT};
    EpochMs ts{0};
    MarketKey key;
    Outcome side{Outcome::UP};
    int step{0};
    Price price{0.0};
    Size shares{0.0};
    std::string reason;
    std::string order_id;
    Size filled_shares{0.0};
};

struct HedgeEscalatorStats {
    int64_t sequences{0};
    int64_t attempts{0};
    int64_t successes{0};
    int64_t failures{0};
    int64_t aborts{0};
    double avg_attempts_per_sequence{0.0};
};

/**
 * HedgeEscalator completes a hedge under time pressure with a bounded
 * number of steps.
 *
 * DESIGN:
 * - Each step runs: pair-cost gate, admission, funds, liquidity,
 *   reservation, submission through OrderGateway
 * - Price only moves up and size only moves down across steps, so the
 *   ladder is monotone and always terminates within max_retries steps
 *   (plus a bounded number of rate-limit waits in SURVIVAL)
 * - Notional is reserved before submission and released on every
 *   failure path
 */
class HedgeEscalator {
public:
    HedgeEscalator(
        const HedgeEscalatorConfig& config,
        std::shared_ptr<OrderGateway> gateway,
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<RateLimiter> rate_limiter,
        std::shared_ptr<FundsChecker> funds,
        std::shared_ptr<ReserveLedger> ledger,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    HedgeResult execute(const HedgeRequest& req);

    HedgeMode mode_for(double seconds_remaining) const;
    Price max_price_for(HedgeMode mode) const;

    HedgeEscalatorStats stats() const;
    std::vector<HedgeEvent> recent_events(size_t limit = 50) const;

private:
    HedgeEscalatorConfig config_;
    std::shared_ptr<OrderGateway> gateway_;
    std::shared_ptr<VenueClient> venue_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<FundsChecker> funds_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::deque<HedgeEvent> events_;
    int64_t sequences_{0};
    int64_t attempts_{0};
    int64_t successes_{0};
    int64_t failures_{0};
    int64_t aborts_{0};

    void log_event(const HedgeRequest& req, HedgeEventType type, int step, Price price,
                   Size shares, const std::string& reason = "",
                   const std::string& order_id = "", Size filled = 0.0);

    HedgeResult fail(const HedgeRequest& req, HedgeErrorCode code, std::string error,
                     int attempts) const;

    DepthResponse fetch_depth(const std::string& token_id);
};

} // namespace updown
