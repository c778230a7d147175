#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "risk/price_guard.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class HedgeIntent {
    HEDGE,
    HEDGE_URGENT,
    SURVIVAL,
    EMERGENCY_EXIT
};

inline std::string hedge_intent_to_string(HedgeIntent i) {
    switch (i) {
        case HedgeIntent::HEDGE: return "HEDGE";
        case HedgeIntent::HEDGE_URGENT: return "HEDGE_URGENT";
        case HedgeIntent::SURVIVAL: return "SURVIVAL";
        case HedgeIntent::EMERGENCY_EXIT: return "EMERGENCY_EXIT";
    }
    return "UNKNOWN";
}

enum class HedgeResolution {
    PENDING,
    HEDGED,
    EXITED,
    EXPIRED_UNHEDGED
};

inline std::string hedge_resolution_to_string(HedgeResolution r) {
    switch (r) {
        case HedgeResolution::PENDING: return "PENDING";
        case HedgeResolution::HEDGED: return "HEDGED";
        case HedgeResolution::EXITED: return "EXITED";
        case HedgeResolution::EXPIRED_UNHEDGED: return "EXPIRED_UNHEDGED";
    }
    return "UNKNOWN";
}

enum class HedgeAction {
    WAIT,
    PLACE_HEDGE,
    REPRICE_HEDGE,
    EMERGENCY_EXIT
};

inline std::string hedge_action_to_string(HedgeAction a) {
    switch (a) {
        case HedgeAction::WAIT: return "WAIT";
        case HedgeAction::PLACE_HEDGE: return "PLACE_HEDGE";
        case HedgeAction::REPRICE_HEDGE: return "REPRICE_HEDGE";
        case HedgeAction::EMERGENCY_EXIT: return "EMERGENCY_EXIT";
    }
    return "UNKNOWN";
}

/**
 * Lifecycle of one one-sided entry until it is hedged, exited or expires.
 */
struct HedgeState {
    EpochMs entry_fill_ts{0};
    Outcome entry_side{Outcome::UP};
    Size entry_qty{0.0};

    int hedge_attempts{0};
    EpochMs last_attempt_ts{0};
    HedgeIntent current_intent{HedgeIntent::HEDGE};

    std::optional<EpochMs> hedge_fill_ts;
    Size hedge_fill_qty{0.0};

    bool resolved{false};
    HedgeResolution resolution{HedgeResolution::PENDING};

    Outcome hedge_side() const { return opposite(entry_side); }
};

struct HedgeDecision {
    bool should_act{false};
    HedgeAction action{HedgeAction::WAIT};
    HedgeIntent intent{HedgeIntent::HEDGE};
    std::string reason;
    bool emergency_mode{false};
};

struct HedgePrice {
    Price price{0.0};
    bool emergency_mode{false};
};

/**
 * HedgePriorityLane decides when and how aggressively to hedge, and
 * which intents may skip admission gates.
 *
 * DESIGN:
 * - Escalation is driven by time since the entry fill, except that the
 *   final emergency window is driven by time to expiry
 * - Every PLACE/REPRICE decision counts as exactly one attempt
 * - Hedge intents bypass rate, burst and pair-cost gating: completing a
 *   hedge always outranks throttling
 */
class HedgePriorityLane {
public:
    HedgePriorityLane(
        const HedgePriorityConfig& config,
        std::shared_ptr<PriceGuard> price_guard,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    // Intent classification
    static bool is_hedge_priority_intent(const std::string& intent);
    static bool should_bypass_rate_limiter(const std::string& intent) { return is_hedge_priority_intent(intent); }
    static bool should_bypass_burst_limiter(const std::string& intent) { return is_hedge_priority_intent(intent); }
    static bool should_bypass_cpp_gating(const std::string& intent) { return is_hedge_priority_intent(intent); }

    HedgeIntent get_escalation_level(double secs_since_entry) const;

    // Lifecycle
    void start_tracking(const MarketKey& key, Outcome entry_side, Size entry_qty);
    void record_hedge_fill(const MarketKey& key, Size fill_qty);
    void record_emergency_exit(const MarketKey& key, Size exit_qty);
    void mark_expired(const MarketKey& key);
    void clear(const MarketKey& key);

    std::optional<HedgeState> get_state(const MarketKey& key) const;
    bool is_active(const MarketKey& key) const;

    HedgeDecision get_hedge_decision(
        const MarketKey& key,
        double seconds_to_expiry,
        bool has_open_hedge_order
    );

    HedgePrice calculate_hedge_price(HedgeIntent intent, const BookSnapshot& book) const;

    const HedgePriorityConfig& config() const { return config_; }

private:
    HedgePriorityConfig config_;
    std::shared_ptr<PriceGuard> price_guard_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<MarketKey, HedgeState> states_;

    void emit_completed(const MarketKey& key, const HedgeState& state, EpochMs now,
                        Size exit_qty = 0.0);
};

} // namespace updown
