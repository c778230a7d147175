#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class PairingState {
    FLAT,            // No inventory
    ONE_SIDED_UP,    // Exposed on UP only (or UP-dominant)
    ONE_SIDED_DOWN,  // Exposed on DOWN only (or DOWN-dominant)
    PAIRING,         // Actively completing the pair
    PAIRED,          // Balanced inventory
    UNWIND_ONLY      // Too close to expiry, no new risk
};

inline std::string pairing_state_to_string(PairingState s) {
    switch (s) {
        case PairingState::FLAT: return "FLAT";
        case PairingState::ONE_SIDED_UP: return "ONE_SIDED_UP";
        case PairingState::ONE_SIDED_DOWN: return "ONE_SIDED_DOWN";
        case PairingState::PAIRING: return "PAIRING";
        case PairingState::PAIRED: return "PAIRED";
        case PairingState::UNWIND_ONLY: return "UNWIND_ONLY";
    }
    return "UNKNOWN";
}

inline bool is_one_sided(PairingState s) {
    return s == PairingState::ONE_SIDED_UP || s == PairingState::ONE_SIDED_DOWN;
}

struct PricePoint {
    EpochMs ts{0};
    Price mid_price{0.0};
};

/**
 * Inventory and lifecycle of one (market, asset).
 */
struct MarketStateContext {
    MarketKey key;
    PairingState state{PairingState::FLAT};
    Size up_shares{0.0};
    Size down_shares{0.0};

    std::optional<EpochMs> pairing_start;
    std::string pairing_reason;

    std::deque<PricePoint> price_history;

    EpochMs state_entered_at{0};
    EpochMs last_transition_at{0};
};

struct PairingTimeoutResult {
    bool timed_out{false};
    double time_in_pairing_s{0.0};
};

struct HedgeCap {
    double base_cap{0.0};
    double dynamic_cap{0.0};
    double final_cap{0.0};
    std::optional<double> recent_vol;
};

struct HedgePriceCheck {
    bool allowed{false};
    HedgeCap cap;
};

struct HedgeChunk {
    double raw_chunk{0.0};
    double bounded_chunk{0.0};
};

struct TickResult {
    PairingState state{PairingState::FLAT};
    bool pairing_timed_out{false};
    double time_in_pairing_s{0.0};
    bool should_cancel_unfilled_hedges{false};
};

/**
 * MarketStateManager owns the pairing lifecycle of every market.
 *
 * DESIGN:
 * - State is a function of inventory and elapsed time only
 * - UNWIND_ONLY is absorbing: once inside the unwind window a market
 *   never takes new risk again
 * - PAIRING has a hard deadline; a timeout reverts to ONE_SIDED exactly
 *   once and tells the caller to cancel resting hedge orders
 * - Hedge slippage caps widen with recent volatility, up to a per-asset max
 */
class MarketStateManager {
public:
    MarketStateManager(
        const MarketStateConfig& config,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    // Contexts are created lazily and live until clear_market()
    MarketStateContext& get_or_create_context(const MarketKey& key);
    std::optional<MarketStateContext> find_context(const MarketKey& key) const;
    PairingState get_state(const MarketKey& key) const;
    void clear_market(const MarketKey& key);

    void update_inventory(const MarketKey& key, Size up_shares, Size down_shares);
    void record_price(const MarketKey& key, Price mid_price);

    // State machine
    PairingState determine_state(const MarketStateContext& ctx, double seconds_remaining) const;
    void transition_state(
        MarketStateContext& ctx,
        PairingState new_state,
        const std::string& reason = "",
        const PairBookData& book_data = {}
    );
    // Move a one-sided market into PAIRING (no-op from any other state)
    bool begin_pairing(const MarketKey& key, const std::string& reason,
                       const PairBookData& book_data = {});
    PairingTimeoutResult check_pairing_timeout(MarketStateContext& ctx);

    // Dynamic hedge caps
    HedgeCap calculate_dynamic_hedge_cap(const std::string& asset, const MarketStateContext& ctx) const;
    HedgePriceCheck is_hedge_price_allowed(
        const std::string& asset,
        const MarketStateContext& ctx,
        double implied_pair_cost_cents
    );

    // Hedge chunk sizing
    HedgeChunk calculate_bounded_hedge_chunk(Size one_sided_shares) const;
    bool is_hedge_size_allowed(Size intended_hedge_size, Size one_sided_shares) const;

    TickResult process_tick(
        const MarketKey& key,
        Size up_shares,
        Size down_shares,
        double seconds_remaining,
        std::optional<Price> mid_price = std::nullopt,
        const PairBookData& book_data = {}
    );

    size_t market_count() const;
    const MarketStateConfig& config() const { return config_; }

private:
    MarketStateConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<MarketKey, MarketStateContext> contexts_;

    std::optional<double> recent_volatility(const MarketStateContext& ctx) const;
    void prune_history(MarketStateContext& ctx, EpochMs now) const;

    void log_pairing_started(const MarketStateContext& ctx, const PairBookData& book_data);
    void log_pairing_timeout(const MarketStateContext& ctx, double time_in_pairing_s,
                             PairingState revert_to);
};

} // namespace updown
