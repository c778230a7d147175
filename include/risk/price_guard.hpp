#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class PriceBlockReason {
    NONE,
    INVALID_BOOK,            // Non-finite or non-positive best bid/ask
    INVERTED_BOOK,           // best_bid >= best_ask
    INVALID_PRICE,           // Requested price non-finite or non-positive
    CROSSING_BLOCKED,        // Would cross and emergency mode is off
    EMERGENCY_RATE_LIMITED   // Emergency crossing inside the per-market cooldown
};

inline std::string price_block_reason_to_string(PriceBlockReason r) {
    switch (r) {
        case PriceBlockReason::NONE: return "NONE";
        case PriceBlockReason::INVALID_BOOK: return "INVALID_BOOK";
        case PriceBlockReason::INVERTED_BOOK: return "INVERTED_BOOK";
        case PriceBlockReason::INVALID_PRICE: return "INVALID_PRICE";
        case PriceBlockReason::CROSSING_BLOCKED: return "CROSSING_BLOCKED";
        case PriceBlockReason::EMERGENCY_RATE_LIMITED: return "EMERGENCY_RATE_LIMITED";
    }
    return "UNKNOWN";
}

/**
 * Outcome of a price check. When allowed, safe_price is the only price
 * that may be submitted; ticks_from_edge < 0 marks an emergency crossing.
 */
struct PriceCheckResult {
    bool allowed{false};
    Price safe_price{0.0};
    int ticks_from_edge{0};
    Price rounded_from{0.0};

    PriceBlockReason reason{PriceBlockReason::NONE};
    std::string message;
    Price requested_price{0.0};
    Price best_price{0.0};   // best_ask for BUY, best_bid for SELL

    bool is_emergency_cross() const { return allowed && ticks_from_edge < 0; }
    explicit operator bool() const { return allowed; }
};

struct PriceCheckRequest {
    Side side{Side::BUY};
    Price requested_price{0.0};
    BookSnapshot book;
    bool emergency_mode{false};
    MarketKey key;
    std::string intent;
};

struct BookFreshnessResult {
    bool fresh{false};
    int64_t age_ms{0};
    std::string reason;
};

struct SpreadCheckResult {
    bool sufficient{false};
    int spread_cents{0};
    std::string reason;
};

/**
 * PriceGuard is the single authority for submitted order prices.
 *
 * INVARIANT:
 * - BUY:  price <= best_ask - tick
 * - SELL: price >= best_bid + tick
 *
 * DESIGN:
 * - Prices are rounded toward the passive side before comparison
 *   (BUY down, SELL up), so rounding never manufactures a crossing
 * - Emergency mode allows a crossing of at most max_cross_ticks,
 *   at most once per emergency_min_interval_ms per market
 * - Broken books are always rejected, in every mode
 */
class PriceGuard {
public:
    PriceGuard(
        const PriceGuardConfig& config,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    // Rounding on the tick grid
    static Price round_buy_price(Price price, double tick = 0.01);
    static Price round_sell_price(Price price, double tick = 0.01);
    static Price round_price(Price price, Side side, double tick = 0.01);

    BookFreshnessResult check_book_freshness(const BookSnapshot& book) const;

    PriceCheckResult check_price(const PriceCheckRequest& request);

    // Passive prices one tick inside the touch, never violating the invariant
    Price select_maker_buy_price(const BookSnapshot& book) const;
    Price select_maker_sell_price(const BookSnapshot& book) const;
    Price select_maker_price(Side side, const BookSnapshot& book) const;

    SpreadCheckResult is_spread_sufficient(const BookSnapshot& book) const;

    bool is_emergency_window(double seconds_remaining) const {
        return seconds_remaining <= config_.emergency_window_s;
    }

    nlohmann::json build_order_telemetry(
        Side side,
        Price requested_price,
        Price submitted_price,
        const BookSnapshot& book,
        const std::string& intent,
        const MarketKey& key
    ) const;

    std::optional<EpochMs> last_emergency_order_ms(const MarketKey& key) const;
    void clear_market(const MarketKey& key);

    const PriceGuardConfig& config() const { return config_; }

private:
    PriceGuardConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<MarketKey, EpochMs> last_emergency_ms_;

    PriceCheckResult blocked(
        PriceBlockReason reason,
        std::string message,
        Price requested,
        Price best
    ) const;

    // Checks the cooldown and claims the slot atomically
    bool try_claim_emergency(const MarketKey& key, EpochMs now);
};

} // namespace updown
