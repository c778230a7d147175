#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/venue_client.hpp"
#include "risk/funding.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

/**
 * A resting BUY order the engine believes is live on the venue.
 */
struct TrackedOrder {
    std::string order_id;
    Price price{0.0};
    Size size{0.0};          // Remaining (unmatched) size
    Outcome side{Outcome::UP};
    EpochMs placed_at{0};
};

struct QuoteTarget {
    Price price{0.0};
    Size size{0.0};
};

struct SyncResult {
    int placed{0};
    int cancelled{0};
    Size filled_shares{0.0};     // Immediate fills reported at placement
    Notional filled_cost{0.0};
};

/**
 * Local order book of one market. The mutex serializes sync and
 * reconciliation for that market.
 */
struct MarketOrders {
    std::mutex mutex;
    std::map<std::string, TrackedOrder> up;
    std::map<std::string, TrackedOrder> down;

    std::map<std::string, TrackedOrder>& side(Outcome o) { return o == Outcome::UP ? up : down; }
};

/**
 * OrderManager keeps resting quotes aligned with target prices.
 *
 * DESIGN:
 * - Orders whose price left the target set are cancelled in parallel,
 *   max_concurrent_orders at a time
 * - Missing target prices are placed in batches of max_concurrent_orders
 * - Only successful placements are tracked; resting notional is
 *   reserved in the ledger and released on cancel
 */
class OrderManager {
public:
    OrderManager(
        const OrderManagerConfig& config,
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<ReserveLedger> ledger,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    SyncResult sync_orders(const MarketSpec& market, Outcome side,
                           const std::vector<QuoteTarget>& targets);

    int cancel_all_orders(const MarketSpec& market);

    // Cancels local ids plus the venue's BUY orders on that token
    int cancel_side_orders(const MarketSpec& market, Outcome side);

    // Track an order placed outside sync_orders (hedge placements)
    void track_order(const MarketKey& key, const TrackedOrder& order);

    // Reduce a tracked order by a fill reported after placement; drops it when done
    void apply_fill(const MarketKey& key, const std::string& order_id, Size filled);

    std::vector<TrackedOrder> orders(const MarketKey& key, Outcome side) const;
    size_t order_count(const MarketKey& key) const;

    bool needs_reconciliation(const MarketKey& key) const;
    void mark_reconciled(const MarketKey& key);

    // Per-market order state, created on first use
    std::shared_ptr<MarketOrders> market_orders(const MarketKey& key);

    void forget_market(const MarketKey& key);

private:
    struct PlaceOutcome {
        bool success{false};
        TrackedOrder order;
        Size filled{0.0};
        Price avg_price{0.0};
        std::string error;
    };

    struct CancelOutcome {
        std::string order_id;
        bool success{false};
        std::string error;
    };

    OrderManagerConfig config_;
    std::shared_ptr<VenueClient> venue_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<MarketKey, std::shared_ptr<MarketOrders>> markets_;
    std::map<MarketKey, EpochMs> last_reconcile_;

    std::shared_ptr<MarketOrders> find_market(const MarketKey& key) const;

    PlaceOutcome place_one(const MarketSpec& market, Outcome side, const QuoteTarget& quote);
    std::vector<CancelOutcome> cancel_parallel(const std::vector<std::string>& ids);
};

} // namespace updown
