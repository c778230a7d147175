#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/order_manager.hpp"
#include "market_data/venue_client.hpp"
#include "risk/funding.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

/**
 * Discrepancy types found during reconciliation.
 */
enum class DiscrepancyType {
    MISSING_LOCAL_ORDER,     // Order on venue not tracked locally
    MISSING_REMOTE_ORDER,    // Order tracked locally but gone from venue
    ORDER_SIZE_MISMATCH      // Remaining size differs (partial fill missed)
};

inline std::string discrepancy_to_string(DiscrepancyType d) {
    switch (d) {
        case DiscrepancyType::MISSING_LOCAL_ORDER: return "MISSING_LOCAL_ORDER";
        case DiscrepancyType::MISSING_REMOTE_ORDER: return "MISSING_REMOTE_ORDER";
        case DiscrepancyType::ORDER_SIZE_MISMATCH: return "ORDER_SIZE_MISMATCH";
    }
    return "UNKNOWN";
}

/**
 * A single discrepancy found during reconciliation.
 */
struct Discrepancy {
    DiscrepancyType type;
    MarketKey key;
    Outcome side{Outcome::UP};
    std::string order_id;
    std::string local_value;
    std::string remote_value;
};

/**
 * Result of one reconciliation pass.
 */
struct ReconciliationResult {
    bool success{false};
    std::vector<Discrepancy> discrepancies;

    int orders_removed{0};          // Local entries dropped
    int orders_adopted{0};          // Remote entries added
    int orders_resized{0};
    int reservations_released{0};

    std::string error_message;

    bool is_consistent() const { return success && discrepancies.empty(); }
    std::string summary() const;
};

/**
 * Reconciler aligns local order tracking with the venue's open orders.
 *
 * DESIGN:
 * - The venue is the source of truth; open orders are fetched once per pass
 * - Per token: local orders absent remotely are dropped, remote BUY
 *   orders absent locally are adopted at their unmatched size
 * - Each market is reconciled under its order lock, so a pass never
 *   interleaves with an in-flight sync for the same market
 * - Ledger reservations of the reconciled markets whose ids are no
 *   longer open are released; other markets' reservations are untouched
 * - A fetch failure leaves all local state unchanged
 */
class Reconciler {
public:
    Reconciler(
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<OrderManager> order_manager,
        std::shared_ptr<ReserveLedger> ledger,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    ReconciliationResult reconcile(const std::vector<MarketSpec>& markets);

private:
    std::shared_ptr<VenueClient> venue_;
    std::shared_ptr<OrderManager> order_manager_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    void reconcile_side(const MarketSpec& market, Outcome side,
                        std::map<std::string, TrackedOrder>& local,
                        const std::vector<RemoteOrder>& remote,
                        ReconciliationResult& result);
};

} // namespace updown
