#pragma once

#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/venue_client.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

struct Reservation {
    std::string order_id;
    std::string market_id;
    Notional notional{0.0};
    Outcome outcome{Outcome::UP};
    EpochMs created_at{0};
};

/**
 * Notional reserved by in-flight and resting orders.
 * Reserve and release are atomic under one mutex.
 */
class ReserveLedger {
public:
    explicit ReserveLedger(std::shared_ptr<Clock> clock);

    void reserve(const std::string& order_id, const std::string& market_id,
                 Notional notional, Outcome outcome);
    // Returns the released notional (0 if the id was unknown)
    Notional release(const std::string& order_id);
    // Reduce by filled notional, releasing at zero
    void on_fill(const std::string& order_id, Notional filled_notional);

    Notional total_reserved() const;
    Notional market_reserved(const std::string& market_id) const;
    std::optional<Reservation> find(const std::string& order_id) const;

    // Release reservations whose id is not in active_ids; returns the count.
    // Reservations created after as_of_ms postdate the venue snapshot and are kept.
    // With market_ids set, only reservations of those markets are considered.
    // The released entries are appended to `released` when given.
    int reconcile(const std::set<std::string>& active_ids,
                  EpochMs as_of_ms = std::numeric_limits<EpochMs>::max(),
                  const std::set<std::string>* market_ids = nullptr,
                  std::vector<Reservation>* released = nullptr);

    void clear();
    std::vector<Reservation> all() const;

private:
    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Reservation> reservations_;
};

enum class FundsBlockReason {
    NONE,
    BELOW_MIN_BALANCE,
    INSUFFICIENT_BALANCE
};

inline std::string funds_block_reason_to_string(FundsBlockReason r) {
    switch (r) {
        case FundsBlockReason::NONE: return "NONE";
        case FundsBlockReason::BELOW_MIN_BALANCE: return "BELOW_MIN_BALANCE";
        case FundsBlockReason::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
    }
    return "UNKNOWN";
}

struct FundsCheckResult {
    bool can_proceed{false};
    FundsBlockReason reason_code{FundsBlockReason::NONE};
    std::string reason;
    double balance{0.0};
    Notional total_reserved{0.0};
    Notional market_reserved{0.0};
    double available{0.0};

    explicit operator bool() const { return can_proceed; }
};

/**
 * Funds port consulted before reserving notional for an order.
 */
class FundsChecker {
public:
    virtual ~FundsChecker() = default;

    virtual FundsCheckResult can_place_order(const std::string& market_id, Outcome side,
                                             Notional notional) = 0;
    virtual void invalidate_balance_cache() = 0;
};

struct BlockedOrder {
    EpochMs ts{0};
    std::string market_id;
    Outcome side{Outcome::UP};
    Notional notional{0.0};
    FundsBlockReason reason_code{FundsBlockReason::NONE};
    std::string reason;
};

/**
 * Balance-aware funding gate.
 *
 * DESIGN:
 * - Venue balance cached for stale_balance_ms; a failed fetch falls back
 *   to the cached value, or 0 when nothing was ever fetched
 * - Limits apply to balance net of everything already reserved
 * - Every block is kept in a bounded log and emitted as telemetry
 */
class FundingGate : public FundsChecker {
public:
    FundingGate(
        const FundingConfig& config,
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<ReserveLedger> ledger,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    FundsCheckResult can_place_order(const std::string& market_id, Outcome side,
                                     Notional notional) override;
    void invalidate_balance_cache() override;

    double current_balance();
    std::vector<BlockedOrder> blocked_orders() const;

private:
    FundingConfig config_;
    std::shared_ptr<VenueClient> venue_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::optional<double> cached_balance_;
    EpochMs balance_fetched_at_{0};
    std::deque<BlockedOrder> blocked_log_;

    double fetch_balance_locked();
    FundsCheckResult block(const std::string& market_id, Outcome side, Notional notional,
                           FundsBlockReason code, std::string reason, FundsCheckResult base);
};

} // namespace updown
