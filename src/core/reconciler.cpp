#include "core/reconciler.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace updown {

namespace {

struct MarketChanges {
    std::string asset;
    int removed{0};
    int adopted{0};
    int resized{0};
    int reservations_released{0};
};

} // namespace

std::string ReconciliationResult::summary() const {
    std::string s;
    s += fmt::format("Reconciliation {}: ", success ? "SUCCESS" : "FAILED");
    s += fmt::format("{} discrepancies, ", discrepancies.size());
    s += fmt::format("{} removed, ", orders_removed);
    s += fmt::format("{} adopted, ", orders_adopted);
    s += fmt::format("{} resized, ", orders_resized);
    s += fmt::format("{} reservations released", reservations_released);
    if (!error_message.empty()) {
        s += fmt::format(" [Error: {}]", error_message);
    }
    return s;
}

Reconciler::Reconciler(
    std::shared_ptr<VenueClient> venue,
    std::shared_ptr<OrderManager> order_manager,
    std::shared_ptr<ReserveLedger> ledger,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : venue_(std::move(venue))
    , order_manager_(std::move(order_manager))
    , ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("Reconciler initialized: strategy=TRUST_VENUE");
}

void Reconciler::reconcile_side(
    const MarketSpec& market,
    Outcome side,
    std::map<std::string, TrackedOrder>& local,
    const std::vector<RemoteOrder>& remote,
    ReconciliationResult& result
) {
    std::map<std::string, const RemoteOrder*> remote_map;
    for (const auto& o : remote) {
        remote_map[o.order_id] = &o;
    }

    // Local but not on the venue: filled or cancelled behind our back
    for (auto it = local.begin(); it != local.end();) {
        auto rit = remote_map.find(it->first);
        if (rit == remote_map.end()) {
            Discrepancy d;
            d.type = DiscrepancyType::MISSING_REMOTE_ORDER;
            d.key = market.key();
            d.side = side;
            d.order_id = it->first;
            d.local_value = fmt::format("BUY@{:.2f} x {:.2f}", it->second.price, it->second.size);
            d.remote_value = "not present";
            result.discrepancies.push_back(std::move(d));
            it = local.erase(it);
            result.orders_removed++;
            continue;
        }

        const Size remaining = std::max(0.0, rit->second->size - rit->second->size_matched);
        if (std::abs(remaining - it->second.size) > 1e-6) {
            Discrepancy d;
            d.type = DiscrepancyType::ORDER_SIZE_MISMATCH;
            d.key = market.key();
            d.side = side;
            d.order_id = it->first;
            d.local_value = fmt::format("{:.2f}", it->second.size);
            d.remote_value = fmt::format("{:.2f}", remaining);
            result.discrepancies.push_back(std::move(d));
            it->second.size = remaining;
            result.orders_resized++;
        }
        ++it;
    }

    // On the venue but not tracked: adopt resting BUY orders
    for (const auto& o : remote) {
        if (o.side != Side::BUY || local.count(o.order_id) > 0) continue;

        TrackedOrder adopted;
        adopted.order_id = o.order_id;
        adopted.price = o.price;
        adopted.size = std::max(0.0, o.size - o.size_matched);
        adopted.side = side;
        adopted.placed_at = o.created_at_ms;
        local[o.order_id] = adopted;

        if (!ledger_->find(o.order_id)) {
            ledger_->reserve(o.order_id, market.market_id, adopted.price * adopted.size, side);
        }

        Discrepancy d;
        d.type = DiscrepancyType::MISSING_LOCAL_ORDER;
        d.key = market.key();
        d.side = side;
        d.order_id = o.order_id;
        d.local_value = "not present";
        d.remote_value = fmt::format("BUY@{:.2f} x {:.2f}", adopted.price, adopted.size);
        result.discrepancies.push_back(std::move(d));
        result.orders_adopted++;
    }
}

ReconciliationResult Reconciler::reconcile(const std::vector<MarketSpec>& markets) {
    ReconciliationResult result;
    const EpochMs snapshot_ts = clock_->now_ms();

    OpenOrdersResponse open;
    try {
        open = venue_->get_open_orders();
    } catch (const std::exception& e) {
        open.success = false;
        open.error = std::string("Exception: ") + e.what();
    }
    if (!open.success) {
        result.error_message = open.error;
        spdlog::warn("[Reconciler] Open orders fetch failed, state unchanged: {}", open.error);
        return result;
    }

    std::map<std::string, std::vector<RemoteOrder>> by_token;
    std::set<std::string> remote_ids;
    for (const auto& o : open.orders) {
        by_token[o.token_id].push_back(o);
        remote_ids.insert(o.order_id);
    }

    std::map<std::string, MarketChanges> changes;
    static const std::vector<RemoteOrder> kNone;
    for (const auto& market : markets) {
        auto orders = order_manager_->market_orders(market.key());
        std::lock_guard<std::mutex> market_lock(orders->mutex);

        const int removed_before = result.orders_removed;
        const int adopted_before = result.orders_adopted;
        const int resized_before = result.orders_resized;

        auto up_it = by_token.find(market.up_token_id);
        auto down_it = by_token.find(market.down_token_id);
        reconcile_side(market, Outcome::UP, orders->up,
                       up_it != by_token.end() ? up_it->second : kNone, result);
        reconcile_side(market, Outcome::DOWN, orders->down,
                       down_it != by_token.end() ? down_it->second : kNone, result);

        auto& c = changes[market.market_id];
        c.asset = market.asset;
        c.removed = result.orders_removed - removed_before;
        c.adopted = result.orders_adopted - adopted_before;
        c.resized = result.orders_resized - resized_before;

        order_manager_->mark_reconciled(market.key());
    }

    // Reservations of markets outside this pass belong to other in-flight work
    std::set<std::string> market_ids;
    for (const auto& market : markets) market_ids.insert(market.market_id);
    std::vector<Reservation> released;
    result.reservations_released = ledger_->reconcile(remote_ids, snapshot_ts, &market_ids, &released);
    for (const auto& r : released) {
        changes[r.market_id].reservations_released++;
    }
    result.success = true;

    if (!result.discrepancies.empty()) {
        spdlog::warn("[Reconciler] Found {} discrepancies:", result.discrepancies.size());
        for (const auto& d : result.discrepancies) {
            spdlog::warn("  - {} {} {} {}: local='{}' remote='{}'",
                         discrepancy_to_string(d.type), d.key.to_string(),
                         outcome_to_string(d.side), d.order_id, d.local_value, d.remote_value);
        }
    }
    if (result.orders_removed > 0 || result.orders_adopted > 0 ||
        result.orders_resized > 0 || result.reservations_released > 0) {
        spdlog::info("[Reconciler] {}", result.summary());
    }

    // One event per market that changed
    const EpochMs now = clock_->now_ms();
    for (const auto& [market_id, c] : changes) {
        if (c.removed == 0 && c.adopted == 0 && c.resized == 0 && c.reservations_released == 0) {
            continue;
        }
        TelemetryEvent event;
        event.type = "ORDERS_RECONCILED";
        event.ts_ms = now;
        event.market_id = market_id;
        event.asset = c.asset;
        event.data = {
            {"removed", c.removed},
            {"adopted", c.adopted},
            {"resized", c.resized},
            {"reservations_released", c.reservations_released}
        };
        emit_event(sink_.get(), event);
    }
    return result;
}

} // namespace updown
