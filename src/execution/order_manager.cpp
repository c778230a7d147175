#include "execution/order_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <set>
#include <stdexcept>

namespace updown {

namespace {

// Prices compared on a 1e-4 grid so 0.1 + 0.2 style noise never splits a level
long long price_key(Price p) {
    return std::llround(p * 10000.0);
}

const std::string& token_for(const MarketSpec& market, Outcome side) {
    return side == Outcome::UP ? market.up_token_id : market.down_token_id;
}

} // namespace

OrderManager::OrderManager(
    const OrderManagerConfig& config,
    std::shared_ptr<VenueClient> venue,
    std::shared_ptr<ReserveLedger> ledger,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , venue_(std::move(venue))
    , ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    if (config_.max_concurrent_orders == 0) {
        config_.max_concurrent_orders = 1;
    }
    spdlog::info("OrderManager initialized: batch={}, reconcile_interval={}ms",
                 config_.max_concurrent_orders, config_.reconcile_interval_ms);
}

std::shared_ptr<MarketOrders> OrderManager::market_orders(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = markets_[key];
    if (!slot) slot = std::make_shared<MarketOrders>();
    return slot;
}

std::shared_ptr<MarketOrders> OrderManager::find_market(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(key);
    return it != markets_.end() ? it->second : nullptr;
}

void OrderManager::forget_market(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    markets_.erase(key);
    last_reconcile_.erase(key);
}

std::vector<OrderManager::CancelOutcome> OrderManager::cancel_parallel(
    const std::vector<std::string>& ids
) {
    std::vector<CancelOutcome> results;
    results.reserve(ids.size());

    // At most max_concurrent_orders cancels in flight at once
    for (size_t i = 0; i < ids.size(); i += config_.max_concurrent_orders) {
        const size_t end = std::min(ids.size(), i + config_.max_concurrent_orders);
        std::vector<std::future<CancelOutcome>> batch;
        batch.reserve(end - i);
        for (size_t j = i; j < end; ++j) {
            const std::string id = ids[j];
            batch.push_back(std::async(std::launch::async, [this, id]() {
                CancelOutcome out;
                out.order_id = id;
                try {
                    auto res = venue_->cancel_order(id);
                    out.success = res.success;
                    out.error = res.error;
                } catch (const std::exception& e) {
                    out.error = e.what();
                }
                return out;
            }));
        }
        for (auto& f : batch) {
            results.push_back(f.get());
        }
    }
    return results;
}

OrderManager::PlaceOutcome OrderManager::place_one(
    const MarketSpec& market, Outcome side, const QuoteTarget& quote
) {
    PlaceOutcome out;
    OrderRequest req;
    req.token_id = token_for(market, side);
    req.side = Side::BUY;
    req.price = quote.price;
    req.size = quote.size;
    req.order_type = OrderType::GTC;

    try {
        auto res = venue_->place_order(req);
        if (!res.success || res.order_id.empty()) {
            out.error = res.error.empty() ? "Unknown error" : res.error;
            return out;
        }
        out.success = true;
        out.filled = res.filled_size;
        out.avg_price = res.avg_price > 0.0 ? res.avg_price : quote.price;
        out.order.order_id = res.order_id;
        out.order.price = quote.price;
        out.order.size = std::max(0.0, quote.size - res.filled_size);
        out.order.side = side;
        out.order.placed_at = clock_->now_ms();
    } catch (const std::exception& e) {
        out.error = e.what();
    }
    return out;
}

SyncResult OrderManager::sync_orders(const MarketSpec& market, Outcome side,
                                     const std::vector<QuoteTarget>& targets) {
    SyncResult result;
    auto orders = market_orders(market.key());
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    auto& current = orders->side(side);

    std::set<long long> target_prices;
    for (const auto& q : targets) {
        target_prices.insert(price_key(q.price));
    }

    // Cancel orders priced outside the target set
    std::vector<std::string> to_cancel;
    for (const auto& [id, order] : current) {
        if (target_prices.count(price_key(order.price)) == 0) {
            to_cancel.push_back(id);
        }
    }
    if (!to_cancel.empty()) {
        for (const auto& c : cancel_parallel(to_cancel)) {
            if (c.success) {
                current.erase(c.order_id);
                ledger_->release(c.order_id);
                result.cancelled++;
            } else {
                spdlog::warn("[OrderManager] Cancel failed for {}: {}", c.order_id, c.error);
            }
        }
    }

    std::set<long long> current_prices;
    for (const auto& [id, order] : current) {
        current_prices.insert(price_key(order.price));
    }

    std::vector<QuoteTarget> to_place;
    for (const auto& q : targets) {
        auto k = price_key(q.price);
        if (current_prices.count(k) == 0) {
            to_place.push_back(q);
            current_prices.insert(k);
        }
    }
    if (to_place.empty()) return result;

    spdlog::info("[OrderManager] {} placing {} {} orders",
                 market.key().to_string(), to_place.size(), outcome_to_string(side));

    for (size_t i = 0; i < to_place.size(); i += config_.max_concurrent_orders) {
        const size_t end = std::min(to_place.size(), i + config_.max_concurrent_orders);
        std::vector<std::future<PlaceOutcome>> batch;
        for (size_t j = i; j < end; ++j) {
            const QuoteTarget quote = to_place[j];
            batch.push_back(std::async(std::launch::async, [this, &market, side, quote]() {
                return place_one(market, side, quote);
            }));
        }

        for (auto& f : batch) {
            auto placed = f.get();
            if (!placed.success) {
                spdlog::warn("[OrderManager] {} place {} failed: {}",
                             market.key().to_string(), outcome_to_string(side), placed.error);
                continue;
            }
            result.placed++;
            if (placed.filled > 0.0) {
                result.filled_shares += placed.filled;
                result.filled_cost += placed.filled * placed.avg_price;
            }
            if (placed.order.size > 0.0) {
                ledger_->reserve(placed.order.order_id, market.market_id,
                                 placed.order.price * placed.order.size, side);
                current[placed.order.order_id] = placed.order;
            }
        }
    }

    spdlog::info("[OrderManager] {} placed {}/{} {} orders",
                 market.key().to_string(), result.placed, to_place.size(), outcome_to_string(side));

    TelemetryEvent event;
    event.type = "ORDERS_SYNCED";
    event.ts_ms = clock_->now_ms();
    event.market_id = market.market_id;
    event.asset = market.asset;
    event.data = {
        {"side", outcome_to_string(side)},
        {"placed", result.placed},
        {"cancelled", result.cancelled},
        {"filled_shares", result.filled_shares}
    };
    emit_event(sink_.get(), event);
    return result;
}

int OrderManager::cancel_all_orders(const MarketSpec& market) {
    auto orders = find_market(market.key());
    if (!orders) return 0;
    std::lock_guard<std::mutex> market_lock(orders->mutex);

    std::vector<std::string> ids;
    for (const auto& [id, o] : orders->up) ids.push_back(id);
    for (const auto& [id, o] : orders->down) ids.push_back(id);
    if (ids.empty()) return 0;

    int cancelled = 0;
    for (const auto& c : cancel_parallel(ids)) {
        if (c.success) {
            orders->up.erase(c.order_id);
            orders->down.erase(c.order_id);
            ledger_->release(c.order_id);
            cancelled++;
        } else {
            spdlog::warn("[OrderManager] CancelAll failed for {}: {}", c.order_id, c.error);
        }
    }
    spdlog::info("[OrderManager] {} cancelled {}/{} orders",
                 market.key().to_string(), cancelled, ids.size());
    return cancelled;
}

int OrderManager::cancel_side_orders(const MarketSpec& market, Outcome side) {
    auto orders = market_orders(market.key());
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    auto& current = orders->side(side);
    const auto& token = token_for(market, side);

    std::set<std::string> ids;
    for (const auto& [id, o] : current) ids.insert(id);

    try {
        auto open = venue_->get_open_orders();
        if (!open.success) {
            spdlog::warn("[OrderManager] CancelSide: open orders fetch failed: {}", open.error);
        } else {
            for (const auto& o : open.orders) {
                if (o.token_id == token && o.side == Side::BUY) ids.insert(o.order_id);
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("[OrderManager] CancelSide: open orders fetch threw: {}", e.what());
    }

    if (ids.empty()) return 0;

    int cancelled = 0;
    for (const auto& c : cancel_parallel(std::vector<std::string>(ids.begin(), ids.end()))) {
        if (c.success) {
            ledger_->release(c.order_id);
            cancelled++;
        } else {
            spdlog::warn("[OrderManager] Cancel {} failed for {}: {}",
                         outcome_to_string(side), c.order_id, c.error);
        }
    }
    // Failed cancels are picked up again by the next reconciliation
    current.clear();

    spdlog::info("[OrderManager] {} cancelled {}/{} {} orders",
                 market.key().to_string(), cancelled, ids.size(), outcome_to_string(side));
    return cancelled;
}

void OrderManager::track_order(const MarketKey& key, const TrackedOrder& order) {
    auto orders = market_orders(key);
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    orders->side(order.side)[order.order_id] = order;
}

void OrderManager::apply_fill(const MarketKey& key, const std::string& order_id, Size filled) {
    auto orders = find_market(key);
    if (!orders) return;
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    for (auto* side : {&orders->up, &orders->down}) {
        auto it = side->find(order_id);
        if (it == side->end()) continue;
        it->second.size -= filled;
        if (it->second.size <= 1e-9) {
            side->erase(it);
        }
        return;
    }
}

std::vector<TrackedOrder> OrderManager::orders(const MarketKey& key, Outcome side) const {
    std::vector<TrackedOrder> out;
    auto orders = find_market(key);
    if (!orders) return out;
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    for (const auto& [id, o] : orders->side(side)) out.push_back(o);
    return out;
}

size_t OrderManager::order_count(const MarketKey& key) const {
    auto orders = find_market(key);
    if (!orders) return 0;
    std::lock_guard<std::mutex> market_lock(orders->mutex);
    return orders->up.size() + orders->down.size();
}

bool OrderManager::needs_reconciliation(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_reconcile_.find(key);
    const EpochMs last = it != last_reconcile_.end() ? it->second : 0;
    return clock_->now_ms() - last > config_.reconcile_interval_ms;
}

void OrderManager::mark_reconciled(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_reconcile_[key] = clock_->now_ms();
}

} // namespace updown
