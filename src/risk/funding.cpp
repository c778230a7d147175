#include "risk/funding.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace updown {

// ============================================================================
// ReserveLedger
// ============================================================================

ReserveLedger::ReserveLedger(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock))
{
}

void ReserveLedger::reserve(const std::string& order_id, const std::string& market_id,
                            Notional notional, Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    Reservation r;
    r.order_id = order_id;
    r.market_id = market_id;
    r.notional = std::max(0.0, notional);
    r.outcome = outcome;
    r.created_at = clock_->now_ms();
    reservations_[order_id] = r;
}

Notional ReserveLedger::release(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(order_id);
    if (it == reservations_.end()) return 0.0;
    Notional released = it->second.notional;
    reservations_.erase(it);
    return released;
}

void ReserveLedger::on_fill(const std::string& order_id, Notional filled_notional) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(order_id);
    if (it == reservations_.end()) return;
    it->second.notional -= filled_notional;
    if (it->second.notional <= 1e-9) {
        reservations_.erase(it);
    }
}

Notional ReserveLedger::total_reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Notional total = 0.0;
    for (const auto& [id, r] : reservations_) {
        total += r.notional;
    }
    return total;
}

Notional ReserveLedger::market_reserved(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Notional total = 0.0;
    for (const auto& [id, r] : reservations_) {
        if (r.market_id == market_id) total += r.notional;
    }
    return total;
}

std::optional<Reservation> ReserveLedger::find(const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(order_id);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
}

int ReserveLedger::reconcile(const std::set<std::string>& active_ids, EpochMs as_of_ms,
                             const std::set<std::string>* market_ids,
                             std::vector<Reservation>* released_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    int released = 0;
    for (auto it = reservations_.begin(); it != reservations_.end();) {
        const bool in_scope = !market_ids || market_ids->count(it->second.market_id) > 0;
        if (in_scope && active_ids.count(it->first) == 0 && it->second.created_at <= as_of_ms) {
            spdlog::info("[ReserveLedger] Releasing stale reservation {} (${:.2f})",
                         it->first, it->second.notional);
            if (released_out) released_out->push_back(it->second);
            it = reservations_.erase(it);
            released++;
        } else {
            ++it;
        }
    }
    return released;
}

void ReserveLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_.clear();
}

std::vector<Reservation> ReserveLedger::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Reservation> out;
    out.reserve(reservations_.size());
    for (const auto& [id, r] : reservations_) {
        out.push_back(r);
    }
    return out;
}

// ============================================================================
// FundingGate
// ============================================================================

FundingGate::FundingGate(
    const FundingConfig& config,
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
    spdlog::info("FundingGate initialized: buffer=${:.2f}, min_balance=${:.2f}, "
                 "max_per_market=${:.2f}, max_total=${:.2f}",
                 config_.safety_buffer_usd, config_.min_balance_for_trading,
                 config_.max_reserved_per_market, config_.max_total_reserved);
}

double FundingGate::fetch_balance_locked() {
    const EpochMs now = clock_->now_ms();
    if (cached_balance_ && now - balance_fetched_at_ < config_.stale_balance_ms) {
        return *cached_balance_;
    }

    try {
        auto resp = venue_->get_balance();
        if (resp.success) {
            cached_balance_ = resp.available;
            balance_fetched_at_ = now;
            return resp.available;
        }
        spdlog::warn("[FundingGate] Balance fetch failed: {}", resp.error);
    } catch (const std::exception& e) {
        spdlog::warn("[FundingGate] Balance fetch threw: {}", e.what());
    }
    return cached_balance_.value_or(0.0);
}

double FundingGate::current_balance() {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_balance_locked();
}

void FundingGate::invalidate_balance_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_fetched_at_ = 0;
}

FundsCheckResult FundingGate::block(const std::string& market_id, Outcome side, Notional notional,
                                    FundsBlockReason code, std::string reason,
                                    FundsCheckResult base) {
    base.can_proceed = false;
    base.reason_code = code;
    base.reason = std::move(reason);

    BlockedOrder entry;
    entry.ts = clock_->now_ms();
    entry.market_id = market_id;
    entry.side = side;
    entry.notional = notional;
    entry.reason_code = code;
    entry.reason = base.reason;
    blocked_log_.push_back(entry);
    while (blocked_log_.size() > config_.blocked_log_capacity) {
        blocked_log_.pop_front();
    }

    spdlog::warn("[FundingGate] BLOCKED {} {} ${:.2f}: {}",
                 market_id, outcome_to_string(side), notional, base.reason);

    TelemetryEvent event;
    event.type = "ORDER_BLOCKED_INSUFFICIENT_FUNDS";
    event.ts_ms = entry.ts;
    event.market_id = market_id;
    event.data = {
        {"side", outcome_to_string(side)},
        {"notional", notional},
        {"reason_code", funds_block_reason_to_string(code)},
        {"reason", base.reason},
        {"balance", base.balance},
        {"total_reserved", base.total_reserved},
        {"market_reserved", base.market_reserved}
    };
    emit_event(sink_.get(), event);

    return base;
}

FundsCheckResult FundingGate::can_place_order(const std::string& market_id, Outcome side,
                                              Notional notional) {
    std::lock_guard<std::mutex> lock(mutex_);

    FundsCheckResult result;
    result.balance = fetch_balance_locked();
    result.total_reserved = ledger_->total_reserved();
    result.market_reserved = ledger_->market_reserved(market_id);
    result.available = result.balance - result.total_reserved - config_.safety_buffer_usd;

    if (result.balance < config_.min_balance_for_trading) {
        return block(market_id, side, notional, FundsBlockReason::BELOW_MIN_BALANCE,
                     fmt::format("balance ${:.2f} below minimum ${:.2f}",
                                 result.balance, config_.min_balance_for_trading),
                     result);
    }

    if (result.market_reserved + notional > config_.max_reserved_per_market) {
        return block(market_id, side, notional, FundsBlockReason::INSUFFICIENT_BALANCE,
                     fmt::format("market reservation ${:.2f} + ${:.2f} exceeds ${:.2f}",
                                 result.market_reserved, notional, config_.max_reserved_per_market),
                     result);
    }

    if (result.total_reserved + notional > config_.max_total_reserved) {
        return block(market_id, side, notional, FundsBlockReason::INSUFFICIENT_BALANCE,
                     fmt::format("total reservation ${:.2f} + ${:.2f} exceeds ${:.2f}",
                                 result.total_reserved, notional, config_.max_total_reserved),
                     result);
    }

    if (result.available < notional) {
        return block(market_id, side, notional, FundsBlockReason::INSUFFICIENT_BALANCE,
                     fmt::format("available ${:.2f} < required ${:.2f}", result.available, notional),
                     result);
    }

    result.can_proceed = true;
    return result;
}

std::vector<BlockedOrder> FundingGate::blocked_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<BlockedOrder>(blocked_log_.begin(), blocked_log_.end());
}

} // namespace updown
