#include "core/market_state_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace updown {

MarketStateManager::MarketStateManager(
    const MarketStateConfig& config,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("MarketStateManager initialized: pairing_timeout={}s, unwind={}s, min_paired={}, "
                 "chunk=[{}, {}]",
                 config_.pairing_timeout_s, config_.unwind_threshold_s,
                 config_.min_paired_shares, config_.min_hedge_chunk_abs,
                 config_.max_hedge_chunk_abs);
}

MarketStateContext& MarketStateManager::get_or_create_context(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(key);
    if (it != contexts_.end()) return it->second;

    const EpochMs now = clock_->now_ms();
    MarketStateContext ctx;
    ctx.key = key;
    ctx.state_entered_at = now;
    ctx.last_transition_at = now;
    return contexts_.emplace(key, std::move(ctx)).first->second;
}

std::optional<MarketStateContext> MarketStateManager::find_context(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(key);
    if (it == contexts_.end()) return std::nullopt;
    return it->second;
}

PairingState MarketStateManager::get_state(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(key);
    return it == contexts_.end() ? PairingState::FLAT : it->second.state;
}

void MarketStateManager::clear_market(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_.erase(key);
}

size_t MarketStateManager::market_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

void MarketStateManager::update_inventory(const MarketKey& key, Size up_shares, Size down_shares) {
    auto& ctx = get_or_create_context(key);
    ctx.up_shares = std::max(0.0, up_shares);
    ctx.down_shares = std::max(0.0, down_shares);
}

void MarketStateManager::prune_history(MarketStateContext& ctx, EpochMs now) const {
    const auto cutoff = now - static_cast<EpochMs>(config_.volatility_lookback_s * 1000.0);
    while (!ctx.price_history.empty() && ctx.price_history.front().ts < cutoff) {
        ctx.price_history.pop_front();
    }
}

void MarketStateManager::record_price(const MarketKey& key, Price mid_price) {
    auto& ctx = get_or_create_context(key);
    const EpochMs now = clock_->now_ms();
    ctx.price_history.push_back({now, mid_price});
    prune_history(ctx, now);
}

// ============================================================================
// State machine
// ============================================================================

PairingState MarketStateManager::determine_state(const MarketStateContext& ctx,
                                                 double seconds_remaining) const {
    const Size up = ctx.up_shares;
    const Size down = ctx.down_shares;
    const Size paired = std::min(up, down);

    if (seconds_remaining <= config_.unwind_threshold_s || ctx.state == PairingState::UNWIND_ONLY) {
        return PairingState::UNWIND_ONLY;
    }

    if (up == 0.0 && down == 0.0) {
        return PairingState::FLAT;
    }

    if (paired >= config_.min_paired_shares &&
        std::abs(up - down) <= paired * config_.paired_imbalance_pct) {
        return PairingState::PAIRED;
    }

    if (up > 0.0 && down == 0.0) return PairingState::ONE_SIDED_UP;
    if (down > 0.0 && up == 0.0) return PairingState::ONE_SIDED_DOWN;

    // Both sides held but unbalanced: stay in PAIRING while it lasts
    if (ctx.state == PairingState::PAIRING) {
        return PairingState::PAIRING;
    }

    return up > down ? PairingState::ONE_SIDED_UP : PairingState::ONE_SIDED_DOWN;
}

void MarketStateManager::transition_state(
    MarketStateContext& ctx,
    PairingState new_state,
    const std::string& reason,
    const PairBookData& book_data
) {
    const PairingState old_state = ctx.state;
    if (old_state == new_state) return;

    const EpochMs now = clock_->now_ms();

    if (new_state == PairingState::PAIRING && is_one_sided(old_state)) {
        ctx.pairing_start = now;
        ctx.pairing_reason = reason.empty() ? "PAIR_EDGE" : reason;
        ctx.state = new_state;
        log_pairing_started(ctx, book_data);
    }

    if (old_state == PairingState::PAIRING && new_state != PairingState::PAIRING) {
        ctx.pairing_start.reset();
        ctx.pairing_reason.clear();
    }

    spdlog::info("[MarketState] {} {} -> {}{}", ctx.key.to_string(),
                 pairing_state_to_string(old_state), pairing_state_to_string(new_state),
                 reason.empty() ? "" : " (" + reason + ")");

    ctx.state = new_state;
    ctx.state_entered_at = now;
    ctx.last_transition_at = now;
}

bool MarketStateManager::begin_pairing(const MarketKey& key, const std::string& reason,
                                       const PairBookData& book_data) {
    auto& ctx = get_or_create_context(key);
    if (!is_one_sided(ctx.state)) return false;
    transition_state(ctx, PairingState::PAIRING, reason, book_data);
    return true;
}

PairingTimeoutResult MarketStateManager::check_pairing_timeout(MarketStateContext& ctx) {
    PairingTimeoutResult result;
    if (ctx.state != PairingState::PAIRING || !ctx.pairing_start) {
        return result;
    }

    const EpochMs now = clock_->now_ms();
    result.time_in_pairing_s = static_cast<double>(now - *ctx.pairing_start) / 1000.0;

    if (result.time_in_pairing_s >= config_.pairing_timeout_s) {
        const PairingState revert_to = ctx.up_shares > ctx.down_shares
            ? PairingState::ONE_SIDED_UP
            : PairingState::ONE_SIDED_DOWN;

        log_pairing_timeout(ctx, result.time_in_pairing_s, revert_to);

        ctx.state = revert_to;
        ctx.pairing_start.reset();
        ctx.pairing_reason.clear();
        ctx.state_entered_at = now;
        ctx.last_transition_at = now;
        result.timed_out = true;
    }

    return result;
}

// ============================================================================
// Dynamic hedge caps
// ============================================================================

std::optional<double> MarketStateManager::recent_volatility(const MarketStateContext& ctx) const {
    const auto& history = ctx.price_history;
    if (history.size() < 2) return std::nullopt;

    const Price oldest = history.front().mid_price;
    const Price latest = history.back().mid_price;
    if (oldest == 0.0) return std::nullopt;

    return std::abs(latest - oldest) / oldest;
}

HedgeCap MarketStateManager::calculate_dynamic_hedge_cap(const std::string& asset,
                                                         const MarketStateContext& ctx) const {
    auto it = config_.hedge_slippage_caps.find(asset);
    const SlippageCap& caps = it != config_.hedge_slippage_caps.end()
        ? it->second : config_.default_slippage_cap;

    HedgeCap cap;
    cap.base_cap = caps.base_cents;
    cap.recent_vol = recent_volatility(ctx);

    if (!cap.recent_vol) {
        cap.dynamic_cap = cap.base_cap;
        cap.final_cap = cap.base_cap;
        return cap;
    }

    cap.dynamic_cap = cap.base_cap + *cap.recent_vol * config_.volatility_multiplier * 100.0;
    cap.final_cap = std::min(cap.dynamic_cap, caps.max_cents);
    return cap;
}

HedgePriceCheck MarketStateManager::is_hedge_price_allowed(
    const std::string& asset,
    const MarketStateContext& ctx,
    double implied_pair_cost_cents
) {
    HedgePriceCheck result;
    result.cap = calculate_dynamic_hedge_cap(asset, ctx);
    result.allowed = implied_pair_cost_cents <= 100.0 + result.cap.final_cap;

    TelemetryEvent event;
    event.type = "HEDGE_PRICE_CAP_DYNAMIC";
    event.ts_ms = clock_->now_ms();
    event.market_id = ctx.key.market_id;
    event.asset = asset;
    event.data = {
        {"base_cap", result.cap.base_cap},
        {"dynamic_cap", result.cap.dynamic_cap},
        {"final_cap", result.cap.final_cap},
        {"implied_pair_cost_cents", implied_pair_cost_cents},
        {"allowed", result.allowed}
    };
    event.data["recent_vol"] = result.cap.recent_vol
        ? nlohmann::json(*result.cap.recent_vol) : nlohmann::json(nullptr);
    emit_event(sink_.get(), event);

    return result;
}

HedgeChunk MarketStateManager::calculate_bounded_hedge_chunk(Size one_sided_shares) const {
    HedgeChunk chunk;
    chunk.raw_chunk = one_sided_shares * config_.min_hedge_chunk_pct;
    chunk.bounded_chunk = std::max(config_.min_hedge_chunk_abs,
                                   std::min(chunk.raw_chunk, config_.max_hedge_chunk_abs));
    return chunk;
}

bool MarketStateManager::is_hedge_size_allowed(Size intended_hedge_size, Size one_sided_shares) const {
    return intended_hedge_size >= calculate_bounded_hedge_chunk(one_sided_shares).bounded_chunk;
}

// ============================================================================
// Tick processing
// ============================================================================

TickResult MarketStateManager::process_tick(
    const MarketKey& key,
    Size up_shares,
    Size down_shares,
    double seconds_remaining,
    std::optional<Price> mid_price,
    const PairBookData& book_data
) {
    update_inventory(key, up_shares, down_shares);
    if (mid_price) {
        record_price(key, *mid_price);
    }

    auto& ctx = get_or_create_context(key);
    auto timeout = check_pairing_timeout(ctx);

    const PairingState next = determine_state(ctx, seconds_remaining);
    if (!timeout.timed_out && next != ctx.state) {
        transition_state(ctx, next, "", book_data);
    }

    TickResult result;
    result.state = ctx.state;
    result.pairing_timed_out = timeout.timed_out;
    result.time_in_pairing_s = timeout.time_in_pairing_s;
    result.should_cancel_unfilled_hedges = timeout.timed_out;
    return result;
}

// ============================================================================
// Events
// ============================================================================

void MarketStateManager::log_pairing_started(const MarketStateContext& ctx,
                                             const PairBookData& book_data) {
    const bool have_book = book_data.best_ask_up > 0.0 && book_data.best_ask_down > 0.0;

    TelemetryEvent event;
    event.type = "PAIRING_STARTED";
    event.ts_ms = clock_->now_ms();
    event.market_id = ctx.key.market_id;
    event.asset = ctx.key.asset;
    event.data = {
        {"up_shares", ctx.up_shares},
        {"down_shares", ctx.down_shares},
        {"reason", ctx.pairing_reason}
    };
    if (have_book) {
        const double combined = book_data.best_ask_up + book_data.best_ask_down;
        event.data["best_ask_up"] = book_data.best_ask_up;
        event.data["best_ask_down"] = book_data.best_ask_down;
        event.data["combined_ask"] = combined;
        event.data["implied_pair_cost_cents"] = std::lround(combined * 100.0);
    } else {
        event.data["combined_ask"] = nullptr;
        event.data["implied_pair_cost_cents"] = nullptr;
    }
    emit_event(sink_.get(), event);
}

void MarketStateManager::log_pairing_timeout(const MarketStateContext& ctx, double time_in_pairing_s,
                                             PairingState revert_to) {
    spdlog::warn("[MarketState] PAIRING_TIMEOUT {} after {:.1f}s, reverting to {} (up={:.1f} down={:.1f})",
                 ctx.key.to_string(), time_in_pairing_s, pairing_state_to_string(revert_to),
                 ctx.up_shares, ctx.down_shares);

    TelemetryEvent event;
    event.type = "PAIRING_TIMEOUT_REVERT";
    event.ts_ms = clock_->now_ms();
    event.market_id = ctx.key.market_id;
    event.asset = ctx.key.asset;
    event.data = {
        {"time_in_pairing_s", time_in_pairing_s},
        {"reverted_to", pairing_state_to_string(revert_to)},
        {"up_shares", ctx.up_shares},
        {"down_shares", ctx.down_shares},
        {"pairing_reason", ctx.pairing_reason}
    };
    emit_event(sink_.get(), event);
}

} // namespace updown
