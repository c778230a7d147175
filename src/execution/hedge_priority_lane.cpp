#include "execution/hedge_priority_lane.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace updown {

HedgePriorityLane::HedgePriorityLane(
    const HedgePriorityConfig& config,
    std::shared_ptr<PriceGuard> price_guard,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , price_guard_(std::move(price_guard))
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("HedgePriorityLane initialized: escalation {}/{}/{}s, emergency at {}s to expiry, "
                 "max attempts {}",
                 config_.normal_hedge_max_s, config_.urgent_hedge_max_s,
                 config_.survival_mode_max_s, config_.emergency_exit_s,
                 config_.max_hedge_attempts);
}

bool HedgePriorityLane::is_hedge_priority_intent(const std::string& intent) {
    static const std::array<const char*, 7> kPriorityIntents = {
        "HEDGE", "HEDGE_URGENT", "SURVIVAL", "EMERGENCY_EXIT", "FORCE", "force_hedge", "panic_hedge"
    };
    return std::any_of(kPriorityIntents.begin(), kPriorityIntents.end(),
                       [&intent](const char* p) { return intent == p; });
}

HedgeIntent HedgePriorityLane::get_escalation_level(double secs_since_entry) const {
    if (secs_since_entry <= config_.normal_hedge_max_s) return HedgeIntent::HEDGE;
    if (secs_since_entry <= config_.urgent_hedge_max_s) return HedgeIntent::HEDGE_URGENT;
    if (secs_since_entry <= config_.survival_mode_max_s) return HedgeIntent::SURVIVAL;
    return HedgeIntent::EMERGENCY_EXIT;
}

void HedgePriorityLane::start_tracking(const MarketKey& key, Outcome entry_side, Size entry_qty) {
    const EpochMs now = clock_->now_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        HedgeState state;
        state.entry_fill_ts = now;
        state.entry_side = entry_side;
        state.entry_qty = entry_qty;
        states_[key] = state;
    }

    spdlog::info("[HedgeLane] HEDGE_STARTED {} entry={} qty={:.1f}",
                 key.to_string(), outcome_to_string(entry_side), entry_qty);

    TelemetryEvent event;
    event.type = "HEDGE_STARTED";
    event.ts_ms = now;
    event.market_id = key.market_id;
    event.asset = key.asset;
    event.data = {
        {"entry_side", outcome_to_string(entry_side)},
        {"entry_qty", entry_qty},
        {"hedge_side", outcome_to_string(opposite(entry_side))}
    };
    emit_event(sink_.get(), event);
}

void HedgePriorityLane::emit_completed(const MarketKey& key, const HedgeState& state, EpochMs now,
                                       Size exit_qty) {
    TelemetryEvent event;
    event.type = "HEDGE_COMPLETED";
    event.ts_ms = now;
    event.market_id = key.market_id;
    event.asset = key.asset;
    event.data = {
        {"entry_fill_ts", state.entry_fill_ts},
        {"hedge_attempts", state.hedge_attempts},
        {"final_state", hedge_resolution_to_string(state.resolution)},
        {"exit_used", state.resolution == HedgeResolution::EXITED}
    };
    if (state.hedge_fill_ts) {
        event.data["hedge_fill_ts"] = *state.hedge_fill_ts;
        event.data["hedge_lag_ms"] = *state.hedge_fill_ts - state.entry_fill_ts;
    } else {
        event.data["hedge_fill_ts"] = nullptr;
        event.data["hedge_lag_ms"] = nullptr;
    }
    if (state.resolution == HedgeResolution::EXITED) {
        event.data["exit_qty"] = exit_qty;
    }
    emit_event(sink_.get(), event);
}

void HedgePriorityLane::record_hedge_fill(const MarketKey& key, Size fill_qty) {
    const EpochMs now = clock_->now_ms();
    HedgeState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(key);
        if (it == states_.end() || it->second.resolved) return;

        auto& state = it->second;
        state.hedge_fill_qty += fill_qty;
        if (!state.hedge_fill_ts) {
            state.hedge_fill_ts = now;
        }
        if (state.hedge_fill_qty + 1e-9 < state.entry_qty) {
            spdlog::info("[HedgeLane] Partial hedge {} {:.1f}/{:.1f}",
                         key.to_string(), state.hedge_fill_qty, state.entry_qty);
            return;
        }
        state.resolved = true;
        state.resolution = HedgeResolution::HEDGED;
        snapshot = state;
    }

    spdlog::info("[HedgeLane] HEDGED {} after {} attempts, lag {}ms",
                 key.to_string(), snapshot.hedge_attempts,
                 snapshot.hedge_fill_ts.value_or(now) - snapshot.entry_fill_ts);
    emit_completed(key, snapshot, now);
}

void HedgePriorityLane::record_emergency_exit(const MarketKey& key, Size exit_qty) {
    const EpochMs now = clock_->now_ms();
    HedgeState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(key);
        if (it == states_.end()) return;
        it->second.resolved = true;
        it->second.resolution = HedgeResolution::EXITED;
        snapshot = it->second;
    }

    spdlog::warn("[HedgeLane] HEDGE_EXITED {} via emergency exit ({:.1f} shares)",
                 key.to_string(), exit_qty);
    emit_completed(key, snapshot, now, exit_qty);
}

void HedgePriorityLane::mark_expired(const MarketKey& key) {
    const EpochMs now = clock_->now_ms();
    HedgeState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(key);
        if (it == states_.end() || it->second.resolved) return;
        it->second.resolved = true;
        it->second.resolution = HedgeResolution::EXPIRED_UNHEDGED;
        snapshot = it->second;
    }

    spdlog::error("[HedgeLane] HEDGE_FAILED {} expired unhedged after {} attempts",
                  key.to_string(), snapshot.hedge_attempts);
    emit_completed(key, snapshot, now);
}

void HedgePriorityLane::clear(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(key);
}

std::optional<HedgeState> HedgePriorityLane::get_state(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(key);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

bool HedgePriorityLane::is_active(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(key);
    return it != states_.end() && !it->second.resolved;
}

HedgeDecision HedgePriorityLane::get_hedge_decision(
    const MarketKey& key,
    double seconds_to_expiry,
    bool has_open_hedge_order
) {
    std::lock_guard<std::mutex> lock(mutex_);
    HedgeDecision decision;

    auto it = states_.find(key);
    if (it == states_.end() || it->second.resolved) {
        decision.reason = "NO_ACTIVE_HEDGE";
        return decision;
    }

    auto& state = it->second;
    const EpochMs now = clock_->now_ms();
    const double secs_since_entry = static_cast<double>(now - state.entry_fill_ts) / 1000.0;

    if (state.hedge_attempts >= config_.max_hedge_attempts) {
        decision.should_act = true;
        decision.action = HedgeAction::EMERGENCY_EXIT;
        decision.intent = HedgeIntent::EMERGENCY_EXIT;
        decision.emergency_mode = true;
        decision.reason = fmt::format("MAX_ATTEMPTS_REACHED: {} attempts", state.hedge_attempts);
        return decision;
    }

    HedgeIntent intent = HedgeIntent::HEDGE;
    int64_t reprice_interval_ms = config_.reprice_normal_ms;
    if (seconds_to_expiry <= config_.emergency_exit_s) {
        intent = HedgeIntent::EMERGENCY_EXIT;
        reprice_interval_ms = 0;
    } else if (secs_since_entry > config_.survival_mode_max_s) {
        intent = HedgeIntent::SURVIVAL;
        reprice_interval_ms = config_.reprice_survival_ms;
    } else if (secs_since_entry > config_.urgent_hedge_max_s) {
        intent = HedgeIntent::HEDGE_URGENT;
        reprice_interval_ms = config_.reprice_urgent_ms;
    }
    state.current_intent = intent;
    decision.intent = intent;

    if (intent == HedgeIntent::EMERGENCY_EXIT) {
        decision.should_act = true;
        decision.action = HedgeAction::EMERGENCY_EXIT;
        decision.emergency_mode = true;
        decision.reason = fmt::format("TIME_CRITICAL: {:.0f}s to expiry, unhedged", seconds_to_expiry);
        return decision;
    }

    if (!has_open_hedge_order) {
        state.hedge_attempts++;
        state.last_attempt_ts = now;
        decision.should_act = true;
        decision.action = HedgeAction::PLACE_HEDGE;
        decision.reason = fmt::format("NO_OPEN_ORDER: attempt {}", state.hedge_attempts);
        return decision;
    }

    const int64_t since_last = now - state.last_attempt_ts;
    if (since_last >= reprice_interval_ms) {
        state.hedge_attempts++;
        state.last_attempt_ts = now;
        decision.should_act = true;
        decision.action = HedgeAction::REPRICE_HEDGE;
        decision.reason = fmt::format("REPRICE: {:.1f}s since last attempt", since_last / 1000.0);
        return decision;
    }

    decision.reason = fmt::format("WAIT_FOR_REPRICE: {:.1f}s remaining",
                                  (reprice_interval_ms - since_last) / 1000.0);
    return decision;
}

HedgePrice HedgePriorityLane::calculate_hedge_price(HedgeIntent intent, const BookSnapshot& book) const {
    const double tick = price_guard_->config().tick_size;
    HedgePrice result;

    if (intent == HedgeIntent::EMERGENCY_EXIT) {
        const double units = std::round(1.0 / tick);
        long long ask_ticks = std::llround(book.best_ask * units);
        result.price = static_cast<double>(ask_ticks + config_.emergency_cross_ticks) / units;
        result.emergency_mode = true;
        return result;
    }

    Price maker = price_guard_->select_maker_buy_price(book);
    Price adjusted = maker;
    if (intent == HedgeIntent::HEDGE_URGENT) {
        adjusted = std::min(maker + tick, book.best_ask - tick);
    } else if (intent == HedgeIntent::SURVIVAL) {
        adjusted = std::min(maker + 2 * tick, book.best_ask - tick);
    }

    result.price = PriceGuard::round_buy_price(adjusted, tick);
    return result;
}

} // namespace updown
