#include "core/engine_runner.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <future>

namespace updown {

namespace {

constexpr double kShareEps = 1e-9;

const std::string& token_for(const MarketSpec& market, Outcome side) {
    return side == Outcome::UP ? market.up_token_id : market.down_token_id;
}

} // namespace

EngineRunner::EngineRunner(EngineContext& ctx)
    : ctx_(ctx)
{
    for (const auto& m : ctx_.config.markets) {
        add_market(m);
    }
    spdlog::info("EngineRunner initialized: {} markets, quoting={}, edge>={:.3f}, loop={}ms",
                 markets_.size(), ctx_.config.quoting.enabled,
                 ctx_.config.quoting.enter_threshold, ctx_.config.quoting.loop_interval_ms);
}

void EngineRunner::add_market(const MarketSpec& market) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        markets_[market.key()] = market;
        inventories_.emplace(market.key(), Inventory{});
    }
    ctx_.cadence->register_market(market.market_id, market.asset);
    ctx_.market_state->get_or_create_context(market.key());
    spdlog::info("[Runner] Tracking {} (expiry {})", market.key().to_string(), market.expiry_epoch_s);
}

void EngineRunner::remove_market(const MarketKey& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        markets_.erase(key);
        inventories_.erase(key);
        last_mids_.erase(key);
    }
    ctx_.cadence->unregister_market(key.market_id);
    for (const auto& r : ctx_.ledger->all()) {
        if (r.market_id == key.market_id) ctx_.ledger->release(r.order_id);
    }
    ctx_.market_state->clear_market(key);
    ctx_.hedge_lane->clear(key);
    ctx_.loss_recovery->clear(key);
    ctx_.order_manager->forget_market(key);
}

std::vector<MarketSpec> EngineRunner::markets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MarketSpec> out;
    for (const auto& [key, m] : markets_) out.push_back(m);
    return out;
}

Inventory EngineRunner::inventory(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inventories_.find(key);
    return it != inventories_.end() ? it->second : Inventory{};
}

double EngineRunner::seconds_remaining(const MarketSpec& market) const {
    return static_cast<double>(market.expiry_epoch_s) -
           static_cast<double>(ctx_.clock->now_ms()) / 1000.0;
}

void EngineRunner::on_spot_price(const std::string& asset, Price price) {
    bool moved = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_spot_.find(asset);
        moved = it == last_spot_.end() || std::abs(it->second - price) > kShareEps;
        last_spot_[asset] = price;
    }
    if (moved) {
        ctx_.cadence->record_spot_move(asset, price);
    }
}

void EngineRunner::record_fill(const MarketKey& key, Outcome side, Size shares, Notional cost) {
    if (shares <= 0.0) return;

    Inventory before;
    Inventory after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& inv = inventories_[key];
        before = inv;
        if (side == Outcome::UP) {
            inv.up_shares += shares;
            inv.up_cost += cost;
        } else {
            inv.down_shares += shares;
            inv.down_cost += cost;
        }
        after = inv;
    }
    ctx_.market_state->update_inventory(key, after.up_shares, after.down_shares);

    spdlog::info("[Runner] FILL {} {} {:.1f} @ {:.3f} -> inventory UP {:.1f} / DOWN {:.1f}",
                 key.to_string(), outcome_to_string(side), shares, cost / shares,
                 after.up_shares, after.down_shares);

    auto lane_state = ctx_.hedge_lane->get_state(key);
    const bool active = lane_state && !lane_state->resolved;
    if (active && side == lane_state->hedge_side()) {
        ctx_.hedge_lane->record_hedge_fill(key, shares);
    } else if (!active && after.unpaired() > before.unpaired() + kShareEps &&
               after.shares(side) > after.shares(opposite(side))) {
        ctx_.hedge_lane->start_tracking(key, side, after.unpaired());
    }
}

bool EngineRunner::on_order_fill(const std::string& order_id, const std::string& token_id,
                                 Price price, Size size) {
    std::optional<MarketKey> key;
    Outcome side = Outcome::UP;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [k, m] : markets_) {
            if (m.up_token_id == token_id || m.down_token_id == token_id) {
                key = k;
                side = m.up_token_id == token_id ? Outcome::UP : Outcome::DOWN;
                break;
            }
        }
    }
    if (!key) {
        spdlog::warn("[Runner] Fill for unknown token {} (order {})", token_id, order_id);
        return false;
    }

    ctx_.ledger->on_fill(order_id, price * size);
    ctx_.order_manager->apply_fill(*key, order_id, size);
    ctx_.funding->invalidate_balance_cache();
    record_fill(*key, side, size, price * size);
    return true;
}

bool EngineRunner::fetch_books(const MarketSpec& market, BookSnapshot& up, BookSnapshot& down) {
    try {
        auto up_depth = ctx_.venue->get_orderbook_depth(market.up_token_id);
        auto down_depth = ctx_.venue->get_orderbook_depth(market.down_token_id);
        if (!up_depth.success || !down_depth.success) {
            spdlog::warn("[Runner] {} depth fetch failed: {}", market.key().to_string(),
                         !up_depth.success ? up_depth.error : down_depth.error);
            return false;
        }
        const EpochMs now = ctx_.clock->now_ms();
        up = to_book_snapshot(up_depth, now);
        down = to_book_snapshot(down_depth, now);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[Runner] {} depth fetch threw: {}", market.key().to_string(), e.what());
        return false;
    }
}

void EngineRunner::feed_cadence(const MarketSpec& market, const BookSnapshot& up,
                                const BookSnapshot& down, EvaluationResult& result) {
    const double combined_ask = up.best_ask + down.best_ask;
    const double mispricing = std::max(0.0, 1.0 - combined_ask);
    const double state_score = std::abs(up.mid() + down.mid() - 1.0) + mispricing;

    bool poly_moved = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_mids_.find(market.key());
        const auto mids = std::make_pair(up.mid(), down.mid());
        const double half_tick = ctx_.config.price_guard.tick_size / 2.0;
        poly_moved = it == last_mids_.end() ||
                     std::abs(it->second.first - mids.first) >= half_tick ||
                     std::abs(it->second.second - mids.second) >= half_tick;
        last_mids_[market.key()] = mids;
    }
    if (poly_moved) {
        ctx_.cadence->record_poly_move(market.market_id, up.mid(), down.mid());
    }

    auto metrics = ctx_.cadence->build_metrics(market.market_id, market.asset, mispricing,
                                               ctx_.config.quoting.enter_threshold, state_score,
                                               up.spread(), down.spread());
    result.cadence = ctx_.cadence->update_state(market.market_id, market.asset, metrics);

    if (ctx_.cadence->should_log_full_snapshot(market.market_id)) {
        TelemetryEvent event;
        event.type = "MARKET_SNAPSHOT";
        event.ts_ms = ctx_.clock->now_ms();
        event.market_id = market.market_id;
        event.asset = market.asset;
        event.data = {
            {"up_bid", up.best_bid}, {"up_ask", up.best_ask},
            {"down_bid", down.best_bid}, {"down_ask", down.best_ask},
            {"combined_ask", combined_ask},
            {"mispricing", mispricing},
            {"seconds_remaining", seconds_remaining(market)},
            {"emergency_window", ctx_.price_guard->is_emergency_window(seconds_remaining(market))},
            {"cadence", cadence_state_to_string(result.cadence)}
        };
        emit_event(ctx_.sink.get(), event);
        ctx_.cadence->mark_full_snapshot(market.market_id);
    }
}

void EngineRunner::run_hedge_lane(const MarketSpec& market, const Inventory& inv,
                                  double secs_remaining, const BookSnapshot& up,
                                  const BookSnapshot& down, EvaluationResult& result) {
    const MarketKey key = market.key();
    if (!ctx_.hedge_lane->is_active(key)) return;

    const Outcome leading = inv.up_shares >= inv.down_shares ? Outcome::UP : Outcome::DOWN;
    const Outcome hedge_side = opposite(leading);
    const bool has_open_hedge = !ctx_.order_manager->orders(key, hedge_side).empty();

    auto decision = ctx_.hedge_lane->get_hedge_decision(key, secs_remaining, has_open_hedge);
    if (!decision.should_act) {
        result.outcome = EvalOutcome::WAITING;
        result.detail = decision.reason;
        return;
    }
    result.hedge_action = decision.action;

    if (decision.action == HedgeAction::EMERGENCY_EXIT) {
        // A resting recovery order is replaced by the next attempt, never stacked
        if (has_open_hedge && !ctx_.loss_recovery->in_cooldown(key)) {
            ctx_.order_manager->cancel_side_orders(market, hedge_side);
        }

        RecoveryInput input;
        input.key = key;
        input.up_token_id = market.up_token_id;
        input.down_token_id = market.down_token_id;
        input.up_qty = inv.up_shares;
        input.down_qty = inv.down_shares;
        input.up_cost = inv.up_cost;
        input.down_cost = inv.down_cost;
        input.up_book = up;
        input.down_book = down;

        auto recovery = ctx_.loss_recovery->check_and_recover(input);
        result.outcome = EvalOutcome::RECOVERY;
        result.detail = recovery.reason;
        if (!recovery.success) return;

        const auto& a = recovery.analysis;
        const bool covered = recovery.filled_qty + kShareEps >= inv.unpaired();
        if (covered) {
            ctx_.hedge_lane->record_emergency_exit(key, recovery.filled_qty);
        }
        if (recovery.filled_qty > 0.0) {
            record_fill(key, a.trailing_side, recovery.filled_qty,
                        recovery.filled_qty * a.buy_price);
        }
        if (!covered && !recovery.order_id.empty()) {
            // Lane stays open; the remainder is managed like any other hedge order
            TrackedOrder resting;
            resting.order_id = recovery.order_id;
            resting.price = a.buy_price;
            resting.size = a.shares_to_buy - recovery.filled_qty;
            resting.side = a.trailing_side;
            resting.placed_at = ctx_.clock->now_ms();
            ctx_.order_manager->track_order(key, resting);
            spdlog::warn("[Runner] {} recovery filled {:.1f}/{:.1f}, {:.1f} resting at {:.2f}",
                         key.to_string(), recovery.filled_qty, a.shares_to_buy, resting.size,
                         resting.price);
        }
        return;
    }

    if (decision.action == HedgeAction::REPRICE_HEDGE) {
        ctx_.order_manager->cancel_side_orders(market, hedge_side);
    }

    const BookSnapshot& hedge_book = hedge_side == Outcome::UP ? up : down;
    const auto hedge_price = ctx_.hedge_lane->calculate_hedge_price(decision.intent, hedge_book);
    const auto chunk = ctx_.market_state->calculate_bounded_hedge_chunk(inv.unpaired());
    const Size shares = std::min(inv.unpaired(), chunk.bounded_chunk);

    // Implied pair cost must stay within 100 + final cap cents
    Price price = hedge_price.price;
    std::optional<Price> price_cap;
    const double avg_leading = inv.shares(leading) > 0.0 ? inv.cost(leading) / inv.shares(leading) : 0.0;
    auto state_ctx = ctx_.market_state->find_context(key);
    if (avg_leading > 0.0 && state_ctx) {
        const double tick = ctx_.config.price_guard.tick_size;
        auto check = ctx_.market_state->is_hedge_price_allowed(key.asset, *state_ctx,
                                                               (avg_leading + price) * 100.0);
        price_cap = PriceGuard::round_buy_price((100.0 + check.cap.final_cap) / 100.0 - avg_leading,
                                                tick);
        if (!check.allowed) {
            if (*price_cap < tick) {
                result.outcome = EvalOutcome::WAITING;
                result.detail = fmt::format("HEDGE_CAP: {:.1f}c pair cost over {:.1f}c cap",
                                            (avg_leading + price) * 100.0, check.cap.final_cap);
                return;
            }
            spdlog::warn("[Runner] {} hedge {:.2f} over cap (other side {:.3f}, cap {:.1f}c), "
                         "clamped to {:.2f}", key.to_string(), price, avg_leading,
                         check.cap.final_cap, *price_cap);
            price = *price_cap;
        }
    }

    ctx_.market_state->begin_pairing(key, hedge_intent_to_string(decision.intent),
                                     PairBookData{up.best_ask, down.best_ask});

    HedgeRequest req;
    req.key = key;
    req.token_id = token_for(market, hedge_side);
    req.side = hedge_side;
    req.target_shares = shares;
    req.initial_price = price;
    req.seconds_remaining = secs_remaining;
    req.price_cap = price_cap;
    if (inv.shares(leading) > 0.0) {
        req.avg_other_side_cost = avg_leading;
    }

    auto hedge = ctx_.escalator->execute(req);
    if (!hedge) {
        result.outcome = EvalOutcome::HEDGE_FAILED;
        result.detail = hedge_error_to_string(hedge.error_code) + ": " + hedge.error;
        return;
    }

    result.outcome = EvalOutcome::HEDGED;
    result.detail = fmt::format("{} {:.1f}/{:.1f} filled", hedge.order_id, hedge.filled_shares, shares);
    if (hedge.filled_shares > 0.0) {
        record_fill(key, hedge_side, hedge.filled_shares, hedge.filled_shares * hedge.avg_price);
    }
    if (!hedge.order_id.empty() && hedge.filled_shares + kShareEps < shares) {
        TrackedOrder resting;
        resting.order_id = hedge.order_id;
        resting.price = hedge.avg_price;
        resting.size = shares - hedge.filled_shares;
        resting.side = hedge_side;
        resting.placed_at = ctx_.clock->now_ms();
        ctx_.order_manager->track_order(key, resting);
    }
}

void EngineRunner::run_entry_quotes(const MarketSpec& market, const Inventory& inv,
                                    const BookSnapshot& up, const BookSnapshot& down,
                                    EvaluationResult& result) {
    const auto& q = ctx_.config.quoting;
    bool quoting = q.enabled && up.is_sane() && down.is_sane();

    Price maker_up = 0.0;
    Price maker_down = 0.0;
    if (quoting) {
        maker_up = ctx_.price_guard->select_maker_buy_price(up);
        maker_down = ctx_.price_guard->select_maker_buy_price(down);
        const double edge = 1.0 - (maker_up + maker_down);
        quoting = maker_up > 0.0 && maker_down > 0.0 && edge + 1e-9 >= q.enter_threshold;
    }

    int placed = 0;
    for (Outcome side : {Outcome::UP, Outcome::DOWN}) {
        std::vector<QuoteTarget> targets;
        const Price price = side == Outcome::UP ? maker_up : maker_down;
        if (quoting && inv.shares(side) + q.quote_shares <= q.max_shares_per_side + kShareEps) {
            auto funds = ctx_.funding->can_place_order(market.market_id, side, price * q.quote_shares);
            if (funds.can_proceed) {
                targets.push_back(QuoteTarget{price, q.quote_shares});
            }
        }

        auto sync = ctx_.order_manager->sync_orders(market, side, targets);
        placed += sync.placed;
        if (sync.filled_shares > 0.0) {
            record_fill(market.key(), side, sync.filled_shares, sync.filled_cost);
        }
    }

    if (placed > 0) {
        result.outcome = EvalOutcome::QUOTED;
        result.detail = fmt::format("maker UP {:.2f} / DOWN {:.2f}", maker_up, maker_down);
    }
}

EvaluationResult EngineRunner::evaluate_market(const MarketSpec& market) {
    EvaluationResult result;
    const MarketKey key = market.key();
    cycles_++;
    ctx_.cadence->mark_evaluated(market.market_id);

    const double secs = seconds_remaining(market);
    if (secs <= 0.0) {
        ctx_.order_manager->cancel_all_orders(market);
        ctx_.hedge_lane->mark_expired(key);
        result.outcome = EvalOutcome::EXPIRED;
        result.state = ctx_.market_state->get_state(key);
        return result;
    }

    // 1) Fresh books
    BookSnapshot up;
    BookSnapshot down;
    if (!fetch_books(market, up, down)) {
        result.outcome = EvalOutcome::NO_BOOK;
        result.state = ctx_.market_state->get_state(key);
        return result;
    }

    // 2) Cadence signals
    feed_cadence(market, up, down, result);

    // 3) Pairing lifecycle
    const Inventory inv = inventory(key);
    std::optional<Price> mid;
    if (up.is_sane()) mid = up.mid();
    auto tick = ctx_.market_state->process_tick(key, inv.up_shares, inv.down_shares, secs, mid,
                                                PairBookData{up.best_ask, down.best_ask});
    result.state = tick.state;

    const Outcome leading = inv.up_shares >= inv.down_shares ? Outcome::UP : Outcome::DOWN;
    if (tick.should_cancel_unfilled_hedges) {
        int cancelled = ctx_.order_manager->cancel_side_orders(market, opposite(leading));
        spdlog::warn("[Runner] {} pairing timed out after {:.1f}s, cancelled {} hedge orders",
                     key.to_string(), tick.time_in_pairing_s, cancelled);
    }

    // 4) Stop accumulating on the exposed side; hedge it
    const bool flat_or_paired = tick.state == PairingState::FLAT || tick.state == PairingState::PAIRED;
    if (!flat_or_paired && inv.unpaired() > kShareEps &&
        !ctx_.order_manager->orders(key, leading).empty()) {
        ctx_.order_manager->cancel_side_orders(market, leading);
    }
    if (tick.state == PairingState::UNWIND_ONLY && inv.unpaired() <= kShareEps &&
        ctx_.order_manager->order_count(key) > 0) {
        ctx_.order_manager->cancel_all_orders(market);
    }

    result.outcome = EvalOutcome::IDLE;
    if (inv.unpaired() > kShareEps) {
        run_hedge_lane(market, inv, secs, up, down, result);
    } else if (flat_or_paired) {
        run_entry_quotes(market, inv, up, down, result);
    }

    // 5) Reconcile against the venue when due
    if (ctx_.order_manager->needs_reconciliation(key)) {
        auto rec = ctx_.reconciler->reconcile({market});
        if (!rec.success) {
            spdlog::warn("[Runner] {} reconciliation failed: {}", key.to_string(), rec.error_message);
        }
    }

    return result;
}

int EngineRunner::run_once() {
    std::vector<MarketSpec> due;
    for (const auto& market : markets()) {
        if (ctx_.cadence->should_evaluate(market.market_id)) due.push_back(market);
    }
    if (due.empty()) return 0;

    // One task per market; a hedge retrying on one market never holds up another
    std::vector<std::future<bool>> tasks;
    tasks.reserve(due.size());
    for (const auto& market : due) {
        tasks.push_back(std::async(std::launch::async, [this, market]() {
            try {
                auto r = evaluate_market(market);
                if (r.outcome != EvalOutcome::IDLE && r.outcome != EvalOutcome::WAITING) {
                    spdlog::debug("[Runner] {} {} state={} cadence={} action={} {}",
                                  market.key().to_string(), eval_outcome_to_string(r.outcome),
                                  pairing_state_to_string(r.state), cadence_state_to_string(r.cadence),
                                  r.hedge_action ? hedge_action_to_string(*r.hedge_action) : "-",
                                  r.detail);
                }
                return true;
            } catch (const std::exception& e) {
                spdlog::error("[Runner] {} evaluation error: {}", market.key().to_string(), e.what());
                return false;
            }
        }));
    }

    int evaluated = 0;
    for (auto& t : tasks) {
        if (t.get()) evaluated++;
    }
    return evaluated;
}

void EngineRunner::run(double duration_s) {
    running_ = true;
    const EpochMs start = ctx_.clock->now_ms();
    spdlog::info("[Runner] Starting loop ({})",
                 duration_s > 0.0 ? fmt::format("{:.0f}s", duration_s) : std::string("until stopped"));

    while (running_) {
        run_once();
        const double elapsed_s = static_cast<double>(ctx_.clock->now_ms() - start) / 1000.0;
        if (duration_s > 0.0 && elapsed_s >= duration_s) break;
        ctx_.clock->sleep_ms(ctx_.config.quoting.loop_interval_ms);
    }

    running_ = false;
    spdlog::info("[Runner] Stopped after {} cycles", cycles_.load());
}

} // namespace updown
