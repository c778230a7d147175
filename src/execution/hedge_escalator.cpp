#include "execution/hedge_escalator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace updown {

HedgeEscalator::HedgeEscalator(
    const HedgeEscalatorConfig& config,
    std::shared_ptr<OrderGateway> gateway,
    std::shared_ptr<VenueClient> venue,
    std::shared_ptr<RateLimiter> rate_limiter,
    std::shared_ptr<FundsChecker> funds,
    std::shared_ptr<ReserveLedger> ledger,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , gateway_(std::move(gateway))
    , venue_(std::move(venue))
    , rate_limiter_(std::move(rate_limiter))
    , funds_(std::move(funds))
    , ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("HedgeEscalator initialized: max_retries={}, max_price={:.2f} (survival {:.2f}), "
                 "+{:.2f}/step, size x{:.2f}/step",
                 config_.max_retries, config_.max_hedge_price, config_.survival_max_price,
                 config_.price_increment_per_retry, config_.size_reduction_factor);
}

HedgeMode HedgeEscalator::mode_for(double seconds_remaining) const {
    if (seconds_remaining < config_.survival_mode_threshold_s) return HedgeMode::SURVIVAL;
    if (seconds_remaining < config_.panic_mode_threshold_s) return HedgeMode::PANIC;
    return HedgeMode::NORMAL;
}

Price HedgeEscalator::max_price_for(HedgeMode mode) const {
    return mode == HedgeMode::SURVIVAL ? config_.survival_max_price : config_.max_hedge_price;
}

void HedgeEscalator::log_event(const HedgeRequest& req, HedgeEventType type, int step, Price price,
                               Size shares, const std::string& reason,
                               const std::string& order_id, Size filled) {
    HedgeEvent event;
    event.type = type;
    event.ts = clock_->now_ms();
    event.key = req.key;
    event.side = req.side;
    event.step = step;
    event.price = price;
    event.shares = shares;
    event.reason = reason;
    event.order_id = order_id;
    event.filled_shares = filled;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        while (events_.size() > config_.event_log_capacity) {
            events_.pop_front();
        }
        switch (type) {
            case HedgeEventType::HEDGE_ATTEMPT: attempts_++; break;
            case HedgeEventType::HEDGE_FAILED: failures_++; break;
            case HedgeEventType::HEDGE_ABORTED: aborts_++; break;
            case HedgeEventType::HEDGE_SUCCESS: successes_++; break;
            case HedgeEventType::HEDGE_ESCALATE_STEP: break;
        }
    }

    const auto type_str = hedge_event_type_to_string(type);
    if (type == HedgeEventType::HEDGE_ABORTED || type == HedgeEventType::HEDGE_FAILED) {
        spdlog::warn("[{}] {} {} step={} @ {:.0f}c x {:.0f}sh{}", type_str, outcome_to_string(req.side),
                     req.key.to_string(), step, price * 100.0, shares,
                     reason.empty() ? "" : " (" + reason + ")");
    } else {
        spdlog::info("[{}] {} {} step={} @ {:.0f}c x {:.0f}sh{}", type_str, outcome_to_string(req.side),
                     req.key.to_string(), step, price * 100.0, shares,
                     reason.empty() ? "" : " (" + reason + ")");
    }

    TelemetryEvent telemetry;
    telemetry.type = type_str;
    telemetry.ts_ms = event.ts;
    telemetry.market_id = req.key.market_id;
    telemetry.asset = req.key.asset;
    telemetry.data = {
        {"side", outcome_to_string(req.side)},
        {"step", step},
        {"price", price},
        {"shares", shares}
    };
    if (!reason.empty()) telemetry.data["reason"] = reason;
    if (!order_id.empty()) {
        telemetry.data["order_id"] = order_id;
        telemetry.data["filled_shares"] = filled;
    }
    emit_event(sink_.get(), telemetry);
}

HedgeResult HedgeEscalator::fail(const HedgeRequest& req, HedgeErrorCode code, std::string error,
                                 int attempts) const {
    HedgeResult result;
    result.ok = false;
    result.error_code = code;
    result.error = std::move(error);
    result.attempts = attempts;
    spdlog::warn("[HedgeEscalator] {} {} gave up: {} ({})", req.key.to_string(),
                 outcome_to_string(req.side), hedge_error_to_string(code), result.error);
    return result;
}

DepthResponse HedgeEscalator::fetch_depth(const std::string& token_id) {
    try {
        return venue_->get_orderbook_depth(token_id);
    } catch (const std::exception& e) {
        DepthResponse depth;
        depth.success = false;
        depth.error = e.what();
        return depth;
    }
}

HedgeResult HedgeEscalator::execute(const HedgeRequest& req) {
    const HedgeMode mode = mode_for(req.seconds_remaining);
    const Price max_price = req.price_cap ? std::min(max_price_for(mode), *req.price_cap)
                                          : max_price_for(mode);
    const int max_steps = config_.max_retries;
    const double min_shares = config_.min_shares_for_retry;

    Size shares = req.target_shares;
    Price price = std::min(req.initial_price, max_price);
    int waits_used = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequences_++;
    }

    spdlog::info("[HedgeEscalator] Starting {} on {}: target={:.0f}sh @ {:.0f}c, other_side={}, mode={}",
                 outcome_to_string(req.side), req.key.to_string(), shares, price * 100.0,
                 req.avg_other_side_cost ? fmt::format("{:.0f}c", *req.avg_other_side_cost * 100.0) : "N/A",
                 hedge_mode_to_string(mode));

    int step = 1;
    while (step <= max_steps) {
        const bool last_step = step == max_steps;

        // 1) Pair-cost gate
        if (mode != HedgeMode::SURVIVAL && req.avg_other_side_cost) {
            const double projected = *req.avg_other_side_cost + price;
            const double max_allowed = 1.0 + config_.allow_overpay;
            if (projected > max_allowed + 1e-9) {
                auto reason = fmt::format("PAIR_COST_WORSENING: projected {:.0f}c > {:.0f}c max",
                                          projected * 100.0, max_allowed * 100.0);
                log_event(req, HedgeEventType::HEDGE_ABORTED, step, price, shares, reason);
                return fail(req, HedgeErrorCode::PAIR_COST_WORSENING, reason, step);
            }
        }

        log_event(req, HedgeEventType::HEDGE_ATTEMPT, step, price, shares);

        // 2) Admission
        auto admission = rate_limiter_->check_allowed(req.key.market_id, RequestKind::ORDER);
        if (!admission.allowed) {
            log_event(req, HedgeEventType::HEDGE_FAILED, step, price, shares,
                      "Rate limited: " + admission.reason);
            if (mode == HedgeMode::SURVIVAL &&
                admission.wait_ms < config_.survival_max_wait_ms &&
                waits_used < config_.survival_wait_budget) {
                waits_used++;
                clock_->sleep_ms(admission.wait_ms);
                continue;
            }
            return fail(req, HedgeErrorCode::RATE_LIMITED, admission.reason, step);
        }

        // 3) Funds
        const Notional notional = shares * price;
        auto funds = funds_->can_place_order(req.key.market_id, req.side, notional);
        if (!funds.can_proceed) {
            log_event(req, HedgeEventType::HEDGE_FAILED, step, price, shares,
                      "Insufficient funds: " + funds.reason);
            if (!last_step) {
                shares = std::floor(shares * config_.size_reduction_factor);
                if (shares < min_shares) {
                    log_event(req, HedgeEventType::HEDGE_ABORTED, step, price, shares,
                              "Shares below minimum after size reduction");
                    return fail(req, HedgeErrorCode::INSUFFICIENT_FUNDS, "Cannot reduce size further", step);
                }
                log_event(req, HedgeEventType::HEDGE_ESCALATE_STEP, step, price, shares,
                          "Reduced size due to insufficient funds");
                step++;
                continue;
            }
            return fail(req, HedgeErrorCode::INSUFFICIENT_FUNDS, funds.reason, step);
        }

        // 4) Liquidity
        auto depth = fetch_depth(req.token_id);
        if (!depth.has_liquidity || depth.ask_volume < shares * config_.min_liquidity_ratio) {
            log_event(req, HedgeEventType::HEDGE_FAILED, step, price, shares,
                      fmt::format("No liquidity (ask vol: {:.0f})", depth.ask_volume));
            if (mode != HedgeMode::NORMAL && depth.ask_volume >= min_shares) {
                shares = std::floor(depth.ask_volume * config_.liquidity_take_ratio);
                log_event(req, HedgeEventType::HEDGE_ESCALATE_STEP, step, price, shares,
                          "Reduced to available liquidity");
                step++;
                continue;
            }
            return fail(req, HedgeErrorCode::NO_LIQUIDITY,
                        fmt::format("Liquidity: {:.0f} shares", depth.ask_volume), step);
        }

        // 5) Reserve and record admission
        const std::string temp_id = fmt::format("hedge_{}_{}_{}_{}", req.key.market_id,
                                                outcome_to_string(req.side), clock_->now_ms(), step);
        ledger_->reserve(temp_id, req.key.market_id, notional, req.side);
        rate_limiter_->record_event(req.key.market_id, RequestKind::ORDER);

        // 6) Submit through the validated path
        SubmitRequest submit;
        submit.key = req.key;
        submit.token_id = req.token_id;
        submit.side = Side::BUY;
        submit.price = price;
        submit.size = shares;
        submit.order_type = OrderType::GTC;
        submit.book = to_book_snapshot(depth, clock_->now_ms());
        submit.emergency_mode = false;
        submit.intent = mode == HedgeMode::SURVIVAL ? "SURVIVAL" : "HEDGE";

        auto placed = gateway_->submit(submit);
        if (placed.success) {
            const Size filled = placed.venue.filled_size;
            const Price avg_price = placed.venue.avg_price > 0.0 ? placed.venue.avg_price
                                                                 : placed.submitted_price;
            ledger_->release(temp_id);
            if (!placed.venue.order_id.empty() && filled < shares) {
                ledger_->reserve(placed.venue.order_id, req.key.market_id,
                                 (shares - filled) * placed.submitted_price, req.side);
            }
            funds_->invalidate_balance_cache();

            log_event(req, HedgeEventType::HEDGE_SUCCESS, step, avg_price, shares, "",
                      placed.venue.order_id, filled);

            HedgeResult result;
            result.ok = true;
            result.order_id = placed.venue.order_id;
            result.filled_shares = filled;
            result.avg_price = avg_price;
            result.attempts = step;
            return result;
        }

        ledger_->release(temp_id);
        rate_limiter_->record_failure(req.key.market_id);
        log_event(req, HedgeEventType::HEDGE_FAILED, step, price, shares,
                  submit_code_to_string(placed.code) + ": " + placed.message);

        if (placed.message.find("balance") != std::string::npos ||
            placed.message.find("allowance") != std::string::npos) {
            funds_->invalidate_balance_cache();
        }

        if (!last_step) {
            if (placed.code != SubmitCode::API_ERROR) {
                price = std::min(max_price, price + config_.price_increment_per_retry);
                if (mode != HedgeMode::SURVIVAL) {
                    shares = std::floor(shares * config_.size_reduction_factor);
                }
                if (shares < min_shares) {
                    log_event(req, HedgeEventType::HEDGE_ABORTED, step, price, shares,
                              "Shares below minimum after escalation");
                    return fail(req, HedgeErrorCode::MAX_RETRIES, "Shares too low after escalation", step);
                }
                log_event(req, HedgeEventType::HEDGE_ESCALATE_STEP, step, price, shares,
                          fmt::format("Price +{:.0f}c", config_.price_increment_per_retry * 100.0));
            }
            clock_->sleep_ms(config_.retry_delay_ms);
        }
        step++;
    }

    log_event(req, HedgeEventType::HEDGE_ABORTED, max_steps, price, shares, "Max retries exhausted");
    return fail(req, HedgeErrorCode::MAX_RETRIES, "All hedge attempts failed", max_steps);
}

HedgeEscalatorStats HedgeEscalator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HedgeEscalatorStats s;
    s.sequences = sequences_;
    s.attempts = attempts_;
    s.successes = successes_;
    s.failures = failures_;
    s.aborts = aborts_;
    s.avg_attempts_per_sequence = sequences_ > 0
        ? static_cast<double>(attempts_) / static_cast<double>(sequences_) : 0.0;
    return s;
}

std::vector<HedgeEvent> HedgeEscalator::recent_events(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(limit, events_.size());
    return std::vector<HedgeEvent>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

} // namespace updown
