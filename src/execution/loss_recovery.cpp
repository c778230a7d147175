#include "execution/loss_recovery.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace updown {

LossRecovery::LossRecovery(
    const RecoveryConfig& config,
    std::shared_ptr<OrderGateway> gateway,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , gateway_(std::move(gateway))
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("LossRecovery initialized: enabled={}, min_unpaired={}, min_win_prob={:.2f}, "
                 "max_combined={:.2f}",
                 config_.enabled, config_.min_unpaired_for_recovery,
                 config_.min_win_probability, config_.max_combined_cost);
}

RecoveryAnalysis LossRecovery::analyze(const RecoveryInput& in) const {
    RecoveryAnalysis a;
    a.total_cost = in.up_cost + in.down_cost;
    a.unpaired = std::abs(in.up_qty - in.down_qty);
    a.leading_side = in.down_qty > in.up_qty ? Outcome::DOWN : Outcome::UP;
    a.trailing_side = opposite(a.leading_side);

    const auto& leading_book = a.leading_side == Outcome::UP ? in.up_book : in.down_book;
    const auto& trailing_book = a.leading_side == Outcome::UP ? in.down_book : in.up_book;

    if (leading_book.best_bid > 0.0) {
        a.leading_price = leading_book.best_bid;
    } else if (leading_book.best_ask > 0.0) {
        a.leading_price = leading_book.best_ask;
    } else {
        a.leading_price = 0.50;
    }
    a.buy_price = trailing_book.best_ask > 0.0 ? trailing_book.best_ask : 0.70;

    const double pnl_up = in.up_qty - a.total_cost;
    const double pnl_down = in.down_qty - a.total_cost;
    a.current_max_loss = std::min(pnl_up, pnl_down);
    a.current_max_gain = std::max(pnl_up, pnl_down);

    a.shares_to_buy = a.unpaired;
    a.recovery_cost = a.unpaired * a.buy_price;
    a.locked_after = std::max(in.up_qty, in.down_qty) - (a.total_cost + a.recovery_cost);
    a.loss_reduction = a.current_max_loss - a.locked_after;

    const Size leading_qty = a.leading_side == Outcome::UP ? in.up_qty : in.down_qty;
    const Notional leading_cost = a.leading_side == Outcome::UP ? in.up_cost : in.down_cost;
    const double avg_leading_cost = leading_qty > 0.0 ? leading_cost / leading_qty : 0.0;
    a.projected_combined = avg_leading_cost + a.buy_price;

    if (!config_.enabled) {
        a.reason = "Recovery mode disabled";
    } else if (a.unpaired < config_.min_unpaired_for_recovery) {
        a.reason = fmt::format("Unpaired {:.0f} < threshold {:.0f}",
                               a.unpaired, config_.min_unpaired_for_recovery);
    } else if (a.leading_price < config_.min_win_probability) {
        a.reason = fmt::format("Leading probability {:.0f}% < {:.0f}%",
                               a.leading_price * 100.0, config_.min_win_probability * 100.0);
    } else if (a.projected_combined > config_.max_combined_cost) {
        a.reason = fmt::format("Combined cost {:.3f} > max {:.2f}",
                               a.projected_combined, config_.max_combined_cost);
    } else if (a.loss_reduction >= 0.0) {
        a.reason = fmt::format("Recovery doesn't reduce loss (reduction: {:.2f})", a.loss_reduction);
    } else {
        a.should_recover = true;
        a.reason = fmt::format("Recovery would reduce max loss by ${:.2f}", -a.loss_reduction);
    }
    return a;
}

void LossRecovery::emit(const std::string& type, const MarketKey& key, nlohmann::json data) {
    TelemetryEvent event;
    event.type = type;
    event.ts_ms = clock_->now_ms();
    event.market_id = key.market_id;
    event.asset = key.asset;
    event.data = std::move(data);
    emit_event(sink_.get(), event);
}

RecoveryResult LossRecovery::check_and_recover(const RecoveryInput& input) {
    RecoveryResult result;
    const EpochMs now = clock_->now_ms();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_attempt_ms_.find(input.key);
        if (it != last_attempt_ms_.end() && now - it->second < config_.cooldown_ms) {
            result.reason = "cooldown";
            return result;
        }
        last_attempt_ms_[input.key] = now;
    }

    result.attempted = true;
    result.analysis = analyze(input);
    const auto& a = result.analysis;

    if (!a.should_recover) {
        result.reason = a.reason;
        return result;
    }

    spdlog::warn("[Recovery] TRIGGERED {}: {:.0f} UP / {:.0f} DOWN, leading {} @ {:.0f}%, "
                 "max loss ${:.2f} -> locked ${:.2f}; buying {:.0f} {} @ {:.2f}",
                 input.key.to_string(), input.up_qty, input.down_qty,
                 outcome_to_string(a.leading_side), a.leading_price * 100.0,
                 a.current_max_loss, a.locked_after, a.shares_to_buy,
                 outcome_to_string(a.trailing_side), a.buy_price);

    emit("EMERGENCY_RECOVERY_TRIGGERED", input.key, {
        {"unpaired", a.unpaired},
        {"leading_side", outcome_to_string(a.leading_side)},
        {"leading_price", a.leading_price},
        {"buy_price", a.buy_price},
        {"current_max_loss", a.current_max_loss},
        {"locked_after", a.locked_after},
        {"loss_reduction", a.loss_reduction},
        {"projected_combined", a.projected_combined}
    });

    SubmitRequest submit;
    submit.key = input.key;
    submit.token_id = a.trailing_side == Outcome::UP ? input.up_token_id : input.down_token_id;
    submit.side = Side::BUY;
    submit.price = a.buy_price;
    submit.size = a.shares_to_buy;
    submit.order_type = OrderType::GTC;
    submit.book = a.trailing_side == Outcome::UP ? input.up_book : input.down_book;
    submit.emergency_mode = true;
    submit.intent = "FORCE";

    auto placed = gateway_->submit(submit);
    if (!placed.success) {
        result.reason = submit_code_to_string(placed.code) + ": " + placed.message;
        emit("EMERGENCY_RECOVERY_FAILED", input.key, {{"reason", result.reason}});
        return result;
    }

    result.success = true;
    result.order_id = placed.venue.order_id;
    result.filled_qty = placed.venue.filled_size;
    result.reason = placed.venue.filled_size + 1e-9 >= a.shares_to_buy ? "filled" : "placed";
    emit("EMERGENCY_RECOVERY_SUCCESS", input.key, {
        {"order_id", result.order_id},
        {"filled_qty", result.filled_qty},
        {"submitted_price", placed.submitted_price}
    });
    return result;
}

bool LossRecovery::in_cooldown(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_attempt_ms_.find(key);
    return it != last_attempt_ms_.end() && clock_->now_ms() - it->second < config_.cooldown_ms;
}

void LossRecovery::clear(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_attempt_ms_.erase(key);
}

} // namespace updown
