#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace updown {

void to_json(nlohmann::json& j, const SlippageCap& c) {
    j = nlohmann::json{
        {"base_cents", c.base_cents},
        {"max_cents", c.max_cents}
    };
}

void from_json(const nlohmann::json& j, SlippageCap& c) {
    if (j.contains("base_cents")) j.at("base_cents").get_to(c.base_cents);
    if (j.contains("max_cents")) j.at("max_cents").get_to(c.max_cents);
}

void to_json(nlohmann::json& j, const PriceGuardConfig& c) {
    j = nlohmann::json{
        {"tick_size", c.tick_size},
        {"max_book_age_ms", c.max_book_age_ms},
        {"emergency_max_cross_ticks", c.emergency_max_cross_ticks},
        {"emergency_min_interval_ms", c.emergency_min_interval_ms},
        {"emergency_window_s", c.emergency_window_s},
        {"min_spread_for_maker", c.min_spread_for_maker}
    };
}

void from_json(const nlohmann::json& j, PriceGuardConfig& c) {
    if (j.contains("tick_size")) j.at("tick_size").get_to(c.tick_size);
    if (j.contains("max_book_age_ms")) j.at("max_book_age_ms").get_to(c.max_book_age_ms);
    if (j.contains("emergency_max_cross_ticks")) j.at("emergency_max_cross_ticks").get_to(c.emergency_max_cross_ticks);
    if (j.contains("emergency_min_interval_ms")) j.at("emergency_min_interval_ms").get_to(c.emergency_min_interval_ms);
    if (j.contains("emergency_window_s")) j.at("emergency_window_s").get_to(c.emergency_window_s);
    if (j.contains("min_spread_for_maker")) j.at("min_spread_for_maker").get_to(c.min_spread_for_maker);
}

void to_json(nlohmann::json& j, const MarketStateConfig& c) {
    j = nlohmann::json{
        {"pairing_timeout_s", c.pairing_timeout_s},
        {"unwind_threshold_s", c.unwind_threshold_s},
        {"min_paired_shares", c.min_paired_shares},
        {"paired_imbalance_pct", c.paired_imbalance_pct},
        {"hedge_slippage_caps", c.hedge_slippage_caps},
        {"default_slippage_cap", c.default_slippage_cap},
        {"volatility_multiplier", c.volatility_multiplier},
        {"volatility_lookback_s", c.volatility_lookback_s},
        {"min_hedge_chunk_abs", c.min_hedge_chunk_abs},
        {"min_hedge_chunk_pct", c.min_hedge_chunk_pct},
        {"max_hedge_chunk_abs", c.max_hedge_chunk_abs}
    };
}

void from_json(const nlohmann::json& j, MarketStateConfig& c) {
    if (j.contains("pairing_timeout_s")) j.at("pairing_timeout_s").get_to(c.pairing_timeout_s);
    if (j.contains("unwind_threshold_s")) j.at("unwind_threshold_s").get_to(c.unwind_threshold_s);
    if (j.contains("min_paired_shares")) j.at("min_paired_shares").get_to(c.min_paired_shares);
    if (j.contains("paired_imbalance_pct")) j.at("paired_imbalance_pct").get_to(c.paired_imbalance_pct);
    if (j.contains("hedge_slippage_caps")) {
        // Merge so a partial override keeps the other assets
        for (const auto& [asset, cap_json] : j.at("hedge_slippage_caps").items()) {
            SlippageCap cap = c.hedge_slippage_caps.count(asset)
                ? c.hedge_slippage_caps.at(asset) : c.default_slippage_cap;
            from_json(cap_json, cap);
            c.hedge_slippage_caps[asset] = cap;
        }
    }
    if (j.contains("default_slippage_cap")) j.at("default_slippage_cap").get_to(c.default_slippage_cap);
    if (j.contains("volatility_multiplier")) j.at("volatility_multiplier").get_to(c.volatility_multiplier);
    if (j.contains("volatility_lookback_s")) j.at("volatility_lookback_s").get_to(c.volatility_lookback_s);
    if (j.contains("min_hedge_chunk_abs")) j.at("min_hedge_chunk_abs").get_to(c.min_hedge_chunk_abs);
    if (j.contains("min_hedge_chunk_pct")) j.at("min_hedge_chunk_pct").get_to(c.min_hedge_chunk_pct);
    if (j.contains("max_hedge_chunk_abs")) j.at("max_hedge_chunk_abs").get_to(c.max_hedge_chunk_abs);
}

void to_json(nlohmann::json& j, const HedgeEscalatorConfig& c) {
    j = nlohmann::json{
        {"max_retries", c.max_retries},
        {"retry_delay_ms", c.retry_delay_ms},
        {"price_increment_per_retry", c.price_increment_per_retry},
        {"max_hedge_price", c.max_hedge_price},
        {"survival_max_price", c.survival_max_price},
        {"panic_mode_threshold_s", c.panic_mode_threshold_s},
        {"survival_mode_threshold_s", c.survival_mode_threshold_s},
        {"min_shares_for_retry", c.min_shares_for_retry},
        {"size_reduction_factor", c.size_reduction_factor},
        {"allow_overpay", c.allow_overpay},
        {"survival_max_wait_ms", c.survival_max_wait_ms},
        {"survival_wait_budget", c.survival_wait_budget},
        {"min_liquidity_ratio", c.min_liquidity_ratio},
        {"liquidity_take_ratio", c.liquidity_take_ratio},
        {"event_log_capacity", c.event_log_capacity}
    };
}

void from_json(const nlohmann::json& j, HedgeEscalatorConfig& c) {
    if (j.contains("max_retries")) j.at("max_retries").get_to(c.max_retries);
    if (j.contains("retry_delay_ms")) j.at("retry_delay_ms").get_to(c.retry_delay_ms);
    if (j.contains("price_increment_per_retry")) j.at("price_increment_per_retry").get_to(c.price_increment_per_retry);
    if (j.contains("max_hedge_price")) j.at("max_hedge_price").get_to(c.max_hedge_price);
    if (j.contains("survival_max_price")) j.at("survival_max_price").get_to(c.survival_max_price);
    if (j.contains("panic_mode_threshold_s")) j.at("panic_mode_threshold_s").get_to(c.panic_mode_threshold_s);
    if (j.contains("survival_mode_threshold_s")) j.at("survival_mode_threshold_s").get_to(c.survival_mode_threshold_s);
    if (j.contains("min_shares_for_retry")) j.at("min_shares_for_retry").get_to(c.min_shares_for_retry);
    if (j.contains("size_reduction_factor")) j.at("size_reduction_factor").get_to(c.size_reduction_factor);
    if (j.contains("allow_overpay")) j.at("allow_overpay").get_to(c.allow_overpay);
    if (j.contains("survival_max_wait_ms")) j.at("survival_max_wait_ms").get_to(c.survival_max_wait_ms);
    if (j.contains("survival_wait_budget")) j.at("survival_wait_budget").get_to(c.survival_wait_budget);
    if (j.contains("min_liquidity_ratio")) j.at("min_liquidity_ratio").get_to(c.min_liquidity_ratio);
    if (j.contains("liquidity_take_ratio")) j.at("liquidity_take_ratio").get_to(c.liquidity_take_ratio);
    if (j.contains("event_log_capacity")) j.at("event_log_capacity").get_to(c.event_log_capacity);
}

void to_json(nlohmann::json& j, const HedgePriorityConfig& c) {
    j = nlohmann::json{
        {"normal_hedge_max_s", c.normal_hedge_max_s},
        {"urgent_hedge_max_s", c.urgent_hedge_max_s},
        {"survival_mode_max_s", c.survival_mode_max_s},
        {"emergency_exit_s", c.emergency_exit_s},
        {"reprice_normal_ms", c.reprice_normal_ms},
        {"reprice_urgent_ms", c.reprice_urgent_ms},
        {"reprice_survival_ms", c.reprice_survival_ms},
        {"max_hedge_attempts", c.max_hedge_attempts},
        {"emergency_cross_ticks", c.emergency_cross_ticks}
    };
}

void from_json(const nlohmann::json& j, HedgePriorityConfig& c) {
    if (j.contains("normal_hedge_max_s")) j.at("normal_hedge_max_s").get_to(c.normal_hedge_max_s);
    if (j.contains("urgent_hedge_max_s")) j.at("urgent_hedge_max_s").get_to(c.urgent_hedge_max_s);
    if (j.contains("survival_mode_max_s")) j.at("survival_mode_max_s").get_to(c.survival_mode_max_s);
    if (j.contains("emergency_exit_s")) j.at("emergency_exit_s").get_to(c.emergency_exit_s);
    if (j.contains("reprice_normal_ms")) j.at("reprice_normal_ms").get_to(c.reprice_normal_ms);
    if (j.contains("reprice_urgent_ms")) j.at("reprice_urgent_ms").get_to(c.reprice_urgent_ms);
    if (j.contains("reprice_survival_ms")) j.at("reprice_survival_ms").get_to(c.reprice_survival_ms);
    if (j.contains("max_hedge_attempts")) j.at("max_hedge_attempts").get_to(c.max_hedge_attempts);
    if (j.contains("emergency_cross_ticks")) j.at("emergency_cross_ticks").get_to(c.emergency_cross_ticks);
}

void to_json(nlohmann::json& j, const CadenceConfig& c) {
    j = nlohmann::json{
        {"cold_eval_ms", c.cold_eval_ms},
        {"warm_eval_ms", c.warm_eval_ms},
        {"hot_eval_ms", c.hot_eval_ms},
        {"cold_snapshot_ms", c.cold_snapshot_ms},
        {"warm_snapshot_ms", c.warm_snapshot_ms},
        {"warm_to_cold_hysteresis_ms", c.warm_to_cold_hysteresis_ms},
        {"hot_to_warm_hysteresis_ms", c.hot_to_warm_hysteresis_ms},
        {"near_mispricing_ratio", c.near_mispricing_ratio},
        {"hot_mispricing_ratio", c.hot_mispricing_ratio},
        {"near_percentile", c.near_percentile},
        {"hot_percentile", c.hot_percentile},
        {"move_age_threshold_ms", c.move_age_threshold_ms},
        {"percentile_window", c.percentile_window},
        {"spread_history_ms", c.spread_history_ms},
        {"spread_change_window_ms", c.spread_change_window_ms},
        {"spread_change_min", c.spread_change_min}
    };
}

void from_json(const nlohmann::json& j, CadenceConfig& c) {
    if (j.contains("cold_eval_ms")) j.at("cold_eval_ms").get_to(c.cold_eval_ms);
    if (j.contains("warm_eval_ms")) j.at("warm_eval_ms").get_to(c.warm_eval_ms);
    if (j.contains("hot_eval_ms")) j.at("hot_eval_ms").get_to(c.hot_eval_ms);
    if (j.contains("cold_snapshot_ms")) j.at("cold_snapshot_ms").get_to(c.cold_snapshot_ms);
    if (j.contains("warm_snapshot_ms")) j.at("warm_snapshot_ms").get_to(c.warm_snapshot_ms);
    if (j.contains("warm_to_cold_hysteresis_ms")) j.at("warm_to_cold_hysteresis_ms").get_to(c.warm_to_cold_hysteresis_ms);
    if (j.contains("hot_to_warm_hysteresis_ms")) j.at("hot_to_warm_hysteresis_ms").get_to(c.hot_to_warm_hysteresis_ms);
    if (j.contains("near_mispricing_ratio")) j.at("near_mispricing_ratio").get_to(c.near_mispricing_ratio);
    if (j.contains("hot_mispricing_ratio")) j.at("hot_mispricing_ratio").get_to(c.hot_mispricing_ratio);
    if (j.contains("near_percentile")) j.at("near_percentile").get_to(c.near_percentile);
    if (j.contains("hot_percentile")) j.at("hot_percentile").get_to(c.hot_percentile);
    if (j.contains("move_age_threshold_ms")) j.at("move_age_threshold_ms").get_to(c.move_age_threshold_ms);
    if (j.contains("percentile_window")) j.at("percentile_window").get_to(c.percentile_window);
    if (j.contains("spread_history_ms")) j.at("spread_history_ms").get_to(c.spread_history_ms);
    if (j.contains("spread_change_window_ms")) j.at("spread_change_window_ms").get_to(c.spread_change_window_ms);
    if (j.contains("spread_change_min")) j.at("spread_change_min").get_to(c.spread_change_min);
}

void to_json(nlohmann::json& j, const OrderManagerConfig& c) {
    j = nlohmann::json{
        {"max_concurrent_orders", c.max_concurrent_orders},
        {"reconcile_interval_ms", c.reconcile_interval_ms}
    };
}

void from_json(const nlohmann::json& j, OrderManagerConfig& c) {
    if (j.contains("max_concurrent_orders")) j.at("max_concurrent_orders").get_to(c.max_concurrent_orders);
    if (j.contains("reconcile_interval_ms")) j.at("reconcile_interval_ms").get_to(c.reconcile_interval_ms);
}

void to_json(nlohmann::json& j, const RateLimitConfig& c) {
    j = nlohmann::json{
        {"max_cancel_replace_per_market_per_minute", c.max_cancel_replace_per_market_per_minute},
        {"max_orders_per_market_per_minute", c.max_orders_per_market_per_minute},
        {"max_total_cancels_per_minute", c.max_total_cancels_per_minute},
        {"max_total_orders_per_minute", c.max_total_orders_per_minute},
        {"market_pause_ms", c.market_pause_ms},
        {"global_pause_ms", c.global_pause_ms},
        {"consecutive_failures_before_break", c.consecutive_failures_before_break},
        {"circuit_breaker_reset_ms", c.circuit_breaker_reset_ms}
    };
}

void from_json(const nlohmann::json& j, RateLimitConfig& c) {
    if (j.contains("max_cancel_replace_per_market_per_minute")) j.at("max_cancel_replace_per_market_per_minute").get_to(c.max_cancel_replace_per_market_per_minute);
    if (j.contains("max_orders_per_market_per_minute")) j.at("max_orders_per_market_per_minute").get_to(c.max_orders_per_market_per_minute);
    if (j.contains("max_total_cancels_per_minute")) j.at("max_total_cancels_per_minute").get_to(c.max_total_cancels_per_minute);
    if (j.contains("max_total_orders_per_minute")) j.at("max_total_orders_per_minute").get_to(c.max_total_orders_per_minute);
    if (j.contains("market_pause_ms")) j.at("market_pause_ms").get_to(c.market_pause_ms);
    if (j.contains("global_pause_ms")) j.at("global_pause_ms").get_to(c.global_pause_ms);
    if (j.contains("consecutive_failures_before_break")) j.at("consecutive_failures_before_break").get_to(c.consecutive_failures_before_break);
    if (j.contains("circuit_breaker_reset_ms")) j.at("circuit_breaker_reset_ms").get_to(c.circuit_breaker_reset_ms);
}

void to_json(nlohmann::json& j, const FundingConfig& c) {
    j = nlohmann::json{
        {"safety_buffer_usd", c.safety_buffer_usd},
        {"min_balance_for_trading", c.min_balance_for_trading},
        {"stale_balance_ms", c.stale_balance_ms},
        {"max_reserved_per_market", c.max_reserved_per_market},
        {"max_total_reserved", c.max_total_reserved},
        {"blocked_log_capacity", c.blocked_log_capacity}
    };
}

void from_json(const nlohmann::json& j, FundingConfig& c) {
    if (j.contains("safety_buffer_usd")) j.at("safety_buffer_usd").get_to(c.safety_buffer_usd);
    if (j.contains("min_balance_for_trading")) j.at("min_balance_for_trading").get_to(c.min_balance_for_trading);
    if (j.contains("stale_balance_ms")) j.at("stale_balance_ms").get_to(c.stale_balance_ms);
    if (j.contains("max_reserved_per_market")) j.at("max_reserved_per_market").get_to(c.max_reserved_per_market);
    if (j.contains("max_total_reserved")) j.at("max_total_reserved").get_to(c.max_total_reserved);
    if (j.contains("blocked_log_capacity")) j.at("blocked_log_capacity").get_to(c.blocked_log_capacity);
}

void to_json(nlohmann::json& j, const BurstLimitConfig& c) {
    j = nlohmann::json{
        {"max_orders_per_minute_per_market", c.max_orders_per_minute_per_market},
        {"min_ms_between_orders", c.min_ms_between_orders},
        {"window_ms", c.window_ms}
    };
}

void from_json(const nlohmann::json& j, BurstLimitConfig& c) {
    if (j.contains("max_orders_per_minute_per_market")) j.at("max_orders_per_minute_per_market").get_to(c.max_orders_per_minute_per_market);
    if (j.contains("min_ms_between_orders")) j.at("min_ms_between_orders").get_to(c.min_ms_between_orders);
    if (j.contains("window_ms")) j.at("window_ms").get_to(c.window_ms);
}

void to_json(nlohmann::json& j, const RecoveryConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"min_unpaired_for_recovery", c.min_unpaired_for_recovery},
        {"min_win_probability", c.min_win_probability},
        {"max_combined_cost", c.max_combined_cost},
        {"cooldown_ms", c.cooldown_ms}
    };
}

void from_json(const nlohmann::json& j, RecoveryConfig& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("min_unpaired_for_recovery")) j.at("min_unpaired_for_recovery").get_to(c.min_unpaired_for_recovery);
    if (j.contains("min_win_probability")) j.at("min_win_probability").get_to(c.min_win_probability);
    if (j.contains("max_combined_cost")) j.at("max_combined_cost").get_to(c.max_combined_cost);
    if (j.contains("cooldown_ms")) j.at("cooldown_ms").get_to(c.cooldown_ms);
}

void to_json(nlohmann::json& j, const QuotingConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"enter_threshold", c.enter_threshold},
        {"quote_shares", c.quote_shares},
        {"max_shares_per_side", c.max_shares_per_side},
        {"loop_interval_ms", c.loop_interval_ms}
    };
}

void from_json(const nlohmann::json& j, QuotingConfig& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("enter_threshold")) j.at("enter_threshold").get_to(c.enter_threshold);
    if (j.contains("quote_shares")) j.at("quote_shares").get_to(c.quote_shares);
    if (j.contains("max_shares_per_side")) j.at("max_shares_per_side").get_to(c.max_shares_per_side);
    if (j.contains("loop_interval_ms")) j.at("loop_interval_ms").get_to(c.loop_interval_ms);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const TelemetryConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"log_events", c.log_events},
        {"events_db_path", c.events_db_path}
    };
}

void from_json(const nlohmann::json& j, TelemetryConfig& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("log_events")) j.at("log_events").get_to(c.log_events);
    if (j.contains("events_db_path")) j.at("events_db_path").get_to(c.events_db_path);
}

void to_json(nlohmann::json& j, const MarketSpec& c) {
    j = nlohmann::json{
        {"market_id", c.market_id},
        {"asset", c.asset},
        {"up_token_id", c.up_token_id},
        {"down_token_id", c.down_token_id},
        {"expiry_epoch_s", c.expiry_epoch_s}
    };
}

void from_json(const nlohmann::json& j, MarketSpec& c) {
    if (j.contains("market_id")) j.at("market_id").get_to(c.market_id);
    if (j.contains("asset")) j.at("asset").get_to(c.asset);
    if (j.contains("up_token_id")) j.at("up_token_id").get_to(c.up_token_id);
    if (j.contains("down_token_id")) j.at("down_token_id").get_to(c.down_token_id);
    if (j.contains("expiry_epoch_s")) j.at("expiry_epoch_s").get_to(c.expiry_epoch_s);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    std::string mode_str;
    switch (c.mode) {
        case TradingMode::DRY_RUN: mode_str = "dry-run"; break;
        case TradingMode::PAPER: mode_str = "paper"; break;
    }

    j = nlohmann::json{
        {"mode", mode_str},
        {"run_id", c.run_id},
        {"price_guard", c.price_guard},
        {"market_state", c.market_state},
        {"hedge_escalator", c.hedge_escalator},
        {"hedge_priority", c.hedge_priority},
        {"cadence", c.cadence},
        {"order_manager", c.order_manager},
        {"rate_limit", c.rate_limit},
        {"funding", c.funding},
        {"burst_limit", c.burst_limit},
        {"recovery", c.recovery},
        {"quoting", c.quoting},
        {"logging", c.logging},
        {"telemetry", c.telemetry},
        {"markets", c.markets}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        if (mode_str == "dry-run" || mode_str == "dry_run") c.mode = TradingMode::DRY_RUN;
        else if (mode_str == "paper") c.mode = TradingMode::PAPER;
        else throw std::runtime_error("Unknown mode: " + mode_str);
    }
    if (j.contains("run_id")) j.at("run_id").get_to(c.run_id);
    if (j.contains("price_guard")) j.at("price_guard").get_to(c.price_guard);
    if (j.contains("market_state")) j.at("market_state").get_to(c.market_state);
    if (j.contains("hedge_escalator")) j.at("hedge_escalator").get_to(c.hedge_escalator);
    if (j.contains("hedge_priority")) j.at("hedge_priority").get_to(c.hedge_priority);
    if (j.contains("cadence")) j.at("cadence").get_to(c.cadence);
    if (j.contains("order_manager")) j.at("order_manager").get_to(c.order_manager);
    if (j.contains("rate_limit")) j.at("rate_limit").get_to(c.rate_limit);
    if (j.contains("funding")) j.at("funding").get_to(c.funding);
    if (j.contains("burst_limit")) j.at("burst_limit").get_to(c.burst_limit);
    if (j.contains("recovery")) j.at("recovery").get_to(c.recovery);
    if (j.contains("quoting")) j.at("quoting").get_to(c.quoting);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("telemetry")) j.at("telemetry").get_to(c.telemetry);
    if (j.contains("markets")) j.at("markets").get_to(c.markets);
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    EngineConfig config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void EngineConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool EngineConfig::validate() const {
    if (price_guard.tick_size <= 0) {
        spdlog::error("price_guard.tick_size must be positive");
        return false;
    }

    if (price_guard.max_book_age_ms <= 0) {
        spdlog::error("price_guard.max_book_age_ms must be positive");
        return false;
    }

    if (price_guard.emergency_max_cross_ticks < 0) {
        spdlog::error("price_guard.emergency_max_cross_ticks must be non-negative");
        return false;
    }

    if (market_state.min_hedge_chunk_abs > market_state.max_hedge_chunk_abs) {
        spdlog::error("market_state.min_hedge_chunk_abs must be <= max_hedge_chunk_abs");
        return false;
    }

    for (const auto& [asset, cap] : market_state.hedge_slippage_caps) {
        if (cap.base_cents > cap.max_cents) {
            spdlog::error("hedge slippage cap for {} has base > max", asset);
            return false;
        }
    }

    if (hedge_escalator.max_retries < 1) {
        spdlog::error("hedge_escalator.max_retries must be at least 1");
        return false;
    }

    if (hedge_escalator.size_reduction_factor <= 0 || hedge_escalator.size_reduction_factor >= 1) {
        spdlog::error("hedge_escalator.size_reduction_factor must be in (0, 1)");
        return false;
    }

    if (hedge_escalator.max_hedge_price > hedge_escalator.survival_max_price) {
        spdlog::warn("max_hedge_price is above survival_max_price, survival mode will be stricter");
    }

    if (hedge_escalator.survival_max_price >= 1.0) {
        spdlog::error("hedge_escalator.survival_max_price must be below 1.0");
        return false;
    }

    if (cadence.hot_eval_ms > cadence.warm_eval_ms || cadence.warm_eval_ms > cadence.cold_eval_ms) {
        spdlog::error("cadence eval intervals must satisfy hot <= warm <= cold");
        return false;
    }

    if (cadence.percentile_window == 0) {
        spdlog::error("cadence.percentile_window must be positive");
        return false;
    }

    if (quoting.quote_shares <= 0 || quoting.loop_interval_ms <= 0) {
        spdlog::error("quoting.quote_shares and quoting.loop_interval_ms must be positive");
        return false;
    }

    if (order_manager.max_concurrent_orders == 0) {
        spdlog::error("order_manager.max_concurrent_orders must be positive");
        return false;
    }

    for (const auto& m : markets) {
        if (m.market_id.empty() || m.up_token_id.empty() || m.down_token_id.empty()) {
            spdlog::error("market entries need market_id, up_token_id and down_token_id");
            return false;
        }
    }

    return true;
}

std::string EngineConfig::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace updown
