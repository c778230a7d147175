#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace updown {

struct PriceGuardConfig {
    double tick_size{0.01};
    int64_t max_book_age_ms{500};
    int emergency_max_cross_ticks{2};
    int64_t emergency_min_interval_ms{30000};   // Cooldown between emergency crossings
    double emergency_window_s{90.0};            // Emergency allowed at <= 90s to expiry
    double min_spread_for_maker{0.02};
};

struct SlippageCap {
    double base_cents{2.0};
    double max_cents{4.0};
};

struct MarketStateConfig {
    double pairing_timeout_s{45.0};
    double unwind_threshold_s{45.0};
    double min_paired_shares{20.0};
    double paired_imbalance_pct{0.20};

    std::map<std::string, SlippageCap> hedge_slippage_caps{
        {"BTC", {1.0, 2.0}},
        {"ETH", {1.5, 2.5}},
        {"SOL", {2.0, 3.0}},
        {"XRP", {2.0, 4.0}},
    };
    SlippageCap default_slippage_cap{2.0, 4.0};
    double volatility_multiplier{50.0};
    double volatility_lookback_s{300.0};

    double min_hedge_chunk_abs{25.0};
    double min_hedge_chunk_pct{0.25};
    double max_hedge_chunk_abs{100.0};
};

struct HedgeEscalatorConfig {
    int max_retries{3};
    int64_t retry_delay_ms{500};
    double price_increment_per_retry{0.01};
    double max_hedge_price{0.85};
    double survival_max_price{0.95};
    double panic_mode_threshold_s{120.0};
    double survival_mode_threshold_s{60.0};
    double min_shares_for_retry{5.0};
    double size_reduction_factor{0.8};
    double allow_overpay{0.01};
    int64_t survival_max_wait_ms{5000};         // Longest rate-limit wait worth sleeping through
    int survival_wait_budget{3};                // Rate-limit waits allowed per hedge
    double min_liquidity_ratio{0.5};
    double liquidity_take_ratio{0.8};
    size_t event_log_capacity{500};
};

struct HedgePriorityConfig {
    double normal_hedge_max_s{10.0};
    double urgent_hedge_max_s{30.0};
    double survival_mode_max_s{60.0};
    double emergency_exit_s{90.0};
    int64_t reprice_normal_ms{5000};
    int64_t reprice_urgent_ms{3000};
    int64_t reprice_survival_ms{10000};
    int max_hedge_attempts{10};
    int emergency_cross_ticks{2};
};

struct CadenceConfig {
    int64_t cold_eval_ms{1000};
    int64_t warm_eval_ms{500};
    int64_t hot_eval_ms{250};
    int64_t cold_snapshot_ms{2000};
    int64_t warm_snapshot_ms{1000};
    int64_t warm_to_cold_hysteresis_ms{5000};
    int64_t hot_to_warm_hysteresis_ms{3000};
    double near_mispricing_ratio{0.6};
    double hot_mispricing_ratio{0.85};
    double near_percentile{75.0};
    double hot_percentile{90.0};
    int64_t move_age_threshold_ms{1000};
    size_t percentile_window{200};
    int64_t spread_history_ms{2000};
    int64_t spread_change_window_ms{1000};
    double spread_change_min{0.01};
};

struct OrderManagerConfig {
    size_t max_concurrent_orders{10};
    int64_t reconcile_interval_ms{30000};
};

struct RateLimitConfig {
    int max_cancel_replace_per_market_per_minute{10};
    int max_orders_per_market_per_minute{15};
    int max_total_cancels_per_minute{50};
    int max_total_orders_per_minute{100};
    int64_t market_pause_ms{30000};
    int64_t global_pause_ms{60000};
    int consecutive_failures_before_break{5};
    int64_t circuit_breaker_reset_ms{120000};
};

struct FundingConfig {
    double safety_buffer_usd{10.0};
    double min_balance_for_trading{50.0};
    int64_t stale_balance_ms{10000};
    double max_reserved_per_market{150.0};
    double max_total_reserved{400.0};
    size_t blocked_log_capacity{1000};
};

struct BurstLimitConfig {
    int max_orders_per_minute_per_market{6};
    int64_t min_ms_between_orders{2000};
    int64_t window_ms{60000};
};

struct RecoveryConfig {
    bool enabled{true};
    double min_unpaired_for_recovery{25.0};
    double min_win_probability{0.60};
    double max_combined_cost{1.10};
    int64_t cooldown_ms{10000};
};

// Passive two-sided entry quotes placed while a market is flat or paired
struct QuotingConfig {
    bool enabled{true};
    double enter_threshold{0.02};     // Required edge: 1 - (maker UP + maker DOWN)
    double quote_shares{10.0};
    double max_shares_per_side{100.0};
    int64_t loop_interval_ms{250};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct TelemetryConfig {
    bool enabled{true};
    bool log_events{true};
    std::string events_db_path{"./data/events.db"};
};

// One tradable up/down market, supplied by the external discovery process
struct MarketSpec {
    std::string market_id;
    std::string asset;
    std::string up_token_id;
    std::string down_token_id;
    int64_t expiry_epoch_s{0};

    MarketKey key() const { return MarketKey{market_id, asset}; }
};

struct EngineConfig {
    TradingMode mode{TradingMode::DRY_RUN};
    std::string run_id{"local"};

    PriceGuardConfig price_guard;
    MarketStateConfig market_state;
    HedgeEscalatorConfig hedge_escalator;
    HedgePriorityConfig hedge_priority;
    CadenceConfig cadence;
    OrderManagerConfig order_manager;
    RateLimitConfig rate_limit;
    FundingConfig funding;
    BurstLimitConfig burst_limit;
    RecoveryConfig recovery;
    QuotingConfig quoting;
    LoggingConfig logging;
    TelemetryConfig telemetry;

    std::vector<MarketSpec> markets;

    // Load from file
    static EngineConfig load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const SlippageCap& c);
void from_json(const nlohmann::json& j, SlippageCap& c);
void to_json(nlohmann::json& j, const PriceGuardConfig& c);
void from_json(const nlohmann::json& j, PriceGuardConfig& c);
void to_json(nlohmann::json& j, const MarketStateConfig& c);
void from_json(const nlohmann::json& j, MarketStateConfig& c);
void to_json(nlohmann::json& j, const HedgeEscalatorConfig& c);
void from_json(const nlohmann::json& j, HedgeEscalatorConfig& c);
void to_json(nlohmann::json& j, const HedgePriorityConfig& c);
void from_json(const nlohmann::json& j, HedgePriorityConfig& c);
void to_json(nlohmann::json& j, const CadenceConfig& c);
void from_json(const nlohmann::json& j, CadenceConfig& c);
void to_json(nlohmann::json& j, const OrderManagerConfig& c);
void from_json(const nlohmann::json& j, OrderManagerConfig& c);
void to_json(nlohmann::json& j, const RateLimitConfig& c);
void from_json(const nlohmann::json& j, RateLimitConfig& c);
void to_json(nlohmann::json& j, const FundingConfig& c);
void from_json(const nlohmann::json& j, FundingConfig& c);
void to_json(nlohmann::json& j, const BurstLimitConfig& c);
void from_json(const nlohmann::json& j, BurstLimitConfig& c);
void to_json(nlohmann::json& j, const RecoveryConfig& c);
void from_json(const nlohmann::json& j, RecoveryConfig& c);
void to_json(nlohmann::json& j, const QuotingConfig& c);
void from_json(const nlohmann::json& j, QuotingConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const TelemetryConfig& c);
void from_json(const nlohmann::json& j, TelemetryConfig& c);
void to_json(nlohmann::json& j, const MarketSpec& c);
void from_json(const nlohmann::json& j, MarketSpec& c);
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

} // namespace updown
