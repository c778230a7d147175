#pragma once

#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class CadenceState {
    COLD,
    WARM,
    HOT
};

inline std::string cadence_state_to_string(CadenceState s) {
    switch (s) {
        case CadenceState::COLD: return "COLD";
        case CadenceState::WARM: return "WARM";
        case CadenceState::HOT: return "HOT";
    }
    return "UNKNOWN";
}

// Age reported for a move that was never observed
constexpr int64_t NEVER_MS = std::numeric_limits<int64_t>::max();

struct CadenceMetrics {
    double mispricing{0.0};
    double enter_threshold{0.0};
    double state_score{0.0};
    int64_t spot_move_age_ms{NEVER_MS};
    int64_t poly_move_age_ms{NEVER_MS};
    bool spread_changed_tick{false};
};

struct CadenceEvalResult {
    bool is_near{false};
    bool is_hot{false};
    std::vector<std::string> near_reasons;
    std::vector<std::string> hot_reasons;
};

struct MarketCadenceState {
    std::string market_id;
    std::string asset;
    CadenceState state{CadenceState::COLD};
    EpochMs last_eval_ts{0};
    EpochMs last_full_snapshot_ts{0};
    std::optional<EpochMs> near_false_since;
    std::optional<EpochMs> hot_false_since;
    EpochMs last_state_change{0};
    int64_t eval_interval_ms{0};
    int64_t snapshot_interval_ms{0};    // NEVER_MS in HOT: snapshots are event-driven
};

struct CadenceStats {
    int cold{0};
    int warm{0};
    int hot{0};
    int total{0};
};

/**
 * Bounded rolling window answering percentile queries.
 */
class RollingPercentile {
public:
    explicit RollingPercentile(size_t max_size = 200) : max_size_(max_size) {}

    void push(double value);
    // Value at index floor(p/100 * (n-1)) of the sorted window, 0 when empty
    double percentile(double p) const;
    size_t size() const { return values_.size(); }

private:
    size_t max_size_;
    std::deque<double> values_;
};

/**
 * CadenceController decides how often each market is evaluated.
 *
 * DESIGN:
 * - A market is "near" or "hot" when any objective signal fires
 *   (mispricing ratio, state-score percentile, recent moves, spread change)
 * - Escalation is immediate, de-escalation needs the signal to stay
 *   false for a hysteresis window
 * - Percentiles are tracked per asset, moves per asset (spot) and per
 *   market (quotes)
 */
class CadenceController {
public:
    CadenceController(
        const CadenceConfig& config,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    void register_market(const std::string& market_id, const std::string& asset);
    void unregister_market(const std::string& market_id);

    // Signals
    void record_spot_move(const std::string& asset, Price price);
    void record_poly_move(const std::string& market_id, Price up_mid, Price down_mid);
    void record_spread(const std::string& market_id, double spread_up, double spread_down);
    void record_state_score(const std::string& asset, double score);

    CadenceEvalResult evaluate_cadence(const std::string& asset, const CadenceMetrics& metrics) const;
    CadenceState update_state(const std::string& market_id, const std::string& asset,
                              const CadenceMetrics& metrics);

    // Timing
    bool should_evaluate(const std::string& market_id) const;
    void mark_evaluated(const std::string& market_id);
    bool should_log_full_snapshot(const std::string& market_id) const;
    void mark_full_snapshot(const std::string& market_id);

    int64_t get_eval_interval_ms(const std::string& market_id) const;
    CadenceState get_state(const std::string& market_id) const;
    bool check_spread_changed(const std::string& market_id) const;
    int64_t get_spot_move_age_ms(const std::string& asset) const;
    int64_t get_poly_move_age_ms(const std::string& market_id) const;

    CadenceStats stats() const;

    // Records spread and score, then assembles metrics from tracked signals
    CadenceMetrics build_metrics(
        const std::string& market_id,
        const std::string& asset,
        double mispricing,
        double enter_threshold,
        double state_score,
        double spread_up,
        double spread_down
    );

private:
    struct SpreadSample {
        EpochMs ts;
        double spread_up;
        double spread_down;
    };

    CadenceConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<std::string, MarketCadenceState> markets_;
    std::map<std::string, RollingPercentile> score_percentiles_;
    std::map<std::string, std::deque<SpreadSample>> spread_history_;
    std::map<std::string, EpochMs> last_spot_move_;
    std::map<std::string, EpochMs> last_poly_move_;

    void apply_intervals(MarketCadenceState& state) const;
    CadenceEvalResult evaluate_locked(const std::string& asset, const CadenceMetrics& metrics) const;
    bool spread_changed_locked(const std::string& market_id, EpochMs now) const;
};

} // namespace updown
