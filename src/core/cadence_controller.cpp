#include "core/cadence_controller.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace updown {

// ============================================================================
// RollingPercentile
// ============================================================================

void RollingPercentile::push(double value) {
    values_.push_back(value);
    while (values_.size() > max_size_) {
        values_.pop_front();
    }
}

double RollingPercentile::percentile(double p) const {
    if (values_.empty()) return 0.0;
    std::vector<double> sorted(values_.begin(), values_.end());
    std::sort(sorted.begin(), sorted.end());
    auto idx = static_cast<size_t>(std::floor((p / 100.0) * static_cast<double>(sorted.size() - 1)));
    return sorted[std::min(idx, sorted.size() - 1)];
}

// ============================================================================
// CadenceController
// ============================================================================

CadenceController::CadenceController(
    const CadenceConfig& config,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("CadenceController initialized: eval COLD={}ms WARM={}ms HOT={}ms, "
                 "hysteresis warm->cold={}ms hot->warm={}ms",
                 config_.cold_eval_ms, config_.warm_eval_ms, config_.hot_eval_ms,
                 config_.warm_to_cold_hysteresis_ms, config_.hot_to_warm_hysteresis_ms);
}

void CadenceController::apply_intervals(MarketCadenceState& state) const {
    switch (state.state) {
        case CadenceState::COLD:
            state.eval_interval_ms = config_.cold_eval_ms;
            state.snapshot_interval_ms = config_.cold_snapshot_ms;
            break;
        case CadenceState::WARM:
            state.eval_interval_ms = config_.warm_eval_ms;
            state.snapshot_interval_ms = config_.warm_snapshot_ms;
            break;
        case CadenceState::HOT:
            state.eval_interval_ms = config_.hot_eval_ms;
            state.snapshot_interval_ms = NEVER_MS;
            break;
    }
}

void CadenceController::register_market(const std::string& market_id, const std::string& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (markets_.find(market_id) == markets_.end()) {
        MarketCadenceState state;
        state.market_id = market_id;
        state.asset = asset;
        state.last_state_change = clock_->now_ms();
        apply_intervals(state);
        markets_.emplace(market_id, std::move(state));
    }
    if (score_percentiles_.find(asset) == score_percentiles_.end()) {
        score_percentiles_.emplace(asset, RollingPercentile(config_.percentile_window));
    }
}

void CadenceController::unregister_market(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    markets_.erase(market_id);
    spread_history_.erase(market_id);
    last_poly_move_.erase(market_id);
}

void CadenceController::record_spot_move(const std::string& asset, Price /*price*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_spot_move_[asset] = clock_->now_ms();
}

void CadenceController::record_poly_move(const std::string& market_id, Price /*up_mid*/,
                                         Price /*down_mid*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_poly_move_[market_id] = clock_->now_ms();
}

void CadenceController::record_spread(const std::string& market_id, double spread_up,
                                      double spread_down) {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    auto& history = spread_history_[market_id];
    history.push_back(SpreadSample{now, spread_up, spread_down});

    const EpochMs cutoff = now - config_.spread_history_ms;
    while (!history.empty() && history.front().ts < cutoff) {
        history.pop_front();
    }
}

void CadenceController::record_state_score(const std::string& asset, double score) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = score_percentiles_.find(asset);
    if (it != score_percentiles_.end()) {
        it->second.push(score);
    }
}

CadenceEvalResult CadenceController::evaluate_locked(const std::string& asset,
                                                     const CadenceMetrics& m) const {
    double p_near = 0.0;
    double p_hot = 0.0;
    auto it = score_percentiles_.find(asset);
    if (it != score_percentiles_.end()) {
        p_near = it->second.percentile(config_.near_percentile);
        p_hot = it->second.percentile(config_.hot_percentile);
    }

    CadenceEvalResult result;

    const double near_threshold = config_.near_mispricing_ratio * m.enter_threshold;
    if (m.mispricing >= near_threshold) {
        result.near_reasons.push_back(fmt::format("mispricing({:.3f})>={}*threshold({:.3f})",
            m.mispricing, config_.near_mispricing_ratio, near_threshold));
    }
    if (p_near > 0.0 && m.state_score >= p_near) {
        result.near_reasons.push_back(fmt::format("stateScore({:.3f})>=P{:.0f}({:.3f})",
            m.state_score, config_.near_percentile, p_near));
    }
    if (m.spot_move_age_ms < config_.move_age_threshold_ms) {
        result.near_reasons.push_back(fmt::format("spotMoveAge({}ms)<{}ms",
            m.spot_move_age_ms, config_.move_age_threshold_ms));
    }
    if (m.poly_move_age_ms < config_.move_age_threshold_ms) {
        result.near_reasons.push_back(fmt::format("polyMoveAge({}ms)<{}ms",
            m.poly_move_age_ms, config_.move_age_threshold_ms));
    }

    const double hot_threshold = config_.hot_mispricing_ratio * m.enter_threshold;
    if (m.mispricing >= hot_threshold) {
        result.hot_reasons.push_back(fmt::format("mispricing({:.3f})>={}*threshold({:.3f})",
            m.mispricing, config_.hot_mispricing_ratio, hot_threshold));
    }
    if (p_hot > 0.0 && m.state_score >= p_hot) {
        result.hot_reasons.push_back(fmt::format("stateScore({:.3f})>=P{:.0f}({:.3f})",
            m.state_score, config_.hot_percentile, p_hot));
    }
    if (m.spread_changed_tick) {
        result.hot_reasons.push_back("spreadChanged>=1tick/1s");
    }

    result.is_near = !result.near_reasons.empty();
    result.is_hot = !result.hot_reasons.empty();
    return result;
}

CadenceEvalResult CadenceController::evaluate_cadence(const std::string& asset,
                                                      const CadenceMetrics& metrics) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluate_locked(asset, metrics);
}

CadenceState CadenceController::update_state(const std::string& market_id,
                                             const std::string& asset,
                                             const CadenceMetrics& metrics) {
    CadenceState from;
    CadenceState to;
    CadenceEvalResult result;
    int64_t interval = 0;
    EpochMs now = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = markets_.find(market_id);
        if (it == markets_.end()) return CadenceState::COLD;
        auto& state = it->second;

        now = clock_->now_ms();
        result = evaluate_locked(asset, metrics);

        if (!result.is_near) {
            if (!state.near_false_since) state.near_false_since = now;
        } else {
            state.near_false_since.reset();
        }
        if (!result.is_hot) {
            if (!state.hot_false_since) state.hot_false_since = now;
        } else {
            state.hot_false_since.reset();
        }

        auto near_quiet = [&]() {
            return state.near_false_since &&
                   now - *state.near_false_since >= config_.warm_to_cold_hysteresis_ms;
        };

        from = state.state;
        to = from;
        switch (from) {
            case CadenceState::COLD:
                if (result.is_near) to = CadenceState::WARM;
                if (result.is_hot) to = CadenceState::HOT;
                break;
            case CadenceState::WARM:
                if (result.is_hot) to = CadenceState::HOT;
                if (near_quiet()) to = CadenceState::COLD;
                break;
            case CadenceState::HOT:
                if (state.hot_false_since &&
                    now - *state.hot_false_since >= config_.hot_to_warm_hysteresis_ms) {
                    to = near_quiet() ? CadenceState::COLD : CadenceState::WARM;
                }
                break;
        }

        if (to == from) return to;

        state.state = to;
        state.last_state_change = now;
        apply_intervals(state);
        interval = state.eval_interval_ms;
    }

    spdlog::info("[Cadence] {} {} -> {} | near={} hot={} | interval={}ms",
                 market_id, cadence_state_to_string(from), cadence_state_to_string(to),
                 result.is_near, result.is_hot, interval);

    TelemetryEvent event;
    event.type = "CADENCE_TRANSITION";
    event.ts_ms = now;
    event.market_id = market_id;
    event.asset = asset;
    event.data = {
        {"from", cadence_state_to_string(from)},
        {"to", cadence_state_to_string(to)},
        {"near_reasons", result.near_reasons},
        {"hot_reasons", result.hot_reasons},
        {"eval_interval_ms", interval}
    };
    emit_event(sink_.get(), event);
    return to;
}

bool CadenceController::should_evaluate(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) return true;
    return clock_->now_ms() - it->second.last_eval_ts >= it->second.eval_interval_ms;
}

void CadenceController::mark_evaluated(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it != markets_.end()) {
        it->second.last_eval_ts = clock_->now_ms();
    }
}

bool CadenceController::should_log_full_snapshot(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) return true;
    if (it->second.state == CadenceState::HOT) return false;
    return clock_->now_ms() - it->second.last_full_snapshot_ts >= it->second.snapshot_interval_ms;
}

void CadenceController::mark_full_snapshot(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it != markets_.end()) {
        it->second.last_full_snapshot_ts = clock_->now_ms();
    }
}

int64_t CadenceController::get_eval_interval_ms(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    return it != markets_.end() ? it->second.eval_interval_ms : config_.cold_eval_ms;
}

CadenceState CadenceController::get_state(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    return it != markets_.end() ? it->second.state : CadenceState::COLD;
}

bool CadenceController::spread_changed_locked(const std::string& market_id, EpochMs now) const {
    auto it = spread_history_.find(market_id);
    if (it == spread_history_.end() || it->second.size() < 2) return false;

    const EpochMs cutoff = now - config_.spread_change_window_ms;
    const SpreadSample* first = nullptr;
    const SpreadSample* last = nullptr;
    int recent = 0;
    for (const auto& sample : it->second) {
        if (sample.ts < cutoff) continue;
        if (!first) first = &sample;
        last = &sample;
        ++recent;
    }
    if (recent < 2) return false;

    // Small epsilon so a one-tick move survives floating-point spreads
    const double min_change = config_.spread_change_min - 1e-9;
    return std::abs(last->spread_up - first->spread_up) >= min_change ||
           std::abs(last->spread_down - first->spread_down) >= min_change;
}

bool CadenceController::check_spread_changed(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spread_changed_locked(market_id, clock_->now_ms());
}

int64_t CadenceController::get_spot_move_age_ms(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_spot_move_.find(asset);
    if (it == last_spot_move_.end()) return NEVER_MS;
    return clock_->now_ms() - it->second;
}

int64_t CadenceController::get_poly_move_age_ms(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_poly_move_.find(market_id);
    if (it == last_poly_move_.end()) return NEVER_MS;
    return clock_->now_ms() - it->second;
}

CadenceStats CadenceController::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CadenceStats s;
    for (const auto& [id, state] : markets_) {
        switch (state.state) {
            case CadenceState::COLD: s.cold++; break;
            case CadenceState::WARM: s.warm++; break;
            case CadenceState::HOT: s.hot++; break;
        }
    }
    s.total = static_cast<int>(markets_.size());
    return s;
}

CadenceMetrics CadenceController::build_metrics(
    const std::string& market_id,
    const std::string& asset,
    double mispricing,
    double enter_threshold,
    double state_score,
    double spread_up,
    double spread_down
) {
    record_spread(market_id, spread_up, spread_down);
    record_state_score(asset, state_score);

    CadenceMetrics m;
    m.mispricing = mispricing;
    m.enter_threshold = enter_threshold;
    m.state_score = state_score;
    m.spot_move_age_ms = get_spot_move_age_ms(asset);
    m.poly_move_age_ms = get_poly_move_age_ms(market_id);
    m.spread_changed_tick = check_spread_changed(market_id);
    return m;
}

} // namespace updown
