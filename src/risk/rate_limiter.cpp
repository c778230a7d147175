#include "risk/rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace updown {

OrderRateLimiter::OrderRateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
{
    spdlog::info("OrderRateLimiter initialized: market={}/min (cancel/replace {}), global={}/min "
                 "(cancel {}), breaker after {} failures",
                 config_.max_orders_per_market_per_minute,
                 config_.max_cancel_replace_per_market_per_minute,
                 config_.max_total_orders_per_minute,
                 config_.max_total_cancels_per_minute,
                 config_.consecutive_failures_before_break);
}

void OrderRateLimiter::prune(std::deque<Event>& events, EpochMs now) {
    while (!events.empty() && now - events.front().ts > WINDOW_MS) {
        events.pop_front();
    }
}

int OrderRateLimiter::count_cancel_replace(const std::deque<Event>& events) {
    int n = 0;
    for (const auto& e : events) {
        if (e.kind != RequestKind::ORDER) n++;
    }
    return n;
}

RateLimitResult OrderRateLimiter::check_allowed(const std::string& market_id, RequestKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    auto& market = markets_[market_id];
    RateLimitResult result;

    // Circuit breaker
    if (market.circuit_open) {
        int64_t elapsed = now - market.circuit_open_at;
        if (elapsed < config_.circuit_breaker_reset_ms) {
            result.allowed = false;
            result.reason = "CIRCUIT_BREAKER_OPEN";
            result.wait_ms = config_.circuit_breaker_reset_ms - elapsed;
            return result;
        }
        spdlog::info("[RateLimiter] Circuit breaker reset for {}", market_id);
        market.circuit_open = false;
        market.consecutive_failures = 0;
    }

    // Global pause
    if (now < global_paused_until_) {
        result.allowed = false;
        result.reason = "GLOBAL_PAUSE";
        result.wait_ms = global_paused_until_ - now;
        return result;
    }

    prune(global_events_, now);
    if (count_cancel_replace(global_events_) >= config_.max_total_cancels_per_minute) {
        global_paused_until_ = now + config_.global_pause_ms;
        spdlog::warn("[RateLimiter] Global cancel limit hit, pausing all markets for {}ms",
                     config_.global_pause_ms);
        result.allowed = false;
        result.reason = "GLOBAL_CANCEL_LIMIT";
        result.wait_ms = config_.global_pause_ms;
        return result;
    }
    if (static_cast<int>(global_events_.size()) >= config_.max_total_orders_per_minute) {
        global_paused_until_ = now + config_.global_pause_ms;
        spdlog::warn("[RateLimiter] Global order limit hit, pausing all markets for {}ms",
                     config_.global_pause_ms);
        result.allowed = false;
        result.reason = "GLOBAL_ORDER_LIMIT";
        result.wait_ms = config_.global_pause_ms;
        return result;
    }

    // Market pause
    if (now < market.paused_until) {
        result.allowed = false;
        result.reason = "MARKET_PAUSED";
        result.wait_ms = market.paused_until - now;
        return result;
    }

    prune(market.events, now);
    if (kind != RequestKind::ORDER &&
        count_cancel_replace(market.events) >= config_.max_cancel_replace_per_market_per_minute) {
        market.paused_until = now + config_.market_pause_ms;
        spdlog::warn("[RateLimiter] {} cancel/replace limit hit on {}, pausing for {}ms",
                     market_id, request_kind_to_string(kind), config_.market_pause_ms);
        result.allowed = false;
        result.reason = "MARKET_CANCEL_LIMIT";
        result.wait_ms = config_.market_pause_ms;
        return result;
    }
    if (static_cast<int>(market.events.size()) >= config_.max_orders_per_market_per_minute) {
        market.paused_until = now + config_.market_pause_ms;
        spdlog::warn("[RateLimiter] {} order limit hit, pausing for {}ms",
                     market_id, config_.market_pause_ms);
        result.allowed = false;
        result.reason = "MARKET_ORDER_LIMIT";
        result.wait_ms = config_.market_pause_ms;
        return result;
    }

    return result;
}

void OrderRateLimiter::record_event(const std::string& market_id, RequestKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    auto& market = markets_[market_id];
    market.events.push_back({now, kind});
    market.consecutive_failures = 0;
    global_events_.push_back({now, kind});
}

void OrderRateLimiter::record_failure(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& market = markets_[market_id];
    market.consecutive_failures++;
    if (!market.circuit_open &&
        market.consecutive_failures >= config_.consecutive_failures_before_break) {
        market.circuit_open = true;
        market.circuit_open_at = clock_->now_ms();
        spdlog::error("[RateLimiter] Circuit breaker OPEN for {} after {} consecutive failures",
                      market_id, market.consecutive_failures);
    }
}

void OrderRateLimiter::reset_failures(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it != markets_.end()) {
        it->second.consecutive_failures = 0;
    }
}

void OrderRateLimiter::force_reset_circuit_breaker(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(market_id);
    if (it != markets_.end()) {
        it->second.circuit_open = false;
        it->second.consecutive_failures = 0;
        spdlog::warn("[RateLimiter] Circuit breaker force-reset for {}", market_id);
    }
}

void OrderRateLimiter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    markets_.clear();
    global_events_.clear();
    global_paused_until_ = 0;
}

nlohmann::json OrderRateLimiter::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    nlohmann::json markets = nlohmann::json::object();
    for (const auto& [id, m] : markets_) {
        markets[id] = {
            {"events_in_window", m.events.size()},
            {"paused", now < m.paused_until},
            {"consecutive_failures", m.consecutive_failures},
            {"circuit_open", m.circuit_open}
        };
    }
    return nlohmann::json{
        {"global_events_in_window", global_events_.size()},
        {"global_paused", now < global_paused_until_},
        {"markets", markets}
    };
}

} // namespace updown
