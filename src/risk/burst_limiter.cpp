#include "risk/burst_limiter.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace updown {

BurstLimiter::BurstLimiter(const BurstLimitConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
{
    spdlog::info("BurstLimiter initialized: {}/{}ms per market, min gap {}ms",
                 config_.max_orders_per_minute_per_market, config_.window_ms,
                 config_.min_ms_between_orders);
}

void BurstLimiter::prune(std::deque<EpochMs>& q, EpochMs now) const {
    while (!q.empty() && now - q.front() > config_.window_ms) {
        q.pop_front();
    }
}

BurstCheckResult BurstLimiter::check(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    BurstCheckResult result;

    auto it = placements_.find(key);
    if (it == placements_.end()) return result;

    auto& q = it->second;
    prune(q, now);
    if (q.empty()) return result;

    if (static_cast<int>(q.size()) >= config_.max_orders_per_minute_per_market) {
        total_blocked_++;
        result.allowed = false;
        result.wait_ms = config_.window_ms - (now - q.front());
        result.reason = fmt::format("BURST_LIMIT: {} orders in last {}ms",
                                    q.size(), config_.window_ms);
        return result;
    }

    int64_t since_last = now - q.back();
    if (since_last < config_.min_ms_between_orders) {
        total_blocked_++;
        result.allowed = false;
        result.wait_ms = config_.min_ms_between_orders - since_last;
        result.reason = fmt::format("BURST_SPACING: {}ms since last order (min {}ms)",
                                    since_last, config_.min_ms_between_orders);
        return result;
    }

    return result;
}

void BurstLimiter::record_placement(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const EpochMs now = clock_->now_ms();
    auto& q = placements_[key];
    prune(q, now);
    q.push_back(now);
}

void BurstLimiter::clear(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    placements_.erase(key);
}

nlohmann::json BurstLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t recent = 0;
    for (const auto& [key, q] : placements_) {
        recent += q.size();
    }
    return nlohmann::json{
        {"tracked_markets", placements_.size()},
        {"recent_placements", recent},
        {"total_blocked", total_blocked_}
    };
}

} // namespace updown
