#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/clock.hpp"

namespace updown {

struct BurstCheckResult {
    bool allowed{true};
    std::string reason;
    int64_t wait_ms{0};

    explicit operator bool() const { return allowed; }
};

/**
 * Per-market order burst limiter: caps placements per window and
 * enforces a minimum spacing between consecutive placements.
 */
class BurstLimiter {
public:
    BurstLimiter(const BurstLimitConfig& config, std::shared_ptr<Clock> clock);

    BurstCheckResult check(const MarketKey& key);
    void record_placement(const MarketKey& key);

    void clear(const MarketKey& key);
    nlohmann::json stats() const;

private:
    BurstLimitConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<MarketKey, std::deque<EpochMs>> placements_;
    int64_t total_blocked_{0};

    void prune(std::deque<EpochMs>& q, EpochMs now) const;
};

} // namespace updown
