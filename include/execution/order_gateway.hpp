#pragma once

#include <memory>
#include <string>
#include "common/types.hpp"
#include "market_data/venue_client.hpp"
#include "risk/burst_limiter.hpp"
#include "risk/price_guard.hpp"
#include "risk/rate_limiter.hpp"
#include "utils/clock.hpp"

namespace updown {

enum class SubmitCode {
    OK,
    RATE_LIMITED,
    BURST_LIMITED,
    STALE_BOOK,
    PRICE_BLOCKED,
    VENUE_REJECTED,
    API_ERROR
};

inline std::string submit_code_to_string(SubmitCode c) {
    switch (c) {
        case SubmitCode::OK: return "OK";
        case SubmitCode::RATE_LIMITED: return "RATE_LIMITED";
        case SubmitCode::BURST_LIMITED: return "BURST_LIMITED";
        case SubmitCode::STALE_BOOK: return "STALE_BOOK";
        case SubmitCode::PRICE_BLOCKED: return "PRICE_BLOCKED";
        case SubmitCode::VENUE_REJECTED: return "VENUE_REJECTED";
        case SubmitCode::API_ERROR: return "API_ERROR";
    }
    return "UNKNOWN";
}

struct SubmitRequest {
    MarketKey key;
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
    OrderType order_type{OrderType::GTC};
    BookSnapshot book;
    bool emergency_mode{false};
    std::string intent;
};

struct SubmitResult {
    bool success{false};
    SubmitCode code{SubmitCode::OK};
    std::string message;
    Price submitted_price{0.0};
    PriceCheckResult price_check;
    OrderResponse venue;

    explicit operator bool() const { return success; }
};

/**
 * The only path from a trading decision to the venue.
 *
 * Every submission is admitted (unless the intent has hedge priority),
 * checked for book freshness, validated by PriceGuard, and only then
 * sent at PriceGuard's safe price.
 */
class OrderGateway {
public:
    OrderGateway(
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<PriceGuard> price_guard,
        std::shared_ptr<RateLimiter> rate_limiter,
        std::shared_ptr<BurstLimiter> burst_limiter
    );

    SubmitResult submit(const SubmitRequest& req);

private:
    std::shared_ptr<VenueClient> venue_;
    std::shared_ptr<PriceGuard> price_guard_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<BurstLimiter> burst_limiter_;
};

} // namespace updown
