#include "execution/order_gateway.hpp"
#include "execution/hedge_priority_lane.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace updown {

OrderGateway::OrderGateway(
    std::shared_ptr<VenueClient> venue,
    std::shared_ptr<PriceGuard> price_guard,
    std::shared_ptr<RateLimiter> rate_limiter,
    std::shared_ptr<BurstLimiter> burst_limiter
)
    : venue_(std::move(venue))
    , price_guard_(std::move(price_guard))
    , rate_limiter_(std::move(rate_limiter))
    , burst_limiter_(std::move(burst_limiter))
{
}

SubmitResult OrderGateway::submit(const SubmitRequest& req) {
    SubmitResult result;

    if (rate_limiter_ && !HedgePriorityLane::should_bypass_rate_limiter(req.intent)) {
        auto rl = rate_limiter_->check_allowed(req.key.market_id, RequestKind::ORDER);
        if (!rl.allowed) {
            result.code = SubmitCode::RATE_LIMITED;
            result.message = fmt::format("{} (wait {}ms)", rl.reason, rl.wait_ms);
            return result;
        }
    }

    if (burst_limiter_ && !HedgePriorityLane::should_bypass_burst_limiter(req.intent)) {
        auto burst = burst_limiter_->check(req.key);
        if (!burst.allowed) {
            result.code = SubmitCode::BURST_LIMITED;
            result.message = burst.reason;
            return result;
        }
    }

    auto freshness = price_guard_->check_book_freshness(req.book);
    if (!freshness.fresh) {
        result.code = SubmitCode::STALE_BOOK;
        result.message = freshness.reason;
        return result;
    }

    PriceCheckRequest check;
    check.side = req.side;
    check.requested_price = req.price;
    check.book = req.book;
    check.emergency_mode = req.emergency_mode;
    check.key = req.key;
    check.intent = req.intent;
    result.price_check = price_guard_->check_price(check);

    if (!result.price_check.allowed) {
        result.code = SubmitCode::PRICE_BLOCKED;
        result.message = result.price_check.message;
        spdlog::info("[Gateway] {} {} {} blocked ({}): {}", req.key.to_string(), req.intent,
                     side_to_string(req.side),
                     price_block_reason_to_string(result.price_check.reason), result.message);
        return result;
    }

    result.submitted_price = result.price_check.safe_price;

    OrderRequest order;
    order.token_id = req.token_id;
    order.side = req.side;
    order.price = result.submitted_price;
    order.size = req.size;
    order.order_type = req.order_type;

    try {
        result.venue = venue_->place_order(order);
    } catch (const std::exception& e) {
        result.code = SubmitCode::API_ERROR;
        result.message = e.what();
        spdlog::error("[Gateway] {} place_order threw: {}", req.key.to_string(), e.what());
        return result;
    }

    if (!result.venue.success) {
        result.code = SubmitCode::VENUE_REJECTED;
        result.message = result.venue.error;
        return result;
    }

    if (burst_limiter_) {
        burst_limiter_->record_placement(req.key);
    }

    auto telemetry = price_guard_->build_order_telemetry(
        req.side, req.price, result.submitted_price, req.book, req.intent, req.key);
    spdlog::info("[Gateway] {} {} {} {:.1f} @ {:.2f} -> {} filled={:.1f} ({})",
                 req.key.to_string(), req.intent, side_to_string(req.side), req.size,
                 result.submitted_price, result.venue.order_id, result.venue.filled_size,
                 telemetry.dump());

    result.success = true;
    result.code = SubmitCode::OK;
    return result;
}

} // namespace updown
