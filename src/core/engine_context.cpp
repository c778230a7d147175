#include "core/engine_context.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace updown {

std::unique_ptr<EngineContext> EngineContext::create(
    const EngineConfig& config,
    std::shared_ptr<VenueClient> venue,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
) {
    if (!venue) {
        throw std::invalid_argument("EngineContext requires a venue client");
    }

    auto ctx = std::make_unique<EngineContext>();
    ctx->config = config;
    ctx->clock = clock ? std::move(clock) : make_system_clock();
    ctx->sink = sink ? std::move(sink) : make_null_sink();
    ctx->venue = std::move(venue);

    const auto& c = ctx->config;
    ctx->price_guard = std::make_shared<PriceGuard>(c.price_guard, ctx->clock, ctx->sink);
    ctx->rate_limiter = std::make_shared<OrderRateLimiter>(c.rate_limit, ctx->clock);
    ctx->burst_limiter = std::make_shared<BurstLimiter>(c.burst_limit, ctx->clock);
    ctx->ledger = std::make_shared<ReserveLedger>(ctx->clock);
    ctx->funding = std::make_shared<FundingGate>(c.funding, ctx->venue, ctx->ledger,
                                                 ctx->clock, ctx->sink);
    ctx->gateway = std::make_shared<OrderGateway>(ctx->venue, ctx->price_guard,
                                                  ctx->rate_limiter, ctx->burst_limiter);

    ctx->market_state = std::make_shared<MarketStateManager>(c.market_state, ctx->clock, ctx->sink);
    ctx->hedge_lane = std::make_shared<HedgePriorityLane>(c.hedge_priority, ctx->price_guard,
                                                          ctx->clock, ctx->sink);
    ctx->escalator = std::make_shared<HedgeEscalator>(c.hedge_escalator, ctx->gateway, ctx->venue,
                                                      ctx->rate_limiter, ctx->funding, ctx->ledger,
                                                      ctx->clock, ctx->sink);
    ctx->loss_recovery = std::make_shared<LossRecovery>(c.recovery, ctx->gateway, ctx->clock, ctx->sink);
    ctx->cadence = std::make_shared<CadenceController>(c.cadence, ctx->clock, ctx->sink);
    ctx->order_manager = std::make_shared<OrderManager>(c.order_manager, ctx->venue, ctx->ledger,
                                                        ctx->clock, ctx->sink);
    ctx->reconciler = std::make_shared<Reconciler>(ctx->venue, ctx->order_manager, ctx->ledger,
                                                   ctx->clock, ctx->sink);

    spdlog::info("EngineContext ready: mode={}, run_id={}, {} markets",
                 mode_to_string(c.mode), c.run_id, c.markets.size());
    return ctx;
}

} // namespace updown
