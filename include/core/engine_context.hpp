#pragma once

#include <memory>
#include "config/config.hpp"
#include "core/cadence_controller.hpp"
#include "core/market_state_manager.hpp"
#include "core/reconciler.hpp"
#include "execution/hedge_escalator.hpp"
#include "execution/hedge_priority_lane.hpp"
#include "execution/loss_recovery.hpp"
#include "execution/order_gateway.hpp"
#include "execution/order_manager.hpp"
#include "market_data/venue_client.hpp"
#include "risk/burst_limiter.hpp"
#include "risk/funding.hpp"
#include "risk/price_guard.hpp"
#include "risk/rate_limiter.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

/**
 * Owns one instance of every engine component and wires them together.
 * Nothing in the engine is a process-wide singleton; tests build their
 * own context around a manual clock and a paper venue.
 */
struct EngineContext {
    EngineConfig config;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<EventSink> sink;
    std::shared_ptr<VenueClient> venue;

    std::shared_ptr<PriceGuard> price_guard;
    std::shared_ptr<OrderRateLimiter> rate_limiter;
    std::shared_ptr<BurstLimiter> burst_limiter;
    std::shared_ptr<ReserveLedger> ledger;
    std::shared_ptr<FundingGate> funding;
    std::shared_ptr<OrderGateway> gateway;

    std::shared_ptr<MarketStateManager> market_state;
    std::shared_ptr<HedgePriorityLane> hedge_lane;
    std::shared_ptr<HedgeEscalator> escalator;
    std::shared_ptr<LossRecovery> loss_recovery;
    std::shared_ptr<CadenceController> cadence;
    std::shared_ptr<OrderManager> order_manager;
    std::shared_ptr<Reconciler> reconciler;

    static std::unique_ptr<EngineContext> create(
        const EngineConfig& config,
        std::shared_ptr<VenueClient> venue,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );
};

} // namespace updown
