#include "risk/price_guard.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace updown {

namespace {

// Tolerance for comparing prices that sit on the tick grid
constexpr double kPriceEps = 1e-9;

double units_per_dollar(double tick) {
    return std::round(1.0 / tick);
}

Price from_ticks(long long ticks, double tick) {
    return static_cast<double>(ticks) / units_per_dollar(tick);
}

long long to_ticks(Price price, double tick) {
    return std::llround(price * units_per_dollar(tick));
}

} // namespace

PriceGuard::PriceGuard(
    const PriceGuardConfig& config,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<EventSink> sink
)
    : config_(config)
    , clock_(std::move(clock))
    , sink_(sink ? std::move(sink) : make_null_sink())
{
    spdlog::info("PriceGuard initialized: tick={:.3f}, max_book_age={}ms, emergency_cross={} ticks, "
                 "emergency_cooldown={}ms",
                 config_.tick_size, config_.max_book_age_ms,
                 config_.emergency_max_cross_ticks, config_.emergency_min_interval_ms);
}

Price PriceGuard::round_buy_price(Price price, double tick) {
    if (!std::isfinite(price)) return price;
    double units = units_per_dollar(tick);
    // Snap values already on the grid before flooring
    auto n = static_cast<long long>(std::floor(price * units + kPriceEps));
    return static_cast<double>(n) / units;
}

Price PriceGuard::round_sell_price(Price price, double tick) {
    if (!std::isfinite(price)) return price;
    double units = units_per_dollar(tick);
    auto n = static_cast<long long>(std::ceil(price * units - kPriceEps));
    return static_cast<double>(n) / units;
}

Price PriceGuard::round_price(Price price, Side side, double tick) {
    return side == Side::BUY ? round_buy_price(price, tick) : round_sell_price(price, tick);
}

BookFreshnessResult PriceGuard::check_book_freshness(const BookSnapshot& book) const {
    BookFreshnessResult result;
    result.age_ms = clock_->now_ms() - book.fetched_at;

    if (result.age_ms > config_.max_book_age_ms) {
        result.fresh = false;
        result.reason = fmt::format("STALE_BOOK: age={}ms exceeds max={}ms",
                                    result.age_ms, config_.max_book_age_ms);
        return result;
    }

    result.fresh = true;
    return result;
}

PriceCheckResult PriceGuard::blocked(
    PriceBlockReason reason,
    std::string message,
    Price requested,
    Price best
) const {
    PriceCheckResult result;
    result.allowed = false;
    result.reason = reason;
    result.message = std::move(message);
    result.requested_price = requested;
    result.best_price = best;
    return result;
}

bool PriceGuard::try_claim_emergency(const MarketKey& key, EpochMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_emergency_ms_.find(key);
    if (it != last_emergency_ms_.end() && now - it->second < config_.emergency_min_interval_ms) {
        return false;
    }
    last_emergency_ms_[key] = now;
    return true;
}

PriceCheckResult PriceGuard::check_price(const PriceCheckRequest& req) {
    const auto& book = req.book;
    const double tick = config_.tick_size;
    const Price best_for_side = req.side == Side::BUY ? book.best_ask : book.best_bid;

    if (!std::isfinite(book.best_bid) || !std::isfinite(book.best_ask) ||
        book.best_bid <= 0.0 || book.best_ask <= 0.0) {
        return blocked(PriceBlockReason::INVALID_BOOK,
                       "INVALID_BOOK: bestBid or bestAsk is invalid",
                       req.requested_price, best_for_side);
    }

    if (book.best_bid >= book.best_ask) {
        return blocked(PriceBlockReason::INVERTED_BOOK,
                       fmt::format("INVERTED_BOOK: bestBid={:.4f} >= bestAsk={:.4f}",
                                   book.best_bid, book.best_ask),
                       req.requested_price, best_for_side);
    }

    if (!std::isfinite(req.requested_price) || req.requested_price <= 0.0) {
        return blocked(PriceBlockReason::INVALID_PRICE,
                       "INVALID_PRICE: requested price is not a positive finite number",
                       req.requested_price, best_for_side);
    }

    const Price rounded = round_price(req.requested_price, req.side, tick);
    const int max_cross = config_.emergency_max_cross_ticks;

    if (req.side == Side::BUY) {
        const Price max_allowed = book.best_ask - tick;
        if (rounded <= max_allowed + kPriceEps) {
            PriceCheckResult result;
            result.allowed = true;
            result.safe_price = rounded;
            result.rounded_from = req.requested_price;
            result.ticks_from_edge = static_cast<int>(std::lround((book.best_ask - rounded) / tick));
            result.best_price = book.best_ask;
            return result;
        }

        if (!req.emergency_mode) {
            auto ticks_over = std::lround((rounded - max_allowed) / tick);
            return blocked(PriceBlockReason::CROSSING_BLOCKED,
                           fmt::format("CROSSING_BLOCKED: BUY @ {:.2f} would cross (bestAsk={:.2f}, over by {} ticks)",
                                       rounded, book.best_ask, ticks_over),
                           rounded, book.best_ask);
        }
    } else {
        const Price min_allowed = book.best_bid + tick;
        if (rounded >= min_allowed - kPriceEps) {
            PriceCheckResult result;
            result.allowed = true;
            result.safe_price = rounded;
            result.rounded_from = req.requested_price;
            result.ticks_from_edge = static_cast<int>(std::lround((rounded - book.best_bid) / tick));
            result.best_price = book.best_bid;
            return result;
        }

        if (!req.emergency_mode) {
            auto ticks_under = std::lround((min_allowed - rounded) / tick);
            return blocked(PriceBlockReason::CROSSING_BLOCKED,
                           fmt::format("CROSSING_BLOCKED: SELL @ {:.2f} would cross (bestBid={:.2f}, under by {} ticks)",
                                       rounded, book.best_bid, ticks_under),
                           rounded, book.best_bid);
        }
    }

    // Emergency crossing: bounded and rate-limited per market
    const EpochMs now = clock_->now_ms();
    if (!try_claim_emergency(req.key, now)) {
        return blocked(PriceBlockReason::EMERGENCY_RATE_LIMITED,
                       "EMERGENCY_RATE_LIMITED: too soon after last emergency order",
                       rounded, best_for_side);
    }

    Price emergency_price;
    int ticks_crossed;
    if (req.side == Side::BUY) {
        Price cap = from_ticks(to_ticks(book.best_ask, tick) + max_cross, tick);
        emergency_price = std::min(rounded, cap);
        // Counted from the passive edge, so a price at the ask is one tick over
        ticks_crossed = static_cast<int>(std::lround((emergency_price - book.best_ask) / tick)) + 1;
    } else {
        Price floor_price = from_ticks(to_ticks(book.best_bid, tick) - max_cross, tick);
        emergency_price = std::max(rounded, floor_price);
        ticks_crossed = static_cast<int>(std::lround((book.best_bid - emergency_price) / tick)) + 1;
    }

    spdlog::warn("[PriceGuard] EMERGENCY_CROSS {} {} @ {:.2f} (best={:.2f}, crossed {} ticks, intent={})",
                 req.key.to_string(), side_to_string(req.side),
                 emergency_price, best_for_side, ticks_crossed, req.intent);

    TelemetryEvent event;
    event.type = "EMERGENCY_CROSS";
    event.ts_ms = now;
    event.market_id = req.key.market_id;
    event.asset = req.key.asset;
    event.data = {
        {"side", side_to_string(req.side)},
        {"intent", req.intent},
        {"requested_price", rounded},
        {"emergency_price", emergency_price},
        {"best_bid", book.best_bid},
        {"best_ask", book.best_ask},
        {"ticks_crossed", ticks_crossed}
    };
    emit_event(sink_.get(), event);

    PriceCheckResult result;
    result.allowed = true;
    result.safe_price = emergency_price;
    result.rounded_from = req.requested_price;
    result.ticks_from_edge = -ticks_crossed;
    result.best_price = best_for_side;
    return result;
}

Price PriceGuard::select_maker_buy_price(const BookSnapshot& book) const {
    const double tick = config_.tick_size;
    Price improved_bid = book.best_bid + tick;
    Price max_safe = book.best_ask - tick;
    return round_buy_price(std::min(improved_bid, max_safe), tick);
}

Price PriceGuard::select_maker_sell_price(const BookSnapshot& book) const {
    const double tick = config_.tick_size;
    Price improved_ask = book.best_ask - tick;
    Price min_safe = book.best_bid + tick;
    return round_sell_price(std::max(improved_ask, min_safe), tick);
}

Price PriceGuard::select_maker_price(Side side, const BookSnapshot& book) const {
    return side == Side::BUY ? select_maker_buy_price(book) : select_maker_sell_price(book);
}

SpreadCheckResult PriceGuard::is_spread_sufficient(const BookSnapshot& book) const {
    SpreadCheckResult result;
    Price spread = book.best_ask - book.best_bid;
    result.spread_cents = static_cast<int>(std::lround(spread * 100.0));

    if (spread + kPriceEps < config_.min_spread_for_maker) {
        result.sufficient = false;
        result.reason = fmt::format("SPREAD_TOO_TIGHT: {}c < {:.0f}c minimum",
                                    result.spread_cents, config_.min_spread_for_maker * 100.0);
        return result;
    }

    result.sufficient = true;
    return result;
}

nlohmann::json PriceGuard::build_order_telemetry(
    Side side,
    Price requested_price,
    Price submitted_price,
    const BookSnapshot& book,
    const std::string& intent,
    const MarketKey& key
) const {
    const double tick = config_.tick_size;
    bool crossing = side == Side::BUY
        ? submitted_price >= book.best_ask - kPriceEps
        : submitted_price <= book.best_bid + kPriceEps;
    long ticks_from_edge = side == Side::BUY
        ? std::lround((book.best_ask - submitted_price) / tick)
        : std::lround((submitted_price - book.best_bid) / tick);

    return nlohmann::json{
        {"market_id", key.market_id},
        {"asset", key.asset},
        {"side", side_to_string(side)},
        {"intent", intent},
        {"requested_price", requested_price},
        {"submitted_price", submitted_price},
        {"best_bid", book.best_bid},
        {"best_ask", book.best_ask},
        {"book_age_ms", clock_->now_ms() - book.fetched_at},
        {"spread_cents", std::lround((book.best_ask - book.best_bid) * 100.0)},
        {"crossing_flag", crossing},
        {"ticks_from_edge", ticks_from_edge}
    };
}

std::optional<EpochMs> PriceGuard::last_emergency_order_ms(const MarketKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_emergency_ms_.find(key);
    if (it == last_emergency_ms_.end()) return std::nullopt;
    return it->second;
}

void PriceGuard::clear_market(const MarketKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_emergency_ms_.erase(key);
}

} // namespace updown
