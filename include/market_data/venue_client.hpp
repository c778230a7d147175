#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace updown {

/**
 * Order-book depth summary for one outcome token.
 */
struct DepthResponse {
    bool success{false};
    std::optional<Price> top_bid;
    std::optional<Price> top_ask;
    Size bid_volume{0.0};
    Size ask_volume{0.0};
    bool has_liquidity{false};
    std::string error;
};

struct OrderRequest {
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
    OrderType order_type{OrderType::GTC};
};

struct OrderResponse {
    bool success{false};
    std::string order_id;
    Size filled_size{0.0};
    Price avg_price{0.0};
    std::string status;
    std::string error;
};

struct CancelResponse {
    bool success{false};
    std::string error;
};

// One resting order as the venue reports it
struct RemoteOrder {
    std::string order_id;
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
    Size size_matched{0.0};
    EpochMs created_at_ms{0};
};

struct OpenOrdersResponse {
    bool success{false};
    std::vector<RemoteOrder> orders;
    std::string error;
};

struct BalanceResponse {
    bool success{false};
    double available{0.0};
    std::string error;
};

/**
 * Venue port. The engine only ever talks to the exchange through this
 * interface; implementations may throw on transport failure.
 */
class VenueClient {
public:
    virtual ~VenueClient() = default;

    virtual DepthResponse get_orderbook_depth(const std::string& token_id) = 0;
    virtual OrderResponse place_order(const OrderRequest& req) = 0;
    virtual CancelResponse cancel_order(const std::string& order_id) = 0;
    virtual OpenOrdersResponse get_open_orders() = 0;
    virtual BalanceResponse get_balance() = 0;
};

/**
 * Build a BookSnapshot from a depth response. Missing sides become 0,
 * which PriceGuard rejects as INVALID_BOOK.
 */
inline BookSnapshot to_book_snapshot(const DepthResponse& depth, EpochMs fetched_at) {
    BookSnapshot book;
    book.best_bid = depth.top_bid.value_or(0.0);
    book.best_ask = depth.top_ask.value_or(0.0);
    book.fetched_at = fetched_at;
    return book;
}

} // namespace updown
