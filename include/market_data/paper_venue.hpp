#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "market_data/venue_client.hpp"
#include "utils/clock.hpp"

namespace updown {

// Fill of a resting order, produced when a book update trades through it
struct PaperFill {
    std::string order_id;
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
};

/**
 * In-process venue used for paper trading and tests.
 *
 * DESIGN:
 * - Books are set explicitly per token; there is no matching engine
 * - A BUY at or above the ask (SELL at or below the bid) takes liquidity
 *   and fills immediately at the touch, up to the displayed volume
 * - Passive orders rest and show up in get_open_orders(); a later book
 *   update whose touch reaches them fills them at their limit price
 * - Failures can be scripted per call so retry paths are reproducible
 * - With fills disabled (dry-run) orders are acknowledged and rest
 */
class PaperVenueClient : public VenueClient {
public:
    struct Config {
        bool simulate_fills{true};
        double starting_balance{1000.0};
    };

    explicit PaperVenueClient(std::shared_ptr<Clock> clock);
    PaperVenueClient(std::shared_ptr<Clock> clock, const Config& config);

    // VenueClient
    DepthResponse get_orderbook_depth(const std::string& token_id) override;
    OrderResponse place_order(const OrderRequest& req) override;
    CancelResponse cancel_order(const std::string& order_id) override;
    OpenOrdersResponse get_open_orders() override;
    BalanceResponse get_balance() override;

    // Scripting
    void set_book(const std::string& token_id, Price bid, Price ask,
                  Size bid_volume = 1000.0, Size ask_volume = 1000.0);
    void set_depth(const std::string& token_id, const DepthResponse& depth);
    void set_balance(double balance);

    // The next n place_order calls fail with `error` (or throw)
    void fail_next_orders(int n, const std::string& error = "order rejected");
    void throw_next_orders(int n, const std::string& error = "connection reset");
    void fail_open_orders(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_open_orders_ = fail; }
    void fail_balance(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_balance_ = fail; }
    void fail_cancels(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_cancels_ = fail; }

    // Inject an order that exists only on the venue side
    void add_remote_order(const RemoteOrder& order);
    // Drop an order from the venue as if it was filled or expired
    void remove_remote_order(const std::string& order_id);

    // Resting-order fills since the last call
    std::vector<PaperFill> drain_fills();

    // Inspection
    std::vector<OrderRequest> placed_requests() const;
    std::vector<std::string> cancelled_ids() const;
    int place_calls() const;
    int balance_calls() const;
    Size filled_shares(const std::string& token_id) const;

private:
    std::shared_ptr<Clock> clock_;
    Config config_;

    mutable std::mutex mutex_;
    std::map<std::string, DepthResponse> books_;
    std::map<std::string, RemoteOrder> open_orders_;
    std::map<std::string, Size> filled_by_token_;
    double balance_;

    int fail_orders_remaining_{0};
    std::string fail_error_;
    int throw_orders_remaining_{0};
    std::string throw_error_;
    bool fail_open_orders_{false};
    bool fail_balance_{false};
    bool fail_cancels_{false};

    std::vector<OrderRequest> placed_;
    std::vector<PaperFill> pending_fills_;
    std::vector<std::string> cancelled_;
    int place_calls_{0};
    int balance_calls_{0};
    uint64_t next_order_id_{1};

    std::string generate_order_id();
    void match_resting_locked(const std::string& token_id);
};

} // namespace updown
