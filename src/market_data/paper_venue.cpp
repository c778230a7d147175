#include "market_data/paper_venue.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace updown {

PaperVenueClient::PaperVenueClient(std::shared_ptr<Clock> clock)
    : PaperVenueClient(std::move(clock), Config{})
{
}

PaperVenueClient::PaperVenueClient(std::shared_ptr<Clock> clock, const Config& config)
    : clock_(std::move(clock))
    , config_(config)
    , balance_(config.starting_balance)
{
    spdlog::info("PaperVenueClient initialized: fills={}, balance=${:.2f}",
                 config_.simulate_fills ? "simulated" : "disabled", balance_);
}

std::string PaperVenueClient::generate_order_id() {
    return fmt::format("paper-{}", next_order_id_++);
}

DepthResponse PaperVenueClient::get_orderbook_depth(const std::string& token_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(token_id);
    if (it == books_.end()) {
        DepthResponse resp;
        resp.success = false;
        resp.error = "unknown token: " + token_id;
        return resp;
    }
    return it->second;
}

OrderResponse PaperVenueClient::place_order(const OrderRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    place_calls_++;

    if (throw_orders_remaining_ > 0) {
        throw_orders_remaining_--;
        throw std::runtime_error(throw_error_);
    }

    OrderResponse resp;
    if (fail_orders_remaining_ > 0) {
        fail_orders_remaining_--;
        resp.success = false;
        resp.error = fail_error_;
        return resp;
    }

    if (req.size <= 0.0 || req.price <= 0.0) {
        resp.success = false;
        resp.error = "invalid order parameters";
        return resp;
    }

    placed_.push_back(req);
    resp.success = true;
    resp.order_id = generate_order_id();

    Size filled = 0.0;
    Price fill_price = 0.0;
    auto book_it = books_.find(req.token_id);
    if (config_.simulate_fills && book_it != books_.end()) {
        auto& book = book_it->second;
        if (req.side == Side::BUY && book.top_ask && req.price >= *book.top_ask) {
            filled = std::min(req.size, book.ask_volume);
            fill_price = *book.top_ask;
        } else if (req.side == Side::SELL && book.top_bid && req.price <= *book.top_bid) {
            filled = std::min(req.size, book.bid_volume);
            fill_price = *book.top_bid;
        }
    }

    // Fill-or-kill takes nothing unless the whole size is there
    if (req.order_type == OrderType::FOK && filled + 1e-9 < req.size) {
        filled = 0.0;
    }

    if (filled > 0.0) {
        if (req.side == Side::BUY) {
            book_it->second.ask_volume -= filled;
        } else {
            book_it->second.bid_volume -= filled;
        }
        double notional = filled * fill_price;
        balance_ += req.side == Side::BUY ? -notional : notional;
        filled_by_token_[req.token_id] += req.side == Side::BUY ? filled : -filled;
        resp.filled_size = filled;
        resp.avg_price = fill_price;
    }

    Size remaining = req.size - filled;
    if (remaining > 0.0 && req.order_type == OrderType::GTC) {
        RemoteOrder resting;
        resting.order_id = resp.order_id;
        resting.token_id = req.token_id;
        resting.side = req.side;
        resting.price = req.price;
        resting.size = req.size;
        resting.size_matched = filled;
        resting.created_at_ms = clock_->now_ms();
        open_orders_[resp.order_id] = resting;
        resp.status = filled > 0.0 ? "partial" : "live";
    } else {
        resp.status = filled > 0.0 ? "matched" : "cancelled";
    }

    spdlog::debug("[PAPER] {} {} {} {:.2f} @ {:.2f} -> {} filled={:.2f}",
                  resp.order_id, order_type_to_string(req.order_type),
                  side_to_string(req.side), req.size, req.price,
                  resp.status, filled);
    return resp;
}

CancelResponse PaperVenueClient::cancel_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelResponse resp;
    if (fail_cancels_) {
        resp.success = false;
        resp.error = "cancel rejected";
        return resp;
    }
    auto it = open_orders_.find(order_id);
    if (it == open_orders_.end()) {
        resp.success = false;
        resp.error = "order not found: " + order_id;
        return resp;
    }
    open_orders_.erase(it);
    cancelled_.push_back(order_id);
    resp.success = true;
    return resp;
}

OpenOrdersResponse PaperVenueClient::get_open_orders() {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenOrdersResponse resp;
    if (fail_open_orders_) {
        resp.success = false;
        resp.error = "open orders unavailable";
        return resp;
    }
    resp.success = true;
    resp.orders.reserve(open_orders_.size());
    for (const auto& [id, order] : open_orders_) {
        resp.orders.push_back(order);
    }
    return resp;
}

BalanceResponse PaperVenueClient::get_balance() {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_calls_++;
    BalanceResponse resp;
    if (fail_balance_) {
        resp.success = false;
        resp.error = "balance unavailable";
        return resp;
    }
    resp.success = true;
    resp.available = balance_;
    return resp;
}

void PaperVenueClient::set_book(const std::string& token_id, Price bid, Price ask,
                                Size bid_volume, Size ask_volume) {
    DepthResponse depth;
    depth.success = true;
    if (bid > 0.0) depth.top_bid = bid;
    if (ask > 0.0) depth.top_ask = ask;
    depth.bid_volume = bid_volume;
    depth.ask_volume = ask_volume;
    depth.has_liquidity = ask_volume > 0.0 || bid_volume > 0.0;
    set_depth(token_id, depth);
}

void PaperVenueClient::set_depth(const std::string& token_id, const DepthResponse& depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[token_id] = depth;
    if (config_.simulate_fills) {
        match_resting_locked(token_id);
    }
}

void PaperVenueClient::match_resting_locked(const std::string& token_id) {
    auto& book = books_[token_id];
    for (auto it = open_orders_.begin(); it != open_orders_.end();) {
        auto& order = it->second;
        if (order.token_id != token_id) {
            ++it;
            continue;
        }

        Size available = 0.0;
        if (order.side == Side::BUY && book.top_ask && order.price >= *book.top_ask) {
            available = book.ask_volume;
        } else if (order.side == Side::SELL && book.top_bid && order.price <= *book.top_bid) {
            available = book.bid_volume;
        }
        const Size remaining = order.size - order.size_matched;
        const Size filled = std::min(remaining, available);
        if (filled <= 0.0) {
            ++it;
            continue;
        }

        if (order.side == Side::BUY) {
            book.ask_volume -= filled;
            balance_ -= filled * order.price;
            filled_by_token_[token_id] += filled;
        } else {
            book.bid_volume -= filled;
            balance_ += filled * order.price;
            filled_by_token_[token_id] -= filled;
        }
        order.size_matched += filled;
        pending_fills_.push_back(PaperFill{order.order_id, token_id, order.side, order.price, filled});

        spdlog::debug("[PAPER] {} resting fill {:.2f} @ {:.2f}", order.order_id, filled, order.price);
        if (order.size - order.size_matched <= 1e-9) {
            it = open_orders_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<PaperFill> PaperVenueClient::drain_fills() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PaperFill> out;
    out.swap(pending_fills_);
    return out;
}

void PaperVenueClient::set_balance(double balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ = balance;
}

void PaperVenueClient::fail_next_orders(int n, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_orders_remaining_ = n;
    fail_error_ = error;
}

void PaperVenueClient::throw_next_orders(int n, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_orders_remaining_ = n;
    throw_error_ = error;
}

void PaperVenueClient::add_remote_order(const RemoteOrder& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_orders_[order.order_id] = order;
}

void PaperVenueClient::remove_remote_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_orders_.erase(order_id);
}

std::vector<OrderRequest> PaperVenueClient::placed_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return placed_;
}

std::vector<std::string> PaperVenueClient::cancelled_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

int PaperVenueClient::place_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return place_calls_;
}

int PaperVenueClient::balance_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_calls_;
}

Size PaperVenueClient::filled_shares(const std::string& token_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = filled_by_token_.find(token_id);
    return it == filled_by_token_.end() ? 0.0 : it->second;
}

} // namespace updown
