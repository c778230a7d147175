#pragma once

#include <string>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <tuple>

namespace updown {

// Epoch milliseconds, the unit every engine timestamp is stored in
using EpochMs = int64_t;

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Prices are probabilities in dollars (0.01 .. 0.99), sizes are shares
using Price = double;
using Size = double;
using Notional = double;

// Order side
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

// Binary outcome of an up/down market
enum class Outcome {
    UP,
    DOWN
};

inline std::string outcome_to_string(Outcome o) {
    return o == Outcome::UP ? "UP" : "DOWN";
}

inline Outcome opposite(Outcome o) {
    return o == Outcome::UP ? Outcome::DOWN : Outcome::UP;
}

// Order types
enum class OrderType {
    GTC,  // Good Till Cancel
    IOC,  // Immediate or Cancel
    FOK   // Fill or Kill
};

inline std::string order_type_to_string(OrderType t) {
    switch (t) {
        case OrderType::GTC: return "GTC";
        case OrderType::IOC: return "IOC";
        case OrderType::FOK: return "FOK";
    }
    return "UNKNOWN";
}

// Trading mode
enum class TradingMode {
    DRY_RUN,  // Decisions only, orders go to the paper venue
    PAPER     // Simulated execution with fills
};

inline std::string mode_to_string(TradingMode m) {
    switch (m) {
        case TradingMode::DRY_RUN: return "DRY_RUN";
        case TradingMode::PAPER: return "PAPER";
    }
    return "UNKNOWN";
}

/**
 * Composite key for per-market, per-asset state.
 */
struct MarketKey {
    std::string market_id;
    std::string asset;

    bool operator==(const MarketKey& other) const {
        return market_id == other.market_id && asset == other.asset;
    }

    bool operator<(const MarketKey& other) const {
        return std::tie(market_id, asset) < std::tie(other.market_id, other.asset);
    }

    std::string to_string() const { return market_id + "/" + asset; }
};

/**
 * Top of book for one outcome token, stamped with fetch time.
 */
struct BookSnapshot {
    Price best_bid{0.0};
    Price best_ask{0.0};
    EpochMs fetched_at{0};

    Price spread() const { return best_ask - best_bid; }
    Price mid() const { return (best_bid + best_ask) / 2.0; }
    bool is_sane() const {
        return std::isfinite(best_bid) && std::isfinite(best_ask) &&
               best_bid > 0.0 && best_ask > 0.0 && best_bid < best_ask;
    }
};

// Best asks of both outcomes, used for pair-cost telemetry
struct PairBookData {
    Price best_ask_up{0.0};
    Price best_ask_down{0.0};
};

} // namespace updown
