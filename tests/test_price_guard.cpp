#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "risk/price_guard.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;
using updown::testing::make_book;

class PriceGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        guard_ = std::make_unique<PriceGuard>(config_, clock_, sink_);
    }

    PriceCheckRequest request(Side side, Price price, Price bid, Price ask, bool emergency = false) {
        PriceCheckRequest req;
        req.side = side;
        req.requested_price = price;
        req.book = make_book(bid, ask, clock_->now_ms());
        req.emergency_mode = emergency;
        req.key = MarketKey{"btc-15m", "BTC"};
        req.intent = "HEDGE";
        return req;
    }

    PriceGuardConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::unique_ptr<PriceGuard> guard_;
};

TEST_F(PriceGuardTest, CheckPrice_BlocksBuyAtAsk) {
    auto result = guard_->check_price(request(Side::BUY, 0.53, 0.51, 0.53));

    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(result.reason, PriceBlockReason::CROSSING_BLOCKED);
    EXPECT_DOUBLE_EQ(result.best_price, 0.53);
    EXPECT_NE(result.message.find("CROSSING_BLOCKED"), std::string::npos);
}

TEST_F(PriceGuardTest, CheckPrice_AllowsPassiveBuy) {
    auto result = guard_->check_price(request(Side::BUY, 0.50, 0.49, 0.52));

    ASSERT_TRUE(result.allowed);
    EXPECT_DOUBLE_EQ(result.safe_price, 0.50);
    EXPECT_EQ(result.ticks_from_edge, 2);
    EXPECT_FALSE(result.is_emergency_cross());
}

TEST_F(PriceGuardTest, CheckPrice_AllowsBuyOneTickBelowAsk) {
    auto result = guard_->check_price(request(Side::BUY, 0.52, 0.49, 0.53));

    ASSERT_TRUE(result.allowed);
    EXPECT_DOUBLE_EQ(result.safe_price, 0.52);
    EXPECT_EQ(result.ticks_from_edge, 1);
}

TEST_F(PriceGuardTest, CheckPrice_SellSymmetric) {
    auto blocked = guard_->check_price(request(Side::SELL, 0.49, 0.49, 0.53));
    EXPECT_EQ(blocked.reason, PriceBlockReason::CROSSING_BLOCKED);

    auto allowed = guard_->check_price(request(Side::SELL, 0.50, 0.49, 0.53));
    ASSERT_TRUE(allowed.allowed);
    EXPECT_DOUBLE_EQ(allowed.safe_price, 0.50);
}

TEST_F(PriceGuardTest, CheckPrice_RejectsBrokenBooksInEveryMode) {
    for (bool emergency : {false, true}) {
        EXPECT_EQ(guard_->check_price(request(Side::BUY, 0.50, 0.0, 0.52, emergency)).reason,
                  PriceBlockReason::INVALID_BOOK);
        EXPECT_EQ(guard_->check_price(request(Side::BUY, 0.50,
                                              std::numeric_limits<double>::quiet_NaN(), 0.52,
                                              emergency)).reason,
                  PriceBlockReason::INVALID_BOOK);
        EXPECT_EQ(guard_->check_price(request(Side::BUY, 0.50, 0.52, 0.52, emergency)).reason,
                  PriceBlockReason::INVERTED_BOOK);
        EXPECT_EQ(guard_->check_price(request(Side::BUY, 0.50, 0.55, 0.52, emergency)).reason,
                  PriceBlockReason::INVERTED_BOOK);
    }
}

TEST_F(PriceGuardTest, CheckPrice_RejectsInvalidRequestedPrice) {
    EXPECT_EQ(guard_->check_price(request(Side::BUY, 0.0, 0.49, 0.52)).reason,
              PriceBlockReason::INVALID_PRICE);
    EXPECT_EQ(guard_->check_price(request(Side::BUY, -0.1, 0.49, 0.52)).reason,
              PriceBlockReason::INVALID_PRICE);
    EXPECT_EQ(guard_->check_price(request(Side::SELL, std::numeric_limits<double>::infinity(),
                                          0.49, 0.52)).reason,
              PriceBlockReason::INVALID_PRICE);
}

TEST_F(PriceGuardTest, Rounding_NeverCreatesCross) {
    // 0.5299 must floor to 0.52, not round up into the ask
    auto buy = guard_->check_price(request(Side::BUY, 0.5299, 0.50, 0.53));
    ASSERT_TRUE(buy.allowed);
    EXPECT_DOUBLE_EQ(buy.safe_price, 0.52);

    auto sell = guard_->check_price(request(Side::SELL, 0.5001, 0.50, 0.53));
    ASSERT_TRUE(sell.allowed);
    EXPECT_DOUBLE_EQ(sell.safe_price, 0.51);
}

TEST_F(PriceGuardTest, Rounding_IdempotentOnGrid) {
    for (int cents = 1; cents <= 99; ++cents) {
        double p = cents / 100.0;
        EXPECT_DOUBLE_EQ(PriceGuard::round_buy_price(p), p) << "cents=" << cents;
        EXPECT_DOUBLE_EQ(PriceGuard::round_sell_price(p), p) << "cents=" << cents;
        double once = PriceGuard::round_buy_price(p + 0.004);
        EXPECT_DOUBLE_EQ(PriceGuard::round_buy_price(once), once);
    }
    EXPECT_DOUBLE_EQ(PriceGuard::round_buy_price(0.456), 0.45);
    EXPECT_DOUBLE_EQ(PriceGuard::round_sell_price(0.451), 0.46);
}

TEST_F(PriceGuardTest, Emergency_CrossIsBoundedByMaxTicks) {
    auto result = guard_->check_price(request(Side::BUY, 0.70, 0.49, 0.52, true));

    ASSERT_TRUE(result.allowed);
    EXPECT_TRUE(result.is_emergency_cross());
    EXPECT_DOUBLE_EQ(result.safe_price, 0.54);   // ask + 2 ticks
    EXPECT_LT(result.ticks_from_edge, 0);
    EXPECT_EQ(sink_->count("EMERGENCY_CROSS"), 1u);
}

TEST_F(PriceGuardTest, Emergency_RateLimitedPerMarket) {
    ASSERT_TRUE(guard_->check_price(request(Side::BUY, 0.53, 0.49, 0.52, true)).allowed);

    auto second = guard_->check_price(request(Side::BUY, 0.53, 0.49, 0.52, true));
    EXPECT_FALSE(second.allowed);
    EXPECT_EQ(second.reason, PriceBlockReason::EMERGENCY_RATE_LIMITED);

    // Other markets have their own cooldown
    auto other = request(Side::BUY, 0.53, 0.49, 0.52, true);
    other.key = MarketKey{"eth-15m", "ETH"};
    EXPECT_TRUE(guard_->check_price(other).allowed);

    clock_->advance_ms(config_.emergency_min_interval_ms);
    EXPECT_TRUE(guard_->check_price(request(Side::BUY, 0.53, 0.49, 0.52, true)).allowed);
}

TEST_F(PriceGuardTest, Emergency_PassivePriceDoesNotConsumeCooldown) {
    ASSERT_TRUE(guard_->check_price(request(Side::BUY, 0.50, 0.49, 0.52, true)).allowed);
    EXPECT_FALSE(guard_->last_emergency_order_ms(MarketKey{"btc-15m", "BTC"}).has_value());
}

TEST_F(PriceGuardTest, MakerPrice_ImprovesBidWithoutCrossing) {
    EXPECT_DOUBLE_EQ(guard_->select_maker_buy_price(make_book(0.48, 0.52)), 0.49);
    EXPECT_DOUBLE_EQ(guard_->select_maker_buy_price(make_book(0.51, 0.52)), 0.51);
    EXPECT_DOUBLE_EQ(guard_->select_maker_sell_price(make_book(0.48, 0.52)), 0.51);
}

TEST_F(PriceGuardTest, Freshness_RejectsStaleBook) {
    auto book = make_book(0.49, 0.52, clock_->now_ms());
    EXPECT_TRUE(guard_->check_book_freshness(book).fresh);

    clock_->advance_ms(config_.max_book_age_ms + 1);
    auto stale = guard_->check_book_freshness(book);
    EXPECT_FALSE(stale.fresh);
    EXPECT_NE(stale.reason.find("STALE_BOOK"), std::string::npos);
}

TEST_F(PriceGuardTest, Spread_RequiresMinimumForMaker) {
    EXPECT_TRUE(guard_->is_spread_sufficient(make_book(0.48, 0.50)).sufficient);
    auto tight = guard_->is_spread_sufficient(make_book(0.49, 0.50));
    EXPECT_FALSE(tight.sufficient);
    EXPECT_EQ(tight.spread_cents, 1);
}

TEST_F(PriceGuardTest, Telemetry_FlagsCrossing) {
    auto j = guard_->build_order_telemetry(Side::BUY, 0.53, 0.53, make_book(0.49, 0.53, clock_->now_ms()),
                                           "HEDGE", MarketKey{"btc-15m", "BTC"});
    EXPECT_TRUE(j["crossing_flag"].get<bool>());
    EXPECT_EQ(j["ticks_from_edge"].get<long>(), 0);
    EXPECT_EQ(j["spread_cents"].get<long>(), 4);
}

TEST_F(PriceGuardTest, EmergencyWindow_LastNinetySeconds) {
    EXPECT_TRUE(guard_->is_emergency_window(90.0));
    EXPECT_TRUE(guard_->is_emergency_window(5.0));
    EXPECT_FALSE(guard_->is_emergency_window(90.5));
    EXPECT_FALSE(guard_->is_emergency_window(600.0));
}

TEST_F(PriceGuardTest, MakerPrice_DispatchesOnSide) {
    auto book = make_book(0.48, 0.52);
    EXPECT_DOUBLE_EQ(guard_->select_maker_price(Side::BUY, book), 0.49);
    EXPECT_DOUBLE_EQ(guard_->select_maker_price(Side::SELL, book), 0.51);
}
