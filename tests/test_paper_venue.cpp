#include <gtest/gtest.h>
#include "market_data/paper_venue.hpp"
#include "utils/clock.hpp"

using namespace updown;

class PaperVenueTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        venue_ = std::make_shared<PaperVenueClient>(clock_);
        venue_->set_book("up", 0.48, 0.52, 100.0, 50.0);
    }

    OrderRequest buy(const std::string& token, Price price, Size size) {
        OrderRequest req;
        req.token_id = token;
        req.side = Side::BUY;
        req.price = price;
        req.size = size;
        return req;
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<PaperVenueClient> venue_;
};

TEST_F(PaperVenueTest, UnknownTokenHasNoDepth) {
    auto depth = venue_->get_orderbook_depth("missing");
    EXPECT_FALSE(depth.success);
    EXPECT_FALSE(depth.error.empty());

    auto book = to_book_snapshot(depth, clock_->now_ms());
    EXPECT_DOUBLE_EQ(book.best_bid, 0.0);
    EXPECT_DOUBLE_EQ(book.best_ask, 0.0);
}

TEST_F(PaperVenueTest, MarketableBuyFillsAtTouchUpToVolume) {
    auto resp = venue_->place_order(buy("up", 0.55, 80.0));
    ASSERT_TRUE(resp.success);
    EXPECT_DOUBLE_EQ(resp.filled_size, 50.0);
    EXPECT_DOUBLE_EQ(resp.avg_price, 0.52);
    EXPECT_EQ(resp.status, "partial");

    // Remainder rests on the venue
    auto open = venue_->get_open_orders();
    ASSERT_EQ(open.orders.size(), 1u);
    EXPECT_DOUBLE_EQ(open.orders[0].size_matched, 50.0);

    auto bal = venue_->get_balance();
    EXPECT_NEAR(bal.available, 1000.0 - 26.0, 1e-9);
    EXPECT_DOUBLE_EQ(venue_->filled_shares("up"), 50.0);
}

TEST_F(PaperVenueTest, IocRemainderIsNotRested) {
    auto req = buy("up", 0.50, 10.0);
    req.order_type = OrderType::IOC;
    auto resp = venue_->place_order(req);
    ASSERT_TRUE(resp.success);
    EXPECT_EQ(resp.status, "cancelled");
    EXPECT_TRUE(venue_->get_open_orders().orders.empty());
}

TEST_F(PaperVenueTest, RestingOrderFillsWhenBookTouches) {
    auto resp = venue_->place_order(buy("up", 0.50, 20.0));
    ASSERT_TRUE(resp.success);
    EXPECT_EQ(resp.status, "live");
    EXPECT_TRUE(venue_->drain_fills().empty());

    venue_->set_book("up", 0.46, 0.50, 100.0, 12.0);
    auto fills = venue_->drain_fills();
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].order_id, resp.order_id);
    EXPECT_DOUBLE_EQ(fills[0].price, 0.50);
    EXPECT_DOUBLE_EQ(fills[0].size, 12.0);
    EXPECT_EQ(venue_->get_open_orders().orders.size(), 1u);

    venue_->set_book("up", 0.45, 0.49, 100.0, 100.0);
    fills = venue_->drain_fills();
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].size, 8.0);
    EXPECT_TRUE(venue_->get_open_orders().orders.empty());
    EXPECT_DOUBLE_EQ(venue_->filled_shares("up"), 20.0);
}

TEST_F(PaperVenueTest, DryRunNeverFills) {
    PaperVenueClient::Config config;
    config.simulate_fills = false;
    PaperVenueClient dry(clock_, config);
    dry.set_book("up", 0.48, 0.52);

    auto resp = dry.place_order(buy("up", 0.60, 10.0));
    ASSERT_TRUE(resp.success);
    EXPECT_DOUBLE_EQ(resp.filled_size, 0.0);
    EXPECT_EQ(dry.get_open_orders().orders.size(), 1u);

    dry.set_book("up", 0.40, 0.45);
    EXPECT_TRUE(dry.drain_fills().empty());
}

TEST_F(PaperVenueTest, ScriptedFailures) {
    venue_->fail_next_orders(1, "insufficient balance");
    auto resp = venue_->place_order(buy("up", 0.50, 5.0));
    EXPECT_FALSE(resp.success);
    EXPECT_EQ(resp.error, "insufficient balance");

    venue_->throw_next_orders(1);
    EXPECT_THROW(venue_->place_order(buy("up", 0.50, 5.0)), std::runtime_error);

    EXPECT_TRUE(venue_->place_order(buy("up", 0.50, 5.0)).success);
    EXPECT_EQ(venue_->place_calls(), 3);
    EXPECT_EQ(venue_->placed_requests().size(), 1u);
}

TEST_F(PaperVenueTest, CancelRemovesOrder) {
    auto resp = venue_->place_order(buy("up", 0.50, 5.0));
    ASSERT_TRUE(venue_->cancel_order(resp.order_id).success);
    EXPECT_FALSE(venue_->cancel_order(resp.order_id).success);
    EXPECT_TRUE(venue_->get_open_orders().orders.empty());
    ASSERT_EQ(venue_->cancelled_ids().size(), 1u);
}

TEST_F(PaperVenueTest, FillOrKillNeedsFullSize) {
    auto req = buy("up", 0.55, 80.0);
    req.order_type = OrderType::FOK;
    auto killed = venue_->place_order(req);
    ASSERT_TRUE(killed.success);
    EXPECT_DOUBLE_EQ(killed.filled_size, 0.0);
    EXPECT_EQ(killed.status, "cancelled");

    req.size = 40.0;
    auto filled = venue_->place_order(req);
    EXPECT_DOUBLE_EQ(filled.filled_size, 40.0);
    EXPECT_EQ(filled.status, "matched");
    EXPECT_TRUE(venue_->get_open_orders().orders.empty());
}
