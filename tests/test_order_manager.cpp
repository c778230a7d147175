#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include "execution/order_manager.hpp"
#include "market_data/paper_venue.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;

// Paper venue that records how many cancels are in flight at once
class CancelCountingVenue : public PaperVenueClient {
public:
    using PaperVenueClient::PaperVenueClient;

    CancelResponse cancel_order(const std::string& order_id) override {
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto resp = PaperVenueClient::cancel_order(order_id);
        --in_flight_;
        return resp;
    }

    int max_in_flight() const { return max_in_flight_.load(); }

private:
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

class OrderManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        venue_ = std::make_shared<PaperVenueClient>(clock_);
        venue_->set_book("tok-up", 0.45, 0.50);
        venue_->set_book("tok-down", 0.45, 0.50);
        ledger_ = std::make_shared<ReserveLedger>(clock_);
        config_.max_concurrent_orders = 2;
        manager_ = std::make_unique<OrderManager>(config_, venue_, ledger_, clock_, sink_);

        market_.market_id = "btc-updown-15m";
        market_.asset = "BTC";
        market_.up_token_id = "tok-up";
        market_.down_token_id = "tok-down";
        market_.expiry_epoch_s = clock_->now_ms() / 1000 + 900;
    }

    std::vector<double> prices(Outcome side) const {
        std::vector<double> out;
        for (const auto& o : manager_->orders(market_.key(), side)) out.push_back(o.price);
        std::sort(out.begin(), out.end());
        return out;
    }

    MarketSpec market_;
    OrderManagerConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::shared_ptr<PaperVenueClient> venue_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::unique_ptr<OrderManager> manager_;
};

TEST_F(OrderManagerTest, Sync_PlacesMissingTargets) {
    auto result = manager_->sync_orders(market_, Outcome::UP,
                                        {{0.44, 10.0}, {0.45, 10.0}, {0.46, 10.0}});

    EXPECT_EQ(result.placed, 3);
    EXPECT_EQ(result.cancelled, 0);
    EXPECT_EQ(prices(Outcome::UP), (std::vector<double>{0.44, 0.45, 0.46}));
    EXPECT_NEAR(ledger_->market_reserved(market_.market_id), (0.44 + 0.45 + 0.46) * 10.0, 1e-9);
    EXPECT_EQ(sink_->count("ORDERS_SYNCED"), 1u);
}

TEST_F(OrderManagerTest, Sync_IsIdempotent) {
    manager_->sync_orders(market_, Outcome::UP, {{0.45, 10.0}});
    auto again = manager_->sync_orders(market_, Outcome::UP, {{0.45, 10.0}});

    EXPECT_EQ(again.placed, 0);
    EXPECT_EQ(again.cancelled, 0);
    EXPECT_EQ(venue_->place_calls(), 1);
}

TEST_F(OrderManagerTest, Sync_CancelsStaleLevelsAndReleases) {
    manager_->sync_orders(market_, Outcome::UP, {{0.44, 10.0}, {0.45, 10.0}});
    auto result = manager_->sync_orders(market_, Outcome::UP, {{0.45, 10.0}, {0.47, 10.0}});

    EXPECT_EQ(result.cancelled, 1);
    EXPECT_EQ(result.placed, 1);
    EXPECT_EQ(prices(Outcome::UP), (std::vector<double>{0.45, 0.47}));
    EXPECT_NEAR(ledger_->total_reserved(), (0.45 + 0.47) * 10.0, 1e-9);
}

TEST_F(OrderManagerTest, Sync_CancelsStaleLevelsInBatches) {
    auto venue = std::make_shared<CancelCountingVenue>(clock_);
    venue->set_book("tok-up", 0.30, 0.60);
    auto manager = std::make_unique<OrderManager>(config_, venue, ledger_, clock_, sink_);

    std::vector<QuoteTarget> ladder;
    for (int i = 0; i < 7; ++i) {
        ladder.push_back(QuoteTarget{0.40 + 0.01 * i, 5.0});
    }
    ASSERT_EQ(manager->sync_orders(market_, Outcome::UP, ladder).placed, 7);

    auto result = manager->sync_orders(market_, Outcome::UP, {{0.35, 5.0}});

    EXPECT_EQ(result.cancelled, 7);
    EXPECT_EQ(result.placed, 1);
    EXPECT_EQ(venue->cancelled_ids().size(), 7u);
    EXPECT_GE(venue->max_in_flight(), 1);
    EXPECT_LE(venue->max_in_flight(), static_cast<int>(config_.max_concurrent_orders));
    EXPECT_EQ(manager->orders(market_.key(), Outcome::UP).size(), 1u);
}

TEST_F(OrderManagerTest, CancelAll_StaysWithinConcurrencyLimit) {
    auto venue = std::make_shared<CancelCountingVenue>(clock_);
    venue->set_book("tok-up", 0.30, 0.60);
    venue->set_book("tok-down", 0.30, 0.60);
    auto manager = std::make_unique<OrderManager>(config_, venue, ledger_, clock_, sink_);

    manager->sync_orders(market_, Outcome::UP, {{0.40, 5.0}, {0.41, 5.0}, {0.42, 5.0}});
    manager->sync_orders(market_, Outcome::DOWN, {{0.40, 5.0}, {0.41, 5.0}});

    EXPECT_EQ(manager->cancel_all_orders(market_), 5);
    EXPECT_LE(venue->max_in_flight(), static_cast<int>(config_.max_concurrent_orders));
    EXPECT_EQ(manager->order_count(market_.key()), 0u);
}

TEST_F(OrderManagerTest, Sync_FloatNoiseMatchesSameLevel) {
    manager_->sync_orders(market_, Outcome::DOWN, {{0.3, 10.0}});
    auto result = manager_->sync_orders(market_, Outcome::DOWN, {{0.1 + 0.2, 10.0}});
    EXPECT_EQ(result.placed, 0);
    EXPECT_EQ(result.cancelled, 0);
}

TEST_F(OrderManagerTest, Sync_FailedPlacementIsNotTracked) {
    venue_->fail_next_orders(1);
    auto result = manager_->sync_orders(market_, Outcome::UP, {{0.45, 10.0}});

    EXPECT_EQ(result.placed, 0);
    EXPECT_EQ(manager_->order_count(market_.key()), 0u);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 0.0);
}

TEST_F(OrderManagerTest, Sync_ThrowingVenueIsContained) {
    venue_->throw_next_orders(1);
    SyncResult result;
    EXPECT_NO_THROW(result = manager_->sync_orders(market_, Outcome::UP, {{0.45, 10.0}}));
    EXPECT_EQ(result.placed, 0);
}

TEST_F(OrderManagerTest, Sync_ImmediateFillReportedNotTracked) {
    // A BUY at the ask fills at once in the paper venue
    auto result = manager_->sync_orders(market_, Outcome::UP, {{0.50, 10.0}});

    EXPECT_EQ(result.placed, 1);
    EXPECT_DOUBLE_EQ(result.filled_shares, 10.0);
    EXPECT_NEAR(result.filled_cost, 5.0, 1e-9);
    EXPECT_EQ(manager_->order_count(market_.key()), 0u);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 0.0);
}

TEST_F(OrderManagerTest, CancelAll_ClearsBothSides) {
    manager_->sync_orders(market_, Outcome::UP, {{0.44, 10.0}});
    manager_->sync_orders(market_, Outcome::DOWN, {{0.43, 10.0}});

    EXPECT_EQ(manager_->cancel_all_orders(market_), 2);
    EXPECT_EQ(manager_->order_count(market_.key()), 0u);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 0.0);
    EXPECT_TRUE(venue_->get_open_orders().orders.empty());
}

TEST_F(OrderManagerTest, CancelAll_KeepsOrdersWhoseCancelFailed) {
    manager_->sync_orders(market_, Outcome::UP, {{0.44, 10.0}});
    venue_->fail_cancels(true);

    EXPECT_EQ(manager_->cancel_all_orders(market_), 0);
    EXPECT_EQ(manager_->order_count(market_.key()), 1u);
}

TEST_F(OrderManagerTest, CancelSide_IncludesUntrackedVenueOrders) {
    manager_->sync_orders(market_, Outcome::DOWN, {{0.44, 10.0}});

    RemoteOrder stray;
    stray.order_id = "stray-1";
    stray.token_id = "tok-down";
    stray.side = Side::BUY;
    stray.price = 0.42;
    stray.size = 5.0;
    venue_->add_remote_order(stray);

    manager_->sync_orders(market_, Outcome::UP, {{0.44, 10.0}});

    EXPECT_EQ(manager_->cancel_side_orders(market_, Outcome::DOWN), 2);
    EXPECT_TRUE(manager_->orders(market_.key(), Outcome::DOWN).empty());
    EXPECT_EQ(manager_->orders(market_.key(), Outcome::UP).size(), 1u);
    EXPECT_EQ(venue_->get_open_orders().orders.size(), 1u);
}

TEST_F(OrderManagerTest, ApplyFill_ReducesThenDrops) {
    TrackedOrder order;
    order.order_id = "hedge-1";
    order.price = 0.45;
    order.size = 20.0;
    order.side = Outcome::DOWN;
    manager_->track_order(market_.key(), order);

    manager_->apply_fill(market_.key(), "hedge-1", 5.0);
    auto down = manager_->orders(market_.key(), Outcome::DOWN);
    ASSERT_EQ(down.size(), 1u);
    EXPECT_DOUBLE_EQ(down[0].size, 15.0);

    manager_->apply_fill(market_.key(), "hedge-1", 15.0);
    EXPECT_TRUE(manager_->orders(market_.key(), Outcome::DOWN).empty());
}

TEST_F(OrderManagerTest, Reconciliation_DueByInterval) {
    EXPECT_TRUE(manager_->needs_reconciliation(market_.key()));
    manager_->mark_reconciled(market_.key());
    EXPECT_FALSE(manager_->needs_reconciliation(market_.key()));
    clock_->advance_ms(config_.reconcile_interval_ms + 1);
    EXPECT_TRUE(manager_->needs_reconciliation(market_.key()));
}
