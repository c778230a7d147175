#include <gtest/gtest.h>
#include "market_data/paper_venue.hpp"
#include "risk/funding.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;

class FundingTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.safety_buffer_usd = 10.0;
        config_.min_balance_for_trading = 50.0;
        config_.max_reserved_per_market = 150.0;
        config_.max_total_reserved = 400.0;
        config_.blocked_log_capacity = 3;

        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        venue_ = std::make_shared<PaperVenueClient>(clock_);
        venue_->set_balance(200.0);
        ledger_ = std::make_shared<ReserveLedger>(clock_);
        gate_ = std::make_unique<FundingGate>(config_, venue_, ledger_, clock_, sink_);
    }

    FundingConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::shared_ptr<PaperVenueClient> venue_;
    std::shared_ptr<ReserveLedger> ledger_;
    std::unique_ptr<FundingGate> gate_;
};

TEST_F(FundingTest, Ledger_ReserveReleaseAndFill) {
    ledger_->reserve("o1", "m1", 10.0, Outcome::UP);
    ledger_->reserve("o2", "m2", 5.0, Outcome::DOWN);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 15.0);
    EXPECT_DOUBLE_EQ(ledger_->market_reserved("m1"), 10.0);

    ledger_->on_fill("o1", 4.0);
    EXPECT_DOUBLE_EQ(ledger_->find("o1")->notional, 6.0);
    ledger_->on_fill("o1", 6.0);
    EXPECT_FALSE(ledger_->find("o1").has_value());

    EXPECT_DOUBLE_EQ(ledger_->release("o2"), 5.0);
    EXPECT_DOUBLE_EQ(ledger_->release("o2"), 0.0);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 0.0);
}

TEST_F(FundingTest, Ledger_ReconcileReleasesUnknownIds) {
    ledger_->reserve("live", "m1", 10.0, Outcome::UP);
    ledger_->reserve("gone", "m1", 7.0, Outcome::UP);

    EXPECT_EQ(ledger_->reconcile({"live"}), 1);
    EXPECT_DOUBLE_EQ(ledger_->total_reserved(), 10.0);
}

TEST_F(FundingTest, Gate_AllowsWithinBalance) {
    auto result = gate_->can_place_order("m1", Outcome::UP, 50.0);
    EXPECT_TRUE(result.can_proceed);
    EXPECT_DOUBLE_EQ(result.balance, 200.0);
    EXPECT_DOUBLE_EQ(result.available, 190.0);
}

TEST_F(FundingTest, Gate_AccountsForReservations) {
    ledger_->reserve("o1", "m2", 140.0, Outcome::UP);

    // 200 - 140 - 10 = 50 available
    EXPECT_TRUE(gate_->can_place_order("m1", Outcome::UP, 50.0).can_proceed);
    auto blocked = gate_->can_place_order("m1", Outcome::UP, 50.01);
    EXPECT_FALSE(blocked.can_proceed);
    EXPECT_EQ(blocked.reason_code, FundsBlockReason::INSUFFICIENT_BALANCE);
    EXPECT_EQ(sink_->count("ORDER_BLOCKED_INSUFFICIENT_FUNDS"), 1u);
}

TEST_F(FundingTest, Gate_BlocksBelowMinimumBalance) {
    venue_->set_balance(40.0);
    auto result = gate_->can_place_order("m1", Outcome::DOWN, 1.0);
    EXPECT_FALSE(result.can_proceed);
    EXPECT_EQ(result.reason_code, FundsBlockReason::BELOW_MIN_BALANCE);
}

TEST_F(FundingTest, Gate_PerMarketCap) {
    venue_->set_balance(1000.0);
    ledger_->reserve("o1", "m1", 120.0, Outcome::UP);
    auto result = gate_->can_place_order("m1", Outcome::DOWN, 40.0);
    EXPECT_FALSE(result.can_proceed);
    EXPECT_NE(result.reason.find("market reservation"), std::string::npos);
    EXPECT_TRUE(gate_->can_place_order("m2", Outcome::DOWN, 40.0).can_proceed);
}

TEST_F(FundingTest, Gate_CachesBalanceUntilStale) {
    gate_->can_place_order("m1", Outcome::UP, 1.0);
    gate_->can_place_order("m1", Outcome::UP, 1.0);
    EXPECT_EQ(venue_->balance_calls(), 1);

    gate_->invalidate_balance_cache();
    gate_->can_place_order("m1", Outcome::UP, 1.0);
    EXPECT_EQ(venue_->balance_calls(), 2);

    clock_->advance_ms(config_.stale_balance_ms);
    gate_->can_place_order("m1", Outcome::UP, 1.0);
    EXPECT_EQ(venue_->balance_calls(), 3);
}

TEST_F(FundingTest, Gate_FetchFailureFallsBackToCache) {
    EXPECT_DOUBLE_EQ(gate_->current_balance(), 200.0);
    venue_->fail_balance(true);
    gate_->invalidate_balance_cache();
    EXPECT_DOUBLE_EQ(gate_->current_balance(), 200.0);
}

TEST_F(FundingTest, Gate_NoBalanceEverFetchedMeansZero) {
    venue_->fail_balance(true);
    auto result = gate_->can_place_order("m1", Outcome::UP, 1.0);
    EXPECT_FALSE(result.can_proceed);
    EXPECT_DOUBLE_EQ(result.balance, 0.0);
}

TEST_F(FundingTest, Gate_BlockedLogIsBounded) {
    venue_->set_balance(0.0);
    for (int i = 0; i < 5; ++i) {
        gate_->can_place_order("m1", Outcome::UP, 1.0);
    }
    EXPECT_EQ(gate_->blocked_orders().size(), 3u);
}
