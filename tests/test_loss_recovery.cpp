#include <gtest/gtest.h>
#include "execution/loss_recovery.hpp"
#include "market_data/paper_venue.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;
using updown::testing::make_book;

class LossRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        venue_ = std::make_shared<PaperVenueClient>(clock_);
        venue_->set_book("tok-up", 0.75, 0.77);
        venue_->set_book("tok-down", 0.24, 0.26);
        guard_ = std::make_shared<PriceGuard>(PriceGuardConfig{}, clock_);
        gateway_ = std::make_shared<OrderGateway>(venue_, guard_, nullptr, nullptr);
        recovery_ = std::make_unique<LossRecovery>(config_, gateway_, clock_, sink_);
    }

    // 100 UP @ 0.45 against 20 DOWN @ 0.50, UP leading at 75%
    RecoveryInput losing_position() const {
        RecoveryInput in;
        in.key = MarketKey{"btc-updown-15m", "BTC"};
        in.up_token_id = "tok-up";
        in.down_token_id = "tok-down";
        in.up_qty = 100.0;
        in.down_qty = 20.0;
        in.up_cost = 45.0;
        in.down_cost = 10.0;
        in.up_book = make_book(0.75, 0.77, clock_->now_ms());
        in.down_book = make_book(0.24, 0.26, clock_->now_ms());
        return in;
    }

    RecoveryConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::shared_ptr<PaperVenueClient> venue_;
    std::shared_ptr<PriceGuard> guard_;
    std::shared_ptr<OrderGateway> gateway_;
    std::unique_ptr<LossRecovery> recovery_;
};

TEST_F(LossRecoveryTest, Analyze_LocksBoundedOutcome) {
    auto a = recovery_->analyze(losing_position());

    EXPECT_TRUE(a.should_recover) << a.reason;
    EXPECT_EQ(a.leading_side, Outcome::UP);
    EXPECT_EQ(a.trailing_side, Outcome::DOWN);
    EXPECT_DOUBLE_EQ(a.unpaired, 80.0);
    EXPECT_DOUBLE_EQ(a.buy_price, 0.26);
    EXPECT_NEAR(a.current_max_loss, -35.0, 1e-9);
    EXPECT_NEAR(a.recovery_cost, 20.8, 1e-9);
    EXPECT_NEAR(a.locked_after, 24.2, 1e-9);
    EXPECT_LT(a.loss_reduction, 0.0);
    EXPECT_NEAR(a.projected_combined, 0.71, 1e-9);
}

TEST_F(LossRecoveryTest, Analyze_SkipsSmallImbalance) {
    auto in = losing_position();
    in.down_qty = 90.0;
    in.down_cost = 45.0;
    auto a = recovery_->analyze(in);
    EXPECT_FALSE(a.should_recover);
    EXPECT_NE(a.reason.find("Unpaired"), std::string::npos);
}

TEST_F(LossRecoveryTest, Analyze_SkipsUncertainLeader) {
    auto in = losing_position();
    in.up_book = make_book(0.55, 0.57, clock_->now_ms());
    auto a = recovery_->analyze(in);
    EXPECT_FALSE(a.should_recover);
    EXPECT_NE(a.reason.find("Leading probability"), std::string::npos);
}

TEST_F(LossRecoveryTest, Analyze_SkipsExpensiveCombination) {
    auto in = losing_position();
    in.up_cost = 90.0;   // 0.90 average
    in.down_book = make_book(0.28, 0.30, clock_->now_ms());
    auto a = recovery_->analyze(in);
    EXPECT_FALSE(a.should_recover);
    EXPECT_NE(a.reason.find("Combined cost"), std::string::npos);
}

TEST_F(LossRecoveryTest, Analyze_DisabledNeverRecovers) {
    config_.enabled = false;
    LossRecovery disabled(config_, gateway_, clock_, sink_);
    EXPECT_FALSE(disabled.analyze(losing_position()).should_recover);
}

TEST_F(LossRecoveryTest, Recover_BuysTrailingSideAtAsk) {
    auto result = recovery_->check_and_recover(losing_position());

    ASSERT_TRUE(result.success) << result.reason;
    EXPECT_DOUBLE_EQ(result.filled_qty, 80.0);
    EXPECT_EQ(result.reason, "filled");

    auto placed = venue_->placed_requests();
    ASSERT_EQ(placed.size(), 1u);
    EXPECT_EQ(placed[0].token_id, "tok-down");
    EXPECT_DOUBLE_EQ(placed[0].price, 0.26);
    EXPECT_EQ(sink_->count("EMERGENCY_RECOVERY_TRIGGERED"), 1u);
    EXPECT_EQ(sink_->count("EMERGENCY_RECOVERY_SUCCESS"), 1u);
    EXPECT_EQ(sink_->count("EMERGENCY_CROSS"), 0u);   // guard has its own sink
}

TEST_F(LossRecoveryTest, Recover_CooldownPerMarket) {
    EXPECT_FALSE(recovery_->in_cooldown(losing_position().key));
    recovery_->check_and_recover(losing_position());
    EXPECT_TRUE(recovery_->in_cooldown(losing_position().key));

    auto again = recovery_->check_and_recover(losing_position());
    EXPECT_FALSE(again.attempted);
    EXPECT_EQ(again.reason, "cooldown");

    auto other = losing_position();
    other.key = MarketKey{"eth-updown-15m", "ETH"};
    EXPECT_TRUE(recovery_->check_and_recover(other).attempted);

    clock_->advance_ms(config_.cooldown_ms);
    EXPECT_FALSE(recovery_->in_cooldown(losing_position().key));
    auto in = losing_position();
    EXPECT_TRUE(recovery_->check_and_recover(in).attempted);
}

TEST_F(LossRecoveryTest, Recover_ReportsGatewayFailure) {
    venue_->fail_next_orders(1, "not enough balance");

    auto result = recovery_->check_and_recover(losing_position());

    EXPECT_TRUE(result.attempted);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.reason.find("VENUE_REJECTED"), std::string::npos);
    EXPECT_EQ(sink_->count("EMERGENCY_RECOVERY_FAILED"), 1u);
}
