#include <gtest/gtest.h>
#include "execution/hedge_priority_lane.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;
using updown::testing::make_book;

class HedgePriorityLaneTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        guard_ = std::make_shared<PriceGuard>(PriceGuardConfig{}, clock_);
        lane_ = std::make_unique<HedgePriorityLane>(config_, guard_, clock_, sink_);
    }

    MarketKey key_{"btc-updown-15m", "BTC"};
    HedgePriorityConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::shared_ptr<PriceGuard> guard_;
    std::unique_ptr<HedgePriorityLane> lane_;
};

TEST_F(HedgePriorityLaneTest, Intents_BypassGates) {
    for (const char* intent : {"HEDGE", "HEDGE_URGENT", "SURVIVAL", "EMERGENCY_EXIT", "FORCE"}) {
        EXPECT_TRUE(HedgePriorityLane::is_hedge_priority_intent(intent)) << intent;
        EXPECT_TRUE(HedgePriorityLane::should_bypass_rate_limiter(intent));
        EXPECT_TRUE(HedgePriorityLane::should_bypass_burst_limiter(intent));
        EXPECT_TRUE(HedgePriorityLane::should_bypass_cpp_gating(intent));
    }
    EXPECT_FALSE(HedgePriorityLane::is_hedge_priority_intent("ENTRY"));
    EXPECT_FALSE(HedgePriorityLane::is_hedge_priority_intent("hedge"));
}

TEST_F(HedgePriorityLaneTest, Escalation_ByTimeSinceEntry) {
    EXPECT_EQ(lane_->get_escalation_level(5.0), HedgeIntent::HEDGE);
    EXPECT_EQ(lane_->get_escalation_level(10.0), HedgeIntent::HEDGE);
    EXPECT_EQ(lane_->get_escalation_level(20.0), HedgeIntent::HEDGE_URGENT);
    EXPECT_EQ(lane_->get_escalation_level(45.0), HedgeIntent::SURVIVAL);
    EXPECT_EQ(lane_->get_escalation_level(61.0), HedgeIntent::EMERGENCY_EXIT);
}

TEST_F(HedgePriorityLaneTest, Decision_NoActiveHedge) {
    auto decision = lane_->get_hedge_decision(key_, 600.0, false);
    EXPECT_FALSE(decision.should_act);
    EXPECT_EQ(decision.action, HedgeAction::WAIT);
}

TEST_F(HedgePriorityLaneTest, Decision_PlaceThenWaitThenReprice) {
    lane_->start_tracking(key_, Outcome::UP, 40.0);
    EXPECT_EQ(sink_->count("HEDGE_STARTED"), 1u);

    auto place = lane_->get_hedge_decision(key_, 600.0, false);
    EXPECT_EQ(place.action, HedgeAction::PLACE_HEDGE);
    EXPECT_EQ(lane_->get_state(key_)->hedge_attempts, 1);

    clock_->advance_ms(1000);
    auto wait = lane_->get_hedge_decision(key_, 599.0, true);
    EXPECT_FALSE(wait.should_act);
    EXPECT_EQ(wait.action, HedgeAction::WAIT);
    EXPECT_EQ(lane_->get_state(key_)->hedge_attempts, 1);

    clock_->advance_ms(config_.reprice_normal_ms);
    auto reprice = lane_->get_hedge_decision(key_, 594.0, true);
    EXPECT_EQ(reprice.action, HedgeAction::REPRICE_HEDGE);
    EXPECT_EQ(lane_->get_state(key_)->hedge_attempts, 2);
}

TEST_F(HedgePriorityLaneTest, Decision_EmergencyNearExpiry) {
    lane_->start_tracking(key_, Outcome::DOWN, 30.0);
    auto decision = lane_->get_hedge_decision(key_, 80.0, true);

    EXPECT_TRUE(decision.should_act);
    EXPECT_EQ(decision.action, HedgeAction::EMERGENCY_EXIT);
    EXPECT_TRUE(decision.emergency_mode);
    EXPECT_EQ(lane_->get_state(key_)->hedge_attempts, 0);
}

TEST_F(HedgePriorityLaneTest, Decision_ExitAfterMaxAttempts) {
    lane_->start_tracking(key_, Outcome::UP, 40.0);
    for (int i = 0; i < config_.max_hedge_attempts; ++i) {
        auto d = lane_->get_hedge_decision(key_, 600.0, false);
        ASSERT_EQ(d.action, HedgeAction::PLACE_HEDGE);
    }
    auto decision = lane_->get_hedge_decision(key_, 600.0, false);
    EXPECT_EQ(decision.action, HedgeAction::EMERGENCY_EXIT);
    EXPECT_NE(decision.reason.find("MAX_ATTEMPTS_REACHED"), std::string::npos);
}

TEST_F(HedgePriorityLaneTest, Fill_PartialThenComplete) {
    lane_->start_tracking(key_, Outcome::UP, 40.0);
    clock_->advance_ms(2500);

    lane_->record_hedge_fill(key_, 15.0);
    EXPECT_TRUE(lane_->is_active(key_));
    EXPECT_EQ(sink_->count("HEDGE_COMPLETED"), 0u);

    lane_->record_hedge_fill(key_, 25.0);
    EXPECT_FALSE(lane_->is_active(key_));

    auto completed = sink_->of_type("HEDGE_COMPLETED");
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].data["final_state"], "HEDGED");
    EXPECT_EQ(completed[0].data["hedge_lag_ms"].get<int64_t>(), 2500);
    EXPECT_FALSE(completed[0].data["exit_used"].get<bool>());
}

TEST_F(HedgePriorityLaneTest, Exit_And_Expiry_Resolve) {
    lane_->start_tracking(key_, Outcome::UP, 40.0);
    lane_->record_emergency_exit(key_, 40.0);
    auto state = lane_->get_state(key_);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->resolution, HedgeResolution::EXITED);

    MarketKey other{"eth-updown-15m", "ETH"};
    lane_->start_tracking(other, Outcome::DOWN, 10.0);
    lane_->mark_expired(other);
    EXPECT_EQ(lane_->get_state(other)->resolution, HedgeResolution::EXPIRED_UNHEDGED);

    // Already resolved: a second expiry is ignored
    lane_->mark_expired(other);
    EXPECT_EQ(sink_->count("HEDGE_COMPLETED"), 2u);
}

TEST_F(HedgePriorityLaneTest, HedgePrice_ByIntent) {
    auto book = make_book(0.40, 0.46);

    EXPECT_DOUBLE_EQ(lane_->calculate_hedge_price(HedgeIntent::HEDGE, book).price, 0.41);
    EXPECT_DOUBLE_EQ(lane_->calculate_hedge_price(HedgeIntent::HEDGE_URGENT, book).price, 0.42);
    EXPECT_DOUBLE_EQ(lane_->calculate_hedge_price(HedgeIntent::SURVIVAL, book).price, 0.43);

    auto emergency = lane_->calculate_hedge_price(HedgeIntent::EMERGENCY_EXIT, book);
    EXPECT_DOUBLE_EQ(emergency.price, 0.48);
    EXPECT_TRUE(emergency.emergency_mode);
}

TEST_F(HedgePriorityLaneTest, HedgePrice_NeverCrossesOutsideEmergency) {
    auto tight = make_book(0.44, 0.45);
    for (auto intent : {HedgeIntent::HEDGE, HedgeIntent::HEDGE_URGENT, HedgeIntent::SURVIVAL}) {
        auto hp = lane_->calculate_hedge_price(intent, tight);
        EXPECT_LE(hp.price, 0.44 + 1e-9);
        EXPECT_FALSE(hp.emergency_mode);
    }
}
