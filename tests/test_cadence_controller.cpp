#include <gtest/gtest.h>
#include "core/cadence_controller.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;

class CadenceControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        cadence_ = std::make_unique<CadenceController>(config_, clock_, sink_);
        cadence_->register_market(market_, "BTC");
    }

    CadenceMetrics quiet() const {
        CadenceMetrics m;
        m.mispricing = 0.0;
        m.enter_threshold = 0.02;
        return m;
    }

    CadenceMetrics near() const {
        CadenceMetrics m = quiet();
        m.mispricing = 0.013;   // >= 0.6 * 0.02, < 0.85 * 0.02
        return m;
    }

    CadenceMetrics hot() const {
        CadenceMetrics m = quiet();
        m.mispricing = 0.018;
        return m;
    }

    std::string market_{"btc-updown-15m"};
    CadenceConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::unique_ptr<CadenceController> cadence_;
};

TEST_F(CadenceControllerTest, RollingPercentile_FloorIndex) {
    RollingPercentile window(5);
    EXPECT_DOUBLE_EQ(window.percentile(90.0), 0.0);

    for (double v : {5.0, 1.0, 4.0, 2.0, 3.0}) window.push(v);
    EXPECT_DOUBLE_EQ(window.percentile(0.0), 1.0);
    EXPECT_DOUBLE_EQ(window.percentile(75.0), 4.0);
    EXPECT_DOUBLE_EQ(window.percentile(90.0), 4.0);
    EXPECT_DOUBLE_EQ(window.percentile(100.0), 5.0);

    // Oldest value is evicted
    window.push(10.0);
    EXPECT_EQ(window.size(), 5u);
    EXPECT_DOUBLE_EQ(window.percentile(0.0), 1.0);
    window.push(10.0);
    EXPECT_DOUBLE_EQ(window.percentile(0.0), 2.0);
}

TEST_F(CadenceControllerTest, Register_StartsCold) {
    EXPECT_EQ(cadence_->get_state(market_), CadenceState::COLD);
    EXPECT_EQ(cadence_->get_eval_interval_ms(market_), config_.cold_eval_ms);
    EXPECT_TRUE(cadence_->should_evaluate(market_));
    EXPECT_TRUE(cadence_->should_evaluate("unknown-market"));
}

TEST_F(CadenceControllerTest, Evaluate_QuietIsNeitherNearNorHot) {
    auto result = cadence_->evaluate_cadence("BTC", quiet());
    EXPECT_FALSE(result.is_near);
    EXPECT_FALSE(result.is_hot);
}

TEST_F(CadenceControllerTest, Evaluate_RecentMovesAreNear) {
    auto m = quiet();
    m.spot_move_age_ms = 200;
    auto result = cadence_->evaluate_cadence("BTC", m);
    EXPECT_TRUE(result.is_near);
    EXPECT_FALSE(result.is_hot);
    ASSERT_EQ(result.near_reasons.size(), 1u);
    EXPECT_NE(result.near_reasons[0].find("spotMoveAge"), std::string::npos);
}

TEST_F(CadenceControllerTest, Evaluate_SpreadChangeIsHot) {
    auto m = quiet();
    m.spread_changed_tick = true;
    EXPECT_TRUE(cadence_->evaluate_cadence("BTC", m).is_hot);
}

TEST_F(CadenceControllerTest, Evaluate_StateScorePercentiles) {
    for (int i = 1; i <= 100; ++i) {
        cadence_->record_state_score("BTC", i / 100.0);
    }
    auto m = quiet();
    m.state_score = 0.80;
    auto result = cadence_->evaluate_cadence("BTC", m);
    EXPECT_TRUE(result.is_near);
    EXPECT_FALSE(result.is_hot);

    m.state_score = 0.95;
    EXPECT_TRUE(cadence_->evaluate_cadence("BTC", m).is_hot);
}

TEST_F(CadenceControllerTest, UpdateState_EscalatesImmediately) {
    EXPECT_EQ(cadence_->update_state(market_, "BTC", near()), CadenceState::WARM);
    EXPECT_EQ(cadence_->get_eval_interval_ms(market_), config_.warm_eval_ms);

    EXPECT_EQ(cadence_->update_state(market_, "BTC", hot()), CadenceState::HOT);
    EXPECT_EQ(cadence_->get_eval_interval_ms(market_), config_.hot_eval_ms);

    auto transitions = sink_->of_type("CADENCE_TRANSITION");
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].data["from"], "COLD");
    EXPECT_EQ(transitions[1].data["to"], "HOT");
}

TEST_F(CadenceControllerTest, UpdateState_ColdJumpsStraightToHot) {
    EXPECT_EQ(cadence_->update_state(market_, "BTC", hot()), CadenceState::HOT);
}

TEST_F(CadenceControllerTest, UpdateState_HotHoldsThroughHysteresis) {
    cadence_->update_state(market_, "BTC", hot());

    // Near but not hot: HOT holds until hot_to_warm_hysteresis_ms
    cadence_->update_state(market_, "BTC", near());
    clock_->advance_ms(config_.hot_to_warm_hysteresis_ms - 1);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", near()), CadenceState::HOT);

    clock_->advance_ms(1);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", near()), CadenceState::WARM);
}

TEST_F(CadenceControllerTest, UpdateState_WarmCoolsAfterHysteresis) {
    cadence_->update_state(market_, "BTC", near());

    cadence_->update_state(market_, "BTC", quiet());
    clock_->advance_ms(config_.warm_to_cold_hysteresis_ms - 1);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", quiet()), CadenceState::WARM);

    // A near signal resets the quiet timer
    cadence_->update_state(market_, "BTC", near());
    clock_->advance_ms(1);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", quiet()), CadenceState::WARM);

    clock_->advance_ms(config_.warm_to_cold_hysteresis_ms);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", quiet()), CadenceState::COLD);
}

TEST_F(CadenceControllerTest, UpdateState_HotCoolsToColdWhenAllQuiet) {
    cadence_->update_state(market_, "BTC", hot());
    cadence_->update_state(market_, "BTC", quiet());
    clock_->advance_ms(config_.warm_to_cold_hysteresis_ms);
    EXPECT_EQ(cadence_->update_state(market_, "BTC", quiet()), CadenceState::COLD);
}

TEST_F(CadenceControllerTest, Timing_EvaluationInterval) {
    cadence_->mark_evaluated(market_);
    EXPECT_FALSE(cadence_->should_evaluate(market_));
    clock_->advance_ms(config_.cold_eval_ms);
    EXPECT_TRUE(cadence_->should_evaluate(market_));
}

TEST_F(CadenceControllerTest, Timing_NoPeriodicSnapshotWhenHot) {
    cadence_->mark_full_snapshot(market_);
    EXPECT_FALSE(cadence_->should_log_full_snapshot(market_));
    clock_->advance_ms(config_.cold_snapshot_ms);
    EXPECT_TRUE(cadence_->should_log_full_snapshot(market_));

    cadence_->update_state(market_, "BTC", hot());
    clock_->advance_ms(60000);
    EXPECT_FALSE(cadence_->should_log_full_snapshot(market_));
}

TEST_F(CadenceControllerTest, Spread_ChangeWithinWindow) {
    EXPECT_FALSE(cadence_->check_spread_changed(market_));

    cadence_->record_spread(market_, 0.02, 0.02);
    EXPECT_FALSE(cadence_->check_spread_changed(market_));

    clock_->advance_ms(300);
    cadence_->record_spread(market_, 0.03, 0.02);
    EXPECT_TRUE(cadence_->check_spread_changed(market_));

    // Old samples fall out of the change window
    clock_->advance_ms(config_.spread_change_window_ms + 1);
    cadence_->record_spread(market_, 0.03, 0.02);
    EXPECT_FALSE(cadence_->check_spread_changed(market_));
}

TEST_F(CadenceControllerTest, Moves_AgeSinceLastObservation) {
    EXPECT_EQ(cadence_->get_spot_move_age_ms("BTC"), NEVER_MS);
    EXPECT_EQ(cadence_->get_poly_move_age_ms(market_), NEVER_MS);

    cadence_->record_spot_move("BTC", 65000.0);
    cadence_->record_poly_move(market_, 0.52, 0.48);
    clock_->advance_ms(400);
    EXPECT_EQ(cadence_->get_spot_move_age_ms("BTC"), 400);
    EXPECT_EQ(cadence_->get_poly_move_age_ms(market_), 400);

    auto m = cadence_->build_metrics(market_, "BTC", 0.0, 0.02, 0.0, 0.02, 0.02);
    EXPECT_EQ(m.spot_move_age_ms, 400);
    EXPECT_FALSE(m.spread_changed_tick);
}

TEST_F(CadenceControllerTest, Stats_CountByState) {
    cadence_->register_market("eth-updown-15m", "ETH");
    cadence_->update_state(market_, "BTC", hot());

    auto s = cadence_->stats();
    EXPECT_EQ(s.total, 2);
    EXPECT_EQ(s.hot, 1);
    EXPECT_EQ(s.cold, 1);

    cadence_->unregister_market(market_);
    EXPECT_EQ(cadence_->stats().total, 1);
}
