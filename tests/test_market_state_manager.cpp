#include <gtest/gtest.h>
#include "core/market_state_manager.hpp"
#include "test_helpers.hpp"

using namespace updown;
using updown::testing::RecordingEventSink;

class MarketStateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        sink_ = std::make_shared<RecordingEventSink>();
        manager_ = std::make_unique<MarketStateManager>(config_, clock_, sink_);
    }

    MarketKey key_{"btc-updown-15m", "BTC"};
    MarketStateConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::unique_ptr<MarketStateManager> manager_;
};

TEST_F(MarketStateManagerTest, ProcessTick_FlatWithoutInventory) {
    auto tick = manager_->process_tick(key_, 0.0, 0.0, 600.0);
    EXPECT_EQ(tick.state, PairingState::FLAT);
    EXPECT_FALSE(tick.pairing_timed_out);
}

TEST_F(MarketStateManagerTest, ProcessTick_OneSidedUp) {
    auto tick = manager_->process_tick(key_, 40.0, 0.0, 200.0);
    EXPECT_EQ(tick.state, PairingState::ONE_SIDED_UP);

    auto down = manager_->process_tick(MarketKey{"eth", "ETH"}, 0.0, 12.0, 200.0);
    EXPECT_EQ(down.state, PairingState::ONE_SIDED_DOWN);
}

TEST_F(MarketStateManagerTest, ProcessTick_PairedWithinImbalance) {
    // |50 - 45| = 5 <= 45 * 0.20
    auto tick = manager_->process_tick(key_, 50.0, 45.0, 300.0);
    EXPECT_EQ(tick.state, PairingState::PAIRED);
}

TEST_F(MarketStateManagerTest, ProcessTick_SmallBalancedIsNotPaired) {
    // Below min_paired_shares the dominant side decides
    auto tick = manager_->process_tick(key_, 10.0, 8.0, 300.0);
    EXPECT_EQ(tick.state, PairingState::ONE_SIDED_UP);
}

TEST_F(MarketStateManagerTest, BeginPairing_OnlyFromOneSided) {
    EXPECT_FALSE(manager_->begin_pairing(key_, "PAIR_EDGE"));

    manager_->process_tick(key_, 40.0, 0.0, 200.0);
    EXPECT_TRUE(manager_->begin_pairing(key_, "PAIR_EDGE"));
    EXPECT_EQ(manager_->get_state(key_), PairingState::PAIRING);
    EXPECT_EQ(sink_->count("PAIRING_STARTED"), 1u);

    auto ctx = manager_->find_context(key_);
    ASSERT_TRUE(ctx.has_value());
    ASSERT_TRUE(ctx->pairing_start.has_value());
    EXPECT_EQ(*ctx->pairing_start, clock_->now_ms());
}

TEST_F(MarketStateManagerTest, PairingTimeout_RevertsOnceAfterDeadline) {
    manager_->process_tick(key_, 40.0, 0.0, 200.0);
    ASSERT_TRUE(manager_->begin_pairing(key_, "PAIR_EDGE"));

    clock_->advance_ms(46000);
    auto tick = manager_->process_tick(key_, 40.0, 0.0, 154.0);

    EXPECT_TRUE(tick.pairing_timed_out);
    EXPECT_TRUE(tick.should_cancel_unfilled_hedges);
    EXPECT_GE(tick.time_in_pairing_s, 45.0);
    EXPECT_EQ(tick.state, PairingState::ONE_SIDED_UP);
    EXPECT_EQ(sink_->count("PAIRING_TIMEOUT_REVERT"), 1u);

    auto ctx = manager_->find_context(key_);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_FALSE(ctx->pairing_start.has_value());

    // Fires exactly once
    clock_->advance_ms(1000);
    auto again = manager_->process_tick(key_, 40.0, 0.0, 153.0);
    EXPECT_FALSE(again.pairing_timed_out);
    EXPECT_EQ(sink_->count("PAIRING_TIMEOUT_REVERT"), 1u);
}

TEST_F(MarketStateManagerTest, Pairing_HoldsWhileBothSidesUnbalanced) {
    manager_->process_tick(key_, 40.0, 0.0, 200.0);
    ASSERT_TRUE(manager_->begin_pairing(key_, "PAIR_EDGE"));

    clock_->advance_ms(10000);
    auto tick = manager_->process_tick(key_, 40.0, 15.0, 190.0);
    EXPECT_EQ(tick.state, PairingState::PAIRING);

    // Completing the pair clears the deadline
    auto paired = manager_->process_tick(key_, 40.0, 38.0, 189.0);
    EXPECT_EQ(paired.state, PairingState::PAIRED);
    EXPECT_FALSE(manager_->find_context(key_)->pairing_start.has_value());
}

TEST_F(MarketStateManagerTest, UnwindOnly_IsAbsorbing) {
    auto tick = manager_->process_tick(key_, 40.0, 0.0, 45.0);
    EXPECT_EQ(tick.state, PairingState::UNWIND_ONLY);

    // Even with balanced inventory and time reported back above the threshold
    auto later = manager_->process_tick(key_, 40.0, 40.0, 300.0);
    EXPECT_EQ(later.state, PairingState::UNWIND_ONLY);
    EXPECT_FALSE(manager_->begin_pairing(key_, "PAIR_EDGE"));
}

TEST_F(MarketStateManagerTest, HedgeCap_BaseWithoutHistory) {
    auto& ctx = manager_->get_or_create_context(key_);
    auto cap = manager_->calculate_dynamic_hedge_cap("BTC", ctx);
    EXPECT_DOUBLE_EQ(cap.final_cap, 1.0);
    EXPECT_FALSE(cap.recent_vol.has_value());

    auto unknown = manager_->calculate_dynamic_hedge_cap("DOGE", ctx);
    EXPECT_DOUBLE_EQ(unknown.final_cap, config_.default_slippage_cap.base_cents);
}

TEST_F(MarketStateManagerTest, HedgeCap_WidensWithVolatilityUpToMax) {
    manager_->record_price(key_, 0.50);
    clock_->advance_ms(1000);
    manager_->record_price(key_, 0.51);

    auto ctx = manager_->find_context(key_);
    ASSERT_TRUE(ctx.has_value());
    auto cap = manager_->calculate_dynamic_hedge_cap("BTC", *ctx);
    ASSERT_TRUE(cap.recent_vol.has_value());
    EXPECT_NEAR(*cap.recent_vol, 0.02, 1e-9);
    EXPECT_GT(cap.dynamic_cap, cap.base_cap);
    EXPECT_DOUBLE_EQ(cap.final_cap, 2.0);
}

TEST_F(MarketStateManagerTest, HedgePriceAllowed_ComparesPairCost) {
    auto& ctx = manager_->get_or_create_context(key_);
    EXPECT_TRUE(manager_->is_hedge_price_allowed("BTC", ctx, 100.5).allowed);
    EXPECT_FALSE(manager_->is_hedge_price_allowed("BTC", ctx, 101.5).allowed);
    EXPECT_EQ(sink_->count("HEDGE_PRICE_CAP_DYNAMIC"), 2u);
}

TEST_F(MarketStateManagerTest, HedgeChunk_Bounded) {
    EXPECT_DOUBLE_EQ(manager_->calculate_bounded_hedge_chunk(40.0).bounded_chunk, 25.0);
    EXPECT_DOUBLE_EQ(manager_->calculate_bounded_hedge_chunk(200.0).bounded_chunk, 50.0);
    EXPECT_DOUBLE_EQ(manager_->calculate_bounded_hedge_chunk(1000.0).bounded_chunk, 100.0);

    EXPECT_TRUE(manager_->is_hedge_size_allowed(25.0, 40.0));
    EXPECT_FALSE(manager_->is_hedge_size_allowed(20.0, 40.0));
}

TEST_F(MarketStateManagerTest, ClearMarket_DropsContext) {
    manager_->process_tick(key_, 40.0, 0.0, 200.0);
    manager_->process_tick(MarketKey{"eth", "ETH"}, 0.0, 0.0, 200.0);
    EXPECT_EQ(manager_->market_count(), 2u);

    manager_->clear_market(key_);
    EXPECT_EQ(manager_->market_count(), 1u);
    EXPECT_EQ(manager_->get_state(key_), PairingState::FLAT);
}
