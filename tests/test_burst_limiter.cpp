#include <gtest/gtest.h>
#include "risk/burst_limiter.hpp"

using namespace updown;

class BurstLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_orders_per_minute_per_market = 3;
        config_.min_ms_between_orders = 2000;
        config_.window_ms = 60000;
        clock_ = std::make_shared<ManualClock>();
        limiter_ = std::make_unique<BurstLimiter>(config_, clock_);
    }

    MarketKey key_{"btc-updown-15m", "BTC"};
    BurstLimitConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<BurstLimiter> limiter_;
};

TEST_F(BurstLimiterTest, Check_AllowsFirstOrder) {
    EXPECT_TRUE(limiter_->check(key_).allowed);
}

TEST_F(BurstLimiterTest, Check_EnforcesSpacing) {
    limiter_->record_placement(key_);
    clock_->advance_ms(500);

    auto result = limiter_->check(key_);
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(result.wait_ms, 1500);
    EXPECT_NE(result.reason.find("BURST_SPACING"), std::string::npos);

    clock_->advance_ms(1500);
    EXPECT_TRUE(limiter_->check(key_).allowed);
}

TEST_F(BurstLimiterTest, Check_CapsOrdersPerWindow) {
    for (int i = 0; i < 3; ++i) {
        limiter_->record_placement(key_);
        clock_->advance_ms(5000);
    }

    auto result = limiter_->check(key_);
    EXPECT_FALSE(result.allowed);
    EXPECT_NE(result.reason.find("BURST_LIMIT"), std::string::npos);
    EXPECT_EQ(result.wait_ms, config_.window_ms - 15000);

    clock_->advance_ms(result.wait_ms + 1);
    EXPECT_TRUE(limiter_->check(key_).allowed);
}

TEST_F(BurstLimiterTest, Check_IsPerMarket) {
    limiter_->record_placement(key_);
    EXPECT_TRUE(limiter_->check(MarketKey{"eth-updown-15m", "ETH"}).allowed);

    limiter_->clear(key_);
    EXPECT_TRUE(limiter_->check(key_).allowed);
}

TEST_F(BurstLimiterTest, Stats_CountsBlocks) {
    limiter_->record_placement(key_);
    limiter_->check(key_);
    auto stats = limiter_->stats();
    EXPECT_EQ(stats["total_blocked"].get<int64_t>(), 1);
    EXPECT_EQ(stats["tracked_markets"].get<size_t>(), 1u);
}
