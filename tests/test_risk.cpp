#include <gtest/gtest.h>
#include "exec/risk.hpp"

TEST(RiskModel, BuyLevelsFromAtr) {
    exec::RiskModel m;
    const auto lv = m.levels(Direction::Buy, 1.1000, 0.0010);
    ASSERT_TRUE(lv.has_value());
    EXPECT_NEAR(lv->stop_loss, 1.0990, 1e-12);
    ASSERT_EQ(lv->take_profits.size(), 3u);
    EXPECT_NEAR(lv->take_profits[0], 1.1020, 1e-12);
    EXPECT_NEAR(lv->take_profits[1], 1.1040, 1e-12);
    EXPECT_NEAR(lv->take_profits[2], 1.1060, 1e-12);
    EXPECT_NEAR(lv->reward_risk, 2.0, 1e-9);
}

TEST(RiskModel, SellMirrorsBuy) {
    exec::RiskModel m;
    const auto lv = m.levels(Direction::Sell, 150.00, 0.20);
    ASSERT_TRUE(lv.has_value());
    EXPECT_NEAR(lv->stop_loss, 150.20, 1e-9);
    EXPECT_NEAR(lv->take_profits.front(), 149.60, 1e-9);
    EXPECT_GT(lv->stop_loss, lv->entry);
    EXPECT_LT(lv->take_profits.back(), lv->take_profits.front());
}

TEST(RiskModel, RejectsWithoutVolatilityOrReward) {
    EXPECT_FALSE(exec::RiskModel().levels(Direction::Buy, 1.1, 0.0).has_value());
    EXPECT_FALSE(exec::RiskModel(1.0, {2.0}, 3.0).levels(Direction::Buy, 1.1, 0.001).has_value());
    EXPECT_FALSE(exec::RiskModel(1.0, {}, 2.0).levels(Direction::Buy, 1.1, 0.001).has_value());
}
