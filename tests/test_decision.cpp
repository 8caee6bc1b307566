#include <gtest/gtest.h>
#include "strategy/decision.hpp"

using strategy::StrengthPolicy;
using strategy::StrengthRule;

TEST(StrengthPolicy, MinAbsRankNeedsOppositeExtremes) {
    StrengthPolicy p;
    EXPECT_TRUE(p.accepts(7, -7));
    EXPECT_TRUE(p.accepts(5, -5));
    EXPECT_FALSE(p.accepts(5, -3));
    EXPECT_FALSE(p.accepts(7, 5));
    EXPECT_FALSE(p.accepts(4, -7));
}

TEST(StrengthPolicy, MinDifferential) {
    StrengthPolicy p;
    p.rule = StrengthRule::MinDifferential;
    p.min_differential = 8;
    EXPECT_TRUE(p.accepts(1, -7));
    EXPECT_FALSE(p.accepts(3, -3));
}

TEST(StrengthPolicy, AcceptedDifferentials) {
    StrengthPolicy p;
    p.rule = StrengthRule::AcceptedDifferentials;
    EXPECT_TRUE(p.accepts(7, -7));
    EXPECT_TRUE(p.accepts(5, -7));
    EXPECT_FALSE(p.accepts(7, -6));
}

TEST(StrengthPolicy, PairedExtremes) {
    StrengthPolicy p;
    p.rule = StrengthRule::PairedExtremes;
    EXPECT_TRUE(p.accepts(7, -5));
    EXPECT_FALSE(p.accepts(5, -5));
}

TEST(StrengthPolicy, ParseRuleNames) {
    EXPECT_EQ(strategy::parse_strength_rule("min_abs_rank").value(), StrengthRule::MinAbsRank);
    EXPECT_EQ(strategy::parse_strength_rule("paired_extremes").value(), StrengthRule::PairedExtremes);
    EXPECT_FALSE(strategy::parse_strength_rule("max").has_value());
}

TEST(Direction, FromRankDifference) {
    EXPECT_EQ(strategy::direction_from_ranks(7, -7).value(), Direction::Buy);
    EXPECT_EQ(strategy::direction_from_ranks(-3, 5).value(), Direction::Sell);
    EXPECT_FALSE(strategy::direction_from_ranks(2, 2).has_value());
}

TEST(Candidates, OrderedByDifferential) {
    const RankMap ranks{{"EUR", 7}, {"USD", -7}, {"GBP", 3}, {"JPY", -1}};
    const std::vector<Pair> pairs{{"GBP", "JPY"}, {"EUR", "USD"}, {"USD", "JPY"}, {"EUR", "CHF"}};
    const auto c = strategy::rank_candidates(pairs, ranks);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c[0].pair.name(), "EUR_USD");
    EXPECT_EQ(c[0].differential(), 14);
    EXPECT_EQ(c[1].pair.name(), "USD_JPY");
    EXPECT_EQ(c[2].pair.name(), "GBP_JPY");
}
