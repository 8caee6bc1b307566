#include <gtest/gtest.h>
#include "strategy/strength.hpp"
#include "fixtures/candles.hpp"
#include "fixtures/fake_candle_source.hpp"

// =============================================================================
// Rank mapping
// =============================================================================

TEST(RankScores, FourCurrencies) {
    const auto r = strategy::rank_scores({{"AUD", 10.0}, {"CAD", 5.0}, {"CHF", -5.0}, {"EUR", -10.0}});
    EXPECT_EQ(r.at("AUD"), 7);
    EXPECT_EQ(r.at("CAD"), 2);
    EXPECT_EQ(r.at("CHF"), -2);
    EXPECT_EQ(r.at("EUR"), -7);
}

TEST(RankScores, EightCurrenciesSpreadEvenly) {
    std::map<std::string, double> s;
    double v = 8.0;
    for (const char* c : kCurrencies) s[c] = v--;
    const auto r = strategy::rank_scores(s);
    EXPECT_EQ(r.at("EUR"), 7);
    EXPECT_EQ(r.at("GBP"), 5);
    EXPECT_EQ(r.at("USD"), 3);
    EXPECT_EQ(r.at("JPY"), 1);
    EXPECT_EQ(r.at("CHF"), -1);
    EXPECT_EQ(r.at("AUD"), -3);
    EXPECT_EQ(r.at("NZD"), -5);
    EXPECT_EQ(r.at("CAD"), -7);
}

TEST(RankScores, MiddleZeroIsNudged) {
    const auto r = strategy::rank_scores({{"EUR", 1.0}, {"USD", 0.0}, {"JPY", -1.0}});
    EXPECT_EQ(r.at("EUR"), 7);
    EXPECT_EQ(r.at("USD"), 1);
    EXPECT_EQ(r.at("JPY"), -7);
}

TEST(RankScores, MonotoneAndNeverZero) {
    const std::map<std::string, double> s{{"EUR", 0.3}, {"GBP", -1.2}, {"USD", 2.5}, {"JPY", 0.3},
                                          {"CHF", -0.1}, {"AUD", 9.0}, {"NZD", -4.0}};
    const auto r = strategy::rank_scores(s);
    ASSERT_EQ(r.size(), s.size());
    for (const auto& [a, sa] : s) {
        EXPECT_NE(r.at(a), 0);
        EXPECT_GE(r.at(a), -7);
        EXPECT_LE(r.at(a), 7);
        for (const auto& [b, sb] : s)
            if (sa > sb) EXPECT_GE(r.at(a), r.at(b)) << a << " vs " << b;
    }
}

TEST(RankScores, FewerThanTwoCurrencies) {
    EXPECT_TRUE(strategy::rank_scores({}).empty());
    EXPECT_TRUE(strategy::rank_scores({{"EUR", 1.0}}).empty());
}

TEST(StrengthAlert, StrongestFirst) {
    const auto msg = strategy::format_strength_alert({{"EUR", -7}, {"USD", 7}});
    const auto usd = msg.find("USD: +7");
    const auto eur = msg.find("EUR: -7");
    ASSERT_NE(usd, std::string::npos);
    ASSERT_NE(eur, std::string::npos);
    EXPECT_LT(usd, eur);
}

// =============================================================================
// Engine
// =============================================================================

TEST(StrengthEngine, RisingPairStrengthensBase) {
    FakeCandleSource src;
    src.set("EUR_USD", Timeframe::H4, fixtures::line(30, 1.10, 0.001));
    strategy::StrengthEngine eng(src);
    const auto r = eng.compute_ranks({Pair{"EUR", "USD"}});
    EXPECT_EQ(r.at("EUR"), 7);
    EXPECT_EQ(r.at("USD"), -7);
}

TEST(StrengthEngine, PairWithoutDataIsExcluded) {
    FakeCandleSource src;
    src.set("EUR_USD", Timeframe::H4, fixtures::line(30, 1.10, 0.001));
    strategy::StrengthEngine eng(src);
    const auto r = eng.compute_ranks({Pair{"EUR", "USD"}, Pair{"GBP", "CHF"}});
    EXPECT_EQ(r.size(), 2u);
    EXPECT_EQ(r.count("GBP"), 0u);
    EXPECT_EQ(r.count("CHF"), 0u);
}

TEST(StrengthEngine, NoDataNoOpinion) {
    FakeCandleSource src;
    strategy::StrengthEngine eng(src);
    EXPECT_TRUE(eng.compute_ranks({Pair{"EUR", "USD"}, Pair{"GBP", "JPY"}}).empty());
}

TEST(StrengthEngine, QuoteReceivesNegatedScore) {
    FakeCandleSource src;
    src.set("EUR_USD", Timeframe::H4, fixtures::line(30, 1.10, 0.001));
    src.set("USD_JPY", Timeframe::H4, fixtures::line(30, 150.0, -0.05));
    strategy::StrengthEngine eng(src);
    const auto avg = eng.average_scores({Pair{"EUR", "USD"}, Pair{"USD", "JPY"}});
    ASSERT_EQ(avg.size(), 3u);
    EXPECT_GT(avg.at("EUR"), 0.0);
    EXPECT_GT(avg.at("JPY"), 0.0);
    EXPECT_LT(avg.at("USD"), 0.0);
}
