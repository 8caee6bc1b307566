#include <gtest/gtest.h>
#include <stdexcept>
#include "exec/active_trades.hpp"
#include "state/json_file.hpp"
#include "fixtures/temp_dir.hpp"

namespace {
exec::TradeSignal signal_for(const char* base, const char* quote, Direction d){
    exec::TradeSignal s;
    s.pair = Pair{base, quote};
    s.direction = d;
    s.entry = 1.1000;
    s.stop_loss = d == Direction::Buy ? 1.0990 : 1.1010;
    s.take_profits = d == Direction::Buy ? std::vector<double>{1.1020, 1.1040, 1.1060}
                                         : std::vector<double>{1.0980, 1.0960, 1.0940};
    s.atr = 0.0010;
    s.base_rank = d == Direction::Buy ? 7 : -7;
    s.quote_rank = -s.base_rank;
    s.strength_diff = 14;
    s.breakout_tag = "range";
    s.breakout_level = 1.0995;
    s.category = "London";
    s.time = 1704895200;
    return s;
}
}

TEST(ActiveTrades, TracksOpenPairsAndCurrencies) {
    exec::ActiveTrades t;
    t.add(signal_for("EUR", "USD", Direction::Buy));
    t.add(signal_for("GBP", "JPY", Direction::Sell));
    EXPECT_EQ(t.size(), 2u);
    EXPECT_TRUE(t.has_open(Pair{"EUR", "USD"}));
    EXPECT_FALSE(t.has_open(Pair{"USD", "EUR"}));
    EXPECT_EQ(t.currencies(), (std::set<std::string>{"EUR", "USD", "GBP", "JPY"}));

    EXPECT_EQ(t.remove(Pair{"EUR", "USD"}), 1u);
    EXPECT_EQ(t.size(), 1u);
    EXPECT_EQ(t.remove(Pair{"EUR", "USD"}), 0u);
}

TEST(ActiveTrades, PersistsAcrossRestart) {
    TempDir dir;
    const auto path = dir.file("active_trades.json");
    {
        exec::ActiveTrades t(path);
        t.add(signal_for("EUR", "USD", Direction::Buy));
        ASSERT_TRUE(t.save());
    }
    exec::ActiveTrades again(path);
    ASSERT_TRUE(again.load());
    const auto v = again.snapshot();
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].pair.name(), "EUR_USD");
    EXPECT_EQ(v[0].direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(v[0].stop_loss, 1.0990);
    EXPECT_EQ(v[0].take_profits.size(), 3u);
    EXPECT_EQ(v[0].category, "London");
}

TEST(ActiveTrades, SkipsUnreadableRecords) {
    TempDir dir;
    const auto path = dir.file("active_trades.json");
    nlohmann::json arr = nlohmann::json::array();
    arr.push_back(nlohmann::json(signal_for("AUD", "NZD", Direction::Sell)));
    arr.push_back(nlohmann::json{{"pair", "XAU_USD"}, {"entry", 1.0}, {"stop_loss", 1.0}});
    arr.push_back(nlohmann::json{{"pair", "EUR_USD"}});
    ASSERT_TRUE(state::write_json_file(path, arr));

    exec::ActiveTrades t(path);
    ASSERT_TRUE(t.load());
    EXPECT_EQ(t.size(), 1u);
    EXPECT_TRUE(t.has_open(Pair{"AUD", "NZD"}));
}

TEST(TradeSignal, JsonRejectsBadPair) {
    exec::TradeSignal s;
    EXPECT_THROW(exec::from_json(nlohmann::json{{"pair", "EURUSD"}, {"entry", 1.0}, {"stop_loss", 1.0}}, s),
                 std::invalid_argument);
}

TEST(TradeSignal, NotificationText) {
    const auto s = signal_for("EUR", "USD", Direction::Buy);
    EXPECT_NEAR(s.reward_risk(), 2.0, 1e-9);
    const auto msg = exec::format_signal(s, 2.0);
    EXPECT_NE(msg.find("BUY EUR_USD [London]"), std::string::npos);
    EXPECT_NE(msg.find("Strength Diff: 14"), std::string::npos);
    EXPECT_NE(msg.find("Strengths: +7, -7"), std::string::npos);
    EXPECT_NE(msg.find("SL: 1.09900"), std::string::npos);
    EXPECT_NE(msg.find("TP1:1.10200"), std::string::npos);
    EXPECT_NE(msg.find("(10.0 pips)"), std::string::npos);
    EXPECT_NE(msg.find("Min RRR:1:2.0"), std::string::npos);
}

TEST(TradeSignal, JpyPairsUseThreeDecimals) {
    auto s = signal_for("GBP", "JPY", Direction::Sell);
    s.entry = 190.000; s.stop_loss = 190.250; s.take_profits = {189.500}; s.atr = 0.25;
    const auto msg = exec::format_signal(s, 2.0);
    EXPECT_NE(msg.find("Entry: 190.000"), std::string::npos);
    EXPECT_NE(msg.find("(25.0 pips)"), std::string::npos);
    EXPECT_NE(msg.find("Strengths: +7, -7"), std::string::npos);
}
