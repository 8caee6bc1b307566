#include <gtest/gtest.h>
#include <memory>
#include "engine/evaluator.hpp"
#include "fixtures/candles.hpp"
#include "fixtures/fake_candle_source.hpp"
#include "fixtures/spy_notifier.hpp"
#include "fixtures/temp_dir.hpp"

namespace {
class FakeCalendar : public telemetry::IEventSource {
public:
    std::vector<telemetry::NewsEvent> events() override { return events_; }
    std::vector<telemetry::NewsEvent> events_;
};
}

// =============================================================================
// Fixture: EUR_USD and USD_JPY with identical uptrends, so EUR ranks +7,
// USD +1 and JPY -7; USD_JPY is the widest candidate.
// =============================================================================

class EvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.pairs = {"EUR_USD", "USD_JPY"};
        cfg.state.cooldown_file = dir.file("bot_state.json");
        cfg.state.active_trades_file = dir.file("active_trades.json");
        cfg.group.enabled = false;
        cfg.signal.policy.rule = strategy::StrengthRule::MinDifferential;
        cfg.signal.policy.min_differential = 6;
        source.set_fallback(fixtures::line(120, 1.10, 0.001));
    }

    std::unique_ptr<engine::Evaluator> make(telemetry::INotifier& n, telemetry::IEventSource* ev = nullptr) {
        auto e = std::make_unique<engine::Evaluator>(cfg, source, n, ev, [this]{ return now; });
        e->restore();
        return e;
    }

    TempDir dir;
    core::AppConfig cfg;
    FakeCandleSource source;
    SpyNotifier notifier;
    std::int64_t now{fixtures::london_noon()};
};

TEST_F(EvaluatorTest, FirstTickSendsEveryAlert) {
    auto ev = make(notifier);
    const auto r = ev->tick();

    ASSERT_EQ(r.ranks.size(), 3u);
    EXPECT_EQ(r.ranks.at("EUR"), 7);
    EXPECT_EQ(r.ranks.at("USD"), 1);
    EXPECT_EQ(r.ranks.at("JPY"), -7);
    EXPECT_TRUE(r.strength_alert_sent);
    ASSERT_EQ(r.signals.size(), 1u);
    EXPECT_EQ(r.signals[0].pair.name(), "USD_JPY");
    EXPECT_EQ(r.signals[0].direction, Direction::Buy);
    EXPECT_TRUE(r.heartbeat_sent);

    EXPECT_EQ(notifier.count(), 3u);
    EXPECT_EQ(notifier.count_containing("Currency Strength Alert"), 1u);
    EXPECT_EQ(notifier.count_containing("BUY USD_JPY"), 1u);
    EXPECT_EQ(notifier.count_containing("Bot Heartbeat"), 1u);
    EXPECT_EQ(ev->active_trades().size(), 1u);
}

TEST_F(EvaluatorTest, RepeatedTickIsQuiet) {
    auto ev = make(notifier);
    ev->tick();
    const auto r = ev->tick();
    EXPECT_FALSE(r.strength_alert_sent);
    EXPECT_TRUE(r.signals.empty());
    EXPECT_FALSE(r.heartbeat_sent);
    EXPECT_EQ(notifier.count(), 3u);
}

TEST_F(EvaluatorTest, StrengthAlertReturnsAfterFourHours) {
    auto ev = make(notifier);
    ev->tick();
    now += 4 * 3600;
    EXPECT_TRUE(ev->tick().strength_alert_sent);
}

TEST_F(EvaluatorTest, RestartDoesNotRepeatAlerts) {
    {
        auto first = make(notifier);
        first->tick();
    }
    SpyNotifier after_restart;
    auto ev = make(after_restart);
    EXPECT_EQ(ev->active_trades().size(), 1u);
    const auto r = ev->tick();
    EXPECT_FALSE(r.strength_alert_sent);
    EXPECT_TRUE(r.signals.empty());
    EXPECT_FALSE(r.heartbeat_sent);
    EXPECT_EQ(after_restart.count(), 0u);
}

TEST_F(EvaluatorTest, SessionRolloverDropsOtherSessions) {
    auto ev = make(notifier);
    ev->cooldowns().record({"EUR_USD", "Asian"}, now - 3 * 3600);
    ev->cooldowns().record({"GBP_USD", "London"}, now - 3 * 3600);
    const auto r = ev->tick();
    EXPECT_EQ(r.pruned_keys, 1u);
    EXPECT_FALSE(ev->cooldowns().last_fired({"EUR_USD", "Asian"}).has_value());
    EXPECT_TRUE(ev->cooldowns().last_fired({"GBP_USD", "London"}).has_value());
}

TEST_F(EvaluatorTest, FailingStageDoesNotStopTheTick) {
    source.set_throws(true);
    auto ev = make(notifier);
    const auto r = ev->tick();
    EXPECT_TRUE(r.ranks.empty());
    EXPECT_TRUE(r.signals.empty());
    EXPECT_TRUE(r.heartbeat_sent);
    EXPECT_EQ(notifier.count(), 1u);
}

TEST_F(EvaluatorTest, NoDataNoStrengthOpinion) {
    source.set_fallback({});
    auto ev = make(notifier);
    const auto r = ev->tick();
    EXPECT_TRUE(r.ranks.empty());
    EXPECT_FALSE(r.strength_alert_sent);
    EXPECT_TRUE(r.signals.empty());
    EXPECT_EQ(notifier.count_containing("Currency Strength Alert"), 0u);
}

TEST_F(EvaluatorTest, GroupBreakoutAlertOnceThresholdMet) {
    cfg.group.enabled = true;
    cfg.group.min_pairs = 2;
    cfg.heartbeat = false;
    auto ev = make(notifier);

    const auto r = ev->tick();
    ASSERT_EQ(r.group_breakouts.size(), 2u);
    EXPECT_EQ(notifier.count_containing("Breakout Alert! (2 pairs)"), 1u);
    EXPECT_EQ(notifier.count_containing("EUR_USD BUY"), 1u);
    EXPECT_EQ(notifier.count_containing("USD_JPY BUY"), 1u);

    EXPECT_TRUE(ev->tick().group_breakouts.empty());
    EXPECT_EQ(notifier.count_containing("Breakout Alert!"), 1u);
}

TEST_F(EvaluatorTest, GroupBreakoutBelowThresholdRecordsNothing) {
    cfg.group.enabled = true;
    cfg.group.min_pairs = 3;
    auto ev = make(notifier);
    EXPECT_TRUE(ev->tick().group_breakouts.empty());
    EXPECT_EQ(notifier.count_containing("Breakout Alert!"), 0u);
    EXPECT_FALSE(ev->cooldowns().last_fired({"EUR_USD", "breakout_group"}).has_value());
}

TEST_F(EvaluatorTest, NewsAlertForOpenTradeCurrencies) {
    FakeCalendar cal;
    cal.events_ = {{"nfp-2024-01", now + 1800, "USD", "High", "Non-Farm Payrolls"},
                   {"rba-2024-01", now + 1800, "AUD", "High", "RBA Minutes"}};
    auto ev = make(notifier, &cal);

    EXPECT_EQ(ev->tick().news_alerts, 1u);
    EXPECT_EQ(notifier.count_containing("News Alert for USD_JPY trade!"), 1u);
    EXPECT_EQ(ev->tick().news_alerts, 0u);
}

TEST_F(EvaluatorTest, UndeliveredNewsAlertRetriedNextTick) {
    FakeCalendar cal;
    cal.events_ = {{"jp-cpi-2024-01", now + 1800, "JPY", "High", "CPI y/y"}};
    notifier.set_deliver(false);
    auto ev = make(notifier, &cal);

    EXPECT_EQ(ev->tick().news_alerts, 0u);
    EXPECT_FALSE(ev->cooldowns().last_fired({"jp-cpi-2024-01", "news"}).has_value());

    notifier.set_deliver(true);
    EXPECT_EQ(ev->tick().news_alerts, 1u);
    EXPECT_EQ(notifier.count_containing("News Alert for USD_JPY trade!"), 2u);
    EXPECT_TRUE(ev->cooldowns().last_fired({"jp-cpi-2024-01", "news"}).has_value());
}
