#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/session.hpp"
#include "data/candle_source.hpp"
#include "exec/active_trades.hpp"
#include "state/cooldown_store.hpp"
#include "strategy/breakout.hpp"
#include "strategy/signal_builder.hpp"
#include "strategy/strength.hpp"
#include "telemetry/news_filter.hpp"
#include "telemetry/notifier.hpp"

namespace engine {

// What one pass produced
struct TickReport {
    RankMap ranks;
    bool strength_alert_sent{false};
    std::vector<exec::TradeSignal> signals;
    std::vector<std::string> group_breakouts;   // pairs in the group alert, empty if none sent
    bool heartbeat_sent{false};
    std::size_t news_alerts{0};
    std::size_t pruned_keys{0};
};

// Owns cooldown and active-trade state; one tick() per scheduling interval.
// No exception escapes tick(); failing stages are logged and skipped.
class Evaluator {
public:
    Evaluator(const core::AppConfig& cfg,
              data::ICandleSource& source,
              telemetry::INotifier& notifier,
              telemetry::IEventSource* events = nullptr,
              core::Clock clock = core::unix_now);

    // Loads persisted state; failures leave the evaluator on in-memory state
    void restore();

    TickReport tick();

    // Persists cooldowns and active trades
    void flush();

    const std::vector<Pair>& pairs() const { return pairs_; }
    state::CooldownStore& cooldowns() { return cooldowns_; }
    exec::ActiveTrades& active_trades() { return trades_; }

private:
    std::size_t rollover_sessions(std::int64_t now);
    bool strength_alert(const RankMap& ranks, std::int64_t now);
    std::vector<exec::TradeSignal> trade_signals(const RankMap& ranks);
    std::vector<std::string> group_breakout_alert(std::int64_t now);
    bool heartbeat(std::int64_t now);
    std::size_t news_alerts(std::int64_t now);

    core::AppConfig cfg_;
    data::ICandleSource& source_;
    telemetry::INotifier& notifier_;
    telemetry::IEventSource* events_;
    core::Clock clock_;

    std::vector<Pair> pairs_;
    state::CooldownStore cooldowns_;
    exec::ActiveTrades trades_;
    strategy::StrengthEngine strength_;
    std::unique_ptr<strategy::SignalBuilder> signals_;
    std::unique_ptr<strategy::IBreakoutStrategy> group_strategy_;
    telemetry::NewsFilter news_;
};

} // namespace engine
