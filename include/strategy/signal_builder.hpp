#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/session.hpp"
#include "core/types.hpp"
#include "data/candle_source.hpp"
#include "exec/active_trades.hpp"
#include "exec/risk.hpp"
#include "exec/trade_signal.hpp"
#include "state/cooldown_store.hpp"
#include "strategy/breakout.hpp"
#include "strategy/decision.hpp"
#include "telemetry/notifier.hpp"

namespace strategy {

// Entry timing on the entry timeframe
//  Momentum:      RSI > momentum_buy_min (buy) / < momentum_sell_max (sell)
//  PullbackCross: armed by an RSI excursion (<= arm_low / >= arm_high),
//                 fires on the cross back through the midpoint
enum class EntryTiming { None, Momentum, PullbackCross };

std::optional<EntryTiming> parse_entry_timing(const std::string& s);

struct SignalConfig {
    Timeframe decision_tf{Timeframe::H1};
    std::size_t decision_bars{100};
    Timeframe entry_tf{Timeframe::M15};
    std::size_t entry_bars{50};
    std::size_t daily_bars{10};

    std::vector<std::string> breakouts{"range", "prior_day_scan"};
    BreakoutSettings breakout{};
    StrengthPolicy policy{};

    std::size_t rsi_period{14};
    std::size_t atr_period{14};
    double rsi_mid{50.0};

    EntryTiming timing{EntryTiming::Momentum};
    double momentum_buy_min{45.0};
    double momentum_sell_max{55.0};
    double arm_low{40.0};
    double arm_high{60.0};

    std::size_t retest_bars{0};        // 0 = retest gate off
    double retest_atr_tol{0.25};

    double sl_atr{1.0};
    std::vector<double> tp_atr{2.0, 4.0, 6.0};
    double min_rrr{2.0};

    std::int64_t cooldown_sec{3600};
    std::string category;              // empty: current trading session name
};

// Collaborators owned by the evaluator
struct SignalContext {
    data::ICandleSource& source;
    state::CooldownStore& cooldowns;
    exec::ActiveTrades& trades;
    telemetry::INotifier& notifier;
    core::Clock clock{core::unix_now};
};

// Price came back to `level` within `tol` and closed on the signal side
bool retest_confirmed(const Candles& c, double level, Direction d, double tol, std::size_t lookback);

// Sequential gate chain: cooldown -> entry RSI -> breakout ->
// direction/strength -> momentum -> retest -> risk -> emit. Any failing
// gate yields nullopt. The entry RSI feeds the pullback state on every
// evaluation past the cooldown, whatever the later gates decide.
class SignalBuilder {
public:
    SignalBuilder(SignalContext ctx, SignalConfig cfg = {});

    std::optional<exec::TradeSignal> build(const Pair& pair, const RankMap& ranks);

    // Cooldown category for signals fired at `now`
    std::string category_at(std::int64_t now) const;

    const SignalConfig& config() const { return cfg_; }

private:
    // armed_* survive until a signal fires in that direction; cross_* only
    // describe the latest observation
    struct PullbackState {
        bool armed_buy{false};
        bool armed_sell{false};
        bool cross_buy{false};
        bool cross_sell{false};
        std::optional<double> prev_rsi;
    };

    void observe_pullback(const std::string& pair, double rsi);
    bool entry_timing_ok(const std::string& pair, Direction d, double rsi) const;
    void disarm(const std::string& pair, Direction d);

    SignalContext ctx_;
    SignalConfig cfg_;
    exec::RiskModel risk_;
    std::vector<std::unique_ptr<IBreakoutStrategy>> strategies_;
    std::map<std::string, PullbackState> pullback_;
};

} // namespace strategy
