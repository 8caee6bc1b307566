#pragma once
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace strategy {

struct BreakoutEvent {
    Pair pair;
    double level{0.0};
    Direction direction{Direction::Buy};
    Timeframe timeframe{Timeframe::H1};
    std::string tag;   // strategy id, e.g. "prior_day"
};

struct BreakoutInput {
    const Pair& pair;
    Timeframe timeframe;
    const Candles& candles;   // decision timeframe, oldest -> newest
    const Candles& daily;     // may be empty
};

// Breakout detection policy. Insufficient history -> nullopt, never throws.
class IBreakoutStrategy {
public:
    virtual ~IBreakoutStrategy() = default;

    // Unique id ("current_bar", "prior_bar", "prior_day", "prior_day_scan", "range")
    virtual std::string id() const = 0;

    // Minimum number of decision-timeframe bars needed
    virtual std::size_t warmup_bars() const = 0;

    virtual std::optional<BreakoutEvent> detect(const BreakoutInput& in) const = 0;
};

// Latest close at/beyond the latest bar's own high or low (whipsaw detector)
class CurrentBarBreak final : public IBreakoutStrategy {
public:
    std::string id() const override { return "current_bar"; }
    std::size_t warmup_bars() const override { return 1; }
    std::optional<BreakoutEvent> detect(const BreakoutInput& in) const override;
};

// Latest close above the previous bar's high / below its low
class PriorBarBreak final : public IBreakoutStrategy {
public:
    std::string id() const override { return "prior_bar"; }
    std::size_t warmup_bars() const override { return 2; }
    std::optional<BreakoutEvent> detect(const BreakoutInput& in) const override;
};

// Close beyond the previous completed daily bar. scan_bars > 1 accepts a
// break by any of the last scan_bars closes ("sometime today").
class PriorDayBreak final : public IBreakoutStrategy {
public:
    explicit PriorDayBreak(std::size_t scan_bars = 1) : scan_bars_(std::max<std::size_t>(1, scan_bars)) {}
    std::string id() const override { return scan_bars_ > 1 ? "prior_day_scan" : "prior_day"; }
    std::size_t warmup_bars() const override { return scan_bars_; }
    std::optional<BreakoutEvent> detect(const BreakoutInput& in) const override;

private:
    std::size_t scan_bars_;
};

struct RangeBreakOptions {
    std::size_t lookback{20};
    bool use_swings{false};            // levels from swing points inside the window
    std::size_t trend_ema_period{0};   // 0 = off; EMA over daily closes
    double min_move_atr{0.0};          // 0 = off; last close-to-close move in ATRs
    std::size_t atr_period{14};
    std::size_t ema_period{0};         // 0 = off; close vs EMA on the same timeframe
    double rsi_margin{0.0};            // 0 = off; RSI beyond 50 +- margin
    std::size_t rsi_period{14};
};

// Close outside the high/low range of the previous `lookback` bars
class RangeBreak final : public IBreakoutStrategy {
public:
    explicit RangeBreak(RangeBreakOptions opt = {}) : opt_(opt) {}
    std::string id() const override { return "range"; }
    std::size_t warmup_bars() const override;
    std::optional<BreakoutEvent> detect(const BreakoutInput& in) const override;

    const RangeBreakOptions& options() const { return opt_; }

private:
    RangeBreakOptions opt_;
};

// Previous completed daily bar: last `complete` bar of `daily`, or derived
// from the intraday candles grouped by UTC date when `daily` is empty.
std::optional<Candle> previous_day_bar(const Candles& intraday, const Candles& daily);

struct BreakoutSettings {
    std::size_t prior_day_scan_bars{12};
    RangeBreakOptions range{};
};

// Factory by id; nullptr for unknown ids
std::unique_ptr<IBreakoutStrategy> make_breakout_strategy(const std::string& id,
                                                          const BreakoutSettings& s = {});

} // namespace strategy
