#include "strategy/breakout.hpp"
#include <algorithm>
#include <limits>
#include "core/session.hpp"
#include "indicators/atr.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/swing.hpp"

namespace strategy {

static BreakoutEvent make_event(const BreakoutInput& in, double level, Direction d, const std::string& tag){
    return BreakoutEvent{in.pair, level, d, in.timeframe, tag};
}

std::optional<BreakoutEvent> CurrentBarBreak::detect(const BreakoutInput& in) const {
    if (in.candles.empty()) return std::nullopt;
    const auto& b = in.candles.back();
    if (b.high <= b.low) return std::nullopt;
    if (b.close >= b.high) return make_event(in, b.high, Direction::Buy, id());
    if (b.close <= b.low)  return make_event(in, b.low, Direction::Sell, id());
    return std::nullopt;
}

std::optional<BreakoutEvent> PriorBarBreak::detect(const BreakoutInput& in) const {
    const auto& c = in.candles;
    if (c.size() < warmup_bars()) return std::nullopt;
    const auto& prev = c[c.size()-2];
    const double close = c.back().close;
    if (close > prev.high) return make_event(in, prev.high, Direction::Buy, id());
    if (close < prev.low)  return make_event(in, prev.low, Direction::Sell, id());
    return std::nullopt;
}

std::optional<Candle> previous_day_bar(const Candles& intraday, const Candles& daily){
    if (!daily.empty()) {
        for (auto it = daily.rbegin(); it != daily.rend(); ++it)
            if (it->complete) return *it;
        return std::nullopt;
    }
    if (intraday.empty()) return std::nullopt;

    const std::int64_t today = core::utc_day(intraday.back().time);
    std::optional<std::int64_t> prev_day;
    for (auto it = intraday.rbegin(); it != intraday.rend(); ++it) {
        const auto d = core::utc_day(it->time);
        if (d < today) { prev_day = d; break; }
    }
    if (!prev_day) return std::nullopt;

    std::optional<Candle> agg;
    for (const auto& b : intraday) {
        if (core::utc_day(b.time) != *prev_day) continue;
        if (!agg) { agg = b; continue; }
        agg->high  = std::max(agg->high, b.high);
        agg->low   = std::min(agg->low, b.low);
        agg->close = b.close;
    }
    return agg;
}

std::optional<BreakoutEvent> PriorDayBreak::detect(const BreakoutInput& in) const {
    const auto& c = in.candles;
    if (c.empty()) return std::nullopt;
    const auto pd = previous_day_bar(c, in.daily);
    if (!pd) return std::nullopt;

    const std::size_t n = std::min(scan_bars_, c.size());
    for (std::size_t k = 0; k < n; ++k) {
        const auto& b = c[c.size() - 1 - k];
        if (k > 0 && b.time <= pd->time) break;   // only bars after the reference day opened
        if (b.close > pd->high) return make_event(in, pd->high, Direction::Buy, id());
        if (b.close < pd->low)  return make_event(in, pd->low, Direction::Sell, id());
    }
    return std::nullopt;
}

std::size_t RangeBreak::warmup_bars() const {
    std::size_t w = opt_.lookback + 1;
    if (opt_.min_move_atr > 0.0) w = std::max(w, opt_.atr_period + 1);
    if (opt_.ema_period > 0)     w = std::max(w, opt_.ema_period);
    if (opt_.rsi_margin > 0.0)   w = std::max(w, opt_.rsi_period + 1);
    return w;
}

std::optional<BreakoutEvent> RangeBreak::detect(const BreakoutInput& in) const {
    const auto& c = in.candles;
    if (opt_.lookback == 0 || c.size() < warmup_bars()) return std::nullopt;

    const Candles window(c.end() - static_cast<std::ptrdiff_t>(opt_.lookback + 1), c.end() - 1);
    double hi = -std::numeric_limits<double>::infinity();
    double lo =  std::numeric_limits<double>::infinity();
    if (opt_.use_swings) {
        const auto sp = ind::find_swing_points(window);
        for (double h : sp.highs) hi = std::max(hi, h);
        for (double l : sp.lows)  lo = std::min(lo, l);
    }
    // no swing on a side (monotone window): fall back to the window extreme
    if (hi == -std::numeric_limits<double>::infinity())
        for (const auto& b : window) hi = std::max(hi, b.high);
    if (lo == std::numeric_limits<double>::infinity())
        for (const auto& b : window) lo = std::min(lo, b.low);

    const double close = c.back().close;
    std::optional<BreakoutEvent> ev;
    if (close > hi)      ev = make_event(in, hi, Direction::Buy, id());
    else if (close < lo) ev = make_event(in, lo, Direction::Sell, id());
    if (!ev) return std::nullopt;

    if (opt_.trend_ema_period > 0) {
        if (in.daily.size() < opt_.trend_ema_period) return std::nullopt;
        const double trend = ind::ema_last(closes_of(in.daily), opt_.trend_ema_period);
        if (ev->direction == Direction::Buy  && close <= trend) return std::nullopt;
        if (ev->direction == Direction::Sell && close >= trend) return std::nullopt;
    }

    if (opt_.min_move_atr > 0.0) {
        const double atr = ind::compute_atr(c, opt_.atr_period);
        if (atr <= 0.0) return std::nullopt;
        const double move = close - c[c.size()-2].close;
        const double need = opt_.min_move_atr * atr;
        if (ev->direction == Direction::Buy  && move < need)  return std::nullopt;
        if (ev->direction == Direction::Sell && -move < need) return std::nullopt;
    }

    if (opt_.ema_period > 0 || opt_.rsi_margin > 0.0) {
        const auto closes = closes_of(c);
        const bool buy = ev->direction == Direction::Buy;
        if (opt_.ema_period > 0) {
            const double ema = ind::ema_last(closes, opt_.ema_period);
            if (buy ? close <= ema : close >= ema) return std::nullopt;
        }
        if (opt_.rsi_margin > 0.0) {
            const double rsi = ind::last_rsi(closes, opt_.rsi_period, 50.0);
            if (buy ? rsi <= 50.0 + opt_.rsi_margin : rsi >= 50.0 - opt_.rsi_margin) return std::nullopt;
        }
    }
    return ev;
}

std::unique_ptr<IBreakoutStrategy> make_breakout_strategy(const std::string& id, const BreakoutSettings& s){
    if (id == "current_bar")    return std::make_unique<CurrentBarBreak>();
    if (id == "prior_bar")      return std::make_unique<PriorBarBreak>();
    if (id == "prior_day")      return std::make_unique<PriorDayBreak>(1);
    if (id == "prior_day_scan") return std::make_unique<PriorDayBreak>(std::max<std::size_t>(2, s.prior_day_scan_bars));
    if (id == "range")          return std::make_unique<RangeBreak>(s.range);
    return nullptr;
}

} // namespace strategy
