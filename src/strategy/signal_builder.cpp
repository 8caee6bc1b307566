#include "strategy/signal_builder.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include "indicators/atr.hpp"
#include "indicators/rsi.hpp"

namespace strategy {

std::optional<EntryTiming> parse_entry_timing(const std::string& s){
    if (s == "none")           return EntryTiming::None;
    if (s == "momentum")       return EntryTiming::Momentum;
    if (s == "pullback_cross") return EntryTiming::PullbackCross;
    return std::nullopt;
}

bool retest_confirmed(const Candles& c, double level, Direction d, double tol, std::size_t lookback){
    if (c.empty() || lookback == 0 || tol < 0.0) return false;
    const bool buy = d == Direction::Buy;
    const double last = c.back().close;
    if (buy ? last <= level : last >= level) return false;

    const std::size_t n = std::min(lookback, c.size());
    for (std::size_t k = 0; k < n; ++k) {
        const auto& b = c[c.size() - 1 - k];
        const double touch = buy ? b.low : b.high;
        if (std::abs(touch - level) > tol) continue;
        if (buy ? b.close > level : b.close < level) return true;
    }
    return false;
}

SignalBuilder::SignalBuilder(SignalContext ctx, SignalConfig cfg)
    : ctx_(std::move(ctx)), cfg_(std::move(cfg)), risk_(cfg_.sl_atr, cfg_.tp_atr, cfg_.min_rrr) {
    for (const auto& id : cfg_.breakouts) {
        auto s = make_breakout_strategy(id, cfg_.breakout);
        if (!s) { spdlog::warn("Unknown breakout strategy '{}' ignored", id); continue; }
        strategies_.push_back(std::move(s));
    }
    if (strategies_.empty()) spdlog::warn("No breakout strategies configured, no trade signal can fire");
}

std::string SignalBuilder::category_at(std::int64_t now) const {
    if (!cfg_.category.empty()) return cfg_.category;
    return core::to_string(core::session_at(now));
}

void SignalBuilder::observe_pullback(const std::string& pair, double rsi){
    auto& st = pullback_[pair];
    if (rsi <= cfg_.arm_low)  st.armed_buy = true;
    if (rsi >= cfg_.arm_high) st.armed_sell = true;
    const auto prev = st.prev_rsi;
    st.cross_buy  = prev && st.armed_buy  && *prev < cfg_.rsi_mid && rsi >= cfg_.rsi_mid;
    st.cross_sell = prev && st.armed_sell && *prev > cfg_.rsi_mid && rsi <= cfg_.rsi_mid;
    st.prev_rsi = rsi;
}

bool SignalBuilder::entry_timing_ok(const std::string& pair, Direction d, double rsi) const {
    switch (cfg_.timing) {
        case EntryTiming::None:
            return true;
        case EntryTiming::Momentum:
            return d == Direction::Buy ? rsi > cfg_.momentum_buy_min : rsi < cfg_.momentum_sell_max;
        case EntryTiming::PullbackCross: {
            const auto it = pullback_.find(pair);
            if (it == pullback_.end()) return false;
            return d == Direction::Buy ? it->second.cross_buy : it->second.cross_sell;
        }
    }
    return false;
}

void SignalBuilder::disarm(const std::string& pair, Direction d){
    const auto it = pullback_.find(pair);
    if (it == pullback_.end()) return;
    if (d == Direction::Buy) it->second.armed_buy = false;
    else                     it->second.armed_sell = false;
}

std::optional<exec::TradeSignal> SignalBuilder::build(const Pair& pair, const RankMap& ranks){
    const std::int64_t now = ctx_.clock();
    const std::string category = category_at(now);
    const state::CooldownKey key{pair.name(), category};
    const std::string name = pair.name();

    // 1. cooldown
    if (!ctx_.cooldowns.is_allowed(key, now, cfg_.cooldown_sec)) {
        spdlog::debug("{}: cooldown active for [{}]", name, category);
        return std::nullopt;
    }

    // 2. entry RSI
    const auto entry_candles = ctx_.source.get(pair, cfg_.entry_tf, cfg_.entry_bars);
    if (entry_candles.empty()) {
        spdlog::debug("{}: no {} candles", name, to_string(cfg_.entry_tf));
        return std::nullopt;
    }
    const double rsi_entry = ind::last_rsi(closes_of(entry_candles), cfg_.rsi_period, -1.0);
    if (rsi_entry < 0.0) {
        spdlog::debug("{}: not enough {} bars for RSI", name, to_string(cfg_.entry_tf));
        return std::nullopt;
    }
    if (cfg_.timing == EntryTiming::PullbackCross) observe_pullback(name, rsi_entry);

    // 3. breakout
    const auto candles = ctx_.source.get(pair, cfg_.decision_tf, cfg_.decision_bars);
    if (candles.size() < 2) {
        spdlog::debug("{}: no {} candles", name, to_string(cfg_.decision_tf));
        return std::nullopt;
    }
    std::size_t daily_count = cfg_.daily_bars;
    if (cfg_.breakout.range.trend_ema_period > 0)
        daily_count = std::max(daily_count, cfg_.breakout.range.trend_ema_period + 1);
    const auto daily = ctx_.source.get(pair, Timeframe::D1, daily_count);

    std::vector<BreakoutEvent> events;
    const BreakoutInput in{pair, cfg_.decision_tf, candles, daily};
    for (const auto& s : strategies_) {
        if (auto ev = s->detect(in)) events.push_back(*ev);
    }
    if (events.empty()) {
        spdlog::debug("{}: no breakout", name);
        return std::nullopt;
    }

    // 4. direction & strength
    const auto b = ranks.find(pair.base), q = ranks.find(pair.quote);
    if (b == ranks.end() || q == ranks.end()) {
        spdlog::debug("{}: currency not ranked", name);
        return std::nullopt;
    }
    const auto dir = direction_from_ranks(b->second, q->second);
    if (!dir) {
        spdlog::debug("{}: equal ranks", name);
        return std::nullopt;
    }
    const int strong = *dir == Direction::Buy ? b->second : q->second;
    const int weak   = *dir == Direction::Buy ? q->second : b->second;
    if (!cfg_.policy.accepts(strong, weak)) {
        spdlog::debug("{}: strength {:+d}/{:+d} rejected by policy", name, strong, weak);
        return std::nullopt;
    }
    const auto ev = std::find_if(events.begin(), events.end(),
                                 [&](const BreakoutEvent& e){ return e.direction == *dir; });
    if (ev == events.end()) {
        spdlog::debug("{}: breakout against strength direction", name);
        return std::nullopt;
    }

    // 5. momentum
    const double rsi_decision = ind::last_rsi(closes_of(candles), cfg_.rsi_period, -1.0);
    if (rsi_decision < 0.0) {
        spdlog::debug("{}: not enough {} bars for RSI", name, to_string(cfg_.decision_tf));
        return std::nullopt;
    }
    if (*dir == Direction::Buy ? rsi_decision < cfg_.rsi_mid : rsi_decision > cfg_.rsi_mid) {
        spdlog::debug("{}: {} RSI {:.1f} disagrees with {}", name, to_string(cfg_.decision_tf),
                      rsi_decision, to_string(*dir));
        return std::nullopt;
    }

    if (!entry_timing_ok(name, *dir, rsi_entry)) {
        spdlog::debug("{}: {} RSI {:.1f} entry timing not met", name, to_string(cfg_.entry_tf), rsi_entry);
        return std::nullopt;
    }

    const double atr = ind::compute_atr(candles, cfg_.atr_period);
    if (atr <= 0.0) {
        spdlog::debug("{}: ATR unavailable", name);
        return std::nullopt;
    }

    // 6. retest
    if (cfg_.retest_bars > 0 &&
        !retest_confirmed(entry_candles, ev->level, *dir, cfg_.retest_atr_tol * atr, cfg_.retest_bars)) {
        spdlog::debug("{}: no retest of {:.5f}", name, ev->level);
        return std::nullopt;
    }

    // 7. risk
    const auto lv = risk_.levels(*dir, entry_candles.back().close, atr);
    if (!lv) {
        spdlog::debug("{}: reward:risk below {:.1f}", name, risk_.min_rrr());
        return std::nullopt;
    }

    // 8. emit
    exec::TradeSignal sig;
    sig.pair = pair;
    sig.direction = *dir;
    sig.entry = lv->entry;
    sig.stop_loss = lv->stop_loss;
    sig.take_profits = lv->take_profits;
    sig.atr = atr;
    sig.strength_diff = strong - weak;
    sig.base_rank = b->second;
    sig.quote_rank = q->second;
    sig.rsi_decision = rsi_decision;
    sig.rsi_entry = rsi_entry;
    sig.breakout_tag = ev->tag;
    sig.breakout_level = ev->level;
    sig.category = category;
    sig.time = now;

    if (!ctx_.cooldowns.try_acquire(key, now, cfg_.cooldown_sec)) {
        spdlog::debug("{}: cooldown taken concurrently", name);
        return std::nullopt;
    }
    disarm(name, *dir);
    ctx_.trades.add(sig);
    if (!ctx_.notifier.send(exec::format_signal(sig, risk_.min_rrr())))
        spdlog::warn("{}: trade notification not delivered", name);

    spdlog::info("Trade triggered: {} | Direction: {} | Strength Diff: {} | {} RSI: {:.1f} | {} RSI: {:.1f} | {}",
                 name, to_string(*dir), sig.strength_diff, to_string(cfg_.decision_tf), rsi_decision,
                 to_string(cfg_.entry_tf), rsi_entry, ev->tag);
    return sig;
}

} // namespace strategy
