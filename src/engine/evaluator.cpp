#include "engine/evaluator.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "strategy/decision.hpp"

namespace engine {

namespace {
const char* kStrengthCategory = "strength_alert";
const char* kGroupCategory    = "breakout_group";
const char* kHeartbeatCategory = "heartbeat";
const char* kNewsCategory     = "news";
}

Evaluator::Evaluator(const core::AppConfig& cfg,
                     data::ICandleSource& source,
                     telemetry::INotifier& notifier,
                     telemetry::IEventSource* events,
                     core::Clock clock)
    : cfg_(cfg), source_(source), notifier_(notifier), events_(events), clock_(std::move(clock)),
      pairs_(parse_pairs(cfg.pairs)),
      cooldowns_(cfg.state.cooldown_file),
      trades_(cfg.state.active_trades_file),
      strength_(source, cfg.strength) {
    signals_ = std::make_unique<strategy::SignalBuilder>(
        strategy::SignalContext{source_, cooldowns_, trades_, notifier_, clock_}, cfg_.signal);
    if (cfg_.group.enabled) {
        group_strategy_ = strategy::make_breakout_strategy(cfg_.group.strategy_id, cfg_.group.settings);
        if (!group_strategy_) spdlog::warn("Group breakout strategy '{}' unknown, group alert disabled", cfg_.group.strategy_id);
    }
    const auto chain = fmt::format("{}", fmt::join(cfg_.signal.breakouts, ", "));
    spdlog::info("Evaluator ready: {} pairs, breakout chain [{}]", pairs_.size(), chain);
}

void Evaluator::restore(){
    if (!cooldowns_.load()) spdlog::warn("Cooldown state not restored, duplicates possible this session");
    if (!trades_.load())    spdlog::warn("Active trades not restored");
}

void Evaluator::flush(){
    if (!cooldowns_.flush()) spdlog::error("Cooldown state not persisted");
    if (!trades_.save())     spdlog::error("Active trades not persisted");
}

std::size_t Evaluator::rollover_sessions(std::int64_t now){
    static const std::set<std::string> sessions{
        core::to_string(core::Session::Asian),
        core::to_string(core::Session::London),
        core::to_string(core::Session::NewYork)};
    const auto n = cooldowns_.prune_stale(sessions, core::to_string(core::session_at(now)));
    if (n) spdlog::info("Session rollover: pruned {} stale cooldown keys", n);
    return n;
}

bool Evaluator::strength_alert(const RankMap& ranks, std::int64_t now){
    if (ranks.empty()) return false;
    const state::CooldownKey key{"ALL", kStrengthCategory};
    if (!cooldowns_.try_acquire(key, now, cfg_.cooldowns.strength_alert_sec)) {
        const auto last = cooldowns_.last_fired(key).value_or(now);
        spdlog::info("Skipping currency strength alert. Cooldown remaining: {:.1f} minutes",
                     (cfg_.cooldowns.strength_alert_sec - (now - last)) / 60.0);
        return false;
    }
    if (!notifier_.send(strategy::format_strength_alert(ranks))) {
        spdlog::warn("Currency strength alert not delivered");
        return false;
    }
    spdlog::info("Sent full currency strength alert");
    return true;
}

std::vector<exec::TradeSignal> Evaluator::trade_signals(const RankMap& ranks){
    std::vector<exec::TradeSignal> out;
    if (ranks.empty()) return out;
    const auto candidates = strategy::rank_candidates(pairs_, ranks);
    const std::size_t n = std::min(cfg_.max_signals_per_tick, candidates.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto& c = candidates[i];
        try {
            if (auto s = signals_->build(c.pair, ranks)) out.push_back(*s);
        } catch (const std::exception& e) {
            spdlog::error("Signal build for {} failed: {}", c.pair.name(), e.what());
        }
    }
    return out;
}

std::vector<std::string> Evaluator::group_breakout_alert(std::int64_t now){
    std::vector<std::string> hits;
    if (!group_strategy_) return hits;

    const Candles no_daily;
    std::vector<std::pair<std::string, Direction>> found;
    for (const auto& p : pairs_) {
        const auto candles = source_.get(p, cfg_.group.tf, cfg_.group.bars);
        if (candles.empty()) continue;
        const auto ev = group_strategy_->detect({p, cfg_.group.tf, candles, no_daily});
        if (!ev) continue;
        if (!cooldowns_.is_allowed({p.name(), kGroupCategory}, now, cfg_.cooldowns.group_breakout_sec)) {
            spdlog::info("Breakout detected for {} but cooldown active", p.name());
            continue;
        }
        spdlog::info("Breakout detected for {} (will alert)", p.name());
        found.emplace_back(p.name(), ev->direction);
    }
    if (found.size() < cfg_.group.min_pairs) {
        spdlog::info("Group breakout: {} pairs, need {}", found.size(), cfg_.group.min_pairs);
        return hits;
    }

    std::sort(found.begin(), found.end());
    std::string msg = fmt::format("Breakout Alert! ({} pairs) - {}\n", found.size(), core::format_utc(now));
    for (const auto& [name, dir] : found) msg += fmt::format("\n{} {}", name, to_string(dir));
    if (!notifier_.send(msg)) {
        spdlog::warn("Failed to send breakout alert");
        return hits;
    }
    for (const auto& f : found) {
        cooldowns_.record({f.first, kGroupCategory}, now);
        hits.push_back(f.first);
    }
    spdlog::info("Sent breakout alert for {} pairs", hits.size());
    return hits;
}

bool Evaluator::heartbeat(std::int64_t now){
    if (!cfg_.heartbeat) return false;
    const state::CooldownKey key{"bot", kHeartbeatCategory};
    if (!cooldowns_.is_allowed(key, now, cfg_.cooldowns.heartbeat_sec)) return false;
    if (!notifier_.send("Bot Heartbeat: fxpulse is running")) return false;
    cooldowns_.record(key, now);
    spdlog::info("Sent Bot Heartbeat alert");
    return true;
}

std::size_t Evaluator::news_alerts(std::int64_t now){
    if (!events_ || trades_.size() == 0) return 0;
    const auto open = trades_.snapshot();
    const auto relevant = news_.relevant(events_->events(), trades_.currencies(), now);
    std::size_t sent = 0;
    for (const auto& ev : relevant) {
        const state::CooldownKey key{ev.id, kNewsCategory};
        if (!cooldowns_.is_allowed(key, now, cfg_.cooldowns.news_sec)) continue;
        std::string pairs;
        for (const auto& t : open) {
            if (!t.pair.contains(ev.currency)) continue;
            if (pairs.find(t.pair.name()) != std::string::npos) continue;
            if (!pairs.empty()) pairs += ", ";
            pairs += t.pair.name();
        }
        if (!notifier_.send(telemetry::NewsFilter::format(ev, pairs))) {
            spdlog::warn("[News] Alert for {} - {} not delivered", ev.currency, ev.title);
            continue;
        }
        cooldowns_.record(key, now);
        spdlog::info("[News] Alert sent for {} - {}", ev.currency, ev.title);
        ++sent;
    }
    return sent;
}

TickReport Evaluator::tick(){
    TickReport r;
    const std::int64_t now = clock_();

    try { r.pruned_keys = rollover_sessions(now); }
    catch (const std::exception& e) { spdlog::error("Session rollover failed: {}", e.what()); }

    try {
        r.ranks = strength_.compute_ranks(pairs_);
        r.strength_alert_sent = strength_alert(r.ranks, now);
    } catch (const std::exception& e) {
        spdlog::error("Error in currency strength stage: {}", e.what());
    }

    r.signals = trade_signals(r.ranks);

    if (cfg_.group.enabled) {
        try { r.group_breakouts = group_breakout_alert(now); }
        catch (const std::exception& e) { spdlog::error("Error in group breakout stage: {}", e.what()); }
    }

    try { r.heartbeat_sent = heartbeat(now); }
    catch (const std::exception& e) { spdlog::error("Heartbeat failed: {}", e.what()); }

    try { r.news_alerts = news_alerts(now); }
    catch (const std::exception& e) { spdlog::error("News stage failed: {}", e.what()); }

    flush();
    return r;
}

} // namespace engine
