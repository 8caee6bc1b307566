#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

template <class T>
static void read(const json& j, const char* key, T& out){
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

static Timeframe read_tf(const json& j, const char* key, Timeframe def){
    if (!j.contains(key)) return def;
    const auto s = j[key].get<std::string>();
    auto tf = parse_timeframe(s);
    if (!tf) throw std::runtime_error(std::string("invalid timeframe for '") + key + "': " + s);
    return *tf;
}

static void read_range(const json& j, strategy::RangeBreakOptions& r){
    read(j, "lookback", r.lookback);
    read(j, "use_swings", r.use_swings);
    read(j, "trend_ema_period", r.trend_ema_period);
    read(j, "min_move_atr", r.min_move_atr);
    read(j, "atr_period", r.atr_period);
    read(j, "ema_period", r.ema_period);
    read(j, "rsi_margin", r.rsi_margin);
    read(j, "rsi_period", r.rsi_period);
}

static void read_breakout(const json& j, strategy::BreakoutSettings& b){
    read(j, "prior_day_scan_bars", b.prior_day_scan_bars);
    if (j.contains("range")) read_range(j["range"], b.range);
}

static void read_policy(const json& j, strategy::StrengthPolicy& p){
    if (j.contains("rule")) {
        const auto s = j["rule"].get<std::string>();
        auto r = strategy::parse_strength_rule(s);
        if (!r) throw std::runtime_error("unknown strength rule: " + s);
        p.rule = *r;
    }
    read(j, "min_abs_rank", p.min_abs_rank);
    read(j, "min_differential", p.min_differential);
    if (j.contains("differentials")) p.differentials = j["differentials"].get<std::set<int>>();
    if (j.contains("extremes")) {
        p.extremes.clear();
        for (const auto& e : j["extremes"]) {
            if (!e.is_array() || e.size() != 2) throw std::runtime_error("extremes entries must be [strong, weak]");
            p.extremes.insert({e[0].get<int>(), e[1].get<int>()});
        }
    }
}

static void read_signal(const json& j, strategy::SignalConfig& s){
    s.decision_tf = read_tf(j, "decision_tf", s.decision_tf);
    s.entry_tf = read_tf(j, "entry_tf", s.entry_tf);
    read(j, "decision_bars", s.decision_bars);
    read(j, "entry_bars", s.entry_bars);
    read(j, "daily_bars", s.daily_bars);
    read(j, "breakouts", s.breakouts);
    if (j.contains("breakout")) read_breakout(j["breakout"], s.breakout);
    if (j.contains("policy")) read_policy(j["policy"], s.policy);
    read(j, "rsi_period", s.rsi_period);
    read(j, "atr_period", s.atr_period);
    if (j.contains("timing")) {
        const auto t = j["timing"].get<std::string>();
        auto et = strategy::parse_entry_timing(t);
        if (!et) throw std::runtime_error("unknown entry timing: " + t);
        s.timing = *et;
    }
    read(j, "momentum_buy_min", s.momentum_buy_min);
    read(j, "momentum_sell_max", s.momentum_sell_max);
    read(j, "arm_low", s.arm_low);
    read(j, "arm_high", s.arm_high);
    read(j, "retest_bars", s.retest_bars);
    read(j, "retest_atr_tol", s.retest_atr_tol);
    read(j, "sl_atr", s.sl_atr);
    read(j, "tp_atr", s.tp_atr);
    read(j, "min_rrr", s.min_rrr);
    read(j, "cooldown_sec", s.cooldown_sec);
    read(j, "category", s.category);
    if (s.tp_atr.empty()) throw std::runtime_error("signal.tp_atr must list at least one target");
}

static void read_strength(const json& j, strategy::StrengthConfig& s){
    s.tf = read_tf(j, "tf", s.tf);
    read(j, "window", s.window);
    read(j, "rsi_period", s.rsi_period);
    read(j, "ema_period", s.ema_period);
    read(j, "atr_period", s.atr_period);
    if (j.contains("weights")) {
        const auto& w = j["weights"];
        read(w, "price", s.weights.price);
        read(w, "rsi", s.weights.rsi);
        read(w, "ema", s.weights.ema);
        read(w, "atr", s.weights.atr);
    }
}

AppConfig config_from_json(const json& j){
    AppConfig c;
    if (!j.is_object()) throw std::runtime_error("config root must be an object");
    try {
        read(j, "pairs", c.pairs);
        if (j.contains("oanda")) {
            const auto& o = j["oanda"];
            read(o, "token", c.oanda.token);
            read(o, "account", c.oanda.account);
            read(o, "api", c.oanda.api);
            read(o, "timeout_ms", c.oanda.timeout_ms);
            read(o, "retry_attempts", c.retry_attempts);
            read(o, "retry_base_ms", c.retry_base_ms);
        }
        if (j.contains("telegram")) {
            const auto& t = j["telegram"];
            read(t, "token", c.telegram.token);
            read(t, "chat_id", c.telegram.chat_id);
            read(t, "timeout_ms", c.telegram.timeout_ms);
        }
        read(j, "dry_run", c.dry_run);
        if (j.contains("strength")) read_strength(j["strength"], c.strength);
        if (j.contains("signal")) read_signal(j["signal"], c.signal);
        read(j, "max_signals_per_tick", c.max_signals_per_tick);
        if (j.contains("group_breakout")) {
            const auto& g = j["group_breakout"];
            read(g, "enabled", c.group.enabled);
            read(g, "min_pairs", c.group.min_pairs);
            c.group.tf = read_tf(g, "tf", c.group.tf);
            read(g, "bars", c.group.bars);
            read(g, "strategy", c.group.strategy_id);
            read_breakout(g, c.group.settings);
        }
        if (j.contains("cooldowns")) {
            const auto& k = j["cooldowns"];
            read(k, "strength_alert_sec", c.cooldowns.strength_alert_sec);
            read(k, "group_breakout_sec", c.cooldowns.group_breakout_sec);
            read(k, "heartbeat_sec", c.cooldowns.heartbeat_sec);
            read(k, "news_sec", c.cooldowns.news_sec);
        }
        if (j.contains("state")) {
            read(j["state"], "cooldown_file", c.state.cooldown_file);
            read(j["state"], "active_trades_file", c.state.active_trades_file);
        }
        read(j, "heartbeat", c.heartbeat);
        read(j, "loop_interval_sec", c.loop_interval_sec);
        read(j, "log_level", c.log_level);
        read(j, "csv_dir", c.csv_dir);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid config value: ") + e.what());
    }
    if (!strategy::make_breakout_strategy(c.group.strategy_id, c.group.settings))
        throw std::runtime_error("unknown group breakout strategy: " + c.group.strategy_id);
    return c;
}

static std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string x;
    while (std::getline(ss, x, ',')) {
        const auto b = x.find_first_not_of(" \t");
        const auto e = x.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(x.substr(b, e - b + 1));
    }
    return out;
}

void apply_env_overrides(AppConfig& cfg){
    auto env = [](const char* k) -> const char* {
        const char* v = std::getenv(k);
        return (v && *v) ? v : nullptr;
    };
    if (auto v = env("OANDA_TOKEN"))      cfg.oanda.token = v;
    if (auto v = env("OANDA_ACCOUNT"))    cfg.oanda.account = v;
    if (auto v = env("OANDA_API"))        cfg.oanda.api = v;
    if (auto v = env("TELEGRAM_TOKEN"))   cfg.telegram.token = v;
    if (auto v = env("TELEGRAM_CHAT_ID")) cfg.telegram.chat_id = v;
    if (auto v = env("PAIRS"))            cfg.pairs = split_csv(v);
}

AppConfig load_config(const std::string& path){
    json j = json::object();
    if (!path.empty()) {
        std::ifstream f(path);
        if (!f.good()) throw std::runtime_error("cannot open config file: " + path);
        try {
            j = json::parse(f);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("config " + path + ": " + e.what());
        }
    }
    AppConfig c = config_from_json(j);
    apply_env_overrides(c);
    if (c.signal.cooldown_sec <= 0) spdlog::warn("signal.cooldown_sec <= 0: duplicate trade alerts possible");
    return c;
}

} // namespace core
