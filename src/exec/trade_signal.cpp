#include "exec/trade_signal.hpp"
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include "filters.hpp"

using json = nlohmann::json;

namespace exec {

double TradeSignal::reward_risk() const {
    const double risk = std::abs(entry - stop_loss);
    if (risk <= 0.0 || take_profits.empty()) return 0.0;
    return std::abs(take_profits.front() - entry) / risk;
}

std::string format_signal(const TradeSignal& s, double min_rrr){
    const int dp = price_decimals(s.pair);
    const double pip = pip_size(s.pair);
    const int strong = s.direction == Direction::Buy ? s.base_rank : s.quote_rank;
    const int weak   = s.direction == Direction::Buy ? s.quote_rank : s.base_rank;

    std::string tps;
    for (std::size_t i = 0; i < s.take_profits.size(); ++i) {
        if (i) tps += ", ";
        tps += fmt::format("TP{}:{:.{}f}", i + 1, round_step(s.take_profits[i], pip / 10.0), dp);
    }

    return fmt::format(
        "{} {} [{}]\n"
        "Strength Diff: {}\n"
        "Strengths: {:+d}, {:+d}\n"
        "H1 RSI: {:.1f} | M15 RSI: {:.1f}\n"
        "Breakout: {} @ {:.{}f}\n"
        "Entry: {:.{}f} | SL: {:.{}f} | ATR: {:.{}f} ({:.1f} pips)\n"
        "TPs: {} | Min RRR:1:{:.1f}",
        to_string(s.direction), s.pair.name(), s.category,
        s.strength_diff,
        strong, weak,
        s.rsi_decision, s.rsi_entry,
        s.breakout_tag, s.breakout_level, dp,
        s.entry, dp, s.stop_loss, dp, s.atr, dp, s.atr / pip,
        tps, min_rrr);
}

void to_json(json& j, const TradeSignal& s){
    j = json{{"pair", s.pair.name()},
             {"direction", s.direction == Direction::Buy ? "buy" : "sell"},
             {"entry", s.entry},
             {"stop_loss", s.stop_loss},
             {"take_profit_levels", s.take_profits},
             {"atr", s.atr},
             {"strength_diff", s.strength_diff},
             {"base_rank", s.base_rank},
             {"quote_rank", s.quote_rank},
             {"h1_rsi", s.rsi_decision},
             {"m15_rsi", s.rsi_entry},
             {"breakout", s.breakout_tag},
             {"breakout_level", s.breakout_level},
             {"category", s.category},
             {"time", s.time}};
}

void from_json(const json& j, TradeSignal& s){
    const auto id = j.at("pair").get<std::string>();
    const auto p = parse_pair(id);
    if (!p) throw std::invalid_argument("bad pair in trade record: " + id);
    s.pair = *p;
    s.direction = j.value("direction", std::string{"buy"}) == "sell" ? Direction::Sell : Direction::Buy;
    s.entry = j.at("entry").get<double>();
    s.stop_loss = j.at("stop_loss").get<double>();
    s.take_profits = j.value("take_profit_levels", std::vector<double>{});
    s.atr = j.value("atr", 0.0);
    s.strength_diff = j.value("strength_diff", 0);
    s.base_rank = j.value("base_rank", 0);
    s.quote_rank = j.value("quote_rank", 0);
    s.rsi_decision = j.value("h1_rsi", 50.0);
    s.rsi_entry = j.value("m15_rsi", 50.0);
    s.breakout_tag = j.value("breakout", std::string{});
    s.breakout_level = j.value("breakout_level", 0.0);
    s.category = j.value("category", std::string{});
    s.time = j.value("time", std::int64_t{0});
}

} // namespace exec
