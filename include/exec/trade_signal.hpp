#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace exec {

// Emitted trade notification. Immutable once built.
struct TradeSignal {
    Pair pair;
    Direction direction{Direction::Buy};
    double entry{0.0};
    double stop_loss{0.0};
    std::vector<double> take_profits;   // ordered, nearest first
    double atr{0.0};
    int strength_diff{0};
    int base_rank{0};
    int quote_rank{0};
    double rsi_decision{50.0};          // decision timeframe (H1)
    double rsi_entry{50.0};             // entry timeframe (M15)
    std::string breakout_tag;
    double breakout_level{0.0};
    std::string category;               // cooldown category (session name)
    std::int64_t time{0};

    double reward_risk() const;
};

// Multi-line notification text
std::string format_signal(const TradeSignal& s, double min_rrr);

void to_json(nlohmann::json& j, const TradeSignal& s);
void from_json(const nlohmann::json& j, TradeSignal& s);

} // namespace exec
