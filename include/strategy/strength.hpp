#pragma once
#include <map>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "data/candle_source.hpp"

namespace strategy {

// Composite weights; price change in %, RSI deviation scaled to +-100,
// EMA slope x100, raw ATR
struct StrengthWeights {
    double price{0.4};
    double rsi{0.3};
    double ema{0.2};
    double atr{0.1};
};

struct StrengthConfig {
    StrengthWeights weights{};
    Timeframe tf{Timeframe::H4};
    std::size_t window{20};
    std::size_t rsi_period{14};
    std::size_t ema_period{10};
    std::size_t atr_period{14};
};

// Raw composite score of one pair's candles (attributed to the base currency)
double pair_score(const Candles& c, const StrengthConfig& cfg);

// Sorts by score descending and maps positions linearly onto [-7,+7].
// A computed 0 is pushed to +1 (upper half) or -1 (lower half).
// Fewer than 2 currencies -> empty map.
RankMap rank_scores(const std::map<std::string, double>& avg_scores);

// "EUR: +7" lines, strongest first
std::string format_strength_alert(const RankMap& ranks);

class StrengthEngine {
public:
    StrengthEngine(data::ICandleSource& source, StrengthConfig cfg = {})
        : source_(source), cfg_(cfg) {}

    // Per-currency average of pair scores (base +score, quote -score)
    std::map<std::string, double> average_scores(const std::vector<Pair>& pairs);

    // Empty map means "no opinion" for this tick
    RankMap compute_ranks(const std::vector<Pair>& pairs);

    const StrengthConfig& config() const { return cfg_; }

private:
    data::ICandleSource& source_;
    StrengthConfig cfg_;
};

} // namespace strategy
