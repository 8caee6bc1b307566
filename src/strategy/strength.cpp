#include "strategy/strength.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "indicators/atr.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"

namespace strategy {

double pair_score(const Candles& c, const StrengthConfig& cfg){
    if (c.size() < 2) return 0.0;
    const auto closes = closes_of(c);
    const double prev = closes[closes.size()-2];
    const double price_change = prev != 0.0 ? (closes.back() - prev) / prev * 100.0 : 0.0;
    const double rsi   = ind::last_rsi(closes, cfg.rsi_period, 50.0);
    const double slope = ind::ema_slope(closes, cfg.ema_period);
    const double atr   = ind::compute_atr(c, cfg.atr_period);

    const auto& w = cfg.weights;
    const double norm_rsi = (rsi - 50.0) / 50.0;
    return w.price * price_change + w.rsi * norm_rsi * 100.0 + w.ema * slope * 100.0 + w.atr * atr;
}

RankMap rank_scores(const std::map<std::string, double>& avg){
    RankMap out;
    const std::size_t n = avg.size();
    if (n < 2) return out;

    std::vector<std::pair<std::string, double>> sorted(avg.begin(), avg.end());
    // stable on the symbol order of the map for equal scores
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b){ return a.second > b.second; });

    constexpr int max_rank = 7, min_rank = -7;
    for (std::size_t idx = 0; idx < n; ++idx) {
        const double pos = static_cast<double>(idx) * (max_rank - min_rank) / static_cast<double>(n - 1);
        int rank = static_cast<int>(std::lround(max_rank - pos));
        if (rank == 0) rank = (idx < n / 2.0) ? 1 : -1;
        out[sorted[idx].first] = rank;
    }
    return out;
}

std::string format_strength_alert(const RankMap& ranks){
    std::vector<std::pair<std::string, int>> v(ranks.begin(), ranks.end());
    std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){ return a.second > b.second; });
    std::string msg = "Currency Strength Alert\n";
    msg += "Currency Strength Rankings (+7 strongest -> -7 weakest):\n";
    for (const auto& [cur, rank] : v) msg += fmt::format("{}: {:+d}\n", cur, rank);
    return msg;
}

std::map<std::string, double> StrengthEngine::average_scores(const std::vector<Pair>& pairs){
    std::map<std::string, std::vector<double>> scores;
    for (const auto& p : pairs) {
        if (!is_tracked_currency(p.base) || !is_tracked_currency(p.quote)) {
            spdlog::warn("Pair {} references an untracked currency, skipped", p.name());
            continue;
        }
        const auto candles = source_.get(p, cfg_.tf, cfg_.window);
        if (candles.size() < 2) {
            spdlog::debug("No {} candles for {}, excluded from strength", to_string(cfg_.tf), p.name());
            continue;
        }
        const double s = pair_score(candles, cfg_);
        scores[p.base].push_back(s);
        scores[p.quote].push_back(-s);
    }

    std::map<std::string, double> avg;
    for (const auto& [cur, vals] : scores) {
        if (vals.empty()) continue;
        double sum = 0.0; for (double v : vals) sum += v;
        avg[cur] = sum / static_cast<double>(vals.size());
    }
    return avg;
}

RankMap StrengthEngine::compute_ranks(const std::vector<Pair>& pairs){
    const auto avg = average_scores(pairs);
    auto ranks = rank_scores(avg);
    if (ranks.empty()) spdlog::info("Strength: fewer than 2 currencies with data, no ranking this tick");
    return ranks;
}

} // namespace strategy
