#pragma once
#include <cmath>
#include <optional>
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace exec {

struct RiskLevels {
    double entry{0.0};
    double stop_loss{0.0};
    std::vector<double> take_profits;
    double reward_risk{0.0};
};

// ATR-scaled stop and targets with a minimum reward:risk gate on TP1
class RiskModel {
public:
    RiskModel(double sl_atr = 1.0, std::vector<double> tp_atr = {2.0, 4.0, 6.0}, double min_rrr = 2.0)
        : sl_atr_(sl_atr), tp_atr_(std::move(tp_atr)), min_rrr_(min_rrr) {}

    double min_rrr() const { return min_rrr_; }

    // nullopt when atr <= 0, no targets, or TP1 reward:risk < min_rrr
    std::optional<RiskLevels> levels(Direction d, double entry, double atr) const {
        if (atr <= 0.0 || sl_atr_ <= 0.0 || tp_atr_.empty()) return std::nullopt;
        const double sign = d == Direction::Buy ? 1.0 : -1.0;
        RiskLevels r;
        r.entry = entry;
        r.stop_loss = entry - sign * sl_atr_ * atr;
        for (double m : tp_atr_) r.take_profits.push_back(entry + sign * m * atr);
        const double risk = std::abs(entry - r.stop_loss);
        r.reward_risk = std::abs(r.take_profits.front() - entry) / risk;
        // tolerance for floating error at exactly min_rrr
        if (r.reward_risk + 1e-9 < min_rrr_) return std::nullopt;
        return r;
    }

private:
    double sl_atr_{1.0};
    std::vector<double> tp_atr_;
    double min_rrr_{2.0};
};

} // namespace exec
