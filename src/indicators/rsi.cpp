#include "indicators/rsi.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

static double rsi_of(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) return 100.0;
    const double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

std::vector<double> compute_rsi(const std::vector<double>& c, std::size_t p) {
    std::vector<double> out;
    if (p == 0 || c.size() < p + 1) return out;
    out.reserve(c.size() - p);

    double g = 0.0, l = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        const double d = c[i] - c[i-1];
        if (d >= 0) g += d; else l -= d;
    }
    double avg_g = g / p, avg_l = l / p;
    out.push_back(rsi_of(avg_g, avg_l));

    // Wilder smoothing
    for (std::size_t i = p + 1; i < c.size(); ++i) {
        const double d = c[i] - c[i-1];
        const double gain = d > 0 ? d : 0.0;
        const double loss = d < 0 ? -d : 0.0;
        avg_g = (avg_g * (p - 1) + gain) / p;
        avg_l = (avg_l * (p - 1) + loss) / p;
        out.push_back(rsi_of(avg_g, avg_l));
    }
    return out;
}

double last_rsi(const std::vector<double>& closes, std::size_t period, double fallback) {
    const auto v = compute_rsi(closes, period);
    return v.empty() ? fallback : v.back();
}

} // namespace ind
