#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

double compute_atr(const Candles& c, std::size_t p){
    if (p == 0 || c.size() < p + 1) return 0.0;
    double sum = 0.0;
    for (std::size_t i = c.size() - p; i < c.size(); ++i) {
        const double prev_close = c[i-1].close;
        const double tr = std::max({c[i].high - c[i].low,
                                    std::abs(c[i].high - prev_close),
                                    std::abs(c[i].low - prev_close)});
        sum += tr;
    }
    return std::max(0.0, sum / static_cast<double>(p));
}

} // namespace ind
