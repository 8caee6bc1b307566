#include "indicators/swing.hpp"

namespace ind {

SwingPoints find_swing_points(const Candles& c){
    SwingPoints sp;
    if (c.size() < 3) return sp;
    for (std::size_t i = 1; i + 1 < c.size(); ++i) {
        if (c[i].high > c[i-1].high && c[i].high > c[i+1].high) sp.highs.push_back(c[i].high);
        if (c[i].low  < c[i-1].low  && c[i].low  < c[i+1].low)  sp.lows.push_back(c[i].low);
    }
    return sp;
}

} // namespace ind
