#pragma once
#include <cmath>
#include <string>
#include "core/types.hpp"

namespace exec {

inline double round_step(double v, double step){
    if (step<=0) return v;
    return std::round(v/step)*step;
}

// JPY-quoted pairs trade in 0.01 pips, the rest in 0.0001
inline double pip_size(const Pair& p){
    return p.quote == "JPY" ? 0.01 : 0.0001;
}

// Display precision: one decimal beyond the pip (pipette)
inline int price_decimals(const Pair& p){
    return p.quote == "JPY" ? 3 : 5;
}

} // namespace exec
