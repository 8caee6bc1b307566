#pragma once
#include <vector>
#include "core/types.hpp"

namespace ind {

struct SwingPoints {
    std::vector<double> highs;
    std::vector<double> lows;
};

// 3-bar window: high strictly above both neighbours / low strictly below
SwingPoints find_swing_points(const Candles& c);

} // namespace ind
