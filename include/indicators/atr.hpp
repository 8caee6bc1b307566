#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Mean true range of the trailing `period` bars.
// 0.0 if fewer than period+1 candles; callers must check before dividing.
double compute_atr(const Candles& c, std::size_t period = 14);

} // namespace ind
