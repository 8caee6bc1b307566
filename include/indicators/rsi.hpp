#pragma once
#include <vector>
#include <cstddef>

namespace ind {

// Wilder RSI; one value per bar from index `period` on (n - period values).
// Empty if fewer than period+1 closes.
std::vector<double> compute_rsi(const std::vector<double>& closes, std::size_t period = 14);

// Last RSI value, or `fallback` when there is not enough data
double last_rsi(const std::vector<double>& closes, std::size_t period = 14, double fallback = 50.0);

} // namespace ind
