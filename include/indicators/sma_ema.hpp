#pragma once
#include <vector>
#include <cstddef>

namespace ind {

// Trailing simple mean of the last p values; 0 when v.size() < p
double compute_sma(const std::vector<double>& v, std::size_t p);

// EMA series seeded with the SMA of the first p values (n - p + 1 points).
// Empty when v.size() < p.
std::vector<double> compute_ema(const std::vector<double>& v, std::size_t p);

// Last EMA point, 0 when insufficient
double ema_last(const std::vector<double>& v, std::size_t p);

// Difference of the last two EMA points; 0 means "no confirmation"
double ema_slope(const std::vector<double>& v, std::size_t p = 10);

} // namespace ind
