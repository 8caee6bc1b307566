#include "indicators/sma_ema.hpp"

namespace ind {

double compute_sma(const std::vector<double>& v, std::size_t p){
    if (p == 0 || v.size() < p) return 0.0;
    double s = 0; for (std::size_t i = v.size() - p; i < v.size(); ++i) s += v[i];
    return s / static_cast<double>(p);
}

std::vector<double> compute_ema(const std::vector<double>& v, std::size_t p){
    std::vector<double> out;
    if (p == 0 || v.size() < p) return out;
    out.reserve(v.size() - p + 1);
    double seed = 0.0;
    for (std::size_t i = 0; i < p; ++i) seed += v[i];
    double e = seed / static_cast<double>(p);
    out.push_back(e);
    const double k = 2.0 / (p + 1.0);
    for (std::size_t i = p; i < v.size(); ++i) {
        e = v[i]*k + e*(1.0-k);
        out.push_back(e);
    }
    return out;
}

double ema_last(const std::vector<double>& v, std::size_t p){
    const auto e = compute_ema(v, p);
    return e.empty() ? 0.0 : e.back();
}

double ema_slope(const std::vector<double>& v, std::size_t p){
    const auto e = compute_ema(v, p);
    if (e.size() < 2) return 0.0;
    return e[e.size()-1] - e[e.size()-2];
}

} // namespace ind
