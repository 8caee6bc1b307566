#include "core/types.hpp"
#include <spdlog/spdlog.h>

std::optional<Timeframe> parse_timeframe(const std::string& s) {
    if (s == "M1")  return Timeframe::M1;
    if (s == "M5")  return Timeframe::M5;
    if (s == "M15") return Timeframe::M15;
    if (s == "M30") return Timeframe::M30;
    if (s == "H1")  return Timeframe::H1;
    if (s == "H4")  return Timeframe::H4;
    if (s == "D" || s == "D1") return Timeframe::D1;
    return std::nullopt;
}

bool is_tracked_currency(const std::string& c) {
    return std::any_of(kCurrencies.begin(), kCurrencies.end(),
                       [&](const char* k){ return c == k; });
}

std::optional<Pair> parse_pair(const std::string& id) {
    const auto pos = id.find('_');
    if (pos == std::string::npos || id.find('_', pos + 1) != std::string::npos) return std::nullopt;
    Pair p{id.substr(0, pos), id.substr(pos + 1)};
    if (p.base.empty() || p.quote.empty() || p.base == p.quote) return std::nullopt;
    if (!is_tracked_currency(p.base) || !is_tracked_currency(p.quote)) return std::nullopt;
    return p;
}

std::vector<Pair> parse_pairs(const std::vector<std::string>& ids) {
    std::vector<Pair> out;
    for (const auto& raw : ids) {
        auto p = parse_pair(raw);
        if (!p) {
            spdlog::warn("Invalid or untracked pair skipped: '{}'", raw);
            continue;
        }
        const bool dup = std::any_of(out.begin(), out.end(), [&](const Pair& q){
            return q == *p || q == p->inverse();
        });
        if (dup) {
            spdlog::warn("Duplicate or inverse pair skipped: {}", p->name());
            continue;
        }
        out.push_back(*p);
    }
    return out;
}
