#include "strategy/decision.hpp"
#include <algorithm>

namespace strategy {

std::optional<StrengthRule> parse_strength_rule(const std::string& s){
    if (s == "min_abs_rank")           return StrengthRule::MinAbsRank;
    if (s == "min_differential")       return StrengthRule::MinDifferential;
    if (s == "accepted_differentials") return StrengthRule::AcceptedDifferentials;
    if (s == "paired_extremes")        return StrengthRule::PairedExtremes;
    return std::nullopt;
}

std::vector<Candidate> rank_candidates(const std::vector<Pair>& pairs, const RankMap& ranks){
    std::vector<Candidate> out;
    for (const auto& p : pairs) {
        auto b = ranks.find(p.base), q = ranks.find(p.quote);
        if (b == ranks.end() || q == ranks.end()) continue;
        out.push_back({p, b->second, q->second});
    }
    std::stable_sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b){
        return a.differential() > b.differential();
    });
    return out;
}

} // namespace strategy
