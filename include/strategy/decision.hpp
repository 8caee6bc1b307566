#pragma once
#include <cstdlib>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace strategy {

// Acceptance rule for the (strong, weak) rank pair of a candidate trade.
//  MinAbsRank:            |strong| >= n, |weak| >= n, opposite signs
//  MinDifferential:       strong - weak >= n
//  AcceptedDifferentials: strong - weak is one of `differentials`
//  PairedExtremes:        (strong, weak) is one of `extremes`
enum class StrengthRule { MinAbsRank, MinDifferential, AcceptedDifferentials, PairedExtremes };

std::optional<StrengthRule> parse_strength_rule(const std::string& s);

struct StrengthPolicy {
    StrengthRule rule{StrengthRule::MinAbsRank};
    int min_abs_rank{5};
    int min_differential{10};
    std::set<int> differentials{10, 12, 14};
    std::set<std::pair<int,int>> extremes{{7,-7}, {7,-5}, {5,-7}};

    bool accepts(int strong, int weak) const {
        switch (rule) {
            case StrengthRule::MinAbsRank:
                return strong > 0 && weak < 0
                    && std::abs(strong) >= min_abs_rank && std::abs(weak) >= min_abs_rank;
            case StrengthRule::MinDifferential:
                return strong - weak >= min_differential;
            case StrengthRule::AcceptedDifferentials:
                return differentials.count(strong - weak) > 0;
            case StrengthRule::PairedExtremes:
                return extremes.count({strong, weak}) > 0;
        }
        return false;
    }
};

// Direction from the rank difference; nullopt when equal
inline std::optional<Direction> direction_from_ranks(int base_rank, int quote_rank){
    if (base_rank > quote_rank) return Direction::Buy;
    if (base_rank < quote_rank) return Direction::Sell;
    return std::nullopt;
}

struct Candidate {
    Pair pair;
    int base_rank{0};
    int quote_rank{0};
    int differential() const { return std::abs(base_rank - quote_rank); }
};

// Ranked pairs ordered by |base - quote| descending (stable on input order)
std::vector<Candidate> rank_candidates(const std::vector<Pair>& pairs, const RankMap& ranks);

} // namespace strategy
