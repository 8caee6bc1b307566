#pragma once
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "exec/trade_signal.hpp"

namespace exec {

// Open trade notifications, shared with other collaborators (news filter).
// Entries are removed only by external trade lifecycle management.
class ActiveTrades {
public:
    explicit ActiveTrades(std::string path = {}) : path_(std::move(path)) {}

    bool load();
    bool save() const;

    void add(const TradeSignal& s);
    std::size_t remove(const Pair& pair);

    std::vector<TradeSignal> snapshot() const;
    std::set<std::string> currencies() const;
    bool has_open(const Pair& pair) const;
    std::size_t size() const;

private:
    std::string path_;
    mutable std::mutex mtx_;
    std::vector<TradeSignal> trades_;
};

} // namespace exec
